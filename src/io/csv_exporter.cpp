#include "csv_exporter.hpp"

#include <fstream>

#include <fmt/format.h>

#include "../utility/exceptions.hpp"
#include "../utility/logger.hpp"

namespace chromatone {

std::string CsvExporter::escape(std::string_view field) {
    if (field.find_first_of(",\"\r\n") == std::string_view::npos) {
        return std::string(field);
    }

    std::string out;
    out.reserve(field.size() + 2);
    out.push_back('"');
    for (char c : field) {
        if (c == '"') {
            out.push_back('"');
        }
        out.push_back(c);
    }
    out.push_back('"');
    return out;
}

void CsvExporter::write(std::ostream &out,
                        const std::vector<DatasetRecord> &records) {
    out << "Skin_Tone_Name,Skin_Tone_Level,Undertone_Type,Upper_Wear_Colors,"
           "Example_Outfit_Ideas\n";
    for (const auto &record : records) {
        out << escape(record.skin_tone_name) << ','
            << record.skin_tone_level << ',' << escape(record.undertone_type)
            << ',' << escape(record.upper_wear_colors) << ','
            << escape(record.outfit_ideas) << '\n';
    }
}

std::string CsvExporter::write(const std::string &filepath,
                               const std::vector<DatasetRecord> &records) {
    LOG_INFO(fmt::format("Exporting {} rows to: {}", records.size(), filepath));

    std::ofstream file(filepath, std::ios::trunc);
    if (!file.is_open()) {
        throw IOError("Failed to open file for writing: " + filepath);
    }

    write(file, records);
    file.flush();
    if (!file) {
        throw IOError("Failed to write CSV data to: " + filepath);
    }

    LOG_INFO("Dataset exported successfully");
    return filepath;
}

} // namespace chromatone
