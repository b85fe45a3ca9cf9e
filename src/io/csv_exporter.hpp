#pragma once

#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include "../dataset/dataset.hpp"

namespace chromatone {

/**
 * @brief Writes dataset records as CSV.
 *
 * Columns: Skin_Tone_Name, Skin_Tone_Level, Undertone_Type,
 * Upper_Wear_Colors, Example_Outfit_Ideas. Fields that contain a comma,
 * quote or line break are quoted, with embedded quotes doubled.
 */
class CsvExporter {
  public:
    static constexpr const char *DEFAULT_FILENAME =
        "chromatone_recommendations.csv";

    /**
     * @brief Writes records to a file, replacing it.
     * @param filepath Destination path
     * @param records Rows to write
     * @return The path that was written
     * @throws IOError if the file cannot be opened or written
     */
    static std::string write(const std::string &filepath,
                             const std::vector<DatasetRecord> &records);

    /**
     * @brief Writes header and rows to an open stream.
     */
    static void write(std::ostream &out,
                      const std::vector<DatasetRecord> &records);

    /** @brief Quotes a single field if needed. */
    static std::string escape(std::string_view field);
};

} // namespace chromatone
