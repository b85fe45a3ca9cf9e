#include "report_writer.hpp"

#include <algorithm>
#include <fstream>

#include "../utility/exceptions.hpp"
#include "../utility/logger.hpp"

namespace chromatone {

json ReportWriter::hsl_to_json(const Hsl &hsl) {
    return json{{"hue", hsl.hue},
                {"saturation", hsl.saturation},
                {"lightness", hsl.lightness}};
}

Hsl ReportWriter::json_to_hsl(const json &j) {
    Hsl hsl;
    hsl.hue = j.at("hue").get<double>();
    hsl.saturation = j.at("saturation").get<double>();
    hsl.lightness = j.at("lightness").get<double>();
    return hsl;
}

json ReportWriter::to_json(const ToneAnalysisResult &result,
                           const Recommendation *recommendation,
                           std::size_t preview_colors) {
    json j;
    j["skin_tone_level"] = result.skin_tone_level;
    j["skin_tone_name"] = result.skin_tone_name;
    j["undertone_type"] = std::string(to_string(result.undertone));
    j["undertone_description"] = result.undertone_description;
    j["hue"] = result.hue;
    j["lightness"] = result.lightness;
    j["saturation"] = result.saturation;

    j["samples"] = json::array();
    for (const auto &hsl : result.samples) {
        j["samples"].push_back(hsl_to_json(hsl));
    }

    if (recommendation) {
        json rec;
        std::size_t n = recommendation->colors.size();
        if (preview_colors > 0) {
            n = std::min(n, preview_colors);
        }
        rec["upper_wear_colors"] = std::vector<std::string>(
            recommendation->colors.begin(), recommendation->colors.begin() + n);
        rec["outfit_examples"] = recommendation->outfits;

        if (recommendation->makeup) {
            const auto &m = *recommendation->makeup;
            rec["makeup"] = {
                {"foundation", std::vector<std::string>(m.foundation.begin(),
                                                        m.foundation.end())},
                {"lip_colors", std::vector<std::string>(m.lip_colors.begin(),
                                                        m.lip_colors.end())},
                {"eyeshadow", std::vector<std::string>(m.eyeshadow.begin(),
                                                       m.eyeshadow.end())}};
        }

        if (recommendation->palettes) {
            rec["palettes"] = json::array();
            for (const auto &palette : *recommendation->palettes) {
                rec["palettes"].push_back(
                    {{"name", std::string(palette.name)},
                     {"colors", std::vector<std::string>(
                                    palette.colors.begin(),
                                    palette.colors.end())}});
            }
        }

        if (recommendation->swatches) {
            rec["swatches"] = std::vector<std::string>(
                recommendation->swatches->begin(),
                recommendation->swatches->end());
        }

        j["recommendation"] = std::move(rec);
    }

    return j;
}

ToneAnalysisResult ReportWriter::result_from_json(const json &j) {
    ToneAnalysisResult result;
    try {
        result.skin_tone_level = j.at("skin_tone_level").get<int>();
        result.skin_tone_name = j.at("skin_tone_name").get<std::string>();
        result.undertone =
            parse_undertone(j.at("undertone_type").get<std::string>());
        result.undertone_description =
            j.at("undertone_description").get<std::string>();
        result.hue = j.at("hue").get<double>();
        result.lightness = j.at("lightness").get<double>();
        result.saturation = j.value("saturation", 0.0);

        if (j.contains("samples")) {
            for (const auto &sample : j["samples"]) {
                result.samples.push_back(json_to_hsl(sample));
            }
        }
    } catch (const json::exception &e) {
        throw IOError("Malformed report: " + std::string(e.what()));
    }
    return result;
}

void ReportWriter::save(const std::string &filepath,
                        const ToneAnalysisResult &result,
                        const Recommendation *recommendation) {
    LOG_INFO("Saving report to: " + filepath);

    std::ofstream file(filepath);
    if (!file.is_open()) {
        throw IOError("Failed to open file for writing: " + filepath);
    }

    file << to_json(result, recommendation).dump(2);
    if (!file) {
        throw IOError("Failed to write report: " + filepath);
    }
}

ToneAnalysisResult ReportWriter::load(const std::string &filepath) {
    LOG_INFO("Loading report from: " + filepath);

    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw IOError("Failed to open file for reading: " + filepath);
    }

    json j;
    try {
        file >> j;
    } catch (const json::exception &e) {
        LOG_ERROR("JSON parsing error: " + std::string(e.what()));
        throw IOError("JSON parsing failed: " + std::string(e.what()));
    }

    return result_from_json(j);
}

} // namespace chromatone
