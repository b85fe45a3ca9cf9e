#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "../recommend/recommendations.hpp"
#include "../tone/classifier.hpp"

namespace chromatone {

using json = nlohmann::json;

/**
 * @brief Saves and loads analysis reports as JSON.
 *
 * A report holds the classification result and, optionally, the
 * recommendation built for it.
 */
class ReportWriter {
  public:
    /**
     * @brief Serializes a result and its recommendation.
     * @param result Classification to serialize
     * @param recommendation Recommendation to embed, or nullptr to skip
     * @param preview_colors How many recommended colors to keep (all if 0)
     */
    static json to_json(const ToneAnalysisResult &result,
                        const Recommendation *recommendation = nullptr,
                        std::size_t preview_colors = 0);

    /**
     * @brief Rebuilds the classification part of a report.
     * @throws IOError if required keys are missing or mistyped
     * @throws UnknownCategoryError if the undertone key is invalid
     */
    static ToneAnalysisResult result_from_json(const json &j);

    /**
     * @brief Writes a report to disk.
     * @throws IOError if the file cannot be written
     */
    static void save(const std::string &filepath,
                     const ToneAnalysisResult &result,
                     const Recommendation *recommendation = nullptr);

    /**
     * @brief Reads the classification part of a report from disk.
     * @throws IOError if the file cannot be opened or parsed
     */
    static ToneAnalysisResult load(const std::string &filepath);

  private:
    static json hsl_to_json(const Hsl &hsl);
    static Hsl json_to_hsl(const json &j);
};

} // namespace chromatone
