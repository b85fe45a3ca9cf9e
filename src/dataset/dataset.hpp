#pragma once

#include <map>
#include <string>
#include <utility>
#include <vector>

namespace chromatone {

/** @brief Separator between color names in DatasetRecord::upper_wear_colors */
inline constexpr const char *kColorSeparator = ", ";
/** @brief Separator between examples in DatasetRecord::outfit_ideas */
inline constexpr const char *kOutfitSeparator = " | ";

/**
 * @brief One (skin tone level x undertone) row.
 */
struct DatasetRecord {
    std::string skin_tone_name;
    int skin_tone_level = 0;
    std::string undertone_type;
    std::string upper_wear_colors;
    std::string outfit_ideas;
    /** @brief Filled by clean_dataset() */
    int color_count = 0;
};

/**
 * @brief Most frequent recommendations for one skin tone level.
 */
struct LevelPreference {
    std::string skin_tone_name;
    /** @brief (color, occurrences), most frequent first */
    std::vector<std::pair<std::string, int>> most_popular_colors;
    int total_combinations = 0;
};

/**
 * @brief Aggregate counts over a dataset, the series a chart would plot.
 */
struct DatasetSummary {
    std::size_t total_rows = 0;
    std::size_t distinct_levels = 0;
    std::size_t distinct_undertones = 0;
    std::map<int, int> level_counts;
    std::map<std::string, int> undertone_counts;
    std::map<int, int> color_count_distribution;
    std::map<int, std::map<std::string, int>> level_undertone_matrix;
};

inline constexpr std::size_t kTopColorsPerLevel = 5;

/**
 * @brief Builds the full cross product of skin tone levels and undertones.
 *
 * Rows are level-major (level 1 first), undertones in warm, cool, neutral
 * order, giving 30 rows.
 */
std::vector<DatasetRecord> build_dataset();

/**
 * @brief Normalizes a dataset.
 *
 * Drops rows with an empty text field, title-cases tone names, lower-cases
 * undertone keys and fills color_count.
 */
std::vector<DatasetRecord> clean_dataset(std::vector<DatasetRecord> records);

/**
 * @brief Per-level color frequencies.
 *
 * Colors are ranked by descending count; ties keep their first appearance
 * order. At most kTopColorsPerLevel colors are kept per level.
 */
std::map<int, LevelPreference>
analyze_color_preferences(const std::vector<DatasetRecord> &records);

DatasetSummary summarize(const std::vector<DatasetRecord> &records);

} // namespace chromatone
