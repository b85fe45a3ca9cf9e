#include "dataset.hpp"

#include <algorithm>
#include <set>

#include <fmt/format.h>

#include "../recommend/recommendations.hpp"
#include "../tone/skin_tone_scale.hpp"
#include "../tone/undertone.hpp"
#include "../utility/logger.hpp"
#include "../utility/strings.hpp"

namespace chromatone {

std::vector<DatasetRecord> build_dataset() {
    std::vector<DatasetRecord> records;
    records.reserve(kSkinToneLevelCount * kUndertoneCount);

    for (const auto &level : skin_tone_scale()) {
        for (const auto &info : undertone_table()) {
            DatasetRecord record;
            record.skin_tone_name = std::string(level.name);
            record.skin_tone_level = level.level;
            record.undertone_type = std::string(info.key);
            record.upper_wear_colors = utility::join(
                recommended_colors(info.undertone), kColorSeparator);
            record.outfit_ideas = utility::join(
                outfit_examples(info.undertone), kOutfitSeparator);
            records.push_back(std::move(record));
        }
    }

    LOG_DEBUG(fmt::format("Built dataset with {} rows", records.size()));
    return records;
}

std::vector<DatasetRecord> clean_dataset(std::vector<DatasetRecord> records) {
    std::vector<DatasetRecord> cleaned;
    cleaned.reserve(records.size());

    for (auto &record : records) {
        if (record.skin_tone_name.empty() || record.undertone_type.empty() ||
            record.upper_wear_colors.empty() || record.outfit_ideas.empty()) {
            LOG_WARN(fmt::format("Dropping incomplete row for level {}",
                                 record.skin_tone_level));
            continue;
        }

        record.skin_tone_name = utility::title_case(record.skin_tone_name);
        record.undertone_type = utility::to_lower(record.undertone_type);
        record.color_count = static_cast<int>(
            utility::split(record.upper_wear_colors, kColorSeparator).size());
        cleaned.push_back(std::move(record));
    }

    return cleaned;
}

std::map<int, LevelPreference>
analyze_color_preferences(const std::vector<DatasetRecord> &records) {
    std::map<int, LevelPreference> results;
    // first-seen order per level, used to break count ties
    std::map<int, std::vector<std::string>> order;
    std::map<int, std::map<std::string, int>> counts;

    for (const auto &record : records) {
        auto &pref = results[record.skin_tone_level];
        if (pref.total_combinations == 0) {
            pref.skin_tone_name = record.skin_tone_name;
        }
        ++pref.total_combinations;

        auto &level_counts = counts[record.skin_tone_level];
        for (const auto &raw : utility::split(record.upper_wear_colors, ",")) {
            std::string color = utility::trim(raw);
            if (color.empty()) {
                continue;
            }
            if (level_counts[color]++ == 0) {
                order[record.skin_tone_level].push_back(color);
            }
        }
    }

    for (auto &[level, pref] : results) {
        const auto &level_counts = counts[level];
        std::vector<std::string> ranked = order[level];
        std::stable_sort(ranked.begin(), ranked.end(),
                         [&](const std::string &a, const std::string &b) {
                             return level_counts.at(a) > level_counts.at(b);
                         });

        const std::size_t keep = std::min(ranked.size(), kTopColorsPerLevel);
        for (std::size_t i = 0; i < keep; ++i) {
            pref.most_popular_colors.emplace_back(ranked[i],
                                                  level_counts.at(ranked[i]));
        }
    }

    return results;
}

DatasetSummary summarize(const std::vector<DatasetRecord> &records) {
    DatasetSummary summary;
    summary.total_rows = records.size();

    std::set<int> levels;
    std::set<std::string> undertones;
    for (const auto &record : records) {
        levels.insert(record.skin_tone_level);
        undertones.insert(record.undertone_type);
        ++summary.level_counts[record.skin_tone_level];
        ++summary.undertone_counts[record.undertone_type];
        ++summary.color_count_distribution[record.color_count];
        ++summary.level_undertone_matrix[record.skin_tone_level]
                                        [record.undertone_type];
    }

    summary.distinct_levels = levels.size();
    summary.distinct_undertones = undertones.size();
    return summary;
}

} // namespace chromatone
