#pragma once

#include <array>
#include <string_view>

namespace chromatone {

/**
 * @brief One entry of the 10-level lightness scale.
 *
 * Intervals are [min_lightness, max_lightness) except the darkest level,
 * which is closed on both ends.
 */
struct SkinToneLevel {
    int level;
    std::string_view name;
    std::string_view swatch_hex;
    double min_lightness;
    double max_lightness;
    bool closed_upper;

    bool contains(double lightness) const {
        return lightness >= min_lightness &&
               (closed_upper ? lightness <= max_lightness
                             : lightness < max_lightness);
    }
};

inline constexpr int kSkinToneLevelCount = 10;
inline constexpr int kFallbackSkinToneLevel = 10;

/**
 * @brief The lightness scale, level 1 (lightest) first.
 */
const std::array<SkinToneLevel, kSkinToneLevelCount> &skin_tone_scale();

/**
 * @brief Looks up a level by number.
 * @throws std::out_of_range if level is not in 1..10
 */
const SkinToneLevel &skin_tone_level(int level);

/**
 * @brief Maps a lightness percentage to its level.
 *
 * Levels are scanned lightest first and the first containing interval wins.
 * Lightness at or above 100, negative or NaN falls back to level 10.
 */
const SkinToneLevel &resolve_skin_tone_level(double lightness);

} // namespace chromatone
