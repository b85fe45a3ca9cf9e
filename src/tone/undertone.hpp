#pragma once

#include <array>
#include <string_view>

#include <fmt/format.h>

namespace chromatone {

/**
 * @brief Coarse skin hue classification. Closed set; strings are converted
 * through parse_undertone() which rejects anything else.
 */
enum class Undertone { Warm, Cool, Neutral };

inline constexpr int kUndertoneCount = 3;
inline constexpr int kRecommendedColorCount = 10;
inline constexpr int kOutfitExampleTableSize = 3;

/**
 * @brief Reference data attached to an undertone.
 */
struct UndertoneInfo {
    Undertone undertone;
    /** @brief Lowercase key: "warm", "cool" or "neutral" */
    std::string_view key;
    /** @brief Human readable hue family, e.g. "Golden/Yellow" */
    std::string_view descriptor;
    /** @brief Informational color family labels */
    std::array<std::string_view, 3> families;
    std::size_t family_count;
    /** @brief Recommended upper-wear color names, best first */
    std::array<std::string_view, kRecommendedColorCount> colors;
    /** @brief Outfit example sentences, best first */
    std::array<std::string_view, kOutfitExampleTableSize> outfits;
};

/** @brief All undertones in the order warm, cool, neutral. */
const std::array<UndertoneInfo, kUndertoneCount> &undertone_table();

const UndertoneInfo &undertone_info(Undertone undertone);

std::string_view to_string(Undertone undertone);

/**
 * @brief Converts a category key to an Undertone.
 * @throws UnknownCategoryError for anything but "warm", "cool" or "neutral"
 */
Undertone parse_undertone(std::string_view key);

/**
 * @brief Classifies a hue angle in degrees.
 *
 * warm: [20,50]; cool: >= 300 or <= 20; neutral otherwise. The warm band is
 * tested first, so exactly 20 degrees is warm.
 */
Undertone resolve_undertone(double hue);

} // namespace chromatone

template <>
struct fmt::formatter<chromatone::Undertone> : fmt::formatter<std::string_view> {
    template <typename FormatContext>
    auto format(chromatone::Undertone undertone, FormatContext &ctx) const
        -> decltype(ctx.out()) {
        return fmt::formatter<std::string_view>::format(
            chromatone::to_string(undertone), ctx);
    }
};
