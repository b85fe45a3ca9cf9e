#pragma once

#include <array>
#include <string>
#include <string_view>
#include <vector>

#include "../tone/classifier.hpp"
#include "../tone/undertone.hpp"

namespace chromatone {

/** @brief Number of outfit examples returned per undertone. */
inline constexpr std::size_t kOutfitExampleCount = 2;

/**
 * @brief Recommended upper-wear color names for an undertone, best first.
 * @return Exactly 10 names
 */
std::vector<std::string> recommended_colors(Undertone undertone);

/**
 * @throws UnknownCategoryError if category is not warm, cool or neutral
 */
std::vector<std::string> recommended_colors(std::string_view category);

/**
 * @brief The first two outfit examples of an undertone, in table order.
 */
std::vector<std::string> outfit_examples(Undertone undertone);

/**
 * @throws UnknownCategoryError if category is not warm, cool or neutral
 */
std::vector<std::string> outfit_examples(std::string_view category);

/**
 * @brief Makeup swatches (hex) matched to an undertone.
 */
struct MakeupRecommendation {
    std::array<std::string_view, 4> foundation;
    std::array<std::string_view, 4> lip_colors;
    std::array<std::string_view, 4> eyeshadow;
};

const MakeupRecommendation &makeup_recommendations(Undertone undertone);

/**
 * @brief A named five-swatch upper-wear palette.
 */
struct Palette {
    std::string_view name;
    std::array<std::string_view, 5> colors;
};

inline constexpr std::size_t kPalettesPerUndertone = 5;
inline constexpr std::size_t kUpperWearSwatchCount = 6;

const std::array<Palette, kPalettesPerUndertone> &
upper_wear_palettes(Undertone undertone);

/** @brief Six representative upper-wear swatches (hex). */
const std::array<std::string_view, kUpperWearSwatchCount> &
upper_wear_swatches(Undertone undertone);

/**
 * @brief Everything the lookup tables offer for one analysis.
 */
struct Recommendation {
    Undertone undertone;
    std::vector<std::string> colors;
    std::vector<std::string> outfits;
    const MakeupRecommendation *makeup;
    const std::array<Palette, kPalettesPerUndertone> *palettes;
    const std::array<std::string_view, kUpperWearSwatchCount> *swatches;
};

Recommendation build_recommendation(const ToneAnalysisResult &result);

} // namespace chromatone
