#include "skin_tone_scale.hpp"

#include <stdexcept>
#include <string>

namespace chromatone {

namespace {

constexpr std::array<SkinToneLevel, kSkinToneLevelCount> kScale = {{
    {1, "Porcelain", "#f6ede4", 85.0, 100.0, false},
    {2, "Ivory", "#f3e7db", 80.0, 85.0, false},
    {3, "Light Beige", "#f7ead0", 75.0, 80.0, false},
    {4, "Warm Beige", "#eadaba", 70.0, 75.0, false},
    {5, "Golden Beige", "#d7bd96", 65.0, 70.0, false},
    {6, "Tan", "#a07e56", 55.0, 65.0, false},
    {7, "Medium Brown", "#825c43", 45.0, 55.0, false},
    {8, "Deep Brown", "#604134", 35.0, 45.0, false},
    {9, "Dark Espresso", "#3a312a", 25.0, 35.0, false},
    {10, "Ebony", "#292421", 0.0, 25.0, true},
}};

} // namespace

const std::array<SkinToneLevel, kSkinToneLevelCount> &skin_tone_scale() {
    return kScale;
}

const SkinToneLevel &skin_tone_level(int level) {
    if (level < 1 || level > kSkinToneLevelCount) {
        throw std::out_of_range("skin tone level " + std::to_string(level) +
                                " is not in 1..10");
    }
    return kScale[level - 1];
}

const SkinToneLevel &resolve_skin_tone_level(double lightness) {
    for (const auto &entry : kScale) {
        if (entry.contains(lightness)) {
            return entry;
        }
    }
    return kScale[kFallbackSkinToneLevel - 1];
}

} // namespace chromatone
