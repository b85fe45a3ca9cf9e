#include "recommendations.hpp"

namespace chromatone {

namespace {

// Indexed by static_cast<int>(Undertone): warm, cool, neutral.

constexpr std::array<MakeupRecommendation, kUndertoneCount> kMakeup = {{
    {{"#CD853F", "#DEB887", "#F4A460", "#DDBF94"},
     {"#CD5C5C", "#E9967A", "#FA8072", "#FF6347"},
     {"#8B4513", "#CD853F", "#DEB887", "#D2691E"}},
    {{"#F8F8FF", "#E6E6FA", "#D8BFD8", "#DDA0DD"},
     {"#DC143C", "#B22222", "#8B0000", "#FF1493"},
     {"#4682B4", "#6495ED", "#9370DB", "#8A2BE2"}},
    {{"#F5F5DC", "#FFF8DC", "#FAEBD7", "#F0E68C"},
     {"#CD5C5C", "#BC8F8F", "#F08080", "#E9967A"},
     {"#CD853F", "#BC8F8F", "#D2B48C", "#DEB887"}},
}};

constexpr std::array<std::array<Palette, kPalettesPerUndertone>,
                     kUndertoneCount>
    kPalettes = {{
        {{
            {"Earth Tone Shirts",
             {"#8B4513", "#D2691E", "#CD853F", "#DEB887", "#F4A460"}},
            {"Autumn Tops",
             {"#B22222", "#FF8C00", "#DAA520", "#CD853F", "#D2B48C"}},
            {"Golden Hour Blouses",
             {"#FFD700", "#FF6347", "#CD853F", "#F4A460", "#DEB887"}},
            {"Warm Coral Collection",
             {"#FF7F50", "#FA8072", "#E9967A", "#F4A460", "#DEB887"}},
            {"Spice Tone Shirts",
             {"#D2691E", "#CD853F", "#B22222", "#A0522D", "#8B4513"}},
        }},
        {{
            {"Ocean Blue Shirts",
             {"#000080", "#4682B4", "#6495ED", "#87CEEB", "#B0C4DE"}},
            {"Berry Tone Tops",
             {"#8B008B", "#DC143C", "#B22222", "#800080", "#9932CC"}},
            {"Winter Frost Blouses",
             {"#2F4F4F", "#708090", "#4682B4", "#6495ED", "#87CEEB"}},
            {"Jewel Tone Collection",
             {"#4B0082", "#008B8B", "#0000CD", "#8B008B", "#006400"}},
            {"Cool Elegance",
             {"#191970", "#483D8B", "#6A5ACD", "#9370DB", "#8A2BE2"}},
        }},
        {{
            {"Classic Neutrals",
             {"#000000", "#696969", "#2F4F4F", "#708090", "#778899"}},
            {"Sage Collection",
             {"#556B2F", "#808080", "#6B8E23", "#9ACD32", "#8FBC8F"}},
            {"Modern Minimalist",
             {"#2F4F4F", "#778899", "#708090", "#696969", "#A9A9A9"}},
            {"Warm Earth Tones",
             {"#8B4513", "#A0522D", "#CD853F", "#D2B48C", "#DEB887"}},
            {"Sophisticated Greys",
             {"#2F4F4F", "#696969", "#778899", "#708090", "#DCDCDC"}},
        }},
    }};

constexpr std::array<std::array<std::string_view, kUpperWearSwatchCount>,
                     kUndertoneCount>
    kSwatches = {{
        {"#8B4513", "#CD853F", "#DEB887", "#FF8C00", "#D2691E", "#DAA520"},
        {"#000080", "#4682B4", "#6495ED", "#2F4F4F", "#708090", "#8B008B"},
        {"#000000", "#696969", "#556B2F", "#8B4513", "#2F4F4F", "#800000"},
    }};

std::size_t index_of(Undertone undertone) {
    return static_cast<std::size_t>(undertone);
}

} // namespace

std::vector<std::string> recommended_colors(Undertone undertone) {
    const auto &info = undertone_info(undertone);
    return std::vector<std::string>(info.colors.begin(), info.colors.end());
}

std::vector<std::string> recommended_colors(std::string_view category) {
    return recommended_colors(parse_undertone(category));
}

std::vector<std::string> outfit_examples(Undertone undertone) {
    const auto &info = undertone_info(undertone);
    return std::vector<std::string>(
        info.outfits.begin(), info.outfits.begin() + kOutfitExampleCount);
}

std::vector<std::string> outfit_examples(std::string_view category) {
    return outfit_examples(parse_undertone(category));
}

const MakeupRecommendation &makeup_recommendations(Undertone undertone) {
    return kMakeup[index_of(undertone_info(undertone).undertone)];
}

const std::array<Palette, kPalettesPerUndertone> &
upper_wear_palettes(Undertone undertone) {
    return kPalettes[index_of(undertone_info(undertone).undertone)];
}

const std::array<std::string_view, kUpperWearSwatchCount> &
upper_wear_swatches(Undertone undertone) {
    return kSwatches[index_of(undertone_info(undertone).undertone)];
}

Recommendation build_recommendation(const ToneAnalysisResult &result) {
    Recommendation rec;
    rec.undertone = result.undertone;
    rec.colors = recommended_colors(result.undertone);
    rec.outfits = outfit_examples(result.undertone);
    rec.makeup = &makeup_recommendations(result.undertone);
    rec.palettes = &upper_wear_palettes(result.undertone);
    rec.swatches = &upper_wear_swatches(result.undertone);
    return rec;
}

} // namespace chromatone
