#include "undertone.hpp"

#include <string>

#include "../utility/exceptions.hpp"

namespace chromatone {

namespace {

constexpr std::array<UndertoneInfo, kUndertoneCount> kUndertones = {{
    {Undertone::Warm,
     "warm",
     "Golden/Yellow",
     {"Golden", "Yellow", "Peach"},
     3,
     {"Warm Brown", "Terracotta", "Camel", "Burnt Orange", "Mustard Yellow",
      "Rust Red", "Golden Beige", "Coral Pink", "Olive Green", "Cream White"},
     {"Terracotta blouse with black trousers and gold accessories",
      "Burnt orange sweater with dark denim jeans",
      "Camel-colored cardigan with white pants and brown belt"}},
    {Undertone::Cool,
     "cool",
     "Pink/Red",
     {"Pink", "Red", "Blue"},
     3,
     {"Navy Blue", "Crisp White", "Steel Blue", "Charcoal Grey",
      "Emerald Green", "Royal Purple", "Cool Pink", "Silver Grey", "Icy Blue",
      "Deep Teal"},
     {"Navy blue shirt with beige chinos and silver watch",
      "Emerald green top with white jeans and pearl necklace",
      "Steel blue blouse with charcoal grey trousers"}},
    {Undertone::Neutral,
     "neutral",
     "Balanced",
     {"Balanced", "Mixed", ""},
     2,
     {"Classic Black", "Pure White", "Medium Grey", "Sage Green",
      "Taupe Brown", "Soft Beige", "Dusty Rose", "Slate Blue", "Warm Ivory",
      "Mushroom Grey"},
     {"Charcoal grey shirt with dark denim and black leather belt",
      "Sage green cardigan with cream-colored pants",
      "Classic white blouse with taupe brown blazer"}},
}};

} // namespace

const std::array<UndertoneInfo, kUndertoneCount> &undertone_table() {
    return kUndertones;
}

const UndertoneInfo &undertone_info(Undertone undertone) {
    switch (undertone) {
    case Undertone::Warm:
        return kUndertones[0];
    case Undertone::Cool:
        return kUndertones[1];
    case Undertone::Neutral:
        return kUndertones[2];
    }
    throw UnknownCategoryError(
        std::to_string(static_cast<int>(undertone)));
}

std::string_view to_string(Undertone undertone) {
    return undertone_info(undertone).key;
}

Undertone parse_undertone(std::string_view key) {
    for (const auto &info : kUndertones) {
        if (info.key == key) {
            return info.undertone;
        }
    }
    throw UnknownCategoryError("'" + std::string(key) + "'");
}

Undertone resolve_undertone(double hue) {
    if (hue >= 20.0 && hue <= 50.0) {
        return Undertone::Warm;
    }
    if (hue >= 300.0 || hue <= 20.0) {
        return Undertone::Cool;
    }
    return Undertone::Neutral;
}

} // namespace chromatone
