#include "hsl.hpp"

#include <algorithm>
#include <cmath>

namespace chromatone {

Hsl to_hsl(const Rgb &color) {
    const double r = color.r / 255.0;
    const double g = color.g / 255.0;
    const double b = color.b / 255.0;

    const double max_c = std::max({r, g, b});
    const double min_c = std::min({r, g, b});
    const double l = (max_c + min_c) / 2.0;

    Hsl out;
    out.lightness = l * 100.0;

    if (max_c == min_c) {
        // achromatic
        return out;
    }

    const double d = max_c - min_c;
    const double s = l > 0.5 ? d / (2.0 - max_c - min_c) : d / (max_c + min_c);

    double h;
    if (max_c == r) {
        h = (g - b) / d + (g < b ? 6.0 : 0.0);
    } else if (max_c == g) {
        h = (b - r) / d + 2.0;
    } else {
        h = (r - g) / d + 4.0;
    }

    double hue = h * 60.0;
    hue = std::fmod(hue, 360.0);
    if (hue < 0.0) {
        hue += 360.0;
    }

    out.hue = hue;
    out.saturation = s * 100.0;
    return out;
}

} // namespace chromatone
