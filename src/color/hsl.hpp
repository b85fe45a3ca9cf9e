#pragma once

#include "rgb.hpp"

namespace chromatone {

/**
 * @brief Hue/Saturation/Lightness triple.
 *
 * hue is in degrees [0,360); saturation and lightness are percentages
 * in [0,100].
 */
struct Hsl {
    double hue = 0.0;
    double saturation = 0.0;
    double lightness = 0.0;
};

/**
 * @brief Converts an RGB color to HSL.
 *
 * Achromatic colors (r == g == b) get hue = saturation = 0. Otherwise the hue
 * is taken from the sector of the dominant channel, with the red sector
 * wrapped by a full turn when green < blue.
 *
 * @param color Input color
 * @return HSL triple
 */
Hsl to_hsl(const Rgb &color);

} // namespace chromatone
