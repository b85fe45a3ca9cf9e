#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "../color/hsl.hpp"
#include "../color/rgb.hpp"
#include "undertone.hpp"

namespace chromatone {

/**
 * @brief How sample hues are combined into one angle.
 *
 * Arithmetic is the plain mean of the angles and does not account for the
 * 0/360 wrap; it is the default so results stay comparable with existing
 * datasets. Circular averages unit vectors instead.
 */
enum class HueAveraging { Arithmetic, Circular };

struct ClassifierOptions {
    HueAveraging hue_averaging = HueAveraging::Arithmetic;
};

/**
 * @brief Result of classifying one set of color samples.
 */
struct ToneAnalysisResult {
    int skin_tone_level;
    std::string skin_tone_name;
    Undertone undertone;
    std::string undertone_description;
    /** @brief Mean hue in degrees that selected the undertone */
    double hue;
    /** @brief Mean lightness percentage that selected the level */
    double lightness;
    /** @brief Mean saturation, informational only */
    double saturation;
    /** @brief Per-sample conversions, in input order */
    std::vector<Hsl> samples;
};

/**
 * @brief Classifies skin tone level and undertone from color samples.
 * @param samples Non-empty list of sampled colors
 * @param options Aggregation options
 * @return Classification result
 * @throws EmptyInputError if samples is empty
 */
ToneAnalysisResult classify(const std::vector<Rgb> &samples,
                            const ClassifierOptions &options = {});

/**
 * @brief Decodes hex strings and classifies them.
 * @throws InvalidColorFormat if any string is not a valid hex color
 * @throws EmptyInputError if hex_samples is empty
 */
ToneAnalysisResult classify(const std::vector<std::string> &hex_samples,
                            const ClassifierOptions &options = {});

/**
 * @brief Combines hue angles according to mode.
 * @throws EmptyInputError if hues is empty
 */
double average_hue(const std::vector<double> &hues, HueAveraging mode);

HueAveraging parse_hue_averaging(std::string_view name);
std::string_view to_string(HueAveraging mode);

} // namespace chromatone
