#include "classifier.hpp"

#include <cmath>
#include <numbers>

#include "../utility/exceptions.hpp"
#include "../utility/logger.hpp"
#include "skin_tone_scale.hpp"

namespace chromatone {

namespace {

constexpr double kCircularEpsilon = 1e-12;

double circular_mean(const std::vector<double> &hues) {
    double sum_sin = 0.0;
    double sum_cos = 0.0;
    for (double h : hues) {
        const double rad = h * std::numbers::pi / 180.0;
        sum_sin += std::sin(rad);
        sum_cos += std::cos(rad);
    }

    // Opposing angles cancel out; there is no meaningful direction.
    if (std::abs(sum_sin) < kCircularEpsilon &&
        std::abs(sum_cos) < kCircularEpsilon) {
        return 0.0;
    }

    double deg = std::atan2(sum_sin, sum_cos) * 180.0 / std::numbers::pi;
    if (deg < 0.0) {
        deg += 360.0;
    }
    if (deg >= 360.0) {
        deg -= 360.0;
    }
    return deg;
}

} // namespace

double average_hue(const std::vector<double> &hues, HueAveraging mode) {
    if (hues.empty()) {
        throw EmptyInputError("cannot average zero hues");
    }

    if (mode == HueAveraging::Circular) {
        return circular_mean(hues);
    }

    double sum = 0.0;
    for (double h : hues) {
        sum += h;
    }
    return sum / static_cast<double>(hues.size());
}

ToneAnalysisResult classify(const std::vector<Rgb> &samples,
                            const ClassifierOptions &options) {
    if (samples.empty()) {
        throw EmptyInputError("classification needs at least one color");
    }

    ToneAnalysisResult result;
    result.samples.reserve(samples.size());

    std::vector<double> hues;
    hues.reserve(samples.size());
    double lightness_sum = 0.0;
    double saturation_sum = 0.0;

    for (const auto &sample : samples) {
        Hsl hsl = to_hsl(sample);
        LOG_DEBUG(fmt::format("{} -> h={:.2f} s={:.2f} l={:.2f}", sample,
                              hsl.hue, hsl.saturation, hsl.lightness));
        hues.push_back(hsl.hue);
        lightness_sum += hsl.lightness;
        saturation_sum += hsl.saturation;
        result.samples.push_back(hsl);
    }

    const auto n = static_cast<double>(samples.size());
    result.lightness = lightness_sum / n;
    result.saturation = saturation_sum / n;
    result.hue = average_hue(hues, options.hue_averaging);

    const SkinToneLevel &level = resolve_skin_tone_level(result.lightness);
    result.skin_tone_level = level.level;
    result.skin_tone_name = std::string(level.name);

    result.undertone = resolve_undertone(result.hue);
    result.undertone_description =
        std::string(undertone_info(result.undertone).descriptor);

    return result;
}

ToneAnalysisResult classify(const std::vector<std::string> &hex_samples,
                            const ClassifierOptions &options) {
    std::vector<Rgb> samples;
    samples.reserve(hex_samples.size());
    for (const auto &hex : hex_samples) {
        samples.push_back(Rgb::from_hex(hex));
    }
    return classify(samples, options);
}

HueAveraging parse_hue_averaging(std::string_view name) {
    if (name == "arithmetic") {
        return HueAveraging::Arithmetic;
    }
    if (name == "circular") {
        return HueAveraging::Circular;
    }
    throw ConfigError("hue_averaging must be 'arithmetic' or 'circular', got '" +
                      std::string(name) + "'");
}

std::string_view to_string(HueAveraging mode) {
    return mode == HueAveraging::Circular ? "circular" : "arithmetic";
}

} // namespace chromatone
