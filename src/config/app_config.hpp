#pragma once

#include <string>
#include <string_view>

#include "../tone/classifier.hpp"
#include "../utility/logger.hpp"

namespace chromatone {

/**
 * @brief Application settings, loaded from a JSON file.
 *
 * Every key is optional; absent keys keep the defaults below.
 */
struct AppConfig {
    /** @brief "arithmetic" (default) or "circular" */
    HueAveraging hue_averaging = HueAveraging::Arithmetic;
    /** @brief Destination of the dataset CSV export */
    std::string export_path = "chromatone_recommendations.csv";
    /** @brief Recommended colors shown in summaries, 1..10 */
    int preview_colors = 5;
    Logger::Level log_level = Logger::INFO_LEVEL;
    /** @brief Batch worker threads, -1 for automatic */
    int threads = -1;

    ClassifierOptions classifier_options() const {
        return ClassifierOptions{hue_averaging};
    }
};

/**
 * @brief Loads configuration from a JSON file.
 * @param filepath Path to the configuration file
 * @return Parsed configuration
 * @throws IOError if the file cannot be opened or is not valid JSON
 * @throws ConfigError if a value is out of range or of the wrong type
 */
AppConfig load_config(const std::string &filepath);

/**
 * @brief Writes configuration to a JSON file.
 * @throws IOError if the file cannot be written
 */
void save_config(const std::string &filepath, const AppConfig &config);

/**
 * @throws ConfigError for names other than debug, info, warn, error
 */
Logger::Level parse_log_level(std::string_view name);
std::string_view to_string(Logger::Level level);

} // namespace chromatone
