#include "app_config.hpp"

#include <fstream>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include "../utility/exceptions.hpp"

namespace chromatone {

using json = nlohmann::json;

namespace {

constexpr const char *HUE_AVERAGING_KEY = "hue_averaging";
constexpr const char *EXPORT_PATH_KEY = "export_path";
constexpr const char *PREVIEW_COLORS_KEY = "preview_colors";
constexpr const char *LOG_LEVEL_KEY = "log_level";
constexpr const char *THREADS_KEY = "threads";

template <typename T>
T get_checked(const json &j, const char *key) {
    try {
        return j.at(key).get<T>();
    } catch (const json::exception &e) {
        throw ConfigError(fmt::format("'{}' has the wrong type: {}", key,
                                      e.what()));
    }
}

} // namespace

Logger::Level parse_log_level(std::string_view name) {
    if (name == "debug") {
        return Logger::DEBUG_LEVEL;
    }
    if (name == "info") {
        return Logger::INFO_LEVEL;
    }
    if (name == "warn") {
        return Logger::WARN_LEVEL;
    }
    if (name == "error") {
        return Logger::ERROR_LEVEL;
    }
    throw ConfigError(fmt::format(
        "log_level must be debug, info, warn or error, got '{}'", name));
}

std::string_view to_string(Logger::Level level) {
    switch (level) {
    case Logger::DEBUG_LEVEL:
        return "debug";
    case Logger::INFO_LEVEL:
        return "info";
    case Logger::WARN_LEVEL:
        return "warn";
    case Logger::ERROR_LEVEL:
        return "error";
    }
    return "info";
}

AppConfig load_config(const std::string &filepath) {
    LOG_INFO("Loading configuration from: " + filepath);

    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw IOError("Failed to open file for reading: " + filepath);
    }

    json j;
    try {
        file >> j;
    } catch (const json::exception &e) {
        LOG_ERROR("JSON parsing error: " + std::string(e.what()));
        throw IOError("JSON parsing failed: " + std::string(e.what()));
    }

    if (!j.is_object()) {
        throw ConfigError("top level must be a JSON object");
    }

    AppConfig config;

    if (j.contains(HUE_AVERAGING_KEY)) {
        config.hue_averaging = parse_hue_averaging(
            get_checked<std::string>(j, HUE_AVERAGING_KEY));
    }

    if (j.contains(EXPORT_PATH_KEY)) {
        config.export_path = get_checked<std::string>(j, EXPORT_PATH_KEY);
        if (config.export_path.empty()) {
            throw ConfigError("export_path must not be empty");
        }
    }

    if (j.contains(PREVIEW_COLORS_KEY)) {
        config.preview_colors = get_checked<int>(j, PREVIEW_COLORS_KEY);
        if (config.preview_colors < 1 ||
            config.preview_colors > kRecommendedColorCount) {
            throw ConfigError(fmt::format(
                "preview_colors must be in 1..{}, got {}",
                kRecommendedColorCount, config.preview_colors));
        }
    }

    if (j.contains(LOG_LEVEL_KEY)) {
        config.log_level =
            parse_log_level(get_checked<std::string>(j, LOG_LEVEL_KEY));
    }

    if (j.contains(THREADS_KEY)) {
        config.threads = get_checked<int>(j, THREADS_KEY);
        if (config.threads == 0 || config.threads < -1) {
            throw ConfigError(fmt::format(
                "threads must be -1 (auto) or positive, got {}",
                config.threads));
        }
    }

    LOG_INFO("Configuration loaded successfully");
    return config;
}

void save_config(const std::string &filepath, const AppConfig &config) {
    json j;
    j[HUE_AVERAGING_KEY] = std::string(to_string(config.hue_averaging));
    j[EXPORT_PATH_KEY] = config.export_path;
    j[PREVIEW_COLORS_KEY] = config.preview_colors;
    j[LOG_LEVEL_KEY] = std::string(to_string(config.log_level));
    j[THREADS_KEY] = config.threads;

    std::ofstream file(filepath);
    if (!file.is_open()) {
        throw IOError("Failed to open file for writing: " + filepath);
    }

    file << j.dump(2);
    if (!file) {
        throw IOError("Failed to write configuration: " + filepath);
    }
}

} // namespace chromatone
