#include <catch2/catch_all.hpp>

#include <filesystem>
#include <fstream>
#include <string>

#include "config/app_config.hpp"
#include "utility/exceptions.hpp"

using chromatone::AppConfig;

namespace {

std::string write_temp(const char *name, const std::string &content) {
    auto path = (std::filesystem::temp_directory_path() / name).string();
    std::ofstream file(path);
    file << content;
    return path;
}

} // namespace

TEST_CASE("AppConfig defaults", "[config]") {
    AppConfig config;
    REQUIRE(config.hue_averaging == chromatone::HueAveraging::Arithmetic);
    REQUIRE(config.export_path == "chromatone_recommendations.csv");
    REQUIRE(config.preview_colors == 5);
    REQUIRE(config.log_level == chromatone::Logger::INFO_LEVEL);
    REQUIRE(config.threads == -1);
}

TEST_CASE("AppConfig loading", "[config]") {
    SECTION("All keys") {
        auto path = write_temp("chromatone_cfg_full.json",
                               R"({"hue_averaging": "circular",
                                   "export_path": "out.csv",
                                   "preview_colors": 3,
                                   "log_level": "warn",
                                   "threads": 2})");
        auto config = chromatone::load_config(path);
        REQUIRE(config.hue_averaging == chromatone::HueAveraging::Circular);
        REQUIRE(config.classifier_options().hue_averaging ==
                chromatone::HueAveraging::Circular);
        REQUIRE(config.export_path == "out.csv");
        REQUIRE(config.preview_colors == 3);
        REQUIRE(config.log_level == chromatone::Logger::WARN_LEVEL);
        REQUIRE(config.threads == 2);
        std::filesystem::remove(path);
    }

    SECTION("Missing keys keep defaults") {
        auto path = write_temp("chromatone_cfg_partial.json",
                               R"({"preview_colors": 10})");
        auto config = chromatone::load_config(path);
        REQUIRE(config.preview_colors == 10);
        REQUIRE(config.export_path == "chromatone_recommendations.csv");
        REQUIRE(config.hue_averaging == chromatone::HueAveraging::Arithmetic);
        std::filesystem::remove(path);
    }

    SECTION("Save and load round trip") {
        auto path = (std::filesystem::temp_directory_path() /
                     "chromatone_cfg_roundtrip.json")
                        .string();
        AppConfig original;
        original.hue_averaging = chromatone::HueAveraging::Circular;
        original.preview_colors = 7;
        original.log_level = chromatone::Logger::ERROR_LEVEL;

        REQUIRE_NOTHROW(chromatone::save_config(path, original));
        auto loaded = chromatone::load_config(path);
        REQUIRE(loaded.hue_averaging == original.hue_averaging);
        REQUIRE(loaded.preview_colors == 7);
        REQUIRE(loaded.log_level == chromatone::Logger::ERROR_LEVEL);
        std::filesystem::remove(path);
    }
}

TEST_CASE("AppConfig error handling", "[config]") {
    SECTION("Missing file") {
        REQUIRE_THROWS_AS(chromatone::load_config("non_existent_config.json"),
                          chromatone::IOError);
    }

    SECTION("Malformed JSON") {
        auto path = write_temp("chromatone_cfg_bad.json",
                               R"({"preview_colors": 3,})");
        REQUIRE_THROWS_AS(chromatone::load_config(path), chromatone::IOError);
        std::filesystem::remove(path);
    }

    SECTION("Invalid values") {
        for (const char *content :
             {R"({"preview_colors": 0})", R"({"preview_colors": 11})",
              R"({"preview_colors": "five"})", R"({"hue_averaging": "mean"})",
              R"({"log_level": "verbose"})", R"({"threads": 0})",
              R"({"export_path": ""})", R"([1, 2])"}) {
            auto path = write_temp("chromatone_cfg_invalid.json", content);
            INFO("config: " << content);
            REQUIRE_THROWS_AS(chromatone::load_config(path),
                              chromatone::ConfigError);
            std::filesystem::remove(path);
        }
    }
}
