#include <catch2/catch_all.hpp>

#include "dataset/dataset.hpp"
#include "utility/strings.hpp"

using chromatone::DatasetRecord;
using chromatone::utility::split;

TEST_CASE("Dataset cross product", "[dataset]") {
    auto records = chromatone::build_dataset();
    REQUIRE(records.size() == 30);

    SECTION("Row order is level-major") {
        REQUIRE(records[0].skin_tone_level == 1);
        REQUIRE(records[0].skin_tone_name == "Porcelain");
        REQUIRE(records[0].undertone_type == "warm");
        REQUIRE(records[1].undertone_type == "cool");
        REQUIRE(records[2].undertone_type == "neutral");
        REQUIRE(records[29].skin_tone_level == 10);
        REQUIRE(records[29].skin_tone_name == "Ebony");
    }

    SECTION("Every row carries 10 colors and 2 outfit ideas") {
        for (const auto &record : records) {
            REQUIRE_FALSE(record.upper_wear_colors.empty());
            REQUIRE(split(record.upper_wear_colors, ", ").size() == 10);
            REQUIRE(split(record.outfit_ideas, " | ").size() == 2);
        }
    }

    SECTION("Joined strings use the lookup order") {
        REQUIRE(records[1].upper_wear_colors.rfind("Navy Blue, Crisp White", 0) ==
                0);
        REQUIRE(records[2].outfit_ideas ==
                "Charcoal grey shirt with dark denim and black leather belt | "
                "Sage green cardigan with cream-colored pants");
    }
}

TEST_CASE("Dataset cleaning", "[dataset]") {
    SECTION("Generated dataset survives unchanged apart from counts") {
        auto cleaned = chromatone::clean_dataset(chromatone::build_dataset());
        REQUIRE(cleaned.size() == 30);
        for (const auto &record : cleaned) {
            REQUIRE(record.color_count == 10);
        }
        REQUIRE(cleaned[6].skin_tone_name == "Light Beige");
    }

    SECTION("Text is normalized and incomplete rows dropped") {
        std::vector<DatasetRecord> raw = {
            {"light beige", 3, "WARM", "Camel, Rust Red", "A | B", 0},
            {"tan", 6, "Cool", "", "A | B", 0},
            {"", 7, "neutral", "Taupe Brown", "A | B", 0},
        };
        auto cleaned = chromatone::clean_dataset(raw);
        REQUIRE(cleaned.size() == 1);
        REQUIRE(cleaned[0].skin_tone_name == "Light Beige");
        REQUIRE(cleaned[0].undertone_type == "warm");
        REQUIRE(cleaned[0].color_count == 2);
    }
}

TEST_CASE("Color preference analysis", "[dataset]") {
    SECTION("Generated dataset") {
        auto prefs = chromatone::analyze_color_preferences(
            chromatone::clean_dataset(chromatone::build_dataset()));
        REQUIRE(prefs.size() == 10);

        const auto &porcelain = prefs.at(1);
        REQUIRE(porcelain.skin_tone_name == "Porcelain");
        REQUIRE(porcelain.total_combinations == 3);
        REQUIRE(porcelain.most_popular_colors.size() == 5);
        // all 30 colors are distinct, so ties keep first appearance
        REQUIRE(porcelain.most_popular_colors[0].first == "Warm Brown");
        REQUIRE(porcelain.most_popular_colors[0].second == 1);
        REQUIRE(porcelain.most_popular_colors[4].first == "Mustard Yellow");
    }

    SECTION("Counts rank colors") {
        std::vector<DatasetRecord> records = {
            {"Ivory", 2, "warm", "Camel, Sage Green", "x | y", 2},
            {"Ivory", 2, "cool", "Sage Green, Navy Blue", "x | y", 2},
            {"Tan", 6, "neutral", "Taupe Brown", "x | y", 1},
        };
        auto prefs = chromatone::analyze_color_preferences(records);
        REQUIRE(prefs.size() == 2);

        const auto &ivory = prefs.at(2).most_popular_colors;
        REQUIRE(ivory.size() == 3);
        REQUIRE(ivory[0] == std::pair<std::string, int>{"Sage Green", 2});
        REQUIRE(ivory[1].first == "Camel");
        REQUIRE(ivory[2].first == "Navy Blue");
        REQUIRE(prefs.at(6).total_combinations == 1);
    }
}

TEST_CASE("Dataset summary", "[dataset]") {
    auto summary = chromatone::summarize(
        chromatone::clean_dataset(chromatone::build_dataset()));

    REQUIRE(summary.total_rows == 30);
    REQUIRE(summary.distinct_levels == 10);
    REQUIRE(summary.distinct_undertones == 3);

    for (const auto &[level, count] : summary.level_counts) {
        REQUIRE(count == 3);
    }
    REQUIRE(summary.undertone_counts.at("warm") == 10);
    REQUIRE(summary.undertone_counts.at("cool") == 10);
    REQUIRE(summary.undertone_counts.at("neutral") == 10);
    REQUIRE(summary.color_count_distribution.size() == 1);
    REQUIRE(summary.color_count_distribution.at(10) == 30);
    REQUIRE(summary.level_undertone_matrix.at(4).at("cool") == 1);

    auto empty = chromatone::summarize({});
    REQUIRE(empty.total_rows == 0);
    REQUIRE(empty.level_counts.empty());
}
