#include <catch2/catch_all.hpp>

#include <filesystem>
#include <fstream>

#include "io/report_writer.hpp"
#include "recommend/recommendations.hpp"
#include "tone/classifier.hpp"
#include "utility/exceptions.hpp"

using Catch::Approx;
using chromatone::ReportWriter;

namespace {

chromatone::ToneAnalysisResult sample_result() {
    return chromatone::classify(
        std::vector<std::string>{"#f3e7db", "#eadaba", "#d7bd96", "#f6ede4"});
}

std::string temp_path(const char *name) {
    return (std::filesystem::temp_directory_path() / name).string();
}

} // namespace

TEST_CASE("Report JSON serialization", "[report]") {
    auto result = sample_result();

    SECTION("Result only") {
        auto j = ReportWriter::to_json(result);
        REQUIRE(j["skin_tone_level"] == 2);
        REQUIRE(j["skin_tone_name"] == "Ivory");
        REQUIRE(j["undertone_type"] == "warm");
        REQUIRE(j["undertone_description"] == "Golden/Yellow");
        REQUIRE(j["hue"].get<double>() == Approx(34.0));
        REQUIRE(j["samples"].size() == 4);
        REQUIRE_FALSE(j.contains("recommendation"));
    }

    SECTION("With a truncated recommendation") {
        auto rec = chromatone::build_recommendation(result);
        auto j = ReportWriter::to_json(result, &rec, 5);

        const auto &r = j["recommendation"];
        REQUIRE(r["upper_wear_colors"].size() == 5);
        REQUIRE(r["upper_wear_colors"][0] == "Warm Brown");
        REQUIRE(r["outfit_examples"].size() == 2);
        REQUIRE(r["makeup"]["lip_colors"].size() == 4);
        REQUIRE(r["palettes"].size() == 5);
        REQUIRE(r["palettes"][0]["name"] == "Earth Tone Shirts");
        REQUIRE(r["swatches"].size() == 6);
    }

    SECTION("Round trip through JSON") {
        auto back = ReportWriter::result_from_json(ReportWriter::to_json(result));
        REQUIRE(back.skin_tone_level == result.skin_tone_level);
        REQUIRE(back.skin_tone_name == result.skin_tone_name);
        REQUIRE(back.undertone == result.undertone);
        REQUIRE(back.lightness == Approx(result.lightness));
        REQUIRE(back.samples.size() == result.samples.size());
    }
}

TEST_CASE("Report files", "[report]") {
    const auto path = temp_path("chromatone_test_report.json");
    auto result = sample_result();
    auto rec = chromatone::build_recommendation(result);

    REQUIRE_NOTHROW(ReportWriter::save(path, result, &rec));
    auto loaded = ReportWriter::load(path);
    REQUIRE(loaded.skin_tone_name == "Ivory");
    REQUIRE(loaded.undertone == chromatone::Undertone::Warm);

    std::filesystem::remove(path);
}

TEST_CASE("Report error handling", "[report]") {
    SECTION("Missing file") {
        REQUIRE_THROWS_AS(ReportWriter::load("non_existent_report.json"),
                          chromatone::IOError);
    }

    SECTION("Unwritable path") {
        REQUIRE_THROWS_AS(
            ReportWriter::save("/invalid/path/that/does/not/exist/r.json",
                               sample_result()),
            chromatone::IOError);
    }

    SECTION("Malformed JSON") {
        const auto path = temp_path("chromatone_test_malformed.json");
        std::ofstream file(path);
        file << "{ \"skin_tone_level\": 2, }";
        file.close();

        REQUIRE_THROWS_AS(ReportWriter::load(path), chromatone::IOError);
        std::filesystem::remove(path);
    }

    SECTION("Missing keys and bad undertone") {
        REQUIRE_THROWS_AS(
            ReportWriter::result_from_json(chromatone::json{{"hue", 1.0}}),
            chromatone::IOError);

        auto j = ReportWriter::to_json(sample_result());
        j["undertone_type"] = "olive";
        REQUIRE_THROWS_AS(ReportWriter::result_from_json(j),
                          chromatone::UnknownCategoryError);
    }
}
