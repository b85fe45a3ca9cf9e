#include <iostream>
#include <string>
#include <vector>

#include <fmt/format.h>

#include "batch/batch_analyzer.hpp"
#include "config/app_config.hpp"
#include "dataset/dataset.hpp"
#include "io/csv_exporter.hpp"
#include "io/report_writer.hpp"
#include "recommend/recommendations.hpp"
#include "tone/classifier.hpp"
#include "tone/skin_tone_scale.hpp"
#include "tone/undertone.hpp"
#include "utility/exceptions.hpp"
#include "utility/logger.hpp"
#include "utility/strings.hpp"

namespace {

constexpr int EXIT_USAGE = 2;

struct UsageError {
    std::string message;
};

void print_usage() {
    std::cerr
        << "Usage: chromatone [--config FILE] <command> [args]\n"
           "\n"
           "Commands:\n"
           "  analyze [--json FILE] COLOR...  classify sampled #rrggbb colors\n"
           "  dataset [--csv FILE]            build, summarize and export the "
           "recommendation dataset\n"
           "  batch SUBJECTS.json             classify many subjects in "
           "parallel\n"
           "  levels                          print the reference tables\n";
}

int run_analyze(const chromatone::AppConfig &config,
                const std::vector<std::string> &args) {
    std::string json_path;
    std::vector<std::string> colors;

    for (size_t i = 0; i < args.size(); ++i) {
        if (args[i] == "--json") {
            if (i + 1 >= args.size()) {
                throw UsageError{"--json needs a file name"};
            }
            json_path = args[++i];
        } else {
            colors.push_back(args[i]);
        }
    }

    auto result = chromatone::classify(colors, config.classifier_options());
    auto rec = chromatone::build_recommendation(result);

    std::vector<std::string> preview(rec.colors.begin(),
                                     rec.colors.begin() + config.preview_colors);

    fmt::print("Skin Tone: {} (Level {})\n", result.skin_tone_name,
               result.skin_tone_level);
    fmt::print("Undertone: {} ({})\n", result.undertone_description,
               result.undertone);
    fmt::print("Mean hue: {:.2f}  Mean lightness: {:.2f}\n", result.hue,
               result.lightness);
    fmt::print("Recommended Colors: {}\n", chromatone::utility::join(preview, ", "));
    fmt::print("Outfit Example: {}\n", rec.outfits.front());

    if (!json_path.empty()) {
        chromatone::ReportWriter::save(json_path, result, &rec);
        fmt::print("Report written to {}\n", json_path);
    }
    return 0;
}

int run_dataset(const chromatone::AppConfig &config,
                const std::vector<std::string> &args) {
    std::string csv_path = config.export_path;
    for (size_t i = 0; i < args.size(); ++i) {
        if (args[i] == "--csv" && i + 1 < args.size()) {
            csv_path = args[++i];
        } else {
            throw UsageError{"unexpected argument '" + args[i] + "'"};
        }
    }

    auto records = chromatone::clean_dataset(chromatone::build_dataset());
    auto summary = chromatone::summarize(records);

    fmt::print("Total entries: {}\n", summary.total_rows);
    fmt::print("Skin tone levels: {}\n", summary.distinct_levels);
    fmt::print("Undertone types: {}\n", summary.distinct_undertones);

    for (const auto &[level, pref] :
         chromatone::analyze_color_preferences(records)) {
        std::vector<std::string> top;
        for (size_t i = 0; i < pref.most_popular_colors.size() && i < 3; ++i) {
            top.push_back(pref.most_popular_colors[i].first);
        }
        fmt::print("Skin Tone Level {} - {}: {}\n", level, pref.skin_tone_name,
                   chromatone::utility::join(top, ", "));
    }

    chromatone::CsvExporter::write(csv_path, records);
    fmt::print("Dataset exported to {}\n", csv_path);
    return 0;
}

int run_batch(const chromatone::AppConfig &config,
              const std::vector<std::string> &args) {
    if (args.size() != 1) {
        throw UsageError{"batch needs exactly one subjects file"};
    }

    auto subjects = chromatone::load_subjects(args[0]);
    chromatone::BatchAnalyzer analyzer(config.threads,
                                       config.classifier_options());
    int failures = 0;
    for (const auto &entry : analyzer.analyze(subjects)) {
        if (entry.ok()) {
            fmt::print("{}: {} (Level {}), {}\n", entry.id,
                       entry.result->skin_tone_name,
                       entry.result->skin_tone_level, entry.result->undertone);
        } else {
            ++failures;
            fmt::print("{}: error: {}\n", entry.id, entry.error);
        }
    }
    return failures == 0 ? 0 : 1;
}

int run_levels() {
    for (const auto &level : chromatone::skin_tone_scale()) {
        fmt::print("{:>2}  {:<14} {}  [{}, {}{}\n", level.level, level.name,
                   level.swatch_hex, level.min_lightness, level.max_lightness,
                   level.closed_upper ? "]" : ")");
    }
    for (const auto &info : chromatone::undertone_table()) {
        fmt::print("{:<8} {}\n", info.key, info.descriptor);
    }
    return 0;
}

int run(int argc, char **argv) {
    std::vector<std::string> args(argv + 1, argv + argc);
    chromatone::AppConfig config;

    if (args.size() >= 2 && args[0] == "--config") {
        config = chromatone::load_config(args[1]);
        args.erase(args.begin(), args.begin() + 2);
    }
    chromatone::Logger::set_min_level(config.log_level);

    if (args.empty()) {
        throw UsageError{"missing command"};
    }

    const std::string command = args[0];
    args.erase(args.begin());

    if (command == "analyze") {
        return run_analyze(config, args);
    }
    if (command == "dataset") {
        return run_dataset(config, args);
    }
    if (command == "batch") {
        return run_batch(config, args);
    }
    if (command == "levels") {
        return run_levels();
    }
    throw UsageError{"unknown command '" + command + "'"};
}

} // namespace

int main(int argc, char **argv) {
    try {
        return run(argc, argv);
    } catch (const UsageError &e) {
        std::cerr << "Error: " << e.message << "\n\n";
        print_usage();
        return EXIT_USAGE;
    } catch (const chromatone::ChromatoneException &e) {
        LOG_ERROR("ChromaTone error: " + std::string(e.what()));
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception &e) {
        LOG_ERROR("Standard error: " + std::string(e.what()));
        std::cerr << "Unexpected error: " << e.what() << std::endl;
        return 1;
    }
}
