#include "batch_analyzer.hpp"

#include <fstream>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include "../utility/exceptions.hpp"
#include "../utility/logger.hpp"

namespace chromatone {

using json = nlohmann::json;

BatchAnalyzer::BatchAnalyzer(int threads, ClassifierOptions options)
    : m_pool(threads), m_options(options) {}

std::vector<BatchEntry>
BatchAnalyzer::analyze(const std::vector<Subject> &subjects) {
    std::vector<BatchEntry> entries(subjects.size());

    m_pool.parallel_for_n(
        [&](int start, int end) {
            for (int i = start; i < end; ++i) {
                const Subject &subject = subjects[i];
                BatchEntry &entry = entries[i];
                entry.id = subject.id;
                try {
                    entry.result = classify(subject.colors, m_options);
                } catch (const ChromatoneException &e) {
                    entry.error = e.what();
                }
            }
        },
        static_cast<int>(subjects.size()));

    for (const auto &entry : entries) {
        if (!entry.ok()) {
            LOG_WARN(fmt::format("Subject '{}' skipped: {}", entry.id,
                                 entry.error));
        }
    }

    return entries;
}

std::vector<Subject> load_subjects(const std::string &filepath) {
    LOG_INFO("Loading subjects from: " + filepath);

    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw IOError("Failed to open file for reading: " + filepath);
    }

    std::vector<Subject> subjects;
    try {
        json j;
        file >> j;

        if (!j.is_array()) {
            throw IOError("subjects file must contain a JSON array");
        }

        subjects.reserve(j.size());
        for (const auto &item : j) {
            Subject subject;
            subject.id = item.at("id").get<std::string>();
            subject.colors = item.at("colors").get<std::vector<std::string>>();
            subjects.push_back(std::move(subject));
        }
    } catch (const json::exception &e) {
        LOG_ERROR("JSON parsing error: " + std::string(e.what()));
        throw IOError("JSON parsing failed: " + std::string(e.what()));
    }

    LOG_INFO(fmt::format("Loaded {} subjects", subjects.size()));
    return subjects;
}

} // namespace chromatone
