#pragma once

#include <optional>
#include <string>
#include <vector>

#include "../tone/classifier.hpp"
#include "thread_pool.hpp"

namespace chromatone {

/**
 * @brief One person to analyze: an identifier and their sampled colors.
 */
struct Subject {
    std::string id;
    std::vector<std::string> colors;
};

/**
 * @brief Outcome for one subject. Exactly one of result and error is set.
 */
struct BatchEntry {
    std::string id;
    std::optional<ToneAnalysisResult> result;
    std::string error;

    bool ok() const { return result.has_value(); }
};

/**
 * @brief Classifies many subjects concurrently.
 *
 * Each subject is classified independently; a subject with malformed or
 * missing colors gets an error entry and does not affect the others.
 */
class BatchAnalyzer {
  public:
    explicit BatchAnalyzer(int threads = -1, ClassifierOptions options = {});

    /**
     * @brief Analyzes all subjects.
     * @return One entry per subject, in input order
     */
    std::vector<BatchEntry> analyze(const std::vector<Subject> &subjects);

    int threads() const { return m_pool.size(); }

  private:
    AnalysisThreadPool m_pool;
    ClassifierOptions m_options;
};

/**
 * @brief Reads subjects from a JSON array of {"id", "colors"} objects.
 * @throws IOError if the file cannot be opened, parsed or has the wrong shape
 */
std::vector<Subject> load_subjects(const std::string &filepath);

} // namespace chromatone
