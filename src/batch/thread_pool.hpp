#pragma once

#include <algorithm>
#include <concepts>
#include <condition_variable>
#include <functional>
#include <latch>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

#include "../utility/exceptions.hpp"
#include "../utility/logger.hpp"

namespace chromatone {

using Job = std::function<void()>;

/**
 * @brief Concept for range kernels: called with [start, end) item indices
 */
template <typename F>
concept Kernel = requires(F f, int a, int b) {
    { f(a, b) } -> std::same_as<void>;
};

/**
 * @brief Default worker count: all cores but one, at least one.
 */
inline int compute_worker_threads() {
    unsigned int num_threads = std::thread::hardware_concurrency();
    if (num_threads <= 1) {
        return 1;
    }

    return int(num_threads) - 1;
}

/**
 * @brief Fixed-size worker pool for running independent analyses.
 */
class AnalysisThreadPool {
  public:
    /**
     * @brief Constructs and starts the pool
     * @param threads Number of workers (-1 for automatic detection)
     */
    explicit AnalysisThreadPool(int threads = -1);

    ~AnalysisThreadPool();

    AnalysisThreadPool(const AnalysisThreadPool &) = delete;
    AnalysisThreadPool(AnalysisThreadPool &&) = delete;
    AnalysisThreadPool &operator=(const AnalysisThreadPool &) = delete;
    AnalysisThreadPool &operator=(AnalysisThreadPool &&) = delete;

    int size() const { return static_cast<int>(m_workers.size()); }

    /**
     * @brief Runs fn over [0, n_items) split into contiguous blocks, one per
     * worker, and blocks until all blocks are done.
     *
     * fn must not throw; callers record per-item failures themselves.
     */
    template <Kernel F>
    void parallel_for_n(F fn, int n_items, int min_parallel = 2) {
        if (n_items <= 0) {
            return;
        }

        int num_threads = std::max(1, size());
        if (num_threads == 1 || n_items < min_parallel) {
            fn(0, n_items);
            return;
        }

        int block = (n_items + num_threads - 1) / num_threads;
        int jobs = (n_items + block - 1) / block;
        std::latch job_latch(jobs);

        for (int job = 0; job < jobs; ++job) {
            int start = job * block;
            int end_exclusive = std::min(n_items, start + block);

            enqueue([start, end_exclusive, &fn, &job_latch] {
                fn(start, end_exclusive);
                job_latch.count_down();
            });
        }

        job_latch.wait();
    }

  private:
    void start(int threads);
    void stop();
    void enqueue(Job f);
    void worker_thread();

  private:
    std::vector<std::thread> m_workers;
    std::mutex m_tasks_mutex;
    std::condition_variable m_tasks_signal;
    std::queue<Job> m_tasks;
    bool m_stopping = false;
};

} // namespace chromatone
