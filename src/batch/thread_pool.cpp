#include "thread_pool.hpp"

#include <string>

namespace chromatone {

AnalysisThreadPool::AnalysisThreadPool(int threads) { start(threads); }

AnalysisThreadPool::~AnalysisThreadPool() { stop(); }

void AnalysisThreadPool::enqueue(Job f) {
    {
        std::lock_guard<std::mutex> lock(m_tasks_mutex);
        m_tasks.push(std::move(f));
    }

    m_tasks_signal.notify_one();
}

void AnalysisThreadPool::start(int threads) {
    if (threads == 0 || threads < -1) {
        throw ConfigError("Invalid thread count: " + std::to_string(threads));
    }

    int num_threads = threads < 0 ? compute_worker_threads() : threads;

    LOG_DEBUG("Starting analysis pool with " + std::to_string(num_threads) +
              " threads");
    m_stopping = false;
    m_workers.reserve(num_threads);

    for (int i = 0; i < num_threads; ++i) {
        m_workers.emplace_back(&AnalysisThreadPool::worker_thread, this);
    }
}

void AnalysisThreadPool::stop() {
    {
        std::lock_guard<std::mutex> lock(m_tasks_mutex);
        m_stopping = true;
    }

    m_tasks_signal.notify_all();

    for (auto &t : m_workers) {
        if (t.joinable()) {
            t.join();
        }
    }

    m_workers.clear();
}

void AnalysisThreadPool::worker_thread() {
    for (;;) {
        Job job;
        {
            std::unique_lock<std::mutex> lock(m_tasks_mutex);

            m_tasks_signal.wait(lock, [this] {
                return m_stopping || !m_tasks.empty();
            });

            if (m_stopping && m_tasks.empty()) {
                return;
            }

            job = std::move(m_tasks.front());
            m_tasks.pop();
        }
        job();
    }
}

} // namespace chromatone
