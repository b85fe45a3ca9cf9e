#include <catch2/catch_all.hpp>

#include <atomic>
#include <vector>

#include "batch/thread_pool.hpp"
#include "utility/exceptions.hpp"

using chromatone::AnalysisThreadPool;

TEST_CASE("AnalysisThreadPool parallel_for_n sums correctly", "[thread_pool]") {
    AnalysisThreadPool pool(std::max(1, chromatone::compute_worker_threads()));
    const int N = 10'000;
    std::atomic<long long> sum{0};

    pool.parallel_for_n(
        [&](int a, int b) {
            long long local = 0;
            for (int i = a; i < b; ++i)
                local += i;
            sum.fetch_add(local, std::memory_order_relaxed);
        },
        N);

    long long expected = 1LL * (N - 1) * N / 2;
    REQUIRE(sum.load() == expected);
}

TEST_CASE("AnalysisThreadPool thread count variations", "[thread_pool]") {
    for (int threads : {1, 2, 4}) {
        AnalysisThreadPool pool(threads);
        REQUIRE(pool.size() == threads);

        std::vector<int> hits(1000, 0);
        pool.parallel_for_n(
            [&](int start, int end) {
                for (int i = start; i < end; ++i) {
                    ++hits[i];
                }
            },
            1000);

        for (int h : hits) {
            REQUIRE(h == 1);
        }
    }
}

TEST_CASE("AnalysisThreadPool edge cases", "[thread_pool]") {
    AnalysisThreadPool pool(2);

    SECTION("Zero items") {
        bool called = false;
        pool.parallel_for_n([&](int, int) { called = true; }, 0);
        REQUIRE_FALSE(called);
    }

    SECTION("Single item runs inline") {
        std::atomic<int> counter{0};
        pool.parallel_for_n(
            [&](int start, int end) { counter.fetch_add(end - start); }, 1);
        REQUIRE(counter.load() == 1);
    }

    SECTION("Fewer items than threads") {
        std::atomic<int> counter{0};
        AnalysisThreadPool wide(8);
        wide.parallel_for_n(
            [&](int start, int end) { counter.fetch_add(end - start); }, 3);
        REQUIRE(counter.load() == 3);
    }
}

TEST_CASE("AnalysisThreadPool rejects invalid sizes", "[thread_pool]") {
    REQUIRE_THROWS_AS(AnalysisThreadPool(0), chromatone::ConfigError);
    REQUIRE_THROWS_AS(AnalysisThreadPool(-5), chromatone::ConfigError);
    REQUIRE_NOTHROW(AnalysisThreadPool(-1));
}
