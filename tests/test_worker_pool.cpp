#include "fetchkit/detail/worker_pool.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

namespace fetchkit::test {

TEST(WorkerPoolTest, RunsEveryJobOnce) {
    std::vector<std::atomic<int>> runs(50);
    const auto errors = detail::runBounded(runs.size(), 4, [&](std::size_t i) { ++runs[i]; });

    ASSERT_EQ(errors.size(), runs.size());
    for (std::size_t i = 0; i < runs.size(); ++i) {
        EXPECT_EQ(runs[i].load(), 1) << i;
        EXPECT_FALSE(errors[i]);
    }
}

TEST(WorkerPoolTest, RespectsLimit) {
    std::atomic<int> active{0};
    std::atomic<int> peak{0};
    const auto errors = detail::runBounded(20, 3, [&](std::size_t) {
        const int now = ++active;
        int seen = peak.load();
        while (now > seen && !peak.compare_exchange_weak(seen, now)) {
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
        --active;
    });

    EXPECT_EQ(errors.size(), 20u);
    EXPECT_GE(peak.load(), 1);
    EXPECT_LE(peak.load(), 3);
}

TEST(WorkerPoolTest, CapturesExceptionsPerJob) {
    const auto errors = detail::runBounded(5, 2, [](std::size_t i) {
        if (i % 2 == 1) {
            throw std::runtime_error("job failed");
        }
    });

    ASSERT_EQ(errors.size(), 5u);
    EXPECT_FALSE(errors[0]);
    EXPECT_TRUE(errors[1]);
    EXPECT_FALSE(errors[2]);
    EXPECT_TRUE(errors[3]);
    EXPECT_THROW(std::rethrow_exception(errors[3]), std::runtime_error);
}

TEST(WorkerPoolTest, NoJobsIsNoop) {
    EXPECT_TRUE(detail::runBounded(0, 8, [](std::size_t) { FAIL(); }).empty());
}

} // namespace fetchkit::test
