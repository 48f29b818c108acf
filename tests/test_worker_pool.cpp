///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "worker_pool.hpp"
#include <atomic>
#include <gtest/gtest.h>
#include <stdexcept>
#include <vector>


///////////////////////////
///        TESTS        ///
///////////////////////////
TEST(WorkerPoolTest, EveryIndexRunsOnce) {
    for (int threads : {1, 3, 8}) {
        std::vector<int> hits(37, 0);
        parallelFor((int)hits.size(), threads, [&](int i) { ++hits[i]; });
        for (int h : hits) EXPECT_EQ(h, 1);
    }
}

TEST(WorkerPoolTest, EmptyRangeDoesNothing) {
    std::atomic<int> calls(0);
    parallelFor(0, 4, [&](int) { ++calls; });
    EXPECT_EQ(calls.load(), 0);
}

TEST(WorkerPoolTest, ExceptionsReachTheCaller) {
    std::atomic<int> calls(0);
    EXPECT_THROW(parallelFor(20, 4, [&](int i) {
        ++calls;
        if (i == 13) throw std::runtime_error("bad index");
    }), std::runtime_error);
    EXPECT_GE(calls.load(), 1);
}

TEST(WorkerPoolTest, ThreadCountResolution) {
    EXPECT_EQ(resolveThreadCount(3), 3);
    EXPECT_GE(resolveThreadCount(0), 1);
    EXPECT_EQ(resolveThreadCount(-5), resolveThreadCount(0));
}
