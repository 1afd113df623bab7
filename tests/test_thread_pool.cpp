/// @file test_thread_pool.cpp
/// @brief Worker pool used for concurrent walker evaluation.

#include <gtest/gtest.h>

#include "mbbfit/ThreadPool.hpp"

#include <atomic>
#include <stdexcept>

using namespace mbbfit;

TEST(ThreadPoolTest, EnqueueReturnsFutureValue)
{
    ThreadPool pool(2);
    auto f = pool.enqueue([](int a, int b) { return a * b; }, 6, 7);
    EXPECT_EQ(f.get(), 42);
}

TEST(ThreadPoolTest, MapKeepsIndexOrder)
{
    ThreadPool pool(4);
    const auto out = pool.map(1000, [](std::size_t i) { return static_cast<double>(i) * 0.5; });
    ASSERT_EQ(out.size(), 1000u);
    for (std::size_t i = 0; i < out.size(); ++i)
        EXPECT_DOUBLE_EQ(out[i], 0.5 * static_cast<double>(i));
}

TEST(ThreadPoolTest, MapRunsEveryTaskBeforeRethrowing)
{
    ThreadPool pool(3);
    std::atomic<int> ran{0};
    EXPECT_THROW(pool.map(64, [&ran](std::size_t i) {
                     ++ran;
                     if (i == 5) throw std::runtime_error("walker failed");
                     return 1;
                 }),
                 std::runtime_error);
    EXPECT_EQ(ran.load(), 64);
}

TEST(ThreadPoolTest, ZeroMeansHardwareConcurrency)
{
    ThreadPool pool(0);
    EXPECT_GE(pool.size(), 1u);
}
