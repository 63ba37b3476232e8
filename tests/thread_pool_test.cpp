#include <gtest/gtest.h>

#include "thread_pool.hpp"

#include <atomic>
#include <stdexcept>

using namespace flume;

TEST(thread_pool, runs_all_posted_jobs_before_join_returns)
{
    thread_pool pool(4);
    std::atomic<int> n{0};
    for(auto i = 0; i < 100; ++i) {
        pool.post([&n] { ++n; });
    }
    pool.join();
    EXPECT_EQ(n, 100);
    EXPECT_EQ(pool.num_executed_jobs(), 100);
    EXPECT_LE(pool.num_threads(), 4);
}

TEST(thread_pool, jobs_posted_after_join_are_dropped)
{
    thread_pool pool(2);
    pool.join();
    std::atomic<bool> ran{false};
    pool.post([&ran] { ran = true; });
    pool.join();
    EXPECT_FALSE(ran);
    EXPECT_EQ(pool.num_pending_jobs(), 0);
}

TEST(thread_pool, throwing_job_does_not_kill_the_pool)
{
    thread_pool pool(1);
    std::atomic<int> n{0};
    pool.post([] { throw std::runtime_error("boom"); });
    pool.post([&n] { ++n; });
    pool.join();
    EXPECT_EQ(n, 1);
}

TEST(thread_pool, invalid_concurrency_falls_back_to_two)
{
    thread_pool pool(0);
    EXPECT_EQ(pool.concurrency(), 2);
}
