#include <gtest/gtest.h>

#include "piece_signal.hpp"
#include "cancel_token.hpp"

#include <atomic>
#include <chrono>
#include <future>

using namespace flume;

namespace {
constexpr auto short_wait = std::chrono::milliseconds(50);
constexpr auto long_wait = std::chrono::seconds(5);
}

TEST(piece_signal, satisfied_predicate_returns_immediately)
{
    piece_signal signal;
    EXPECT_TRUE(signal.wait(nullptr, [] { return true; }));
}

TEST(piece_signal, waiter_wakes_when_predicate_holds)
{
    piece_signal signal;
    std::atomic<int> value{0};
    auto waiter = std::async(std::launch::async,
            [&] { return signal.wait(nullptr, [&value] { return value >= 2; }); });

    value = 1;
    signal.notify_all();
    ASSERT_EQ(waiter.wait_for(short_wait), std::future_status::timeout);

    value = 2;
    signal.notify_all();
    ASSERT_EQ(waiter.wait_for(long_wait), std::future_status::ready);
    EXPECT_TRUE(waiter.get());
}

TEST(piece_signal, cancel_wakes_only_its_own_waiter)
{
    piece_signal signal;
    cancel_token a;
    cancel_token b;
    std::atomic<bool> done{false};
    auto waiter_a = std::async(std::launch::async,
            [&] { return signal.wait(&a, [&done] { return done.load(); }); });
    auto waiter_b = std::async(std::launch::async,
            [&] { return signal.wait(&b, [&done] { return done.load(); }); });
    ASSERT_EQ(waiter_a.wait_for(short_wait), std::future_status::timeout);

    a.cancel();
    ASSERT_EQ(waiter_a.wait_for(long_wait), std::future_status::ready);
    EXPECT_FALSE(waiter_a.get());
    EXPECT_EQ(waiter_b.wait_for(short_wait), std::future_status::timeout);

    done = true;
    signal.notify_all();
    ASSERT_EQ(waiter_b.wait_for(long_wait), std::future_status::ready);
    EXPECT_TRUE(waiter_b.get());
}

TEST(piece_signal, already_cancelled_token_does_not_block)
{
    piece_signal signal;
    cancel_token token;
    token.cancel();
    EXPECT_FALSE(signal.wait(&token, [] { return false; }));
}
