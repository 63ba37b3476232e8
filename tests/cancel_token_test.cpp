#include <gtest/gtest.h>

#include "cancel_token.hpp"

using namespace flume;

TEST(cancel_token, callbacks_run_once_on_cancel)
{
    cancel_token token;
    int n = 0;
    token.subscribe([&n] { ++n; });
    token.subscribe([&n] { ++n; });
    EXPECT_FALSE(token.is_cancelled());

    token.cancel();
    EXPECT_TRUE(token.is_cancelled());
    EXPECT_EQ(n, 2);

    token.cancel();
    EXPECT_EQ(n, 2);
}

TEST(cancel_token, unsubscribed_callback_is_not_run)
{
    cancel_token token;
    bool called = false;
    const int id = token.subscribe([&called] { called = true; });
    token.unsubscribe(id);
    token.cancel();
    EXPECT_FALSE(called);
}

TEST(cancel_token, subscribing_to_cancelled_token_runs_callback_right_away)
{
    cancel_token token;
    token.cancel();
    bool called = false;
    EXPECT_EQ(token.subscribe([&called] { called = true; }), -1);
    EXPECT_TRUE(called);
    // no-op
    token.unsubscribe(-1);
}
