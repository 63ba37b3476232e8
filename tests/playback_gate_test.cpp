#include <gtest/gtest.h>

#include "playback_gate.hpp"
#include "fake_engine.hpp"

using namespace flume;

TEST(playback_gate, opens_at_five_percent_and_stays_open)
{
    // 100 pieces of 10 bytes
    fake_engine engine(fake_engine::single_file(1000, 10));
    playback_gate gate(engine);

    EXPECT_FALSE(gate.ready());
    for(auto i = 0; i < 4; ++i) {
        engine.verify(i);
    }
    // 4%
    EXPECT_FALSE(gate.ready());
    engine.verify(4);
    // 5%
    EXPECT_TRUE(gate.ready());
    EXPECT_TRUE(gate.ready());
}

TEST(playback_gate, closed_while_total_length_unknown)
{
    fake_engine engine(fake_engine::single_file(1000, 10), false);
    playback_gate gate(engine);
    EXPECT_FALSE(gate.ready());
    engine.publish_metadata();
    EXPECT_FALSE(gate.ready());
}

TEST(playback_gate, custom_threshold)
{
    fake_engine engine(fake_engine::single_file(100, 10));
    playback_gate gate(engine, 0.5);
    for(auto i = 0; i < 4; ++i) {
        engine.verify(i);
    }
    EXPECT_FALSE(gate.ready());
    engine.verify(9);
    EXPECT_TRUE(gate.ready());
}
