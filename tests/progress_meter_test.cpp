#include <gtest/gtest.h>

#include "progress_meter.hpp"

using namespace flume;

TEST(progress_meter, percent_and_rate)
{
    progress_meter meter;
    auto s = meter.sample(0, 1000, seconds(1));
    EXPECT_EQ(s.percent, 0.0);
    EXPECT_EQ(s.download_rate, 0);

    s = meter.sample(250, 1000, seconds(1));
    EXPECT_DOUBLE_EQ(s.percent, 25.0);
    EXPECT_EQ(s.download_rate, 250);

    s = meter.sample(450, 1000, seconds(2));
    EXPECT_DOUBLE_EQ(s.percent, 45.0);
    EXPECT_EQ(s.download_rate, 100);
    EXPECT_EQ(s.bytes_completed, 450);
    EXPECT_EQ(s.total_length, 1000);
}

TEST(progress_meter, unknown_total_length)
{
    progress_meter meter;
    const auto s = meter.sample(0, 0, seconds(1));
    EXPECT_EQ(s.percent, 0.0);
}

TEST(progress_meter, zero_interval_yields_no_rate)
{
    progress_meter meter;
    const auto s = meter.sample(500, 1000, milliseconds(0));
    EXPECT_EQ(s.download_rate, 0);
    EXPECT_DOUBLE_EQ(s.percent, 50.0);
}
