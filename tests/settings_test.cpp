#include <gtest/gtest.h>

#include "settings.hpp"

#include <stdexcept>

using namespace flume;

TEST(settings, defaults_are_filled_in)
{
    settings s;
    fill_in_defaults(s);
    EXPECT_FALSE(s.engine.data_dir.empty());
    EXPECT_EQ(s.engine.listener_port, 6881);
    EXPECT_EQ(s.engine.max_connections, 50);
    EXPECT_GT(s.engine.disk_io_concurrency, 0);
    EXPECT_EQ(s.stream.readahead_window, 8);
    EXPECT_DOUBLE_EQ(s.stream.readiness_threshold, 0.05);
    EXPECT_EQ(s.server.port, 8080);
    EXPECT_GT(s.server.concurrency, 0);
    EXPECT_EQ(s.server.chunk_size, 0x10000);
    EXPECT_NO_THROW(verify(s));
}

TEST(settings, explicit_values_are_kept)
{
    settings s;
    s.engine.data_dir = "/var/tmp/flume";
    s.engine.max_connections = 10;
    s.stream.readahead_window = 0;
    fill_in_defaults(s);
    EXPECT_EQ(s.engine.data_dir, "/var/tmp/flume");
    EXPECT_EQ(s.engine.max_connections, 10);
    EXPECT_EQ(s.stream.readahead_window, 0);
}

TEST(settings, invalid_values_are_rejected)
{
    settings s;
    fill_in_defaults(s);

    auto bad = s;
    bad.engine.listener_port = 70000;
    EXPECT_THROW(verify(bad), std::invalid_argument);

    bad = s;
    bad.engine.peer_timeout = seconds(30);
    EXPECT_THROW(verify(bad), std::invalid_argument);

    bad = s;
    bad.stream.readiness_threshold = 1.5;
    EXPECT_THROW(verify(bad), std::invalid_argument);

    bad = s;
    bad.server.chunk_size = 100;
    EXPECT_THROW(verify(bad), std::invalid_argument);

    bad = s;
    bad.engine.client_id_prefix = std::string(21, 'x');
    EXPECT_THROW(verify(bad), std::invalid_argument);
}
