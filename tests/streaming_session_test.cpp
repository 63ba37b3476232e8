#include <gtest/gtest.h>

#include "streaming_session.hpp"
#include "torrent_source.hpp"
#include "session_error.hpp"
#include "stream_error.hpp"
#include "fake_engine.hpp"

#include <chrono>
#include <future>
#include <vector>

using namespace flume;

namespace {

constexpr auto short_wait = std::chrono::milliseconds(50);
constexpr auto long_wait = std::chrono::seconds(5);

settings default_settings()
{
    settings s;
    fill_in_defaults(s);
    return s;
}

torrent_layout two_file_layout()
{
    torrent_layout layout;
    layout.name = "show";
    layout.piece_length = 16;
    layout.total_length = 400;
    layout.num_pieces = 25;
    layout.files = {{"show/sample.mkv", 80, 0}, {"show/episode.mkv", 320, 80}};
    return layout;
}

torrent_source magnet_source()
{
    return torrent_source::parse(
            "magnet:?xt=urn:btih:c12fe1c06bba254a9dc9f519b335aa7c1367a88a");
}

} // namespace

TEST(streaming_session, streams_the_largest_file_once_metadata_arrives)
{
    auto engine = std::make_unique<fake_engine>(two_file_layout(), false);
    auto& fake = *engine;
    streaming_session session(std::move(engine), default_settings());
    session.start(magnet_source());
    EXPECT_EQ(fake.added_magnet, magnet_source().location);

    error_code ec;
    auto opened = std::async(std::launch::async,
            [&session, &ec] { return session.open_stream(nullptr, ec); });
    ASSERT_EQ(opened.wait_for(short_wait), std::future_status::timeout);
    EXPECT_FALSE(session.is_published());
    EXPECT_TRUE(session.stream_name().empty());

    fake.publish_metadata();
    ASSERT_EQ(opened.wait_for(long_wait), std::future_status::ready);
    auto reader = opened.get();
    ASSERT_FALSE(ec);
    ASSERT_TRUE(reader);
    EXPECT_EQ(reader->name(), "show/episode.mkv");
    EXPECT_EQ(reader->size(), 320);
    EXPECT_EQ(session.target().offset, 80);
    EXPECT_EQ(session.stream_name(), "show/episode.mkv");
    EXPECT_TRUE(session.is_published());
    EXPECT_EQ(fake.num_download_all_calls, 1);

    // ceil(25 * 5%) = 2 pieces were bumped to readahead
    const auto changes = fake.priority_changes();
    ASSERT_EQ(changes.size(), 2u);
    EXPECT_EQ(changes[0].first, 0);
    EXPECT_EQ(changes[1].first, 1);
    EXPECT_EQ(changes[1].second, piece_priority::readahead);

    fake.verify_all();
    std::vector<uint8_t> buffer(32);
    EXPECT_EQ(reader->read_at(0, buffer, nullptr, ec), 32);
    EXPECT_EQ(buffer[0], fake_engine::byte_at(80));
}

TEST(streaming_session, status_reports_engine_progress)
{
    auto engine = std::make_unique<fake_engine>(fake_engine::single_file(1000, 10));
    auto& fake = *engine;
    streaming_session session(std::move(engine), default_settings());
    session.start(magnet_source());

    auto status = session.status();
    EXPECT_EQ(status.name, "movie.mp4");
    EXPECT_EQ(status.total_length, 1000);
    EXPECT_EQ(status.bytes_completed, 0);
    EXPECT_EQ(status.num_connections, 3);
    EXPECT_TRUE(status.has_metadata);
    EXPECT_FALSE(status.is_ready);
    EXPECT_FALSE(status.failure);

    for(auto i = 0; i < 5; ++i) {
        fake.verify(i);
    }
    status = session.status();
    EXPECT_EQ(status.bytes_completed, 50);
    EXPECT_TRUE(status.is_ready);
    EXPECT_TRUE(session.ready());

    fake.fail();
    EXPECT_EQ(session.status().failure, session_errc::no_peers);
}

TEST(streaming_session, open_stream_can_be_cancelled)
{
    streaming_session session(
            std::make_unique<fake_engine>(two_file_layout(), false), default_settings());
    session.start(magnet_source());

    cancel_token cancel;
    error_code ec;
    auto opened = std::async(std::launch::async,
            [&session, &cancel, &ec] { return session.open_stream(&cancel, ec); });
    ASSERT_EQ(opened.wait_for(short_wait), std::future_status::timeout);
    cancel.cancel();
    ASSERT_EQ(opened.wait_for(long_wait), std::future_status::ready);
    EXPECT_FALSE(opened.get());
    EXPECT_EQ(ec, stream_errc::cancelled);
}

TEST(streaming_session, open_stream_fails_with_engine)
{
    auto engine = std::make_unique<fake_engine>(two_file_layout(), false);
    auto& fake = *engine;
    streaming_session session(std::move(engine), default_settings());
    session.start(magnet_source());

    error_code ec;
    auto opened = std::async(std::launch::async,
            [&session, &ec] { return session.open_stream(nullptr, ec); });
    ASSERT_EQ(opened.wait_for(short_wait), std::future_status::timeout);
    fake.fail();
    ASSERT_EQ(opened.wait_for(long_wait), std::future_status::ready);
    EXPECT_FALSE(opened.get());
    EXPECT_EQ(ec, stream_errc::engine_failure);
}

TEST(streaming_session, close_wakes_waiters_and_tears_down_in_order)
{
    auto engine = std::make_unique<fake_engine>(two_file_layout(), false);
    auto& fake = *engine;
    streaming_session session(std::move(engine), default_settings());
    session.start(magnet_source());

    error_code ec;
    auto opened = std::async(std::launch::async,
            [&session, &ec] { return session.open_stream(nullptr, ec); });
    ASSERT_EQ(opened.wait_for(short_wait), std::future_status::timeout);

    session.close();
    ASSERT_EQ(opened.wait_for(long_wait), std::future_status::ready);
    EXPECT_FALSE(opened.get());
    EXPECT_EQ(ec, session_errc::closed);
    EXPECT_EQ(fake.num_drop_calls, 1);
    EXPECT_EQ(fake.num_close_calls, 1);

    session.close();
    EXPECT_EQ(fake.num_close_calls, 1);
}

TEST(streaming_session, missing_torrent_file)
{
    streaming_session session(
            std::make_unique<fake_engine>(two_file_layout()), default_settings());
    try {
        session.start(torrent_source::parse("/nonexistent/file.torrent"));
        FAIL() << "expected a system_error";
    } catch(const system_error& e) {
        EXPECT_EQ(e.code(), session_errc::file_not_found);
        EXPECT_STREQ(construction_step(e.code()), construction_step(
                make_error_code(session_errc::file_not_found)));
    }
}

TEST(streaming_session, engine_rejecting_the_torrent)
{
    auto engine = std::make_unique<fake_engine>(two_file_layout());
    engine->add_error = make_error_code(session_errc::invalid_magnet);
    streaming_session session(std::move(engine), default_settings());
    try {
        session.start(magnet_source());
        FAIL() << "expected a system_error";
    } catch(const system_error& e) {
        EXPECT_EQ(e.code(), session_errc::invalid_magnet);
    }
}

TEST(streaming_session, can_only_be_started_once)
{
    streaming_session session(
            std::make_unique<fake_engine>(two_file_layout()), default_settings());
    session.start(magnet_source());
    EXPECT_THROW(session.start(magnet_source()), system_error);
}
