#include <gtest/gtest.h>

#include "stream_reader.hpp"
#include "priority_scheduler.hpp"
#include "cancel_token.hpp"
#include "fake_engine.hpp"

#include <chrono>
#include <future>
#include <thread>
#include <vector>

using namespace flume;

namespace {

constexpr auto short_wait = std::chrono::milliseconds(50);
constexpr auto long_wait = std::chrono::seconds(5);

struct stream_reader_fixture : public ::testing::Test
{
    // 10 pieces of 16 bytes, the last one 4 bytes short
    fake_engine engine{fake_engine::single_file(156, 16)};
    priority_scheduler scheduler{engine, engine.num_pieces()};
    stream_reader reader{engine, scheduler, engine.layout().files[0], 16, 2};

    std::future<int> async_read(const int64_t offset, std::vector<uint8_t>& buffer,
            cancel_token* cancel, error_code& ec)
    {
        return std::async(std::launch::async, [this, offset, &buffer, cancel, &ec] {
            return reader.read_at(offset, buffer, cancel, ec);
        });
    }
};

void expect_torrent_bytes(const std::vector<uint8_t>& buffer, const int64_t offset,
        const int n)
{
    for(auto i = 0; i < n; ++i) {
        ASSERT_EQ(buffer[i], fake_engine::byte_at(offset + i)) << "at " << offset + i;
    }
}

} // namespace

TEST_F(stream_reader_fixture, reads_verified_pieces_without_blocking)
{
    engine.verify(1);
    engine.verify(2);
    std::vector<uint8_t> buffer(20);
    error_code ec;
    const int n = reader.read_at(20, buffer, nullptr, ec);
    ASSERT_FALSE(ec);
    EXPECT_EQ(n, 20);
    expect_torrent_bytes(buffer, 20, n);
    EXPECT_EQ(reader.last_read_end(), 40);
}

TEST_F(stream_reader_fixture, read_bumps_now_and_readahead_window)
{
    engine.verify_all();
    std::vector<uint8_t> buffer(20);
    error_code ec;
    reader.read_at(20, buffer, nullptr, ec);
    ASSERT_FALSE(ec);
    // verified pieces are never bumped
    EXPECT_TRUE(engine.priority_changes().empty());

    fake_engine fresh(fake_engine::single_file(156, 16));
    priority_scheduler s(fresh, fresh.num_pieces());
    stream_reader r(fresh, s, fresh.layout().files[0], 16, 2);
    fresh.verify(1);
    fresh.verify(2);
    r.read_at(20, buffer, nullptr, ec);
    ASSERT_FALSE(ec);
    EXPECT_EQ(s.level(3), piece_priority::readahead);
    EXPECT_EQ(s.level(4), piece_priority::readahead);
    EXPECT_EQ(s.level(5), piece_priority::normal);
}

TEST_F(stream_reader_fixture, readahead_stops_at_end_of_file)
{
    engine.verify(9);
    std::vector<uint8_t> buffer(12);
    error_code ec;
    const int n = reader.read_at(144, buffer, nullptr, ec);
    ASSERT_FALSE(ec);
    EXPECT_EQ(n, 12);
    expect_torrent_bytes(buffer, 144, n);
    EXPECT_TRUE(engine.priority_changes().empty());
}

TEST_F(stream_reader_fixture, short_read_at_end_of_file)
{
    engine.verify(9);
    std::vector<uint8_t> buffer(64);
    error_code ec;
    const int n = reader.read_at(150, buffer, nullptr, ec);
    ASSERT_FALSE(ec);
    EXPECT_EQ(n, 6);
    expect_torrent_bytes(buffer, 150, n);
}

TEST_F(stream_reader_fixture, offset_past_end_is_out_of_range_and_bumps_nothing)
{
    std::vector<uint8_t> buffer(4);
    error_code ec;
    EXPECT_EQ(reader.read_at(156, buffer, nullptr, ec), 0);
    EXPECT_EQ(ec, stream_errc::out_of_range);
    EXPECT_EQ(reader.read_at(-1, buffer, nullptr, ec), 0);
    EXPECT_EQ(ec, stream_errc::out_of_range);
    EXPECT_TRUE(engine.priority_changes().empty());
}

TEST_F(stream_reader_fixture, blocks_until_pieces_are_verified)
{
    std::vector<uint8_t> buffer(16);
    error_code ec;
    auto result = async_read(40, buffer, nullptr, ec);
    ASSERT_EQ(result.wait_for(short_wait), std::future_status::timeout);
    EXPECT_EQ(scheduler.level(2), piece_priority::now);
    EXPECT_EQ(scheduler.level(3), piece_priority::now);

    engine.verify(2);
    ASSERT_EQ(result.wait_for(short_wait), std::future_status::timeout);
    engine.verify(3);
    ASSERT_EQ(result.wait_for(long_wait), std::future_status::ready);
    EXPECT_EQ(result.get(), 16);
    EXPECT_FALSE(ec);
    expect_torrent_bytes(buffer, 40, 16);
}

TEST_F(stream_reader_fixture, overlapping_reads_both_complete)
{
    std::vector<uint8_t> a(32);
    std::vector<uint8_t> b(32);
    error_code ec_a;
    error_code ec_b;
    auto read_a = async_read(0, a, nullptr, ec_a);
    auto read_b = async_read(16, b, nullptr, ec_b);
    ASSERT_EQ(read_a.wait_for(short_wait), std::future_status::timeout);

    engine.verify(0);
    engine.verify(1);
    engine.verify(2);
    ASSERT_EQ(read_a.wait_for(long_wait), std::future_status::ready);
    ASSERT_EQ(read_b.wait_for(long_wait), std::future_status::ready);
    EXPECT_EQ(read_a.get(), 32);
    EXPECT_EQ(read_b.get(), 32);
    EXPECT_FALSE(ec_a);
    EXPECT_FALSE(ec_b);
    expect_torrent_bytes(a, 0, 32);
    expect_torrent_bytes(b, 16, 32);

    // piece 1 was requested by both reads but the engine heard of it once as now
    int num_now = 0;
    for(const auto& change : engine.priority_changes()) {
        if(change.first == 1 && change.second == piece_priority::now) {
            ++num_now;
        }
    }
    EXPECT_EQ(num_now, 1);
}

TEST_F(stream_reader_fixture, cancelling_one_read_leaves_others_waiting)
{
    cancel_token cancel_a;
    cancel_token cancel_b;
    std::vector<uint8_t> a(16);
    std::vector<uint8_t> b(16);
    error_code ec_a;
    error_code ec_b;
    auto read_a = async_read(0, a, &cancel_a, ec_a);
    auto read_b = async_read(96, b, &cancel_b, ec_b);
    ASSERT_EQ(read_a.wait_for(short_wait), std::future_status::timeout);

    cancel_a.cancel();
    ASSERT_EQ(read_a.wait_for(long_wait), std::future_status::ready);
    EXPECT_EQ(read_a.get(), 0);
    EXPECT_EQ(ec_a, stream_errc::cancelled);
    EXPECT_EQ(read_b.wait_for(short_wait), std::future_status::timeout);

    engine.verify(6);
    ASSERT_EQ(read_b.wait_for(long_wait), std::future_status::ready);
    EXPECT_EQ(read_b.get(), 16);
    EXPECT_FALSE(ec_b);
}

TEST_F(stream_reader_fixture, engine_failure_wakes_waiting_reads)
{
    std::vector<uint8_t> buffer(16);
    error_code ec;
    auto result = async_read(0, buffer, nullptr, ec);
    ASSERT_EQ(result.wait_for(short_wait), std::future_status::timeout);
    engine.fail();
    ASSERT_EQ(result.wait_for(long_wait), std::future_status::ready);
    EXPECT_EQ(result.get(), 0);
    EXPECT_EQ(ec, stream_errc::engine_failure);
}

TEST_F(stream_reader_fixture, cursor_reads_and_seeks)
{
    engine.verify_all();
    std::vector<uint8_t> buffer(100);
    error_code ec;

    EXPECT_EQ(reader.read(buffer, nullptr, ec), 100);
    EXPECT_EQ(reader.tell(), 100);
    EXPECT_EQ(reader.read(buffer, nullptr, ec), 56);
    expect_torrent_bytes(buffer, 100, 56);
    EXPECT_EQ(reader.read(buffer, nullptr, ec), 0);
    EXPECT_FALSE(ec);

    EXPECT_EQ(reader.seek(-6, stream_reader::origin::end, ec), 150);
    EXPECT_FALSE(ec);
    EXPECT_EQ(reader.seek(2, stream_reader::origin::current, ec), 152);
    EXPECT_EQ(reader.seek(-1, stream_reader::origin::begin, ec), 152);
    EXPECT_EQ(ec, stream_errc::out_of_range);
    EXPECT_EQ(reader.seek(1000, stream_reader::origin::begin, ec), 1000);
    EXPECT_FALSE(ec);
    EXPECT_EQ(reader.read(buffer, nullptr, ec), 0);
    EXPECT_FALSE(ec);
}

TEST_F(stream_reader_fixture, seek_touches_no_pieces)
{
    error_code ec;
    EXPECT_EQ(reader.seek(100, stream_reader::origin::begin, ec), 100);
    EXPECT_FALSE(ec);
    EXPECT_EQ(reader.seek(20, stream_reader::origin::current, ec), 120);
    EXPECT_FALSE(ec);
    EXPECT_EQ(reader.seek(-10, stream_reader::origin::end, ec), 146);
    EXPECT_FALSE(ec);
    EXPECT_EQ(reader.tell(), 146);

    EXPECT_TRUE(engine.priority_changes().empty());
    for(auto piece = 0; piece < engine.num_pieces(); ++piece) {
        EXPECT_EQ(scheduler.level(piece), piece_priority::normal) << "piece " << piece;
    }
}

TEST(stream_reader, file_within_multi_file_torrent)
{
    torrent_layout layout;
    layout.name = "show";
    layout.piece_length = 16;
    layout.total_length = 100;
    layout.num_pieces = 7;
    layout.files = {{"show/a.srt", 20, 0}, {"show/b.mkv", 80, 20}};
    fake_engine engine(layout);
    priority_scheduler scheduler(engine, layout.num_pieces);
    stream_reader reader(engine, scheduler, layout.files[1], 16, 8);
    engine.verify_all();

    std::vector<uint8_t> buffer(80);
    error_code ec;
    ASSERT_EQ(reader.read_at(0, buffer, nullptr, ec), 80);
    ASSERT_FALSE(ec);
    for(auto i = 0; i < 80; ++i) {
        ASSERT_EQ(buffer[i], fake_engine::byte_at(20 + i));
    }
    EXPECT_EQ(reader.name(), "show/b.mkv");
    EXPECT_EQ(reader.size(), 80);
}
