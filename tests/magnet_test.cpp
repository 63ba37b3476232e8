#include <gtest/gtest.h>

#include "magnet.hpp"
#include "session_error.hpp"
#include "string_utils.hpp"

using namespace flume;

TEST(magnet, hex_info_hash_with_parameters)
{
    error_code ec;
    const auto link = parse_magnet("magnet:?xt=urn:btih:C12FE1C06BBA254A9DC9F519B335AA7C1367A88A"
                                   "&dn=Big+Buck+Bunny"
                                   "&tr=udp%3A%2F%2Ftracker.example.org%3A1337"
                                   "&tr=http%3A%2F%2Fexample.com%2Fannounce"
                                   "&x.pe=10.0.0.1%3A6881",
            ec);
    ASSERT_FALSE(ec);
    EXPECT_EQ(util::to_hex(link.info_hash), "c12fe1c06bba254a9dc9f519b335aa7c1367a88a");
    EXPECT_EQ(link.display_name, "Big Buck Bunny");
    ASSERT_EQ(link.trackers.size(), 2u);
    EXPECT_EQ(link.trackers[0], "udp://tracker.example.org:1337");
    EXPECT_EQ(link.trackers[1], "http://example.com/announce");
    ASSERT_EQ(link.peers.size(), 1u);
    EXPECT_EQ(link.peers[0], "10.0.0.1:6881");
}

TEST(magnet, base32_info_hash)
{
    // base32 of the 20 bytes 0x00, 0x01, ..., 0x13
    error_code ec;
    const auto link = parse_magnet("magnet:?xt=urn:btih:AAAQEAYEAUDAOCAJBIFQYDIOB4IBCEQT", ec);
    ASSERT_FALSE(ec);
    EXPECT_EQ(util::to_hex(link.info_hash), "000102030405060708090a0b0c0d0e0f10111213");
}

TEST(magnet, invalid_links)
{
    error_code ec;
    parse_magnet("http://example.com", ec);
    EXPECT_EQ(ec, session_errc::invalid_magnet);
    parse_magnet("magnet:?dn=no+hash", ec);
    EXPECT_EQ(ec, session_errc::invalid_magnet);
    parse_magnet("magnet:?xt=urn:btih:1234", ec);
    EXPECT_EQ(ec, session_errc::invalid_magnet);
    parse_magnet("magnet:?xt=urn:btih:zz2fe1c06bba254a9dc9f519b335aa7c1367a88a", ec);
    EXPECT_EQ(ec, session_errc::invalid_magnet);
}
