#include <gtest/gtest.h>

#include "tracker.hpp"
#include "bencode.hpp"

#include <string>

using namespace flume;

TEST(tracker, announce_url)
{
    tracker_request r;
    r.info_hash.fill(0);
    r.info_hash[0] = 0xab;
    r.info_hash[1] = 'Z';
    r.peer_id.fill('x');
    r.port = 6881;
    r.uploaded = 1;
    r.downloaded = 2;
    r.left = 3;
    r.num_want = 50;
    r.event = tracker_request::event_t::started;

    const auto url = http_tracker::create_announce_url("http://t.example/announce", r);
    EXPECT_EQ(url,
            "http://t.example/announce?info_hash=%ABZ%00%00%00%00%00%00%00%00%00%00%00%00"
            "%00%00%00%00%00%00&peer_id=xxxxxxxxxxxxxxxxxxxx&port=6881&uploaded=1"
            "&downloaded=2&left=3&compact=1&no_peer_id=1&numwant=50&event=started");

    r.event = tracker_request::event_t::none;
    r.num_want = -1;
    r.tracker_id = "a b";
    const auto with_query = http_tracker::create_announce_url("http://t.example/a?k=v", r);
    EXPECT_NE(with_query.find("/a?k=v&info_hash="), std::string::npos);
    EXPECT_EQ(with_query.find("event="), std::string::npos);
    EXPECT_EQ(with_query.find("numwant="), std::string::npos);
    EXPECT_NE(with_query.find("&trackerid=a%20b"), std::string::npos);
}

TEST(tracker, compact_response)
{
    // 10.0.0.1:6881 and 192.168.1.2:51413
    const std::string peers("\x0a\x00\x00\x01\x1a\xe1\xc0\xa8\x01\x02\xc8\xd5", 12);
    bvalue::map_type m;
    m["interval"] = 1800;
    m["min interval"] = 60;
    m["complete"] = 5;
    m["incomplete"] = 7;
    m["tracker id"] = "abc";
    m["peers"] = peers;

    error_code ec;
    const auto r = http_tracker::parse_announce_response(bencode(bvalue(m)), ec);
    ASSERT_FALSE(ec);
    EXPECT_EQ(r.interval, seconds(1800));
    EXPECT_EQ(r.min_interval, seconds(60));
    EXPECT_EQ(r.num_seeders, 5);
    EXPECT_EQ(r.num_leechers, 7);
    EXPECT_EQ(r.tracker_id, "abc");
    ASSERT_EQ(r.peers.size(), 2u);
    EXPECT_EQ(r.peers[0].address().to_string(), "10.0.0.1");
    EXPECT_EQ(r.peers[0].port(), 6881);
    EXPECT_EQ(r.peers[1].address().to_string(), "192.168.1.2");
    EXPECT_EQ(r.peers[1].port(), 51413);
}

TEST(tracker, dictionary_peers)
{
    bvalue::map_type m;
    m["interval"] = 900;
    m["peers"] = bvalue::list_type{
        bvalue::map_type{{"ip", "10.1.1.1"}, {"port", 1000}},
        bvalue::map_type{{"ip", "not an ip"}, {"port", 1000}},
        bvalue::map_type{{"ip", "10.1.1.2"}, {"port", 0}},
    };
    error_code ec;
    const auto r = http_tracker::parse_announce_response(bencode(bvalue(m)), ec);
    ASSERT_FALSE(ec);
    ASSERT_EQ(r.peers.size(), 1u);
    EXPECT_EQ(r.peers[0].address().to_string(), "10.1.1.1");
    EXPECT_EQ(r.peers[0].port(), 1000);
}

TEST(tracker, failure_reason)
{
    error_code ec;
    const auto r = http_tracker::parse_announce_response(
            "d14:failure reason12:unregisterede", ec);
    ASSERT_FALSE(ec);
    EXPECT_EQ(r.failure_reason, "unregistered");
    EXPECT_TRUE(r.peers.empty());
}

TEST(tracker, invalid_response)
{
    error_code ec;
    http_tracker::parse_announce_response("li1ee", ec);
    EXPECT_EQ(ec, tracker_errc::invalid_response);
    http_tracker::parse_announce_response("<html>", ec);
    EXPECT_TRUE(ec);
}

TEST(tracker, compact_peers_skip_zero_ports)
{
    const uint8_t data[] = {1, 2, 3, 4, 0, 0, 5, 6, 7, 8, 0, 80, 9};
    const auto peers = parse_compact_peers(data, sizeof data);
    ASSERT_EQ(peers.size(), 1u);
    EXPECT_EQ(peers[0].address().to_string(), "5.6.7.8");
    EXPECT_EQ(peers[0].port(), 80);
}
