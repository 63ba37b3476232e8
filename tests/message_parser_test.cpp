#include <gtest/gtest.h>

#include "message_parser.hpp"
#include "payload.hpp"

#include <algorithm>
#include <string>

using namespace flume;

namespace {

void receive(message_parser& parser, const std::vector<uint8_t>& bytes)
{
    auto buffer = parser.get_receive_buffer(bytes.size());
    std::copy(bytes.begin(), bytes.end(), buffer.begin());
    parser.record_received_bytes(bytes.size());
}

std::vector<uint8_t> handshake_bytes()
{
    const std::string protocol = "BitTorrent protocol";
    payload p;
    p.u8(protocol.size()).buffer(protocol);
    for(auto i = 0; i < 8; ++i) {
        p.u8(i == 5 ? 0x10 : 0);
    }
    for(auto i = 0; i < 20; ++i) {
        p.u8(0xaa);
    }
    for(auto i = 0; i < 20; ++i) {
        p.u8(i);
    }
    return p.data;
}

} // namespace

TEST(message_parser, handshake)
{
    message_parser parser;
    const auto bytes = handshake_bytes();
    ASSERT_EQ(bytes.size(), 68u);

    receive(parser, std::vector<uint8_t>(bytes.begin(), bytes.begin() + 40));
    EXPECT_FALSE(parser.has_handshake());
    receive(parser, std::vector<uint8_t>(bytes.begin() + 40, bytes.end()));
    ASSERT_TRUE(parser.has_handshake());

    const auto hs = parser.extract_handshake();
    EXPECT_EQ(std::string(hs.protocol.begin(), hs.protocol.end()), "BitTorrent protocol");
    EXPECT_EQ(hs.reserved[5], 0x10);
    EXPECT_EQ(hs.info_hash[0], 0xaa);
    EXPECT_EQ(hs.peer_id[19], 19);
    EXPECT_EQ(parser.size(), 0);
}

TEST(message_parser, messages_arriving_in_fragments)
{
    payload p;
    // keep-alive
    p.u32(0);
    // have piece 7
    p.u32(5).u8(message_type::have).u32(7);
    // request
    p.u32(13).u8(message_type::request).u32(1).u32(0x4000).u32(0x4000);

    message_parser parser;
    receive(parser, std::vector<uint8_t>(p.data.begin(), p.data.begin() + 6));
    ASSERT_TRUE(parser.has_message());
    EXPECT_EQ(parser.extract_message().type, message_type::keep_alive);
    EXPECT_FALSE(parser.has_message());
    EXPECT_EQ(parser.current_message_length(), 5);

    receive(parser, std::vector<uint8_t>(p.data.begin() + 6, p.data.end()));
    ASSERT_TRUE(parser.has_message());
    auto msg = parser.extract_message();
    EXPECT_EQ(msg.type, message_type::have);
    ASSERT_EQ(msg.data.size(), 4u);
    EXPECT_EQ(flume::endian::read_network<uint32_t>(msg.data.begin()), 7u);

    ASSERT_TRUE(parser.has_message());
    msg = parser.extract_message();
    EXPECT_EQ(msg.type, message_type::request);
    ASSERT_EQ(msg.data.size(), 12u);
    EXPECT_EQ(flume::endian::read_network<uint32_t>(msg.data.begin() + 8), 0x4000u);
    EXPECT_FALSE(parser.has_message());
    EXPECT_EQ(parser.current_message_length(), -1);
}

TEST(message_parser, optimize_receive_space_keeps_partial_message)
{
    payload p;
    p.u32(1).u8(message_type::unchoke);
    p.u32(1).u8(message_type::interested);

    message_parser parser;
    receive(parser, std::vector<uint8_t>(p.data.begin(), p.data.begin() + 7));
    ASSERT_TRUE(parser.has_message());
    EXPECT_EQ(parser.extract_message().type, message_type::unchoke);

    parser.optimize_receive_space();
    EXPECT_EQ(parser.size(), 2);
    receive(parser, std::vector<uint8_t>(p.data.begin() + 7, p.data.end()));
    ASSERT_TRUE(parser.has_message());
    EXPECT_EQ(parser.extract_message().type, message_type::interested);
}

TEST(message_parser, extracting_without_message_throws)
{
    message_parser parser;
    EXPECT_THROW(parser.extract_message(), std::logic_error);
    EXPECT_THROW(parser.extract_handshake(), std::logic_error);
}
