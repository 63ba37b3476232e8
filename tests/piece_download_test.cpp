#include <gtest/gtest.h>

#include "piece_download.hpp"
#include "disk_buffer.hpp"

#include <memory>
#include <vector>

using namespace flume;

namespace {

const tcp::endpoint peer_a(asio::ip::make_address("10.0.0.1"), 6881);
const tcp::endpoint peer_b(asio::ip::make_address("10.0.0.2"), 6881);

// two full blocks and a short one
constexpr int piece_length = 2 * 0x4000 + 100;

struct piece_download_fixture : public ::testing::Test
{
    std::shared_ptr<disk_buffer_pool> pool = std::make_shared<disk_buffer_pool>(piece_length);
    piece_download download{3, piece_length, pool->allocate(piece_length)};
};

} // namespace

TEST_F(piece_download_fixture, picks_blocks_in_order)
{
    EXPECT_EQ(download.num_blocks(), 3);
    EXPECT_EQ(download.pick_block(), block_info(3, 0, 0x4000));
    EXPECT_EQ(download.pick_block(), block_info(3, 0x4000, 0x4000));
    EXPECT_EQ(download.pick_block(), block_info(3, 0x8000, 100));
    EXPECT_FALSE(download.can_request());
    EXPECT_EQ(download.pick_block(), invalid_block);

    download.cancel_request(block_info(3, 0x4000, 0x4000));
    EXPECT_TRUE(download.can_request());
    EXPECT_EQ(download.pick_block(), block_info(3, 0x4000, 0x4000));
}

TEST_F(piece_download_fixture, assembles_piece_from_blocks)
{
    std::vector<uint8_t> first(0x4000, 1);
    std::vector<uint8_t> second(0x4000, 2);
    std::vector<uint8_t> last(100, 3);

    const auto b0 = download.pick_block();
    const auto b1 = download.pick_block();
    const auto b2 = download.pick_block();
    EXPECT_TRUE(download.got_block(peer_a, b0, first));
    EXPECT_FALSE(download.got_block(peer_a, b0, first));
    EXPECT_TRUE(download.has_block(b0));
    EXPECT_TRUE(download.got_block(peer_a, b2, last));
    EXPECT_TRUE(download.is_exclusive());
    EXPECT_FALSE(download.is_complete());

    EXPECT_TRUE(download.got_block(peer_b, b1, second));
    EXPECT_TRUE(download.is_complete());
    EXPECT_FALSE(download.is_exclusive());
    EXPECT_EQ(download.participants().size(), 2u);

    const auto& buffer = download.buffer();
    EXPECT_EQ(buffer.data()[0], 1);
    EXPECT_EQ(buffer.data()[0x4000], 2);
    EXPECT_EQ(buffer.data()[piece_length - 1], 3);
}

TEST_F(piece_download_fixture, validates_blocks)
{
    EXPECT_TRUE(download.is_valid_block(block_info(3, 0x8000, 100)));
    EXPECT_FALSE(download.is_valid_block(block_info(2, 0, 0x4000)));
    EXPECT_FALSE(download.is_valid_block(block_info(3, 10, 0x4000)));
    EXPECT_FALSE(download.is_valid_block(block_info(3, 0x8000, 0x4000)));
    EXPECT_FALSE(download.is_valid_block(block_info(3, 0xc000, 0x4000)));
}

TEST_F(piece_download_fixture, unrequested_block_still_counts)
{
    std::vector<uint8_t> data(0x4000, 9);
    EXPECT_TRUE(download.got_block(peer_a, block_info(3, 0x4000, 0x4000), data));
    EXPECT_EQ(download.pick_block(), block_info(3, 0, 0x4000));
    EXPECT_EQ(download.pick_block(), block_info(3, 0x8000, 100));
    EXPECT_FALSE(download.can_request());
}
