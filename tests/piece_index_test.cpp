#include <gtest/gtest.h>

#include "piece_index.hpp"
#include "stream_error.hpp"

using namespace flume;

TEST(piece_index, locate_request_spanning_two_pieces)
{
    // piece size 4, file of 10 bytes, 4 bytes from offset 3
    error_code ec;
    const auto span = locate(0, 10, 4, 3, 4, ec);
    ASSERT_FALSE(ec);
    EXPECT_EQ(span.first_piece, 0);
    EXPECT_EQ(span.last_piece, 1);
    EXPECT_EQ(span.first_offset, 3);
    EXPECT_EQ(span.last_end, 3);
    EXPECT_EQ(span.num_pieces(), 2);
    EXPECT_EQ(span.pieces(), interval(0, 2));
}

TEST(piece_index, locate_reconstructs_exact_length)
{
    const int piece_length = 7;
    const int64_t file_offset = 5;
    const int64_t file_length = 40;
    for(int64_t offset = 0; offset < file_length; ++offset) {
        for(int64_t length = 1; offset + length <= file_length; ++length) {
            error_code ec;
            const auto span = locate(
                    file_offset, file_length, piece_length, offset, length, ec);
            ASSERT_FALSE(ec);
            int64_t total = 0;
            for(auto p = span.first_piece; p <= span.last_piece; ++p) {
                const int begin = p == span.first_piece ? span.first_offset : 0;
                const int end = p == span.last_piece ? span.last_end : piece_length;
                total += end - begin;
            }
            ASSERT_EQ(total, length) << "offset " << offset << " length " << length;
        }
    }
}

TEST(piece_index, last_byte_of_file_with_short_last_piece)
{
    // 10 bytes in pieces of 4: the last piece is 2 bytes long
    error_code ec;
    const auto span = locate(0, 10, 4, 9, 1, ec);
    ASSERT_FALSE(ec);
    EXPECT_EQ(span.first_piece, 2);
    EXPECT_EQ(span.last_piece, 2);
    EXPECT_EQ(span.first_offset, 1);
    EXPECT_EQ(span.last_end, 2);
}

TEST(piece_index, file_in_middle_of_torrent)
{
    // the file starts at byte 6 of the torrent
    error_code ec;
    const auto span = locate(6, 10, 4, 0, 10, ec);
    ASSERT_FALSE(ec);
    EXPECT_EQ(span.first_piece, 1);
    EXPECT_EQ(span.first_offset, 2);
    EXPECT_EQ(span.last_piece, 3);
    EXPECT_EQ(span.last_end, 4);
}

TEST(piece_index, out_of_range_requests)
{
    error_code ec;
    locate(0, 10, 4, -1, 2, ec);
    EXPECT_EQ(ec, stream_errc::out_of_range);
    locate(0, 10, 4, 0, 0, ec);
    EXPECT_EQ(ec, stream_errc::out_of_range);
    locate(0, 10, 4, 8, 3, ec);
    EXPECT_EQ(ec, stream_errc::out_of_range);
    locate(0, 10, 4, 10, 1, ec);
    EXPECT_EQ(ec, stream_errc::out_of_range);
    locate(0, 10, 4, 8, 2, ec);
    EXPECT_FALSE(ec);
}

TEST(piece_index, geometry)
{
    const piece_index index(10, 4);
    EXPECT_EQ(index.num_pieces(), 3);
    EXPECT_EQ(index.piece_size(0), 4);
    EXPECT_EQ(index.piece_size(2), 2);
    EXPECT_EQ(index.piece_offset(2), 8);

    const piece_index even(12, 4);
    EXPECT_EQ(even.num_pieces(), 3);
    EXPECT_EQ(even.piece_size(2), 4);
}

TEST(piece_index, file_pieces)
{
    const piece_index index(100, 10);
    EXPECT_EQ(index.file_pieces(0, 100), interval(0, 10));
    EXPECT_EQ(index.file_pieces(15, 10), interval(1, 3));
    EXPECT_EQ(index.file_pieces(20, 10), interval(2, 3));
    EXPECT_TRUE(index.file_pieces(20, 0).empty());
}
