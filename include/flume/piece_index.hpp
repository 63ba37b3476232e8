#ifndef FLUME_PIECE_INDEX_HEADER
#define FLUME_PIECE_INDEX_HEADER

#include "error_code.hpp"
#include "interval.hpp"
#include "types.hpp"

#include <cstdint>

namespace flume {

/**
 * The pieces backing a byte range of a file: an inclusive piece range, the offset
 * of the first byte within the first piece and the exclusive end of the last byte
 * within the last piece.
 */
struct piece_span
{
    piece_index_t first_piece = 0;
    int first_offset = 0;
    piece_index_t last_piece = 0;
    int last_end = 0;

    int num_pieces() const noexcept { return last_piece - first_piece + 1; }

    /** The pieces as a half-open interval. */
    interval pieces() const noexcept { return {first_piece, last_piece + 1}; }
};

/**
 * Maps the byte range [offset, offset + length) of a file that begins at
 * `file_offset` within the torrent to the pieces that back it.
 *
 * A negative offset, a non-positive length or a range that extends past
 * `file_length` sets `error` to `stream_errc::out_of_range`; requests are never
 * clamped.
 */
piece_span locate(const int64_t file_offset, const int64_t file_length,
        const int piece_length, const int64_t offset, const int64_t length,
        error_code& error);

/**
 * Piece geometry of a torrent. Every piece is `piece_length` bytes long except the
 * last, which is `total_length mod piece_length` (or `piece_length` when the total
 * is evenly divisible).
 */
class piece_index
{
    int64_t total_length_ = 0;
    int piece_length_ = 0;
    int num_pieces_ = 0;

public:
    piece_index() = default;
    piece_index(const int64_t total_length, const int piece_length);

    int64_t total_length() const noexcept { return total_length_; }
    int piece_length() const noexcept { return piece_length_; }
    int num_pieces() const noexcept { return num_pieces_; }

    /** The length of the piece, accounting for the shorter last piece. */
    int piece_size(const piece_index_t piece) const noexcept;

    /** The offset of the piece's first byte within the torrent. */
    int64_t piece_offset(const piece_index_t piece) const noexcept;

    /** The pieces that contain any byte of a file. Empty for empty files. */
    interval file_pieces(const int64_t file_offset, const int64_t file_length) const noexcept;
};

} // namespace flume

#endif // FLUME_PIECE_INDEX_HEADER
