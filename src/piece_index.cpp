#include "piece_index.hpp"
#include "stream_error.hpp"

#include <cassert>

namespace flume {

piece_span locate(const int64_t file_offset, const int64_t file_length,
        const int piece_length, const int64_t offset, const int64_t length,
        error_code& error)
{
    assert(piece_length > 0);
    error.clear();
    // offset + length may not overflow as both are bounded by file_length here
    if((offset < 0) || (length <= 0) || (offset > file_length)
            || (length > file_length - offset)) {
        error = make_error_code(stream_errc::out_of_range);
        return {};
    }

    const int64_t begin = file_offset + offset;
    const int64_t end = begin + length;

    piece_span span;
    span.first_piece = begin / piece_length;
    span.first_offset = begin - int64_t(span.first_piece) * piece_length;
    span.last_piece = (end - 1) / piece_length;
    span.last_end = end - int64_t(span.last_piece) * piece_length;
    return span;
}

piece_index::piece_index(const int64_t total_length, const int piece_length)
    : total_length_(total_length)
    , piece_length_(piece_length)
    , num_pieces_(piece_length > 0 ? (total_length + piece_length - 1) / piece_length : 0)
{}

int piece_index::piece_size(const piece_index_t piece) const noexcept
{
    assert(piece >= 0 && piece < num_pieces_);
    if(piece == num_pieces_ - 1) {
        const int rem = total_length_ % piece_length_;
        return rem == 0 ? piece_length_ : rem;
    }
    return piece_length_;
}

int64_t piece_index::piece_offset(const piece_index_t piece) const noexcept
{
    return int64_t(piece) * piece_length_;
}

interval piece_index::file_pieces(
        const int64_t file_offset, const int64_t file_length) const noexcept
{
    if(file_length <= 0 || piece_length_ <= 0) {
        return {};
    }
    return {int(file_offset / piece_length_),
            int((file_offset + file_length - 1) / piece_length_ + 1)};
}

} // namespace flume
