#ifndef FLUME_BLOCK_INFO_HEADER
#define FLUME_BLOCK_INFO_HEADER

#include "types.hpp"
#include "time.hpp"

namespace flume {

/** A piece is transferred over the wire in blocks, the identity of which is this. */
struct block_info
{
    enum { default_length = 0x4000 };

    piece_index_t index = -1;
    int offset = -1;
    int length = -1;

    block_info() = default;
    block_info(piece_index_t index_, int offset_, int length_)
        : index(index_)
        , offset(offset_)
        , length(length_)
    {}
};

static const block_info invalid_block;

inline bool operator==(const block_info& a, const block_info& b) noexcept
{
    return a.index == b.index && a.offset == b.offset && a.length == b.length;
}

inline bool operator!=(const block_info& a, const block_info& b) noexcept
{
    return !(a == b);
}

inline bool operator<(const block_info& a, const block_info& b) noexcept
{
    if(a.index == b.index) {
        if(a.offset == b.offset) {
            return a.length < b.length;
        }
        return a.offset < b.offset;
    }
    return a.index < b.index;
}

/** Used to represent requests we had sent out. */
struct pending_block : public block_info
{
    time_point request_time;

    pending_block(block_info b, time_point t) : block_info(b), request_time(t) {}
};

} // namespace flume

#endif // FLUME_BLOCK_INFO_HEADER
