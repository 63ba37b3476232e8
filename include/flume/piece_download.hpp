#ifndef FLUME_PIECE_DOWNLOAD_HEADER
#define FLUME_PIECE_DOWNLOAD_HEADER

#include "block_info.hpp"
#include "disk_buffer.hpp"
#include "socket.hpp"
#include "types.hpp"
#include "time.hpp"
#include "view.hpp"

#include <vector>

namespace flume {

/**
 * This represents an ongoing piece download. It tracks which blocks were requested
 * and received, assembles the piece in a single buffer, and remembers the peers who
 * participated in the download so that a corrupt piece can be attributed.
 *
 * Several peer_sessions may download blocks of the same piece, so instances are
 * shared. Must only be used on the network thread.
 */
class piece_download
{
public:
    struct block
    {
        enum class status : uint8_t
        {
            free,
            requested,
            received
        };

        enum status status = status::free;
        time_point request_time;
    };

private:
    std::vector<block> blocks_;
    std::vector<tcp::endpoint> participants_;
    disk_buffer buffer_;
    piece_index_t index_;
    int piece_length_;

    // This is only decremented on a call to got_block().
    int num_blocks_left_;

    // This is decremented with every requested and received block, and incremented
    // once a request is cancelled. It's used to check if we can make requests for
    // this piece or we should move on to another.
    int num_pickable_blocks_;

public:
    piece_download(const piece_index_t index, const int piece_length, disk_buffer buffer);

    piece_index_t piece_index() const noexcept { return index_; }
    int piece_length() const noexcept { return piece_length_; }
    int num_blocks() const noexcept { return blocks_.size(); }
    int num_blocks_left() const noexcept { return num_blocks_left_; }
    bool is_complete() const noexcept { return num_blocks_left_ == 0; }

    /** Tests whether there are blocks left to request. */
    bool can_request() const noexcept { return num_pickable_blocks_ > 0; }

    /** Checks if we already downloaded block. */
    bool has_block(const block_info& block) const noexcept;

    /** Whether block describes a valid block of this piece. */
    bool is_valid_block(const block_info& block) const noexcept;

    /** True if at most a single peer sent us blocks of this piece. */
    bool is_exclusive() const noexcept { return participants_.size() <= 1; }
    const std::vector<tcp::endpoint>& participants() const noexcept
    {
        return participants_;
    }

    const std::vector<block>& blocks() const noexcept { return blocks_; }

    /**
     * Picks a free block, marks it as requested and returns it, or returns
     * invalid_block if none is free.
     */
    block_info pick_block();

    /**
     * Copies the block's payload into the piece buffer. Returns false if the block
     * had already been received, in which case nothing is copied. block must be
     * valid.
     */
    bool got_block(const tcp::endpoint& peer, const block_info& block,
            const_view<uint8_t> data);

    /**
     * This should be called when it is known that a block requested from a peer is
     * not going to be downloaded, such as when we disconnect, when we're choked, or
     * the request timed out. The block is freed for others to download.
     */
    void cancel_request(const block_info& block);

    /** The assembled piece, only complete once `is_complete()`. */
    const disk_buffer& buffer() const noexcept { return buffer_; }

private:
    int block_index(const block_info& block) const noexcept
    {
        return block.offset / block_info::default_length;
    }

    int block_length(const int index) const noexcept;
};

} // namespace flume

#endif // FLUME_PIECE_DOWNLOAD_HEADER
