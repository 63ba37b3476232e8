#ifndef FLUME_PIECE_PICKER_HEADER
#define FLUME_PIECE_PICKER_HEADER

#include "download_engine.hpp"
#include "bitfield.hpp"
#include "types.hpp"

#include <vector>

namespace flume {

/**
 * Decides which piece to download next from a peer.
 *
 * Nothing is wanted until `want_all` is called or a piece's priority is set, which
 * lets the engine fetch metadata and stay idle until told to download. Among the
 * wanted pieces that a peer has, that we don't have, and that are not yet reserved,
 * the highest priority wins. Within `now` and `readahead` the lowest index is picked
 * so that streams are fed in order; within `normal` the rarest piece in the swarm is
 * picked, lowest index breaking ties.
 */
class piece_picker
{
    struct piece
    {
        uint16_t frequency = 0;
        piece_priority priority = piece_priority::normal;
        bool is_wanted = false;
        bool is_reserved = false;
    };

    std::vector<piece> pieces_;

    // A full piece availability map of our pieces.
    bitfield my_pieces_;

    int num_have_ = 0;
    int num_wanted_ = 0;

public:
    explicit piece_picker(const int num_pieces);

    int num_pieces() const noexcept { return pieces_.size(); }
    int num_have_pieces() const noexcept { return num_have_; }
    const bitfield& my_bitfield() const noexcept { return my_pieces_; }
    bool has_all_pieces() const noexcept { return num_have_ == num_pieces(); }
    bool has_piece(const piece_index_t piece) const noexcept { return my_pieces_[piece]; }

    /** True if all wanted pieces are downloaded. */
    bool is_finished() const noexcept { return num_wanted_ == 0; }

    void want_all();

    /** Raises the piece's priority, never lowers it. Also marks the piece as wanted. */
    void set_priority(const piece_index_t piece, const piece_priority priority);
    piece_priority priority(const piece_index_t piece) const noexcept;
    bool is_wanted(const piece_index_t piece) const noexcept;

    /** Whether the peer has a piece we want and don't have yet. */
    bool am_interested_in(const bitfield& available_pieces) const noexcept;

    /**
     * Called when a 'have' or 'bitfield' message is received or a peer disconnects,
     * to track the availability of pieces in the swarm.
     */
    void increase_frequency(const piece_index_t piece);
    void increase_frequency(const bitfield& available_pieces);
    void decrease_frequency(const piece_index_t piece);
    void decrease_frequency(const bitfield& available_pieces);
    int frequency(const piece_index_t piece) const noexcept;

    /**
     * Picks and reserves the most suitable piece from available_pieces, or returns
     * invalid_piece_index if none could be picked.
     */
    piece_index_t pick(const bitfield& available_pieces);

    bool is_reserved(const piece_index_t piece) const noexcept;
    void reserve(const piece_index_t piece);
    void unreserve(const piece_index_t piece);

    /** Marks the piece as downloaded (and verified). */
    void got(const piece_index_t piece);
};

} // namespace flume

#endif // FLUME_PIECE_PICKER_HEADER
