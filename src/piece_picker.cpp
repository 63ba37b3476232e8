#include "piece_picker.hpp"

#include <algorithm>
#include <cassert>

namespace flume {

piece_picker::piece_picker(const int num_pieces)
    : pieces_(num_pieces)
    , my_pieces_(num_pieces)
{}

void piece_picker::want_all()
{
    for(auto i = 0; i < num_pieces(); ++i) {
        if(!pieces_[i].is_wanted && !my_pieces_[i]) {
            pieces_[i].is_wanted = true;
            ++num_wanted_;
        }
    }
}

void piece_picker::set_priority(const piece_index_t piece, const piece_priority priority)
{
    assert(piece >= 0 && piece < num_pieces());
    auto& p = pieces_[piece];
    // Priority changes may arrive out of order, so a piece is never lowered.
    p.priority = std::max(p.priority, priority);
    if(!p.is_wanted && !my_pieces_[piece]) {
        p.is_wanted = true;
        ++num_wanted_;
    }
}

piece_priority piece_picker::priority(const piece_index_t piece) const noexcept
{
    assert(piece >= 0 && piece < num_pieces());
    return pieces_[piece].priority;
}

bool piece_picker::is_wanted(const piece_index_t piece) const noexcept
{
    assert(piece >= 0 && piece < num_pieces());
    return pieces_[piece].is_wanted;
}

bool piece_picker::am_interested_in(const bitfield& available_pieces) const noexcept
{
    // we're interested in peer if it has at least one piece that we don't have but want
    assert(available_pieces.size() == num_pieces());
    for(auto i = 0; i < num_pieces(); ++i) {
        if(pieces_[i].is_wanted && available_pieces[i]) {
            return true;
        }
    }
    return false;
}

void piece_picker::increase_frequency(const piece_index_t piece)
{
    assert(piece >= 0 && piece < num_pieces());
    ++pieces_[piece].frequency;
}

void piece_picker::increase_frequency(const bitfield& available_pieces)
{
    for(piece_index_t piece = 0; piece < num_pieces(); ++piece) {
        if(available_pieces[piece]) {
            increase_frequency(piece);
        }
    }
}

void piece_picker::decrease_frequency(const piece_index_t piece)
{
    assert(piece >= 0 && piece < num_pieces());
    if(pieces_[piece].frequency > 0) {
        --pieces_[piece].frequency;
    }
}

void piece_picker::decrease_frequency(const bitfield& available_pieces)
{
    for(piece_index_t piece = 0; piece < num_pieces(); ++piece) {
        if(available_pieces[piece]) {
            decrease_frequency(piece);
        }
    }
}

int piece_picker::frequency(const piece_index_t piece) const noexcept
{
    assert(piece >= 0 && piece < num_pieces());
    return pieces_[piece].frequency;
}

piece_index_t piece_picker::pick(const bitfield& available_pieces)
{
    assert(available_pieces.size() == num_pieces());
    piece_index_t best = invalid_piece_index;
    for(auto i = 0; i < num_pieces(); ++i) {
        const auto& p = pieces_[i];
        if(!p.is_wanted || p.is_reserved || !available_pieces[i]) {
            continue;
        }
        if(best == invalid_piece_index) {
            best = i;
            continue;
        }
        const auto& b = pieces_[best];
        if(p.priority != b.priority) {
            if(p.priority > b.priority) {
                best = i;
            }
        } else if(p.priority == piece_priority::normal && p.frequency < b.frequency) {
            // rarest first, and since we iterate in index order, ties keep the
            // lower index
            best = i;
        }
    }
    if(best != invalid_piece_index) {
        reserve(best);
    }
    return best;
}

bool piece_picker::is_reserved(const piece_index_t piece) const noexcept
{
    assert(piece >= 0 && piece < num_pieces());
    return pieces_[piece].is_reserved;
}

void piece_picker::reserve(const piece_index_t piece)
{
    assert(piece >= 0 && piece < num_pieces());
    pieces_[piece].is_reserved = true;
}

void piece_picker::unreserve(const piece_index_t piece)
{
    assert(piece >= 0 && piece < num_pieces());
    pieces_[piece].is_reserved = false;
}

void piece_picker::got(const piece_index_t piece)
{
    assert(piece >= 0 && piece < num_pieces());
    if(my_pieces_[piece]) {
        return;
    }
    my_pieces_.set(piece);
    ++num_have_;
    auto& p = pieces_[piece];
    if(p.is_wanted) {
        p.is_wanted = false;
        --num_wanted_;
    }
    p.is_reserved = false;
}

} // namespace flume
