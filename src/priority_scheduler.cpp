#include "priority_scheduler.hpp"

#include <algorithm>
#include <cassert>

namespace flume {

priority_scheduler::priority_scheduler(download_engine& engine, const int num_pieces)
    : engine_(engine)
    , num_pieces_(num_pieces)
    , levels_(new std::atomic<uint8_t>[num_pieces])
{
    for(auto i = 0; i < num_pieces_; ++i) {
        levels_[i].store(uint8_t(piece_priority::normal), std::memory_order_relaxed);
    }
}

void priority_scheduler::bump(const interval pieces, const piece_priority level)
{
    assert(pieces.begin >= 0 && pieces.end <= num_pieces_);
    const auto new_level = uint8_t(level);
    for(auto piece = pieces.begin; piece < pieces.end; ++piece) {
        if(engine_.is_piece_verified(piece)) {
            continue;
        }
        auto& slot = levels_[piece];
        uint8_t curr = slot.load(std::memory_order_acquire);
        while(curr < new_level) {
            if(slot.compare_exchange_weak(curr, new_level, std::memory_order_acq_rel)) {
                engine_.set_piece_priority(piece, level);
                break;
            }
        }
    }
}

void priority_scheduler::initial_readahead()
{
    std::call_once(initial_readahead_flag_, [this] {
        const int n = initial_readahead_length(num_pieces_);
        if(n > 0) {
            bump({0, n}, piece_priority::readahead);
        }
    });
}

piece_priority priority_scheduler::level(const piece_index_t piece) const noexcept
{
    assert(piece >= 0 && piece < num_pieces_);
    return piece_priority(levels_[piece].load(std::memory_order_acquire));
}

int priority_scheduler::initial_readahead_length(const int num_pieces) noexcept
{
    if(num_pieces <= 0) {
        return 0;
    }
    return std::min(num_pieces, std::max(1, (num_pieces * 5 + 99) / 100));
}

} // namespace flume
