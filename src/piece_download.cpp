#include "piece_download.hpp"

#include <algorithm>
#include <cassert>

namespace flume {

piece_download::piece_download(
        const piece_index_t index, const int piece_length, disk_buffer buffer)
    : blocks_((piece_length + (block_info::default_length - 1)) / block_info::default_length)
    , buffer_(std::move(buffer))
    , index_(index)
    , piece_length_(piece_length)
    , num_blocks_left_(blocks_.size())
    , num_pickable_blocks_(blocks_.size())
{
    assert(buffer_.size() == piece_length);
}

bool piece_download::is_valid_block(const block_info& block) const noexcept
{
    return block.index == index_ && block.offset >= 0
            && block.offset % block_info::default_length == 0
            && block.offset < piece_length_
            && block.length == block_length(block_index(block));
}

bool piece_download::has_block(const block_info& block) const noexcept
{
    if(!is_valid_block(block)) {
        return false;
    }
    return blocks_[block_index(block)].status == block::status::received;
}

block_info piece_download::pick_block()
{
    if(!can_request()) {
        return invalid_block;
    }
    for(auto i = 0; i < num_blocks(); ++i) {
        auto& b = blocks_[i];
        if(b.status == block::status::free) {
            b.status = block::status::requested;
            b.request_time = cached_clock::now();
            --num_pickable_blocks_;
            return block_info(index_, i * block_info::default_length, block_length(i));
        }
    }
    return invalid_block;
}

bool piece_download::got_block(
        const tcp::endpoint& peer, const block_info& info, const_view<uint8_t> data)
{
    assert(is_valid_block(info));
    assert(int(data.size()) == info.length);

    block& b = blocks_[block_index(info)];
    if(b.status == block::status::received) {
        return false;
    }
    if(b.status == block::status::free) {
        // We didn't request it (or the request was cancelled), but it's still good.
        --num_pickable_blocks_;
    }
    b.status = block::status::received;
    --num_blocks_left_;
    std::copy(data.begin(), data.end(), buffer_.data() + info.offset);

    if(std::find(participants_.begin(), participants_.end(), peer) == participants_.end()) {
        participants_.push_back(peer);
    }
    return true;
}

void piece_download::cancel_request(const block_info& info)
{
    if(!is_valid_block(info)) {
        return;
    }
    block& b = blocks_[block_index(info)];
    if(b.status == block::status::requested) {
        b.status = block::status::free;
        ++num_pickable_blocks_;
    }
}

int piece_download::block_length(const int index) const noexcept
{
    if(index == num_blocks() - 1) {
        const int rest = piece_length_ - index * block_info::default_length;
        return rest;
    }
    return block_info::default_length;
}

} // namespace flume
