#include "message_parser.hpp"
#include "endian.hpp"

#include <algorithm>
#include <stdexcept>
#include <cassert>

namespace flume {

view<uint8_t> message_parser::get_receive_buffer(const int n)
{
    if(n > free_space_size()) {
        buffer_.resize(buffer_size() + n - free_space_size());
    }
    return view<uint8_t>(&buffer_[unused_begin_], size_t(free_space_size()));
}

void message_parser::record_received_bytes(const int n) noexcept
{
    assert(n >= 0);
    assert(unused_begin_ + n <= buffer_size());
    unused_begin_ += n;
}

bool message_parser::has_message() const noexcept
{
    if(has(4)) {
        return has(4 + view_message_length());
    }
    return false;
}

bool message_parser::has_handshake() const noexcept
{
    if(has(1)) {
        const uint8_t protocol_length = buffer_[message_begin_];
        return has(49 + protocol_length);
    }
    return false;
}

handshake message_parser::extract_handshake()
{
    if(!has_handshake()) {
        throw std::logic_error("message_parser has no handshake message");
    }
    const uint8_t protocol_length = buffer_[message_begin_];
    const uint8_t* pos = &buffer_[message_begin_ + 1];
    handshake handshake;
    handshake.protocol = const_view<uint8_t>(pos, size_t(protocol_length));
    handshake.reserved = const_view<uint8_t>(pos += protocol_length, size_t(8));
    handshake.info_hash = const_view<uint8_t>(pos += 8, size_t(20));
    handshake.peer_id = const_view<uint8_t>(pos += 20, size_t(20));

    message_begin_ += 49 + protocol_length;
    return handshake;
}

message message_parser::extract_message()
{
    if(!has_message()) {
        throw std::logic_error("message_parser has no messages");
    }
    const int msg_length = view_message_length();
    message msg;
    if(msg_length == 0) {
        msg.type = message_type::keep_alive;
    } else {
        const int msg_id_pos = message_begin_ + 4;
        msg.type = buffer_[msg_id_pos];
        msg.data = const_view<uint8_t>(&buffer_[msg_id_pos + 1], size_t(msg_length - 1));
    }
    message_begin_ += 4 + msg_length;
    return msg;
}

int message_parser::current_message_length() const noexcept
{
    return has(4) ? view_message_length() : -1;
}

int message_parser::view_message_length() const noexcept
{
    assert(has(4));
    return endian::read_network<uint32_t>(&buffer_[message_begin_]);
}

void message_parser::optimize_receive_space()
{
    if(message_begin_ >= unused_begin_) {
        // everything's been parsed, start from the beginning of the buffer
        message_begin_ = 0;
        unused_begin_ = 0;
        return;
    }
    if(message_begin_ == 0) {
        return;
    }
    const auto begin = buffer_.begin();
    std::copy(begin + message_begin_, begin + unused_begin_, begin);
    unused_begin_ -= message_begin_;
    message_begin_ = 0;
}

} // namespace flume
