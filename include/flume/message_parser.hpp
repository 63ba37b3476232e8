#ifndef FLUME_MESSAGE_PARSER_HEADER
#define FLUME_MESSAGE_PARSER_HEADER

#include "view.hpp"

#include <cstdint>
#include <vector>

namespace flume {

/**
 * All supported BitTorrent message types. This is denoted by the 5th byte in a
 * torrent message.
 *
 * NOTE: whereas in the protocol the term 'piece' is used to describe both the pieces
 * into which a file is split and the payload sent over the network, for clarity, here
 * and throughout the engine, the unofficial term 'block' is used to denote the piece
 * chunks sent over the network.
 */
namespace message_type {

// A keep alive message has no identifier (it's just 4 zero bytes), this is used only by
// message_parser::type to tell caller that the current message is a keep_alive.
constexpr int keep_alive = -1;

enum
{
    choke = 0,
    unchoke = 1,
    interested = 2,
    not_interested = 3,
    have = 4,
    bitfield = 5,
    request = 6,
    block = 7,
    cancel = 8,
    port = 9,
    // BEP 10 extension protocol
    extended = 20
};

} // namespace message_type

struct message
{
    int type;
    // The message content, excluding the four bytes of message length and one byte of
    // message identifier/type.
    const_view<uint8_t> data;
};

struct handshake
{
    const_view<uint8_t> protocol;
    // 8 reserved bytes used to identify extensions.
    const_view<uint8_t> reserved;
    const_view<uint8_t> info_hash;
    const_view<uint8_t> peer_id;
};

/**
 * Raw bytes sent by peer are read into message_parser's internal buffer. These are
 * lazily parsed into BitTorrent messages, however, no extra copies are made. The user
 * receives merely a view into the internal buffer, which is valid until the next
 * call to `get_receive_buffer` or `optimize_receive_space`.
 */
class message_parser
{
    std::vector<uint8_t> buffer_;

    // The index of the beginning of the current message, i.e. the beginning of the
    // message length field.
    int message_begin_ = 0;

    // This is first byte after the last message byte, so anything in the range
    // [unused_begin_, buffer_size()) is garbage.
    int unused_begin_ = 0;

public:
    /** The number of unparsed bytes in the receive buffer. */
    int size() const noexcept { return unused_begin_ - message_begin_; }
    int buffer_size() const noexcept { return buffer_.size(); }
    int free_space_size() const noexcept { return buffer_size() - unused_begin_; }

    /**
     * Returns a view of at least `n` free bytes after the last received byte, growing
     * the buffer if necessary.
     */
    view<uint8_t> get_receive_buffer(const int n);

    /**
     * Records the number of bytes we managed to read (as it may not be the same amount
     * as was requested), so we need to tell parser where the actual data ends.
     */
    void record_received_bytes(const int n) noexcept;

    bool has_message() const noexcept;
    bool has_handshake() const noexcept;

    /**
     * Extracts the 68 byte handshake. Must only be called after `has_handshake`
     * returned true, otherwise std::logic_error is thrown.
     */
    handshake extract_handshake();

    /**
     * Returns the next message and advances the "message pointer". Must only be called
     * after `has_message` returned true, otherwise std::logic_error is thrown.
     */
    message extract_message();

    /**
     * The length (excluding the length field itself) of the current message, or -1
     * if not even its length has been received.
     */
    int current_message_length() const noexcept;

    /**
     * Moves the unparsed bytes to the front of the buffer so that subsequent receives
     * don't grow it. Invalidates views of extracted messages.
     */
    void optimize_receive_space();

private:
    bool has(const int n) const noexcept { return unused_begin_ - message_begin_ >= n; }
    int view_message_length() const noexcept;
};

} // namespace flume

#endif // FLUME_MESSAGE_PARSER_HEADER
