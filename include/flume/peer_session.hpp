#ifndef FLUME_PEER_SESSION_HEADER
#define FLUME_PEER_SESSION_HEADER

#include "peer_session_error.hpp"
#include "message_parser.hpp"
#include "piece_download.hpp"
#include "block_info.hpp"
#include "bitfield.hpp"
#include "socket.hpp"
#include "types.hpp"
#include "time.hpp"
#include "log.hpp"

#include <deque>
#include <memory>
#include <string>
#include <vector>

namespace flume {

class torrent;
class bvalue;

/**
 * A connection to a single peer, speaking the BitTorrent wire protocol with the
 * extension protocol (BEP 10) and metadata exchange (BEP 9).
 *
 * Instances are always held by shared_ptr: pending asynchronous operations keep the
 * session alive, so after `disconnect` it is safe for torrent to drop its reference.
 * All methods must be called on the network thread.
 */
class peer_session : public std::enable_shared_from_this<peer_session>
{
public:
    enum class state
    {
        connecting,
        handshaking,
        connected,
        disconnected
    };

private:
    torrent& torrent_;
    tcp::socket socket_;
    tcp::endpoint remote_endpoint_;

    message_parser message_parser_;

    // Outgoing messages are queued here and written one at a time.
    std::deque<std::vector<uint8_t>> send_queue_;

    state state_ = state::disconnected;
    bool is_outbound_;
    bool is_sending_ = false;
    bool is_receiving_ = false;

    bool am_choked_ = true;
    bool am_interested_ = false;
    bool is_peer_choked_ = true;
    bool is_peer_interested_ = false;

    // The bitfield message is only valid as the first message after the handshake.
    bool has_received_first_message_ = false;

    peer_id_t peer_id_;

    // Only sized once metadata is known. Until then the peer's bitfield and have
    // messages are stashed in the two fields below.
    bitfield available_pieces_;
    std::vector<uint8_t> pending_raw_bitfield_;
    std::vector<piece_index_t> pending_haves_;

    // -- extension protocol --

    bool supports_extensions_ = false;
    // The id under which the peer expects ut_metadata messages, 0 if it doesn't
    // support it.
    int peer_ut_metadata_id_ = 0;
    // The metadata piece we're waiting for, or -1.
    int outstanding_metadata_piece_ = -1;
    time_point metadata_request_time_;
    bool has_peer_rejected_metadata_request_ = false;

    // -- downloading --

    std::vector<pending_block> outgoing_requests_;
    std::vector<std::shared_ptr<piece_download>> downloads_;
    int num_unwanted_blocks_ = 0;

    // -- uploading --

    std::deque<block_info> incoming_requests_;
    bool is_reading_block_ = false;
    int num_requests_while_choked_ = 0;

    time_point connection_started_time_;
    time_point last_receive_time_;
    time_point last_send_time_;

    int64_t total_downloaded_payload_bytes_ = 0;
    int64_t total_uploaded_payload_bytes_ = 0;

public:
    /** Creates an outbound session, `start` connects to the peer. */
    peer_session(asio::io_context& ios, tcp::endpoint peer, torrent& torrent);

    /** Creates an inbound session from an accepted socket. */
    peer_session(tcp::socket socket, torrent& torrent);

    void start();

    /** Cancels all operations and closes the socket. Idempotent. */
    void disconnect(const error_code& error);

    /**
     * Called by torrent once per second to send keep-alives and enforce the
     * connect, handshake, inactivity and request timeouts.
     */
    void tick();

    /** Called by torrent after the metadata was received and verified. */
    void on_metadata_received();

    /** Called by torrent after a piece got verified. */
    void announce_new_piece(const piece_index_t piece);

    void choke_peer();
    void unchoke_peer();

    /** Re-evaluates our interest and, if we may, requests more blocks. */
    void update_interest();

    state current_state() const noexcept { return state_; }
    bool is_connected() const noexcept { return state_ == state::connected; }
    bool is_disconnected() const noexcept { return state_ == state::disconnected; }
    bool is_outbound() const noexcept { return is_outbound_; }
    bool is_peer_choked() const noexcept { return is_peer_choked_; }
    bool is_peer_interested() const noexcept { return is_peer_interested_; }
    const tcp::endpoint& remote_endpoint() const noexcept { return remote_endpoint_; }
    int64_t total_downloaded_payload_bytes() const noexcept
    {
        return total_downloaded_payload_bytes_;
    }
    int64_t total_uploaded_payload_bytes() const noexcept
    {
        return total_uploaded_payload_bytes_;
    }

private:
    void connect();
    void on_connected(const error_code& error);

    // -- io --

    void send();
    void on_sent(const error_code& error, size_t num_bytes_sent);
    void receive();
    void on_received(const error_code& error, size_t num_bytes_received);

    // -- incoming --

    void handle_messages();
    void handle_handshake();
    void handle_bitfield(const message& msg);
    void handle_choke(const message& msg);
    void handle_unchoke(const message& msg);
    void handle_interested(const message& msg);
    void handle_not_interested(const message& msg);
    void handle_have(const message& msg);
    void handle_request(const message& msg);
    void handle_block(const message& msg);
    void handle_cancel(const message& msg);
    void handle_extended(const message& msg);
    void handle_extended_handshake(const bvalue& handshake);
    void handle_metadata_message(const bvalue& header, const_view<uint8_t> payload);

    bool is_block_request_valid(const block_info& block) const noexcept;
    void apply_pending_availability();
    void serve_requests();

    // -- outgoing --

    void send_message(std::vector<uint8_t> message);
    void send_handshake();
    void send_extended_handshake();
    void send_bitfield();
    void send_keep_alive();
    void send_choke();
    void send_unchoke();
    void send_interested();
    void send_not_interested();
    void send_have(const piece_index_t piece);
    void send_request(const block_info& block);
    void send_block(const block_info& block, const std::vector<uint8_t>& data);
    void send_cancel(const block_info& block);
    void send_extended(const int id, const std::string& header,
            const_view<uint8_t> payload = {});

    void make_requests();
    void request_metadata();
    void abort_outgoing_requests();

    std::shared_ptr<piece_download> find_download(const piece_index_t piece) noexcept;
    bool has_metadata() const noexcept;

    enum class log_event
    {
        connecting,
        disconnecting,
        incoming,
        outgoing,
        disk,
        invalid_message,
        timeout,
        request,
        info
    };

    template <typename... Args>
    void log(const log_event event, const char* format, Args&&... args) const;

    template <typename... Args>
    void log(const log_event event, const log::priority priority, const char* format,
            Args&&... args) const;
};

} // namespace flume

#endif // FLUME_PEER_SESSION_HEADER
