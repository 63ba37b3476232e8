#include "peer_session.hpp"
#include "string_utils.hpp"
#include "bencode.hpp"
#include "payload.hpp"
#include "torrent.hpp"
#include "endian.hpp"

#include <algorithm>
#include <cassert>
#include <sstream>

#include <boost/asio/write.hpp>

namespace flume {

namespace {

constexpr char protocol[] = "BitTorrent protocol";
constexpr int protocol_length = sizeof(protocol) - 1;

// The extension id under which we receive ut_metadata messages.
constexpr int ut_metadata_id = 1;
constexpr int metadata_piece_length = 0x4000;

// Anything larger than this is not a message we're willing to buffer.
constexpr int max_message_length = 2 * 1024 * 1024;

constexpr int max_unwanted_blocks = 50;
constexpr int max_requests_while_choked = 20;
constexpr int max_incoming_request_queue_size = 250;

const seconds keep_alive_interval(90);

} // namespace

#define SHARED_THIS self = shared_from_this()

peer_session::peer_session(asio::io_context& ios, tcp::endpoint peer, torrent& torrent)
    : torrent_(torrent)
    , socket_(ios)
    , remote_endpoint_(std::move(peer))
    , is_outbound_(true)
{}

peer_session::peer_session(tcp::socket socket, torrent& torrent)
    : torrent_(torrent)
    , socket_(std::move(socket))
    , is_outbound_(false)
{
    error_code ec;
    remote_endpoint_ = socket_.remote_endpoint(ec);
}

void peer_session::start()
{
    if(state_ != state::disconnected) {
        return;
    }
    connection_started_time_ = cached_clock::now();
    last_receive_time_ = connection_started_time_;
    last_send_time_ = connection_started_time_;
    if(is_outbound_) {
        connect();
    } else {
        on_connected(error_code());
    }
}

void peer_session::connect()
{
    error_code ec;
    socket_.open(remote_endpoint_.protocol(), ec);
    if(ec) {
        disconnect(ec);
        return;
    }
    state_ = state::connecting;
    log(log_event::connecting, log::priority::low, "started establishing connection");
    socket_.async_connect(remote_endpoint_,
            [SHARED_THIS](const error_code& error) { self->on_connected(error); });
}

void peer_session::on_connected(const error_code& error)
{
    if(state_ == state::disconnected && is_outbound_) {
        return;
    }
    if(error) {
        disconnect(error);
        return;
    }
    if(!socket_.is_open()) {
        disconnect(make_error_code(errc::bad_file_descriptor));
        return;
    }

    log(log_event::connecting, "connected in %llims",
            (long long)to_int<milliseconds>(
                    cached_clock::now() - connection_started_time_));
    state_ = state::handshaking;
    // Inbound peers are sent our handshake after theirs was verified.
    if(is_outbound_) {
        send_handshake();
    }
    receive();
}

void peer_session::disconnect(const error_code& error)
{
    if(state_ == state::disconnected) {
        return;
    }

#ifdef FLUME_ENABLE_LOGGING
    const auto reason = error.message();
    log(log_event::disconnecting, log::priority::high, "reason: %s (#%i)",
            reason.c_str(), error.value());
#endif // FLUME_ENABLE_LOGGING

    state_ = state::disconnected;

    abort_outgoing_requests();
    if(outstanding_metadata_piece_ != -1) {
        torrent_.on_metadata_request_failed(outstanding_metadata_piece_);
        outstanding_metadata_piece_ = -1;
    }
    if(has_metadata() && available_pieces_.size() == torrent_.num_pieces()) {
        torrent_.picker().decrease_frequency(available_pieces_);
    }
    incoming_requests_.clear();
    // A pending write still refers to the front buffer.
    if(!is_sending_) {
        send_queue_.clear();
    }

    error_code ec;
    socket_.shutdown(tcp::socket::shutdown_both, ec);
    socket_.close(ec);

    torrent_.on_peer_disconnected(*this, error);
}

void peer_session::tick()
{
    if(state_ == state::disconnected) {
        return;
    }

    const auto now = cached_clock::now();
    const auto& settings = torrent_.settings();
    if(state_ == state::connecting) {
        if(now - connection_started_time_ >= settings.peer_connect_timeout) {
            disconnect(peer_session_errc::connect_timeout);
        }
        return;
    }
    if(state_ == state::handshaking) {
        if(now - connection_started_time_ >= settings.peer_connect_timeout) {
            disconnect(peer_session_errc::handshake_timeout);
        }
        return;
    }

    if(now - last_receive_time_ >= settings.peer_timeout) {
        disconnect(peer_session_errc::inactivity_timeout);
        return;
    }

    for(const auto& request : outgoing_requests_) {
        if(now - request.request_time >= settings.request_timeout) {
            log(log_event::timeout, "request for block(%i, %i, %i) timed out",
                    request.index, request.offset, request.length);
            disconnect(peer_session_errc::request_timeout);
            return;
        }
    }

    if(outstanding_metadata_piece_ != -1
            && now - metadata_request_time_ >= settings.request_timeout) {
        log(log_event::timeout, "metadata request for piece %i timed out",
                outstanding_metadata_piece_);
        torrent_.on_metadata_request_failed(outstanding_metadata_piece_);
        outstanding_metadata_piece_ = -1;
        has_peer_rejected_metadata_request_ = true;
    }

    if(now - last_send_time_ >= keep_alive_interval) {
        send_keep_alive();
    }

    // A download may have become available since, e.g. because priorities changed
    // or another peer disconnected.
    if(!has_metadata()) {
        request_metadata();
    } else {
        make_requests();
    }
}

bool peer_session::has_metadata() const noexcept
{
    return torrent_.has_metadata();
}

// -------
// sending
// -------

void peer_session::send_message(std::vector<uint8_t> message)
{
    if(state_ == state::disconnected) {
        return;
    }
    send_queue_.emplace_back(std::move(message));
    send();
}

void peer_session::send()
{
    if(is_sending_ || send_queue_.empty() || state_ == state::disconnected) {
        return;
    }
    is_sending_ = true;
    asio::async_write(socket_, asio::buffer(send_queue_.front()),
            [SHARED_THIS](const error_code& error, size_t num_bytes_sent) {
                self->on_sent(error, num_bytes_sent);
            });
}

void peer_session::on_sent(const error_code& error, size_t num_bytes_sent)
{
    is_sending_ = false;
    if(state_ == state::disconnected || error == asio::error::operation_aborted) {
        return;
    }
    if(error) {
        disconnect(error);
        return;
    }
    last_send_time_ = cached_clock::now();
    send_queue_.pop_front();
    send();
}

// ---------
// receiving
// ---------

void peer_session::receive()
{
    if(is_receiving_ || state_ == state::disconnected) {
        return;
    }
    // Make room for at least the rest of the current message, so large messages
    // (blocks, bitfields) are received in as few reads as possible.
    int num_bytes = 4096;
    const int message_length = message_parser_.current_message_length();
    if(message_length > 0) {
        num_bytes = std::max(num_bytes, 4 + message_length - message_parser_.size());
    }
    auto buffer = message_parser_.get_receive_buffer(num_bytes);
    is_receiving_ = true;
    socket_.async_read_some(asio::buffer(buffer.data(), buffer.size()),
            [SHARED_THIS](const error_code& error, size_t num_bytes_received) {
                self->on_received(error, num_bytes_received);
            });
}

void peer_session::on_received(const error_code& error, size_t num_bytes_received)
{
    is_receiving_ = false;
    if(state_ == state::disconnected || error == asio::error::operation_aborted) {
        return;
    }
    if(error) {
        disconnect(error);
        return;
    }
    last_receive_time_ = cached_clock::now();
    message_parser_.record_received_bytes(num_bytes_received);
    handle_messages();
    if(state_ == state::disconnected) {
        return;
    }
    message_parser_.optimize_receive_space();
    receive();
}

void peer_session::handle_messages()
{
    if(state_ == state::handshaking) {
        if(!message_parser_.has_handshake()) {
            return;
        }
        handle_handshake();
    }

    while(state_ == state::connected) {
        const int length = message_parser_.current_message_length();
        if(length > max_message_length) {
            disconnect(peer_session_errc::message_too_big);
            return;
        }
        if(!message_parser_.has_message()) {
            break;
        }

        const message msg = message_parser_.extract_message();
        // The extension handshake may precede the bitfield.
        const bool is_first_message = !has_received_first_message_;
        if(msg.type != message_type::extended && msg.type != message_type::keep_alive) {
            has_received_first_message_ = true;
        }
        switch(msg.type) {
        case message_type::keep_alive:
            log(log_event::incoming, log::priority::low, "KEEP_ALIVE");
            break;
        case message_type::choke: handle_choke(msg); break;
        case message_type::unchoke: handle_unchoke(msg); break;
        case message_type::interested: handle_interested(msg); break;
        case message_type::not_interested: handle_not_interested(msg); break;
        case message_type::have: handle_have(msg); break;
        case message_type::bitfield:
            if(!is_first_message) {
                disconnect(peer_session_errc::invalid_bitfield_message);
                return;
            }
            handle_bitfield(msg);
            break;
        case message_type::request: handle_request(msg); break;
        case message_type::block: handle_block(msg); break;
        case message_type::cancel: handle_cancel(msg); break;
        case message_type::port:
            // DHT is not supported.
            break;
        case message_type::extended: handle_extended(msg); break;
        default:
            log(log_event::invalid_message, "unknown message id: %i", msg.type);
            disconnect(peer_session_errc::invalid_message_id);
            return;
        }
    }
}

// ----------------------------------------------------------------------------
// HANDSHAKE <pstrlen=49+len(pstr)><pstr><reserved><info hash><peer id>
// ----------------------------------------------------------------------------
void peer_session::handle_handshake()
{
    const handshake handshake = message_parser_.extract_handshake();
    if(handshake.protocol.size() != size_t(protocol_length)
            || !std::equal(handshake.protocol.begin(), handshake.protocol.end(), protocol)) {
        disconnect(peer_session_errc::invalid_handshake);
        return;
    }
    if(!std::equal(handshake.info_hash.begin(), handshake.info_hash.end(),
               torrent_.info_hash().begin())) {
        disconnect(peer_session_errc::invalid_info_hash);
        return;
    }
    std::copy(handshake.peer_id.begin(), handshake.peer_id.end(), peer_id_.begin());
    if(peer_id_ == torrent_.client_id()) {
        disconnect(peer_session_errc::duplicate_peer_id);
        return;
    }
    supports_extensions_ = (handshake.reserved[5] & 0x10) != 0;

    log(log_event::incoming, log::priority::high,
            "HANDSHAKE (client_id: %s; extensions: %s)",
            std::string(peer_id_.begin(), peer_id_.begin() + 8).c_str(),
            supports_extensions_ ? "yes" : "no");

    if(!is_outbound_) {
        send_handshake();
    }
    state_ = state::connected;
    if(has_metadata()) {
        available_pieces_ = bitfield(torrent_.num_pieces());
    }
    if(supports_extensions_) {
        send_extended_handshake();
    }
    if(torrent_.settings().seed && has_metadata()
            && torrent_.picker().num_have_pieces() > 0) {
        send_bitfield();
    }
    torrent_.on_peer_handshake(*this);
}

// ----------------------------------
// BITFIELD <len=1+X><id=5><bitfield>
// ----------------------------------
void peer_session::handle_bitfield(const message& msg)
{
    log(log_event::incoming, "BITFIELD (%i bytes)", int(msg.data.size()));
    if(!has_metadata()) {
        // We can't validate it until we know the number of pieces.
        pending_raw_bitfield_.assign(msg.data.begin(), msg.data.end());
        return;
    }
    if(!bitfield::is_raw_bitfield_valid(msg.data, torrent_.num_pieces())) {
        disconnect(peer_session_errc::invalid_bitfield_message);
        return;
    }
    available_pieces_ = bitfield::from_raw(msg.data, torrent_.num_pieces());
    torrent_.picker().increase_frequency(available_pieces_);
    update_interest();
}

// ---------------------
// CHOKE <len=1><id=0>
// ---------------------
void peer_session::handle_choke(const message& msg)
{
    if(!msg.data.empty()) {
        disconnect(peer_session_errc::invalid_choke_message);
        return;
    }
    log(log_event::incoming, "CHOKE");
    if(!am_choked_) {
        am_choked_ = true;
        // Choking discards all pending requests.
        abort_outgoing_requests();
    }
}

// -----------------------
// UNCHOKE <len=1><id=1>
// -----------------------
void peer_session::handle_unchoke(const message& msg)
{
    if(!msg.data.empty()) {
        disconnect(peer_session_errc::invalid_unchoke_message);
        return;
    }
    log(log_event::incoming, "UNCHOKE");
    if(am_choked_) {
        am_choked_ = false;
        make_requests();
    }
}

// --------------------------
// INTERESTED <len=1><id=2>
// --------------------------
void peer_session::handle_interested(const message& msg)
{
    if(!msg.data.empty()) {
        disconnect(peer_session_errc::invalid_interested_message);
        return;
    }
    log(log_event::incoming, "INTERESTED");
    if(!is_peer_interested_) {
        is_peer_interested_ = true;
        torrent_.on_peer_interested(*this);
    }
}

// ------------------------------
// NOT INTERESTED <len=1><id=3>
// ------------------------------
void peer_session::handle_not_interested(const message& msg)
{
    if(!msg.data.empty()) {
        disconnect(peer_session_errc::invalid_not_interested_message);
        return;
    }
    log(log_event::incoming, "NOT_INTERESTED");
    if(is_peer_interested_) {
        is_peer_interested_ = false;
        torrent_.on_peer_not_interested(*this);
    }
}

// ------------------------------
// HAVE <len=5><id=4><piece index>
// ------------------------------
void peer_session::handle_have(const message& msg)
{
    if(msg.data.size() != 4) {
        disconnect(peer_session_errc::invalid_have_message);
        return;
    }
    const piece_index_t piece = endian::read_network<int32_t>(msg.data.data());
    log(log_event::incoming, log::priority::low, "HAVE %i", piece);
    if(!has_metadata()) {
        if(piece < 0) {
            disconnect(peer_session_errc::invalid_have_message);
            return;
        }
        pending_haves_.push_back(piece);
        return;
    }
    if(piece < 0 || piece >= torrent_.num_pieces()) {
        disconnect(peer_session_errc::invalid_have_message);
        return;
    }
    if(!available_pieces_[piece]) {
        available_pieces_.set(piece);
        torrent_.picker().increase_frequency(piece);
        if(!am_interested_) {
            update_interest();
        }
    }
}

// ---------------------------------------------
// REQUEST <len=13><id=6><index><offset><length>
// ---------------------------------------------
void peer_session::handle_request(const message& msg)
{
    if(msg.data.size() != 12) {
        disconnect(peer_session_errc::invalid_request_message);
        return;
    }
    const uint8_t* data = msg.data.data();
    const block_info block(endian::read_network<int32_t>(data),
            endian::read_network<int32_t>(data + 4), endian::read_network<int32_t>(data + 8));
    log(log_event::incoming, log::priority::low, "REQUEST (%i, %i, %i)", block.index,
            block.offset, block.length);

    if(is_peer_choked_) {
        // Requests sent before our choke arrived are tolerated to a degree.
        if(++num_requests_while_choked_ > max_requests_while_choked) {
            disconnect(peer_session_errc::sent_requests_when_choked);
        }
        return;
    }
    if(!is_block_request_valid(block)) {
        disconnect(peer_session_errc::invalid_request_message);
        return;
    }
    if(int(incoming_requests_.size()) >= max_incoming_request_queue_size) {
        log(log_event::request, "request queue full, dropping request");
        return;
    }
    incoming_requests_.push_back(block);
    serve_requests();
}

bool peer_session::is_block_request_valid(const block_info& block) const noexcept
{
    return has_metadata() && block.index >= 0 && block.index < torrent_.num_pieces()
            && torrent_.is_piece_verified(block.index) && block.offset >= 0
            && block.length > 0 && block.length <= block_info::default_length
            && block.offset + block.length <= torrent_.piece_length(block.index);
}

void peer_session::serve_requests()
{
    if(is_reading_block_ || incoming_requests_.empty() || is_peer_choked_
            || state_ != state::connected) {
        return;
    }
    is_reading_block_ = true;
    const block_info block = incoming_requests_.front();
    torrent_.read_block(block,
            [SHARED_THIS, block](const error_code& error, std::vector<uint8_t> data) {
                self->is_reading_block_ = false;
                if(self->state_ != state::connected) {
                    return;
                }
                if(error) {
                    self->log(log_event::disk, log::priority::high,
                            "couldn't read block: %s", error.message().c_str());
                    self->disconnect(error);
                    return;
                }
                // The request may have been cancelled in the meantime.
                auto& requests = self->incoming_requests_;
                auto it = std::find(requests.begin(), requests.end(), block);
                if(it != requests.end()) {
                    requests.erase(it);
                    self->send_block(block, data);
                }
                self->serve_requests();
            });
}

// ----------------------------------------------
// BLOCK <len=9+X><id=7><index><offset><block>
// ----------------------------------------------
void peer_session::handle_block(const message& msg)
{
    if(msg.data.size() < 8 || msg.data.size() > 8 + block_info::default_length) {
        disconnect(peer_session_errc::invalid_block_message);
        return;
    }
    const uint8_t* data = msg.data.data();
    const block_info block(endian::read_network<int32_t>(data),
            endian::read_network<int32_t>(data + 4), int(msg.data.size() - 8));
    const_view<uint8_t> payload(data + 8, size_t(block.length));

    auto request = std::find_if(outgoing_requests_.begin(), outgoing_requests_.end(),
            [&block](const pending_block& r) { return r == block; });
    if(request != outgoing_requests_.end()) {
        outgoing_requests_.erase(request);
    }

    auto download = find_download(block.index);
    if(!download || !download->is_valid_block(block) || download->has_block(block)) {
        log(log_event::invalid_message, "unwanted BLOCK (%i, %i, %i)", block.index,
                block.offset, block.length);
        if(++num_unwanted_blocks_ > max_unwanted_blocks) {
            disconnect(peer_session_errc::unwanted_blocks);
        }
        return;
    }

    log(log_event::incoming, log::priority::low, "BLOCK (%i, %i, %i)", block.index,
            block.offset, block.length);
    download->got_block(remote_endpoint_, block, payload);
    total_downloaded_payload_bytes_ += block.length;

    if(download->is_complete()) {
        downloads_.erase(std::remove(downloads_.begin(), downloads_.end(), download),
                downloads_.end());
        torrent_.on_piece_downloaded(download);
    }
    if(state_ == state::connected) {
        make_requests();
    }
}

// ---------------------------------------------
// CANCEL <len=13><id=8><index><offset><length>
// ---------------------------------------------
void peer_session::handle_cancel(const message& msg)
{
    if(msg.data.size() != 12) {
        disconnect(peer_session_errc::invalid_cancel_message);
        return;
    }
    const uint8_t* data = msg.data.data();
    const block_info block(endian::read_network<int32_t>(data),
            endian::read_network<int32_t>(data + 4), endian::read_network<int32_t>(data + 8));
    log(log_event::incoming, log::priority::low, "CANCEL (%i, %i, %i)", block.index,
            block.offset, block.length);
    auto it = std::find(incoming_requests_.begin(), incoming_requests_.end(), block);
    if(it != incoming_requests_.end()) {
        incoming_requests_.erase(it);
    }
}

// -----------------------------------------------
// EXTENDED <len=2+X><id=20><extended id><payload>
// -----------------------------------------------
void peer_session::handle_extended(const message& msg)
{
    if(msg.data.empty()) {
        disconnect(peer_session_errc::invalid_extended_message);
        return;
    }
    const int extended_id = msg.data[0];
    const std::string_view encoded(
            reinterpret_cast<const char*>(msg.data.data() + 1), msg.data.size() - 1);
    error_code ec;
    size_t num_consumed = 0;
    const bvalue header = bdecode_prefix(encoded, num_consumed, ec);
    if(ec || !header.is_map()) {
        log(log_event::invalid_message, "invalid extended message header");
        disconnect(peer_session_errc::invalid_extended_message);
        return;
    }

    if(extended_id == 0) {
        handle_extended_handshake(header);
    } else if(extended_id == ut_metadata_id) {
        handle_metadata_message(header, msg.data.subview(1 + num_consumed));
    } else {
        log(log_event::invalid_message, "unknown extended message id: %i", extended_id);
    }
}

void peer_session::handle_extended_handshake(const bvalue& handshake)
{
    if(const bvalue* m = handshake.find_map("m")) {
        if(const bvalue* id = m->find_number("ut_metadata")) {
            peer_ut_metadata_id_ = id->number() > 0 && id->number() < 256 ? id->number() : 0;
        }
    }
    std::string client;
    if(const bvalue* v = handshake.find_string("v")) {
        client = v->string();
    }
    int64_t metadata_size = 0;
    if(const bvalue* size = handshake.find_number("metadata_size")) {
        metadata_size = size->number();
    }
    log(log_event::incoming, "EXTENDED HANDSHAKE (client: %s; ut_metadata: %i;"
            " metadata_size: %lli)", client.c_str(), peer_ut_metadata_id_,
            (long long)metadata_size);

    if(!has_metadata() && peer_ut_metadata_id_ != 0 && metadata_size > 0
            && metadata_size <= max_message_length * 8) {
        torrent_.set_metadata_size(int(metadata_size));
        request_metadata();
    }
}

void peer_session::handle_metadata_message(
        const bvalue& header, const_view<uint8_t> payload)
{
    const bvalue* msg_type = header.find_number("msg_type");
    const bvalue* piece = header.find_number("piece");
    if(!msg_type || !piece || piece->number() < 0) {
        disconnect(peer_session_errc::invalid_extended_message);
        return;
    }
    const int index = piece->number();

    switch(msg_type->number()) {
    case 0: {
        // request
        log(log_event::incoming, "METADATA REQUEST (piece: %i)", index);
        if(peer_ut_metadata_id_ == 0) {
            return;
        }
        const int size = has_metadata() ? int(torrent_.metadata().size()) : 0;
        const int offset = index * metadata_piece_length;
        if(!torrent_.settings().seed || size == 0 || offset >= size) {
            bvalue::map_type reject;
            reject["msg_type"] = 2;
            reject["piece"] = index;
            send_extended(peer_ut_metadata_id_, bencode(bvalue(std::move(reject))));
            return;
        }
        const int length = std::min(metadata_piece_length, size - offset);
        bvalue::map_type data;
        data["msg_type"] = 1;
        data["piece"] = index;
        data["total_size"] = size;
        const auto& metadata = torrent_.metadata();
        send_extended(peer_ut_metadata_id_, bencode(bvalue(std::move(data))),
                const_view<uint8_t>(
                        reinterpret_cast<const uint8_t*>(metadata.data()) + offset,
                        size_t(length)));
        break;
    }
    case 1:
        // data
        log(log_event::incoming, "METADATA DATA (piece: %i; %i bytes)", index,
                int(payload.size()));
        if(index != outstanding_metadata_piece_) {
            log(log_event::invalid_message, "unrequested metadata piece %i", index);
            return;
        }
        outstanding_metadata_piece_ = -1;
        if(!has_metadata()) {
            torrent_.on_metadata_piece(index, payload);
        }
        if(state_ == state::connected && !has_metadata()) {
            request_metadata();
        }
        break;
    case 2:
        // reject
        log(log_event::incoming, "METADATA REJECT (piece: %i)", index);
        if(index == outstanding_metadata_piece_) {
            outstanding_metadata_piece_ = -1;
            torrent_.on_metadata_request_failed(index);
        }
        has_peer_rejected_metadata_request_ = true;
        break;
    default:
        log(log_event::invalid_message, "unknown metadata msg_type: %lli",
                (long long)msg_type->number());
    }
}

void peer_session::request_metadata()
{
    if(has_metadata() || state_ != state::connected || peer_ut_metadata_id_ == 0
            || outstanding_metadata_piece_ != -1 || has_peer_rejected_metadata_request_) {
        return;
    }
    const int piece = torrent_.pick_metadata_piece();
    if(piece == -1) {
        return;
    }
    outstanding_metadata_piece_ = piece;
    metadata_request_time_ = cached_clock::now();
    bvalue::map_type request;
    request["msg_type"] = 0;
    request["piece"] = piece;
    log(log_event::outgoing, "METADATA REQUEST (piece: %i)", piece);
    send_extended(peer_ut_metadata_id_, bencode(bvalue(std::move(request))));
}

void peer_session::on_metadata_received()
{
    if(state_ == state::disconnected) {
        return;
    }
    outstanding_metadata_piece_ = -1;
    if(state_ == state::connected) {
        apply_pending_availability();
    }
}

void peer_session::apply_pending_availability()
{
    const int num_pieces = torrent_.num_pieces();
    available_pieces_ = bitfield(num_pieces);
    if(!pending_raw_bitfield_.empty()) {
        if(!bitfield::is_raw_bitfield_valid(pending_raw_bitfield_, num_pieces)) {
            disconnect(peer_session_errc::invalid_bitfield_message);
            return;
        }
        available_pieces_ = bitfield::from_raw(pending_raw_bitfield_, num_pieces);
        pending_raw_bitfield_.clear();
    }
    for(const piece_index_t piece : pending_haves_) {
        if(piece >= num_pieces) {
            disconnect(peer_session_errc::invalid_have_message);
            return;
        }
        available_pieces_.set(piece);
    }
    pending_haves_.clear();
    torrent_.picker().increase_frequency(available_pieces_);
    update_interest();
}

// --------
// outgoing
// --------

void peer_session::send_handshake()
{
    std::array<uint8_t, 8> reserved{};
    // BEP 10 extension protocol
    reserved[5] |= 0x10;
    payload message(49 + protocol_length);
    message.u8(protocol_length)
            .range(protocol, protocol + protocol_length)
            .buffer(reserved)
            .buffer(torrent_.info_hash())
            .buffer(torrent_.client_id());
    send_message(std::move(message.data));
    log(log_event::outgoing, "HANDSHAKE");
}

void peer_session::send_extended_handshake()
{
    bvalue::map_type m;
    m["ut_metadata"] = ut_metadata_id;
    bvalue::map_type handshake;
    handshake["m"] = bvalue(std::move(m));
    handshake["v"] = FLUME_USER_AGENT;
    if(has_metadata() && torrent_.settings().seed) {
        handshake["metadata_size"] = int64_t(torrent_.metadata().size());
    }
    if(torrent_.settings().seed) {
        handshake["p"] = int(torrent_.listener_port());
    }
    send_extended(0, bencode(bvalue(std::move(handshake))));
    log(log_event::outgoing, "EXTENDED HANDSHAKE");
}

void peer_session::send_extended(
        const int id, const std::string& header, const_view<uint8_t> data)
{
    payload message(6 + header.size() + data.size());
    message.u32(2 + header.size() + data.size())
            .u8(message_type::extended)
            .u8(id)
            .buffer(header)
            .buffer(data);
    send_message(std::move(message.data));
}

void peer_session::send_bitfield()
{
    const auto& bits = torrent_.picker().my_bitfield().data();
    payload message(5 + bits.size());
    message.u32(1 + bits.size()).u8(message_type::bitfield).buffer(bits);
    send_message(std::move(message.data));
    log(log_event::outgoing, "BITFIELD");
}

void peer_session::send_keep_alive()
{
    payload message(4);
    message.u32(0);
    send_message(std::move(message.data));
    log(log_event::outgoing, log::priority::low, "KEEP_ALIVE");
}

void peer_session::send_choke()
{
    payload message(5);
    message.u32(1).u8(message_type::choke);
    send_message(std::move(message.data));
    log(log_event::outgoing, "CHOKE");
}

void peer_session::send_unchoke()
{
    payload message(5);
    message.u32(1).u8(message_type::unchoke);
    send_message(std::move(message.data));
    log(log_event::outgoing, "UNCHOKE");
}

void peer_session::send_interested()
{
    payload message(5);
    message.u32(1).u8(message_type::interested);
    send_message(std::move(message.data));
    log(log_event::outgoing, "INTERESTED");
}

void peer_session::send_not_interested()
{
    payload message(5);
    message.u32(1).u8(message_type::not_interested);
    send_message(std::move(message.data));
    log(log_event::outgoing, "NOT_INTERESTED");
}

void peer_session::send_have(const piece_index_t piece)
{
    payload message(9);
    message.u32(5).u8(message_type::have).i32(piece);
    send_message(std::move(message.data));
    log(log_event::outgoing, log::priority::low, "HAVE %i", piece);
}

void peer_session::send_request(const block_info& block)
{
    payload message(17);
    message.u32(13)
            .u8(message_type::request)
            .i32(block.index)
            .i32(block.offset)
            .i32(block.length);
    send_message(std::move(message.data));
    log(log_event::outgoing, log::priority::low, "REQUEST (%i, %i, %i)", block.index,
            block.offset, block.length);
}

void peer_session::send_block(const block_info& block, const std::vector<uint8_t>& data)
{
    payload message(13 + data.size());
    message.u32(9 + data.size())
            .u8(message_type::block)
            .i32(block.index)
            .i32(block.offset)
            .buffer(data);
    send_message(std::move(message.data));
    total_uploaded_payload_bytes_ += data.size();
    log(log_event::outgoing, log::priority::low, "BLOCK (%i, %i, %i)", block.index,
            block.offset, block.length);
}

void peer_session::send_cancel(const block_info& block)
{
    payload message(17);
    message.u32(13)
            .u8(message_type::cancel)
            .i32(block.index)
            .i32(block.offset)
            .i32(block.length);
    send_message(std::move(message.data));
    log(log_event::outgoing, log::priority::low, "CANCEL (%i, %i, %i)", block.index,
            block.offset, block.length);
}

// -----------
// choking etc
// -----------

void peer_session::choke_peer()
{
    if(state_ != state::connected || is_peer_choked_) {
        return;
    }
    is_peer_choked_ = true;
    num_requests_while_choked_ = 0;
    incoming_requests_.clear();
    send_choke();
}

void peer_session::unchoke_peer()
{
    if(state_ != state::connected || !is_peer_choked_) {
        return;
    }
    is_peer_choked_ = false;
    send_unchoke();
}

void peer_session::announce_new_piece(const piece_index_t piece)
{
    if(state_ != state::connected) {
        return;
    }
    if(torrent_.settings().seed) {
        send_have(piece);
    }
    update_interest();
}

void peer_session::update_interest()
{
    if(state_ != state::connected || !has_metadata()
            || available_pieces_.size() != torrent_.num_pieces()) {
        return;
    }
    const bool was_interested = am_interested_;
    am_interested_ = torrent_.picker().am_interested_in(available_pieces_);
    if(am_interested_ && !was_interested) {
        send_interested();
    } else if(!am_interested_ && was_interested) {
        send_not_interested();
    }
    make_requests();
}

// --------
// requests
// --------

void peer_session::make_requests()
{
    if(state_ != state::connected || am_choked_ || !am_interested_ || !has_metadata()) {
        return;
    }
    // Pieces completed or picked by others don't need us anymore.
    downloads_.erase(std::remove_if(downloads_.begin(), downloads_.end(),
                             [this](const auto& d) {
                                 return !d->can_request()
                                         && std::none_of(outgoing_requests_.begin(),
                                                 outgoing_requests_.end(),
                                                 [&d](const pending_block& r) {
                                                     return r.index == d->piece_index();
                                                 });
                             }),
            downloads_.end());

    auto& picker = torrent_.picker();
    const auto priority_of = [&picker](const piece_download& d) {
        return int(picker.priority(d.piece_index()));
    };

    const int max_requests = torrent_.settings().max_outgoing_request_queue_size;
    int num_new_requests = 0;
    while(int(outgoing_requests_.size()) < max_requests) {
        // Our most urgent download that still has free blocks.
        std::shared_ptr<piece_download> best;
        for(const auto& d : downloads_) {
            if(!d->can_request()) {
                continue;
            }
            if(!best || priority_of(*d) > priority_of(*best)
                    || (priority_of(*d) == priority_of(*best)
                            && d->piece_index() < best->piece_index())) {
                best = d;
            }
        }

        // A more urgent piece (or any piece if we have none) takes precedence.
        auto download = torrent_.pick_download(
                available_pieces_, best ? priority_of(*best) : -1);
        if(download) {
            if(std::find(downloads_.begin(), downloads_.end(), download) == downloads_.end()) {
                downloads_.push_back(download);
            }
            best = download;
        }
        if(!best) {
            break;
        }

        const block_info block = best->pick_block();
        if(block == invalid_block) {
            break;
        }
        outgoing_requests_.emplace_back(block, cached_clock::now());
        send_request(block);
        ++num_new_requests;
    }

    if(num_new_requests > 0) {
        log(log_event::request, "requested %i blocks (%i outstanding)", num_new_requests,
                int(outgoing_requests_.size()));
    }
}

void peer_session::abort_outgoing_requests()
{
    for(const auto& request : outgoing_requests_) {
        if(auto download = find_download(request.index)) {
            download->cancel_request(request);
        }
    }
    outgoing_requests_.clear();
    downloads_.clear();
}

std::shared_ptr<piece_download> peer_session::find_download(
        const piece_index_t piece) noexcept
{
    auto it = std::find_if(downloads_.begin(), downloads_.end(),
            [piece](const auto& d) { return d->piece_index() == piece; });
    if(it != downloads_.end()) {
        return *it;
    }
    return nullptr;
}

template <typename... Args>
void peer_session::log(const log_event event, const char* format, Args&&... args) const
{
    log(event, log::priority::normal, format, std::forward<Args>(args)...);
}

template <typename... Args>
void peer_session::log(const log_event event, const log::priority priority,
        const char* format, Args&&... args) const
{
#ifdef FLUME_ENABLE_LOGGING
    std::stringstream header;
    if(state_ == state::connected) {
        header << '+';
        header << to_int<seconds>(cached_clock::now() - connection_started_time_);
        header << "s|";
    }
    switch(event) {
    case log_event::connecting: header << "CONNECTING"; break;
    case log_event::disconnecting: header << "DISCONNECTING"; break;
    case log_event::incoming: header << "IN"; break;
    case log_event::outgoing: header << "OUT"; break;
    case log_event::disk: header << "DISK"; break;
    case log_event::invalid_message: header << "INVALID MESSAGE"; break;
    case log_event::timeout: header << "TIMEOUT"; break;
    case log_event::request: header << "REQUEST"; break;
    case log_event::info: header << "INFO"; break;
    }
    log::log_peer_session(remote_endpoint_, header.str(),
            util::format(format, std::forward<Args>(args)...), priority);
#endif // FLUME_ENABLE_LOGGING
}

#undef SHARED_THIS

} // namespace flume
