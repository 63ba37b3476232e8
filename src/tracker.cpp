#include "tracker.hpp"
#include "string_utils.hpp"
#include "bencode.hpp"
#include "random.hpp"
#include "endian.hpp"
#include "log.hpp"

#include <algorithm>
#include <cassert>
#include <limits>
#include <sstream>

namespace flume {

std::vector<tcp::endpoint> parse_compact_peers(const uint8_t* data, const size_t length)
{
    const size_t num_peers = length / 6;
    std::vector<tcp::endpoint> peers;
    peers.reserve(num_peers);
    for(size_t i = 0, offset = 0; i < num_peers; ++i, offset += 6) {
        // Endpoints are encoded as a 32 bit integer for the IP address and a
        // 16 bit integer for the port.
        const asio::ip::address_v4 ip(endian::read_network<uint32_t>(data + offset));
        const uint16_t port = endian::read_network<uint16_t>(data + offset + 4);
        if(port == 0) {
            continue;
        }
        peers.emplace_back(ip, port);
    }
    return peers;
}

namespace {

std::vector<tcp::endpoint> parse_compact_peers6(const uint8_t* data, const size_t length)
{
    const size_t num_peers = length / 18;
    std::vector<tcp::endpoint> peers;
    peers.reserve(num_peers);
    for(size_t i = 0, offset = 0; i < num_peers; ++i, offset += 18) {
        asio::ip::address_v6::bytes_type bytes;
        std::copy(data + offset, data + offset + 16, bytes.begin());
        const uint16_t port = endian::read_network<uint16_t>(data + offset + 16);
        if(port == 0) {
            continue;
        }
        peers.emplace_back(asio::ip::address_v6(bytes), port);
    }
    return peers;
}

std::vector<tcp::endpoint> parse_peer_dicts(const bvalue::list_type& peers_list)
{
    std::vector<tcp::endpoint> peers;
    peers.reserve(peers_list.size());
    for(const bvalue& peer : peers_list) {
        const bvalue* ip = peer.find_string("ip");
        const bvalue* port = peer.find_number("port");
        if(!ip || !port || port->number() <= 0 || port->number() > 65535) {
            continue;
        }
        error_code ec;
        const auto address = asio::ip::make_address(ip->string(), ec);
        if(ec) {
            continue;
        }
        peers.emplace_back(address, static_cast<uint16_t>(port->number()));
    }
    return peers;
}

const char* event_name(const tracker_request::event_t event) noexcept
{
    switch(event) {
    case tracker_request::event_t::started: return "started";
    case tracker_request::event_t::completed: return "completed";
    case tracker_request::event_t::stopped: return "stopped";
    default: return "none";
    }
}

} // namespace

// -------------
// tracker error
// -------------

std::string tracker_error_category::message(int env) const
{
    switch(static_cast<tracker_errc>(env)) {
    case tracker_errc::timed_out:
        return "Tracker timed out";
    case tracker_errc::invalid_response:
        return "Invalid response";
    case tracker_errc::wrong_response_type:
        return "Not the expected response type";
    case tracker_errc::wrong_response_length:
        return "Not the expected response length";
    case tracker_errc::invalid_transaction_id:
        return "Invalid transaction id";
    case tracker_errc::http_error:
        return "Tracker responded with an HTTP error";
    case tracker_errc::unsupported_protocol:
        return "Unsupported tracker protocol";
    default:
        return "Unknown error";
    }
}

const tracker_error_category& tracker_category()
{
    static tracker_error_category instance;
    return instance;
}

error_code make_error_code(tracker_errc e)
{
    return error_code(static_cast<int>(e), tracker_category());
}

error_condition make_error_condition(tracker_errc e)
{
    return error_condition(static_cast<int>(e), tracker_category());
}

// -------
// tracker
// -------

tracker::tracker(std::string url, const engine_settings& settings)
    : url_(std::move(url))
    , settings_(settings)
{}

template <typename... Args>
void tracker::log(const log_event event, const char* format, Args&&... args) const
{
#ifdef FLUME_ENABLE_LOGGING
    std::stringstream ss;
    ss << url_ << '|';
    switch(event) {
    case log_event::connecting: ss << "CONNECTING"; break;
    case log_event::incoming: ss << "IN"; break;
    case log_event::outgoing: ss << "OUT"; break;
    case log_event::invalid_message: ss << "INVALID MESSAGE"; break;
    case log_event::timeout: ss << "TIMEOUT"; break;
    }
    log::log_torrent(ss.str(), util::format(format, std::forward<Args>(args)...));
#endif // FLUME_ENABLE_LOGGING
}

// ------------
// http tracker
// ------------

http_tracker::http_tracker(asio::io_context& ios, asio::ssl::context& ssl_context,
        std::string url, const engine_settings& settings)
    : tracker(std::move(url), settings)
    , ios_(ios)
    , ssl_context_(ssl_context)
{}

http_tracker::~http_tracker()
{
    abort();
}

void http_tracker::abort()
{
    is_aborted_ = true;
    if(request_) {
        request_->abort();
        request_.reset();
    }
}

void http_tracker::announce(tracker_request parameters, announce_handler handler)
{
    if(is_aborted_) {
        return;
    }
    if(request_) {
        request_->abort();
    }

    log(log_event::outgoing,
            "sending ANNOUNCE (down: %lli; left: %lli; up: %lli; event: %s; num_want: %i;"
            " port: %i)",
            (long long)parameters.downloaded, (long long)parameters.left,
            (long long)parameters.uploaded, event_name(parameters.event),
            parameters.num_want, parameters.port);

    request_ = std::make_shared<http::get_request>(ios_, ssl_context_,
            FLUME_USER_AGENT, settings_.tracker_timeout, 1024 * 1024);
    auto request = request_;
    request_->start(create_announce_url(url_, parameters),
            [this, request, handler = std::move(handler)](
                    const error_code& error, http::get_request::response_type response) {
                if(is_aborted_ || request != request_) {
                    return;
                }
                request_.reset();
                if(error) {
                    handler(error, {});
                    return;
                }
                if(response.result() != http::status::ok) {
                    log(log_event::invalid_message, "HTTP status %u",
                            response.result_int());
                    handler(make_error_code(tracker_errc::http_error), {});
                    return;
                }
                error_code ec;
                auto r = parse_announce_response(response.body(), ec);
                if(ec) {
                    log(log_event::invalid_message, "invalid response: %s",
                            ec.message().c_str());
                } else {
                    log(log_event::incoming,
                            "received ANNOUNCE (interval: %i; num_leechers: %i;"
                            " num_seeders: %i; num_peers: %i)",
                            int(r.interval.count()), r.num_leechers, r.num_seeders,
                            int(r.peers.size()));
                }
                handler(ec, std::move(r));
            });
}

std::string http_tracker::create_announce_url(
        const std::string& announce_url, const tracker_request& r)
{
    std::string url = announce_url;
    url += announce_url.find('?') == std::string::npos ? '?' : '&';
    url += "info_hash=" + util::url_encode(r.info_hash);
    url += "&peer_id=" + util::url_encode(r.peer_id);
    url += "&port=" + std::to_string(r.port);
    url += "&uploaded=" + std::to_string(r.uploaded);
    url += "&downloaded=" + std::to_string(r.downloaded);
    url += "&left=" + std::to_string(r.left);
    url += "&compact=1&no_peer_id=1";
    if(r.num_want > 0) {
        url += "&numwant=" + std::to_string(r.num_want);
    }
    if(r.event != tracker_request::event_t::none) {
        url += "&event=";
        url += event_name(r.event);
    }
    if(!r.tracker_id.empty()) {
        url += "&trackerid=" + util::url_encode(r.tracker_id);
    }
    return url;
}

tracker_response http_tracker::parse_announce_response(
        const std::string& body, error_code& error)
{
    error.clear();
    const bvalue map = bdecode(body, error);
    if(error) {
        return {};
    }
    if(!map.is_map()) {
        error = make_error_code(tracker_errc::invalid_response);
        return {};
    }

    tracker_response response;
    if(const bvalue* failure_reason = map.find_string("failure reason")) {
        // When the failure reason field is set, no other field may be set.
        response.failure_reason = failure_reason->string();
        return response;
    }

    if(const bvalue* v = map.find_string("warning message")) {
        response.warning_message = v->string();
    }
    if(const bvalue* v = map.find_string("tracker id")) {
        response.tracker_id = v->string();
    }
    if(const bvalue* v = map.find_number("interval")) {
        response.interval = seconds(std::max<int64_t>(0, v->number()));
    }
    if(const bvalue* v = map.find_number("min interval")) {
        response.min_interval = seconds(std::max<int64_t>(0, v->number()));
    }
    if(const bvalue* v = map.find_number("complete")) {
        response.num_seeders = v->number();
    }
    if(const bvalue* v = map.find_number("incomplete")) {
        response.num_leechers = v->number();
    }

    if(const bvalue* peers = map.find_string("peers")) {
        const auto& s = peers->string();
        response.peers = parse_compact_peers(
                reinterpret_cast<const uint8_t*>(s.data()), s.size());
    } else if(const bvalue* peers = map.find_list("peers")) {
        response.peers = parse_peer_dicts(peers->list());
    }
    if(const bvalue* peers6 = map.find_string("peers6")) {
        const auto& s = peers6->string();
        auto v6 = parse_compact_peers6(reinterpret_cast<const uint8_t*>(s.data()), s.size());
        response.peers.insert(response.peers.end(), v6.begin(), v6.end());
    }
    return response;
}

// -----------
// udp tracker
// -----------

// The number of times a request is resent before giving up.
constexpr int max_udp_retries = 2;

udp_tracker::udp_tracker(
        asio::io_context& ios, std::string url, const engine_settings& settings)
    : tracker(std::move(url), settings)
    , socket_(ios)
    , resolver_(ios)
    , timeout_timer_(ios)
{
    http::url u;
    if(http::parse_url(url_, u)) {
        host_ = u.host;
        port_ = u.port;
    }
}

udp_tracker::~udp_tracker()
{
    abort();
}

void udp_tracker::abort()
{
    is_aborted_ = true;
    request_.reset();
    resolver_.cancel();
    timeout_timer_.cancel();
    error_code ec;
    socket_.close(ec);
}

void udp_tracker::announce(tracker_request parameters, announce_handler handler)
{
    if(is_aborted_) {
        return;
    }
    request_ = std::make_unique<request>();
    request_->transaction_id = create_transaction_id();
    request_->parameters = std::move(parameters);
    request_->handler = std::move(handler);

    if(!is_resolved_) {
        log(log_event::connecting, "resolving %s:%s", host_.c_str(), port_.c_str());
        resolver_.async_resolve(host_, port_,
                [this](const error_code& error, udp::resolver::results_type results) {
                    on_host_resolved(error, std::move(results));
                });
        start_timeout();
        return;
    }
    execute_request();
}

void udp_tracker::on_host_resolved(
        const error_code& error, udp::resolver::results_type results)
{
    if(is_aborted_ || error == asio::error::operation_aborted) {
        return;
    }
    if(error) {
        finish(error);
        return;
    }
    if(results.empty()) {
        finish(make_error_code(asio::error::host_not_found));
        return;
    }

    const udp::endpoint ep = *results.begin();
    log(log_event::connecting, "resolved to: %s:%i", ep.address().to_string().c_str(),
            int(ep.port()));

    // Connect also opens socket.
    error_code ec;
    socket_.connect(ep, ec);
    if(ec) {
        finish(ec);
        return;
    }
    is_resolved_ = true;
    if(request_) {
        execute_request();
    }
}

void udp_tracker::execute_request()
{
    assert(request_);
    if(must_connect()) {
        send_connect_request();
    } else {
        send_announce_request();
    }
}

bool udp_tracker::must_connect() const noexcept
{
    return !is_connected_ || cached_clock::now() - last_connect_time_ >= minutes(1);
}

/**
 * Message format (length = 16):
 * int64_t protocol_id = 0x41727101980 // magic constant
 * int32_t action = 0 // connect
 * int32_t transaction_id // randomly choosen by us
 */
void udp_tracker::send_connect_request()
{
    log(log_event::outgoing, "sending CONNECT (trans_id: %i)", request_->transaction_id);
    request_->expected = action::connect;
    uint8_t* buffer = send_buffer_.data();
    endian::write_network<int64_t>(buffer, 0x41727101980);
    endian::write_network<int32_t>(buffer + 8, action::connect);
    endian::write_network<int32_t>(buffer + 12, request_->transaction_id);
    send_message(16);
}

/**
 * Message format (length = 16):
 * int32_t action = 0 // connect
 * int32_t transaction_id
 * int64_t connection_id
 */
void udp_tracker::handle_connect_response(const size_t num_bytes_received)
{
    if(num_bytes_received < 16) {
        finish(make_error_code(tracker_errc::wrong_response_length));
        return;
    }
    is_connected_ = true;
    last_connect_time_ = cached_clock::now();
    connection_id_ = endian::read_network<int64_t>(receive_buffer_.data() + 8);
    log(log_event::incoming, "received CONNECT (trans_id: %i, conn.id: %lli)",
            request_->transaction_id, (long long)connection_id_);
    send_announce_request();
}

/**
 * Message format (len 98):
 * int64_t connection_id
 * int32_t action = 1 // announce
 * int32_t transaction_id
 * 20-byte string info_hash
 * 20-byte string peer_id
 * int64_t downloaded
 * int64_t left
 * int64_t uploaded
 * int32_t event // 0: none; 1: completed; 2: started; 3: stopped
 * int32_t IP address // 0: default
 * int32_t key
 * int32_t num_want // -1: default
 * int16_t port
 */
void udp_tracker::send_announce_request()
{
    request_->expected = action::announce_;
    const tracker_request& parameters = request_->parameters;

    log(log_event::outgoing,
            "sending ANNOUNCE (trans_id: %i; down: %lli; left: %lli; up: %lli; event: %s;"
            " num_want: %i; port: %i)",
            request_->transaction_id, (long long)parameters.downloaded,
            (long long)parameters.left, (long long)parameters.uploaded,
            event_name(parameters.event), parameters.num_want, parameters.port);

    uint8_t* buffer = send_buffer_.data();
    endian::write_network<int64_t>(buffer, connection_id_);
    endian::write_network<int32_t>(buffer + 8, action::announce_);
    endian::write_network<int32_t>(buffer + 12, request_->transaction_id);
    std::copy(parameters.info_hash.begin(), parameters.info_hash.end(), buffer + 16);
    std::copy(parameters.peer_id.begin(), parameters.peer_id.end(), buffer + 36);
    endian::write_network<int64_t>(buffer + 56, parameters.downloaded);
    endian::write_network<int64_t>(buffer + 64, parameters.left);
    endian::write_network<int64_t>(buffer + 72, parameters.uploaded);
    endian::write_network<int32_t>(buffer + 80, static_cast<int32_t>(parameters.event));
    endian::write_network<int32_t>(buffer + 84, 0);
    endian::write_network<int32_t>(buffer + 88, request_->transaction_id);
    endian::write_network<int32_t>(buffer + 92, parameters.num_want);
    endian::write_network<uint16_t>(buffer + 96, parameters.port);
    send_message(98);
}

/**
 * Message format (length = 20 + n * 6)
 * int32_t action = 1 // announce
 * int32_t transaction_id
 * int32_t interval
 * int32_t leechers
 * int32_t seeders
 * n * <int32_t IP address, int16_t TCP port>
 */
void udp_tracker::handle_announce_response(const size_t num_bytes_received)
{
    if(num_bytes_received < 20) {
        finish(make_error_code(tracker_errc::wrong_response_length));
        return;
    }

    // Skip the 4 byte action and 4 byte transaction_id fields.
    const uint8_t* buffer = receive_buffer_.data() + 8;
    tracker_response response;
    response.interval = seconds(std::max(0, endian::read_network<int32_t>(buffer)));
    response.num_leechers = endian::read_network<int32_t>(buffer + 4);
    response.num_seeders = endian::read_network<int32_t>(buffer + 8);
    response.peers = parse_compact_peers(buffer + 12, num_bytes_received - 20);

    log(log_event::incoming,
            "received ANNOUNCE (trans_id: %i; interval: %i; num_leechers: %i;"
            " num_seeders: %i; num_peers: %i)",
            request_->transaction_id, int(response.interval.count()),
            response.num_leechers, response.num_seeders, int(response.peers.size()));
    finish(error_code(), std::move(response));
}

/**
 * Message format:
 * int32_t action = 3 // error
 * int32_t transaction_id
 * string message
 */
void udp_tracker::handle_error_response(const size_t num_bytes_received)
{
    const uint8_t* buffer = receive_buffer_.data() + 8;
    tracker_response response;
    response.failure_reason.assign(buffer, buffer + (num_bytes_received - 8));
    log(log_event::incoming, "received ERROR (trans_id: %i; error_msg: %s)",
            request_->transaction_id, response.failure_reason.c_str());
    finish(error_code(), std::move(response));
}

void udp_tracker::send_message(const size_t num_bytes)
{
    socket_.async_send(asio::buffer(send_buffer_.data(), num_bytes),
            [this](const error_code& error, size_t) {
                if(is_aborted_ || error == asio::error::operation_aborted) {
                    return;
                }
                if(error) {
                    finish(error);
                }
            });
    receive_message();
    start_timeout();
}

void udp_tracker::receive_message()
{
    if(is_receiving_) {
        return;
    }
    is_receiving_ = true;
    socket_.async_receive(asio::buffer(receive_buffer_),
            [this](const error_code& error, size_t num_bytes_received) {
                on_message_received(error, num_bytes_received);
            });
}

void udp_tracker::on_message_received(const error_code& ec, const size_t num_bytes_received)
{
    is_receiving_ = false;
    if(is_aborted_ || ec == asio::error::operation_aborted) {
        return;
    }
    if(!request_) {
        // A late response to an already finished request.
        return;
    }
    if(ec) {
        finish(ec);
        return;
    }
    if(num_bytes_received < 8) {
        log(log_event::invalid_message, "datagram too small (%i bytes)",
                int(num_bytes_received));
        receive_message();
        return;
    }

    const int32_t received_action = endian::read_network<int32_t>(receive_buffer_.data());
    const int32_t transaction_id
            = endian::read_network<int32_t>(receive_buffer_.data() + 4);
    if(transaction_id != request_->transaction_id) {
        log(log_event::invalid_message, "unknown transaction id: %i", transaction_id);
        receive_message();
        return;
    }

    timeout_timer_.cancel();
    if(received_action == action::error) {
        handle_error_response(num_bytes_received);
    } else if(received_action != request_->expected) {
        finish(make_error_code(tracker_errc::wrong_response_type));
    } else if(received_action == action::connect) {
        handle_connect_response(num_bytes_received);
    } else {
        handle_announce_response(num_bytes_received);
    }
}

void udp_tracker::start_timeout()
{
    // BEP 15 suggests 15 * 2 ^ n seconds, we cap it at the configured timeout.
    const auto timeout = std::min<seconds>(
            seconds(15 << request_->num_retries), settings_.tracker_timeout);
    start_timer(timeout_timer_, timeout, [this](const error_code& error) { on_timeout(error); });
}

void udp_tracker::on_timeout(const error_code& error)
{
    if(is_aborted_ || error == asio::error::operation_aborted || !request_) {
        return;
    }
    if(error) {
        finish(error);
        return;
    }
    if(request_->num_retries < max_udp_retries && is_resolved_) {
        ++request_->num_retries;
        log(log_event::timeout, "retrying request#%i", request_->transaction_id);
        execute_request();
    } else {
        log(log_event::timeout, "request#%i timed out", request_->transaction_id);
        resolver_.cancel();
        finish(make_error_code(tracker_errc::timed_out));
    }
}

void udp_tracker::finish(const error_code& error, tracker_response response)
{
    timeout_timer_.cancel();
    if(error) {
        // The connection id may have been invalidated.
        is_connected_ = false;
    }
    auto request = std::move(request_);
    if(request && request->handler) {
        request->handler(error, std::move(response));
    }
}

int32_t udp_tracker::create_transaction_id()
{
    return util::random_int(1, std::numeric_limits<int32_t>::max());
}

std::unique_ptr<tracker> make_tracker(const std::string& url, asio::io_context& ios,
        asio::ssl::context& ssl_context, const engine_settings& settings)
{
    http::url u;
    if(!http::parse_url(url, u)) {
        return nullptr;
    }
    if(u.scheme == "http" || u.scheme == "https") {
        return std::make_unique<http_tracker>(ios, ssl_context, url, settings);
    } else if(u.scheme == "udp" && !u.port.empty()) {
        return std::make_unique<udp_tracker>(ios, url, settings);
    }
    return nullptr;
}

} // namespace flume
