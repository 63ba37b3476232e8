#ifndef FLUME_TRACKER_HEADER
#define FLUME_TRACKER_HEADER

#include "error_code.hpp"
#include "settings.hpp"
#include "socket.hpp"
#include "types.hpp"
#include "time.hpp"
#include "http.hpp"

#include <array>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace flume {

struct tracker_request
{
    enum class event_t
    {
        // This is used by udp_tracker because an event field is always included so we
        // must differentiate it from the other three events.
        none = 0,
        // Must be sent to the tracker when the client becomes a seeder. Must not be
        // present if the client started as a seeder.
        completed = 1,
        // The first request to tracker must include this value.
        started = 2,
        // Must be sent to tracker if the client is shutting down gracefully.
        stopped = 3,
    };

    sha1_hash info_hash;
    peer_id_t peer_id;
    uint16_t port = 0;
    int64_t uploaded = 0;
    int64_t downloaded = 0;
    int64_t left = 0;

    // The number of peers the client wishes to receive from the tracker. If it's -1
    // the tracker decides.
    int num_want = -1;

    event_t event = event_t::none;

    // If a previous announce contained a tracker_id, it should be included here.
    std::string tracker_id;
};

struct tracker_response
{
    // If this is not empty, no other fields in response are valid. It contains a
    // human-readable error message as to why the request was invalid.
    std::string failure_reason;

    // Optional. Similar to failure_reason, but the response is still processed.
    std::string warning_message;

    // Optional.
    std::string tracker_id;

    // The number of seconds the client should wait before recontacting tracker.
    seconds interval{0};

    // If present, the client must not reannounce itself before the end of this
    // interval.
    seconds min_interval{0};

    int32_t num_seeders = 0;
    int32_t num_leechers = 0;

    std::vector<tcp::endpoint> peers;
};

enum class tracker_errc
{
    timed_out = 1,
    invalid_response,
    wrong_response_type,
    wrong_response_length,
    invalid_transaction_id,
    http_error,
    unsupported_protocol
};

struct tracker_error_category : public error_category
{
    const char* name() const noexcept override { return "tracker"; }
    std::string message(int env) const override;
};

const tracker_error_category& tracker_category();
error_code make_error_code(tracker_errc e);
error_condition make_error_condition(tracker_errc e);

} // namespace flume

namespace FLUME_ERROR_CODE_NS {
template <>
struct is_error_code_enum<flume::tracker_errc> : public std::true_type
{};
}

namespace flume {

/**
 * This is an interface for the two possible trackers: UDP and HTTP/S. A torrent owns
 * its trackers and only ever has a single announce outstanding with each.
 *
 * All methods must be called on the io_context's thread.
 */
class tracker
{
public:
    using announce_handler = std::function<void(const error_code&, tracker_response)>;

protected:
    // The full announce URL, including the protocol identifier.
    std::string url_;

    const engine_settings& settings_;

    bool is_aborted_ = false;

public:
    tracker(std::string url, const engine_settings& settings);
    virtual ~tracker() = default;

    /**
     * Starts an asynchronous tracker announcement. Network errors are reported via the
     * error_code, but semantic errors (i.e. invalid fields in the request) are
     * reported via the tracker_response.failure_reason field (in which case all other
     * fields in response are empty/invalid).
     */
    virtual void announce(tracker_request parameters, announce_handler handler) = 0;

    /**
     * This should be called when torrent is shutting down but we don't want to wait
     * for pending announcements. Handlers of outstanding announcements are not invoked.
     */
    virtual void abort() = 0;

    const std::string& url() const noexcept { return url_; }

protected:
    enum class log_event
    {
        connecting,
        incoming,
        outgoing,
        invalid_message,
        timeout
    };

    template <typename... Args>
    void log(const log_event event, const char* format, Args&&... args) const;
};

/** Announces via HTTP or HTTPS GET requests, as in BEP 3 and BEP 23. */
class http_tracker final : public tracker
{
    asio::io_context& ios_;
    asio::ssl::context& ssl_context_;
    std::shared_ptr<http::get_request> request_;

public:
    http_tracker(asio::io_context& ios, asio::ssl::context& ssl_context, std::string url,
            const engine_settings& settings);
    ~http_tracker();

    void announce(tracker_request parameters, announce_handler handler) override;
    void abort() override;

    /** Appends the announce parameters to the query of the announce URL. */
    static std::string create_announce_url(
            const std::string& announce_url, const tracker_request& r);

    static tracker_response parse_announce_response(
            const std::string& body, error_code& error);
};

/**
 * Implements: http://bittorrent.org/beps/bep_0015.html
 */
class udp_tracker final : public tracker
{
    /** Each exchanged message has an action field specifying the message's intent. */
    enum action : int32_t
    {
        connect = 0,
        announce_ = 1,
        scrape = 2,
        error = 3
    };

    struct request
    {
        // The message we're expecting next from tracker (response may be
        // action::error, however).
        action expected = action::connect;
        int32_t transaction_id = 0;
        int num_retries = 0;
        tracker_request parameters;
        announce_handler handler;
    };

    // There is at most a single outstanding announcement, which is stored here.
    std::unique_ptr<request> request_;

    udp::socket socket_;
    udp::resolver resolver_;
    deadline_timer timeout_timer_;

    // The largest message we send is the 98 byte announce request.
    std::array<uint8_t, 98> send_buffer_;
    // 1500 bytes is the limit of Ethernet v2 MTU, so this is about the upper limit
    // of what a tracker sends without fragmentation.
    std::array<uint8_t, 1500> receive_buffer_;

    std::string host_;
    std::string port_;
    bool is_resolved_ = false;

    // We may only have a single receive operation outstanding.
    bool is_receiving_ = false;

    // After establishing a connection with tracker and receiving a connection_id,
    // the connection is alive for one minute.
    time_point last_connect_time_;
    bool is_connected_ = false;
    int64_t connection_id_ = 0;

public:
    /** url must include the "udp://" protocol identifier and the port number. */
    udp_tracker(asio::io_context& ios, std::string url, const engine_settings& settings);
    ~udp_tracker();

    void announce(tracker_request parameters, announce_handler handler) override;
    void abort() override;

private:
    void on_host_resolved(const error_code& error, udp::resolver::results_type results);
    void execute_request();
    bool must_connect() const noexcept;

    void send_connect_request();
    void send_announce_request();
    void send_message(const size_t num_bytes);
    void receive_message();
    void on_message_received(const error_code& error, const size_t num_bytes_received);

    void handle_connect_response(const size_t num_bytes_received);
    void handle_announce_response(const size_t num_bytes_received);
    void handle_error_response(const size_t num_bytes_received);

    void start_timeout();
    void on_timeout(const error_code& error);

    void finish(const error_code& error, tracker_response response = {});

    static int32_t create_transaction_id();
};

/**
 * A torrent's per tracker state.
 */
struct tracker_entry
{
    std::unique_ptr<class tracker> tracker;

    // Each tracker announce starts with a 'started' event. Each tracker that received
    // such a message, must be sent a 'completed' event once the download is done, and
    // a 'stopped' event when the torrent is gracefully stopped.
    bool has_sent_started = false;
    bool has_sent_completed = false;

    bool is_announcing = false;

    // We should not announce more frequently than every 'interval' seconds, unless
    // we need more peers, in which case min_interval is respected.
    seconds interval{0};
    seconds min_interval{0};

    time_point last_announce_time;
    std::string tracker_id;

    // The number of consecutive failed announcements.
    int num_fails = 0;

    // If there was an error with tracker, it will be kept here.
    error_code last_error;
};

/**
 * Returns nullptr if the url's protocol is not supported (anything other than
 * http, https and udp).
 */
std::unique_ptr<tracker> make_tracker(const std::string& url, asio::io_context& ios,
        asio::ssl::context& ssl_context, const engine_settings& settings);

/** Parses a compact peer list (6 bytes per peer). A trailing partial entry is ignored. */
std::vector<tcp::endpoint> parse_compact_peers(const uint8_t* data, const size_t length);

} // namespace flume

#endif // FLUME_TRACKER_HEADER
