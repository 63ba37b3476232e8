#ifndef FLUME_HTTP_CONNECTION_HEADER
#define FLUME_HTTP_CONNECTION_HEADER

#include "stream_reader.hpp"
#include "cancel_token.hpp"
#include "thread_pool.hpp"
#include "error_code.hpp"
#include "settings.hpp"
#include "socket.hpp"
#include "http.hpp"
#include "log.hpp"

#include <ctime>
#include <memory>
#include <vector>

namespace flume {

class streaming_session;

/**
 * Serves a session's stream to a single HTTP client, one request at a time
 * (keep-alive is honoured, pipelined requests are queued by the client's TCP
 * stream).
 *
 * The stream_reader blocks until the requested pieces are downloaded, so reads
 * are executed on the server's worker pool, while the socket is driven on the
 * network thread. While a read is in flight the socket is watched, so that a client
 * hanging up cancels the read. Requests the client sends in the meantime are moved
 * into the request buffer, so that the hang-up behind them is still noticed.
 */
class http_connection : public std::enable_shared_from_this<http_connection>
{
    boost::beast::tcp_stream stream_;
    tcp::endpoint remote_endpoint_;

    streaming_session& session_;
    thread_pool& workers_;
    const server_settings& settings_;

    http::flat_buffer buffer_;
    http::request<http::empty_body> request_;
    http::response<http::empty_body> response_;
    std::unique_ptr<http::response_serializer<http::empty_body>> serializer_;

    // Opened on the first request and reused on subsequent ones.
    std::unique_ptr<stream_reader> reader_;

    // Each request gets its own token, so that cancelling it only affects that
    // request's reads.
    std::shared_ptr<cancel_token> cancel_;

    // Only accessed by the worker while is_worker_busy_ is set.
    std::vector<uint8_t> chunk_;

    int64_t offset_ = 0;
    int64_t num_bytes_left_ = 0;
    std::time_t request_time_ = 0;

    bool is_worker_busy_ = false;
    bool is_watching_socket_ = false;
    bool is_closed_ = false;

public:
    http_connection(tcp::socket socket, streaming_session& session,
            thread_pool& workers, const server_settings& settings);

    void start();

    /** Cancels the in-flight read, if any, and closes the connection. */
    void stop();

    bool is_closed() const noexcept { return is_closed_; }

private:
    void read_request();
    void on_request(const error_code& error);

    void open_stream();
    void on_stream_opened(const error_code& error, std::unique_ptr<stream_reader> reader);

    void send_header();
    void on_header_sent(const error_code& error);

    void read_chunk();
    void on_chunk_read(const error_code& error, const int num_bytes_read);
    void on_chunk_sent(const error_code& error, const size_t num_bytes_sent);

    void finish_response();

    /** Responds with an error status and a short plain text body. */
    void send_error(const http::status status, const std::string& content_range = {});
    void handle_stream_error(const error_code& error);

    void watch_socket();
    void close();

    template <typename... Args>
    void log(const log::priority priority, const char* format, Args&&... args) const;
};

} // namespace flume

#endif // FLUME_HTTP_CONNECTION_HEADER
