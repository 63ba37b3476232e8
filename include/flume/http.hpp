#ifndef FLUME_HTTP_HEADER
#define FLUME_HTTP_HEADER

#include "error_code.hpp"
#include "socket.hpp"
#include "time.hpp"

#include <functional>
#include <memory>
#include <string>

#include <boost/asio/ssl/context.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl/ssl_stream.hpp>

namespace flume {
namespace http {

using namespace boost::beast::http;
using boost::beast::flat_buffer;

/** The components of an absolute URL, e.g. `https://host:port/target?query`. */
struct url
{
    // Lower-cased, without the "://".
    std::string scheme;
    std::string host;
    // Defaults to 80 for http and 443 for https and is empty for other schemes
    // without an explicit port.
    std::string port;
    // Everything from the first '/' after the authority, "/" if there is none.
    std::string target;
};

/** Returns false if `s` is not an absolute URL. */
bool parse_url(const std::string& s, url& out);

/**
 * A single GET request, including the redirects (at most `max_redirects`) it takes
 * to reach the final resource. Both plain HTTP and HTTPS are supported, the latter
 * verifying the server's certificate against the host name.
 *
 * Instances must be created via `std::make_shared` as they keep themselves alive
 * until the handler is invoked, which happens exactly once, on the io_context's
 * thread.
 */
class get_request : public std::enable_shared_from_this<get_request>
{
public:
    using response_type = response<string_body>;
    using handler_type = std::function<void(const error_code&, response_type)>;

    static constexpr int max_redirects = 5;

private:
    tcp::resolver resolver_;
    asio::ssl::context& ssl_context_;

    // Exactly one of these is set for the duration of a connection.
    std::unique_ptr<boost::beast::tcp_stream> plain_stream_;
    std::unique_ptr<boost::beast::ssl_stream<boost::beast::tcp_stream>> ssl_stream_;

    flat_buffer buffer_;
    request<empty_body> request_;
    std::unique_ptr<response_parser<string_body>> parser_;

    url url_;
    std::string user_agent_;
    duration timeout_;
    int64_t body_limit_;
    int num_redirects_ = 0;

    handler_type handler_;
    bool is_aborted_ = false;

public:
    get_request(asio::io_context& ios, asio::ssl::context& ssl_context,
            std::string user_agent, duration timeout, int64_t body_limit = 8 * 1024 * 1024);

    /**
     * Starts the request. Network errors and timeouts are reported via the error
     * code, non-2xx responses are delivered as they are.
     */
    void start(const std::string& target_url, handler_type handler);

    /** Cancels the request, after which the handler is invoked with operation_aborted. */
    void abort();

private:
    void resolve();
    void on_resolved(const error_code& error, tcp::resolver::results_type results);
    void on_connected(const error_code& error);
    void send_request();
    void on_response(const error_code& error);
    void close_stream();
    void finish(const error_code& error, response_type response = {});

    boost::beast::tcp_stream& lowest_layer();

    template <typename... Args>
    void log(const char* format, Args&&... args) const;
};

/** Creates a TLS client context that verifies peers against the system's CA store. */
std::unique_ptr<asio::ssl::context> make_client_ssl_context();

} // namespace http
} // namespace flume

#endif // FLUME_HTTP_HEADER
