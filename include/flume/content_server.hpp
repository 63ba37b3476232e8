#ifndef FLUME_CONTENT_SERVER_HEADER
#define FLUME_CONTENT_SERVER_HEADER

#include "thread_pool.hpp"
#include "settings.hpp"
#include "socket.hpp"
#include "log.hpp"

#include <atomic>
#include <ctime>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>

namespace flume {

class streaming_session;
class http_connection;

/**
 * An HTTP/1.1 server that serves the session's stream (the torrent's largest file)
 * at every path, supporting GET and HEAD and single byte ranges.
 */
class content_server
{
    streaming_session& session_;
    server_settings settings_;

    asio::io_context ios_;
    asio::executor_work_guard<asio::io_context::executor_type> work_;
    tcp::acceptor acceptor_;

    // Blocking stream reads are executed here.
    thread_pool workers_;
    std::thread network_thread_;

    // Only accessed on the network thread.
    std::vector<std::weak_ptr<http_connection>> connections_;

    std::atomic<bool> is_running_{false};

public:
    /**
     * Binds the listening socket on all interfaces. A port of 0 picks a free one.
     * Throws a `system_error` if binding fails.
     */
    content_server(streaming_session& session, const server_settings& settings);
    ~content_server();

    content_server(const content_server&) = delete;
    content_server& operator=(const content_server&) = delete;

    /** Starts accepting connections on a thread of its own. */
    void start();

    /** Closes all connections, cancelling their in-flight reads, and joins. */
    void stop();

    uint16_t port() const;

private:
    void accept();

    template <typename... Args>
    void log(const log::priority priority, const char* format, Args&&... args) const;
};

/** The MIME type by the extension of `path`, application/octet-stream if unknown. */
const char* mime_type(const std::string& path) noexcept;

/** Formats `t` as an RFC 7231 IMF-fixdate, e.g. "Sun, 06 Nov 1994 08:49:37 GMT". */
std::string http_date(const std::time_t t);

} // namespace flume

#endif // FLUME_CONTENT_SERVER_HEADER
