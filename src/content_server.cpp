#include "content_server.hpp"
#include "http_connection.hpp"
#include "string_utils.hpp"

#include <algorithm>
#include <cctype>
#include <cstring>

#include <boost/asio/post.hpp>

namespace flume {

content_server::content_server(streaming_session& session, const server_settings& settings)
    : session_(session)
    , settings_(settings)
    , work_(asio::make_work_guard(ios_))
    , acceptor_(ios_)
    , workers_(settings.concurrency)
{
    const tcp::endpoint ep(tcp::v4(), uint16_t(settings_.port));
    acceptor_.open(ep.protocol());
    acceptor_.set_option(tcp::acceptor::reuse_address(true));
    acceptor_.bind(ep);
    acceptor_.listen(asio::socket_base::max_listen_connections);
}

content_server::~content_server()
{
    stop();
}

void content_server::start()
{
    if(is_running_.exchange(true)) {
        return;
    }
    accept();
    network_thread_ = std::thread([this] {
        for(;;) {
            try {
                ios_.run();
                break;
            } catch(const std::exception& e) {
                log(log::priority::high, "exception on server thread: %s", e.what());
            }
        }
    });
    log(log::priority::normal, "listening on port %i", int(port()));
}

void content_server::stop()
{
    if(!is_running_.exchange(false)) {
        return;
    }
    asio::post(ios_, [this] {
        error_code ec;
        acceptor_.close(ec);
        for(auto& c : connections_) {
            if(auto connection = c.lock()) {
                connection->stop();
            }
        }
        connections_.clear();
    });
    work_.reset();
    if(network_thread_.joinable()) {
        network_thread_.join();
    }
    workers_.clear_pending_jobs();
    workers_.join();
    log(log::priority::normal, "stopped");
}

uint16_t content_server::port() const
{
    error_code ec;
    const auto ep = acceptor_.local_endpoint(ec);
    return ec ? 0 : ep.port();
}

void content_server::accept()
{
    acceptor_.async_accept([this](const error_code& error, tcp::socket socket) {
        if(error == asio::error::operation_aborted || !acceptor_.is_open()) {
            return;
        }
        if(error) {
            log(log::priority::normal, "accept error: %s", error.message().c_str());
        } else {
            connections_.erase(std::remove_if(connections_.begin(), connections_.end(),
                                       [](const auto& c) { return c.expired(); }),
                    connections_.end());
            auto connection = std::make_shared<http_connection>(
                    std::move(socket), session_, workers_, settings_);
            connections_.push_back(connection);
            connection->start();
        }
        accept();
    });
}

template <typename... Args>
void content_server::log(
        const log::priority priority, const char* format, Args&&... args) const
{
#ifdef FLUME_ENABLE_LOGGING
    log::log_http("SERVER", util::format(format, std::forward<Args>(args)...), priority);
#endif // FLUME_ENABLE_LOGGING
}

const char* mime_type(const std::string& path) noexcept
{
    struct entry
    {
        const char* extension;
        const char* type;
    };
    static constexpr entry types[] = {
        {"mp4", "video/mp4"},
        {"m4v", "video/x-m4v"},
        {"mkv", "video/x-matroska"},
        {"webm", "video/webm"},
        {"avi", "video/x-msvideo"},
        {"mov", "video/quicktime"},
        {"wmv", "video/x-ms-wmv"},
        {"flv", "video/x-flv"},
        {"mpg", "video/mpeg"},
        {"mpeg", "video/mpeg"},
        {"ts", "video/mp2t"},
        {"ogv", "video/ogg"},
        {"mp3", "audio/mpeg"},
        {"m4a", "audio/mp4"},
        {"aac", "audio/aac"},
        {"flac", "audio/flac"},
        {"ogg", "audio/ogg"},
        {"opus", "audio/opus"},
        {"wav", "audio/wav"},
        {"srt", "application/x-subrip"},
        {"vtt", "text/vtt"},
        {"txt", "text/plain; charset=utf-8"},
        {"html", "text/html; charset=utf-8"},
        {"pdf", "application/pdf"},
        {"jpg", "image/jpeg"},
        {"jpeg", "image/jpeg"},
        {"png", "image/png"},
        {"gif", "image/gif"},
    };

    const auto dot = path.rfind('.');
    const auto slash = path.rfind('/');
    if(dot == std::string::npos || (slash != std::string::npos && dot < slash)) {
        return "application/octet-stream";
    }
    std::string extension = path.substr(dot + 1);
    util::to_lower(extension);
    for(const auto& e : types) {
        if(extension == e.extension) {
            return e.type;
        }
    }
    return "application/octet-stream";
}

std::string http_date(const std::time_t t)
{
    std::tm tm;
    gmtime_r(&t, &tm);
    char buffer[64];
    const auto n = std::strftime(buffer, sizeof buffer, "%a, %d %b %Y %H:%M:%S GMT", &tm);
    return std::string(buffer, n);
}

} // namespace flume
