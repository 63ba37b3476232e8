#include "log.hpp"

#include <fstream>
#include <mutex>
#include <sstream>
#ifdef FLUME_ENABLE_STREAM_DEBUGGING
#include <iostream>
#endif // FLUME_ENABLE_STREAM_DEBUGGING

namespace flume {
namespace log {
namespace detail {

#ifndef FLUME_MIN_LOG_PRIORITY
#define FLUME_MIN_LOG_PRIORITY priority::low
#endif

constexpr auto g_open_mode = std::ios::app | std::ios::out;

std::mutex g_dir_mutex;
std::string g_log_dir;

std::string make_log_path(const std::string& name)
{
    std::lock_guard<std::mutex> l(g_dir_mutex);
    if(g_log_dir.empty()) {
        return {};
    }
    return g_log_dir + '/' + name + "-log.txt";
}

#define FLUME_PRIORITY_CHAR(p)                                                           \
    char(p == priority::low ? 'l' : p == priority::normal ? 'n' : 'h')

#define FLUME_LOG(priority, stream, header, log)                                         \
    stream << '[' << FLUME_PRIORITY_CHAR(priority) << '|' << header << "] " << log << '\n';

/**
 * Streams are read by the server's worker threads while the engine logs from its
 * network and disk threads, so every logger is thread-safe.
 */
class file_logger
{
    std::string name_;
    std::ofstream file_;
    std::mutex file_mutex_;

public:
    explicit file_logger(std::string name) : name_(std::move(name)) {}

    void log(const std::string& header, const std::string& log, const priority priority)
    {
#ifdef FLUME_ENABLE_LOGGING
        if(priority < FLUME_MIN_LOG_PRIORITY) {
            return;
        }
        std::lock_guard<std::mutex> l(file_mutex_);
#ifdef FLUME_ENABLE_STREAM_DEBUGGING
        FLUME_LOG(priority, std::clog, '(' << name_ << ')' << header, log);
#endif // FLUME_ENABLE_STREAM_DEBUGGING
        if(!file_.is_open()) {
            const auto path = make_log_path(name_);
            if(path.empty()) {
                return;
            }
            file_.open(path, g_open_mode);
        }
        FLUME_LOG(priority, file_, header, log);
#endif // FLUME_ENABLE_LOGGING
    }

    void flush()
    {
        std::lock_guard<std::mutex> l(file_mutex_);
        if(file_.is_open()) {
            file_.flush();
        }
    }
};

// global logger instances

file_logger engine_logger("engine");
file_logger torrent_logger("torrent");
file_logger peer_session_logger("peers");
file_logger disk_io_logger("diskIO");
file_logger stream_logger("stream");
file_logger http_logger("http");

} // detail

void set_log_dir(const std::string& dir)
{
    std::lock_guard<std::mutex> l(detail::g_dir_mutex);
    detail::g_log_dir = dir;
}

void log_engine(const std::string& header, const std::string& log, const priority priority)
{
    detail::engine_logger.log(header, log, priority);
}

void log_torrent(
        const std::string& header, const std::string& log, const priority priority)
{
    detail::torrent_logger.log(header, log, priority);
}

void log_peer_session(const tcp::endpoint& endpoint, const std::string& header,
        const std::string& log, const priority priority)
{
#ifdef FLUME_ENABLE_LOGGING
    std::stringstream ss;
    ss << endpoint.address().to_string() << ':' << endpoint.port() << '|' << header;
    detail::peer_session_logger.log(ss.str(), log, priority);
#endif // FLUME_ENABLE_LOGGING
}

void log_disk_io(const std::string& header, const std::string& log, const priority priority)
{
    detail::disk_io_logger.log(header, log, priority);
}

void log_stream(const std::string& header, const std::string& log, const priority priority)
{
    detail::stream_logger.log(header, log, priority);
}

void log_http(const std::string& header, const std::string& log, const priority priority)
{
    detail::http_logger.log(header, log, priority);
}

void flush()
{
    detail::engine_logger.flush();
    detail::torrent_logger.flush();
    detail::peer_session_logger.flush();
    detail::disk_io_logger.flush();
    detail::stream_logger.flush();
    detail::http_logger.flush();
}

} // log
} // flume
