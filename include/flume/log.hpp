#ifndef FLUME_LOG_HEADER
#define FLUME_LOG_HEADER

#include "socket.hpp"

#include <string>

namespace flume {
namespace log {

enum class priority
{
    low,
    normal,
    high
};

/**
 * Log files are written to this directory as `<component>-log.txt`. Until a
 * directory is set (or when compiled without FLUME_ENABLE_LOGGING) all entries are
 * discarded.
 */
void set_log_dir(const std::string& dir);

void log_engine(const std::string& header, const std::string& log,
        const priority priority = priority::normal);
void log_torrent(const std::string& header, const std::string& log,
        const priority priority = priority::normal);
void log_peer_session(const tcp::endpoint& endpoint, const std::string& header,
        const std::string& log, const priority priority = priority::normal);
void log_disk_io(const std::string& header, const std::string& log,
        const priority priority = priority::normal);
void log_stream(const std::string& header, const std::string& log,
        const priority priority = priority::normal);
void log_http(const std::string& header, const std::string& log,
        const priority priority = priority::normal);

/**
 * Call this on shutdown (or in a SIGABRT handler) so that everything buffered is
 * written to disk.
 */
void flush();

} // log
} // flume

#endif // FLUME_LOG_HEADER
