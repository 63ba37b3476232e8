#include "session_error.hpp"

namespace flume {

std::string session_error_category::message(int env) const
{
    switch(static_cast<session_errc>(env)) {
    case session_errc::engine_init_failed: return "Could not initialize download engine";
    case session_errc::invalid_magnet: return "Invalid magnet link";
    case session_errc::invalid_metainfo: return "Invalid torrent metainfo";
    case session_errc::file_not_found: return "Torrent file not found";
    case session_errc::fetch_failed: return "Could not download torrent file";
    case session_errc::torrent_exists: return "A torrent has already been added";
    case session_errc::no_peers: return "No peers found for torrent";
    case session_errc::closed: return "Session closed";
    default: return "Unknown session error";
    }
}

const session_error_category& session_category()
{
    static session_error_category instance;
    return instance;
}

error_code make_error_code(session_errc e)
{
    return error_code(static_cast<int>(e), session_category());
}

error_condition make_error_condition(session_errc e)
{
    return error_condition(static_cast<int>(e), session_category());
}

const char* construction_step(const error_code& error) noexcept
{
    if(error.category() != session_category()) {
        return "starting session";
    }
    switch(static_cast<session_errc>(error.value())) {
    case session_errc::engine_init_failed: return "creating torrent client";
    case session_errc::invalid_magnet: return "adding torrent";
    case session_errc::fetch_failed: return "downloading torrent file";
    case session_errc::file_not_found: return "file not found";
    case session_errc::invalid_metainfo:
    case session_errc::torrent_exists: return "adding torrent to the client";
    default: return "starting session";
    }
}

} // namespace flume
