#ifndef FLUME_SESSION_ERROR_HEADER
#define FLUME_SESSION_ERROR_HEADER

#include "error_code.hpp"

#include <string>

namespace flume {

/**
 * These are the errors that may occur while constructing a streaming session (or
 * that make the engine give up on a torrent later on). Construction errors are
 * thrown as `system_error`s carrying one of these codes.
 */
enum class session_errc
{
    // The download engine could not be set up (e.g. the data directory could not be
    // created or the peer listener could not be bound).
    engine_init_failed = 1,
    invalid_magnet,
    invalid_metainfo,
    file_not_found,
    // A remote .torrent file could not be downloaded.
    fetch_failed,
    // The engine serves a single torrent and one has already been added.
    torrent_exists,
    // No peer could be found for the torrent in a long time.
    no_peers,
    // The session has been closed.
    closed
};

struct session_error_category : public error_category
{
    const char* name() const noexcept override { return "session"; }
    std::string message(int env) const override;
};

const session_error_category& session_category();
error_code make_error_code(session_errc e);
error_condition make_error_condition(session_errc e);

/**
 * Names the construction step a session error occurred in, e.g. "adding torrent",
 * for user facing error reports. Errors of other categories yield "starting
 * session".
 */
const char* construction_step(const error_code& error) noexcept;

} // namespace flume

namespace FLUME_ERROR_CODE_NS {
template <>
struct is_error_code_enum<flume::session_errc> : public std::true_type
{};
}

#endif // FLUME_SESSION_ERROR_HEADER
