#ifndef FLUME_TORRENT_SOURCE_HEADER
#define FLUME_TORRENT_SOURCE_HEADER

#include "time.hpp"

#include <string>

namespace flume {

/** What the user pointed us at. */
struct torrent_source
{
    enum class kind
    {
        magnet,
        // A path to a local .torrent file.
        file,
        // An http:// or https:// URL of a .torrent file.
        url
    };

    kind type = kind::file;
    std::string location;

    /** Classifies user input. Surrounding whitespace is ignored. */
    static torrent_source parse(std::string input);
};

/**
 * Downloads the .torrent file at `url` into `cache_dir` and returns the local path.
 * The file is named after the URL's hash, so a previous download of the same URL is
 * reused. Redirects are followed (at most 5 of them).
 *
 * Throws a `system_error` with `session_errc::fetch_failed` on failure.
 */
std::string fetch_torrent_file(
        const std::string& url, const std::string& cache_dir, const seconds timeout);

} // namespace flume

#endif // FLUME_TORRENT_SOURCE_HEADER
