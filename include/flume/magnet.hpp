#ifndef FLUME_MAGNET_HEADER
#define FLUME_MAGNET_HEADER

#include "error_code.hpp"
#include "types.hpp"

#include <string>
#include <vector>

namespace flume {

struct magnet_link
{
    sha1_hash info_hash;
    // The `dn` parameter, may be empty.
    std::string display_name;
    // `tr` parameters.
    std::vector<std::string> trackers;
    // `x.pe` parameters, as "host:port" strings.
    std::vector<std::string> peers;
};

/**
 * Parses a `magnet:?xt=urn:btih:<hash>` URI, where the hash is either 40 hex or 32
 * base32 characters. Sets `error` to `session_errc::invalid_magnet` on failure.
 */
magnet_link parse_magnet(const std::string& uri, error_code& error);

} // namespace flume

#endif // FLUME_MAGNET_HEADER
