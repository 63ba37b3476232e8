#ifndef FLUME_METAINFO_HEADER
#define FLUME_METAINFO_HEADER

#include "download_engine.hpp"
#include "error_code.hpp"
#include "types.hpp"

#include <string_view>
#include <string>
#include <vector>

namespace flume {

/** The contents of a .torrent file (or of an info dictionary fetched from peers). */
struct metainfo
{
    sha1_hash info_hash;
    std::string name;
    int piece_length = 0;
    int64_t total_length = 0;
    std::vector<sha1_hash> piece_hashes;
    std::vector<file_entry> files;

    // Announce URLs in the order of the announce-list's tiers, without duplicates.
    std::vector<std::string> trackers;

    // The raw bencoded info dictionary, which is served to peers asking for metadata.
    std::string info;

    int num_pieces() const noexcept { return piece_hashes.size(); }

    torrent_layout layout() const;
};

/**
 * Parses a complete .torrent file. Malformed bencode is reported with a
 * `bencode_errc`, structurally invalid metainfo with `session_errc::invalid_metainfo`.
 */
metainfo parse_metainfo(std::string_view encoded, error_code& error);

/** Parses a bencoded info dictionary and computes its info-hash. */
metainfo parse_info_dict(std::string_view encoded, error_code& error);

/** Reads and parses a .torrent file from disk. */
metainfo read_metainfo_file(const std::string& path, error_code& error);

/**
 * Joins the components of a file's path, dropping components that are empty, "."
 * or "..", and replacing path separators within components, so that the result can
 * never escape the download directory. An empty result yields `fallback`.
 */
std::string sanitize_path(
        const std::vector<std::string>& components, const std::string& fallback);

} // namespace flume

#endif // FLUME_METAINFO_HEADER
