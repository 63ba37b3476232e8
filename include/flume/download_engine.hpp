#ifndef FLUME_DOWNLOAD_ENGINE_HEADER
#define FLUME_DOWNLOAD_ENGINE_HEADER

#include "piece_signal.hpp"
#include "error_code.hpp"
#include "types.hpp"
#include "view.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace flume {

class cancel_token;

enum class piece_priority : uint8_t
{
    normal,
    readahead,
    now
};

struct file_entry
{
    // The file's path within the torrent, with '/' as separator.
    std::string path;
    int64_t length = 0;
    // The offset of the file's first byte within the torrent's contiguous byte
    // space.
    int64_t offset = 0;
};

/** The metadata of a torrent, available once the engine received it. */
struct torrent_layout
{
    std::string name;
    int64_t total_length = 0;
    int piece_length = 0;
    int num_pieces = 0;
    std::vector<file_entry> files;
};

/**
 * Picks the file with the largest length (the first one if several share it), or
 * returns nullptr if there are no files.
 */
const file_entry* largest_file(const std::vector<file_entry>& files) noexcept;

/**
 * The interface through which the streaming core drives a torrent download. The
 * bundled BitTorrent implementation is `bt_engine`.
 *
 * Every method may be called from any thread. Implementations must raise
 * `piece_signal()` after a piece got verified, after metadata arrived and after
 * they failed, having published the respective state change first.
 */
class download_engine
{
    piece_signal piece_signal_;

public:
    virtual ~download_engine() = default;

    /**
     * Adds the torrent to the engine. An engine handles a single torrent. Errors are
     * thrown as `system_error`s with a `session_errc`.
     */
    virtual void add_magnet(const std::string& uri) = 0;
    virtual void add_torrent_file(const std::string& path) = 0;

    /**
     * Blocks until metadata is known, the engine failed or `cancel` is cancelled. In
     * the latter two cases `error` is set to `stream_errc::engine_failure` or
     * `stream_errc::cancelled` and the returned layout is empty.
     */
    torrent_layout wait_for_metadata(cancel_token* cancel, error_code& error);

    virtual bool has_metadata() const = 0;

    /** Only valid once `has_metadata()` returns true. */
    virtual torrent_layout layout() const = 0;

    /**
     * The torrent's display name, which may be a placeholder (the magnet's display
     * name or the info-hash) until metadata is known.
     */
    virtual std::string name() const = 0;

    /** Marks every piece as wanted at normal priority. */
    virtual void download_all() = 0;

    /** Requests that a piece be downloaded with at least the given urgency. */
    virtual void set_piece_priority(const piece_index_t piece, const piece_priority p) = 0;

    virtual bool is_piece_verified(const piece_index_t piece) const = 0;

    /**
     * Copies `buffer.size()` bytes of a verified piece starting at `offset` within the
     * piece. Returns the number of bytes copied, or sets `error` (e.g. to
     * `stream_errc::piece_not_verified`) and returns 0.
     */
    virtual int read_verified_piece(const piece_index_t piece, const int offset,
            view<uint8_t> buffer, error_code& error) = 0;

    virtual int64_t bytes_completed() const = 0;
    virtual int64_t total_length() const = 0;
    virtual int num_pieces() const = 0;
    virtual int piece_length(const piece_index_t piece) const = 0;
    virtual int num_connections() const = 0;

    /** Once an engine failed it stays failed. */
    virtual bool has_failed() const = 0;
    virtual error_code failure() const = 0;

    /** Stops downloading and releases the torrent. */
    virtual void drop() = 0;

    /** Shuts the engine down. No other method may be called afterwards. */
    virtual void close() = 0;

    piece_signal& signal() noexcept { return piece_signal_; }
};

} // namespace flume

#endif // FLUME_DOWNLOAD_ENGINE_HEADER
