#ifndef FLUME_STREAM_READER_HEADER
#define FLUME_STREAM_READER_HEADER

#include "download_engine.hpp"
#include "error_code.hpp"
#include "piece_index.hpp"
#include "view.hpp"

#include <atomic>
#include <cstdint>
#include <string>

namespace flume {

class priority_scheduler;
class cancel_token;

/**
 * Presents one file of a partially downloaded torrent as a seekable byte stream.
 *
 * Each read maps its byte range to pieces, bumps them to `now` (and a window of
 * pieces after them to `readahead`), blocks until all of them are verified and then
 * copies the bytes out of the engine's storage. Bytes are only ever served from
 * verified pieces.
 *
 * `read_at` may be called concurrently from several threads; the cursor based
 * `read`/`seek`/`tell` trio is meant for a single owner.
 */
class stream_reader
{
public:
    enum class origin
    {
        begin,
        current,
        end
    };

    /** The phases a single read goes through. */
    enum class read_state
    {
        computing,
        waiting,
        copying,
        done
    };

private:
    download_engine& engine_;
    priority_scheduler& scheduler_;
    file_entry file_;
    int piece_length_;

    // Pieces after a read's last piece that are bumped to readahead.
    int readahead_window_;

    // The file's pieces, readahead never reaches past these.
    interval file_pieces_;

    int64_t cursor_ = 0;
    std::atomic<int64_t> last_read_end_{0};

public:
    stream_reader(download_engine& engine, priority_scheduler& scheduler, file_entry file,
            const int piece_length, const int readahead_window);

    stream_reader(const stream_reader&) = delete;
    stream_reader& operator=(const stream_reader&) = delete;

    /**
     * Reads `min(buffer.size(), size() - offset)` bytes starting at `offset` into
     * `buffer` and returns the number of bytes read.
     *
     * On error 0 is returned and `error` is set to one of:
     * - `stream_errc::out_of_range` if offset is not within the file (no pieces are
     *   bumped in this case),
     * - `stream_errc::cancelled` if `cancel` fired while waiting for pieces,
     * - `stream_errc::engine_failure` if the engine gave up on the torrent,
     * - or whatever the engine reported while copying.
     *
     * `cancel` may be null, in which case the read may only end through completion or
     * engine failure.
     */
    int read_at(const int64_t offset, view<uint8_t> buffer, cancel_token* cancel,
            error_code& error);

    /**
     * Reads from the cursor and advances it by the number of bytes read. Returns 0
     * without error at the end of the file.
     */
    int read(view<uint8_t> buffer, cancel_token* cancel, error_code& error);

    /**
     * Moves the cursor without any I/O or priority changes and returns its new
     * position. A resulting negative position is rejected with out_of_range; seeking
     * past the end is allowed and makes the next `read` return 0.
     */
    int64_t seek(const int64_t offset, const origin origin, error_code& error);

    int64_t tell() const noexcept { return cursor_; }
    int64_t size() const noexcept { return file_.length; }
    const std::string& name() const noexcept { return file_.path; }
    const file_entry& file() const noexcept { return file_; }

    /** The end offset of the most recent successful read. */
    int64_t last_read_end() const noexcept
    {
        return last_read_end_.load(std::memory_order_relaxed);
    }

private:
    bool are_all_verified(const piece_span& span) const;
    int copy(const int64_t offset, const piece_span& span, view<uint8_t> buffer,
            error_code& error);

    template <typename... Args>
    void log(const read_state state, const char* format, Args&&... args) const;
};

} // namespace flume

#endif // FLUME_STREAM_READER_HEADER
