#ifndef FLUME_STREAMING_SESSION_HEADER
#define FLUME_STREAMING_SESSION_HEADER

#include "download_engine.hpp"
#include "playback_gate.hpp"
#include "cancel_token.hpp"
#include "stream_reader.hpp"
#include "settings.hpp"
#include "log.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <thread>

namespace flume {

struct torrent_source;
class priority_scheduler;

struct session_status
{
    std::string name;
    int64_t bytes_completed = 0;
    int64_t total_length = 0;
    int num_connections = 0;
    bool has_metadata = false;
    bool is_ready = false;
    // Set if the engine gave up on the torrent.
    error_code failure;
};

/**
 * Owns a single torrent session: adds the torrent to the download engine, waits
 * for its metadata in the background (after which everything is scheduled for
 * download and the first pieces are bumped to readahead), hands out readers over
 * the torrent's largest file and tears everything down.
 */
class streaming_session
{
    settings settings_;
    std::unique_ptr<download_engine> engine_;
    playback_gate gate_;

    // Cancelled on close to abort the background metadata wait.
    cancel_token shutdown_;
    std::thread metadata_thread_;

    // The scheduler and the target file are published by the metadata thread under
    // this mutex, after which is_published_ is set.
    mutable std::mutex mutex_;
    std::unique_ptr<priority_scheduler> scheduler_;
    torrent_layout layout_;
    file_entry target_;
    std::atomic<bool> is_published_{false};

    std::atomic<bool> is_closed_{false};
    bool is_started_ = false;

public:
    /** `s` must have its defaults filled in. */
    streaming_session(std::unique_ptr<download_engine> engine, const settings& s);
    ~streaming_session();

    streaming_session(const streaming_session&) = delete;
    streaming_session& operator=(const streaming_session&) = delete;

    /**
     * Resolves `source` (downloading remote .torrent files), adds it to the engine and
     * launches the background metadata task. Throws a `system_error` with a
     * `session_errc` if the torrent could not be added. May only be called once.
     */
    void start(const torrent_source& source);

    /**
     * Returns a new reader over the torrent's largest file, blocking until metadata
     * is known. On failure nullptr is returned and `error` is set to
     * `stream_errc::cancelled`, `stream_errc::engine_failure` or
     * `session_errc::closed`.
     */
    std::unique_ptr<stream_reader> open_stream(cancel_token* cancel, error_code& error);

    /** Whether enough is downloaded to advertise the stream. Latches once true. */
    bool ready() const { return gate_.ready(); }

    /** True once the stream's target file is known. */
    bool is_published() const noexcept
    {
        return is_published_.load(std::memory_order_acquire);
    }

    /** The largest file of the torrent. Only valid once `is_published()`. */
    file_entry target() const;

    /** The streamed file's path within the torrent, empty until `is_published()`. */
    std::string stream_name() const;

    session_status status() const;

    download_engine& engine() noexcept { return *engine_; }

    /**
     * Stops the background task, drops the torrent and closes the engine. Readers
     * handed out must no longer be used afterwards. Errors are logged, not thrown.
     * Calling it more than once has no effect.
     */
    void close();

private:
    void wait_for_metadata();

    template <typename... Args>
    void log(const log::priority priority, const char* format, Args&&... args) const;
};

} // namespace flume

#endif // FLUME_STREAMING_SESSION_HEADER
