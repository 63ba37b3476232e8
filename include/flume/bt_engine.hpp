#ifndef FLUME_BT_ENGINE_HEADER
#define FLUME_BT_ENGINE_HEADER

#include "download_engine.hpp"
#include "thread_pool.hpp"
#include "settings.hpp"
#include "socket.hpp"
#include "types.hpp"
#include "time.hpp"
#include "log.hpp"

#include <atomic>
#include <memory>
#include <thread>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ssl/context.hpp>

namespace flume {

class torrent;

/**
 * The bundled BitTorrent engine. It runs a network thread, on which the torrent and
 * its peer sessions live, and a thread pool for hashing and disk IO.
 *
 * Mutating calls are posted to the network thread, queries are answered from the
 * torrent's thread-safe state.
 */
class bt_engine final : public download_engine
{
    // Everything below refers to these two, so they are destroyed last.
    asio::io_context ios_;
    std::unique_ptr<asio::ssl::context> ssl_context_;

    engine_settings settings_;
    peer_id_t client_id_;

    thread_pool disk_pool_;
    std::unique_ptr<torrent> torrent_;

    // Bounds the time the stopped announcements may take on close.
    deadline_timer shutdown_timer_;

    asio::executor_work_guard<asio::io_context::executor_type> work_;
    std::thread network_thread_;

    std::atomic<bool> is_added_{false};
    std::atomic<bool> is_closed_{false};

public:
    /**
     * Creates the data directory and starts the engine's threads. Throws a
     * `system_error` with `session_errc::engine_init_failed` if that fails.
     */
    explicit bt_engine(const engine_settings& settings);
    ~bt_engine() override;

    void add_magnet(const std::string& uri) override;
    void add_torrent_file(const std::string& path) override;

    bool has_metadata() const override;
    torrent_layout layout() const override;
    std::string name() const override;
    void download_all() override;
    void set_piece_priority(const piece_index_t piece, const piece_priority p) override;
    bool is_piece_verified(const piece_index_t piece) const override;
    int read_verified_piece(const piece_index_t piece, const int offset,
            view<uint8_t> buffer, error_code& error) override;
    int64_t bytes_completed() const override;
    int64_t total_length() const override;
    int num_pieces() const override;
    int piece_length(const piece_index_t piece) const override;
    int num_connections() const override;
    bool has_failed() const override;
    error_code failure() const override;
    void drop() override;
    void close() override;

    const peer_id_t& client_id() const noexcept { return client_id_; }

private:
    void run();
    void check_can_add();

    template <typename... Args>
    void log(const log::priority priority, const char* format, Args&&... args) const;
};

} // namespace flume

#endif // FLUME_BT_ENGINE_HEADER
