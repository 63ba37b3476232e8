#ifndef FLUME_TORRENT_HEADER
#define FLUME_TORRENT_HEADER

#include "download_engine.hpp"
#include "piece_download.hpp"
#include "piece_storage.hpp"
#include "piece_picker.hpp"
#include "piece_signal.hpp"
#include "disk_buffer.hpp"
#include "thread_pool.hpp"
#include "error_code.hpp"
#include "block_info.hpp"
#include "metainfo.hpp"
#include "settings.hpp"
#include "tracker.hpp"
#include "log.hpp"
#include "socket.hpp"
#include "types.hpp"
#include "time.hpp"

#include <atomic>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include <boost/asio/ssl/context.hpp>

namespace flume {

class peer_session;
struct magnet_link;

/**
 * A single torrent download: it announces to trackers, connects to peers, fetches
 * the metadata if started from a magnet link, and downloads, verifies and stores
 * pieces in the order set by the piece picker.
 *
 * Unless noted otherwise, methods must only be called on the network thread (the
 * thread running the io_context). The methods under "thread-safe" may be called
 * from any thread; they back `bt_engine`'s `download_engine` interface.
 */
class torrent
{
    asio::io_context& ios_;
    asio::ssl::context& ssl_context_;

    // Hashing and disk writes are executed here.
    thread_pool& disk_pool_;

    const engine_settings& settings_;
    piece_signal& signal_;

    peer_id_t client_id_;
    sha1_hash info_hash_;

    // Until metadata is known this is the magnet link's display name or the hex
    // info-hash.
    std::string name_;
    mutable std::mutex name_mutex_;

    // -- metadata --
    // Set exactly once, before has_metadata_ is published; immutable afterwards.

    std::unique_ptr<metainfo> metainfo_;
    torrent_layout layout_;
    std::unique_ptr<piece_storage> storage_;
    std::atomic<bool> has_metadata_{false};

    // Each piece's verified flag. These are set after the piece's hash matched and
    // it was written to disk.
    std::unique_ptr<std::atomic<bool>[]> verified_pieces_;
    std::atomic<int64_t> bytes_completed_{0};

    std::unique_ptr<piece_picker> piece_picker_;
    std::shared_ptr<disk_buffer_pool> buffer_pool_;

    // Pieces being downloaded, shared by the peer_sessions that download them.
    std::map<piece_index_t, std::shared_ptr<piece_download>> downloads_;

    // -- metadata exchange (BEP 9) --

    struct metadata_piece
    {
        bool is_received = false;
        time_point request_time;
        bool is_requested = false;
    };
    std::string metadata_buffer_;
    std::vector<metadata_piece> metadata_pieces_;
    int metadata_size_ = 0;

    // -- peers --

    std::vector<std::shared_ptr<peer_session>> sessions_;
    std::deque<tcp::endpoint> available_peers_;
    // Every endpoint we've ever learned of, so we don't connect to the same peer
    // twice.
    std::set<tcp::endpoint> known_peers_;
    std::unique_ptr<tcp::acceptor> acceptor_;
    std::atomic<int> num_connections_{0};
    int num_unchoked_peers_ = 0;

    std::vector<tracker_entry> trackers_;
    // The 'stopped' announcements still awaiting a response.
    int num_pending_stop_announces_ = 0;
    std::function<void()> stopped_handler_;

    deadline_timer update_timer_;

    // The last time we had a connected peer or learned of new peers.
    time_point last_peer_activity_time_;

    int64_t total_uploaded_bytes_ = 0;
    int64_t total_downloaded_bytes_ = 0;

    // Set via download_all before metadata is known.
    bool is_download_all_pending_ = false;
    bool is_stopped_ = false;
    bool is_started_ = false;

    // Once set, the torrent has given up and is stopped.
    std::atomic<bool> has_failed_{false};
    error_code failure_;
    mutable std::mutex failure_mutex_;

public:
    torrent(asio::io_context& ios, asio::ssl::context& ssl_context,
            thread_pool& disk_pool, const engine_settings& settings,
            piece_signal& signal, const peer_id_t& client_id);
    ~torrent();

    torrent(const torrent&) = delete;
    torrent& operator=(const torrent&) = delete;

    /**
     * Starts the torrent from a parsed .torrent file or magnet link. These may be
     * called before the io_context is run.
     */
    void start(metainfo m);
    void start(const magnet_link& m);

    /** Sends 'stopped' to trackers and disconnects all peers. */
    void stop();

    /**
     * Like `stop()`, and invokes `handler` once every 'stopped' announcement has
     * been answered, which may be right away. Also works after `stop()`.
     */
    void stop(std::function<void()> handler);

    void download_all();
    void set_piece_priority(const piece_index_t piece, const piece_priority p);

    // -- thread-safe --

    bool has_metadata() const noexcept { return has_metadata_.load(std::memory_order_acquire); }
    /** Only valid once `has_metadata()` returns true. */
    const torrent_layout& layout() const noexcept { return layout_; }
    std::string name() const;
    bool is_piece_verified(const piece_index_t piece) const noexcept;
    int read_verified_piece(const piece_index_t piece, const int offset,
            view<uint8_t> buffer, error_code& error);
    int64_t bytes_completed() const noexcept { return bytes_completed_.load(); }
    int num_connections() const noexcept { return num_connections_.load(); }
    bool has_failed() const noexcept { return has_failed_.load(std::memory_order_acquire); }
    error_code failure() const;

    // -- peer_session facing --

    const sha1_hash& info_hash() const noexcept { return info_hash_; }
    const peer_id_t& client_id() const noexcept { return client_id_; }
    const engine_settings& settings() const noexcept { return settings_; }
    bool is_stopped() const noexcept { return is_stopped_; }
    int num_pieces() const noexcept { return layout_.num_pieces; }
    int piece_length(const piece_index_t piece) const noexcept;
    piece_picker& picker() noexcept { return *piece_picker_; }
    uint16_t listener_port() const noexcept;

    /**
     * Returns a download (in progress or new) of a piece that `available_pieces`
     * has with a priority higher than `min_priority` (-1 meaning any priority), or
     * nullptr if there is none.
     */
    std::shared_ptr<piece_download> pick_download(
            const bitfield& available_pieces, const int min_priority);

    /** Hashes and saves a completed download. */
    void on_piece_downloaded(std::shared_ptr<piece_download> download);

    /** Reads a block for uploading to a peer on the disk thread pool. */
    void read_block(const block_info& block,
            std::function<void(const error_code&, std::vector<uint8_t>)> handler);

    void on_peer_handshake(peer_session& session);
    void on_peer_disconnected(peer_session& session, const error_code& error);
    void on_peer_interested(peer_session& session);
    void on_peer_not_interested(peer_session& session);

    /** The size announced by a peer, accepted only if none is known yet. */
    void set_metadata_size(const int size);
    int metadata_size() const noexcept { return metadata_size_; }

    /** Returns the index of the next metadata piece to request, or -1. */
    int pick_metadata_piece();
    void on_metadata_piece(const int index, const_view<uint8_t> data);
    void on_metadata_request_failed(const int index);

    /** The raw info dictionary, only valid once metadata is known. */
    const std::string& metadata() const noexcept { return metainfo_->info; }

private:
    void start_common(const std::vector<std::string>& trackers);
    void init_metadata(metainfo m);

    void update();
    void connect_peers();
    void add_peers(const std::vector<tcp::endpoint>& peers);
    void accept_peer();

    void announce(tracker_entry& entry, const tracker_request::event_t event);
    void on_announce_response(tracker_entry& entry, const error_code& error,
            tracker_response response, const tracker_request::event_t event);
    void announce_all(const tracker_request::event_t event);
    void invoke_stopped_handler();
    bool needs_peers() const noexcept;
    void update_num_connections();

    void on_piece_hashed(std::shared_ptr<piece_download> download, const bool is_good,
            const error_code& error);
    void handle_valid_piece(const piece_download& download);
    void handle_corrupt_piece(const piece_download& download);

    void fail(const error_code& error);
    void set_name(std::string name);

    template <typename... Args>
    void log(const log::priority priority, const char* format, Args&&... args) const;
};

} // namespace flume

#endif // FLUME_TORRENT_HEADER
