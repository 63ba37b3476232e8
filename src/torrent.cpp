#include "torrent.hpp"
#include "peer_session.hpp"
#include "session_error.hpp"
#include "stream_error.hpp"
#include "string_utils.hpp"
#include "sha1_hasher.hpp"
#include "magnet.hpp"
#include "path.hpp"

#include <algorithm>
#include <cassert>

#include <boost/asio/post.hpp>

namespace flume {

namespace {

constexpr int metadata_piece_length = 0x4000;

// Used when the tracker gives no interval.
const seconds default_announce_interval(minutes(30));

const seconds update_interval(1);

// Parses the "host:port" and "[v6]:port" peer addresses of magnet links.
bool parse_peer_address(const std::string& s, tcp::endpoint& ep)
{
    const auto colon = s.rfind(':');
    if(colon == std::string::npos || colon == 0 || colon + 1 == s.size()) {
        return false;
    }
    std::string host = s.substr(0, colon);
    if(host.front() == '[' && host.back() == ']') {
        host = host.substr(1, host.size() - 2);
    }
    int port = 0;
    for(auto i = colon + 1; i < s.size(); ++i) {
        if(s[i] < '0' || s[i] > '9') {
            return false;
        }
        port = port * 10 + (s[i] - '0');
        if(port > 0xffff) {
            return false;
        }
    }
    error_code ec;
    const auto address = asio::ip::make_address(host, ec);
    if(ec || port == 0) {
        return false;
    }
    ep = tcp::endpoint(address, uint16_t(port));
    return true;
}

} // namespace

torrent::torrent(asio::io_context& ios, asio::ssl::context& ssl_context,
        thread_pool& disk_pool, const engine_settings& settings, piece_signal& signal,
        const peer_id_t& client_id)
    : ios_(ios)
    , ssl_context_(ssl_context)
    , disk_pool_(disk_pool)
    , settings_(settings)
    , signal_(signal)
    , client_id_(client_id)
    , update_timer_(ios)
{}

torrent::~torrent() = default;

void torrent::start(metainfo m)
{
    info_hash_ = m.info_hash;
    auto trackers = m.trackers;
    init_metadata(std::move(m));
    start_common(trackers);
}

void torrent::start(const magnet_link& m)
{
    info_hash_ = m.info_hash;
    set_name(m.display_name.empty() ? util::to_hex(m.info_hash) : m.display_name);
    std::vector<tcp::endpoint> peers;
    for(const auto& s : m.peers) {
        tcp::endpoint ep;
        if(parse_peer_address(s, ep)) {
            peers.push_back(ep);
        } else {
            log(log::priority::normal, "ignoring invalid peer address: %s", s.c_str());
        }
    }
    add_peers(peers);
    start_common(m.trackers);
}

void torrent::start_common(const std::vector<std::string>& trackers)
{
    is_started_ = true;
    cached_clock::update();
    last_peer_activity_time_ = cached_clock::now();

    for(const auto& url : trackers) {
        auto t = make_tracker(url, ios_, ssl_context_, settings_);
        if(!t) {
            log(log::priority::normal, "unsupported tracker: %s", url.c_str());
            continue;
        }
        tracker_entry entry;
        entry.tracker = std::move(t);
        trackers_.emplace_back(std::move(entry));
    }

    if(settings_.seed) {
        error_code ec;
        const tcp::endpoint ep(tcp::v4(), uint16_t(settings_.listener_port));
        auto acceptor = std::make_unique<tcp::acceptor>(ios_);
        acceptor->open(ep.protocol(), ec);
        if(!ec) {
            acceptor->set_option(tcp::acceptor::reuse_address(true), ec);
        }
        if(!ec) {
            acceptor->bind(ep, ec);
        }
        if(!ec) {
            acceptor->listen(asio::socket_base::max_listen_connections, ec);
        }
        if(ec) {
            log(log::priority::high, "couldn't listen on port %i: %s",
                    settings_.listener_port, ec.message().c_str());
        } else {
            acceptor_ = std::move(acceptor);
            accept_peer();
        }
    }

    log(log::priority::high, "started (trackers: %i; peers: %i; metadata: %s)",
            int(trackers_.size()), int(available_peers_.size()),
            has_metadata() ? "yes" : "no");
    update();
}

void torrent::init_metadata(metainfo m)
{
    metainfo_ = std::make_unique<metainfo>(std::move(m));
    layout_ = metainfo_->layout();
    set_name(layout_.name);

    piece_picker_ = std::make_unique<piece_picker>(layout_.num_pieces);
    storage_ = std::make_unique<piece_storage>(path(settings_.data_dir), layout_);
    buffer_pool_ = std::make_shared<disk_buffer_pool>(layout_.piece_length);
    verified_pieces_ = std::make_unique<std::atomic<bool>[]>(layout_.num_pieces);

    metadata_buffer_.clear();
    metadata_pieces_.clear();
    metadata_size_ = metainfo_->info.size();

    has_metadata_.store(true, std::memory_order_release);
    signal_.notify_all();

    log(log::priority::high, "metadata: %s (%s in %i pieces of %s, %i files)",
            layout_.name.c_str(), util::to_human_readable_bytes(layout_.total_length).c_str(),
            layout_.num_pieces, util::to_human_readable_bytes(layout_.piece_length).c_str(),
            int(layout_.files.size()));

    // A session may disconnect on finding the peer's stashed availability invalid.
    auto sessions = sessions_;
    for(auto& session : sessions) {
        session->on_metadata_received();
    }
    if(is_download_all_pending_) {
        is_download_all_pending_ = false;
        download_all();
    }
}

void torrent::stop()
{
    if(is_stopped_) {
        return;
    }
    is_stopped_ = true;
    log(log::priority::high, "stopping");

    update_timer_.cancel();
    if(acceptor_) {
        error_code ec;
        acceptor_->close(ec);
    }
    // Sessions remove themselves from the list via on_peer_disconnected.
    auto sessions = sessions_;
    for(auto& session : sessions) {
        session->disconnect(peer_session_errc::torrent_removed);
    }
    sessions_.clear();
    available_peers_.clear();
    announce_all(tracker_request::event_t::stopped);
}

void torrent::stop(std::function<void()> handler)
{
    stopped_handler_ = std::move(handler);
    stop();
    if(num_pending_stop_announces_ == 0) {
        invoke_stopped_handler();
    }
}

void torrent::invoke_stopped_handler()
{
    if(stopped_handler_) {
        auto handler = std::move(stopped_handler_);
        stopped_handler_ = nullptr;
        handler();
    }
}

void torrent::download_all()
{
    if(!has_metadata()) {
        is_download_all_pending_ = true;
        return;
    }
    piece_picker_->want_all();
    for(auto& session : sessions_) {
        session->update_interest();
    }
}

void torrent::set_piece_priority(const piece_index_t piece, const piece_priority p)
{
    if(!has_metadata() || is_stopped_) {
        return;
    }
    assert(piece >= 0 && piece < num_pieces());
    if(piece_picker_->has_piece(piece)) {
        return;
    }
    if(piece_picker_->is_wanted(piece) && piece_picker_->priority(piece) >= p) {
        return;
    }
    piece_picker_->set_priority(piece, p);
    for(auto& session : sessions_) {
        session->update_interest();
    }
}

// -----------
// thread-safe
// -----------

std::string torrent::name() const
{
    std::lock_guard<std::mutex> l(name_mutex_);
    return name_;
}

void torrent::set_name(std::string name)
{
    std::lock_guard<std::mutex> l(name_mutex_);
    name_ = std::move(name);
}

bool torrent::is_piece_verified(const piece_index_t piece) const noexcept
{
    if(!has_metadata() || piece < 0 || piece >= layout_.num_pieces) {
        return false;
    }
    return verified_pieces_[piece].load(std::memory_order_acquire);
}

int torrent::read_verified_piece(const piece_index_t piece, const int offset,
        view<uint8_t> buffer, error_code& error)
{
    if(!is_piece_verified(piece)) {
        error = make_error_code(stream_errc::piece_not_verified);
        return 0;
    }
    return storage_->read(piece, offset, buffer, error);
}

error_code torrent::failure() const
{
    std::lock_guard<std::mutex> l(failure_mutex_);
    return failure_;
}

void torrent::fail(const error_code& error)
{
    if(has_failed()) {
        return;
    }
    {
        std::lock_guard<std::mutex> l(failure_mutex_);
        failure_ = error;
    }
    has_failed_.store(true, std::memory_order_release);
    log(log::priority::high, "giving up: %s", error.message().c_str());
    signal_.notify_all();
    stop();
}

// ------
// update
// ------

void torrent::update()
{
    if(is_stopped_) {
        return;
    }
    cached_clock::update();
    const auto now = cached_clock::now();

    // Ticking may disconnect sessions, which modifies sessions_.
    auto sessions = sessions_;
    for(auto& session : sessions) {
        session->tick();
    }
    if(is_stopped_) {
        return;
    }

    const bool has_connected_peer = std::any_of(sessions_.begin(), sessions_.end(),
            [](const auto& s) { return s->is_connected(); });
    if(has_connected_peer) {
        last_peer_activity_time_ = now;
    }

    const bool is_complete = has_metadata() && piece_picker_->has_all_pieces();
    if(!is_complete && now - last_peer_activity_time_ >= settings_.give_up_timeout) {
        fail(session_errc::no_peers);
        return;
    }

    if(!available_peers_.empty()
            && int(sessions_.size()) < settings_.max_connections) {
        connect_peers();
    }

    for(auto& entry : trackers_) {
        if(entry.is_announcing) {
            continue;
        }
        if(!entry.has_sent_started) {
            if(entry.num_fails == 0 || now - entry.last_announce_time >= entry.interval) {
                announce(entry, tracker_request::event_t::started);
            }
            continue;
        }
        const auto interval = needs_peers() && entry.min_interval > seconds(0)
                ? entry.min_interval
                : entry.interval;
        if(now - entry.last_announce_time >= interval) {
            announce(entry, tracker_request::event_t::none);
        }
    }

    start_timer(update_timer_, update_interval, [this](const error_code& error) {
        if(error != asio::error::operation_aborted) {
            update();
        }
    });
}

bool torrent::needs_peers() const noexcept
{
    return available_peers_.empty()
            && int(sessions_.size()) < settings_.max_connections
            && !(has_metadata() && piece_picker_->has_all_pieces() && !settings_.seed);
}

void torrent::update_num_connections()
{
    num_connections_.store(int(std::count_if(sessions_.begin(), sessions_.end(),
            [](const auto& s) { return s->is_connected(); })));
}

// -----
// peers
// -----

void torrent::connect_peers()
{
    const int num_to_connect = std::min(int(available_peers_.size()),
            settings_.max_connections - int(sessions_.size()));
    if(num_to_connect <= 0) {
        return;
    }
    log(log::priority::low, "connecting %i peer%s", num_to_connect,
            num_to_connect == 1 ? "" : "s");
    for(auto i = 0; i < num_to_connect; ++i) {
        auto session = std::make_shared<peer_session>(ios_, available_peers_.front(), *this);
        available_peers_.pop_front();
        sessions_.push_back(session);
        session->start();
    }
}

void torrent::add_peers(const std::vector<tcp::endpoint>& peers)
{
    int num_new = 0;
    for(const auto& ep : peers) {
        if(known_peers_.insert(ep).second) {
            available_peers_.push_back(ep);
            ++num_new;
        }
    }
    if(num_new > 0) {
        last_peer_activity_time_ = cached_clock::now();
        log(log::priority::normal, "learned of %i new peer%s", num_new,
                num_new == 1 ? "" : "s");
    }
}

void torrent::accept_peer()
{
    acceptor_->async_accept([this](const error_code& error, tcp::socket socket) {
        if(error == asio::error::operation_aborted || is_stopped_) {
            return;
        }
        if(error) {
            log(log::priority::normal, "accept error: %s", error.message().c_str());
        } else if(int(sessions_.size()) >= settings_.max_connections) {
            error_code ec;
            socket.close(ec);
        } else {
            error_code ec;
            const auto ep = socket.remote_endpoint(ec);
            if(!ec) {
                known_peers_.insert(ep);
                auto session = std::make_shared<peer_session>(std::move(socket), *this);
                sessions_.push_back(session);
                session->start();
            }
        }
        accept_peer();
    });
}

uint16_t torrent::listener_port() const noexcept
{
    if(acceptor_) {
        error_code ec;
        const auto ep = acceptor_->local_endpoint(ec);
        if(!ec) {
            return ep.port();
        }
    }
    return settings_.listener_port > 0 ? uint16_t(settings_.listener_port) : 0;
}

void torrent::on_peer_handshake(peer_session& session)
{
    last_peer_activity_time_ = cached_clock::now();
    update_num_connections();
    log(log::priority::low, "peer %s connected (%i connections)",
            session.remote_endpoint().address().to_string().c_str(),
            num_connections());
}

void torrent::on_peer_disconnected(peer_session& session, const error_code& error)
{
    if(!session.is_peer_choked() && num_unchoked_peers_ > 0) {
        --num_unchoked_peers_;
    }
    total_downloaded_bytes_ += session.total_downloaded_payload_bytes();
    total_uploaded_bytes_ += session.total_uploaded_payload_bytes();
    sessions_.erase(std::remove_if(sessions_.begin(), sessions_.end(),
                            [&session](const auto& s) { return s.get() == &session; }),
            sessions_.end());
    update_num_connections();
    log(log::priority::low, "peer %s disconnected: %s",
            session.remote_endpoint().address().to_string().c_str(),
            error.message().c_str());
}

void torrent::on_peer_interested(peer_session& session)
{
    if(settings_.seed && session.is_peer_choked()
            && num_unchoked_peers_ < settings_.max_upload_slots) {
        session.unchoke_peer();
        ++num_unchoked_peers_;
    }
}

void torrent::on_peer_not_interested(peer_session& session)
{
    if(!session.is_peer_choked()) {
        session.choke_peer();
        --num_unchoked_peers_;
    }
}

// ---------------
// piece transfers
// ---------------

int torrent::piece_length(const piece_index_t piece) const noexcept
{
    if(piece == layout_.num_pieces - 1) {
        return layout_.total_length - int64_t(piece) * layout_.piece_length;
    }
    return layout_.piece_length;
}

std::shared_ptr<piece_download> torrent::pick_download(
        const bitfield& available_pieces, const int min_priority)
{
    if(!has_metadata() || is_stopped_) {
        return nullptr;
    }

    // A download another peer started but can't complete on its own.
    std::shared_ptr<piece_download> shared;
    int shared_priority = min_priority;
    for(const auto& entry : downloads_) {
        const auto& download = entry.second;
        const int priority = int(piece_picker_->priority(entry.first));
        if(priority > shared_priority && available_pieces[entry.first]
                && download->can_request()) {
            shared = download;
            shared_priority = priority;
        }
    }

    const piece_index_t piece = piece_picker_->pick(available_pieces);
    if(piece == invalid_piece_index) {
        return shared;
    }
    const int priority = int(piece_picker_->priority(piece));
    if(priority <= shared_priority) {
        piece_picker_->unreserve(piece);
        return shared;
    }

    const int length = piece_length(piece);
    auto download = std::make_shared<piece_download>(
            piece, length, buffer_pool_->allocate(length));
    downloads_.emplace(piece, download);
    log(log::priority::low, "started downloading piece %i (priority %i)", piece, priority);
    return download;
}

void torrent::on_piece_downloaded(std::shared_ptr<piece_download> download)
{
    const piece_index_t piece = download->piece_index();
    downloads_.erase(piece);

    const sha1_hash expected = metainfo_->piece_hashes[piece];
    disk_pool_.post([this, download = std::move(download), expected] {
        const auto& buffer = download->buffer();
        const const_view<uint8_t> data(buffer.data(), size_t(buffer.size()));
        const bool is_good = create_sha1_digest(data) == expected;
        error_code ec;
        if(is_good) {
            storage_->write_piece(download->piece_index(), data, ec);
        }
        asio::post(ios_, [this, download, is_good, ec] {
            on_piece_hashed(download, is_good, ec);
        });
    });
}

void torrent::on_piece_hashed(
        std::shared_ptr<piece_download> download, const bool is_good, const error_code& error)
{
    if(error) {
        log(log::priority::high, "couldn't save piece %i: %s", download->piece_index(),
                error.message().c_str());
        fail(error);
        return;
    }
    if(is_good) {
        handle_valid_piece(*download);
    } else {
        handle_corrupt_piece(*download);
    }
}

void torrent::handle_valid_piece(const piece_download& download)
{
    const piece_index_t piece = download.piece_index();
    verified_pieces_[piece].store(true, std::memory_order_release);
    bytes_completed_.fetch_add(download.piece_length());
    piece_picker_->got(piece);
    signal_.notify_all();

    log(log::priority::normal, "piece %i verified (%i/%i)", piece,
            piece_picker_->num_have_pieces(), num_pieces());

    if(is_stopped_) {
        return;
    }
    for(auto& session : sessions_) {
        session->announce_new_piece(piece);
    }
    if(piece_picker_->has_all_pieces()) {
        log(log::priority::high, "download complete");
        announce_all(tracker_request::event_t::completed);
    }
}

void torrent::handle_corrupt_piece(const piece_download& download)
{
    const piece_index_t piece = download.piece_index();
    log(log::priority::high, "piece %i failed the hash check", piece);
    piece_picker_->unreserve(piece);

    // Without other participants the sole peer is known to have sent bad data.
    if(download.is_exclusive() && !download.participants().empty()) {
        const auto& culprit = download.participants().front();
        auto it = std::find_if(sessions_.begin(), sessions_.end(),
                [&culprit](const auto& s) { return s->remote_endpoint() == culprit; });
        if(it != sessions_.end()) {
            auto session = *it;
            session->disconnect(peer_session_errc::corrupt_piece);
        }
    }
}

void torrent::read_block(const block_info& block,
        std::function<void(const error_code&, std::vector<uint8_t>)> handler)
{
    disk_pool_.post([this, block, handler = std::move(handler)] {
        std::vector<uint8_t> data(block.length);
        error_code ec;
        const int num_read = storage_->read(block.index, block.offset, data, ec);
        if(!ec && num_read != block.length) {
            ec = make_error_code(errc::io_error);
        }
        asio::post(ios_, [handler, ec, data = std::move(data)]() mutable {
            handler(ec, std::move(data));
        });
    });
}

// ---------------------
// metadata exchange
// ---------------------

void torrent::set_metadata_size(const int size)
{
    if(has_metadata() || metadata_size_ > 0 || size <= 0) {
        return;
    }
    metadata_size_ = size;
    metadata_buffer_.assign(size, '\0');
    metadata_pieces_.resize((size + metadata_piece_length - 1) / metadata_piece_length);
    log(log::priority::normal, "metadata size: %i (%i pieces)", size,
            int(metadata_pieces_.size()));
}

int torrent::pick_metadata_piece()
{
    if(has_metadata() || is_stopped_) {
        return -1;
    }
    for(auto i = 0; i < int(metadata_pieces_.size()); ++i) {
        auto& piece = metadata_pieces_[i];
        if(!piece.is_received && !piece.is_requested) {
            piece.is_requested = true;
            piece.request_time = cached_clock::now();
            return i;
        }
    }
    return -1;
}

void torrent::on_metadata_request_failed(const int index)
{
    if(index >= 0 && index < int(metadata_pieces_.size())) {
        metadata_pieces_[index].is_requested = false;
    }
}

void torrent::on_metadata_piece(const int index, const_view<uint8_t> data)
{
    if(has_metadata() || index < 0 || index >= int(metadata_pieces_.size())) {
        return;
    }
    const int offset = index * metadata_piece_length;
    const int expected_length = std::min(metadata_piece_length, metadata_size_ - offset);
    auto& piece = metadata_pieces_[index];
    piece.is_requested = false;
    if(int(data.size()) != expected_length) {
        log(log::priority::normal, "metadata piece %i has invalid length %i", index,
                int(data.size()));
        return;
    }
    std::copy(data.begin(), data.end(), metadata_buffer_.begin() + offset);
    piece.is_received = true;

    const bool is_complete = std::all_of(metadata_pieces_.begin(), metadata_pieces_.end(),
            [](const metadata_piece& p) { return p.is_received; });
    if(!is_complete) {
        return;
    }

    if(create_sha1_digest(std::string_view(metadata_buffer_)) != info_hash_) {
        log(log::priority::high, "received metadata doesn't match info-hash");
        for(auto& p : metadata_pieces_) {
            p.is_received = false;
        }
        return;
    }

    error_code ec;
    metainfo m = parse_info_dict(metadata_buffer_, ec);
    if(ec) {
        log(log::priority::high, "invalid metadata: %s", ec.message().c_str());
        fail(make_error_code(session_errc::invalid_metainfo));
        return;
    }
    init_metadata(std::move(m));
}

// --------
// trackers
// --------

void torrent::announce(tracker_entry& entry, const tracker_request::event_t event)
{
    tracker_request request;
    request.info_hash = info_hash_;
    request.peer_id = client_id_;
    request.port = listener_port();
    request.uploaded = total_uploaded_bytes_;
    request.downloaded = total_downloaded_bytes_;
    // Until metadata arrives the size is unknown, but 0 would make us look like a
    // seed.
    request.left = has_metadata() ? layout_.total_length - bytes_completed()
                                  : metadata_piece_length;
    request.num_want = event == tracker_request::event_t::stopped ? 0 : -1;
    request.event = event;
    request.tracker_id = entry.tracker_id;

    entry.is_announcing = true;
    if(event == tracker_request::event_t::stopped) {
        ++num_pending_stop_announces_;
    }
    log(log::priority::normal, "announcing to %s (event: %i)",
            entry.tracker->url().c_str(), int(event));
    entry.tracker->announce(std::move(request),
            [this, &entry, event](const error_code& error, tracker_response response) {
                on_announce_response(entry, error, std::move(response), event);
            });
}

void torrent::announce_all(const tracker_request::event_t event)
{
    for(auto& entry : trackers_) {
        if(entry.is_announcing || !entry.has_sent_started) {
            continue;
        }
        if(event == tracker_request::event_t::completed && entry.has_sent_completed) {
            continue;
        }
        announce(entry, event);
    }
}

void torrent::on_announce_response(tracker_entry& entry, const error_code& error,
        tracker_response response, const tracker_request::event_t event)
{
    entry.is_announcing = false;
    entry.last_announce_time = cached_clock::now();
    if(event == tracker_request::event_t::stopped) {
        if(--num_pending_stop_announces_ == 0) {
            invoke_stopped_handler();
        }
        return;
    }

    if(error || !response.failure_reason.empty()) {
        ++entry.num_fails;
        entry.last_error = error;
        // Back off exponentially, up to 15 minutes.
        entry.interval = seconds(std::min(15 << std::min(entry.num_fails, 6), 900));
        log(log::priority::normal, "announce to %s failed (%i): %s",
                entry.tracker->url().c_str(), entry.num_fails,
                error ? error.message().c_str() : response.failure_reason.c_str());
        return;
    }

    entry.num_fails = 0;
    entry.last_error.clear();
    if(event == tracker_request::event_t::started) {
        entry.has_sent_started = true;
    } else if(event == tracker_request::event_t::completed) {
        entry.has_sent_completed = true;
    }
    entry.interval = response.interval > seconds(0) ? response.interval
                                                   : default_announce_interval;
    entry.min_interval = response.min_interval;
    if(!response.tracker_id.empty()) {
        entry.tracker_id = std::move(response.tracker_id);
    }
    if(!response.warning_message.empty()) {
        log(log::priority::normal, "tracker warning: %s",
                response.warning_message.c_str());
    }

    log(log::priority::normal, "%s: %i peers (seeders: %i; leechers: %i; interval: %llis)",
            entry.tracker->url().c_str(), int(response.peers.size()),
            response.num_seeders, response.num_leechers,
            (long long)entry.interval.count());
    if(!is_stopped_) {
        add_peers(response.peers);
    }
}

template <typename... Args>
void torrent::log(const log::priority priority, const char* format, Args&&... args) const
{
#ifdef FLUME_ENABLE_LOGGING
    log::log_torrent(name(), util::format(format, std::forward<Args>(args)...), priority);
#endif // FLUME_ENABLE_LOGGING
}

} // namespace flume
