#include "bt_engine.hpp"
#include "session_error.hpp"
#include "string_utils.hpp"
#include "metainfo.hpp"
#include "torrent.hpp"
#include "magnet.hpp"
#include "random.hpp"
#include "http.hpp"
#include "path.hpp"

#include <algorithm>

#include <boost/asio/post.hpp>

namespace flume {

namespace {

// How long the 'stopped' announcements may take before the engine shuts down.
const seconds shutdown_grace_period(2);

peer_id_t create_client_id(const std::string& prefix)
{
    peer_id_t id;
    const auto n = std::min(prefix.size(), id.size());
    std::copy(prefix.begin(), prefix.begin() + n, id.begin());
    util::random_bytes(id.begin() + n, id.end());
    return id;
}

// Errors from the parsers are reported under the session category.
error_code to_session_error(const error_code& error, const session_errc fallback)
{
    if(error.category() == session_category()) {
        return error;
    }
    return make_error_code(fallback);
}

} // namespace

bt_engine::bt_engine(const engine_settings& settings)
    : settings_(settings)
    , client_id_(create_client_id(settings.client_id_prefix))
    , disk_pool_(settings.disk_io_concurrency)
    , shutdown_timer_(ios_)
    , work_(asio::make_work_guard(ios_))
{
    std::error_code ec;
    fs::create_directories(settings_.data_dir, ec);
    if(ec) {
        log(log::priority::high, "couldn't create data directory %s: %s",
                settings_.data_dir.c_str(), ec.message().c_str());
        throw system_error(make_error_code(session_errc::engine_init_failed));
    }
    try {
        ssl_context_ = http::make_client_ssl_context();
    } catch(const system_error& e) {
        log(log::priority::high, "couldn't set up TLS: %s", e.what());
        throw system_error(make_error_code(session_errc::engine_init_failed));
    }
    torrent_ = std::make_unique<torrent>(
            ios_, *ssl_context_, disk_pool_, settings_, signal(), client_id_);
    network_thread_ = std::thread([this] { run(); });
    log(log::priority::normal, "engine started (data dir: %s)", settings_.data_dir.c_str());
}

bt_engine::~bt_engine()
{
    close();
}

void bt_engine::run()
{
    for(;;) {
        try {
            ios_.run();
            break;
        } catch(const std::exception& e) {
            log(log::priority::high, "exception on network thread: %s", e.what());
        }
    }
}

void bt_engine::check_can_add()
{
    if(is_closed_.load()) {
        throw system_error(make_error_code(session_errc::closed));
    }
    if(is_added_.exchange(true)) {
        throw system_error(make_error_code(session_errc::torrent_exists));
    }
}

void bt_engine::add_magnet(const std::string& uri)
{
    error_code ec;
    magnet_link m = parse_magnet(uri, ec);
    if(ec) {
        throw system_error(to_session_error(ec, session_errc::invalid_magnet));
    }
    check_can_add();
    log(log::priority::normal, "adding magnet %s", util::to_hex(m.info_hash).c_str());
    asio::post(ios_, [this, m = std::move(m)] { torrent_->start(m); });
}

void bt_engine::add_torrent_file(const std::string& path)
{
    error_code ec;
    metainfo m = read_metainfo_file(path, ec);
    if(ec) {
        throw system_error(to_session_error(ec, session_errc::invalid_metainfo));
    }
    check_can_add();
    log(log::priority::normal, "adding torrent %s", m.name.c_str());
    asio::post(ios_, [this, m = std::move(m)]() mutable { torrent_->start(std::move(m)); });
}

bool bt_engine::has_metadata() const
{
    return torrent_->has_metadata();
}

torrent_layout bt_engine::layout() const
{
    if(!has_metadata()) {
        return {};
    }
    return torrent_->layout();
}

std::string bt_engine::name() const
{
    return torrent_->name();
}

void bt_engine::download_all()
{
    asio::post(ios_, [this] { torrent_->download_all(); });
}

void bt_engine::set_piece_priority(const piece_index_t piece, const piece_priority p)
{
    asio::post(ios_, [this, piece, p] { torrent_->set_piece_priority(piece, p); });
}

bool bt_engine::is_piece_verified(const piece_index_t piece) const
{
    return torrent_->is_piece_verified(piece);
}

int bt_engine::read_verified_piece(const piece_index_t piece, const int offset,
        view<uint8_t> buffer, error_code& error)
{
    return torrent_->read_verified_piece(piece, offset, buffer, error);
}

int64_t bt_engine::bytes_completed() const
{
    return torrent_->bytes_completed();
}

int64_t bt_engine::total_length() const
{
    return has_metadata() ? torrent_->layout().total_length : 0;
}

int bt_engine::num_pieces() const
{
    return has_metadata() ? torrent_->num_pieces() : 0;
}

int bt_engine::piece_length(const piece_index_t piece) const
{
    return has_metadata() ? torrent_->piece_length(piece) : 0;
}

int bt_engine::num_connections() const
{
    return torrent_->num_connections();
}

bool bt_engine::has_failed() const
{
    return torrent_->has_failed();
}

error_code bt_engine::failure() const
{
    return torrent_->failure();
}

void bt_engine::drop()
{
    if(is_closed_.load()) {
        return;
    }
    asio::post(ios_, [this] { torrent_->stop(); });
}

void bt_engine::close()
{
    if(is_closed_.exchange(true)) {
        return;
    }
    log(log::priority::normal, "shutting down");
    asio::post(ios_, [this] {
        start_timer(shutdown_timer_, shutdown_grace_period, [this](const error_code& error) {
            if(error != asio::error::operation_aborted) {
                log(log::priority::normal, "trackers didn't answer in time");
                ios_.stop();
            }
        });
        torrent_->stop([this] {
            shutdown_timer_.cancel();
            ios_.stop();
        });
    });
    work_.reset();
    if(network_thread_.joinable()) {
        network_thread_.join();
    }
    disk_pool_.clear_pending_jobs();
    disk_pool_.join();
    log(log::priority::normal, "engine closed");
}

template <typename... Args>
void bt_engine::log(const log::priority priority, const char* format, Args&&... args) const
{
#ifdef FLUME_ENABLE_LOGGING
    log::log_engine("ENGINE", util::format(format, std::forward<Args>(args)...), priority);
#endif // FLUME_ENABLE_LOGGING
}

} // namespace flume
