#include "streaming_session.hpp"
#include "priority_scheduler.hpp"
#include "torrent_source.hpp"
#include "session_error.hpp"
#include "stream_error.hpp"
#include "string_utils.hpp"

#include <exception>
#include <filesystem>

namespace flume {

streaming_session::streaming_session(
        std::unique_ptr<download_engine> engine, const settings& s)
    : settings_(s)
    , engine_(std::move(engine))
    , gate_(*engine_, s.stream.readiness_threshold)
{}

streaming_session::~streaming_session()
{
    close();
}

void streaming_session::start(const torrent_source& source)
{
    if(is_started_) {
        throw system_error(make_error_code(session_errc::torrent_exists));
    }
    if(is_closed_) {
        throw system_error(make_error_code(session_errc::closed));
    }

    switch(source.type) {
    case torrent_source::kind::magnet:
        log(log::priority::normal, "adding magnet: %s", source.location.c_str());
        engine_->add_magnet(source.location);
        break;
    case torrent_source::kind::url:
    {
        log(log::priority::normal, "downloading torrent file: %s", source.location.c_str());
        const auto path = fetch_torrent_file(source.location, settings_.engine.data_dir,
                settings_.engine.tracker_timeout);
        engine_->add_torrent_file(path);
        break;
    }
    case torrent_source::kind::file:
    {
        std::error_code ec;
        if(!std::filesystem::is_regular_file(source.location, ec)) {
            throw system_error(make_error_code(session_errc::file_not_found),
                    source.location);
        }
        log(log::priority::normal, "adding torrent file: %s", source.location.c_str());
        engine_->add_torrent_file(source.location);
        break;
    }
    }

    is_started_ = true;
    metadata_thread_ = std::thread([this] { wait_for_metadata(); });
}

void streaming_session::wait_for_metadata()
{
    error_code error;
    auto layout = engine_->wait_for_metadata(&shutdown_, error);
    if(error) {
        log(log::priority::high, "stopped waiting for metadata: %s",
                error.message().c_str());
        return;
    }

    const auto* largest = largest_file(layout.files);
    if(!largest) {
        log(log::priority::high, "torrent has no files");
        return;
    }

    engine_->download_all();
    auto scheduler = std::make_unique<priority_scheduler>(*engine_, layout.num_pieces);
    scheduler->initial_readahead();
    log(log::priority::normal, "metadata received: '%s', %i pieces, streaming '%s'",
            layout.name.c_str(), layout.num_pieces, largest->path.c_str());

    {
        std::lock_guard<std::mutex> l(mutex_);
        target_ = *largest;
        layout_ = std::move(layout);
        scheduler_ = std::move(scheduler);
    }
    is_published_.store(true, std::memory_order_release);
    engine_->signal().notify_all();
}

std::unique_ptr<stream_reader> streaming_session::open_stream(
        cancel_token* cancel, error_code& error)
{
    error.clear();
    const bool is_ready = engine_->signal().wait(cancel, [this] {
        return is_published() || engine_->has_failed() || is_closed_.load();
    });
    if(is_closed_) {
        error = make_error_code(session_errc::closed);
        return nullptr;
    }
    if(!is_published()) {
        error = make_error_code(
                is_ready ? stream_errc::engine_failure : stream_errc::cancelled);
        return nullptr;
    }
    std::lock_guard<std::mutex> l(mutex_);
    return std::make_unique<stream_reader>(*engine_, *scheduler_, target_,
            layout_.piece_length, settings_.stream.readahead_window);
}

file_entry streaming_session::target() const
{
    std::lock_guard<std::mutex> l(mutex_);
    return target_;
}

std::string streaming_session::stream_name() const
{
    std::lock_guard<std::mutex> l(mutex_);
    return target_.path;
}

session_status streaming_session::status() const
{
    session_status s;
    s.name = engine_->name();
    s.bytes_completed = engine_->bytes_completed();
    s.total_length = engine_->total_length();
    s.num_connections = engine_->num_connections();
    s.has_metadata = engine_->has_metadata();
    s.is_ready = gate_.ready();
    if(engine_->has_failed()) {
        s.failure = engine_->failure();
    }
    return s;
}

void streaming_session::close()
{
    if(is_closed_.exchange(true)) {
        return;
    }
    log(log::priority::normal, "closing session");
    shutdown_.cancel();
    // wake up any open_stream callers
    engine_->signal().notify_all();
    if(metadata_thread_.joinable()) {
        metadata_thread_.join();
    }
    try {
        if(is_started_) {
            engine_->drop();
        }
    } catch(const std::exception& e) {
        log(log::priority::high, "error dropping torrent: %s", e.what());
    }
    try {
        engine_->close();
    } catch(const std::exception& e) {
        log(log::priority::high, "error closing engine: %s", e.what());
    }
}

template <typename... Args>
void streaming_session::log(
        const log::priority priority, const char* format, Args&&... args) const
{
#ifdef FLUME_ENABLE_LOGGING
    log::log_engine("SESSION", util::format(format, std::forward<Args>(args)...), priority);
#endif // FLUME_ENABLE_LOGGING
}

} // namespace flume
