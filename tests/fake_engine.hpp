#ifndef FLUME_TESTS_FAKE_ENGINE_HEADER
#define FLUME_TESTS_FAKE_ENGINE_HEADER

#include "download_engine.hpp"
#include "session_error.hpp"
#include "stream_error.hpp"
#include "piece_index.hpp"

#include <algorithm>
#include <atomic>
#include <cstring>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

namespace flume {

/**
 * A deterministic in-memory download engine. The torrent's bytes are a function of
 * their offset, pieces are verified only when a test says so, and every priority
 * change is recorded.
 */
class fake_engine : public download_engine
{
    torrent_layout layout_;
    piece_index index_;
    std::vector<uint8_t> data_;
    std::unique_ptr<std::atomic<bool>[]> verified_;

    std::atomic<bool> has_metadata_{false};
    std::atomic<bool> has_failed_{false};
    std::atomic<int64_t> bytes_completed_{0};

    mutable std::mutex mutex_;
    std::vector<std::pair<piece_index_t, piece_priority>> priority_changes_;

public:
    std::atomic<int> num_download_all_calls{0};
    std::atomic<int> num_drop_calls{0};
    std::atomic<int> num_close_calls{0};
    std::string added_magnet;
    std::string added_torrent_file;
    // Set to make the add_* methods throw.
    error_code add_error;

    explicit fake_engine(torrent_layout layout, const bool has_metadata = true)
        : layout_(std::move(layout))
        , index_(layout_.total_length, layout_.piece_length)
        , data_(size_t(layout_.total_length))
        , verified_(new std::atomic<bool>[layout_.num_pieces])
        , has_metadata_(has_metadata)
    {
        for(size_t i = 0; i < data_.size(); ++i) {
            data_[i] = byte_at(int64_t(i));
        }
        for(auto i = 0; i < layout_.num_pieces; ++i) {
            verified_[i] = false;
        }
    }

    static uint8_t byte_at(const int64_t offset) noexcept
    {
        return uint8_t((offset * 31 + 7) % 251);
    }

    /** A single file torrent of `total_length` bytes. */
    static torrent_layout single_file(const int64_t total_length, const int piece_length,
            const std::string& name = "movie.mp4")
    {
        torrent_layout l;
        l.name = name;
        l.total_length = total_length;
        l.piece_length = piece_length;
        l.num_pieces = piece_index(total_length, piece_length).num_pieces();
        l.files.push_back({name, total_length, 0});
        return l;
    }

    void verify(const piece_index_t piece)
    {
        if(!verified_[piece].exchange(true)) {
            bytes_completed_ += index_.piece_size(piece);
        }
        signal().notify_all();
    }

    void verify_all()
    {
        for(auto i = 0; i < layout_.num_pieces; ++i) {
            verify(i);
        }
    }

    void publish_metadata()
    {
        has_metadata_ = true;
        signal().notify_all();
    }

    void fail()
    {
        has_failed_ = true;
        signal().notify_all();
    }

    std::vector<std::pair<piece_index_t, piece_priority>> priority_changes() const
    {
        std::lock_guard<std::mutex> l(mutex_);
        return priority_changes_;
    }

    int num_priority_changes(const piece_index_t piece) const
    {
        std::lock_guard<std::mutex> l(mutex_);
        return int(std::count_if(priority_changes_.begin(), priority_changes_.end(),
                [piece](const auto& c) { return c.first == piece; }));
    }

    void add_magnet(const std::string& uri) override
    {
        if(add_error) {
            throw system_error(add_error);
        }
        added_magnet = uri;
    }

    void add_torrent_file(const std::string& path) override
    {
        if(add_error) {
            throw system_error(add_error);
        }
        added_torrent_file = path;
    }

    bool has_metadata() const override { return has_metadata_; }
    torrent_layout layout() const override { return layout_; }
    std::string name() const override { return layout_.name; }
    void download_all() override { ++num_download_all_calls; }

    void set_piece_priority(const piece_index_t piece, const piece_priority p) override
    {
        std::lock_guard<std::mutex> l(mutex_);
        priority_changes_.emplace_back(piece, p);
    }

    bool is_piece_verified(const piece_index_t piece) const override
    {
        return verified_[piece];
    }

    int read_verified_piece(const piece_index_t piece, const int offset,
            view<uint8_t> buffer, error_code& error) override
    {
        error.clear();
        if(!verified_[piece]) {
            error = make_error_code(stream_errc::piece_not_verified);
            return 0;
        }
        std::memcpy(buffer.data(), &data_[index_.piece_offset(piece) + offset],
                buffer.size());
        return int(buffer.size());
    }

    int64_t bytes_completed() const override { return bytes_completed_; }
    int64_t total_length() const override
    {
        return has_metadata_ ? layout_.total_length : 0;
    }
    int num_pieces() const override { return layout_.num_pieces; }
    int piece_length(const piece_index_t piece) const override
    {
        return index_.piece_size(piece);
    }
    int num_connections() const override { return 3; }
    bool has_failed() const override { return has_failed_; }

    error_code failure() const override
    {
        return has_failed_ ? make_error_code(session_errc::no_peers) : error_code();
    }

    void drop() override { ++num_drop_calls; }
    void close() override { ++num_close_calls; }
};

} // namespace flume

#endif // FLUME_TESTS_FAKE_ENGINE_HEADER
