#include "stream_reader.hpp"
#include "priority_scheduler.hpp"
#include "cancel_token.hpp"
#include "string_utils.hpp"
#include "stream_error.hpp"
#include "log.hpp"

#include <algorithm>

namespace flume {

stream_reader::stream_reader(download_engine& engine, priority_scheduler& scheduler,
        file_entry file, const int piece_length, const int readahead_window)
    : engine_(engine)
    , scheduler_(scheduler)
    , file_(std::move(file))
    , piece_length_(piece_length)
    , readahead_window_(std::max(0, readahead_window))
    , file_pieces_(piece_index(file_.offset + file_.length, piece_length)
                           .file_pieces(file_.offset, file_.length))
{}

int stream_reader::read_at(const int64_t offset, view<uint8_t> buffer,
        cancel_token* cancel, error_code& error)
{
    error.clear();
    if((offset < 0) || (offset >= size())) {
        error = make_error_code(stream_errc::out_of_range);
        return 0;
    }
    if(buffer.empty()) {
        return 0;
    }

    const int64_t length = std::min<int64_t>(buffer.size(), size() - offset);
    const auto span = locate(file_.offset, file_.length, piece_length_, offset, length, error);
    if(error) {
        return 0;
    }
    log(read_state::computing, "[%lli, %lli) -> pieces [%i, %i]", (long long)offset,
            (long long)(offset + length),
            span.first_piece, span.last_piece);

    scheduler_.bump(span.pieces(), piece_priority::now);
    const interval ahead(span.last_piece + 1,
            std::min(span.last_piece + 1 + readahead_window_, file_pieces_.end));
    if(!ahead.empty()) {
        scheduler_.bump(ahead, piece_priority::readahead);
    }

    if(!are_all_verified(span)) {
        log(read_state::waiting, "waiting for pieces [%i, %i]", span.first_piece,
                span.last_piece);
        const bool is_ready = engine_.signal().wait(cancel, [this, &span] {
            return are_all_verified(span) || engine_.has_failed();
        });
        if(!are_all_verified(span)) {
            if(is_ready) {
                error = make_error_code(stream_errc::engine_failure);
            } else {
                error = make_error_code(stream_errc::cancelled);
            }
            log(read_state::done, "read at %lli aborted: %s", (long long)offset,
                    error.message().c_str());
            return 0;
        }
    }

    log(read_state::copying, "copying %lli bytes", (long long)length);
    const int num_copied = copy(offset, span, buffer.subview(0, length), error);
    if(error) {
        return 0;
    }
    last_read_end_.store(offset + num_copied, std::memory_order_relaxed);
    log(read_state::done, "read [%lli, %lli)", (long long)offset,
            (long long)(offset + num_copied));
    return num_copied;
}

int stream_reader::read(view<uint8_t> buffer, cancel_token* cancel, error_code& error)
{
    error.clear();
    if(cursor_ >= size()) {
        return 0;
    }
    const int num_read = read_at(cursor_, buffer, cancel, error);
    cursor_ += num_read;
    return num_read;
}

int64_t stream_reader::seek(const int64_t offset, const origin origin, error_code& error)
{
    error.clear();
    int64_t base = 0;
    switch(origin) {
    case origin::begin: base = 0; break;
    case origin::current: base = cursor_; break;
    case origin::end: base = size(); break;
    }
    const int64_t position = base + offset;
    if(position < 0) {
        error = make_error_code(stream_errc::out_of_range);
        return cursor_;
    }
    cursor_ = position;
    return cursor_;
}

bool stream_reader::are_all_verified(const piece_span& span) const
{
    for(auto piece = span.first_piece; piece <= span.last_piece; ++piece) {
        if(!engine_.is_piece_verified(piece)) {
            return false;
        }
    }
    return true;
}

int stream_reader::copy(const int64_t offset, const piece_span& span,
        view<uint8_t> buffer, error_code& error)
{
    int num_copied = 0;
    for(auto piece = span.first_piece; piece <= span.last_piece; ++piece) {
        const int begin = piece == span.first_piece ? span.first_offset : 0;
        const int end = piece == span.last_piece ? span.last_end
                                                 : engine_.piece_length(piece);
        const int n = engine_.read_verified_piece(
                piece, begin, buffer.subview(num_copied, end - begin), error);
        if(error) {
            log(read_state::copying, "failed to copy piece %i for read at %lli: %s",
                    piece, (long long)offset, error.message().c_str());
            return 0;
        }
        num_copied += n;
    }
    return num_copied;
}

template <typename... Args>
void stream_reader::log(const read_state state, const char* format, Args&&... args) const
{
#ifdef FLUME_ENABLE_LOGGING
    const auto header = [state]() -> std::string {
        switch(state) {
        case read_state::computing: return "COMPUTING";
        case read_state::waiting: return "WAITING";
        case read_state::copying: return "COPYING";
        case read_state::done: return "DONE";
        default: return "";
        }
    }();
    log::log_stream(file_.path + '|' + header,
            util::format(format, std::forward<Args>(args)...), log::priority::low);
#endif // FLUME_ENABLE_LOGGING
}

} // namespace flume
