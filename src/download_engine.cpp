#include "download_engine.hpp"
#include "stream_error.hpp"

namespace flume {

const file_entry* largest_file(const std::vector<file_entry>& files) noexcept
{
    const file_entry* largest = nullptr;
    for(const auto& file : files) {
        if(!largest || file.length > largest->length) {
            largest = &file;
        }
    }
    return largest;
}

torrent_layout download_engine::wait_for_metadata(cancel_token* cancel, error_code& error)
{
    error.clear();
    const bool is_ready = signal().wait(
            cancel, [this] { return has_metadata() || has_failed(); });
    if(is_ready && has_metadata()) {
        return layout();
    }
    error = make_error_code(
            is_ready ? stream_errc::engine_failure : stream_errc::cancelled);
    return {};
}

} // namespace flume
