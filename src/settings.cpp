#include "settings.hpp"

#include <algorithm>
#include <stdexcept>
#include <system_error>
#include <filesystem>
#include <thread>

namespace flume {

template <typename T, typename String>
void throw_if_below(const T& v, const T& min, const String& msg)
{
    if((v != values::none) && (v < min)) {
        throw std::invalid_argument(msg);
    }
}

template <typename T, typename U, typename String>
void throw_if_above(const T& v, const U& max, const String& msg)
{
    if((v != values::none) && (v > max)) {
        throw std::invalid_argument(msg);
    }
}

void fill_in_defaults(settings& s)
{
    using values::none;

    auto set_if_none = [](auto& setting, auto val) {
        if(setting == none) {
            setting = val;
        }
    };

    if(s.engine.data_dir.empty()) {
        std::error_code ec;
        const auto tmp = std::filesystem::temp_directory_path(ec);
        s.engine.data_dir = ec ? std::string("/tmp") : tmp.string();
    }
    set_if_none(s.engine.listener_port, 6881);
    set_if_none(s.engine.max_connections, 50);
    set_if_none(s.engine.max_outgoing_request_queue_size, 16);
    set_if_none(s.engine.disk_io_concurrency,
            std::max(2, int(std::thread::hardware_concurrency())));

    set_if_none(s.stream.readahead_window, 8);

    set_if_none(s.server.port, 8080);
    set_if_none(s.server.concurrency,
            std::max(4, 2 * int(std::thread::hardware_concurrency())));
    set_if_none(s.server.chunk_size, 0x10000);
}

void verify(const settings& s)
{
    throw_if_below(s.engine.listener_port, 1,
            "engine_settings::listener_port must be between 1 and 65535 or none");
    throw_if_above(s.engine.listener_port, 65535,
            "engine_settings::listener_port must be between 1 and 65535 or none");
    throw_if_below(s.engine.max_connections, 1,
            "engine_settings::max_connections must be none or above 0");
    throw_if_below(s.engine.max_upload_slots, 1,
            "engine_settings::max_upload_slots must be above 0");
    throw_if_below(s.engine.max_outgoing_request_queue_size, 1,
            "engine_settings::max_outgoing_request_queue_size must be none or above 0");
    throw_if_below(s.engine.disk_io_concurrency, 1,
            "engine_settings::disk_io_concurrency must be none or above 0");
    if(s.engine.peer_timeout < minutes(2)) {
        throw std::invalid_argument("engine_settings::peer_timeout must be at least 2 minutes");
    }
    if(s.engine.peer_connect_timeout <= seconds(0)
            || s.engine.request_timeout <= seconds(0)
            || s.engine.tracker_timeout <= seconds(0)
            || s.engine.give_up_timeout <= seconds(0)) {
        throw std::invalid_argument("engine_settings timeouts must be positive");
    }
    if(s.engine.client_id_prefix.size() > 20) {
        throw std::invalid_argument(
                "engine_settings::client_id_prefix must be at most 20 characters");
    }

    throw_if_below(s.stream.readahead_window, 0,
            "stream_settings::readahead_window must be none, 0 or more");
    if(s.stream.readiness_threshold < 0.0 || s.stream.readiness_threshold > 1.0) {
        throw std::invalid_argument(
                "stream_settings::readiness_threshold must be in [0, 1]");
    }

    throw_if_below(s.server.port, 0, "server_settings::port must be between 0 and 65535");
    throw_if_above(s.server.port, 65535, "server_settings::port must be between 0 and 65535");
    throw_if_below(s.server.concurrency, 1,
            "server_settings::concurrency must be none or above 0");
    throw_if_below(s.server.chunk_size, 0x1000,
            "server_settings::chunk_size must be none or at least 4KiB");
}

} // namespace flume
