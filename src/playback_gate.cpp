#include "playback_gate.hpp"
#include "download_engine.hpp"

namespace flume {

playback_gate::playback_gate(const download_engine& engine, const double threshold)
    : engine_(engine)
    , threshold_(threshold)
{}

bool playback_gate::ready() const
{
    if(is_open_.load(std::memory_order_acquire)) {
        return true;
    }
    const int64_t total = engine_.total_length();
    if(total <= 0) {
        return false;
    }
    if(double(engine_.bytes_completed()) / double(total) >= threshold_) {
        is_open_.store(true, std::memory_order_release);
        return true;
    }
    return false;
}

} // namespace flume
