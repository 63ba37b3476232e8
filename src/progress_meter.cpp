#include "progress_meter.hpp"

#include <algorithm>

namespace flume {

progress_sample progress_meter::sample(const int64_t bytes_completed,
        const int64_t total_length, const duration interval)
{
    progress_sample s;
    s.bytes_completed = bytes_completed;
    s.total_length = total_length;
    if(total_length > 0) {
        s.percent = 100.0 * double(bytes_completed) / double(total_length);
    }
    const auto ms = to_int<milliseconds>(interval);
    if(ms > 0) {
        const int64_t delta = std::max<int64_t>(0, bytes_completed - prev_bytes_completed_);
        s.download_rate = delta * 1000 / ms;
    }
    prev_bytes_completed_ = bytes_completed;
    return s;
}

} // namespace flume
