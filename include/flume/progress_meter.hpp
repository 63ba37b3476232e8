#ifndef FLUME_PROGRESS_METER_HEADER
#define FLUME_PROGRESS_METER_HEADER

#include "time.hpp"

#include <cstdint>

namespace flume {

struct progress_sample
{
    int64_t bytes_completed = 0;
    int64_t total_length = 0;
    // Completion in [0, 100], 0 while the total length is unknown.
    double percent = 0.0;
    // Bytes per second since the previous sample.
    int64_t download_rate = 0;
};

/**
 * Computes progress and download throughput from periodic samples of the bytes
 * completed. Only the previous sample is retained.
 */
class progress_meter
{
    int64_t prev_bytes_completed_ = 0;

public:
    /** `interval` is the time elapsed since the previous sample. */
    progress_sample sample(const int64_t bytes_completed, const int64_t total_length,
            const duration interval);
};

} // namespace flume

#endif // FLUME_PROGRESS_METER_HEADER
