#include "time.hpp"

namespace flume {
namespace cached_clock {

static time_point g_cached_time(clock::now());

time_point now() noexcept
{
    return g_cached_time;
}

void update()
{
    g_cached_time = clock::now();
}

} // namespace cached_clock
} // namespace flume
