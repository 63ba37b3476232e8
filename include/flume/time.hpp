#ifndef FLUME_TIME_HEADER
#define FLUME_TIME_HEADER

#include "error_code.hpp"

#include <chrono>
#include <cstdint>

#include <boost/asio/basic_waitable_timer.hpp>

namespace flume {

using clock = std::chrono::steady_clock;

using time_point = clock::time_point;
using duration = clock::duration;

using std::chrono::hours;
using std::chrono::microseconds;
using std::chrono::milliseconds;
using std::chrono::minutes;
using std::chrono::seconds;

using std::chrono::duration_cast;

using deadline_timer = boost::asio::basic_waitable_timer<clock>;

/**
 * To avoid some of the overhead of system calls when fetching the current time, a
 * cached time_point can be used where accuracy is not instrumental.
 *
 * The engine's network thread updates it once per tick, so it must only be used
 * on that thread.
 */
namespace cached_clock {
time_point now() noexcept;
void update();
}

template <typename Unit>
int64_t to_int(const duration& d)
{
    return duration_cast<Unit>(d).count();
}

inline duration elapsed_since(const time_point& t)
{
    return cached_clock::now() - t;
}

template <typename Duration, typename Handler>
void start_timer(deadline_timer& timer, const Duration& expires_in, Handler handler)
{
    // Setting this cancels pending async waits (which is what we want).
    timer.expires_after(expires_in);
    timer.async_wait(std::move(handler));
}

} // namespace flume

#endif // FLUME_TIME_HEADER
