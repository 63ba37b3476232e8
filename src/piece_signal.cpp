#include "piece_signal.hpp"

namespace flume {

void piece_signal::notify_all()
{
    // Taking the mutex orders this notification after any waiter that has tested
    // its predicate but not yet gone to sleep.
    {
        std::lock_guard<std::mutex> l(mutex_);
    }
    cv_.notify_all();
}

} // namespace flume
