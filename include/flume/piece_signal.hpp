#ifndef FLUME_PIECE_SIGNAL_HEADER
#define FLUME_PIECE_SIGNAL_HEADER

#include "cancel_token.hpp"

#include <condition_variable>
#include <mutex>

namespace flume {

/**
 * A broadcast signal the download engine raises whenever its observable state
 * changes: a piece got verified, metadata arrived or the engine gave up.
 *
 * Waiters re-check their own predicate on every wakeup, so any number of readers
 * waiting on different (possibly overlapping) piece ranges can share it.
 *
 * Lock order: a cancel_token's mutex may be held while notifying (the token invokes
 * its callbacks under its mutex), so waiters subscribe to and unsubscribe from
 * their token outside of this signal's mutex.
 */
class piece_signal
{
    std::mutex mutex_;
    std::condition_variable cv_;

public:
    /**
     * Wakes all waiters. The state change that waiters test for must be published
     * before calling this.
     */
    void notify_all();

    /**
     * Blocks until `predicate` holds or `cancel` (which may be null) is cancelled.
     * Returns the final value of `predicate`, so a satisfied predicate wins over a
     * concurrent cancellation. There is no timeout.
     */
    template <typename Predicate>
    bool wait(cancel_token* cancel, Predicate predicate);
};

template <typename Predicate>
bool piece_signal::wait(cancel_token* cancel, Predicate predicate)
{
    const int subscription = cancel ? cancel->subscribe([this] { notify_all(); }) : -1;
    bool is_satisfied = false;
    {
        std::unique_lock<std::mutex> l(mutex_);
        cv_.wait(l, [&] {
            is_satisfied = predicate();
            return is_satisfied || (cancel && cancel->is_cancelled());
        });
    }
    if(cancel) {
        cancel->unsubscribe(subscription);
    }
    return is_satisfied;
}

} // namespace flume

#endif // FLUME_PIECE_SIGNAL_HEADER
