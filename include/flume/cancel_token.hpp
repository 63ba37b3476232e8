#ifndef FLUME_CANCEL_TOKEN_HEADER
#define FLUME_CANCEL_TOKEN_HEADER

#include <functional>
#include <atomic>
#include <mutex>
#include <map>

namespace flume {

/**
 * Lets one party abort another's blocking wait. The content server creates one per
 * response and cancels it when the client goes away, which wakes only the waits
 * that were started with this token.
 *
 * Cancellation is one way: once cancelled, a token stays cancelled.
 */
class cancel_token
{
    std::atomic<bool> is_cancelled_{false};

    // Callbacks are invoked with this held so that `unsubscribe` returning
    // guarantees the callback is not running and will not run.
    mutable std::mutex mutex_;
    std::map<int, std::function<void()>> callbacks_;
    int next_id_ = 0;

public:
    cancel_token() = default;
    cancel_token(const cancel_token&) = delete;
    cancel_token& operator=(const cancel_token&) = delete;

    bool is_cancelled() const noexcept
    {
        return is_cancelled_.load(std::memory_order_acquire);
    }

    /** Marks the token cancelled and invokes every subscribed callback once. */
    void cancel();

    /**
     * Registers a callback to be invoked on cancellation and returns an id with which
     * it can be removed. If the token is already cancelled, the callback is invoked
     * right away and -1 is returned.
     */
    int subscribe(std::function<void()> callback);
    void unsubscribe(const int id);
};

} // namespace flume

#endif // FLUME_CANCEL_TOKEN_HEADER
