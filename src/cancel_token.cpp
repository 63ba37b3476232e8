#include "cancel_token.hpp"

namespace flume {

void cancel_token::cancel()
{
    std::lock_guard<std::mutex> l(mutex_);
    if(is_cancelled_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }
    for(auto& entry : callbacks_) {
        entry.second();
    }
    callbacks_.clear();
}

int cancel_token::subscribe(std::function<void()> callback)
{
    std::lock_guard<std::mutex> l(mutex_);
    if(is_cancelled()) {
        callback();
        return -1;
    }
    const int id = next_id_++;
    callbacks_.emplace(id, std::move(callback));
    return id;
}

void cancel_token::unsubscribe(const int id)
{
    if(id < 0) {
        return;
    }
    std::lock_guard<std::mutex> l(mutex_);
    callbacks_.erase(id);
}

} // namespace flume
