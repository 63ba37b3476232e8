#include "disk_buffer.hpp"

#include <cassert>
#include <new>

namespace flume {

disk_buffer_pool::disk_buffer_pool(const int buffer_size)
    : pool_(buffer_size)
    , buffer_size_(buffer_size)
{}

disk_buffer disk_buffer_pool::allocate(const int size)
{
    assert(size <= buffer_size_);
    void* p = nullptr;
    {
        std::lock_guard<std::mutex> l(mutex_);
        p = pool_.malloc();
    }
    if(p == nullptr) {
        throw std::bad_alloc();
    }
    auto self = shared_from_this();
    std::shared_ptr<uint8_t> data(static_cast<uint8_t*>(p), [self](uint8_t* p) {
        std::lock_guard<std::mutex> l(self->mutex_);
        self->pool_.free(p);
    });
    return disk_buffer(std::move(data), size);
}

} // namespace flume
