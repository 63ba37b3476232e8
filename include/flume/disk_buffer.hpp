#ifndef FLUME_DISK_BUFFER_HEADER
#define FLUME_DISK_BUFFER_HEADER

#include "view.hpp"

#include <cstdint>
#include <memory>
#include <mutex>

#include <boost/pool/pool.hpp>

namespace flume {

class disk_buffer_pool;

/**
 * A pool allocated buffer holding a piece while it's being assembled from blocks,
 * then hashed and written to disk.
 *
 * It has shared_ptr semantics in that only the destruction of the last copy will
 * free the underlying resource (that is, give back the memory to the allocating
 * pool). Thus, ensuring that the buffer is not written simultaneously is the
 * responsibility of the user. Each buffer keeps its pool alive.
 */
class disk_buffer
{
    std::shared_ptr<uint8_t> data_;
    // Reflects the desired size, which may be less than the pool's chunk size.
    int size_ = 0;

public:
    disk_buffer() = default; // default is invalid buffer
    disk_buffer(std::shared_ptr<uint8_t> data, int size)
        : data_(std::move(data))
        , size_(size)
    {}

    operator bool() const noexcept { return data_ != nullptr; }
    int size() const noexcept { return size_; }
    uint8_t* data() noexcept { return data_.get(); }
    const uint8_t* data() const noexcept { return data_.get(); }
    uint8_t* begin() noexcept { return data(); }
    const uint8_t* begin() const noexcept { return data(); }
    uint8_t* end() noexcept { return data() + size(); }
    const uint8_t* end() const noexcept { return data() + size(); }
};

/**
 * Allocates fixed size buffers of a torrent's piece length. The pool may be used
 * from multiple threads, as buffers are allocated on the network thread but may be
 * released on a disk thread.
 */
class disk_buffer_pool : public std::enable_shared_from_this<disk_buffer_pool>
{
    boost::pool<> pool_;
    std::mutex mutex_;
    int buffer_size_;

public:
    explicit disk_buffer_pool(const int buffer_size);

    int buffer_size() const noexcept { return buffer_size_; }

    /**
     * Returns a buffer of `size` bytes, which must not exceed `buffer_size()`.
     * Throws std::bad_alloc if no memory could be allocated.
     */
    disk_buffer allocate(const int size);
};

} // namespace flume

#endif // FLUME_DISK_BUFFER_HEADER
