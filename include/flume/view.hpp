#ifndef FLUME_VIEW_HEADER
#define FLUME_VIEW_HEADER

#include <array>
#include <cstddef>
#include <stdexcept>
#include <type_traits>
#include <vector>

namespace flume {

/**
 * A non-owning pointer and length pair over contiguous memory, used wherever a
 * caller lends a buffer (reader output, received blocks, message payloads).
 */
template <typename T>
struct view
{
    using value_type = T;
    using size_type = size_t;
    using pointer = value_type*;
    using reference = value_type&;
    using iterator = pointer;

private:
    pointer data_ = nullptr;
    size_type length_ = 0;

public:
    view() = default;
    constexpr view(pointer data, size_type length) : data_(data), length_(length) {}
    constexpr view(pointer begin, pointer end) : data_(begin), length_(end - begin) {}

    template <typename U,
            typename = typename std::enable_if<std::is_convertible<U*, T*>::value>::type>
    constexpr view(const view<U>& other) : data_(other.data()), length_(other.size())
    {}

    template <typename U, size_type N>
    constexpr view(std::array<U, N>& arr) : data_(arr.data()), length_(N)
    {}

    template <typename U, size_type N>
    constexpr view(const std::array<U, N>& arr) : data_(arr.data()), length_(N)
    {}

    template <typename U>
    view(std::vector<U>& v) : data_(v.data()), length_(v.size())
    {}

    template <typename U>
    view(const std::vector<U>& v) : data_(v.data()), length_(v.size())
    {}

    constexpr size_type size() const noexcept { return length_; }
    constexpr bool empty() const noexcept { return length_ == 0; }
    constexpr pointer data() const noexcept { return data_; }

    constexpr iterator begin() const noexcept { return data_; }
    constexpr iterator end() const noexcept { return data_ + length_; }

    constexpr reference operator[](const size_type i) const noexcept { return data_[i]; }

    view subview(const size_type offset) const
    {
        if(offset > size()) {
            throw std::out_of_range("tried to create a subview that is larger than view");
        }
        return {data_ + offset, size() - offset};
    }

    view subview(const size_type offset, const size_type count) const
    {
        if((offset > size()) || (offset + count > size())) {
            throw std::out_of_range("tried to create a subview that is larger than view");
        }
        return {data_ + offset, count};
    }

    void trim_front(const size_type n)
    {
        if(n > size()) {
            throw std::out_of_range("tried to trim more from front of view than its size");
        }
        data_ += n;
        length_ -= n;
    }
};

template <typename T>
using const_view = view<const T>;

} // namespace flume

#endif // FLUME_VIEW_HEADER
