#ifndef FLUME_PAYLOAD_HEADER
#define FLUME_PAYLOAD_HEADER

#include "endian.hpp"

#include <cstdint>
#include <iterator>
#include <vector>

namespace flume {

/**
 * Used to represent an outgoing raw network message and provides convenient
 * multi-byte integer host to network conversion with builder semantics.
 */
struct payload
{
    std::vector<uint8_t> data;

    payload() = default;

    explicit payload(const int size) { data.reserve(size); }

    payload& u8(const uint8_t h)
    {
        data.emplace_back(h);
        return *this;
    }

    payload& u16(const uint16_t h)
    {
        add_integer<uint16_t>(h);
        return *this;
    }

    payload& i32(const int32_t h)
    {
        add_integer<int32_t>(h);
        return *this;
    }

    payload& u32(const uint32_t h)
    {
        add_integer<uint32_t>(h);
        return *this;
    }

    payload& i64(const int64_t h)
    {
        add_integer<int64_t>(h);
        return *this;
    }

    template <typename InputIt>
    payload& range(InputIt begin, InputIt end)
    {
        data.insert(data.end(), begin, end);
        return *this;
    }

    template <typename Buffer>
    payload& buffer(const Buffer& buffer)
    {
        return range(std::begin(buffer), std::end(buffer));
    }

private:
    template <typename Int>
    void add_integer(Int x)
    {
        const auto pos = data.size();
        data.resize(data.size() + sizeof(Int));
        endian::write_network<Int>(&data[pos], x);
    }
};

} // namespace flume

#endif // FLUME_PAYLOAD_HEADER
