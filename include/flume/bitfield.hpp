#ifndef FLUME_BITFIELD_HEADER
#define FLUME_BITFIELD_HEADER

#include "view.hpp"

#include <cstdint>
#include <vector>

namespace flume {

/**
 * The piece availability map of a peer (or of ourselves), in the layout of the
 * BitTorrent 'bitfield' message: the highest bit of the first byte is piece 0, and
 * the spare bits at the end of the last byte are always zero.
 */
class bitfield
{
    std::vector<uint8_t> bytes_;
    int num_bits_ = 0;

public:
    bitfield() = default;
    explicit bitfield(const int num_bits)
        : bytes_(num_bytes_for(num_bits), 0)
        , num_bits_(num_bits)
    {}

    /**
     * Validates a received bitfield: it must be exactly as long as needed for
     * `num_bits` and its spare bits must be zero.
     */
    static bool is_raw_bitfield_valid(const_view<uint8_t> bytes, const int num_bits) noexcept
    {
        if(int(bytes.size()) != num_bytes_for(num_bits)) {
            return false;
        }
        const int num_spare = bytes.size() * 8 - num_bits;
        if(num_spare == 0) {
            return true;
        }
        const uint8_t spare_mask = (1 << num_spare) - 1;
        return (bytes[bytes.size() - 1] & spare_mask) == 0;
    }

    /** The caller must have validated `bytes` via `is_raw_bitfield_valid`. */
    static bitfield from_raw(const_view<uint8_t> bytes, const int num_bits)
    {
        bitfield b(num_bits);
        for(size_t i = 0; i < b.bytes_.size(); ++i) {
            b.bytes_[i] = bytes[i];
        }
        return b;
    }

    static constexpr int num_bytes_for(const int num_bits) noexcept
    {
        return (num_bits + 7) / 8;
    }

    int size() const noexcept { return num_bits_; }
    const std::vector<uint8_t>& data() const noexcept { return bytes_; }

    bool operator[](const int bit) const noexcept
    {
        return (bytes_[bit / 8] & mask(bit)) != 0;
    }

    bitfield& set(const int bit) noexcept
    {
        bytes_[bit / 8] |= mask(bit);
        return *this;
    }

    bitfield& reset(const int bit) noexcept
    {
        bytes_[bit / 8] &= ~mask(bit);
        return *this;
    }

    /** Sets every bit. */
    bitfield& fill() noexcept
    {
        for(auto i = 0; i < num_bits_; ++i) {
            set(i);
        }
        return *this;
    }

    int count() const noexcept
    {
        int n = 0;
        for(auto i = 0; i < num_bits_; ++i) {
            n += (*this)[i];
        }
        return n;
    }

    bool are_all_set() const noexcept { return count() == num_bits_; }
    bool are_none_set() const noexcept { return count() == 0; }

private:
    static constexpr uint8_t mask(const int bit) noexcept
    {
        return uint8_t(0x80 >> (bit % 8));
    }
};

} // namespace flume

#endif // FLUME_BITFIELD_HEADER
