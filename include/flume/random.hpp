#ifndef FLUME_RANDOM_HEADER
#define FLUME_RANDOM_HEADER

#include <cstdint>
#include <random>

namespace flume {
namespace util {

/** Each thread has its own engine, seeded from std::random_device. */
std::mt19937& random_engine();

/** Returns a random integer in the range [0, max] or [min, max]. */
int random_int(const int max);
int random_int(const int min, const int max);

/** Fills [first, last) with random bytes. */
template <typename OutputIt>
void random_bytes(OutputIt first, OutputIt last)
{
    std::uniform_int_distribution<int> dist(0, 255);
    while(first != last) {
        *first++ = static_cast<uint8_t>(dist(random_engine()));
    }
}

} // namespace util
} // namespace flume

#endif // FLUME_RANDOM_HEADER
