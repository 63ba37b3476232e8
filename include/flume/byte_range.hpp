#ifndef FLUME_BYTE_RANGE_HEADER
#define FLUME_BYTE_RANGE_HEADER

#include <cstdint>
#include <string>
#include <string_view>

namespace flume {

/** An inclusive range of bytes in a resource, as in `Range: bytes=first-last`. */
struct byte_range
{
    int64_t first = 0;
    int64_t last = -1;

    int64_t length() const noexcept { return last - first + 1; }
};

enum class range_kind
{
    // No Range header, or one we serve as a whole, e.g. a multi-range request.
    whole,
    // A single satisfiable range.
    partial,
    // A malformed or unsatisfiable range, answered with 416.
    unsatisfiable
};

/**
 * Parses the value of a Range header against a resource of `size` bytes. The
 * forms "bytes=a-b", "bytes=a-" and "bytes=-n" are supported, and the end of a
 * range past the resource is clamped. `range` is only set if `partial` is
 * returned.
 */
range_kind parse_range_header(std::string_view header, const int64_t size,
        byte_range& range);

/** "bytes first-last/size". */
std::string content_range(const byte_range& range, const int64_t size);

// The Content-Range of a 416 response, "bytes */size".
std::string unsatisfied_content_range(const int64_t size);

} // namespace flume

#endif // FLUME_BYTE_RANGE_HEADER
