#ifndef FLUME_STREAM_ERROR_HEADER
#define FLUME_STREAM_ERROR_HEADER

#include "error_code.hpp"

#include <string>

namespace flume {

/** Errors a read through a `stream_reader` may end with. */
enum class stream_errc
{
    // The requested offset (or offset + length) lies outside the file. Requests are
    // rejected, never clamped.
    out_of_range = 1,
    // The caller's cancel_token fired while the read was waiting for pieces.
    cancelled,
    // The download engine gave up on the torrent; pieces will never arrive.
    engine_failure,
    // Storage was asked for bytes of a piece that has not passed verification.
    piece_not_verified
};

struct stream_error_category : public error_category
{
    const char* name() const noexcept override { return "stream"; }
    std::string message(int env) const override;
};

const stream_error_category& stream_category();
error_code make_error_code(stream_errc e);
error_condition make_error_condition(stream_errc e);

} // namespace flume

namespace FLUME_ERROR_CODE_NS {
template <>
struct is_error_code_enum<flume::stream_errc> : public std::true_type
{};
}

#endif // FLUME_STREAM_ERROR_HEADER
