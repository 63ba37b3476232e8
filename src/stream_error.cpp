#include "stream_error.hpp"

namespace flume {

std::string stream_error_category::message(int env) const
{
    switch(static_cast<stream_errc>(env)) {
    case stream_errc::out_of_range: return "Read outside the bounds of the file";
    case stream_errc::cancelled: return "Read cancelled";
    case stream_errc::engine_failure: return "Download engine gave up on the torrent";
    case stream_errc::piece_not_verified: return "Piece has not been verified";
    default: return "Unknown stream error";
    }
}

const stream_error_category& stream_category()
{
    static stream_error_category instance;
    return instance;
}

error_code make_error_code(stream_errc e)
{
    return error_code(static_cast<int>(e), stream_category());
}

error_condition make_error_condition(stream_errc e)
{
    return error_condition(static_cast<int>(e), stream_category());
}

} // namespace flume
