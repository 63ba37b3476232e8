#ifndef FLUME_TYPES_HEADER
#define FLUME_TYPES_HEADER

#include <cstdint>
#include <array>

namespace flume {

using piece_index_t = int32_t;
using file_index_t = int;

static constexpr piece_index_t invalid_piece_index = -1;

using sha1_hash = std::array<uint8_t, 20>;
using peer_id_t = sha1_hash;

} // namespace flume

#endif // FLUME_TYPES_HEADER
