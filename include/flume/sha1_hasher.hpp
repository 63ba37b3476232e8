#ifndef FLUME_SHA1_HASHER_HEADER
#define FLUME_SHA1_HASHER_HEADER

#include "types.hpp"
#include "view.hpp"

#include <string_view>

#include <openssl/sha.h>

namespace flume {

/**
 * This class is used to verify pieces and metadata using the SHA-1 hashing
 * algorithm.
 *
 * The entire piece that is to be hashed need not be kept in memory, it can be hashed
 * incrementally by feeding the hasher with blocks using the update() method. When all
 * blocks have been hashed, use the finish() method to return the final SHA-1 digest.
 */
class sha1_hasher
{
    SHA_CTX context_;

public:
    sha1_hasher();

    void reset();

    sha1_hasher& update(const_view<uint8_t> buffer);
    sha1_hasher& update(std::string_view buffer);

    sha1_hash finish();
};

/**
 * This is a convenience method for when update would be called only once because all
 * the data is available.
 */
template <typename Buffer>
sha1_hash create_sha1_digest(const Buffer& buffer)
{
    sha1_hasher hasher;
    hasher.update(buffer);
    return hasher.finish();
}

} // namespace flume

#endif // FLUME_SHA1_HASHER_HEADER
