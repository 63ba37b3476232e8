#ifndef FLUME_PEER_SESSION_ERROR_HEADER
#define FLUME_PEER_SESSION_ERROR_HEADER

#include "error_code.hpp"

#include <string>

namespace flume {

/**
 * These are the types of errors that may occur in a peer connection, any of which
 * result in the peer being disconnected.
 */
enum class peer_session_errc
{
    unknown = 1,

    // The info hash sent in the initial handshake was invalid.
    invalid_info_hash,
    // We connected to ourselves.
    duplicate_peer_id,
    torrent_removed,
    both_seeders,

    // We could not set up the connection.
    connect_timeout,
    // The peer has not sent any message in a long time, not even a keepalive message.
    inactivity_timeout,
    // The handshake could not be completed.
    handshake_timeout,
    // Our requests timed out.
    request_timeout,
    // We have too many peers connected.
    too_many_connections,

    // Used anytime the message is larger than what's expected or when the client
    // sent a larger block than what we requested.
    message_too_big,

    // Generic invalid BitTorrent messages.
    invalid_handshake,
    invalid_message_id,
    invalid_choke_message,
    invalid_unchoke_message,
    invalid_interested_message,
    invalid_not_interested_message,
    invalid_have_message,
    invalid_bitfield_message,
    invalid_request_message,
    invalid_block_message,
    invalid_cancel_message,
    invalid_extended_message,

    // The peer sent a metadata piece whose info-hash did not match.
    corrupt_metadata,

    // The peer sent more requests while being choked than allowed.
    sent_requests_when_choked,

    // The peer sent corrupt data.
    corrupt_piece,

    // The peer sent us too many blocks that we didn't request.
    unwanted_blocks
};

struct peer_session_error_category : public error_category
{
    const char* name() const noexcept override { return "peer_session"; }
    std::string message(int env) const override;
    error_condition default_error_condition(int ev) const noexcept override;
};

const peer_session_error_category& peer_session_category();
error_code make_error_code(peer_session_errc e);
error_condition make_error_condition(peer_session_errc e);

} // namespace flume

namespace FLUME_ERROR_CODE_NS {
template <>
struct is_error_code_enum<flume::peer_session_errc> : public std::true_type
{};
}

#endif // FLUME_PEER_SESSION_ERROR_HEADER
