#ifndef FLUME_SETTINGS_HEADER
#define FLUME_SETTINGS_HEADER

#include "time.hpp"
#include "types.hpp"

#include <string>

namespace flume {
namespace values {

constexpr int unlimited = -1;
constexpr int none = -2;

} // values

#define FLUME_CLIENT_ID_PREFIX "-FL0100-"
#define FLUME_USER_AGENT "flume/0.1.0"

/** Settings of the bundled BitTorrent engine. */
struct engine_settings
{
    // Downloaded pieces and cached .torrent files are stored here. Defaults to the
    // operating system's temporary directory.
    std::string data_dir;

    // If set, we upload to peers, accept incoming connections and keep serving the
    // torrent once it's complete. Otherwise we only ever download.
    bool seed = false;

    // The port on which incoming peer connections are accepted when seeding.
    int listener_port = values::none;

    // The maximum number of open peer connections we'll have at any given time.
    int max_connections = values::none;

    // The number of peers we unchoke when seeding.
    int max_upload_slots = 4;

    // The number of outstanding block requests we keep with each peer.
    int max_outgoing_request_queue_size = values::none;

    // The number of threads hashing and writing pieces.
    int disk_io_concurrency = values::none;

    // The number of seconds we wait for a TCP connection and handshake to complete.
    seconds peer_connect_timeout{10};

    // A peer that sends nothing (not even a keep-alive) for this long is
    // disconnected. Must be at least 2 minutes, for that is BitTorrent's keep-alive
    // timeout.
    seconds peer_timeout{minutes{2}};

    // Outstanding requests that yield no block for this long are given back to
    // the picker and the peer is disconnected.
    seconds request_timeout{30};

    seconds tracker_timeout{30};

    // If we had no connected peer and found no new ones for this long, the engine
    // gives up on the torrent and the stream fails with `engine_failure`.
    seconds give_up_timeout{minutes{3}};

    // The first 8 bytes of our peer id, the rest is random.
    std::string client_id_prefix = FLUME_CLIENT_ID_PREFIX;
};

struct stream_settings
{
    // The number of pieces following a read's range that are bumped to readahead.
    int readahead_window = values::none;

    // Completion ratio at which the stream is advertised as ready for playback.
    double readiness_threshold = 0.05;
};

struct server_settings
{
    // The HTTP port the stream is served on.
    int port = 8080;

    // The number of threads reading from streams on behalf of HTTP responses.
    int concurrency = values::none;

    // The number of body bytes read (and written) at a time.
    int chunk_size = values::none;
};

struct settings
{
    // If not empty, log files are written here.
    std::string log_dir;

    engine_settings engine;
    stream_settings stream;
    server_settings server;
};

/** Replaces every `values::none` with the value chosen by flume. */
void fill_in_defaults(settings& s);

/** Throws std::invalid_argument naming the first invalid setting. */
void verify(const settings& s);

} // flume

#endif // FLUME_SETTINGS_HEADER
