#ifndef FLUME_PLAYBACK_GATE_HEADER
#define FLUME_PLAYBACK_GATE_HEADER

#include <atomic>

namespace flume {

class download_engine;

/**
 * Tells whether enough of the torrent is downloaded to advertise the stream:
 * completed bytes must reach `threshold` (5% by default) of the torrent's total
 * length. Once open the gate stays open for the rest of the session.
 */
class playback_gate
{
    const download_engine& engine_;
    double threshold_;
    mutable std::atomic<bool> is_open_{false};

public:
    explicit playback_gate(const download_engine& engine, const double threshold = 0.05);

    /** Safe to call from any thread. Returns false while the total length is 0. */
    bool ready() const;
};

} // namespace flume

#endif // FLUME_PLAYBACK_GATE_HEADER
