#ifndef FLUME_PRIORITY_SCHEDULER_HEADER
#define FLUME_PRIORITY_SCHEDULER_HEADER

#include "download_engine.hpp"
#include "interval.hpp"
#include "types.hpp"

#include <atomic>
#include <memory>
#include <mutex>

namespace flume {

/**
 * Tracks the priority the streaming core requested for each piece and forwards
 * raises to the download engine.
 *
 * Levels only ever go up (normal < readahead < now): bumping a piece to a level at
 * or below its current one is a no-op, and the engine is told about a piece only
 * when its level actually rose. Raising is an atomic max, so any number of
 * readers may bump concurrently without further locking.
 */
class priority_scheduler
{
    download_engine& engine_;
    int num_pieces_;
    std::unique_ptr<std::atomic<uint8_t>[]> levels_;
    std::once_flag initial_readahead_flag_;

public:
    priority_scheduler(download_engine& engine, const int num_pieces);

    int num_pieces() const noexcept { return num_pieces_; }

    /**
     * Raises every piece in `pieces` to at least `level`. Pieces the engine already
     * verified are skipped. The interval must lie within [0, num_pieces()).
     */
    void bump(const interval pieces, const piece_priority level);

    /**
     * Bumps the first `initial_readahead_length()` pieces to readahead. Only the
     * first call has an effect.
     */
    void initial_readahead();

    piece_priority level(const piece_index_t piece) const noexcept;

    /** ceil(5% of num_pieces), but at least one piece if there are any. */
    static int initial_readahead_length(const int num_pieces) noexcept;
};

} // namespace flume

#endif // FLUME_PRIORITY_SCHEDULER_HEADER
