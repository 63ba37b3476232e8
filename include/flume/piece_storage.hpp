#ifndef FLUME_PIECE_STORAGE_HEADER
#define FLUME_PIECE_STORAGE_HEADER

#include "download_engine.hpp"
#include "piece_index.hpp"
#include "error_code.hpp"
#include "path.hpp"
#include "view.hpp"
#include "log.hpp"

#include <cstdint>
#include <mutex>
#include <vector>

namespace flume {

/**
 * Stores a torrent's pieces in its files under a root directory. A piece may span
 * several files, in which case it's split along file boundaries.
 *
 * Files are created (sparse) on first write. Reads and writes of distinct pieces
 * may run concurrently from any thread.
 */
class piece_storage
{
    struct file
    {
        file_entry entry;
        path absolute_path;
        // -1 until opened.
        int handle = -1;
    };

    path root_;
    piece_index index_;
    std::vector<file> files_;

    // Guards opening file handles; I/O on open handles is positional and needs no
    // locking.
    std::mutex files_mutex_;

public:
    piece_storage(path root, const torrent_layout& layout);
    ~piece_storage();

    piece_storage(const piece_storage&) = delete;
    piece_storage& operator=(const piece_storage&) = delete;

    const path& root() const noexcept { return root_; }
    const piece_index& index() const noexcept { return index_; }

    /** Writes a complete piece. `data` must be exactly as long as the piece. */
    void write_piece(const piece_index_t piece, const_view<uint8_t> data, error_code& error);

    /**
     * Reads `buffer.size()` bytes of a piece, starting `offset` bytes into the piece.
     * Returns the number of bytes read.
     */
    int read(const piece_index_t piece, const int offset, view<uint8_t> buffer,
            error_code& error);

private:
    template <typename Function>
    int for_each_slice(const piece_index_t piece, const int offset, const int length,
            error_code& error, Function fn);

    int open_file(file& f, const bool create, error_code& error);

    template <typename... Args>
    void log(const log::priority priority, const char* format, Args&&... args) const;
};

} // namespace flume

#endif // FLUME_PIECE_STORAGE_HEADER
