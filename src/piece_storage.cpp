#include "piece_storage.hpp"
#include "stream_error.hpp"
#include "string_utils.hpp"
#include "log.hpp"

#include <algorithm>
#include <cerrno>

#include <fcntl.h>
#include <unistd.h>

namespace flume {

static error_code last_error()
{
    return error_code(errno, system_category());
}

piece_storage::piece_storage(path root, const torrent_layout& layout)
    : root_(std::move(root))
    , index_(layout.total_length, layout.piece_length)
{
    files_.reserve(layout.files.size());
    for(const auto& entry : layout.files) {
        file f;
        f.entry = entry;
        f.absolute_path = root_ / entry.path;
        files_.push_back(std::move(f));
    }
}

piece_storage::~piece_storage()
{
    for(auto& f : files_) {
        if(f.handle != -1) {
            ::close(f.handle);
        }
    }
}

void piece_storage::write_piece(
        const piece_index_t piece, const_view<uint8_t> data, error_code& error)
{
    error.clear();
    if(int(data.size()) != index_.piece_size(piece)) {
        error = make_error_code(errc::invalid_argument);
        return;
    }
    for_each_slice(piece, 0, data.size(), error,
            [this, &data](file& f, const int64_t file_offset, const int buffer_offset,
                    const int length, error_code& error) -> int {
                const int handle = open_file(f, true, error);
                if(error) {
                    return 0;
                }
                int num_written = 0;
                while(num_written < length) {
                    const auto n = ::pwrite(handle, data.data() + buffer_offset + num_written,
                            length - num_written, file_offset + num_written);
                    if(n < 0) {
                        if(errno == EINTR) {
                            continue;
                        }
                        error = last_error();
                        return num_written;
                    }
                    num_written += n;
                }
                return num_written;
            });
    if(error) {
        log(log::priority::high, "failed to write piece %i: %s", piece,
                error.message().c_str());
    }
}

int piece_storage::read(const piece_index_t piece, const int offset,
        view<uint8_t> buffer, error_code& error)
{
    error.clear();
    if(offset < 0 || offset + int(buffer.size()) > index_.piece_size(piece)) {
        error = make_error_code(stream_errc::out_of_range);
        return 0;
    }
    return for_each_slice(piece, offset, buffer.size(), error,
            [this, &buffer](file& f, const int64_t file_offset, const int buffer_offset,
                    const int length, error_code& error) -> int {
                const int handle = open_file(f, false, error);
                if(error) {
                    return 0;
                }
                int num_read = 0;
                while(num_read < length) {
                    const auto n = ::pread(handle, buffer.data() + buffer_offset + num_read,
                            length - num_read, file_offset + num_read);
                    if(n < 0) {
                        if(errno == EINTR) {
                            continue;
                        }
                        error = last_error();
                        return num_read;
                    } else if(n == 0) {
                        // the file is shorter than what was written to it
                        error = make_error_code(errc::io_error);
                        return num_read;
                    }
                    num_read += n;
                }
                return num_read;
            });
}

template <typename Function>
int piece_storage::for_each_slice(const piece_index_t piece, const int offset,
        const int length, error_code& error, Function fn)
{
    const int64_t begin = index_.piece_offset(piece) + offset;
    const int64_t end = begin + length;
    int num_transferred = 0;
    for(auto& f : files_) {
        const int64_t file_begin = f.entry.offset;
        const int64_t file_end = file_begin + f.entry.length;
        if(file_end <= begin || f.entry.length == 0) {
            continue;
        }
        if(file_begin >= end) {
            break;
        }
        const int64_t slice_begin = std::max(begin, file_begin);
        const int64_t slice_end = std::min(end, file_end);
        num_transferred += fn(f, slice_begin - file_begin, int(slice_begin - begin),
                int(slice_end - slice_begin), error);
        if(error) {
            break;
        }
    }
    return num_transferred;
}

int piece_storage::open_file(file& f, const bool create, error_code& error)
{
    std::lock_guard<std::mutex> l(files_mutex_);
    if(f.handle != -1) {
        return f.handle;
    }
    if(create) {
        std::error_code ec;
        fs::create_directories(f.absolute_path.parent_path(), ec);
        if(ec) {
            error = error_code(ec.value(), system_category());
            return -1;
        }
    }
    const int flags = create ? (O_RDWR | O_CREAT) : O_RDWR;
    const int handle = ::open(f.absolute_path.c_str(), flags, 0644);
    if(handle == -1) {
        error = last_error();
        return -1;
    }
    if(create) {
        // sparse allocation, so that reads of any written range succeed
        if(::ftruncate(handle, f.entry.length) == -1) {
            error = last_error();
            ::close(handle);
            return -1;
        }
    }
    f.handle = handle;
    log(log::priority::low, "opened %s", f.absolute_path.c_str());
    return handle;
}

template <typename... Args>
void piece_storage::log(const log::priority priority, const char* format, Args&&... args) const
{
#ifdef FLUME_ENABLE_LOGGING
    log::log_disk_io("STORAGE", util::format(format, std::forward<Args>(args)...), priority);
#endif // FLUME_ENABLE_LOGGING
}

} // namespace flume
