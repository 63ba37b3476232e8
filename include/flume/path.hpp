#ifndef FLUME_PATH_HEADER
#define FLUME_PATH_HEADER

#include <filesystem>

namespace flume {

using std::filesystem::path;
namespace fs = std::filesystem;

} // namespace flume

#endif // FLUME_PATH_HEADER
