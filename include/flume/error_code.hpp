#ifndef FLUME_ERROR_CODE_HEADER
#define FLUME_ERROR_CODE_HEADER

#include <boost/system/error_code.hpp>
#include <boost/system/system_error.hpp>

namespace flume {

// Boost.Asio and Boost.Beast report boost::system errors and every subsystem
// shares their types.
using boost::system::error_category;
using boost::system::error_code;
using boost::system::error_condition;
using boost::system::generic_category;
using boost::system::system_category;
using boost::system::system_error;

namespace errc = boost::system::errc;

#define FLUME_ERROR_CODE_NS boost::system

} // namespace flume

#endif // FLUME_ERROR_CODE_HEADER
