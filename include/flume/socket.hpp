#ifndef FLUME_SOCKET_HEADER
#define FLUME_SOCKET_HEADER

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ip/udp.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/write.hpp>

namespace flume {

namespace asio = boost::asio;

using asio::async_read;
using asio::async_write;
using asio::ip::tcp;
using asio::ip::udp;

} // namespace flume

#endif // FLUME_SOCKET_HEADER
