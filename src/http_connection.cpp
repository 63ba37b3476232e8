#include "http_connection.hpp"
#include "streaming_session.hpp"
#include "content_server.hpp"
#include "session_error.hpp"
#include "stream_error.hpp"
#include "string_utils.hpp"
#include "byte_range.hpp"

#include <algorithm>
#include <string_view>

#include <boost/asio/post.hpp>
#include <boost/asio/write.hpp>

namespace flume {

namespace {

// A keep-alive connection may sit idle for this long between requests.
const seconds idle_timeout(60);

// Writing a header or a chunk of the body may take this long.
const seconds write_timeout(60);

// The most a client may send ahead of the response it is waiting for.
constexpr size_t max_pipelined_bytes = 64 * 1024;

} // namespace

#define SHARED_THIS self = shared_from_this()

http_connection::http_connection(tcp::socket socket, streaming_session& session,
        thread_pool& workers, const server_settings& settings)
    : stream_(std::move(socket))
    , session_(session)
    , workers_(workers)
    , settings_(settings)
{
    error_code ec;
    remote_endpoint_ = stream_.socket().remote_endpoint(ec);
}

void http_connection::start()
{
    log(log::priority::low, "connected");
    read_request();
}

void http_connection::stop()
{
    close();
}

void http_connection::read_request()
{
    if(is_closed_) {
        return;
    }
    request_ = {};
    stream_.expires_after(idle_timeout);
    http::async_read(stream_, buffer_, request_,
            [SHARED_THIS](const error_code& error, size_t) { self->on_request(error); });
}

void http_connection::on_request(const error_code& error)
{
    if(is_closed_) {
        return;
    }
    if(error == http::error::end_of_stream) {
        log(log::priority::low, "client closed the connection");
        close();
        return;
    }
    if(error) {
        log(log::priority::normal, "couldn't read request: %s", error.message().c_str());
        close();
        return;
    }

    const auto method = request_.method_string();
    const auto target = request_.target();
    log(log::priority::normal, "%s %s", std::string(method.data(), method.size()).c_str(),
            std::string(target.data(), target.size()).c_str());

    request_time_ = std::time(nullptr);
    if(request_.method() != http::verb::get && request_.method() != http::verb::head) {
        send_error(http::status::method_not_allowed);
        return;
    }

    cancel_ = std::make_shared<cancel_token>();
    if(reader_) {
        send_header();
    } else {
        open_stream();
    }
}

void http_connection::open_stream()
{
    // Opening waits for the metadata, which may take a while.
    stream_.expires_never();
    is_worker_busy_ = true;
    watch_socket();
    workers_.post([SHARED_THIS, cancel = cancel_] {
        error_code ec;
        auto reader = self->session_.open_stream(cancel.get(), ec);
        asio::post(self->stream_.get_executor(),
                [self, ec, reader = std::move(reader)]() mutable {
                    self->is_worker_busy_ = false;
                    self->on_stream_opened(ec, std::move(reader));
                });
    });
}

void http_connection::on_stream_opened(
        const error_code& error, std::unique_ptr<stream_reader> reader)
{
    if(is_closed_) {
        return;
    }
    if(error) {
        handle_stream_error(error);
        return;
    }
    reader_ = std::move(reader);
    send_header();
}

void http_connection::send_header()
{
    const int64_t size = reader_->size();
    const auto range_header = request_[http::field::range];

    byte_range range;
    const auto kind = parse_range_header(
            std::string_view(range_header.data(), range_header.size()), size, range);
    if(kind == range_kind::unsatisfiable) {
        log(log::priority::normal, "unsatisfiable range: %s",
                std::string(range_header.data(), range_header.size()).c_str());
        send_error(http::status::range_not_satisfiable, unsatisfied_content_range(size));
        return;
    }

    response_ = {};
    response_.version(request_.version());
    response_.set(http::field::server, FLUME_USER_AGENT);
    response_.set(http::field::accept_ranges, "bytes");
    response_.set(http::field::content_type, mime_type(reader_->name()));
    response_.set(http::field::last_modified, http_date(request_time_));
    response_.set(http::field::content_disposition,
            "attachment; filename=\"" + session_.engine().name() + "\"");
    if(kind == range_kind::partial) {
        response_.result(http::status::partial_content);
        response_.set(http::field::content_range, content_range(range, size));
        offset_ = range.first;
        num_bytes_left_ = range.length();
    } else {
        response_.result(http::status::ok);
        offset_ = 0;
        num_bytes_left_ = size;
    }
    response_.content_length(uint64_t(num_bytes_left_));
    response_.keep_alive(request_.keep_alive());

    if(request_.method() == http::verb::head) {
        num_bytes_left_ = 0;
    }

    log(log::priority::normal, "%i (offset: %lli; length: %lli)",
            int(response_.result_int()), (long long)offset_, (long long)num_bytes_left_);

    serializer_ = std::make_unique<http::response_serializer<http::empty_body>>(response_);
    stream_.expires_after(write_timeout);
    http::async_write_header(stream_, *serializer_,
            [SHARED_THIS](const error_code& error, size_t) { self->on_header_sent(error); });
}

void http_connection::on_header_sent(const error_code& error)
{
    if(is_closed_) {
        return;
    }
    if(error) {
        log(log::priority::normal, "couldn't send header: %s", error.message().c_str());
        close();
        return;
    }
    if(num_bytes_left_ == 0) {
        finish_response();
    } else {
        read_chunk();
    }
}

void http_connection::read_chunk()
{
    const int length = int(std::min<int64_t>(settings_.chunk_size, num_bytes_left_));
    chunk_.resize(length);
    // Reads may block until the pieces are downloaded.
    stream_.expires_never();
    is_worker_busy_ = true;
    watch_socket();
    workers_.post([SHARED_THIS, cancel = cancel_, offset = offset_, length] {
        error_code ec;
        const int num_read = self->reader_->read_at(offset,
                view<uint8_t>(self->chunk_.data(), size_t(length)), cancel.get(), ec);
        asio::post(self->stream_.get_executor(), [self, ec, num_read] {
            self->is_worker_busy_ = false;
            self->on_chunk_read(ec, num_read);
        });
    });
}

void http_connection::on_chunk_read(const error_code& error, const int num_bytes_read)
{
    if(is_closed_) {
        return;
    }
    if(error || num_bytes_read <= 0) {
        // The header is out, so all we can do is close the connection.
        if(error == stream_errc::cancelled) {
            log(log::priority::low, "read cancelled");
        } else {
            log(log::priority::high, "read at %lli failed: %s", (long long)offset_,
                    error ? error.message().c_str() : "no bytes read");
        }
        close();
        return;
    }
    stream_.expires_after(write_timeout);
    asio::async_write(stream_, asio::buffer(chunk_.data(), size_t(num_bytes_read)),
            [SHARED_THIS](const error_code& error, size_t num_bytes_sent) {
                self->on_chunk_sent(error, num_bytes_sent);
            });
}

void http_connection::on_chunk_sent(const error_code& error, const size_t num_bytes_sent)
{
    if(is_closed_) {
        return;
    }
    if(error) {
        log(log::priority::low, "couldn't send body: %s", error.message().c_str());
        close();
        return;
    }
    offset_ += num_bytes_sent;
    num_bytes_left_ -= num_bytes_sent;
    if(num_bytes_left_ > 0) {
        read_chunk();
    } else {
        finish_response();
    }
}

void http_connection::finish_response()
{
    serializer_.reset();
    if(response_.keep_alive()) {
        read_request();
    } else {
        close();
    }
}

void http_connection::send_error(const http::status status, const std::string& content_range)
{
    auto response = std::make_shared<http::response<http::string_body>>();
    response->version(request_.version());
    response->result(status);
    response->set(http::field::server, FLUME_USER_AGENT);
    response->set(http::field::content_type, "text/plain; charset=utf-8");
    if(status == http::status::method_not_allowed) {
        response->set(http::field::allow, "GET, HEAD");
    }
    if(!content_range.empty()) {
        response->set(http::field::content_range, content_range);
    }
    if(request_.method() != http::verb::head) {
        const auto reason = http::obsolete_reason(status);
        response->body() = std::string(reason.data(), reason.size()) + '\n';
    }
    response->prepare_payload();
    // Server side failures won't go away by retrying on the same connection.
    response->keep_alive(request_.keep_alive() && int(status) < 500);

    log(log::priority::normal, "%i", int(status));
    stream_.expires_after(write_timeout);
    http::async_write(stream_, *response,
            [SHARED_THIS, response](const error_code& error, size_t) {
                if(error || !response->keep_alive()) {
                    self->close();
                } else {
                    self->read_request();
                }
            });
}

void http_connection::handle_stream_error(const error_code& error)
{
    if(error == stream_errc::cancelled) {
        log(log::priority::low, "request cancelled");
        close();
    } else if(error == stream_errc::out_of_range) {
        send_error(http::status::range_not_satisfiable,
                unsatisfied_content_range(reader_ ? reader_->size() : 0));
    } else if(error == stream_errc::engine_failure || error == session_errc::closed) {
        log(log::priority::high, "stream unavailable: %s", error.message().c_str());
        send_error(http::status::service_unavailable);
    } else {
        log(log::priority::high, "couldn't open stream: %s", error.message().c_str());
        send_error(http::status::internal_server_error);
    }
}

void http_connection::watch_socket()
{
    if(is_watching_socket_ || is_closed_) {
        return;
    }
    is_watching_socket_ = true;
    stream_.socket().async_wait(tcp::socket::wait_read, [SHARED_THIS](const error_code& error) {
        self->is_watching_socket_ = false;
        if(error || self->is_closed_ || !self->is_worker_busy_) {
            return;
        }
        // The socket is readable either because the client sent its next request
        // or because it hung up, only the latter cancels the read.
        auto& socket = self->stream_.socket();
        error_code ec;
        const size_t num_available = socket.available(ec);
        if(!ec && num_available == 0) {
            char c;
            const auto n = socket.receive(asio::buffer(&c, 1), tcp::socket::message_peek, ec);
            if(!ec && n > 0) {
                // data arrived in the meantime
                self->watch_socket();
                return;
            }
            if(!ec) {
                ec = asio::error::eof;
            }
        }
        if(ec) {
            self->log(log::priority::low, "client hung up, cancelling read");
            self->cancel_->cancel();
            return;
        }
        if(self->buffer_.size() + num_available > max_pipelined_bytes) {
            self->log(log::priority::low, "client sent too much ahead, not watching");
            return;
        }
        // The next request is parsed from buffer_, so pull it off the socket to
        // be able to see what follows it.
        const size_t n = socket.receive(self->buffer_.prepare(num_available), 0, ec);
        self->buffer_.commit(n);
        if(ec) {
            self->log(log::priority::low, "client hung up, cancelling read");
            self->cancel_->cancel();
            return;
        }
        self->watch_socket();
    });
}

void http_connection::close()
{
    if(is_closed_) {
        return;
    }
    is_closed_ = true;
    if(cancel_) {
        cancel_->cancel();
    }
    error_code ec;
    stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
    stream_.close();
    log(log::priority::low, "closed");
}

template <typename... Args>
void http_connection::log(
        const log::priority priority, const char* format, Args&&... args) const
{
#ifdef FLUME_ENABLE_LOGGING
    log::log_http(remote_endpoint_.address().to_string() + ':'
                    + std::to_string(remote_endpoint_.port()),
            util::format(format, std::forward<Args>(args)...), priority);
#endif // FLUME_ENABLE_LOGGING
}

#undef SHARED_THIS

} // namespace flume
