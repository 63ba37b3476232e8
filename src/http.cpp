#include "http.hpp"
#include "string_utils.hpp"
#include "log.hpp"

#include <boost/asio/post.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/asio/ssl/error.hpp>

#include <openssl/err.h>
#include <openssl/ssl.h>

namespace flume {
namespace http {

bool parse_url(const std::string& s, url& out)
{
    const auto scheme_end = s.find("://");
    if(scheme_end == std::string::npos || scheme_end == 0) {
        return false;
    }
    url result;
    result.scheme = s.substr(0, scheme_end);
    util::to_lower(result.scheme);

    const auto authority_begin = scheme_end + 3;
    auto authority_end = s.find_first_of("/?#", authority_begin);
    if(authority_end == std::string::npos) {
        authority_end = s.size();
    }
    std::string authority = s.substr(authority_begin, authority_end - authority_begin);
    // Strip user info.
    const auto at = authority.rfind('@');
    if(at != std::string::npos) {
        authority.erase(0, at + 1);
    }

    if(!authority.empty() && authority.front() == '[') {
        // IPv6 literal
        const auto bracket_end = authority.find(']');
        if(bracket_end == std::string::npos) {
            return false;
        }
        result.host = authority.substr(1, bracket_end - 1);
        if(bracket_end + 1 < authority.size()) {
            if(authority[bracket_end + 1] != ':') {
                return false;
            }
            result.port = authority.substr(bracket_end + 2);
        }
    } else {
        const auto colon = authority.rfind(':');
        if(colon != std::string::npos) {
            result.host = authority.substr(0, colon);
            result.port = authority.substr(colon + 1);
        } else {
            result.host = authority;
        }
    }
    if(result.host.empty()) {
        return false;
    }
    if(!result.port.empty()) {
        const bool is_numeric = std::all_of(result.port.begin(), result.port.end(),
                [](char c) { return c >= '0' && c <= '9'; });
        if(!is_numeric || result.port.size() > 5 || std::stoi(result.port) > 65535) {
            return false;
        }
    } else if(result.scheme == "http") {
        result.port = "80";
    } else if(result.scheme == "https") {
        result.port = "443";
    }

    if(authority_end < s.size() && s[authority_end] == '/') {
        result.target = s.substr(authority_end);
    } else {
        result.target = "/" + s.substr(authority_end);
    }
    // The fragment is never sent.
    const auto fragment = result.target.find('#');
    if(fragment != std::string::npos) {
        result.target.erase(fragment);
    }
    out = std::move(result);
    return true;
}

get_request::get_request(asio::io_context& ios, asio::ssl::context& ssl_context,
        std::string user_agent, duration timeout, int64_t body_limit)
    : resolver_(ios)
    , ssl_context_(ssl_context)
    , user_agent_(std::move(user_agent))
    , timeout_(timeout)
    , body_limit_(body_limit)
{}

void get_request::start(const std::string& target_url, handler_type handler)
{
    handler_ = std::move(handler);
    if(!parse_url(target_url, url_)
            || (url_.scheme != "http" && url_.scheme != "https")) {
        log("invalid url: %s", target_url.c_str());
        auto self = shared_from_this();
        asio::post(resolver_.get_executor(),
                [self] { self->finish(asio::error::invalid_argument); });
        return;
    }
    resolve();
}

void get_request::abort()
{
    auto self = shared_from_this();
    asio::post(resolver_.get_executor(), [self] {
        if(self->is_aborted_) {
            return;
        }
        self->is_aborted_ = true;
        self->resolver_.cancel();
        self->close_stream();
        self->finish(asio::error::operation_aborted);
    });
}

void get_request::resolve()
{
    log("resolving %s:%s", url_.host.c_str(), url_.port.c_str());
    resolver_.async_resolve(url_.host, url_.port,
            [self = shared_from_this()](
                    const error_code& error, tcp::resolver::results_type results) {
                self->on_resolved(error, std::move(results));
            });
}

void get_request::on_resolved(const error_code& error, tcp::resolver::results_type results)
{
    if(is_aborted_) {
        return;
    }
    if(error) {
        finish(error);
        return;
    }

    auto executor = resolver_.get_executor();
    if(url_.scheme == "https") {
        ssl_stream_ = std::make_unique<boost::beast::ssl_stream<boost::beast::tcp_stream>>(
                executor, ssl_context_);
        // SNI
        if(!SSL_set_tlsext_host_name(ssl_stream_->native_handle(), url_.host.c_str())) {
            finish(error_code(static_cast<int>(::ERR_get_error()),
                    asio::error::get_ssl_category()));
            return;
        }
        ssl_stream_->set_verify_callback(asio::ssl::host_name_verification(url_.host));
    } else {
        plain_stream_ = std::make_unique<boost::beast::tcp_stream>(executor);
    }

    lowest_layer().expires_after(timeout_);
    lowest_layer().async_connect(results,
            [self = shared_from_this()](const error_code& error, const tcp::endpoint&) {
                self->on_connected(error);
            });
}

void get_request::on_connected(const error_code& error)
{
    if(is_aborted_) {
        return;
    }
    if(error) {
        finish(error);
        return;
    }
    if(ssl_stream_) {
        lowest_layer().expires_after(timeout_);
        ssl_stream_->async_handshake(asio::ssl::stream_base::client,
                [self = shared_from_this()](const error_code& error) {
                    if(self->is_aborted_) {
                        return;
                    }
                    if(error) {
                        self->finish(error);
                        return;
                    }
                    self->send_request();
                });
    } else {
        send_request();
    }
}

void get_request::send_request()
{
    request_ = {};
    request_.version(11);
    request_.method(verb::get);
    request_.target(url_.target);
    if((url_.scheme == "http" && url_.port == "80")
            || (url_.scheme == "https" && url_.port == "443")) {
        request_.set(field::host, url_.host);
    } else {
        request_.set(field::host, url_.host + ':' + url_.port);
    }
    request_.set(field::user_agent, user_agent_);
    request_.set(field::connection, "close");

    parser_ = std::make_unique<response_parser<string_body>>();
    parser_->body_limit(uint64_t(body_limit_));
    buffer_.consume(buffer_.size());

    log("GET %s", url_.target.c_str());

    auto on_written = [self = shared_from_this()](const error_code& error, size_t) {
        if(self->is_aborted_) {
            return;
        }
        if(error) {
            self->finish(error);
            return;
        }
        auto on_read = [self](const error_code& error, size_t) { self->on_response(error); };
        self->lowest_layer().expires_after(self->timeout_);
        if(self->ssl_stream_) {
            boost::beast::http::async_read(*self->ssl_stream_, self->buffer_, *self->parser_, std::move(on_read));
        } else {
            boost::beast::http::async_read(*self->plain_stream_, self->buffer_, *self->parser_,
                    std::move(on_read));
        }
    };

    lowest_layer().expires_after(timeout_);
    if(ssl_stream_) {
        async_write(*ssl_stream_, request_, std::move(on_written));
    } else {
        async_write(*plain_stream_, request_, std::move(on_written));
    }
}

void get_request::on_response(const error_code& ec)
{
    if(is_aborted_) {
        return;
    }
    if(ec) {
        finish(ec);
        return;
    }
    response_type response = parser_->release();
    close_stream();

    const auto status = response.result_int();
    log("%u response, %lli body bytes", status, (long long)response.body().size());

    const bool is_redirect = status == 301 || status == 302 || status == 303
            || status == 307 || status == 308;
    if(is_redirect && response.find(field::location) != response.end()) {
        if(++num_redirects_ > max_redirects) {
            log("too many redirects");
            finish(make_error_code(error::bad_target));
            return;
        }
        const std::string location(response[field::location]);
        if(!location.empty() && location.front() == '/') {
            url_.target = location;
        } else if(!parse_url(location, url_)
                || (url_.scheme != "http" && url_.scheme != "https")) {
            log("invalid redirect location: %s", location.c_str());
            finish(make_error_code(error::bad_target));
            return;
        }
        log("redirected to %s://%s:%s%s", url_.scheme.c_str(), url_.host.c_str(),
                url_.port.c_str(), url_.target.c_str());
        resolve();
        return;
    }

    finish(error_code(), std::move(response));
}

void get_request::close_stream()
{
    if(plain_stream_ || ssl_stream_) {
        error_code ec;
        lowest_layer().socket().shutdown(tcp::socket::shutdown_both, ec);
        lowest_layer().close();
    }
    plain_stream_.reset();
    ssl_stream_.reset();
}

void get_request::finish(const error_code& error, response_type response)
{
    if(!handler_) {
        return;
    }
    if(error) {
        close_stream();
        log("error: %s", error.message().c_str());
    }
    // Release the handler before calling it so that it may start another request.
    auto handler = std::move(handler_);
    handler_ = nullptr;
    handler(error, std::move(response));
}

boost::beast::tcp_stream& get_request::lowest_layer()
{
    if(ssl_stream_) {
        return ssl_stream_->next_layer();
    }
    return *plain_stream_;
}

template <typename... Args>
void get_request::log(const char* format, Args&&... args) const
{
#ifdef FLUME_ENABLE_LOGGING
    log::log_http(url_.host, util::format(format, std::forward<Args>(args)...));
#endif // FLUME_ENABLE_LOGGING
}

std::unique_ptr<asio::ssl::context> make_client_ssl_context()
{
    auto context = std::make_unique<asio::ssl::context>(asio::ssl::context::tls_client);
    context->set_default_verify_paths();
    context->set_verify_mode(asio::ssl::verify_peer);
    return context;
}

} // namespace http
} // namespace flume
