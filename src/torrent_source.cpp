#include "torrent_source.hpp"
#include "session_error.hpp"
#include "string_utils.hpp"
#include "sha1_hasher.hpp"
#include "http.hpp"
#include "settings.hpp"
#include "path.hpp"
#include "log.hpp"

#include <fstream>

#include <boost/asio/io_context.hpp>

namespace flume {

namespace {

constexpr int64_t max_torrent_file_size = 16 * 1024 * 1024;

template <typename... Args>
void log_fetch(const log::priority priority, const char* format, Args&&... args)
{
#ifdef FLUME_ENABLE_LOGGING
    log::log_http("FETCH", util::format(format, std::forward<Args>(args)...), priority);
#endif // FLUME_ENABLE_LOGGING
}

[[noreturn]] void throw_fetch_failed()
{
    throw system_error(make_error_code(session_errc::fetch_failed));
}

} // namespace

torrent_source torrent_source::parse(std::string input)
{
    util::trim(input);
    torrent_source source;
    if(util::istarts_with(input, "magnet:")) {
        source.type = kind::magnet;
    } else if(util::istarts_with(input, "http://") || util::istarts_with(input, "https://")) {
        source.type = kind::url;
    } else {
        source.type = kind::file;
    }
    source.location = std::move(input);
    return source;
}

std::string fetch_torrent_file(
        const std::string& url, const std::string& cache_dir, const seconds timeout)
{
    const path file_path = path(cache_dir)
            / ("flume-" + util::to_hex(create_sha1_digest(std::string_view(url)))
                      + ".torrent");

    std::error_code fs_error;
    if(fs::is_regular_file(file_path, fs_error) && fs::file_size(file_path, fs_error) > 0
            && !fs_error) {
        log_fetch(log::priority::normal, "using cached %s for %s", file_path.c_str(),
                url.c_str());
        return file_path.string();
    }

    asio::io_context ios;
    std::unique_ptr<asio::ssl::context> ssl_context;
    try {
        ssl_context = http::make_client_ssl_context();
    } catch(const system_error& e) {
        log_fetch(log::priority::high, "couldn't set up TLS: %s", e.what());
        throw_fetch_failed();
    }

    error_code error;
    http::get_request::response_type response;
    auto request = std::make_shared<http::get_request>(ios, *ssl_context,
            FLUME_USER_AGENT, timeout, max_torrent_file_size);
    request->start(url, [&error, &response](const error_code& ec,
                                http::get_request::response_type r) {
        error = ec;
        response = std::move(r);
    });
    ios.run();

    if(error) {
        log_fetch(log::priority::high, "GET %s failed: %s", url.c_str(), error.message().c_str());
        throw_fetch_failed();
    }
    if(response.result() != http::status::ok) {
        log_fetch(log::priority::high, "GET %s failed: HTTP %i", url.c_str(),
                response.result_int());
        throw_fetch_failed();
    }
    if(response.body().empty()) {
        log_fetch(log::priority::high, "GET %s returned an empty body", url.c_str());
        throw_fetch_failed();
    }

    fs::create_directories(cache_dir, fs_error);
    // Written under a temporary name, so an interrupted download isn't mistaken for
    // a cached file later.
    path tmp_path = file_path;
    tmp_path += ".part";
    {
        std::ofstream file(tmp_path, std::ios::binary | std::ios::trunc);
        file.write(response.body().data(), response.body().size());
        if(!file) {
            log_fetch(log::priority::high, "couldn't write %s", tmp_path.c_str());
            throw_fetch_failed();
        }
    }
    fs::rename(tmp_path, file_path, fs_error);
    if(fs_error) {
        log_fetch(log::priority::high, "couldn't move %s into place: %s", tmp_path.c_str(),
                fs_error.message().c_str());
        fs::remove(tmp_path, fs_error);
        throw_fetch_failed();
    }
    log_fetch(log::priority::normal, "downloaded %s (%s) to %s", url.c_str(),
            util::to_human_readable_bytes(response.body().size()).c_str(),
            file_path.c_str());
    return file_path.string();
}

} // namespace flume
