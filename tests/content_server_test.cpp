#include <gtest/gtest.h>

#include "content_server.hpp"
#include "streaming_session.hpp"
#include "torrent_source.hpp"
#include "fake_engine.hpp"
#include "http.hpp"

#include <chrono>
#include <future>
#include <string>
#include <thread>

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>

using namespace flume;

namespace {

struct content_server_fixture : public ::testing::Test
{
    fake_engine* engine = nullptr;
    std::unique_ptr<streaming_session> session;
    std::unique_ptr<content_server> server;

    asio::io_context ios;
    tcp::socket socket{ios};
    http::flat_buffer buffer;

    void SetUp() override
    {
        settings s;
        fill_in_defaults(s);
        s.server.port = 0;
        auto e = std::make_unique<fake_engine>(fake_engine::single_file(1000, 64));
        engine = e.get();
        engine->verify_all();
        session = std::make_unique<streaming_session>(std::move(e), s);
        session->start(torrent_source::parse(
                "magnet:?xt=urn:btih:c12fe1c06bba254a9dc9f519b335aa7c1367a88a"));
        server = std::make_unique<content_server>(*session, s.server);
        server->start();
        socket.connect(tcp::endpoint(asio::ip::make_address("127.0.0.1"), server->port()));
    }

    void TearDown() override
    {
        error_code ec;
        socket.close(ec);
        server->stop();
        session->close();
    }

    http::response<http::string_body> send(http::verb method, const std::string& range = {})
    {
        http::request<http::empty_body> request(method, "/movie.mp4", 11);
        request.set(http::field::host, "localhost");
        if(!range.empty()) {
            request.set(http::field::range, range);
        }
        http::write(socket, request);

        http::response_parser<http::string_body> parser;
        parser.body_limit(1 << 20);
        if(method == http::verb::head) {
            parser.skip(true);
        }
        http::read(socket, buffer, parser);
        return parser.release();
    }

    static std::string torrent_bytes(const int64_t offset, const int64_t length)
    {
        std::string s;
        for(auto i = offset; i < offset + length; ++i) {
            s += char(fake_engine::byte_at(i));
        }
        return s;
    }
};

} // namespace

TEST_F(content_server_fixture, whole_file)
{
    const auto response = send(http::verb::get);
    EXPECT_EQ(response.result(), http::status::ok);
    EXPECT_EQ(response[http::field::accept_ranges], "bytes");
    EXPECT_EQ(response[http::field::content_type], "video/mp4");
    EXPECT_EQ(response[http::field::content_length], "1000");
    EXPECT_EQ(response[http::field::content_disposition],
            "attachment; filename=\"movie.mp4\"");
    EXPECT_FALSE(response[http::field::last_modified].empty());
    EXPECT_EQ(response.body(), torrent_bytes(0, 1000));
}

TEST_F(content_server_fixture, partial_content_over_keep_alive)
{
    auto response = send(http::verb::get, "bytes=100-199");
    EXPECT_EQ(response.result(), http::status::partial_content);
    EXPECT_EQ(response[http::field::content_range], "bytes 100-199/1000");
    EXPECT_EQ(response.body(), torrent_bytes(100, 100));

    response = send(http::verb::get, "bytes=-10");
    EXPECT_EQ(response.result(), http::status::partial_content);
    EXPECT_EQ(response[http::field::content_range], "bytes 990-999/1000");
    EXPECT_EQ(response.body(), torrent_bytes(990, 10));
}

TEST_F(content_server_fixture, head_sends_no_body)
{
    const auto response = send(http::verb::head, "bytes=0-9");
    EXPECT_EQ(response.result(), http::status::partial_content);
    EXPECT_EQ(response[http::field::content_length], "10");
    EXPECT_TRUE(response.body().empty());
}

TEST_F(content_server_fixture, unsatisfiable_range)
{
    const auto response = send(http::verb::get, "bytes=1000-");
    EXPECT_EQ(response.result(), http::status::range_not_satisfiable);
    EXPECT_EQ(response[http::field::content_range], "bytes */1000");
}

TEST_F(content_server_fixture, other_methods_are_not_allowed)
{
    const auto response = send(http::verb::post);
    EXPECT_EQ(response.result(), http::status::method_not_allowed);
    EXPECT_EQ(response[http::field::allow], "GET, HEAD");
}

TEST(content_server, hang_up_behind_next_request_cancels_read)
{
    settings s;
    fill_in_defaults(s);
    s.server.port = 0;
    // a single worker, so a read left blocking starves every other request
    s.server.concurrency = 1;
    auto e = std::make_unique<fake_engine>(fake_engine::single_file(1000, 64));
    auto& engine = *e;
    for(auto piece = 0; piece < 15; ++piece) {
        engine.verify(piece);
    }
    streaming_session session(std::move(e), s);
    session.start(torrent_source::parse(
            "magnet:?xt=urn:btih:c12fe1c06bba254a9dc9f519b335aa7c1367a88a"));
    content_server server(session, s.server);
    server.start();
    const tcp::endpoint endpoint(asio::ip::make_address("127.0.0.1"), server.port());

    asio::io_context ios;
    tcp::socket client(ios);
    client.connect(endpoint);
    http::request<http::empty_body> request(http::verb::get, "/movie.mp4", 11);
    request.set(http::field::host, "localhost");
    // the last piece is missing, so the body read blocks
    request.set(http::field::range, "bytes=960-999");
    http::write(client, request);
    http::flat_buffer buffer;
    http::response_parser<http::string_body> parser;
    http::read_header(client, buffer, parser);
    EXPECT_EQ(parser.get().result(), http::status::partial_content);

    request.set(http::field::range, "bytes=0-9");
    http::write(client, request);
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    client.close();

    auto next = std::async(std::launch::async, [&endpoint] {
        asio::io_context ios;
        tcp::socket socket(ios);
        socket.connect(endpoint);
        http::request<http::empty_body> request(http::verb::get, "/movie.mp4", 11);
        request.set(http::field::host, "localhost");
        request.set(http::field::range, "bytes=0-9");
        http::write(socket, request);
        http::flat_buffer buffer;
        http::response<http::string_body> response;
        http::read(socket, buffer, response);
        return response.result();
    });
    const bool was_served = next.wait_for(std::chrono::seconds(5))
            == std::future_status::ready;
    EXPECT_TRUE(was_served);
    if(!was_served) {
        // release the stuck worker so the test can finish
        engine.verify(15);
    }
    EXPECT_EQ(next.get(), http::status::partial_content);

    server.stop();
    session.close();
}

TEST(content_server, mime_types)
{
    EXPECT_STREQ(mime_type("show/Episode.MKV"), "video/x-matroska");
    EXPECT_STREQ(mime_type("movie.mp4"), "video/mp4");
    EXPECT_STREQ(mime_type("subs.srt"), "application/x-subrip");
    EXPECT_STREQ(mime_type("no_extension"), "application/octet-stream");
    EXPECT_STREQ(mime_type("dir.d/file"), "application/octet-stream");
    EXPECT_STREQ(mime_type("archive.xyz"), "application/octet-stream");
}

TEST(content_server, http_date)
{
    EXPECT_EQ(http_date(784111777), "Sun, 06 Nov 1994 08:49:37 GMT");
    EXPECT_EQ(http_date(0), "Thu, 01 Jan 1970 00:00:00 GMT");
}
