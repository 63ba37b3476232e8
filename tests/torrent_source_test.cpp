#include <gtest/gtest.h>

#include "torrent_source.hpp"
#include "session_error.hpp"
#include "string_utils.hpp"
#include "sha1_hasher.hpp"
#include "path.hpp"

#include <fstream>
#include <string_view>

using namespace flume;

TEST(torrent_source, classifies_input)
{
    auto s = torrent_source::parse("  magnet:?xt=urn:btih:abc\n");
    EXPECT_EQ(s.type, torrent_source::kind::magnet);
    EXPECT_EQ(s.location, "magnet:?xt=urn:btih:abc");

    s = torrent_source::parse("HTTPS://example.com/a.torrent");
    EXPECT_EQ(s.type, torrent_source::kind::url);
    s = torrent_source::parse("http://example.com/a.torrent");
    EXPECT_EQ(s.type, torrent_source::kind::url);

    s = torrent_source::parse("/home/user/a.torrent");
    EXPECT_EQ(s.type, torrent_source::kind::file);
    s = torrent_source::parse("ftp.torrent");
    EXPECT_EQ(s.type, torrent_source::kind::file);
}

TEST(torrent_source, cached_download_is_reused)
{
    const path cache_dir = fs::temp_directory_path() / "flume-fetch-cache-test";
    fs::remove_all(cache_dir);
    fs::create_directories(cache_dir);

    // nothing listens there, so only the cache can satisfy this
    const std::string url = "http://127.0.0.1:1/cached.torrent";
    const path cached = cache_dir
            / ("flume-" + util::to_hex(create_sha1_digest(std::string_view(url)))
                      + ".torrent");
    {
        std::ofstream out(cached, std::ios::binary);
        out << "d4:infodee";
    }
    EXPECT_EQ(fetch_torrent_file(url, cache_dir.string(), seconds(5)), cached.string());
    fs::remove_all(cache_dir);
}

TEST(torrent_source, unreachable_url_fails)
{
    const path cache_dir = fs::temp_directory_path() / "flume-fetch-fail-test";
    fs::remove_all(cache_dir);
    try {
        fetch_torrent_file("http://127.0.0.1:1/missing.torrent", cache_dir.string(),
                seconds(5));
        FAIL() << "expected a system_error";
    } catch(const system_error& e) {
        EXPECT_EQ(e.code(), session_errc::fetch_failed);
    }
    fs::remove_all(cache_dir);
}
