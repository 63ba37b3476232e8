#include <gtest/gtest.h>

#include "bt_engine.hpp"
#include "session_error.hpp"
#include "settings.hpp"
#include "path.hpp"

#include <chrono>

using namespace flume;

namespace {

engine_settings test_settings()
{
    settings s;
    s.engine.data_dir = (fs::temp_directory_path() / "flume-bt-engine-test").string();
    fill_in_defaults(s);
    return s.engine;
}

} // namespace

TEST(bt_engine, closes_promptly_without_trackers)
{
    bt_engine engine(test_settings());
    // no trackers, so there is no 'stopped' announcement to wait for
    engine.add_magnet("magnet:?xt=urn:btih:c12fe1c06bba254a9dc9f519b335aa7c1367a88a");
    EXPECT_FALSE(engine.has_metadata());

    const auto start = std::chrono::steady_clock::now();
    engine.drop();
    engine.close();
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(1));
    fs::remove_all(test_settings().data_dir);
}

TEST(bt_engine, rejects_a_second_torrent)
{
    bt_engine engine(test_settings());
    engine.add_magnet("magnet:?xt=urn:btih:c12fe1c06bba254a9dc9f519b335aa7c1367a88a");
    try {
        engine.add_magnet("magnet:?xt=urn:btih:c12fe1c06bba254a9dc9f519b335aa7c1367a88a");
        FAIL() << "expected a system_error";
    } catch(const system_error& e) {
        EXPECT_EQ(e.code(), session_errc::torrent_exists);
    }
    engine.close();
    fs::remove_all(test_settings().data_dir);
}
