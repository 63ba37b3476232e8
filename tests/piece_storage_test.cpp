#include <gtest/gtest.h>

#include "piece_storage.hpp"
#include "stream_error.hpp"
#include "log.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <vector>

using namespace flume;

namespace {

struct piece_storage_fixture : public ::testing::Test
{
    path root = fs::temp_directory_path() / "flume-piece-storage-test";

    void SetUp() override { fs::remove_all(root); }
    void TearDown() override { fs::remove_all(root); }

    static std::vector<uint8_t> piece_data(const int size, const uint8_t seed)
    {
        std::vector<uint8_t> data(size);
        for(auto i = 0; i < size; ++i) {
            data[i] = uint8_t(seed + i);
        }
        return data;
    }
};

torrent_layout three_files()
{
    // 10 + 5 + 13 bytes in pieces of 8
    torrent_layout layout;
    layout.name = "album";
    layout.piece_length = 8;
    layout.total_length = 28;
    layout.num_pieces = 4;
    layout.files = {{"album/a", 10, 0}, {"album/b", 5, 10}, {"album/c", 13, 15}};
    return layout;
}

} // namespace

TEST_F(piece_storage_fixture, piece_spanning_files)
{
    piece_storage storage(root, three_files());
    // piece 1 covers a[8, 10), b[0, 5) and c[0, 1)
    const auto data = piece_data(8, 100);
    error_code ec;
    storage.write_piece(1, data, ec);
    ASSERT_FALSE(ec);
    EXPECT_TRUE(fs::exists(root / "album/a"));
    EXPECT_EQ(fs::file_size(root / "album/b"), 5u);
    EXPECT_EQ(fs::file_size(root / "album/c"), 13u);

    std::vector<uint8_t> buffer(8);
    EXPECT_EQ(storage.read(1, 0, buffer, ec), 8);
    ASSERT_FALSE(ec);
    EXPECT_EQ(buffer, data);

    std::vector<uint8_t> middle(4);
    EXPECT_EQ(storage.read(1, 3, middle, ec), 4);
    ASSERT_FALSE(ec);
    EXPECT_EQ(middle, std::vector<uint8_t>(data.begin() + 3, data.begin() + 7));
}

TEST_F(piece_storage_fixture, short_last_piece)
{
    piece_storage storage(root, three_files());
    error_code ec;
    storage.write_piece(3, piece_data(8, 0), ec);
    EXPECT_EQ(ec, errc::invalid_argument);

    const auto data = piece_data(4, 7);
    storage.write_piece(3, data, ec);
    ASSERT_FALSE(ec);
    std::vector<uint8_t> buffer(4);
    EXPECT_EQ(storage.read(3, 0, buffer, ec), 4);
    EXPECT_EQ(buffer, data);

    std::vector<uint8_t> too_long(5);
    storage.read(3, 0, too_long, ec);
    EXPECT_EQ(ec, stream_errc::out_of_range);
}

TEST_F(piece_storage_fixture, reading_unwritten_file_fails)
{
    piece_storage storage(root, three_files());
    std::vector<uint8_t> buffer(8);
    error_code ec;
    storage.read(0, 0, buffer, ec);
    EXPECT_TRUE(ec);
}

TEST_F(piece_storage_fixture, pieces_survive_reopening)
{
    const auto data = piece_data(8, 42);
    {
        piece_storage storage(root, three_files());
        error_code ec;
        storage.write_piece(2, data, ec);
        ASSERT_FALSE(ec);
    }
    piece_storage storage(root, three_files());
    std::vector<uint8_t> buffer(8);
    error_code ec;
    EXPECT_EQ(storage.read(2, 0, buffer, ec), 8);
    ASSERT_FALSE(ec);
    EXPECT_EQ(buffer, data);
}

TEST_F(piece_storage_fixture, file_opens_go_to_disk_log_when_enabled)
{
    const path log_dir = root / "logs";
    fs::create_directories(log_dir);
    log::set_log_dir(log_dir.string());
    {
        piece_storage storage(root, three_files());
        error_code ec;
        storage.write_piece(0, piece_data(8, 1), ec);
        ASSERT_FALSE(ec);
    }
    log::flush();
    log::set_log_dir({});

    const path log_file = log_dir / "diskIO-log.txt";
#ifdef FLUME_ENABLE_LOGGING
    ASSERT_TRUE(fs::exists(log_file));
    std::ifstream in(log_file);
    std::stringstream contents;
    contents << in.rdbuf();
    EXPECT_NE(contents.str().find("[l|STORAGE] opened"), std::string::npos);
#else
    EXPECT_FALSE(fs::exists(log_file));
#endif // FLUME_ENABLE_LOGGING
}
