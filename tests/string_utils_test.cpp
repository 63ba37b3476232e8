#include <gtest/gtest.h>

#include "string_utils.hpp"

#include <array>

using namespace flume;

TEST(string_utils, trim_and_lower)
{
    std::string s = " \t Hello World \n";
    util::trim(s);
    EXPECT_EQ(s, "Hello World");
    util::to_lower(s);
    EXPECT_EQ(s, "hello world");

    std::string blank = "   ";
    util::trim(blank);
    EXPECT_TRUE(blank.empty());
}

TEST(string_utils, prefixes)
{
    EXPECT_TRUE(util::starts_with("magnet:?xt", "magnet:"));
    EXPECT_FALSE(util::starts_with("Magnet:?xt", "magnet:"));
    EXPECT_TRUE(util::istarts_with("Magnet:?xt", "magnet:"));
    EXPECT_FALSE(util::istarts_with("mag", "magnet:"));
}

TEST(string_utils, hex)
{
    const std::array<uint8_t, 3> bytes = {0x00, 0xab, 0x7f};
    EXPECT_EQ(util::to_hex(bytes), "00ab7f");
    EXPECT_EQ(util::hex_digit_value('F'), 15);
    EXPECT_EQ(util::hex_digit_value('g'), -1);
}

TEST(string_utils, url_coding)
{
    EXPECT_EQ(util::url_encode(std::string("a b/c~")), "a%20b%2Fc~");
    EXPECT_EQ(util::url_decode("a%20b%2fc"), "a b/c");
    EXPECT_EQ(util::url_decode("a+b", true), "a b");
    EXPECT_EQ(util::url_decode("a+b"), "a+b");
    EXPECT_EQ(util::url_decode("100%"), "100%");
    EXPECT_EQ(util::url_decode("%zz"), "%zz");
}

TEST(string_utils, human_readable_bytes)
{
    EXPECT_EQ(util::to_human_readable_bytes(0), "0 B");
    EXPECT_EQ(util::to_human_readable_bytes(999), "999 B");
    EXPECT_EQ(util::to_human_readable_bytes(1234567), "1.2 MB");
    EXPECT_EQ(util::to_human_readable_bytes(82854982), "83 MB");
}

TEST(string_utils, format)
{
    EXPECT_EQ(util::format("%s: %i", "pieces", 42), "pieces: 42");
    EXPECT_EQ(util::format("%lli", (long long)1 << 40), "1099511627776");
}
