#include <gtest/gtest.h>

#include "bencode.hpp"

using namespace flume;

TEST(bencode, decode_number)
{
    error_code ec;
    auto v = bdecode("i42e", ec);
    ASSERT_FALSE(ec);
    EXPECT_TRUE(v.is_number());
    EXPECT_EQ(v.number(), 42);

    v = bdecode("i-17e", ec);
    ASSERT_FALSE(ec);
    EXPECT_EQ(v.number(), -17);

    v = bdecode("i0e", ec);
    ASSERT_FALSE(ec);
    EXPECT_EQ(v.number(), 0);
}

TEST(bencode, reject_malformed_numbers)
{
    error_code ec;
    bdecode("i-0e", ec);
    EXPECT_EQ(ec, bencode_errc::invalid_number);
    bdecode("i03e", ec);
    EXPECT_EQ(ec, bencode_errc::invalid_number);
    bdecode("ie", ec);
    EXPECT_EQ(ec, bencode_errc::invalid_number);
    bdecode("i12", ec);
    EXPECT_EQ(ec, bencode_errc::unexpected_end);
    bdecode("i1234567890123456789e", ec);
    EXPECT_EQ(ec, bencode_errc::invalid_number);
}

TEST(bencode, decode_string)
{
    error_code ec;
    auto v = bdecode("4:spam", ec);
    ASSERT_FALSE(ec);
    EXPECT_TRUE(v.is_string());
    EXPECT_EQ(v.string(), "spam");

    v = bdecode("0:", ec);
    ASSERT_FALSE(ec);
    EXPECT_EQ(v.string(), "");

    bdecode("5:spam", ec);
    EXPECT_EQ(ec, bencode_errc::unexpected_end);
}

TEST(bencode, decode_containers)
{
    error_code ec;
    const auto v = bdecode("d4:eggsl1:ai2ee4:spamd3:fooi3eee", ec);
    ASSERT_FALSE(ec);
    ASSERT_TRUE(v.is_map());
    const auto* eggs = v.find_list("eggs");
    ASSERT_NE(eggs, nullptr);
    ASSERT_EQ(eggs->list().size(), 2u);
    EXPECT_EQ(eggs->list()[0].string(), "a");
    EXPECT_EQ(eggs->list()[1].number(), 2);

    const auto* spam = v.find_map("spam");
    ASSERT_NE(spam, nullptr);
    ASSERT_NE(spam->find_number("foo"), nullptr);
    EXPECT_EQ(spam->find_number("foo")->number(), 3);
    EXPECT_EQ(spam->find_string("foo"), nullptr);
    EXPECT_EQ(v.find("missing"), nullptr);
}

TEST(bencode, source_span_of_nested_element)
{
    const std::string encoded = "d8:announce3:url4:infod4:name1:xee";
    error_code ec;
    const auto v = bdecode(encoded, ec);
    ASSERT_FALSE(ec);
    const auto* info = v.find_map("info");
    ASSERT_NE(info, nullptr);
    EXPECT_EQ(encoded.substr(info->source_begin(), info->source_end() - info->source_begin()),
            "d4:name1:xe");
}

TEST(bencode, errors)
{
    error_code ec;
    bdecode("", ec);
    EXPECT_EQ(ec, bencode_errc::unexpected_end);
    bdecode("x", ec);
    EXPECT_EQ(ec, bencode_errc::invalid_token);
    bdecode("di1ei2ee", ec);
    EXPECT_EQ(ec, bencode_errc::invalid_map_key);
    bdecode("l1:a", ec);
    EXPECT_EQ(ec, bencode_errc::unexpected_end);
    bdecode("i1ei2e", ec);
    EXPECT_EQ(ec, bencode_errc::trailing_data);
    bdecode(std::string(100, 'l') + std::string(100, 'e'), ec);
    EXPECT_EQ(ec, bencode_errc::nesting_too_deep);
}

TEST(bencode, decode_prefix_leaves_trailing_data)
{
    const std::string message = "d8:msg_typei1e5:piecei0eeRAWDATA";
    size_t num_consumed = 0;
    error_code ec;
    const auto header = bdecode_prefix(message, num_consumed, ec);
    ASSERT_FALSE(ec);
    EXPECT_EQ(header.find_number("msg_type")->number(), 1);
    EXPECT_EQ(message.substr(num_consumed), "RAWDATA");
}

TEST(bencode, encode)
{
    bvalue::map_type m;
    m["m"] = bvalue::map_type{{"ut_metadata", 1}};
    m["v"] = "flume";
    m["list"] = bvalue::list_type{bvalue(-3), bvalue("ab")};
    EXPECT_EQ(bencode(bvalue(m)), "d4:listli-3e2:abe1:md11:ut_metadatai1ee1:v5:flumee");
}
