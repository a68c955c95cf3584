#include <gtest/gtest.h>

#include <string>

#include "persist/json_cursor.hpp"

TEST(JsonCursor, StringEscapesAndSurrogates) {
    persist::JsonCursor cur(R"("a\"b\\c\n\u00e9\ud83d\ude00")");
    std::string err;
    const auto s = cur.parse_string(err);
    ASSERT_TRUE(s.has_value()) << err;
    EXPECT_EQ(*s, "a\"b\\c\n\xC3\xA9\xF0\x9F\x98\x80");
    EXPECT_TRUE(cur.eof());
}

TEST(JsonCursor, RejectsUnpairedSurrogates) {
    std::string err;
    persist::JsonCursor lone(R"("\ud83d")");
    EXPECT_FALSE(lone.parse_string(err).has_value());
    persist::JsonCursor low(R"("\ude00")");
    EXPECT_FALSE(low.parse_string(err).has_value());
    persist::JsonCursor unterminated(R"("abc)");
    EXPECT_FALSE(unterminated.parse_string(err).has_value());
}

TEST(JsonCursor, SkipsNestedValues) {
    persist::JsonCursor cur(R"( {"a": [1, -2.5e3, {"b": null}], "c": "x"} , true)");
    std::string err;
    ASSERT_TRUE(cur.skip_value(err)) << err;
    EXPECT_TRUE(cur.expect(','));
    EXPECT_EQ(cur.parse_bool(err), true);
    EXPECT_TRUE(cur.eof());
}

TEST(JsonCursor, NestingDepthIsBounded) {
    const std::string deep = std::string(100, '[') + std::string(100, ']');
    persist::JsonCursor cur(deep);
    std::string err;
    EXPECT_FALSE(cur.skip_value(err));
}

TEST(JsonCursor, IntegersAndSignedness) {
    std::string err;
    persist::JsonCursor neg("-42");
    EXPECT_EQ(neg.parse_int64(err), -42);
    persist::JsonCursor unsigned_neg("-42");
    EXPECT_FALSE(unsigned_neg.parse_uint64(err).has_value());
    persist::JsonCursor big("18446744073709551616");
    EXPECT_FALSE(big.parse_uint64(err).has_value());
}

TEST(JsonCursor, AppendQuotesAndEscapes) {
    std::string out;
    persist::append_json_string(out, "tab\there \"q\"");
    EXPECT_EQ(out, R"("tab\there \"q\"")");
}
