#include <gtest/gtest.h>

#include "util/uuid.hpp"

TEST(Uuid, ParsesHyphenatedAndBareForms) {
    const auto a = util::parse_uuid("069a79f4-44e9-4726-a5be-fca90e38aaf5");
    const auto b = util::parse_uuid("069A79F444E94726A5BEFCA90E38AAF5");
    ASSERT_TRUE(a.has_value());
    ASSERT_TRUE(b.has_value());
    EXPECT_EQ(*a, *b);
    EXPECT_EQ((*a)[0], 0x06);
    EXPECT_EQ((*a)[15], 0xF5);
    EXPECT_EQ(util::to_string(*a), "069a79f4-44e9-4726-a5be-fca90e38aaf5");
}

TEST(Uuid, RejectsMalformedText) {
    EXPECT_FALSE(util::parse_uuid("").has_value());
    EXPECT_FALSE(util::parse_uuid("069a79f4-44e9-4726-a5be-fca90e38aaf").has_value());
    EXPECT_FALSE(util::parse_uuid("069a79f4044e9-4726-a5be-fca90e38aaf5").has_value());
    EXPECT_FALSE(util::parse_uuid("g69a79f4-44e9-4726-a5be-fca90e38aaf5").has_value());
}
