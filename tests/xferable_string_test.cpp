#include "awsid/text/XferableString.hpp"

#include <gtest/gtest.h>

#include <string>
#include <type_traits>
#include <unordered_set>

using namespace awsid::text;

static_assert(sizeof(XferableString<29>) == 29);
static_assert(std::is_trivially_copyable_v<XferableString<29>>);

TEST(XferableStringTest, HoldsText) {
    XferableString<16> s("vpc-0a1b2c3d");
    EXPECT_EQ(s.size(), 12u);
    EXPECT_FALSE(s.empty());
    EXPECT_EQ(s.view(), "vpc-0a1b2c3d");
    EXPECT_STREQ(s.c_str(), "vpc-0a1b2c3d");
    EXPECT_EQ(static_cast<std::string>(s), "vpc-0a1b2c3d");
    EXPECT_TRUE(XferableString<4>().empty());
}

TEST(XferableStringTest, TwoPieces) {
    XferableString<22> s("tgw-", "0123456789abcdef0");
    EXPECT_EQ(s, std::string_view("tgw-0123456789abcdef0"));
    EXPECT_EQ(s.size(), 21u);
}

TEST(XferableStringTest, TruncatesToCapacity) {
    XferableString<4> s("abcdef");
    EXPECT_EQ(s.view(), "abc");
    XferableString<6> t("abc", "def");
    EXPECT_EQ(t.view(), "abcde");
    XferableString<3> u("abc", "def");
    EXPECT_EQ(u.view(), "ab");
}

TEST(XferableStringTest, CompareAndHash) {
    XferableString<8> a("abc");
    XferableString<8> b("abd");
    EXPECT_TRUE(a < b);
    EXPECT_TRUE(a != b);
    EXPECT_TRUE(a == XferableString<8>("abc"));

    std::unordered_set<XferableString<8>> set{a, b, XferableString<8>("abc")};
    EXPECT_EQ(set.size(), 2u);

    char buf[8];
    EXPECT_EQ(std::string(buf, b.copyTo(buf)), "abd");
}
