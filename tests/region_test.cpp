#include "awsid/Region.hpp"

#include <gtest/gtest.h>

#include <set>
#include <sstream>
#include <string>
#include <unordered_set>

using namespace awsid;

static_assert(sizeof(AwsRegionId) == 1);
static_assert(AwsRegionId::count == 29);
static_assert(AwsRegionId(Region::us_west_2).asText() == "us-west-2");
static_assert(AwsRegionId(Region::af_south_1) < AwsRegionId(Region::us_east_1));
static_assert(is_short_code_v<AwsRegionId>);

TEST(RegionTest, KnownCodeParses) {
    auto res = AwsRegionId::parse("eu-central-1");
    ASSERT_TRUE(res.ok());
    EXPECT_EQ(res.value().code(), Region::eu_central_1);
    EXPECT_EQ(res.value().asText(), "eu-central-1");
    EXPECT_STREQ(res.value().description(), "Europe (Frankfurt)");
}

TEST(RegionTest, UnknownCode) {
    auto res = AwsRegionId::parse("mars-central-1");
    ASSERT_FALSE(res.ok());
    EXPECT_EQ(res.error().kind, ParseErrorKind::unknown_code);
    EXPECT_EQ(res.error().describe("mars-central-1")
        , "failed to initialize AwsRegionId from \"mars-central-1\": unknown code");

    // exact, case sensitive match only
    EXPECT_FALSE(AwsRegionId::parse("EU-CENTRAL-1"));
    EXPECT_FALSE(AwsRegionId::parse("eu-central-1 "));
    EXPECT_FALSE(AwsRegionId::parse("eu-central"));
    EXPECT_FALSE(AwsRegionId::parse(""));
    EXPECT_THROW(AwsRegionId::fromString("us-east-3"), ParseException);
}

TEST(RegionTest, AllCodesRoundTrip) {
    auto all = AwsRegionId::all();
    ASSERT_EQ(all.size(), 29u);
    std::set<std::string> texts;
    for (auto r : all) {
        auto back = AwsRegionId::parse(r.asText());
        ASSERT_TRUE(back) << r;
        EXPECT_EQ(back.value(), r);
        EXPECT_EQ(back.value().toString(), std::string(r.asText()));
        EXPECT_NE(std::string(r.description()), "");
        texts.insert(r.toString());
    }
    EXPECT_EQ(texts.size(), 29u);
}

TEST(RegionTest, OrderingMatchesText) {
    auto all = AwsRegionId::all();
    for (size_t i = 0; i < all.size(); ++i) {
        for (size_t j = 0; j < all.size(); ++j) {
            EXPECT_EQ(all[i] < all[j], all[i].asText() < all[j].asText());
            EXPECT_EQ(all[i] == all[j], all[i].asText() == all[j].asText());
        }
    }
}

TEST(RegionTest, FromCode) {
    RegionId r{Region::us_east_1};
    EXPECT_EQ(r.asText(), "us-east-1");
    EXPECT_STREQ(r.description(), "US East (N. Virginia)");
    EXPECT_EQ(static_cast<Region>(r), Region::us_east_1);
    EXPECT_EQ(AwsRegionId::fromString("us-east-1"), r);

    std::ostringstream os;
    os << r;
    EXPECT_EQ(os.str(), "us-east-1");
}

TEST(RegionTest, Hashable) {
    std::unordered_set<AwsRegionId> regions;
    for (auto r : AwsRegionId::all()) regions.insert(r);
    regions.insert(AwsRegionId::fromString("sa-east-1"));
    EXPECT_EQ(regions.size(), 29u);
}
