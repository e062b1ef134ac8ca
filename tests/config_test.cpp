#include "awsid/app/Config.hpp"
#include "awsid/GeneralResource.hpp"
#include "awsid/Region.hpp"

#include <gtest/gtest.h>

#include <sstream>
#include <string>
#include <vector>

using namespace awsid;
using namespace awsid::app;
namespace pt = boost::property_tree;

namespace {
char const* json = R"|(
{
    "type"      : "auto",
    "count"     : 3,
    "vpc"       : "vpc-0a1b2c3d",
    "region"    : "us-east-1",
    "subnets"   : ["subnet-0a1b2c3d", "subnet-0123456789abcdef0"],
    "strict"    : {
        "type"  : "AwsVpcId",
        "vpc"   : "vpc-0123456789abcdef0"
    },
    "bad"       : {
        "vpc"   : "vpc-nothex00",
        "subnets" : ["subnet-0a1b2c3d", "subnet-X"]
    }
}
)|";
}

TEST(ConfigTest, SectionOverridesTopLevel) {
    Config top(json);
    EXPECT_EQ(top.getExt<std::string>("type"), "auto");
    EXPECT_EQ(top.getId<AwsVpcId>("vpc").toString(), "vpc-0a1b2c3d");

    Config strict(json, "strict");
    EXPECT_EQ(strict.getExt<std::string>("type"), "AwsVpcId");
    EXPECT_EQ(strict.getId<AwsVpcId>("vpc").toString(), "vpc-0123456789abcdef0");
    // not in the section, the top level value is used
    EXPECT_EQ(strict.getExt<int>("count"), 3);
    EXPECT_EQ(strict.getId<AwsRegionId>("region").code(), Region::us_east_1);
}

TEST(ConfigTest, MissingSectionThrows) {
    EXPECT_THROW(Config c(json, "missing"), pt::ptree_bad_path);
}

TEST(ConfigTest, InvalidIdThrowsConfigException) {
    Config bad(json, "bad");
    try {
        bad.getId<AwsVpcId>("vpc");
        FAIL() << "no exception";
    } catch (ConfigException const& e) {
        EXPECT_EQ(e.error.kind, ParseErrorKind::invalid_suffix_char);
        EXPECT_EQ(e.error.position, 4u);
        EXPECT_NE(std::string(e.what()).find("vpc-nothex00"), std::string::npos);
    }
    EXPECT_THROW(bad.getId<AwsVpcId>("nope"), pt::ptree_bad_path);
    EXPECT_THROW(bad.getId<AwsRegionId>("vpc"), ConfigException);
}

TEST(ConfigTest, FallbackConfig) {
    Config primary(R"|({"format": "json"})|");
    Config fallback(R"|({"region": "eu-west-1", "format": "text"})|");
    primary.setAdditionalFallbackConfig(fallback);
    EXPECT_EQ(primary.getExt<std::string>("format"), "json");
    EXPECT_EQ(primary.getId<AwsRegionId>("region").toString(), "eu-west-1");
    EXPECT_THROW(primary.getExt<std::string>("nope"), pt::ptree_bad_path);
    EXPECT_EQ(primary.getExt<std::string>("nope", false), "");
}

TEST(ConfigTest, ChainedFill) {
    Config top(json);
    auto vpc = AwsVpcId::fromString("vpc-00000000");
    auto region = AwsRegionId(Region::af_south_1);
    int count = 0;
    top(vpc, "vpc")(count, "count")(region, "region");
    EXPECT_EQ(vpc.toString(), "vpc-0a1b2c3d");
    EXPECT_EQ(count, 3);
    EXPECT_EQ(region.toString(), "us-east-1");
}

TEST(ConfigTest, IdArrays) {
    Config top(json);
    auto subnets = top.getArray<AwsSubnetId>("subnets");
    ASSERT_EQ(subnets.size(), 2u);
    EXPECT_TRUE(subnets[1].isLongForm());

    Config bad(json, "bad");
    EXPECT_THROW(bad.getArray<AwsSubnetId>("subnets"), pt::ptree_bad_data);
}

TEST(ConfigTest, PutIds) {
    Config c;
    c.put("vpc", AwsVpcId::fromString("vpc-ffffffff"))
        .put("region", AwsRegionId(Region::ca_west_1));
    EXPECT_EQ(c.getExt<std::string>("vpc"), "vpc-ffffffff");
    EXPECT_EQ(c.getExt<std::string>("region"), "ca-west-1");
}

TEST(ConfigTest, UpdateWithCmdline) {
    Config top(json);
    int argc = 4;
    char const* argv[] = {"type=vpc", "--help", "vpc=vpc-ffffffff", "subnets=subnet-00000000"};
    top.updateWithCmdline(argc, argv);
    ASSERT_EQ(argc, 1);
    EXPECT_STREQ(argv[0], "--help");
    EXPECT_EQ(top.getExt<std::string>("type"), "vpc");
    EXPECT_EQ(top.getId<AwsVpcId>("vpc").toString(), "vpc-ffffffff");
    auto subnets = top.getArray<AwsSubnetId>("subnets");
    ASSERT_EQ(subnets.size(), 1u);
    EXPECT_EQ(subnets[0].toString(), "subnet-00000000");

    int argc2 = 1;
    char const* argv2[] = {"unknown=1"};
    EXPECT_THROW(top.updateWithCmdline(argc2, argv2), pt::ptree_bad_path);
}

TEST(ConfigTest, Content) {
    Config strict(json, "strict");
    std::ostringstream os;
    os << strict;
    auto text = os.str();
    EXPECT_NE(text.find("type=AwsVpcId"), std::string::npos);
    EXPECT_NE(text.find("count=3"), std::string::npos);
    EXPECT_EQ(text.find("type=auto"), std::string::npos);
}
