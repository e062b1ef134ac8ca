#include "awsid/GeneralResource.hpp"
#include "awsid/MetaUtils.hpp"

#include <gtest/gtest.h>

#include <set>
#include <string>
#include <type_traits>

using namespace awsid;

static_assert(std::tuple_size_v<GeneralResourceIds> == 28);
static_assert(is_in_tuple_v<AwsVpcId, GeneralResourceIds>);
static_assert(index_in_tuple<AwsNetworkAclId, GeneralResourceIds>::value == 0);
static_assert(index_in_tuple<AwsVpnGatewayId, GeneralResourceIds>::value == 27);

namespace {
template <typename Visitor>
void forEachGeneralId(Visitor&& v) {
    visit_tuple<GeneralResourceIds>()([&v](auto* tag, size_t) {
        v(tag);
        return false;
    });
}
}

// AWS moved these types from 8 to 17 character ids between 2016 and 2018
// without documenting which types still hand out the short form, so both
// lengths are accepted for every type. These tests pin that assumption.
TEST(GeneralResourceTest, EveryTypeAcceptsBothLengths) {
    size_t visited = 0;
    forEachGeneralId([&visited](auto* tag) {
        using Id = std::remove_pointer_t<decltype(tag)>;
        auto prefix = std::string(Id::prefix());
        auto shortText = prefix + "0123abcd";
        auto longText = prefix + "0123456789abcdef0";

        auto shortId = Id::parse(shortText);
        EXPECT_TRUE(shortId.ok()) << shortText;
        if (shortId) {
            EXPECT_EQ(shortId.value().asText().view(), shortText);
            EXPECT_FALSE(shortId.value().isLongForm());
        }

        auto longId = Id::parse(longText);
        EXPECT_TRUE(longId.ok()) << longText;
        if (longId) {
            EXPECT_EQ(longId.value().toString(), longText);
            EXPECT_TRUE(longId.value().isLongForm());
        }
        ++visited;
    });
    EXPECT_EQ(visited, 28u);
}

TEST(GeneralResourceTest, EveryTypeRejectsOtherLengthsAndCharsets) {
    forEachGeneralId([](auto* tag) {
        using Id = std::remove_pointer_t<decltype(tag)>;
        auto prefix = std::string(Id::prefix());
        EXPECT_EQ(Id::parse(prefix + "0123abc").error().kind
            , ParseErrorKind::length_mismatch) << prefix;
        EXPECT_EQ(Id::parse(prefix + "0123456789abcdef").error().kind
            , ParseErrorKind::length_mismatch) << prefix;
        EXPECT_EQ(Id::parse(prefix + "0123ABCD").error().kind
            , ParseErrorKind::invalid_suffix_char) << prefix;
        auto err = Id::parse(prefix + "0123ABCD").error();
        EXPECT_EQ(err.position, prefix.size() + 4);
        EXPECT_STREQ(err.targetType, Id::typeName());
    });
}

TEST(GeneralResourceTest, SameFootprint) {
    forEachGeneralId([](auto* tag) {
        using Id = std::remove_pointer_t<decltype(tag)>;
        EXPECT_EQ(sizeof(Id), 18u) << Id::typeName();
    });
}

TEST(GeneralResourceTest, PrefixesAndNamesAreDistinct) {
    std::set<std::string> prefixes;
    std::set<std::string> names;
    forEachGeneralId([&](auto* tag) {
        using Id = std::remove_pointer_t<decltype(tag)>;
        EXPECT_EQ(Id::prefix().back(), '-') << Id::typeName();
        prefixes.insert(std::string(Id::prefix()));
        names.insert(Id::typeName());
    });
    EXPECT_EQ(prefixes.size(), 28u);
    EXPECT_EQ(names.size(), 28u);
}

TEST(GeneralResourceTest, KnownPrefixes) {
    EXPECT_EQ(AwsNetworkAclId::prefix(), "acl-");
    EXPECT_EQ(AwsAmiId::prefix(), "ami-");
    EXPECT_EQ(AwsElasticIpId::prefix(), "eipalloc-");
    EXPECT_EQ(AwsElasticBeanstalkEnvironmentId::prefix(), "e-");
    EXPECT_EQ(AwsInstanceId::prefix(), "i-");
    EXPECT_EQ(AwsLoadBalancerId::prefix(), "elbv2-");
    EXPECT_EQ(AwsRdsInstanceId::prefix(), "db-");
    EXPECT_EQ(AwsRedshiftClusterId::prefix(), "redshift-");
    EXPECT_EQ(AwsTransitGatewayAttachmentId::prefix(), "tgw-attach-");
    EXPECT_EQ(AwsTransitGatewayId::prefix(), "tgw-");
    EXPECT_EQ(AwsVpnGatewayId::prefix(), "vgw-");
    EXPECT_STREQ(general_resource_detail::AwsVpcIdDoc, "AWS VPC (Virtual Private Cloud) ID");
}

TEST(GeneralResourceTest, TypesDoNotMix) {
    // distinct types, so a vpc id is not a vpn connection id even with equal suffixes
    static_assert(!std::is_same_v<AwsVpcId, AwsVpnConnectionId>);
    static_assert(!std::is_convertible_v<AwsVpcId, AwsVpnConnectionId>);
    EXPECT_EQ(AwsVpnConnectionId::parse("vpc-0a1b2c3d").error().kind
        , ParseErrorKind::prefix_mismatch);
}
