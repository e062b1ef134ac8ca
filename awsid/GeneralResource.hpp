#include "awsid/Copyright.hpp"
#pragma once
#include "awsid/text/TaggedString.hpp"

#include <tuple>
#include <type_traits>
#include <utility>

/**
 * @brief every AWS resource id type in the general format
 * @details X(type name, prefix, description)
 *
 * > Prior to January 2016, the IDs assigned to newly created resources of
 * > certain resource types used 8 characters after the hyphen (for example,
 * > i-1a2b3c4d). From January 2016 to June 2018, we changed the IDs of these
 * > resource types to use 17 characters after the hyphen (for example,
 * > i-1234567890abcdef0).
 * > https://docs.aws.amazon.com/AWSEC2/latest/UserGuide/resource-ids.html
 *
 * both lengths are accepted for every type
 */
#define AWSID_GENERAL_RESOURCE_LIST(X) \
    X(AwsNetworkAclId,                  "acl-",         "AWS Network ACL (Access Control List) ID") \
    X(AwsAmiId,                         "ami-",         "AWS AMI (Amazon Machine Image) ID") \
    X(AwsCustomerGatewayId,             "cgw-",         "AWS Customer Gateway ID") \
    X(AwsElasticIpId,                   "eipalloc-",    "AWS Elastic IP ID") \
    X(AwsEfsFileSystemId,               "fs-",          "AWS EFS (Elastic File System) ID") \
    X(AwsEfsMountTargetId,              "fsmt-",        "AWS EFS Mount Target ID") \
    X(AwsCloudFormationStackId,         "stack-",       "AWS CloudFormation Stack ID") \
    X(AwsElasticBeanstalkEnvironmentId, "e-",           "AWS Elastic Beanstalk Environment ID") \
    X(AwsInstanceId,                    "i-",           "AWS EC2 Instance ID") \
    X(AwsInternetGatewayId,             "igw-",         "AWS Internet Gateway ID") \
    X(AwsKeyPairId,                     "key-",         "AWS Key Pair ID") \
    X(AwsLoadBalancerId,                "elbv2-",       "AWS Elastic Load Balancer ID") \
    X(AwsNatGatewayId,                  "nat-",         "AWS NAT Gateway ID") \
    X(AwsNetworkInterfaceId,            "eni-",         "AWS Network Interface ID") \
    X(AwsPlacementGroupId,              "pg-",          "AWS Placement Group ID") \
    X(AwsRdsInstanceId,                 "db-",          "AWS RDS Instance ID") \
    X(AwsRedshiftClusterId,             "redshift-",    "AWS Redshift Cluster ID") \
    X(AwsRouteTableId,                  "rtb-",         "AWS Route Table ID") \
    X(AwsSecurityGroupId,               "sg-",          "AWS Security Group ID") \
    X(AwsSnapshotId,                    "snap-",        "AWS EBS Snapshot ID") \
    X(AwsSubnetId,                      "subnet-",      "AWS VPC Subnet ID") \
    X(AwsTargetGroupId,                 "tg-",          "AWS Target Group ID") \
    X(AwsTransitGatewayAttachmentId,    "tgw-attach-",  "AWS Transit Gateway Attachment ID") \
    X(AwsTransitGatewayId,              "tgw-",         "AWS Transit Gateway ID") \
    X(AwsVolumeId,                      "vol-",         "AWS EBS Volume ID") \
    X(AwsVpcId,                         "vpc-",         "AWS VPC (Virtual Private Cloud) ID") \
    X(AwsVpnConnectionId,               "vpn-",         "AWS VPN Connection ID") \
    X(AwsVpnGatewayId,                  "vgw-",         "AWS VPN Gateway ID")

namespace awsid {
namespace general_resource_detail {
#define AWSID_DECLARE_LITERALS(type, prefix, doc) \
    inline constexpr char type##Name[] = #type; \
    inline constexpr char type##Prefix[] = prefix; \
    inline constexpr char type##Doc[] = doc;
AWSID_GENERAL_RESOURCE_LIST(AWSID_DECLARE_LITERALS)
#undef AWSID_DECLARE_LITERALS
}

#define AWSID_DECLARE_TYPE(type, prefix, doc) \
    using type = text::TaggedString<general_resource_detail::type##Name \
        , general_resource_detail::type##Prefix>; \
    static_assert(sizeof(type) == AWSID_GENERAL_ID_BYTES, #type " must stay " "18 bytes"); \
    static_assert(std::is_trivially_copyable_v<type>, #type " must be trivially copyable");
AWSID_GENERAL_RESOURCE_LIST(AWSID_DECLARE_TYPE)
#undef AWSID_DECLARE_TYPE

#define AWSID_LIST_TYPE(type, prefix, doc) , std::declval<std::tuple<type>>()
/// all general format id types in registry order
using GeneralResourceIds = decltype(std::tuple_cat(std::declval<std::tuple<>>()
    AWSID_GENERAL_RESOURCE_LIST(AWSID_LIST_TYPE)
));
#undef AWSID_LIST_TYPE
}
