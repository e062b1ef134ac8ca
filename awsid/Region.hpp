#include "awsid/Copyright.hpp"
#pragma once
#include "awsid/ShortCode.hpp"

#include <array>
#include <string_view>
#include <stdint.h>

namespace awsid {

/**
 * @brief AWS regions, declared in ascending order of their code text
 */
enum class Region : uint8_t {
    af_south_1,
    ap_east_1,
    ap_northeast_1,
    ap_northeast_2,
    ap_northeast_3,
    ap_south_1,
    ap_south_2,
    ap_southeast_1,
    ap_southeast_2,
    ap_southeast_3,
    ap_southeast_4,
    ca_central_1,
    ca_west_1,
    eu_central_1,
    eu_central_2,
    eu_north_1,
    eu_south_1,
    eu_south_2,
    eu_west_1,
    eu_west_2,
    eu_west_3,
    il_central_1,
    me_central_1,
    me_south_1,
    sa_east_1,
    us_east_1,
    us_east_2,
    us_west_1,
    us_west_2,
};

struct RegionTraits {
    using Code = Region;
    struct Entry {
        Code code;
        std::string_view text;
        char const* description;
    };

    static constexpr std::array<Entry, 29> table = {{
        {Region::af_south_1,        "af-south-1",       "Africa (Cape Town)"},
        {Region::ap_east_1,         "ap-east-1",        "Asia Pacific (Hong Kong)"},
        {Region::ap_northeast_1,    "ap-northeast-1",   "Asia Pacific (Tokyo)"},
        {Region::ap_northeast_2,    "ap-northeast-2",   "Asia Pacific (Seoul)"},
        {Region::ap_northeast_3,    "ap-northeast-3",   "Asia Pacific (Osaka)"},
        {Region::ap_south_1,        "ap-south-1",       "Asia Pacific (Mumbai)"},
        {Region::ap_south_2,        "ap-south-2",       "Asia Pacific (Hyderabad)"},
        {Region::ap_southeast_1,    "ap-southeast-1",   "Asia Pacific (Singapore)"},
        {Region::ap_southeast_2,    "ap-southeast-2",   "Asia Pacific (Sydney)"},
        {Region::ap_southeast_3,    "ap-southeast-3",   "Asia Pacific (Jakarta)"},
        {Region::ap_southeast_4,    "ap-southeast-4",   "Asia Pacific (Melbourne)"},
        {Region::ca_central_1,      "ca-central-1",     "Canada (Central)"},
        {Region::ca_west_1,         "ca-west-1",        "Canada West (Calgary)"},
        {Region::eu_central_1,      "eu-central-1",     "Europe (Frankfurt)"},
        {Region::eu_central_2,      "eu-central-2",     "Europe (Zurich)"},
        {Region::eu_north_1,        "eu-north-1",       "Europe (Stockholm)"},
        {Region::eu_south_1,        "eu-south-1",       "Europe (Milan)"},
        {Region::eu_south_2,        "eu-south-2",       "Europe (Spain)"},
        {Region::eu_west_1,         "eu-west-1",        "Europe (Ireland)"},
        {Region::eu_west_2,         "eu-west-2",        "Europe (London)"},
        {Region::eu_west_3,         "eu-west-3",        "Europe (Paris)"},
        {Region::il_central_1,      "il-central-1",     "Israel (Tel Aviv)"},
        {Region::me_central_1,      "me-central-1",     "Middle East (UAE)"},
        {Region::me_south_1,        "me-south-1",       "Middle East (Bahrain)"},
        {Region::sa_east_1,         "sa-east-1",        "South America (Sao Paulo)"},
        {Region::us_east_1,         "us-east-1",        "US East (N. Virginia)"},
        {Region::us_east_2,         "us-east-2",        "US East (Ohio)"},
        {Region::us_west_1,         "us-west-1",        "US West (N. California)"},
        {Region::us_west_2,         "us-west-2",        "US West (Oregon)"},
    }};
};

static_assert(isIndexedByCode(RegionTraits::table), "region table out of enum order");
static_assert(isSortedByText(RegionTraits::table), "region codes must ascend by text");

inline constexpr char AwsRegionIdName[] = "AwsRegionId";

/// AWS Region ID
using AwsRegionId = ShortCode<AwsRegionIdName, RegionTraits>;
using RegionId = AwsRegionId;

static_assert(sizeof(AwsRegionId) == 1, "a region id is its one byte tag");

}
