// hello-ids for awsid
// - parse, inspect and store a few AWS resource ids
// to build:
// g++ hello-ids.cpp -std=c++2a -Ipath-to-awsid -Ipath-to-boost -ldl -o /tmp/hi
//
// example run:
// [term1] /tmp/hi
// vpc-0a1b2c3d is a AwsVpcId, 18 bytes, short form
// subnet-0123456789abcdef0 is a AwsSubnetId, 18 bytes, long form
// ...
//
#include "awsid/awsid.hpp"

#include <boost/property_tree/json_parser.hpp>

#include <iostream>
#include <map>
#include <unordered_set>

using namespace std;
using namespace awsid;

template <typename Id>
void show(Id const& id) {
    cout << id << " is a " << Id::typeName() << ", " << sizeof(id) << " bytes, "
        << (id.isLongForm() ? "long" : "short") << " form" << endl;
}

int main() {
    // the validating path, errors come back as values
    auto vpc = AwsVpcId::parse("vpc-0a1b2c3d");
    if (!vpc) {
        cerr << vpc.error().describe("vpc-0a1b2c3d") << endl;
        return 1;
    }
    show(vpc.value());

    // the throwing path
    auto subnet = AwsSubnetId::fromString("subnet-0123456789abcdef0");
    show(subnet);

    try {
        AwsSecurityGroupId::fromString("sg-0A1B2C3D");
    } catch (ParseException const& e) {
        cout << "rejected: " << e.error << " ("
            << parseErrorKindString(e.error.kind) << ')' << endl;
    }

    auto region = AwsRegionId::fromString("eu-central-1");
    cout << region << " is " << region.description() << endl;

    // ids are ordinary keys
    map<AwsInstanceId, AwsRegionId> placement;
    placement.emplace(AwsInstanceId::fromString("i-0123456789abcdef0"), region);
    placement.emplace(AwsInstanceId::fromString("i-1a2b3c4d"), RegionId{Region::us_east_1});
    unordered_set<AwsVolumeId> volumes{AwsVolumeId::fromString("vol-00112233")};
    for (auto const& p : placement) {
        cout << p.first << " runs in " << p.second << endl;
    }
    cout << volumes.size() << " volume(s)" << endl;

    // what is this?
    for (auto text : {"tgw-attach-0a1b2c3d", "ap-southeast-2", "arn:aws:s3:::bucket"}) {
        auto v = identify(text);
        if (v) {
            cout << text << " -> " << v.typeName() << endl;
        } else {
            cout << text << " -> " << v.error.describe(text) << endl;
        }
    }

    // ids in a json document
    boost::property_tree::ptree doc;
    doc.put("vpc", vpc.value());
    doc.put("region", region);
    boost::property_tree::write_json(cout, doc);
    auto back = doc.get<AwsVpcId>("vpc");
    return back == vpc.value() ? 0 : 1;
}
