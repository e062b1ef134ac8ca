#include "awsid/awsid.hpp"
#include "awsid/app/Config.hpp"
#include "awsid/app/Logger.hpp"

#include <boost/format.hpp>
#include <boost/program_options.hpp>
#include <boost/property_tree/json_parser.hpp>

#include <fstream>
#include <iostream>
#include <string>
#include <vector>

using namespace std;
using namespace awsid;
using namespace awsid::app;

namespace {
int printRegistry() {
    for (auto const& info : registry()) {
        if (info.prefix.empty()) continue;
        cout << boost::format("%-34s %-12s %s\n")
            % info.typeName % string(info.prefix) % info.description;
    }
    cout << '\n' << AwsRegionId::typeName() << ":\n";
    for (auto r : AwsRegionId::all()) {
        cout << boost::format("  %-16s %s\n") % r.toString() % r.description();
    }
    return 0;
}

Verdict run(string const& type, string const& input) {
    if (type == "auto") return identify(input);
    return check(type, input);
}

int report(string const& type, string const& format, vector<string> const& inputs) {
    int res = 0;
    boost::property_tree::ptree results;
    for (auto const& input : inputs) {
        auto v = run(type, input);
        if (!v) res = 1;
        auto err = v ? string() : v.error.describe(input);
        AWSID_LOG_D(input, " -> ", v.typeName(), ' ', parseErrorKindString(v.error.kind));
        if (format == "json") {
            boost::property_tree::ptree r;
            r.put("input", input);
            r.put("valid", v.ok());
            r.put("type", v.typeName());
            r.put("error", err);
            results.push_back(make_pair("", r));
        } else if (v) {
            cout << "OK " << v.typeName() << ' ' << input << '\n';
        } else {
            cout << "ERR " << err << '\n';
        }
    }
    if (format == "json") {
        if (results.empty()) {
            // write_json has no way to express an empty array
            cout << "{\n    \"results\": []\n}\n";
            return res;
        }
        boost::property_tree::ptree doc;
        doc.add_child("results", results);
        boost::property_tree::write_json(cout, doc);
    }
    return res;
}
}

int main(int argc, char** argv) {
    pattern::SingletonGuardian<SyncLogger> logGuard(std::cerr);

    namespace po = boost::program_options;
    po::options_description desc("Allowed cmd options");
    auto helpStr =
    R"|(
This program validates AWS resource ids given as arguments, or read from
stdin (whitespace separated) when none are given. Exit status is 0 when all
are valid, 1 when any is not and 2 for usage or configuration errors.
)|";
    vector<string> inputs;
    desc.add_options()
    ("help,h", helpStr)
    ("list", "print the registered id types and the region codes, then exit")
    ("input", po::value<vector<string>>(&inputs), "the ids to check")
    ;

    std::string cfgString =
R"|(
{
    "type"      : "auto",   "__type"    : "expected id type: a type name (AwsVpcId), a prefix (vpc- or vpc), region, or auto to identify each input",
    "format"    : "text",   "__format"  : "text prints one OK/ERR line per input, json prints a results document (all values are JSON strings, valid is \"true\" or \"false\")",
    "logLevel"  : 3,        "__logLevel": "only log Warning and above by default",
    "cfg"       : "",       "__cfg"     : "json file whose values override the defaults above",
    "section"   : "",       "__section" : "section in the cfg file to use"
}
)|";

    try {
        Config config(cfgString.c_str());
        auto params = config.content();
        for (auto it = params.begin(); it != params.end();) {
            string& name = it->first;
            string& val = it->second;
            it++;
            string& comment = it->second;
            it++;
            desc.add_options()
                (name.c_str(), po::value<string>(&val)->default_value(val), comment.c_str());
        }

        po::positional_options_description p;
        p.add("input", -1);
        po::variables_map vm;
        try {
            po::store(po::command_line_parser(argc, argv).
                options(desc).positional(p).run(), vm);
            po::notify(vm);
        } catch (po::error const& e) {
            AWSID_LOG_C(e.what());
            cerr << desc << "\n";
            return 2;
        }

        if (vm.count("help")) {
            cout << desc << "\n";
            return 0;
        }
        if (vm.count("list")) {
            return printRegistry();
        }

        Config dft;
        Config cmdline;
        for (auto it = params.begin(); it != params.end(); ++it) {
            dft.put(it->first, it->second);
            if (vm.count(it->first) && !vm[it->first].defaulted()) {
                cmdline.put(it->first, it->second);
            }
        }
        config = cmdline;
        auto cfg = dft.getExt<std::string>("cfg");
        if (cmdline.count("cfg")) cfg = cmdline.getExt<std::string>("cfg");
        if (cfg.size()) {
            auto section = cmdline.count("section")
                ? cmdline.getExt<std::string>("section") : dft.getExt<std::string>("section");
            std::ifstream ifs(cfg);
            if (!ifs) {
                AWSID_LOG_C("cannot open cfg file ", cfg);
                return 2;
            }
            Config fileCfg(ifs, section.size() ? section.c_str() : nullptr);
            fileCfg.setAdditionalFallbackConfig(dft);
            config.setAdditionalFallbackConfig(fileCfg);
        } else {
            config.setAdditionalFallbackConfig(dft);
        }

        SyncLogger::instance().setMinLogLevel((SyncLogger::Level)config.getExt<int>("logLevel"));
        AWSID_LOG_N(" in effect config: ", config);

        auto type = config.getExt<std::string>("type");
        auto format = config.getExt<std::string>("format");
        if (type != "auto" && !findType(type)) {
            AWSID_LOG_C("unknown id type ", type, ", see --list");
            return 2;
        }
        if (format != "text" && format != "json") {
            AWSID_LOG_C("unknown format ", format);
            return 2;
        }

        if (inputs.empty()) {
            string tok;
            while (cin >> tok) inputs.push_back(tok);
        }
        return report(type, format, inputs);
    } catch (std::exception const& e) {
        AWSID_LOG_C(e.what());
        return 2;
    }
}
