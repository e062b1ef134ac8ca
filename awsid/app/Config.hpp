#include "awsid/Copyright.hpp"
#pragma once

#include "awsid/Exception.hpp"
#include "awsid/ParseError.hpp"
#include "awsid/Serialization.hpp"

#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/json_parser.hpp>

#include <list>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <unordered_set>
#include <utility>
#include <vector>
#include <string.h>

/**
 * @namespace awsid::app
 * the layer programs built on the id types use: configuration and logging
 */
namespace awsid { namespace app {

/**
 * @brief thrown when a configured value is not a valid id of the requested type
 */
struct ConfigException
: std::runtime_error {
    ConfigException(std::string const& what, ParseError const& e)
    : std::runtime_error(what)
    , error(e) {
    }

    ParseError error;
};

namespace config_detail {

/**
 * @brief class to hold a configuration
 * @details it is based on a two level (fallback and section) json.
 * top level for the fallback values and lower level for the section specific values.
 * a Config instance is always constructed to be associated to 0 or 1 specific section.
 * shown below:
 *
 *      {
 *          "type": "auto",
 *          "format": "text",
 *          "strict": {
 *               "type": "AwsVpcId",
 *               "defaultVpc": "vpc-0a1b2c3d"
 *          },
 *          "report": {
 *               "format": "json"
 *          }
 *      }
 */
struct Config
: boost::property_tree::ptree {
    using Base = boost::property_tree::ptree;

    /**
     * @brief empty config
     */
    Config(){}

    Config(Config const& other)
    : Base(other)
    , section_(other.section_)
    , fallbackConfig_(other.fallbackConfig_
        ?new Config(*other.fallbackConfig_)
        :nullptr)
    {}

    Config& operator = (Config const& other) {
        (Base&)*this = other;
        section_ = other.section_;
        fallbackConfig_.reset(other.fallbackConfig_
            ?new Config(*other.fallbackConfig_)
            :nullptr);
        return *this;
    }

    /**
     * @brief construct using stream, optionally specifying the section name
     * @details if the section is nullptr, just use the fallback values. if
     * the section name cannot be found, throw an exception
     *
     * @param is stream as input providing a json stream
     * @param section pointing to the effective section in the json above
     */
    explicit
    Config(std::istream&& is, char const* section = nullptr)
    : section_(section?section:"") {
        read_json(is, (Base&)*this);
        get_child(section_);
    }

    explicit
    Config(std::istream& is, char const* section = nullptr)
    : section_(section?section:"") {
        read_json(is, (Base&)*this);
        get_child(section_);
    }

    /**
     * @brief construct using a json string, optionally specifying the section name
     */
    explicit
    Config(char const* json, char const* section = nullptr)
    : Config(std::istringstream(json), section)
    {}

    /**
     * @brief construct using another ptree as fallbacks, optionally specifying the section name
     */
    Config(boost::property_tree::ptree const& t, char const* section = nullptr)
    : Base(t)
    , section_(section?section:"") {
        get_child(section_);
    }

    /**
     * @brief set additional defaults
     * @details previously set defaults take precedence
     *
     * @param c a config holding configuration values
     * @return *this
     */
    Config& setAdditionalFallbackConfig(Config const& c) {
        if (!fallbackConfig_) {
            fallbackConfig_.reset(new Config(c));
        } else {
            fallbackConfig_->setAdditionalFallbackConfig(c);
        }
        return *this;
    }

    /**
     * @brief forward the call to ptree's put but return Config
     * @details ids are written in their text form
     */
    template <typename ...Args>
    Config& put(Args&&... args) {
        Base::put(std::forward<Args>(args)...);
        return *this;
    }

    /**
     * @brief put an array of values
     */
    template <typename Array>
    Config& putArray(const path_type& param, Array&& array) {
        Base a;
        for (auto const& v : array) {
            Base elem;
            elem.put("", v);
            a.push_back(std::make_pair("", elem));
        }
        Base::put_child(param, a);
        return *this;
    }

    /**
     * @brief put an array of values
     *
     * @param values a delimit separated string for array values
     * @param delimit delimit such as "," or "[sep]"
     * @return object itself
     */
    Config& putArray(const path_type& param, std::string const& values
        , char const* delimit) {
        std::vector<std::string> array;
        auto s = values;
        while(true) {
            auto pos = s.find(delimit);
            auto v = s.substr(0, pos);
            if (v.size()) array.push_back(v);
            if (pos != std::string::npos) {
                s.erase(0,  pos + strlen(delimit));
            } else {
                break;
            }
        }
        return putArray(param, array);
    }

    /**
     * @brief      Gets the child from the config.
     * @details check the section for it, if not found, try the top level,
     * then the fallback configs. Throw exception ptree_bad_path if all fail
     *
     * @param[in]  param  config parameter name
     *
     * @return     ptree reference to the child.
     */
    boost::property_tree::ptree const& getChildExt(const path_type& param) const {
        auto sec = section_;
        auto res = get_child_optional(sec/=param);
        if (!res) {
            res = get_child_optional(param);
            if (!res) {
                if (fallbackConfig_) {
                    return fallbackConfig_->getChildExt(param);
                } else {
                    throw boost::property_tree::ptree_bad_path(
                        section_.dump() + ":invalid param and no fallback Config set", param);
                }
            }
        }
        return *res;
    }

    /**
     * @brief get a value from the config
     * @details check the section for it, if not found, try the top level,
     * then the fallback configs. If throwIfMissing, throw exception ptree_bad_path if all fail
     *
     * @param param config parameter name
     * @param throwIfMissing - true if no config found, throw an exception; otherwise return empty
     * @tparam T type of the value, needs to be default constructible; use getId for ids
     * @return result
     */
    template <typename T>
    T getExt(const path_type& param, bool throwIfMissing = true) const {
        auto sec = section_;
        auto res = get_optional<T>(sec/=param);
        if (!res) {
            res = get_optional<T>(param);
            if (!res) {
                if (get_child_optional(param)) {
                    throw boost::property_tree::ptree_bad_data(
                        section_.dump() + ":invalid data", param);
                }
                if (fallbackConfig_) {
                    return fallbackConfig_->getExt<T>(param, throwIfMissing);
                } else if (throwIfMissing) {
                    throw boost::property_tree::ptree_bad_path(
                        section_.dump() + ":invalid param and no fallback Config set", param);
                } else {
                    return T{};
                }
            }
        }
        return *res;
    }

    /**
     * @brief get an id from the config, resolved the same way as getExt
     * @details throws ptree_bad_path if missing, ConfigException carrying the
     * ParseError if the configured text is not a valid Id
     *
     * @tparam Id a TaggedString or ShortCode instantiation
     * @param param config parameter name
     * @return the id
     */
    template <typename Id>
    Id getId(const path_type& param) const {
        auto s = getExt<std::string>(param);
        auto res = Id::parse(s);
        if (!res) {
            AWSID_THROW_WITH(ConfigException
                , param.dump() << ": " << res.error().describe(s), res.error());
        }
        return res.value();
    }

    /**
     * @brief get a vector of value from the json array
     * @details check the section for it, if not found, try the top level,
     * then the fallback configs. Id element types are validated, an invalid
     * element throws ptree_bad_data
     *
     * @param param config parameter name
     * @tparam T type of the value
     * @return result
     */
    template <typename T>
    std::vector<T> getArray(const path_type& param) const {
        std::vector<T> res;
        auto sec = section_;
        auto children = get_child_optional(sec/=param);
        if (!children) children = get_child_optional(param);
        if (children) {
            for (auto& v : *children) {
                if (v.first.empty()) {
                    // [""] is reserved for an empty array due to ptree limits for json array
                    if (children->size() > 1
                        || v.second.get_value<std::string>() != "") {
                        res.push_back(v.second.get_value<T>());
                    }
                } else {
                    throw boost::property_tree::ptree_bad_data(
                        section_.dump() + ":param not pointing to array ", param);
                }
            }
            return res;
        } else if (fallbackConfig_) {
            return fallbackConfig_->getArray<T>(param);
        }
        throw boost::property_tree::ptree_bad_path(
            section_.dump() + ":invalid array param and no fallback Config set", param);
    }

    /**
     * @brief fill in a variable with a configured value retrieved using getExt
     * @details example cfg(abc, "abc")(def, "def");
     *
     * @param to destination
     * @param param config parameter
     * @param throwIfMissing - true if no config found, throw an exception
     *
     * @return the Config object itself
     */
    template <typename T>
    std::enable_if_t<!text::is_tagged_string_v<T> && !is_short_code_v<T>, Config const&>
    operator()(T& to, const boost::property_tree::ptree::path_type& param
        , bool throwIfMissing = true) const {
        to = getExt<T>(param, throwIfMissing);
        return *this;
    }

    /**
     * @brief fill in an id with a configured value retrieved using getId
     * @details an id always has a value so a missing param always throws
     */
    template <typename Id>
    std::enable_if_t<text::is_tagged_string_v<Id> || is_short_code_v<Id>, Config const&>
    operator()(Id& to, const boost::property_tree::ptree::path_type& param) const {
        to = getId<Id>(param);
        return *this;
    }

    /**
     * @brief get contents of all the effective configure in the form of list of string pairs
     * @details only effective ones are shown
     *
     * @param skipThese skip those config params
     * @return list of string pairs in the original order of ptree nodes
     */
    std::list<std::pair<std::string, std::string>> content(
        std::unordered_set<std::string> const& skipThese = std::unordered_set<std::string>()) const {
        std::list<std::pair<std::string, std::string>> res;
        std::unordered_set<std::string> history(skipThese);
        auto secTree = get_child_optional(section_);
        if (secTree) {
            for (auto& p : *secTree) {
                if (history.find(p.first) == history.end()) {
                    history.insert(p.first);
                    if (p.second.empty()) { //leaf
                        res.push_back(make_pair(p.first, p.second.get_value<std::string>()));
                    }
                }
            }
        }
        for (auto& p : *this) {
            if (history.find(p.first) == history.end()) {
                history.insert(p.first);
                if (p.second.empty()) { //leaf
                    res.push_back(make_pair(p.first, p.second.get_value<std::string>()));
                }
            }
        }
        if (fallbackConfig_) {
            auto more = fallbackConfig_->content(history);
            res.insert(res.end(), more.begin(), more.end());
        }
        return res;
    }

    /**
     * @brief      stream out the effective settings
     */
    friend std::ostream& operator << (std::ostream& os, Config const& cfg) {
        for (auto& r : cfg.content()) {
            os << r.first << '=' << r.second << std::endl;
        }
        if (cfg.fallbackConfig_) {
            os << "next in line fallback" << std::endl;
            os << *cfg.fallbackConfig_ << std::endl;
        }
        return os;
    }

    /**
     * @brief update the config from the cmd line arg list via key=val args:
     * argv example: type=vpc format=json subnets=subnet-0a1b2c3d,subnet-4e5f6a7b
     * if a key in argv does not exist in the config, throw
     * @param argc how many args in argv; when return: how many args are not processed
     * since there is no "=" in them (not throw in these cases) - for example "--help"
     * @param argv parameters, when return, it contains only unprocessed params
     * @param arrayDelimit when setting array use this str as delimit
     * @return *this
     */
    Config& updateWithCmdline(int& argc, char const* argv[], char const* arrayDelimit = ",")  {
        int unprocessed = 0;
        while (unprocessed != argc) {
            auto arg = std::string(argv[unprocessed]);
            auto pos = arg.find("=");
            if (pos == arg.npos) {
                unprocessed++;
                continue;
            }
            auto paramPath = arg.substr(0, pos);
            arg.erase(0,  pos + 1);
            auto const& child = getChildExt(paramPath);
            if (child.size() && child.begin()->first == "") {
                putArray(paramPath, arg, arrayDelimit);
            } else {
                put(paramPath, arg);
            }
            memmove(argv + unprocessed, argv + unprocessed + 1
                , sizeof(char*) * (argc - unprocessed - 1));
            --argc;
        }
        return *this;
    }

private:
    boost::property_tree::ptree::path_type section_;
    std::unique_ptr<Config> fallbackConfig_;
};
} //config_detail

using Config = config_detail::Config;
}}
