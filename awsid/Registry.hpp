#include "awsid/Copyright.hpp"
#pragma once
#include "awsid/GeneralResource.hpp"
#include "awsid/Region.hpp"
#include "awsid/MetaUtils.hpp"
#include "awsid/ParseError.hpp"
#include "awsid/Exception.hpp"

#include <array>
#include <stdexcept>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <stddef.h>

namespace awsid {

/// every registered id type, the general ones first in list order, then the region id
using AllIds = concat_tuple<GeneralResourceIds, std::tuple<AwsRegionId>>::type;

/**
 * @brief runtime description of a registered id type
 */
struct IdInfo {
    char const* typeName;
    std::string_view prefix;    ///< empty for the region id
    char const* description;
    size_t index;               ///< position in AllIds
};

namespace registry_detail {
inline constexpr char AwsRegionIdDoc[] = "AWS Region ID";
inline constexpr char IdentifierName[] = "identifier";

#define AWSID_REGISTRY_ROW(type, prefix, doc) \
    IdInfo{general_resource_detail::type##Name, prefix, general_resource_detail::type##Doc \
        , index_in_tuple<type, AllIds>::value},

inline constexpr std::array<IdInfo, std::tuple_size_v<AllIds>> table = {{
    AWSID_GENERAL_RESOURCE_LIST(AWSID_REGISTRY_ROW)
    IdInfo{AwsRegionIdName, "", AwsRegionIdDoc, index_in_tuple<AwsRegionId, AllIds>::value},
}};
#undef AWSID_REGISTRY_ROW

constexpr bool isIndexed() {
    for (size_t i = 0; i < table.size(); ++i) {
        if (table[i].index != i) return false;
    }
    return true;
}
static_assert(isIndexed(), "registry rows out of AllIds order");

template <typename Id>
ParseError parseAs(std::string_view input) {
    auto res = Id::parse(input);
    return res.error();
}

inline
ParseError
parseAs(IdInfo const& info, std::string_view input) {
    ParseError res;
    auto found = visit_tuple_at<AllIds>(info.index, [&res, input](auto* tag) {
        using Id = std::remove_pointer_t<decltype(tag)>;
        res = parseAs<Id>(input);
    });
    if (!found) {
        AWSID_THROW(std::out_of_range, "no registered type at index " << info.index);
    }
    return res;
}
}

/**
 * @brief the outcome of a runtime check
 * @details info is the type the input was checked as, nullptr if no type
 * could be resolved (unknown key, or nothing recognized the input)
 */
struct Verdict {
    IdInfo const* info = nullptr;
    ParseError error;

    bool ok() const noexcept { return info && error.ok(); }
    explicit operator bool() const noexcept { return ok(); }
    char const* typeName() const noexcept { return info ? info->typeName : ""; }
};

/// all registered types, indexed the same as AllIds
inline
std::array<IdInfo, std::tuple_size_v<AllIds>> const&
registry() {
    return registry_detail::table;
}

/**
 * @brief look up a registered type
 *
 * @param key the type name (AwsVpcId), the prefix (vpc-), the prefix without
 * its dash (vpc) or "region"
 * @return nullptr if there is no such type
 */
inline
IdInfo const*
findType(std::string_view key) {
    if (key.empty()) return nullptr;
    auto const& table = registry();
    if (key == "region") {
        return &table[index_in_tuple<AwsRegionId, AllIds>::value];
    }
    for (auto const& info : table) {
        if (key == info.typeName) return &info;
        if (info.prefix.empty()) continue;
        if (key == info.prefix
            || key == info.prefix.substr(0, info.prefix.size() - 1)) {
            return &info;
        }
    }
    return nullptr;
}

/**
 * @brief validate input as the type registered under key
 * @details an unknown key yields a Verdict without info and ParseErrorKind::unknown_type
 */
inline
Verdict
check(std::string_view key, std::string_view input) {
    Verdict res;
    res.info = findType(key);
    if (!res.info) {
        res.error = ParseError::of(ParseErrorKind::unknown_type
            , registry_detail::IdentifierName, input.size());
        return res;
    }
    res.error = registry_detail::parseAs(*res.info, input);
    return res;
}

/**
 * @brief find the registered type that accepts input
 * @details types whose prefix starts the input are tried, the longest prefix
 * wins; a region code is tried when no prefix matches. If nothing accepts the
 * input the Verdict reports the error of the longest matching prefix, or
 * ParseErrorKind::unrecognized when there is none.
 */
inline
Verdict
identify(std::string_view input) {
    auto const& table = registry();
    Verdict accepted;
    Verdict rejected;
    for (auto const& info : table) {
        if (info.prefix.empty()) continue;
        if (input.compare(0, info.prefix.size(), info.prefix) != 0) continue;
        auto err = registry_detail::parseAs(info, input);
        auto& to = err.ok() ? accepted : rejected;
        if (!to.info || info.prefix.size() > to.info->prefix.size()) {
            to.info = &info;
            to.error = err;
        }
    }
    if (accepted.info) return accepted;
    if (rejected.info) return rejected;

    auto const& region = table[index_in_tuple<AwsRegionId, AllIds>::value];
    auto err = registry_detail::parseAs(region, input);
    if (err.ok()) {
        accepted.info = &region;
        return accepted;
    }
    rejected.error = ParseError::of(ParseErrorKind::unrecognized
        , registry_detail::IdentifierName, input.size());
    return rejected;
}

}
