#include "awsid/Copyright.hpp"
#pragma once
#include "awsid/ParseResult.hpp"
#include "awsid/ShortCode.hpp"
#include "awsid/text/TaggedString.hpp"

#include <boost/optional.hpp>
#include <boost/property_tree/ptree.hpp>

#include <string>

/**
 * @namespace awsid::serialization
 * ids as plain strings inside boost property trees (json, ini, xml)
 */
namespace awsid { namespace serialization {
/**
 * @brief property_tree translator between the text form and an id
 * @details put always succeeds; get validates and yields nothing for invalid
 * text, which ptree turns into ptree_bad_data or an empty optional
 *
 * @tparam Id a TaggedString or ShortCode instantiation
 */
template <typename Id>
struct IdTranslator {
    using internal_type = std::string;
    using external_type = Id;

    boost::optional<external_type> get_value(internal_type const& s) const {
        auto res = Id::parse(s);
        if (!res) return boost::none;
        return res.value();
    }

    boost::optional<internal_type> put_value(external_type const& id) const {
        return id.toString();
    }
};

/**
 * @brief read an id from pt at path, keeping the reason when it is invalid
 * @details throws ptree_bad_path if path does not exist
 *
 * @param pt the tree
 * @param path where the text is
 * @return the id or the ParseError
 */
template <typename Id>
ParseResult<Id>
getId(boost::property_tree::ptree const& pt
    , boost::property_tree::ptree::path_type const& path) {
    return Id::parse(pt.get<std::string>(path));
}
}}

namespace boost { namespace property_tree {
template <char const NAME[], char const PREFIX[]>
struct translator_between<std::string, awsid::text::TaggedString<NAME, PREFIX>> {
    using type = awsid::serialization::IdTranslator<awsid::text::TaggedString<NAME, PREFIX>>;
};

template <char const NAME[], typename Traits>
struct translator_between<std::string, awsid::ShortCode<NAME, Traits>> {
    using type = awsid::serialization::IdTranslator<awsid::ShortCode<NAME, Traits>>;
};
}}
