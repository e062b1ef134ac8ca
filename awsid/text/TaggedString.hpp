#include "awsid/Copyright.hpp"
#pragma once
#include "awsid/Config.hpp"
#include "awsid/Compile.hpp"
#include "awsid/ParseResult.hpp"
#include "awsid/text/Misc.h"
#include "awsid/text/XferableString.hpp"

#include <algorithm>
#include <functional>
#include <ostream>
#include <string>
#include <string_view>
#include <type_traits>
#include <stdint.h>
#include <string.h>

namespace awsid { namespace text {
/**
 * @brief an AWS resource id in the general format: a type specific prefix
 * followed by an 8 or 17 character lowercase hex unique part, e.g. vpc-1a2b3c4d
 * @details The prefix belongs to the type and is not stored. The object is the
 * unique part (zero padded to 17 bytes) plus its length, AWSID_GENERAL_ID_BYTES
 * in total for every prefix, and is trivially copyable.
 *
 * Instances only come from parse()/fromString(), which validate, or from
 * fromTrusted()/fromTrustedSuffix(), which do not.
 *
 * @tparam NAME[] the type's name for diagnostics, e.g. "AwsVpcId"
 * @tparam PREFIX[] the required prefix including the dash, e.g. "vpc-"
 */
template <char const NAME[], char const PREFIX[]>
struct TaggedString {
private:
    using ThisT = TaggedString<NAME, PREFIX>;
    friend struct std::hash<TaggedString<NAME, PREFIX>>;

    char suffix_[AWSID_LONG_SUFFIX_LEN];
    uint8_t suffixLen_;

    TaggedString(char const* s, size_t len) noexcept {
        len = std::min(len, (size_t)AWSID_LONG_SUFFIX_LEN);
        memset(suffix_, 0, sizeof(suffix_));
        if (len) memcpy(suffix_, s, len);
        suffixLen_ = static_cast<uint8_t>(len);
    }

public:
    static constexpr size_t prefixLength = std::char_traits<char>::length(PREFIX);
    static constexpr size_t shortLength = prefixLength + AWSID_SHORT_SUFFIX_LEN;
    static constexpr size_t longLength = prefixLength + AWSID_LONG_SUFFIX_LEN;
    using Text = XferableString<longLength + 1>;

    static_assert(prefixLength > 0, "empty prefix");

    static constexpr char const* typeName() { return NAME; }
    static constexpr std::string_view prefix() { return std::string_view(PREFIX, prefixLength); }

    /**
     * @brief validate s and build the id from it
     * @details checks run in this order and the first failure is reported:
     * length (prefix + 8 or prefix + 17), prefix (exact, case sensitive),
     * then every suffix byte being 0-9a-f
     *
     * @param s input text
     * @return the id or the ParseError
     */
    static ParseResult<ThisT> parse(std::string_view s) noexcept {
        auto prefixMatched = s.compare(0, prefixLength, prefix()) == 0;
        if (awsid_unlikely(s.size() != shortLength && s.size() != longLength)) {
            return ParseError::lengthMismatch(NAME, PREFIX, s.size(), prefixMatched);
        }
        if (awsid_unlikely(!prefixMatched)) {
            return ParseError::prefixMismatch(NAME, PREFIX, s.size());
        }
        auto suffix = s.substr(prefixLength);
        auto bad = findNonLowerHex(suffix);
        if (awsid_unlikely(bad != suffix.size())) {
            return ParseError::invalidSuffixChar(NAME, PREFIX, s.size()
                , prefixLength + bad, suffix[bad]);
        }
        return ThisT(suffix.data(), suffix.size());
    }

    /**
     * @brief same as parse() but throws ParseException with the full
     * diagnostic (input included) on failure
     */
    static ThisT fromString(std::string_view s) {
        auto res = parse(s);
        if (!res) {
            AWSID_THROW_WITH(ParseException, res.error().describe(s), res.error());
        }
        return res.value();
    }

    /**
     * @brief build from text known to be valid, e.g. read back from a store this
     * library wrote, skipping all checks
     * @details the caller guarantees s is a valid id of this type; nothing is
     * verified (the copy is only bounded by the storage)
     */
    static ThisT fromTrusted(std::string_view s) noexcept {
        auto skip = std::min(s.size(), prefixLength);
        return ThisT(s.data() + skip, s.size() - skip);
    }

    /**
     * @brief like fromTrusted() but the input is the unique part only
     */
    static ThisT fromTrustedSuffix(std::string_view suffix) noexcept {
        return ThisT(suffix.data(), suffix.size());
    }

    /// the unique part, a view into this object
    std::string_view suffix() const noexcept { return std::string_view(suffix_, suffixLen_); }
    size_t size() const noexcept { return prefixLength + suffixLen_; }
    bool isLongForm() const noexcept { return suffixLen_ == AWSID_LONG_SUFFIX_LEN; }

    /// full text in an inline buffer
    Text asText() const noexcept { return Text(prefix(), suffix()); }

    std::string toString() const {
        std::string res;
        res.reserve(size());
        res.append(prefix()).append(suffix());
        return res;
    }

    explicit operator std::string () const { return toString(); }

    /**
     * @brief copy the text (no NUL) to a buffer of at least longLength bytes
     * @return number of chars copied
     */
    size_t copyTo(char* to) const noexcept {
        memcpy(to, PREFIX, prefixLength);
        memcpy(to + prefixLength, suffix_, suffixLen_);
        return size();
    }

    // the prefix is common to all values of the type, comparing the
    // suffixes orders the same as comparing the full texts
    bool operator == (ThisT const& other) const { return suffix() == other.suffix(); }
    bool operator != (ThisT const& other) const { return suffix() != other.suffix(); }
    bool operator <  (ThisT const& other) const { return suffix() <  other.suffix(); }
    bool operator <= (ThisT const& other) const { return suffix() <= other.suffix(); }
    bool operator >  (ThisT const& other) const { return suffix() >  other.suffix(); }
    bool operator >= (ThisT const& other) const { return suffix() >= other.suffix(); }

    friend
    std::ostream& operator << (std::ostream& os, ThisT const& id) {
        return os << id.prefix() << id.suffix();
    }
};

template <typename T>
struct is_tagged_string : std::false_type {};

template <char const NAME[], char const PREFIX[]>
struct is_tagged_string<TaggedString<NAME, PREFIX>> : std::true_type {};

template <typename T>
constexpr bool is_tagged_string_v = is_tagged_string<T>::value;

}}

namespace std {
    template <char const NAME[], char const PREFIX[]>
    struct hash<awsid::text::TaggedString<NAME, PREFIX>> {
        size_t operator()(const awsid::text::TaggedString<NAME, PREFIX>& x) const {
            uint32_t hash = 0;
            for (auto c : x.suffix()) {
                hash += static_cast<unsigned char>(c);
                hash += (hash << 10);
                hash ^= (hash >> 6);
            }
            hash += (hash << 3);
            hash ^= (hash >> 11);
            hash += (hash << 15);
            return hash;
        }
    };
}
