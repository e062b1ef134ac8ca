#include "awsid/Copyright.hpp"
#pragma once
#include "awsid/ParseResult.hpp"

#include <array>
#include <functional>
#include <ostream>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <stddef.h>

namespace awsid {
/**
 * @brief a value from a small closed set of textual codes, held as its enum tag
 *
 * @tparam NAME[] the type's name for diagnostics
 * @tparam Traits provides
 *  - Code: an enum class whose values are 0..N-1
 *  - table: constexpr std::array of Entry{Code, text, description} indexed by Code
 */
template <char const NAME[], typename Traits>
struct ShortCode {
    using Code = typename Traits::Code;
    using ThisT = ShortCode<NAME, Traits>;
    static constexpr size_t count = Traits::table.size();

    static constexpr char const* typeName() { return NAME; }

    constexpr explicit ShortCode(Code c) noexcept
    : v_(c) {}

    /**
     * @brief exact, case sensitive lookup of s among the known codes
     */
    static ParseResult<ThisT> parse(std::string_view s) noexcept {
        for (auto const& e : Traits::table) {
            if (e.text == s) return ThisT(e.code);
        }
        return ParseError::of(ParseErrorKind::unknown_code, NAME, s.size());
    }

    /**
     * @brief same as parse() but throws ParseException on failure
     */
    static ThisT fromString(std::string_view s) {
        auto res = parse(s);
        if (!res) {
            AWSID_THROW_WITH(ParseException, res.error().describe(s), res.error());
        }
        return res.value();
    }

    /// every known value in tag order
    static constexpr std::array<ThisT, count> all() {
        return all(std::make_index_sequence<count>());
    }

    constexpr Code code() const noexcept { return v_; }
    constexpr explicit operator Code() const noexcept { return v_; }

    constexpr std::string_view asText() const noexcept { return entry().text; }
    constexpr char const* description() const noexcept { return entry().description; }
    std::string toString() const { return std::string(asText()); }
    explicit operator std::string () const { return toString(); }

    constexpr bool operator <  (ThisT t) const { return v_ <  t.v_;}
    constexpr bool operator >  (ThisT t) const { return v_ >  t.v_;}
    constexpr bool operator <= (ThisT t) const { return v_ <= t.v_;}
    constexpr bool operator >= (ThisT t) const { return v_ >= t.v_;}
    constexpr bool operator == (ThisT t) const { return v_ == t.v_;}
    constexpr bool operator != (ThisT t) const { return v_ != t.v_;}

    friend
    std::ostream& operator << (std::ostream& os, ThisT const& t) {
        return os << t.asText();
    }

private:
    constexpr auto const& entry() const noexcept {
        return Traits::table[static_cast<size_t>(v_)];
    }

    template <size_t... Is>
    static constexpr std::array<ThisT, count> all(std::index_sequence<Is...>) {
        return {{ThisT(static_cast<Code>(Is))...}};
    }

    Code v_;
};

/**
 * @brief true if table[i].code == i for every row, which entry() relies on
 */
template <typename Table>
constexpr bool isIndexedByCode(Table const& table) {
    for (size_t i = 0; i < table.size(); ++i) {
        if (static_cast<size_t>(table[i].code) != i) return false;
    }
    return true;
}

/**
 * @brief true if the texts are strictly ascending, so tag order is text order
 */
template <typename Table>
constexpr bool isSortedByText(Table const& table) {
    for (size_t i = 1; i < table.size(); ++i) {
        if (!(table[i - 1].text < table[i].text)) return false;
    }
    return true;
}

template <typename T>
struct is_short_code : std::false_type {};

template <char const NAME[], typename Traits>
struct is_short_code<ShortCode<NAME, Traits>> : std::true_type {};

template <typename T>
constexpr bool is_short_code_v = is_short_code<T>::value;
}

namespace std {
    template <char const NAME[], typename Traits>
    struct hash<awsid::ShortCode<NAME, Traits>> {
        size_t operator()(const awsid::ShortCode<NAME, Traits>& x) const {
            return std::hash<size_t>()(static_cast<size_t>(x.code()));
        }
    };
}
