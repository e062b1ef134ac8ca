#include "awsid/Copyright.hpp"
#pragma once

#include <ostream>
#include <string_view>
#include <stdio.h>
#include <stddef.h>

namespace awsid { namespace text {
/**
 * @brief the alphabet AWS generates id suffixes from
 */
constexpr
bool
isLowerHexDigit(char c) noexcept {
    return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
}

/**
 * @brief index of the first byte in s that is not a lowercase hex digit
 * @return s.size() if all are
 */
constexpr
size_t
findNonLowerHex(std::string_view s) noexcept {
    for (size_t i = 0; i < s.size(); ++i) {
        if (!isLowerHexDigit(s[i])) return i;
    }
    return s.size();
}

/**
 * @brief write s for diagnostics: printable ascii as is, the rest as \xNN
 */
inline
void
writeEscaped(std::ostream& os, std::string_view s) {
    for (auto c : s) {
        auto u = static_cast<unsigned char>(c);
        if (u >= 0x20 && u < 0x7f) {
            os << c;
        } else {
            char buf[5];
            snprintf(buf, sizeof(buf), "\\x%02x", u);
            os << buf;
        }
    }
}

}}
