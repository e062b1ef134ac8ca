#include "awsid/Copyright.hpp"
#pragma once
#include "awsid/Config.hpp"
#include "awsid/text/Misc.h"

#include <ostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <stddef.h>
#include <stdint.h>

namespace awsid {

/**
 * @brief why a text could not become an identifier
 */
enum class ParseErrorKind : uint8_t {
    none = 0,               ///< no error
    length_mismatch,        ///< total length is neither of the two valid lengths
    prefix_mismatch,        ///< leading bytes differ from the required prefix
    invalid_suffix_char,    ///< a suffix byte is not 0-9a-f
    unknown_code,           ///< no known short code matches
    unknown_type,           ///< the registry has no type under the requested key
    unrecognized,           ///< no registered prefix matches the input
};

constexpr char const* parseErrorKindString(ParseErrorKind k) noexcept {
    switch (k) {
        case ParseErrorKind::none:
            return "none";
        case ParseErrorKind::length_mismatch:
            return "length_mismatch";
        case ParseErrorKind::prefix_mismatch:
            return "prefix_mismatch";
        case ParseErrorKind::invalid_suffix_char:
            return "invalid_suffix_char";
        case ParseErrorKind::unknown_code:
            return "unknown_code";
        case ParseErrorKind::unknown_type:
            return "unknown_type";
        case ParseErrorKind::unrecognized:
            return "unrecognized";
    }
    return "unknown";
}

/**
 * @brief details of a failed parse
 * @details it does not keep the input text so it stays allocation free;
 * use describe() with the input for the complete diagnostic
 */
struct ParseError {
    ParseErrorKind kind = ParseErrorKind::none;
    char const* targetType = "";        ///< e.g. "AwsVpcId"
    char const* expectedPrefix = "";    ///< empty for short codes
    size_t inputLength = 0;
    size_t position = 0;                ///< offset into the input, invalid_suffix_char only
    char offendingByte = 0;             ///< invalid_suffix_char only
    bool prefixMatched = false;         ///< the input starts with expectedPrefix

    static ParseError lengthMismatch(char const* type, char const* prefix, size_t len
        , bool prefixMatched) noexcept {
        ParseError e;
        e.kind = ParseErrorKind::length_mismatch;
        e.targetType = type;
        e.expectedPrefix = prefix;
        e.inputLength = len;
        e.prefixMatched = prefixMatched;
        return e;
    }

    static ParseError prefixMismatch(char const* type, char const* prefix, size_t len) noexcept {
        ParseError e = lengthMismatch(type, prefix, len, false);
        e.kind = ParseErrorKind::prefix_mismatch;
        return e;
    }

    static ParseError invalidSuffixChar(char const* type, char const* prefix
        , size_t len, size_t pos, char c) noexcept {
        ParseError e = lengthMismatch(type, prefix, len, true);
        e.kind = ParseErrorKind::invalid_suffix_char;
        e.position = pos;
        e.offendingByte = c;
        return e;
    }

    static ParseError of(ParseErrorKind kind, char const* type, size_t len) noexcept {
        ParseError e;
        e.kind = kind;
        e.targetType = type;
        e.inputLength = len;
        return e;
    }

    bool ok() const noexcept { return kind == ParseErrorKind::none; }

    /**
     * @brief full diagnostic, e.g.
     * failed to initialize AwsAmiId from "ami-1234567": the unique part must be 8 or 17 characters long, not 7
     *
     * @param input the text that failed to parse
     */
    std::string describe(std::string_view input) const {
        std::ostringstream os;
        os << "failed to initialize " << targetType << " from \"";
        text::writeEscaped(os, input);
        os << "\": " << *this;
        return os.str();
    }

    /// only the detail part of the diagnostic
    friend std::ostream& operator << (std::ostream& os, ParseError const& e) {
        std::string_view prefix(e.expectedPrefix);
        switch (e.kind) {
            case ParseErrorKind::none:
                return os << "no error";
            case ParseErrorKind::length_mismatch:
                // without the prefix there is no unique part to measure
                if (!e.prefixMatched) {
                    return os << "the input must be " << prefix.size() + AWSID_SHORT_SUFFIX_LEN
                        << " or " << prefix.size() + AWSID_LONG_SUFFIX_LEN
                        << " characters long, not " << e.inputLength;
                }
                return os << "the unique part must be " << AWSID_SHORT_SUFFIX_LEN
                    << " or " << AWSID_LONG_SUFFIX_LEN << " characters long, not "
                    << e.inputLength - prefix.size();
            case ParseErrorKind::prefix_mismatch:
                return os << "incorrect prefix, expected \"" << prefix << '"';
            case ParseErrorKind::invalid_suffix_char:
                os << "the unique part contains the non lowercase hex character '";
                text::writeEscaped(os, std::string_view(&e.offendingByte, 1));
                return os << "' at position " << e.position;
            case ParseErrorKind::unknown_code:
                return os << "unknown code";
            case ParseErrorKind::unknown_type:
                return os << "unknown identifier type";
            case ParseErrorKind::unrecognized:
                return os << "no registered identifier type matches";
        }
        return os << parseErrorKindString(e.kind);
    }
};

/**
 * @brief thrown by the throwing conveniences (fromString, ParseResult::value)
 */
struct ParseException
: std::invalid_argument {
    ParseException(std::string const& what, ParseError const& e)
    : std::invalid_argument(what)
    , error(e) {
    }

    ParseError error;
};

}
