#include "awsid/Copyright.hpp"
#pragma once
#include "awsid/ParseError.hpp"
#include "awsid/Exception.hpp"

#include <optional>
#include <utility>

namespace awsid {

/**
 * @brief either a parsed value or the ParseError explaining why there is none
 *
 * @tparam T the identifier type
 */
template <typename T>
struct ParseResult {
    ParseResult(T const& v) noexcept
    : value_(v) {
    }

    ParseResult(ParseError const& e) noexcept
    : error_(e) {
    }

    bool ok() const noexcept { return value_.has_value(); }
    explicit operator bool() const noexcept { return ok(); }

    /**
     * @brief the parsed value
     * @details throws ParseException if there is none
     */
    T const& value() const {
        if (!value_) {
            AWSID_THROW_WITH(ParseException
                , "failed to initialize " << error_.targetType << ": " << error_, error_);
        }
        return *value_;
    }

    /// kind is ParseErrorKind::none when ok()
    ParseError const& error() const noexcept { return error_; }

    T valueOr(T const& dft) const noexcept {
        return value_ ? *value_ : dft;
    }

private:
    std::optional<T> value_;
    ParseError error_;
};

}
