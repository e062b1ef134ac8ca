#include "awsid/Copyright.hpp"
#pragma once

#include <algorithm>
#include <functional>
#include <ostream>
#include <string>
#include <string_view>
#include <stdint.h>
#include <string.h>

namespace awsid { namespace text {
/**
 * @brief inline, NUL terminated char buffer with a compile time capacity
 * @details it holds no pointer so it can be copied byte-wise, stored in
 * shared memory or handed out of a function without touching the heap.
 * Text longer than the capacity is truncated; the types in this library size
 * it so that never happens.
 *
 * @tparam SIZE bytes reserved, including the terminating NUL
 */
template <uint16_t SIZE>
struct XferableString {
    static_assert(SIZE > 0, "needs room for the NUL");
private:
    using ThisT = XferableString<SIZE>;
    char v_[SIZE];
    friend struct std::hash<XferableString<SIZE>>;

public:
    using rawType = char[SIZE];
    enum{capacity = SIZE - 1,};

    XferableString() {
        memset(v_, 0, SIZE);
    }

    explicit XferableString(std::string_view s)
    : XferableString() {
        append(0, s);
    }

    /**
     * @brief concatenation of two pieces, typically a prefix and a suffix
     */
    XferableString(std::string_view head, std::string_view tail)
    : XferableString() {
        append(append(0, head), tail);
    }

    operator std::string () const {
        return std::string(view());
    }

    char const* c_str() const { return v_; }
    std::string_view view() const { return std::string_view(v_, size()); }

    size_t size() const {
        char const* b = v_;
        return std::find(b, b + capacity, '\x00') - b;
    }
    bool empty() const { return !v_[0]; }

    bool operator == (ThisT const& other) const {
        return view() == other.view();
    }
    bool operator != (ThisT const& other) const {
        return !(*this == other);
    }
    bool operator < (ThisT const& other) const {
        return view() < other.view();
    }
    bool operator == (std::string_view other) const {
        return view() == other;
    }
    bool operator != (std::string_view other) const {
        return view() != other;
    }

    friend
    std::ostream& operator << (std::ostream& os, ThisT const& s) {
        return os << s.view();
    }

    /**
     * @brief copy the chars (no NUL) to a buffer of at least capacity bytes
     * @return number of chars copied
     */
    size_t copyTo(char* to) const {
        auto s = view();
        if (s.size()) memcpy(to, s.data(), s.size());
        return s.size();
    }

private:
    size_t append(size_t at, std::string_view s) {
        auto n = std::min(s.size(), (size_t)capacity - at);
        if (n) memcpy(v_ + at, s.data(), n);
        return at + n;
    }
};

}}

namespace std {
    template <uint16_t SIZE>
    struct hash<awsid::text::XferableString<SIZE>> {
        size_t operator()(const awsid::text::XferableString<SIZE>& x) const {
            return std::hash<std::string_view>()(x.view());
        }
    };
}
