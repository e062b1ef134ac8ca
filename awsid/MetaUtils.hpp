#include "awsid/Copyright.hpp"
#pragma once

#include <tuple>
#include <type_traits>
#include <utility>
#include <stddef.h>

namespace awsid {
template <typename T, typename Tuple>
struct index_in_tuple;

template <typename T, typename ...Types>
struct index_in_tuple<T, std::tuple<T, Types...>> {
    static constexpr std::size_t value = 0;
};

template <typename T>
struct index_in_tuple<T, std::tuple<>> {
    static constexpr std::size_t value = 0;
};

template <typename T, typename U, typename ...Types>
struct index_in_tuple<T, std::tuple<U, Types...>> {
    static constexpr std::size_t value = 1 + index_in_tuple<T, std::tuple<Types...>>::value;
};

template <typename T, typename Tuple>
constexpr bool is_in_tuple_v = index_in_tuple<T, Tuple>::value < std::tuple_size_v<Tuple>;

template <typename Tuple0, typename Tuple1>
struct concat_tuple;

template <typename ...T, typename ...U>
struct concat_tuple<std::tuple<T...>, std::tuple<U...>> {
    using type = std::tuple<T..., U...>;
};

/**
 * @brief visit the types of a tuple in order without instances of them
 * @details the visitor is called as v((T*)nullptr, index) and the visit stops
 * at the first call returning true
 *
 * @tparam Tuple std::tuple of the types
 * @return true if a call returned true
 */
template <typename Tuple, size_t from = 0, size_t to = std::tuple_size<Tuple>::value>
struct visit_tuple;

template <typename ...Ts, size_t from, size_t to>
struct visit_tuple<std::tuple<Ts...>, from, to> {
    template <typename Visitor>
    bool operator()(Visitor&& v) const {
        if constexpr (from >= to) {
            return false;
        } else {
            using atType = typename std::tuple_element<from, std::tuple<Ts...>>::type;
            if (v((atType*)nullptr, from)) return true;
            return visit_tuple<std::tuple<Ts...>, from + 1, to>()(
                std::forward<Visitor>(v));
        }
    }
};

/**
 * @brief call v((T*)nullptr) for the type at runtime index i of the tuple
 * @return false if i is out of range
 */
template <typename Tuple, typename Visitor>
bool visit_tuple_at(size_t i, Visitor&& v) {
    return visit_tuple<Tuple>()([i, &v](auto* tag, size_t at) {
        if (at != i) return false;
        v(tag);
        return true;
    });
}
}
