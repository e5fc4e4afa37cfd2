/*
 * Copyright 2024 Redpanda Data, Inc.
 *
 * Use of this software is governed by the Business Source License
 * included in the file licenses/BSL.md
 *
 * As of the Change Date specified in that file, in accordance with
 * the Business Source License, use of this software will be governed
 * by the Apache License, Version 2.0
 */
#pragma once
#include <fmt/core.h>

#include <compare>
#include <cstddef>
#include <functional>
#include <limits>
#include <ostream>
#include <type_traits>

// A strong typedef over an arithmetic type. Values of different tags do not
// convert into each other, but read back as the raw type.
template<typename T, typename Tag>
requires std::is_arithmetic_v<T>
class named_type {
public:
    using type = T;
    constexpr named_type() = default;
    constexpr explicit named_type(const type& v)
      : _value(v) {}
    named_type(named_type&& o) noexcept = default;
    named_type& operator=(named_type&& o) noexcept = default;
    named_type(const named_type& o) noexcept = default;
    named_type& operator=(const named_type& o) noexcept = default;

    friend constexpr bool operator==(const named_type&, const named_type&)
      = default;
    friend constexpr auto operator<=>(const named_type&, const named_type&)
      = default;

    friend constexpr bool
    operator==(const named_type& lhs, const type& rhs) noexcept {
        return lhs._value == rhs;
    }
    friend constexpr auto
    operator<=>(const named_type& lhs, const type& rhs) noexcept {
        return lhs._value <=> rhs;
    }

    constexpr named_type& operator++() {
        ++_value;
        return *this;
    }
    constexpr named_type operator++(int) {
        auto copy = *this;
        ++_value;
        return copy;
    }
    constexpr named_type operator+(const type& val) const {
        return named_type(_value + val);
    }

    // explicit getter
    constexpr type operator()() const { return _value; }
    // implicit conversion operator
    constexpr operator type() const { return _value; }

    static constexpr named_type min() {
        return named_type(std::numeric_limits<type>::min());
    }
    static constexpr named_type max() {
        return named_type(std::numeric_limits<type>::max());
    }

    friend std::ostream& operator<<(std::ostream& o, const named_type& t) {
        return o << t._value;
    };

private:
    type _value = std::numeric_limits<T>::min();
};

template<typename T, typename Tag>
struct fmt::formatter<named_type<T, Tag>> : fmt::formatter<T> {
    auto format(const named_type<T, Tag>& v, fmt::format_context& ctx) const {
        return fmt::formatter<T>::format(v(), ctx);
    }
};

namespace std {
template<typename T, typename Tag>
struct hash<named_type<T, Tag>> {
    constexpr size_t operator()(const named_type<T, Tag>& x) const {
        return std::hash<T>()(x());
    }
};
} // namespace std
