// Copyright 2020-2025 Francesco Biscani (bluescarni@gmail.com), Dario Izzo (dario.izzo@gmail.com)
//
// This file is part of the decarith library.
//
// This Source Code Form is subject to the terms of the Mozilla
// Public License v. 2.0. If a copy of the MPL was not distributed
// with this file, You can obtain one at http://mozilla.org/MPL/2.0/.

#ifndef DECARITH_ARITHMETIC_HPP
#define DECARITH_ARITHMETIC_HPP

#include <decarith/config.hpp>

#include <concepts>
#include <type_traits>

#include <decarith/decimal.hpp>
#include <decarith/exceptions.hpp>

DECARITH_BEGIN_NAMESPACE

// The types which can appear as operands in the
// arithmetic and comparison functions below.
template <typename T>
concept decimable = native_number<T> || std::same_as<T, decimal>;

namespace detail
{

template <typename T, typename U>
concept native_operands = native_number<T> && native_number<U>;

// Pairs of operands at least one of which is a decimal. These
// are the operands for which the operators are overloaded.
template <typename T, typename U>
concept decimal_operands = decimable<T> && decimable<U> && (std::same_as<T, decimal> || std::same_as<U, decimal>);

// Coerce an operand into a decimal. Decimals are passed
// through without copies.
inline const decimal &as_decimal(const decimal &d) noexcept
{
    return d;
}

template <typename T>
    requires native_number<T>
decimal as_decimal(const T &x)
{
    return decimal{x};
}

} // namespace detail

// Promotion of a decimable to decimal.
template <typename T>
    requires decimable<T>
decimal promote(const T &x)
{
    return detail::as_decimal(x);
}

// NOTE: the functions below all share the same structure:
// - if both operands are native numbers, the built-in operator is used,
// - otherwise, the native operand (if any) is promoted to decimal and
//   the decimal primitive is invoked.

template <typename T, typename U>
    requires decimable<T> && decimable<U>
auto add(const T &a, const U &b)
{
    if constexpr (detail::native_operands<T, U>) {
        return a + b;
    } else {
        return add(detail::as_decimal(a), detail::as_decimal(b));
    }
}

template <typename T, typename U>
    requires decimable<T> && decimable<U>
auto sub(const T &a, const U &b)
{
    if constexpr (detail::native_operands<T, U>) {
        return a - b;
    } else {
        return sub(detail::as_decimal(a), detail::as_decimal(b));
    }
}

template <typename T, typename U>
    requires decimable<T> && decimable<U>
auto mul(const T &a, const U &b)
{
    if constexpr (detail::native_operands<T, U>) {
        return a * b;
    } else {
        return mul(detail::as_decimal(a), detail::as_decimal(b));
    }
}

template <typename T, typename U>
    requires decimable<T> && decimable<U>
auto div(const T &a, const U &b)
{
    if constexpr (detail::native_operands<T, U>) {
        if constexpr (native_integral<T> && native_integral<U>) {
            // NOTE: integral division by zero is undefined behaviour.
            if (b == 0) {
                throw zero_division_error("Integral division by zero");
            }
        }

        return a / b;
    } else {
        return div(detail::as_decimal(a), detail::as_decimal(b));
    }
}

template <typename T, typename U>
    requires decimable<T> && decimable<U>
bool equal(const T &a, const U &b)
{
    if constexpr (detail::native_operands<T, U>) {
        return a == b;
    } else {
        return equal(detail::as_decimal(a), detail::as_decimal(b));
    }
}

template <typename T, typename U>
    requires decimable<T> && decimable<U>
bool not_equal(const T &a, const U &b)
{
    return !equal(a, b);
}

template <typename T, typename U>
    requires decimable<T> && decimable<U>
bool greater(const T &a, const U &b)
{
    if constexpr (detail::native_operands<T, U>) {
        return a > b;
    } else {
        return compare(detail::as_decimal(a), detail::as_decimal(b)) == ordering::greater;
    }
}

template <typename T, typename U>
    requires decimable<T> && decimable<U>
bool greater_equal(const T &a, const U &b)
{
    return equal(a, b) || greater(a, b);
}

template <typename T, typename U>
    requires decimable<T> && decimable<U>
bool less(const T &a, const U &b)
{
    if constexpr (detail::native_operands<T, U>) {
        return a < b;
    } else {
        return compare(detail::as_decimal(a), detail::as_decimal(b)) == ordering::less;
    }
}

template <typename T, typename U>
    requires decimable<T> && decimable<U>
bool less_equal(const T &a, const U &b)
{
    return equal(a, b) || less(a, b);
}

// Operators. These are found via ADL whenever
// at least one operand is a decimal.

template <typename T, typename U>
    requires detail::decimal_operands<T, U>
decimal operator+(const T &a, const U &b)
{
    return add(a, b);
}

template <typename T, typename U>
    requires detail::decimal_operands<T, U>
decimal operator-(const T &a, const U &b)
{
    return sub(a, b);
}

template <typename T, typename U>
    requires detail::decimal_operands<T, U>
decimal operator*(const T &a, const U &b)
{
    return mul(a, b);
}

template <typename T, typename U>
    requires detail::decimal_operands<T, U>
decimal operator/(const T &a, const U &b)
{
    return div(a, b);
}

template <typename T, typename U>
    requires detail::decimal_operands<T, U>
bool operator==(const T &a, const U &b)
{
    return equal(a, b);
}

template <typename T, typename U>
    requires detail::decimal_operands<T, U>
bool operator!=(const T &a, const U &b)
{
    return not_equal(a, b);
}

template <typename T, typename U>
    requires detail::decimal_operands<T, U>
bool operator>(const T &a, const U &b)
{
    return greater(a, b);
}

template <typename T, typename U>
    requires detail::decimal_operands<T, U>
bool operator>=(const T &a, const U &b)
{
    return greater_equal(a, b);
}

template <typename T, typename U>
    requires detail::decimal_operands<T, U>
bool operator<(const T &a, const U &b)
{
    return less(a, b);
}

template <typename T, typename U>
    requires detail::decimal_operands<T, U>
bool operator<=(const T &a, const U &b)
{
    return less_equal(a, b);
}

DECARITH_END_NAMESPACE

#endif
