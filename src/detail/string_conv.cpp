// Copyright 2020-2025 Francesco Biscani (bluescarni@gmail.com), Dario Izzo (dario.izzo@gmail.com)
//
// This file is part of the decarith library.
//
// This Source Code Form is subject to the terms of the Mozilla
// Public License v. 2.0. If a copy of the MPL was not distributed
// with this file, You can obtain one at http://mozilla.org/MPL/2.0/.

#include <decarith/config.hpp>

#include <charconv>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>

#include <fmt/format.h>

#include <decarith/detail/string_conv.hpp>
#include <decarith/detail/type_traits.hpp>
#include <decarith/detail/visibility.hpp>

DECARITH_BEGIN_NAMESPACE

namespace detail
{

// NOTE: fmt produces the shortest representation that
// round-trips to the original value.
template <typename T>
std::string fp_to_string(const T &x)
{
    if constexpr (std::is_same_v<T, float> || std::is_same_v<T, double> || std::is_same_v<T, long double>) {
        return fmt::format("{}", x);
    } else {
        static_assert(always_false_v<T>, "Unhandled type.");
    }
}

template DECARITH_DLL_PUBLIC std::string fp_to_string<float>(const float &);
template DECARITH_DLL_PUBLIC std::string fp_to_string<double>(const double &);
template DECARITH_DLL_PUBLIC std::string fp_to_string<long double>(const long double &);

namespace
{

bool is_digit(char c)
{
    return c >= '0' && c <= '9';
}

// Consume a (possibly empty) sequence of decimal digits starting at idx.
std::string_view consume_digits(std::string_view s, std::string_view::size_type &idx)
{
    const auto start = idx;

    while (idx < s.size() && is_digit(s[idx])) {
        ++idx;
    }

    return s.substr(start, idx - start);
}

} // namespace

// Validate a decimal literal and decompose it into its
// significant digits and exponent. The accepted grammar is:
//
// [+-]? (digits ('.' digits?)? | '.' digits) ([eE] [+-]? digits)?
//
// An empty optional is returned if the literal is malformed.
std::optional<decimal_literal> parse_decimal_literal(std::string_view s)
{
    std::string_view::size_type idx = 0;

    bool neg = false;
    if (idx < s.size() && (s[idx] == '+' || s[idx] == '-')) {
        neg = s[idx] == '-';
        ++idx;
    }

    const auto int_digits = consume_digits(s, idx);

    std::string_view frac_digits;
    if (idx < s.size() && s[idx] == '.') {
        ++idx;
        frac_digits = consume_digits(s, idx);
    }

    if (int_digits.empty() && frac_digits.empty()) {
        // No mantissa digits at all (e.g., "", "-", ".", "e5").
        return {};
    }

    std::int32_t exponent = 0;
    if (idx < s.size() && (s[idx] == 'e' || s[idx] == 'E')) {
        ++idx;

        bool exp_neg = false;
        if (idx < s.size() && (s[idx] == '+' || s[idx] == '-')) {
            exp_neg = s[idx] == '-';
            ++idx;
        }

        const auto exp_digits = consume_digits(s, idx);
        if (exp_digits.empty()) {
            return {};
        }

        const auto [ptr, ec] = std::from_chars(exp_digits.data(), exp_digits.data() + exp_digits.size(), exponent);
        if (ec != std::errc{}) {
            // Exponent out of range.
            return {};
        }

        if (exp_neg) {
            exponent = -exponent;
        }
    }

    if (idx != s.size()) {
        // Trailing garbage.
        return {};
    }

    decimal_literal ret;
    ret.negative = neg;

    std::string digits(int_digits);
    digits += frac_digits;

    const auto first_nz = digits.find_first_not_of('0');
    if (first_nz == std::string::npos) {
        // Zero.
        return ret;
    }

    const auto last_nz = digits.find_last_not_of('0');

    ret.digits = digits.substr(first_nz, last_nz - first_nz + 1u);
    // NOTE: the exponent is computed in 64-bit arithmetic, so that
    // it cannot overflow for any 32-bit input exponent.
    ret.exponent = static_cast<std::int64_t>(exponent) + static_cast<std::int64_t>(int_digits.size())
                   - static_cast<std::int64_t>(first_nz);

    return ret;
}

} // namespace detail

DECARITH_END_NAMESPACE
