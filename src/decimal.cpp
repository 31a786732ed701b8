// Copyright 2020-2025 Francesco Biscani (bluescarni@gmail.com), Dario Izzo (dario.izzo@gmail.com)
//
// This file is part of the decarith library.
//
// This Source Code Form is subject to the terms of the Mozilla
// Public License v. 2.0. If a copy of the MPL was not distributed
// with this file, You can obtain one at http://mozilla.org/MPL/2.0/.

// NOTE: this needs to go first because of the
// SPDLOG_ACTIVE_LEVEL definition.
#include <decarith/detail/logging_impl.hpp>

#include <decarith/config.hpp>

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <ios>
#include <limits>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <typeinfo>
#include <utility>

#include <boost/core/demangle.hpp>
#include <boost/multiprecision/cpp_dec_float.hpp>

#include <fmt/core.h>
#include <fmt/format.h>

#include <decarith/decimal.hpp>
#include <decarith/detail/string_conv.hpp>
#include <decarith/detail/visibility.hpp>
#include <decarith/exceptions.hpp>
#include <decarith/s11n.hpp>

DECARITH_BEGIN_NAMESPACE

namespace detail
{

namespace
{

// Build a value of the backend type from a decomposed literal.
// An empty optional is returned if the value is outside the
// range of the backend.
std::optional<decimal::value_type> literal_to_value(const decimal_literal &lit)
{
    using limits = std::numeric_limits<decimal::value_type>;

    if (lit.digits.empty()) {
        return decimal::value_type{};
    }

    // Exponent of the leading digit.
    const auto sci_exp = lit.exponent - 1;

    if (sci_exp > limits::max_exponent10 || sci_exp < limits::min_exponent10) {
        return {};
    }

    const std::string_view digits = lit.digits;
    const auto str = fmt::format("{}{}.{}e{}", lit.negative ? "-" : "", digits[0],
                                 digits.size() > 1u ? digits.substr(1) : std::string_view{"0"}, sci_exp);

    decimal::value_type ret;

    try {
        ret = decimal::value_type(str.c_str());
    } catch (const std::runtime_error &) {
        // LCOV_EXCL_START
        return {};
        // LCOV_EXCL_STOP
    }

    using boost::multiprecision::isfinite;

    // NOTE: a non-zero literal must never collapse to zero.
    if (!isfinite(ret) || ret.is_zero()) {
        return {}; // LCOV_EXCL_LINE
    }

    return ret;
}

// Parse a string into a value of the backend type. Throws
// malformed_literal_error if s is not a valid decimal literal,
// if it has more significant digits than the backend can represent
// exactly, or if it is out of range.
decimal::value_type parse_decimal(std::string_view s)
{
    const auto lit = parse_decimal_literal(s);

    if (!lit) {
        throw malformed_literal_error(fmt::format("The string '{}' is not a valid decimal literal", s));
    }

    constexpr auto max_digits = static_cast<std::size_t>(std::numeric_limits<decimal::value_type>::digits10);

    if (lit->digits.size() > max_digits) {
        throw malformed_literal_error(
            fmt::format("The decimal literal '{}' has {} significant digits, but at most {} are supported", s,
                        lit->digits.size(), max_digits));
    }

    auto ret = literal_to_value(*lit);

    if (!ret) {
        throw malformed_literal_error(fmt::format("The decimal literal '{}' is out of range", s));
    }

    return std::move(*ret);
}

template <typename T>
decimal::value_type fp_to_decimal(T x)
{
    using std::isfinite;

    if (!isfinite(x)) {
        throw std::invalid_argument(fmt::format("Cannot convert the non-finite floating-point value {} to a decimal", x));
    }

    const auto str = fp_to_string(x);

    SPDLOG_LOGGER_DEBUG(get_logger(), "Promoting a value of type '{}' to decimal via the literal '{}'",
                        boost::core::demangle(typeid(T).name()), str);

    return decimal::value_type(str.c_str());
}

} // namespace

} // namespace detail

decimal::decimal() = default;

decimal::decimal(value_type x) : m_value(std::move(x))
{
    finalise();
}

decimal::decimal(std::string_view s) : m_value(detail::parse_decimal(s))
{
    finalise();
}

decimal::decimal(float x) : m_value(detail::fp_to_decimal(x))
{
    finalise();
}

decimal::decimal(double x) : m_value(detail::fp_to_decimal(x))
{
    finalise();
}

decimal::decimal(long double x) : m_value(detail::fp_to_decimal(x))
{
    finalise();
}

decimal::decimal(const decimal &) = default;

decimal::decimal(decimal &&) noexcept = default;

decimal::~decimal() = default;

decimal &decimal::operator=(const decimal &) = default;

decimal &decimal::operator=(decimal &&) noexcept = default;

// Check the value and bring it into canonical form.
void decimal::finalise()
{
    using boost::multiprecision::isfinite;

    if (!isfinite(m_value)) {
        throw std::overflow_error("A non-finite value was produced by a decimal operation");
    }

    // NOTE: make sure that negative zero is not
    // distinguishable from positive zero.
    if (m_value.is_zero()) {
        m_value = value_type{};
    }
}

void decimal::save(boost::archive::binary_oarchive &ar, unsigned) const
{
    // NOTE: store all the digits of the backend,
    // so that the round trip is exact.
    const auto str = m_value.str(0, std::ios_base::scientific);

    ar << str;
}

void decimal::load(boost::archive::binary_iarchive &ar, unsigned)
{
    std::string str;
    ar >> str;

    *this = decimal{value_type(str.c_str())};
}

const decimal::value_type &decimal::value() const noexcept
{
    return m_value;
}

// NOTE: all the digits stored by the backend are printed, in plain notation
// with trailing zeros removed, unless the magnitude of the value requires
// scientific notation.
std::string decimal::to_string() const
{
    return m_value.str(0, std::ios_base::fmtflags{});
}

decimal decimal_from(std::string_view s)
{
    return decimal{s};
}

namespace detail
{

// NOLINTNEXTLINE(bugprone-exception-escape)
std::size_t hash(const decimal &d) noexcept
{
    return std::hash<decimal::value_type>{}(d.value());
}

} // namespace detail

std::ostream &operator<<(std::ostream &os, const decimal &d)
{
    return os << d.to_string();
}

bool is_zero(const decimal &d)
{
    return d.value().is_zero();
}

bool is_negative(const decimal &d)
{
    return d.value().sign() < 0;
}

bool is_integer(const decimal &d)
{
    return trunc(d.value()) == d.value();
}

decimal operator+(decimal d)
{
    return d;
}

decimal operator-(const decimal &d)
{
    return decimal{-d.value()};
}

decimal abs(const decimal &d)
{
    return decimal{abs(d.value())};
}

decimal add(const decimal &a, const decimal &b)
{
    return decimal{a.value() + b.value()};
}

decimal sub(const decimal &a, const decimal &b)
{
    return decimal{a.value() - b.value()};
}

decimal mul(const decimal &a, const decimal &b)
{
    return decimal{a.value() * b.value()};
}

decimal div(const decimal &a, const decimal &b)
{
    if (is_zero(b)) {
        throw zero_division_error(fmt::format("Cannot divide the decimal value {} by zero", a));
    }

    return decimal{a.value() / b.value()};
}

// NOLINTNEXTLINE(bugprone-exception-escape)
ordering compare(const decimal &a, const decimal &b) noexcept
{
    const auto ret = a.value().compare(b.value());

    if (ret < 0) {
        return ordering::less;
    } else if (ret > 0) {
        return ordering::greater;
    } else {
        return ordering::equal;
    }
}

// NOTE: the backend is normalised, hence equality
// does not depend on the number of trailing zeros
// in the original representation.
// NOLINTNEXTLINE(bugprone-exception-escape)
bool equal(const decimal &a, const decimal &b) noexcept
{
    return a.value() == b.value();
}

namespace detail
{

namespace
{

// Increment by one the non-negative integer represented
// by the decimal digits in str.
void increment_digits(std::string &str)
{
    for (auto it = str.rbegin(); it != str.rend(); ++it) {
        if (*it != '9') {
            ++*it;
            return;
        }

        *it = '0';
    }

    str.insert(str.begin(), '1');
}

} // namespace

} // namespace detail

// NOTE: the rounding operates on the exact digits of the value,
// hence it is not affected by the range of the backend.
decimal round(const decimal &d, std::int32_t places, rounding mode)
{
    if (is_zero(d)) {
        return d;
    }

    const auto lit = detail::parse_decimal_literal(d.value().str(0, std::ios_base::scientific));
    // LCOV_EXCL_START
    if (!lit) {
        throw std::invalid_argument(fmt::format("Unable to extract the digits of the decimal value {}", d));
    }
    // LCOV_EXCL_STOP

    const auto &digits = lit->digits;

    // Number of digits to the left of the rounding position.
    const auto keep = lit->exponent + places;

    if (keep >= static_cast<std::int64_t>(digits.size())) {
        // Nothing to round.
        return d;
    }

    // The retained digits, representing an integer
    // in units of 10**-places.
    auto kept = keep > 0 ? digits.substr(0, static_cast<std::size_t>(keep)) : std::string{};

    // Position of the discarded part with respect to one half unit.
    // NOTE: the discarded digits are never all zeros, because
    // the last digit of the literal is nonzero.
    int half_cmp = -1;
    if (keep >= 0) {
        const auto rem = std::string_view(digits).substr(static_cast<std::size_t>(keep));

        if (rem[0] == '5') {
            half_cmp = rem.size() > 1u ? 1 : 0;
        } else {
            half_cmp = rem[0] > '5' ? 1 : -1;
        }
    }

    const auto odd = !kept.empty() && (kept.back() - '0') % 2 == 1;

    // Round away from zero?
    bool away = false;

    switch (mode) {
        case rounding::down:
            away = false;
            break;
        case rounding::up:
            away = true;
            break;
        case rounding::floor:
            away = lit->negative;
            break;
        case rounding::ceiling:
            away = !lit->negative;
            break;
        case rounding::half_up:
            away = half_cmp >= 0;
            break;
        case rounding::half_down:
            away = half_cmp > 0;
            break;
        case rounding::half_even:
            away = half_cmp > 0 || (half_cmp == 0 && odd);
            break;
        default:
            // LCOV_EXCL_START
            throw std::invalid_argument(
                fmt::format("Invalid rounding mode {} passed to round()", static_cast<int>(mode)));
            // LCOV_EXCL_STOP
    }

    if (away) {
        detail::increment_digits(kept);
    }

    if (kept.empty()) {
        return decimal{};
    }

    detail::decimal_literal res;
    res.negative = lit->negative;
    res.exponent = static_cast<std::int64_t>(kept.size()) - places;
    res.digits = std::move(kept);
    res.digits.erase(res.digits.find_last_not_of('0') + 1u);

    auto ret = detail::literal_to_value(res);

    if (!ret) {
        throw std::overflow_error(
            fmt::format("The result of rounding the decimal value {} to {} places is out of range", d, places));
    }

    return decimal{std::move(*ret)};
}

DECARITH_END_NAMESPACE
