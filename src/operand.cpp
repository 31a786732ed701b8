// Copyright 2020-2025 Francesco Biscani (bluescarni@gmail.com), Dario Izzo (dario.izzo@gmail.com)
//
// This file is part of the decarith library.
//
// This Source Code Form is subject to the terms of the Mozilla
// Public License v. 2.0. If a copy of the MPL was not distributed
// with this file, You can obtain one at http://mozilla.org/MPL/2.0/.

#include <decarith/config.hpp>

#include <cstddef>
#include <cstdint>
#include <exception>
#include <ostream>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <variant>

// NOTE: the safe numerics library uses std::terminate()
// without including <exception>, hence <exception> must be
// included beforehand:
//
// https://github.com/boostorg/safe_numerics/issues/139
#include <boost/safe_numerics/safe_integer.hpp>

#include <fmt/core.h>

#include <decarith/arithmetic.hpp>
#include <decarith/decimal.hpp>
#include <decarith/detail/string_conv.hpp>
#include <decarith/detail/type_traits.hpp>
#include <decarith/exceptions.hpp>
#include <decarith/operand.hpp>
#include <decarith/s11n.hpp>

DECARITH_BEGIN_NAMESPACE

operand::operand() noexcept : m_value(std::int64_t(0)) {}

operand::operand(float x) noexcept : m_value(static_cast<double>(x)) {}

operand::operand(double x) noexcept : m_value(x) {}

operand::operand(decimal d) : m_value(std::move(d)) {}

operand::operand(const operand &) = default;

// NOLINTNEXTLINE(bugprone-exception-escape)
operand::operand(operand &&other) noexcept : m_value(std::move(other.m_value))
{
    // NOTE: ensure other is equivalent to a
    // default-constructed operand.
    other.m_value.emplace<std::int64_t>(0);
}

operand::~operand() = default;

operand &operand::operator=(const operand &other)
{
    if (this != &other) {
        *this = operand(other);
    }

    return *this;
}

// NOLINTNEXTLINE(bugprone-exception-escape)
operand &operand::operator=(operand &&other) noexcept
{
    if (this != &other) {
        m_value = std::move(other.m_value);
        // NOTE: ensure other is equivalent to a
        // default-constructed operand.
        other.m_value.emplace<std::int64_t>(0);
    }

    return *this;
}

// NOTE: the archive contains the index of the active
// alternative followed by its value.
void operand::save(boost::archive::binary_oarchive &ar, unsigned) const
{
    const auto idx = m_value.index();
    ar << idx;

    std::visit([&ar](const auto &x) { ar << x; }, m_value);
}

void operand::load(boost::archive::binary_iarchive &ar, unsigned)
{
    std::size_t idx{};
    ar >> idx;

    switch (idx) {
        case 0u: {
            std::int64_t n{};
            ar >> n;
            m_value = n;
            break;
        }
        case 1u: {
            double x{};
            ar >> x;
            m_value = x;
            break;
        }
        case 2u: {
            decimal d;
            ar >> d;
            m_value = std::move(d);
            break;
        }
        default:
            // LCOV_EXCL_START
            throw std::invalid_argument(
                fmt::format("Invalid operand kind {} loaded during the deserialisation of an operand", idx));
            // LCOV_EXCL_STOP
    }
}

const operand::value_type &operand::value() const noexcept
{
    return m_value;
}

void swap(operand &o0, operand &o1) noexcept
{
    std::swap(o0.m_value, o1.m_value);
}

bool is_decimal(const operand &o) noexcept
{
    return std::holds_alternative<decimal>(o.value());
}

bool is_native(const operand &o) noexcept
{
    return !is_decimal(o);
}

decimal to_decimal(const operand &o)
{
    return std::visit([](const auto &x) { return promote(x); }, o.value());
}

std::ostream &operator<<(std::ostream &os, const operand &o)
{
    std::visit(
        [&os](const auto &x) {
            using type = detail::uncvref_t<decltype(x)>;

            if constexpr (std::is_same_v<type, double>) {
                os << detail::fp_to_string(x);
            } else {
                os << x;
            }
        },
        o.value());

    return os;
}

namespace detail
{

namespace
{

// Arithmetic between two native integers is checked
// for overflow.
using safe_int64_t = boost::safe_numerics::safe<std::int64_t>;

template <typename T, typename U>
inline constexpr bool both_int64_v
    = std::conjunction_v<std::is_same<uncvref_t<T>, std::int64_t>, std::is_same<uncvref_t<U>, std::int64_t>>;

} // namespace

} // namespace detail

operand operator+(operand o)
{
    return o;
}

operand operator-(const operand &o)
{
    return std::visit(
        [](const auto &x) -> operand {
            using type = detail::uncvref_t<decltype(x)>;

            if constexpr (std::is_same_v<type, std::int64_t>) {
                return operand{static_cast<std::int64_t>(-detail::safe_int64_t(x))};
            } else {
                return operand{-x};
            }
        },
        o.value());
}

operand operator+(const operand &o1, const operand &o2)
{
    return std::visit(
        [](const auto &x, const auto &y) -> operand {
            if constexpr (detail::both_int64_v<decltype(x), decltype(y)>) {
                return operand{static_cast<std::int64_t>(detail::safe_int64_t(x) + y)};
            } else {
                return operand{add(x, y)};
            }
        },
        o1.value(), o2.value());
}

operand operator-(const operand &o1, const operand &o2)
{
    return std::visit(
        [](const auto &x, const auto &y) -> operand {
            if constexpr (detail::both_int64_v<decltype(x), decltype(y)>) {
                return operand{static_cast<std::int64_t>(detail::safe_int64_t(x) - y)};
            } else {
                return operand{sub(x, y)};
            }
        },
        o1.value(), o2.value());
}

operand operator*(const operand &o1, const operand &o2)
{
    return std::visit(
        [](const auto &x, const auto &y) -> operand {
            if constexpr (detail::both_int64_v<decltype(x), decltype(y)>) {
                return operand{static_cast<std::int64_t>(detail::safe_int64_t(x) * y)};
            } else {
                return operand{mul(x, y)};
            }
        },
        o1.value(), o2.value());
}

operand operator/(const operand &o1, const operand &o2)
{
    return std::visit(
        [](const auto &x, const auto &y) -> operand {
            if constexpr (detail::both_int64_v<decltype(x), decltype(y)>) {
                if (y == 0) {
                    throw zero_division_error("Integral division by zero");
                }

                // NOTE: this can still overflow when dividing
                // the minimum value by -1.
                return operand{static_cast<std::int64_t>(detail::safe_int64_t(x) / y)};
            } else {
                return operand{div(x, y)};
            }
        },
        o1.value(), o2.value());
}

// NOTE: the comparison operators do not need any
// special handling for integral operands.

bool operator==(const operand &o1, const operand &o2)
{
    return std::visit([](const auto &x, const auto &y) { return equal(x, y); }, o1.value(), o2.value());
}

bool operator!=(const operand &o1, const operand &o2)
{
    return !(o1 == o2);
}

bool operator>(const operand &o1, const operand &o2)
{
    return std::visit([](const auto &x, const auto &y) { return greater(x, y); }, o1.value(), o2.value());
}

bool operator>=(const operand &o1, const operand &o2)
{
    return std::visit([](const auto &x, const auto &y) { return greater_equal(x, y); }, o1.value(), o2.value());
}

bool operator<(const operand &o1, const operand &o2)
{
    return std::visit([](const auto &x, const auto &y) { return less(x, y); }, o1.value(), o2.value());
}

bool operator<=(const operand &o1, const operand &o2)
{
    return std::visit([](const auto &x, const auto &y) { return less_equal(x, y); }, o1.value(), o2.value());
}

DECARITH_END_NAMESPACE
