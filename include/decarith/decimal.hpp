// Copyright 2020-2025 Francesco Biscani (bluescarni@gmail.com), Dario Izzo (dario.izzo@gmail.com)
//
// This file is part of the decarith library.
//
// This Source Code Form is subject to the terms of the Mozilla
// Public License v. 2.0. If a copy of the MPL was not distributed
// with this file, You can obtain one at http://mozilla.org/MPL/2.0/.

#ifndef DECARITH_DECIMAL_HPP
#define DECARITH_DECIMAL_HPP

#include <decarith/config.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <ostream>
#include <string>
#include <string_view>

#include <boost/multiprecision/cpp_dec_float.hpp>

#include <fmt/core.h>
#include <fmt/ostream.h>

#include <decarith/detail/fwd_decl.hpp>
#include <decarith/detail/type_traits.hpp>
#include <decarith/detail/visibility.hpp>
#include <decarith/s11n.hpp>

DECARITH_BEGIN_NAMESPACE

template <typename T>
concept native_integral = detail::is_native_integral_v<T>;

template <typename T>
concept native_fp = detail::is_native_fp_v<T>;

// The native (i.e., built-in) numerical types.
template <typename T>
concept native_number = native_integral<T> || native_fp<T>;

// Result of a three-way comparison.
enum class ordering : int { less = -1, equal = 0, greater = 1 };

enum class rounding {
    // Towards zero.
    down,
    // To nearest, ties away from zero.
    half_up,
    // To nearest, ties to even.
    half_even,
    // To nearest, ties towards zero.
    half_down,
    // Away from zero.
    up,
    // Towards negative infinity.
    floor,
    // Towards positive infinity.
    ceiling
};

// Immutable arbitrary-precision decimal number.
//
// The arithmetic is delegated to Boost.Multiprecision's decimal
// floating-point backend, which stores at least DECARITH_DECIMAL_DIGITS10
// significant decimal digits. Values are always finite.
class DECARITH_DLL_PUBLIC decimal
{
public:
    using value_type = boost::multiprecision::number<boost::multiprecision::cpp_dec_float<DECARITH_DECIMAL_DIGITS10>,
                                                     boost::multiprecision::et_off>;

private:
    value_type m_value;

    // Serialization.
    friend class boost::serialization::access;
    void save(boost::archive::binary_oarchive &, unsigned) const;
    void load(boost::archive::binary_iarchive &, unsigned);
    BOOST_SERIALIZATION_SPLIT_MEMBER()

    void finalise();

public:
    decimal();
    explicit decimal(value_type);
    explicit decimal(std::string_view);
    // NOTE: integral values are always converted exactly.
    template <typename T>
        requires native_integral<T>
    explicit decimal(T n) : m_value(n)
    {
    }
    // NOTE: floating-point values are converted via their
    // shortest round-tripping decimal representation.
    explicit decimal(float);
    explicit decimal(double);
    explicit decimal(long double);
    decimal(const decimal &);
    decimal(decimal &&) noexcept;
    ~decimal();

    decimal &operator=(const decimal &);
    decimal &operator=(decimal &&) noexcept;

    [[nodiscard]] const value_type &value() const noexcept;

    [[nodiscard]] std::string to_string() const;
};

DECARITH_DLL_PUBLIC decimal decimal_from(std::string_view);

namespace detail
{

DECARITH_DLL_PUBLIC std::size_t hash(const decimal &) noexcept;

} // namespace detail

DECARITH_DLL_PUBLIC std::ostream &operator<<(std::ostream &, const decimal &);

DECARITH_DLL_PUBLIC bool is_zero(const decimal &);
DECARITH_DLL_PUBLIC bool is_negative(const decimal &);
DECARITH_DLL_PUBLIC bool is_integer(const decimal &);

DECARITH_DLL_PUBLIC decimal operator+(decimal);
DECARITH_DLL_PUBLIC decimal operator-(const decimal &);

DECARITH_DLL_PUBLIC decimal abs(const decimal &);

DECARITH_DLL_PUBLIC decimal add(const decimal &, const decimal &);
DECARITH_DLL_PUBLIC decimal sub(const decimal &, const decimal &);
DECARITH_DLL_PUBLIC decimal mul(const decimal &, const decimal &);
DECARITH_DLL_PUBLIC decimal div(const decimal &, const decimal &);

DECARITH_DLL_PUBLIC ordering compare(const decimal &, const decimal &) noexcept;
DECARITH_DLL_PUBLIC bool equal(const decimal &, const decimal &) noexcept;

DECARITH_DLL_PUBLIC decimal round(const decimal &, std::int32_t, rounding = rounding::half_up);

DECARITH_END_NAMESPACE

namespace std
{

template <>
struct hash<decarith::decimal> {
    size_t operator()(const decarith::decimal &d) const noexcept
    {
        return decarith::detail::hash(d);
    }
};

} // namespace std

// fmt formatter for decimal, implemented
// on top of the streaming operator.
namespace fmt
{

template <>
struct formatter<decarith::decimal> : fmt::ostream_formatter {
};

} // namespace fmt

#endif
