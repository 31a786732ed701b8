// Copyright 2020-2025 Francesco Biscani (bluescarni@gmail.com), Dario Izzo (dario.izzo@gmail.com)
//
// This file is part of the decarith library.
//
// This Source Code Form is subject to the terms of the Mozilla
// Public License v. 2.0. If a copy of the MPL was not distributed
// with this file, You can obtain one at http://mozilla.org/MPL/2.0/.

#ifndef DECARITH_OPERAND_HPP
#define DECARITH_OPERAND_HPP

#include <decarith/config.hpp>

#include <cstdint>
#include <ostream>
#include <variant>

#include <boost/numeric/conversion/cast.hpp>

#include <fmt/core.h>
#include <fmt/ostream.h>

#include <decarith/decimal.hpp>
#include <decarith/detail/fwd_decl.hpp>
#include <decarith/detail/visibility.hpp>
#include <decarith/s11n.hpp>

DECARITH_BEGIN_NAMESPACE

DECARITH_DLL_PUBLIC void swap(operand &, operand &) noexcept;

// Operand whose kind (native integer, native floating-point
// or decimal) is known only at runtime.
class DECARITH_DLL_PUBLIC operand
{
    friend DECARITH_DLL_PUBLIC void swap(operand &, operand &) noexcept;

public:
    using value_type = std::variant<std::int64_t, double, decimal>;

private:
    value_type m_value;

    // Serialization.
    friend class boost::serialization::access;
    void save(boost::archive::binary_oarchive &, unsigned) const;
    void load(boost::archive::binary_iarchive &, unsigned);
    BOOST_SERIALIZATION_SPLIT_MEMBER()

public:
    operand() noexcept;
    // NOTE: integral values which do not fit in
    // std::int64_t are rejected.
    template <typename T>
        requires native_integral<T>
    explicit operand(T n) : m_value(boost::numeric_cast<std::int64_t>(n))
    {
    }
    explicit operand(float) noexcept;
    explicit operand(double) noexcept;
    explicit operand(decimal);
    operand(const operand &);
    operand(operand &&) noexcept;
    ~operand();

    operand &operator=(const operand &);
    operand &operator=(operand &&) noexcept;

    [[nodiscard]] const value_type &value() const noexcept;
};

DECARITH_DLL_PUBLIC bool is_decimal(const operand &) noexcept;
DECARITH_DLL_PUBLIC bool is_native(const operand &) noexcept;

DECARITH_DLL_PUBLIC decimal to_decimal(const operand &);

DECARITH_DLL_PUBLIC std::ostream &operator<<(std::ostream &, const operand &);

DECARITH_DLL_PUBLIC operand operator+(operand);
DECARITH_DLL_PUBLIC operand operator-(const operand &);

DECARITH_DLL_PUBLIC operand operator+(const operand &, const operand &);
DECARITH_DLL_PUBLIC operand operator-(const operand &, const operand &);
DECARITH_DLL_PUBLIC operand operator*(const operand &, const operand &);
DECARITH_DLL_PUBLIC operand operator/(const operand &, const operand &);

DECARITH_DLL_PUBLIC bool operator==(const operand &, const operand &);
DECARITH_DLL_PUBLIC bool operator!=(const operand &, const operand &);
DECARITH_DLL_PUBLIC bool operator>(const operand &, const operand &);
DECARITH_DLL_PUBLIC bool operator>=(const operand &, const operand &);
DECARITH_DLL_PUBLIC bool operator<(const operand &, const operand &);
DECARITH_DLL_PUBLIC bool operator<=(const operand &, const operand &);

DECARITH_END_NAMESPACE

namespace fmt
{

template <>
struct formatter<decarith::operand> : fmt::ostream_formatter {
};

} // namespace fmt

#endif
