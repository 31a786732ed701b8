// Copyright 2020-2025 Francesco Biscani (bluescarni@gmail.com), Dario Izzo (dario.izzo@gmail.com)
//
// This file is part of the decarith library.
//
// This Source Code Form is subject to the terms of the Mozilla
// Public License v. 2.0. If a copy of the MPL was not distributed
// with this file, You can obtain one at http://mozilla.org/MPL/2.0/.

#ifndef DECARITH_DETAIL_STRING_CONV_HPP
#define DECARITH_DETAIL_STRING_CONV_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <decarith/config.hpp>
#include <decarith/detail/visibility.hpp>

DECARITH_BEGIN_NAMESPACE

namespace detail
{

template <typename T>
DECARITH_DLL_PUBLIC std::string fp_to_string(const T &);

// Decomposition of a decimal literal. The represented
// value is (-1)**negative * 0.digits * 10**exponent.
struct decimal_literal {
    bool negative = false;
    // The significant digits, without leading
    // or trailing zeros. Empty for zero.
    std::string digits;
    std::int64_t exponent = 0;
};

DECARITH_DLL_PUBLIC std::optional<decimal_literal> parse_decimal_literal(std::string_view);

} // namespace detail

DECARITH_END_NAMESPACE

#endif
