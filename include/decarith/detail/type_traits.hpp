// Copyright 2020-2025 Francesco Biscani (bluescarni@gmail.com), Dario Izzo (dario.izzo@gmail.com)
//
// This file is part of the decarith library.
//
// This Source Code Form is subject to the terms of the Mozilla
// Public License v. 2.0. If a copy of the MPL was not distributed
// with this file, You can obtain one at http://mozilla.org/MPL/2.0/.

#ifndef DECARITH_DETAIL_TYPE_TRAITS_HPP
#define DECARITH_DETAIL_TYPE_TRAITS_HPP

#include <decarith/config.hpp>

#include <type_traits>

DECARITH_BEGIN_NAMESPACE

namespace detail
{

template <typename T>
using uncvref_t = std::remove_cv_t<std::remove_reference_t<T>>;

template <typename, typename...>
inline constexpr bool always_false_v = false;

// Detect character types. These are integral types
// in C++, but they do not represent numbers.
template <typename T>
struct is_char_type
    : std::disjunction<std::is_same<T, char>, std::is_same<T, wchar_t>, std::is_same<T, char8_t>,
                       std::is_same<T, char16_t>, std::is_same<T, char32_t>> {
};

template <typename T>
inline constexpr bool is_char_type_v = is_char_type<T>::value;

// Detect native integral types (i.e., the integral
// types which are not bool or character types).
template <typename T>
inline constexpr bool is_native_integral_v
    = std::is_integral_v<T> && !std::is_same_v<T, bool> && !is_char_type_v<T>;

// Detect native floating-point types.
template <typename T>
inline constexpr bool is_native_fp_v = std::is_floating_point_v<T>;

} // namespace detail

DECARITH_END_NAMESPACE

#endif
