// Copyright 2020-2025 Francesco Biscani (bluescarni@gmail.com), Dario Izzo (dario.izzo@gmail.com)
//
// This file is part of the decarith library.
//
// This Source Code Form is subject to the terms of the Mozilla
// Public License v. 2.0. If a copy of the MPL was not distributed
// with this file, You can obtain one at http://mozilla.org/MPL/2.0/.

#ifndef DECARITH_EXCEPTIONS_HPP
#define DECARITH_EXCEPTIONS_HPP

#include <stdexcept>

#include <decarith/config.hpp>
#include <decarith/detail/visibility.hpp>

DECARITH_BEGIN_NAMESPACE

// Exception to signal division by zero.
struct DECARITH_DLL_PUBLIC_INLINE_CLASS zero_division_error final : std::domain_error {
    using std::domain_error::domain_error;
};

// Exception to signal that a string could not be parsed
// into a decimal value.
struct DECARITH_DLL_PUBLIC_INLINE_CLASS malformed_literal_error final : std::invalid_argument {
    using std::invalid_argument::invalid_argument;
};

DECARITH_END_NAMESPACE

#endif
