// Copyright 2020-2025 Francesco Biscani (bluescarni@gmail.com), Dario Izzo (dario.izzo@gmail.com)
//
// This file is part of the decarith library.
//
// This Source Code Form is subject to the terms of the Mozilla
// Public License v. 2.0. If a copy of the MPL was not distributed
// with this file, You can obtain one at http://mozilla.org/MPL/2.0/.

#ifndef DECARITH_DETAIL_FWD_DECL_HPP
#define DECARITH_DETAIL_FWD_DECL_HPP

#include <decarith/config.hpp>
#include <decarith/detail/visibility.hpp>

DECARITH_BEGIN_NAMESPACE

class DECARITH_DLL_PUBLIC decimal;
class DECARITH_DLL_PUBLIC operand;

DECARITH_END_NAMESPACE

#endif
