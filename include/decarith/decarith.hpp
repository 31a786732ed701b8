// Copyright 2020-2025 Francesco Biscani (bluescarni@gmail.com), Dario Izzo (dario.izzo@gmail.com)
//
// This file is part of the decarith library.
//
// This Source Code Form is subject to the terms of the Mozilla
// Public License v. 2.0. If a copy of the MPL was not distributed
// with this file, You can obtain one at http://mozilla.org/MPL/2.0/.

#ifndef DECARITH_DECARITH_HPP
#define DECARITH_DECARITH_HPP

#include <decarith/arithmetic.hpp>
#include <decarith/decimal.hpp>
#include <decarith/exceptions.hpp>
#include <decarith/logging.hpp>
#include <decarith/operand.hpp>
#include <decarith/s11n.hpp>

#endif
