// Copyright 2020-2025 Francesco Biscani (bluescarni@gmail.com), Dario Izzo (dario.izzo@gmail.com)
//
// This file is part of the decarith library.
//
// This Source Code Form is subject to the terms of the Mozilla
// Public License v. 2.0. If a copy of the MPL was not distributed
// with this file, You can obtain one at http://mozilla.org/MPL/2.0/.

#include <decarith/config.hpp>

#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string>

#include <decarith/detail/string_conv.hpp>

#include <catch2/catch.hpp>

using namespace decarith;

TEST_CASE("parse_decimal_literal")
{
    using detail::parse_decimal_literal;

    auto check = [](const char *in, bool neg, const char *digits, std::int64_t exponent) {
        const auto ret = parse_decimal_literal(in);

        REQUIRE(ret);
        REQUIRE(ret->negative == neg);
        REQUIRE(ret->digits == digits);
        REQUIRE(ret->exponent == exponent);
    };

    check("42", false, "42", 2);
    check("-42", true, "42", 2);
    check("+42", false, "42", 2);
    check(".5", false, "5", 0);
    check("5.", false, "5", 1);
    check("-.25", true, "25", 0);
    check("12.34", false, "1234", 2);
    check("1e3", false, "1", 4);
    check("1E+3", false, "1", 4);
    check("1.5e-7", false, "15", -6);
    check("0.00120", false, "12", -2);
    check("007.100", false, "71", 1);
    check("1200", false, "12", 4);
    check("1.2340000e+02", false, "1234", 3);

    // Zero, whatever the exponent.
    check("0", false, "", 0);
    check("-0.000", true, "", 0);
    check("0e2147483647", false, "", 0);

    // The exponent is adjusted without overflowing.
    check("12345e2147483647", false, "12345", 2147483652ll);
    check("0.0001e-2147483647", false, "1", -2147483650ll);

    for (const auto *str : {"", "+", "-", ".", "-.", "e3", ".e3", "1e", "1e-", "1e+", "1.2.3", "1..2", "1e3.5",
                            "1e3e4", " 1", "1 ", "abc", "inf", "nan", "0x1p3", "1_000", "1e99999999999"}) {
        REQUIRE(!parse_decimal_literal(str));
    }
}

TEST_CASE("fp_to_string")
{
    using detail::fp_to_string;

    REQUIRE(fp_to_string(0.1) == "0.1");
    REQUIRE(fp_to_string(-3.) == "-3");
    REQUIRE(fp_to_string(3.15) == "3.15");
    REQUIRE(fp_to_string(0.1 + 0.2) == "0.30000000000000004");
    REQUIRE(fp_to_string(1.1f) == "1.1");
    REQUIRE(fp_to_string(0.5l) == "0.5");

    // The output is always a valid decimal literal.
    for (auto x : {0.1, -3., 1e-10, 1.5e300, 123456.789}) {
        REQUIRE(detail::parse_decimal_literal(fp_to_string(x)));
    }
}
