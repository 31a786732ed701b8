// Copyright 2020-2025 Francesco Biscani (bluescarni@gmail.com), Dario Izzo (dario.izzo@gmail.com)
//
// This file is part of the decarith library.
//
// This Source Code Form is subject to the terms of the Mozilla
// Public License v. 2.0. If a copy of the MPL was not distributed
// with this file, You can obtain one at http://mozilla.org/MPL/2.0/.

#include <decarith/config.hpp>

#include <string>

#include <spdlog/spdlog.h>

#include <decarith/decimal.hpp>
#include <decarith/logging.hpp>

#include <catch2/catch.hpp>

#include "spdlog_oss.hpp"

using namespace decarith;

TEST_CASE("logger basic")
{
    REQUIRE(create_logger() != nullptr);
    REQUIRE(spdlog::get("decarith"));
    REQUIRE(spdlog::get("decarith").get() == create_logger());

    set_logger_level_trace();
    REQUIRE(spdlog::get("decarith")->level() == spdlog::level::trace);
    set_logger_level_debug();
    REQUIRE(spdlog::get("decarith")->level() == spdlog::level::debug);
    set_logger_level_info();
    REQUIRE(spdlog::get("decarith")->level() == spdlog::level::info);
    set_logger_level_warn();
    REQUIRE(spdlog::get("decarith")->level() == spdlog::level::warn);
    set_logger_level_err();
    REQUIRE(spdlog::get("decarith")->level() == spdlog::level::err);
    set_logger_level_critical();
    REQUIRE(spdlog::get("decarith")->level() == spdlog::level::critical);
}

TEST_CASE("promotion logging")
{
    create_logger();
    set_logger_level_trace();

    std::string out;

    {
        decarith_test::spdlog_oss oss;

        const auto d = decimal{0.1};
        REQUIRE(d.to_string() == "0.1");

        // Decimals constructed from strings are not logged.
        const auto d2 = decimal_from("0.25");
        REQUIRE(d2.to_string() == "0.25");

        oss.flush();
        out = oss.oss().str();
    }

#if defined(NDEBUG)
    REQUIRE(out.empty());
#else
    REQUIRE(out.find("Promoting a value of type 'double' to decimal via the literal '0.1'") != std::string::npos);
    REQUIRE(out.find("0.25") == std::string::npos);
#endif

    set_logger_level_info();
}
