// Copyright 2020-2025 Francesco Biscani (bluescarni@gmail.com), Dario Izzo (dario.izzo@gmail.com)
//
// This file is part of the decarith library.
//
// This Source Code Form is subject to the terms of the Mozilla
// Public License v. 2.0. If a copy of the MPL was not distributed
// with this file, You can obtain one at http://mozilla.org/MPL/2.0/.

#include <cstdint>
#include <iostream>
#include <random>
#include <stdexcept>
#include <vector>

#include <boost/program_options.hpp>

#include <fmt/core.h>

#include <spdlog/spdlog.h>
#include <spdlog/stopwatch.h>

#include <decarith/arithmetic.hpp>
#include <decarith/decimal.hpp>
#include <decarith/logging.hpp>
#include <decarith/operand.hpp>

using namespace decarith;

int main(int argc, char *argv[])
{
    namespace po = boost::program_options;

    unsigned long nevals{};
    unsigned seed{};

    po::options_description desc("Options");

    desc.add_options()("help", "produce help message")(
        "nevals", po::value<unsigned long>(&nevals)->default_value(100'000ul), "number of evaluations")(
        "seed", po::value<unsigned>(&seed)->default_value(42u), "random seed");

    po::variables_map vm;
    po::store(po::parse_command_line(argc, argv, desc), vm);
    po::notify(vm);

    if (vm.count("help") != 0u) {
        std::cout << desc << "\n";
        return 0;
    }

    if (nevals == 0u) {
        throw std::invalid_argument("The number of evaluations must be positive");
    }

    // RNG setup.
    std::mt19937 rng(seed);
    std::uniform_int_distribution<std::int64_t> cents_dist(1, 100'000);

    // Data setup: prices with two decimal places.
    std::vector<double> fp_vec;
    std::vector<decimal> dec_vec;
    std::vector<operand> op_vec;
    fp_vec.reserve(nevals);
    dec_vec.reserve(nevals);
    op_vec.reserve(nevals);

    for (auto i = 0ul; i < nevals; ++i) {
        const auto cents = cents_dist(rng);

        fp_vec.push_back(static_cast<double>(cents) / 100.);
        dec_vec.push_back(decimal{cents} / 100);
        // Alternate between the native and decimal kinds.
        op_vec.push_back(i % 2u == 0u ? operand{dec_vec.back()} : operand{fp_vec.back()});
    }

    // Fetch the logger.
    create_logger();
    set_logger_level_info();
    auto logger = spdlog::get("decarith");

    // Native path.
    spdlog::stopwatch sw;

    double fp_acc = 0;
    for (const auto &x : fp_vec) {
        fp_acc = add(fp_acc, x);
    }

    logger->info("Native run took: {}s", sw);

    // Mixed path (the native operand is promoted at every step).
    sw.reset();

    decimal mixed_acc;
    for (const auto &x : fp_vec) {
        mixed_acc = mixed_acc + x;
    }

    logger->info("Mixed run took: {}s", sw);

    // Decimal path.
    sw.reset();

    decimal dec_acc;
    for (const auto &x : dec_vec) {
        dec_acc = dec_acc + x;
    }

    logger->info("Decimal run took: {}s", sw);

    // Runtime dispatch path.
    sw.reset();

    operand op_acc;
    for (const auto &x : op_vec) {
        op_acc = op_acc + x;
    }

    logger->info("Runtime dispatch run took: {}s", sw);

    std::cout << fmt::format("Native sum : {}\n", fp_acc);
    std::cout << fmt::format("Mixed sum  : {}\n", mixed_acc);
    std::cout << fmt::format("Decimal sum: {}\n", dec_acc);
    std::cout << fmt::format("Operand sum: {}\n", op_acc);
}
