/*
 * AEVUMDB COMMUNITY LICENSE
 * Version 1.0, February 2026
 *
 * Copyright (c) 2026 Ananda Firmansyah.
 * Official Organization: AevumDB (https://github.com/aevumdb)
 *
 * This source code is licensed under the AevumDB Community License.
 * You may not use this file except in compliance with the License.
 */

/**
 * @file main.cpp
 * @brief Command-line entry point of the `ulidkit` tool.
 *
 * @details
 * This file contains the `main` function which orchestrates:
 * 1. Argument Parsing (optionally seeded from a JSON configuration file).
 * 2. Dependency Resolution for the host.
 * 3. Generation of the requested number of ULIDs, one per line on stdout.
 */

#include "ulidkit/error.hpp"
#include "ulidkit/generator/generator.hpp"
#include "ulidkit/infra/cli.hpp"
#include "ulidkit/infra/config.hpp"
#include "ulidkit/infra/logger.hpp"

#include <cstdint>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

using ulidkit::infra::CommandLine;
using ulidkit::infra::Logger;
using ulidkit::infra::LogLevel;

namespace {

constexpr int kExitUsage = 2;

} // namespace

/**
 * @brief Main Execution Entry Point.
 */
int main(int argc, char* argv[])
{
    // stdout carries the identifiers; every diagnostic goes to stderr.
    Logger::route_all_to_stderr(true);

    ulidkit::infra::Options opts;
    try {
        opts = CommandLine::parse(std::vector<std::string>(argv + 1, argv + argc));
    } catch (const std::invalid_argument& e) {
        std::cerr << argv[0] << ": " << e.what() << "\n";
        CommandLine::print_usage(std::cerr, argv[0]);
        return kExitUsage;
    }

    if (opts.help) {
        CommandLine::print_usage(std::cout, argv[0]);
        return 0;
    }

    try {
        // 1. Configuration: file first, then command-line overrides.
        ulidkit::infra::Settings settings = CommandLine::resolve(opts);
        Logger::set_level(settings.log_level);

        Logger::log(LogLevel::DEBUG, "Config: " + std::string(settings.monotonic ? "monotonic"
                                                                                 : "non-monotonic") +
                                         ", entropy device '" + settings.random_device + "'");

        // 2. Dependency resolution and generator construction.
        auto next = ulidkit::generator::Generator::create(settings.to_generator_config());

        // 3. Emit.
        for (std::uint64_t i = 0; i < opts.count; ++i) {
            std::cout << next(opts.time) << '\n';
        }
        std::cout.flush();

    } catch (const ulidkit::UlidError& e) {
        Logger::log(LogLevel::FATAL,
                    std::string(ulidkit::to_string(e.code())) + ": " + std::string(e.what()));
        return 1;
    } catch (const std::exception& e) {
        Logger::log(LogLevel::FATAL, "System: Critical Failure: " + std::string(e.what()));
        return 1;
    }

    return 0;
}
