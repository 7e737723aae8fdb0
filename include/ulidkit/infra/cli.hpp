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
 * @file cli.hpp
 * @brief Argument parsing and settings resolution for the `ulidkit` tool.
 *
 * @details
 * Flags are switches: a flag that is present turns its setting on, an absent
 * flag defers to the configuration file (or the documented default).
 */

#pragma once

#include "ulidkit/infra/config.hpp"

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace ulidkit::infra {

/**
 * @struct Options
 * @brief Parsed command line.
 */
struct Options {
    std::uint64_t count = 1;
    std::optional<double> time;
    std::optional<std::string> config_path;
    bool monotonic = false;
    bool allow_insecure = false;
    bool allow_imprecise = false;
    bool quiet = false;
    bool help = false;
};

/**
 * @class CommandLine
 * @brief Static helpers behind `main`.
 */
class CommandLine {
  public:
    /**
     * @brief Parses @p args (program name excluded).
     *
     * @throws std::invalid_argument on an unknown flag, a missing value, a
     * `--count` that is not a non-negative integer or a `--time` that is not a number.
     */
    static Options parse(const std::vector<std::string>& args);

    /**
     * @brief Applies the command-line overrides in @p opts on top of @p settings.
     *
     * `--quiet` lowers the log level to `ERROR` whatever the file asked for.
     */
    static Settings apply(const Options& opts, Settings settings);

    /**
     * @brief Loads `opts.config_path` when given, then applies the overrides.
     *
     * @throws ConfigError if the configuration file is unreadable or invalid.
     */
    static Settings resolve(const Options& opts);

    static void print_usage(std::ostream& out, const std::string& binary_name);
};

} // namespace ulidkit::infra
