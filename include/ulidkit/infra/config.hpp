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
 * @file config.hpp
 * @brief JSON configuration for the ulidkit tool.
 *
 * @details
 * Declares `Settings`, the complete set of tunables with their defaults, and
 * `ConfigLoader`, which merges a (possibly partial) JSON document over a set of
 * base settings. Merging happens once; the resulting `Settings` is plain data.
 *
 * **Recognized keys:**
 * @code
 * {
 * "monotonic": true,
 * "allow_insecure": false,
 * "allow_imprecise": false,
 * "random_device": "/dev/urandom",
 * "log_level": "warn"
 * }
 * @endcode
 */

#pragma once

#include "ulidkit/env/resolver.hpp"
#include "ulidkit/generator/generator.hpp"
#include "ulidkit/infra/logger.hpp"

#include <string>

namespace ulidkit::infra {

/**
 * @struct Settings
 * @brief Fully resolved tool configuration.
 */
struct Settings {
    bool monotonic = false;
    bool allow_insecure = false;
    bool allow_imprecise = false;
    std::string random_device = env::kDefaultRandomDevice;
    LogLevel log_level = LogLevel::INFO;

    /**
     * @brief Resolves dependencies for these settings and returns a generator config.
     *
     * @throws MissingSecureRandomness, MissingPrecisionClock from `env::Resolver`.
     */
    generator::Config to_generator_config() const;
};

/**
 * @class ConfigLoader
 * @brief Parses JSON configuration documents with cJSON.
 */
class ConfigLoader {
  public:
    /**
     * @brief Merges the JSON object in @p json over @p base.
     *
     * Keys that are absent keep their value from @p base. Unknown keys are
     * reported at `WARN` and otherwise ignored.
     *
     * @throws ConfigError on invalid JSON, a non-object root, or a value of the wrong type.
     */
    static Settings parse(const std::string& json, const Settings& base = Settings{});

    /**
     * @brief Reads @p path and merges it over @p base.
     *
     * @throws ConfigError if the file cannot be read or its content is invalid.
     */
    static Settings load_file(const std::string& path, const Settings& base = Settings{});

    /**
     * @brief Maps a level name ("trace", "debug", "info", "warn", "error", "fatal").
     *
     * Matching is case-insensitive.
     *
     * @throws ConfigError for any other name.
     */
    static LogLevel parse_level(const std::string& name);
};

} // namespace ulidkit::infra
