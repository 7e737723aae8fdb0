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
 * @file resolver.cpp
 * @brief POSIX implementation of the clock/entropy resolver.
 */

#include "ulidkit/env/resolver.hpp"

#include "ulidkit/error.hpp"
#include "ulidkit/infra/logger.hpp"

#include <array>
#include <cstdint>
#include <cstring>
#include <fstream>
#include <limits>
#include <memory>
#include <mutex>
#include <random>

namespace ulidkit::env {

using infra::Logger;
using infra::LogLevel;

namespace {

/**
 * @brief Shared handle on the entropy device. One stream per resolved prng.
 */
struct DeviceSource {
    std::string path;
    std::ifstream stream;
    std::mutex mutex;

    std::uint64_t read_word()
    {
        std::array<char, sizeof(std::uint64_t)> bytes{};
        stream.read(bytes.data(), static_cast<std::streamsize>(bytes.size()));
        if (!stream) {
            throw MissingSecureRandomness("short read from " + path);
        }
        std::uint64_t word = 0;
        std::memcpy(&word, bytes.data(), bytes.size());
        return word;
    }
};

struct FallbackSource {
    std::mt19937_64 engine;
    std::mutex mutex;
};

void check_range(std::int64_t min, std::int64_t max)
{
    if (min > max) {
        throw DependencyContractViolation("prng called with empty range [" + std::to_string(min) +
                                          ", " + std::to_string(max) + "]");
    }
}

} // namespace

Environment Environment::detect()
{
    Environment env;
    env.clock_resolution = std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::system_clock::duration(1));
    return env;
}

/**
 * @brief Selects dependencies in order of preference.
 *
 * Resolution Order:
 * 1. **Entropy**: kernel device, else (if tolerated) the Mersenne Twister fallback.
 * 2. **Clock**: `system_clock`, rejected when its tick exceeds one millisecond
 * unless imprecision is tolerated.
 */
generator::Dependencies Resolver::resolve(const Environment& env, bool allow_insecure,
                                          bool allow_imprecise)
{
    generator::Dependencies deps;

    deps.prng = device_prng(env.random_device);
    if (deps.prng) {
        Logger::log(LogLevel::DEBUG, "Resolver: entropy from '" + env.random_device + "'");
    } else if (allow_insecure) {
        Logger::log(LogLevel::WARN, "Resolver: '" + env.random_device +
                                        "' unavailable, using insecure mt19937_64 fallback");
        deps.prng = fallback_prng();
    } else {
        throw MissingSecureRandomness("cannot open '" + env.random_device +
                                      "' and insecure fallback is not allowed");
    }

    if (env.clock_resolution > std::chrono::milliseconds(1)) {
        std::string resolution = std::to_string(env.clock_resolution.count()) + " ns";
        if (!allow_imprecise) {
            throw MissingPrecisionClock("system clock tick is " + resolution +
                                        " and imprecise clocks are not allowed");
        }
        Logger::log(LogLevel::WARN,
                    "Resolver: system clock tick is " + resolution + ", timestamps are imprecise");
    }
    deps.now = system_clock();

    return deps;
}

/**
 * @brief Uniform draws from the entropy device.
 *
 * Implementation Strategy:
 * 1. **Span**: Compute `max - min` in unsigned arithmetic so that the full
 * `int64_t` range does not overflow.
 * 2. **Rejection Sampling**: Discard words below `2^64 mod range` so that the
 * final modulo is unbiased.
 */
codec::Prng Resolver::device_prng(const std::string& device)
{
    auto source = std::make_shared<DeviceSource>();
    source->path = device;
    source->stream.open(device, std::ios::in | std::ios::binary);
    if (!source->stream.is_open()) {
        return {};
    }

    return [source](std::int64_t min, std::int64_t max) -> std::int64_t {
        check_range(min, max);

        const std::uint64_t span = static_cast<std::uint64_t>(max) - static_cast<std::uint64_t>(min);

        std::lock_guard<std::mutex> lock(source->mutex);
        std::uint64_t word = source->read_word();

        if (span == std::numeric_limits<std::uint64_t>::max()) {
            return static_cast<std::int64_t>(static_cast<std::uint64_t>(min) + word);
        }

        const std::uint64_t range = span + 1;
        const std::uint64_t threshold = (0 - range) % range;
        while (word < threshold) {
            word = source->read_word();
        }
        return static_cast<std::int64_t>(static_cast<std::uint64_t>(min) + word % range);
    };
}

codec::Prng Resolver::fallback_prng()
{
    auto source = std::make_shared<FallbackSource>();
    std::random_device rd;
    source->engine.seed(rd());

    return [source](std::int64_t min, std::int64_t max) -> std::int64_t {
        check_range(min, max);
        std::uniform_int_distribution<std::int64_t> dist(min, max);
        std::lock_guard<std::mutex> lock(source->mutex);
        return dist(source->engine);
    };
}

generator::Clock Resolver::system_clock()
{
    return []() -> std::int64_t {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
                   std::chrono::system_clock::now().time_since_epoch())
            .count();
    };
}

} // namespace ulidkit::env
