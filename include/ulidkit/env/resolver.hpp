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
 * @file resolver.hpp
 * @brief Host adapter that supplies the generator's clock and entropy source.
 *
 * @details
 * The generator core never inspects its host. When a caller does not inject its
 * own `Dependencies`, this adapter probes a POSIX environment:
 * - **Entropy**: the kernel random device (default `/dev/urandom`). If it cannot be
 * opened, a `std::mt19937_64` fallback is used only when insecure randomness
 * has been explicitly allowed.
 * - **Clock**: `std::chrono::system_clock` truncated to milliseconds. A clock whose
 * tick is coarser than one millisecond is used only when imprecision has been
 * explicitly allowed.
 *
 * Other hosts plug in by providing their own `Dependencies`.
 */

#pragma once

#include "ulidkit/codec/base32.hpp"
#include "ulidkit/generator/dependencies.hpp"

#include <chrono>
#include <string>

namespace ulidkit::env {

inline constexpr const char* kDefaultRandomDevice = "/dev/urandom";

/**
 * @struct Environment
 * @brief The probe inputs the resolver decides on.
 *
 * Kept as plain data so tests can describe a host lacking a capability.
 */
struct Environment {
    /// Path of the kernel entropy device.
    std::string random_device = kDefaultRandomDevice;

    /// Tick period of the wall clock.
    std::chrono::nanoseconds clock_resolution{1};

    /**
     * @brief Describes the running host: default device path and the
     * `system_clock` tick period.
     */
    static Environment detect();
};

/**
 * @class Resolver
 * @brief Builds a `generator::Dependencies` pair from an `Environment`.
 */
class Resolver {
  public:
    /**
     * @brief Selects a clock and a prng for @p env.
     *
     * @param env Host description, usually `Environment::detect()`.
     * @param allow_insecure Accept the non-cryptographic fallback prng.
     * @param allow_imprecise Accept a clock coarser than one millisecond.
     *
     * @throws MissingSecureRandomness if the device cannot be opened and
     * @p allow_insecure is false.
     * @throws MissingPrecisionClock if the clock is too coarse and
     * @p allow_imprecise is false.
     */
    static generator::Dependencies resolve(const Environment& env, bool allow_insecure,
                                           bool allow_imprecise);

    /**
     * @brief A prng reading 64-bit words from @p device with rejection sampling.
     *
     * The returned callable shares one open stream and is thread-safe.
     *
     * @return An empty `Prng` if the device cannot be opened.
     */
    static codec::Prng device_prng(const std::string& device);

    /**
     * @brief Thread-safe `std::mt19937_64` seeded from `std::random_device`.
     *
     * @warning Not suitable where identifiers must be unguessable.
     */
    static codec::Prng fallback_prng();

    /// @brief `system_clock` milliseconds since the Unix epoch.
    static generator::Clock system_clock();
};

} // namespace ulidkit::env
