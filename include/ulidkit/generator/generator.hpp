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
 * @file generator.hpp
 * @brief ULID factory with optional same-millisecond monotonic ordering.
 *
 * @details
 * This header declares the `Generator` class, the public entry point of ulidkit.
 * A generator combines a 10-character time encoding with a 16-character random
 * encoding. In monotonic mode it remembers the last timestamp and random tail
 * and, whenever the clock does not move forward, increments the tail instead of
 * redrawing it, so that every identifier it returns sorts after the previous one.
 */

#pragma once

#include "ulidkit/codec/base32.hpp"
#include "ulidkit/generator/dependencies.hpp"

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace ulidkit::generator {

/**
 * @struct Config
 * @brief Construction options. Resolved once by `Generator::create`.
 */
struct Config {
    /// Guarantee strictly increasing output within one generator instance.
    bool monotonic = false;

    /// Explicit clock/prng pair. When empty, `env::Resolver` probes the host.
    std::optional<Dependencies> dependencies;

    /// Accept a non-cryptographic prng if no secure source exists (resolver only).
    bool allow_insecure = false;

    /// Accept a clock coarser than one millisecond (resolver only).
    bool allow_imprecise = false;
};

/**
 * @class Generator
 * @brief Callable ULID source.
 *
 * @details
 * **Concurrency Model:**
 * - Non-monotonic instances hold no mutable state; `operator()` may be called
 * from any number of threads as long as the supplied dependencies are thread-safe.
 * - Monotonic instances serialize the read-modify-write of their state with an
 * internal mutex, so one instance may be shared between threads.
 *
 * Instances are movable but not copyable: a copy would fork the monotonic state.
 */
class Generator {
  public:
    /**
     * @brief Builds a generator from @p config.
     *
     * If `config.dependencies` is set it is used as-is (both callables must be
     * non-empty). Otherwise the host environment is probed through
     * `env::Resolver`, honouring `allow_insecure` and `allow_imprecise`.
     *
     * @throws DependencyContractViolation if a supplied callable is empty.
     * @throws MissingSecureRandomness, MissingPrecisionClock from the resolver.
     *
     * @code
     * auto next = ulidkit::generator::Generator::create({true});
     * std::string a = next();
     * std::string b = next(); // b > a, always
     * @endcode
     */
    static Generator create(const Config& config);

    Generator(Dependencies deps, bool monotonic);

    Generator(Generator&&) = default;
    Generator& operator=(Generator&&) = default;
    Generator(const Generator&) = delete;
    Generator& operator=(const Generator&) = delete;

    /**
     * @brief Produces the next 26-character ULID.
     *
     * @param time Millisecond timestamp to embed. When absent, `now()` is called.
     * @return std::string Time encoding followed by the random encoding.
     *
     * @throws InvalidTimestamp if the effective time is outside `[0, 2^48 - 1]` or fractional.
     * @throws SequenceExhausted (monotonic only) if the random tail is already at its maximum.
     * @throws DependencyContractViolation if the prng misbehaves.
     *
     * A call that throws leaves the monotonic state unchanged.
     */
    std::string operator()(std::optional<double> time = std::nullopt);

    bool monotonic() const { return state_ != nullptr; }

  private:
    /**
     * @struct MonotonicState
     * @brief Last emitted timestamp and random tail, owned by one generator.
     */
    struct MonotonicState {
        std::uint64_t last_time = 0;
        /// Empty until the first identifier has been produced.
        std::optional<codec::RandomDigits> last_random;
        std::mutex mutex;
    };

    std::uint64_t resolve_time(std::optional<double> time) const;

    std::string next_monotonic(std::optional<double> time);

    Dependencies deps_;

    /// Heap allocated; `std::mutex` is not movable.
    std::unique_ptr<MonotonicState> state_;
};

/**
 * @brief One-shot convenience: a throwaway non-monotonic generator.
 *
 * Resolves dependencies from the host on every call.
 *
 * @param time Optional explicit timestamp.
 * @param relax_checks Sets both `allow_insecure` and `allow_imprecise`.
 */
std::string ulid(std::optional<double> time = std::nullopt, bool relax_checks = false);

} // namespace ulidkit::generator
