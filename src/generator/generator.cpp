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
 * @file generator.cpp
 * @brief Implementation of plain and monotonic ULID generation.
 *
 * @details
 * A monotonic generator moves through two states on every call:
 * - **ADVANCE**: the effective time is later than `last_time`; adopt it and draw
 * a fresh random tail.
 * - **STALL**: the effective time equals or precedes `last_time`; keep the old
 * time prefix and increment the tail by one, which keeps the output sorted even
 * when the wall clock steps backwards.
 */

#include "ulidkit/generator/generator.hpp"

#include "ulidkit/env/resolver.hpp"
#include "ulidkit/error.hpp"
#include "ulidkit/infra/logger.hpp"

#include <utility>

namespace ulidkit::generator {

using codec::Base32;
using infra::Logger;
using infra::LogLevel;

Generator Generator::create(const Config& config)
{
    Dependencies deps = config.dependencies
                            ? *config.dependencies
                            : env::Resolver::resolve(env::Environment::detect(),
                                                     config.allow_insecure, config.allow_imprecise);

    if (Logger::enabled(LogLevel::DEBUG)) {
        Logger::log(LogLevel::DEBUG,
                    std::string("Generator: created (") +
                        (config.monotonic ? "monotonic" : "non-monotonic") + ", " +
                        (config.dependencies ? "explicit" : "resolved") + " dependencies)");
    }
    return Generator(std::move(deps), config.monotonic);
}

Generator::Generator(Dependencies deps, bool monotonic) : deps_(std::move(deps))
{
    if (!deps_.now) {
        throw DependencyContractViolation("now function is empty");
    }
    if (!deps_.prng) {
        throw DependencyContractViolation("prng function is empty");
    }
    if (monotonic) {
        state_ = std::make_unique<MonotonicState>();
    }
}

std::string Generator::operator()(std::optional<double> time)
{
    if (state_) {
        return next_monotonic(time);
    }

    // Stateless path: every call is self-contained.
    std::uint64_t t = resolve_time(time);
    return Base32::encode_time(static_cast<double>(t)) + Base32::encode_random(deps_.prng);
}

/**
 * @brief Picks the caller's timestamp or asks the clock, then validates it.
 *
 * The clock value goes through the same 48-bit checks as an explicit time, so a
 * misbehaving clock surfaces as `InvalidTimestamp`.
 */
std::uint64_t Generator::resolve_time(std::optional<double> time) const
{
    if (time) {
        return Base32::validate_time(*time);
    }
    return Base32::validate_time(static_cast<double>(deps_.now()));
}

/**
 * @brief Monotonic step, executed entirely under the instance lock.
 *
 * Implementation Strategy:
 * 1. **Critical Section**: Lock before reading the clock so that two threads can
 * never observe the same `last_time`/`last_random` pair.
 * 2. **Validation**: Resolve the effective time first; a rejected timestamp leaves
 * the state untouched.
 * 3. **Transition**: STALL increments a copy of the tail and commits it only if the
 * carry did not overflow; ADVANCE draws a new tail.
 * 4. **Emit**: Encode `last_time` (not the effective time) plus the stored tail.
 */
std::string Generator::next_monotonic(std::optional<double> time)
{
    std::lock_guard<std::mutex> lock(state_->mutex);

    std::uint64_t effective = resolve_time(time);

    if (state_->last_random && effective <= state_->last_time) {
        codec::RandomDigits next = *state_->last_random;
        Base32::increment_digits(next.data(), next.size());
        state_->last_random = next;

        if (Logger::enabled(LogLevel::TRACE)) {
            Logger::log(LogLevel::TRACE, "Generator: stall at " +
                                             std::to_string(state_->last_time) +
                                             " ms (requested " + std::to_string(effective) + ")");
        }
    } else {
        state_->last_random = Base32::random_digits(deps_.prng);
        state_->last_time = effective;
    }

    return Base32::encode_time(static_cast<double>(state_->last_time)) +
           Base32::to_text(*state_->last_random);
}

std::string ulid(std::optional<double> time, bool relax_checks)
{
    Config config;
    config.allow_insecure = relax_checks;
    config.allow_imprecise = relax_checks;
    return Generator::create(config)(time);
}

} // namespace ulidkit::generator
