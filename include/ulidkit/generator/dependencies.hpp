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
 * @file dependencies.hpp
 * @brief The clock/entropy contract between the generator and its host environment.
 */

#pragma once

#include "ulidkit/codec/base32.hpp"

#include <cstdint>
#include <functional>

namespace ulidkit::generator {

/**
 * @brief Millisecond wall clock: non-negative integer milliseconds since the Unix epoch.
 */
using Clock = std::function<std::int64_t()>;

/**
 * @struct Dependencies
 * @brief The pair of external collaborators a generator is built from.
 *
 * @details
 * - `now()` must return non-negative integer milliseconds since the Unix epoch.
 * - `prng(min, max)` must return a uniformly distributed integer in `[min, max]`.
 *
 * Both are copied into the generator at construction time and never replaced.
 * Thread safety of the callables is the supplier's responsibility; the
 * resolvers in `ulidkit::env` hand out thread-safe ones.
 */
struct Dependencies {
    Clock now;
    codec::Prng prng;
};

} // namespace ulidkit::generator
