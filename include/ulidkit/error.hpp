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
 * @file error.hpp
 * @brief Exception taxonomy shared by every ulidkit subsystem.
 *
 * @details
 * All failures raised by the codec, the generator, the environment resolver and
 * the configuration loader derive from `UlidError`. Each concrete type carries a
 * stable `ErrorCode` so that callers (and the CLI) can branch on the category
 * without string matching.
 */

#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace ulidkit {

/**
 * @enum ErrorCode
 * @brief Stable classification of every ulidkit failure.
 */
enum class ErrorCode {
    InvalidTimestamp,            ///< Timestamp is NaN, negative, above 2^48 - 1 or fractional.
    NotBase32,                   ///< Input contains a character outside the ULID alphabet.
    SequenceExhausted,           ///< Increment carried past the most significant digit.
    MissingSecureRandomness,     ///< No secure entropy source and insecure fallback not allowed.
    MissingPrecisionClock,       ///< Clock coarser than 1 ms and imprecise clock not allowed.
    DependencyContractViolation, ///< A supplied `now`/`prng` broke its documented contract.
    InvalidConfig                ///< Configuration document is malformed or unreadable.
};

/**
 * @enum TimestampViolation
 * @brief Which constraint an `InvalidTimestamp` failed.
 */
enum class TimestampViolation {
    NotANumber,
    TooLarge,
    Negative,
    NotIntegral
};

/// @brief Human readable name of an error category.
const char* to_string(ErrorCode code);

/// @brief Human readable name of a timestamp constraint.
const char* to_string(TimestampViolation violation);

/**
 * @class UlidError
 * @brief Root of the ulidkit exception hierarchy.
 */
class UlidError : public std::runtime_error {
  public:
    UlidError(ErrorCode code, const std::string& message);

    /// @brief The category of this failure.
    ErrorCode code() const noexcept { return code_; }

  private:
    ErrorCode code_;
};

/**
 * @class InvalidTimestamp
 * @brief Raised when a timestamp cannot be encoded into 48 bits of milliseconds.
 */
class InvalidTimestamp : public UlidError {
  public:
    InvalidTimestamp(TimestampViolation violation, double value);

    TimestampViolation violation() const noexcept { return violation_; }

  private:
    TimestampViolation violation_;
};

/**
 * @class NotBase32
 * @brief Raised when text handed to the codec is not pure ULID base32.
 */
class NotBase32 : public UlidError {
  public:
    /// @brief Offending character @p c found at @p position.
    NotBase32(char c, std::size_t position);

    /// @brief Structural problem (e.g. wrong length) described by @p detail.
    explicit NotBase32(const std::string& detail);
};

/**
 * @class SequenceExhausted
 * @brief Raised when every digit of the incremented string was already at its maximum.
 *
 * For a monotonic generator this means 2^80 identifiers were requested inside a
 * single millisecond; the caller has to wait for the clock to advance.
 */
class SequenceExhausted : public UlidError {
  public:
    explicit SequenceExhausted(std::size_t width);
};

class MissingSecureRandomness : public UlidError {
  public:
    explicit MissingSecureRandomness(const std::string& detail);
};

class MissingPrecisionClock : public UlidError {
  public:
    explicit MissingPrecisionClock(const std::string& detail);
};

class DependencyContractViolation : public UlidError {
  public:
    explicit DependencyContractViolation(const std::string& detail);
};

class ConfigError : public UlidError {
  public:
    explicit ConfigError(const std::string& detail);
};

} // namespace ulidkit
