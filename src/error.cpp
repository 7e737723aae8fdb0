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
 * @file error.cpp
 * @brief Message formatting for the ulidkit exception hierarchy.
 */

#include "ulidkit/error.hpp"

#include <iomanip>
#include <sstream>

namespace ulidkit {

const char* to_string(ErrorCode code)
{
    switch (code) {
    case ErrorCode::InvalidTimestamp:
        return "InvalidTimestamp";
    case ErrorCode::NotBase32:
        return "NotBase32";
    case ErrorCode::SequenceExhausted:
        return "SequenceExhausted";
    case ErrorCode::MissingSecureRandomness:
        return "MissingSecureRandomness";
    case ErrorCode::MissingPrecisionClock:
        return "MissingPrecisionClock";
    case ErrorCode::DependencyContractViolation:
        return "DependencyContractViolation";
    case ErrorCode::InvalidConfig:
        return "InvalidConfig";
    }
    return "Unknown";
}

const char* to_string(TimestampViolation violation)
{
    switch (violation) {
    case TimestampViolation::NotANumber:
        return "time must be a number";
    case TimestampViolation::TooLarge:
        return "time must not exceed 2^48 - 1";
    case TimestampViolation::Negative:
        return "time must be non-negative";
    case TimestampViolation::NotIntegral:
        return "time must be an integer";
    }
    return "unknown constraint";
}

UlidError::UlidError(ErrorCode code, const std::string& message)
    : std::runtime_error(message), code_(code)
{
}

namespace {

/**
 * @brief Renders a rejected timestamp without losing the fractional part.
 */
std::string describe_timestamp(TimestampViolation violation, double value)
{
    std::ostringstream ss;
    ss << "Invalid timestamp " << std::setprecision(17) << value << ": " << to_string(violation);
    return ss.str();
}

} // namespace

InvalidTimestamp::InvalidTimestamp(TimestampViolation violation, double value)
    : UlidError(ErrorCode::InvalidTimestamp, describe_timestamp(violation, value)),
      violation_(violation)
{
}

NotBase32::NotBase32(char c, std::size_t position)
    : UlidError(ErrorCode::NotBase32, "Character '" + std::string(1, c) + "' at position " +
                                          std::to_string(position) +
                                          " is not part of the ULID base32 alphabet")
{
}

NotBase32::NotBase32(const std::string& detail) : UlidError(ErrorCode::NotBase32, detail) {}

SequenceExhausted::SequenceExhausted(std::size_t width)
    : UlidError(ErrorCode::SequenceExhausted,
                "Cannot increment " + std::to_string(width) +
                    "-digit base32 sequence: all digits are at their maximum")
{
}

MissingSecureRandomness::MissingSecureRandomness(const std::string& detail)
    : UlidError(ErrorCode::MissingSecureRandomness, "Secure randomness unavailable: " + detail)
{
}

MissingPrecisionClock::MissingPrecisionClock(const std::string& detail)
    : UlidError(ErrorCode::MissingPrecisionClock, "Millisecond clock unavailable: " + detail)
{
}

DependencyContractViolation::DependencyContractViolation(const std::string& detail)
    : UlidError(ErrorCode::DependencyContractViolation, "Dependency contract violated: " + detail)
{
}

ConfigError::ConfigError(const std::string& detail)
    : UlidError(ErrorCode::InvalidConfig, "Configuration error: " + detail)
{
}

} // namespace ulidkit
