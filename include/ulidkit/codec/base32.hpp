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
 * @file base32.hpp
 * @brief Fixed-width base32 codec for the two halves of a ULID.
 *
 * @details
 * A ULID is rendered as 26 characters of Crockford base32: 10 characters for the
 * 48-bit millisecond timestamp followed by 16 characters (80 bits) of randomness.
 * This header declares the stateless `Base32` utility that produces both halves
 * and implements the digit-level increment used by monotonic generation.
 *
 * Internally the random half is kept as an array of digit indices (0-31); text
 * is produced only at the API boundary.
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace ulidkit::codec {

/// @brief Crockford base32 digits in ascending order (no I, L, O, U).
inline constexpr std::string_view kAlphabet = "0123456789ABCDEFGHJKMNPQRSTVWXYZ";

inline constexpr std::size_t kAlphabetSize = 32;
inline constexpr std::uint8_t kMaxDigit = 31;

inline constexpr std::size_t kTimeLength = 10;
inline constexpr std::size_t kRandomLength = 16;
inline constexpr std::size_t kUlidLength = kTimeLength + kRandomLength;

/// @brief Largest timestamp representable in 48 bits (year 10889).
inline constexpr std::uint64_t kMaxTime = (std::uint64_t{1} << 48) - 1;

/// @brief The 80-bit random tail as digit indices, most significant first.
using RandomDigits = std::array<std::uint8_t, kRandomLength>;

/**
 * @brief Uniform integer source: returns a value in the inclusive range `[min, max]`.
 */
using Prng = std::function<std::int64_t(std::int64_t, std::int64_t)>;

/**
 * @class Base32
 * @brief Static encode/decode/increment primitives over the ULID alphabet.
 *
 * @details
 * Every member is pure with respect to process state and may be invoked from any
 * number of threads concurrently. Only `encode_random` touches the outside world,
 * through the caller supplied `Prng`.
 */
class Base32 {
  public:
    /**
     * @brief Maps a character to its digit index.
     *
     * @return The index in `[0, 31]`, or `-1` when @p c is not an alphabet character.
     * Lowercase letters are not accepted.
     */
    static int digit_of(char c);

    /**
     * @brief Checks a timestamp against the 48-bit millisecond domain.
     *
     * **Constraints (checked in this order):**
     * - not NaN (`TimestampViolation::NotANumber`)
     * - `<= 2^48 - 1` (`TimestampViolation::TooLarge`, also catches +infinity)
     * - `>= 0` (`TimestampViolation::Negative`)
     * - integral (`TimestampViolation::NotIntegral`)
     *
     * @param time Candidate timestamp in milliseconds.
     * @return std::uint64_t The validated integral value.
     * @throws InvalidTimestamp naming the first failed constraint.
     */
    static std::uint64_t validate_time(double time);

    /**
     * @brief Encodes a millisecond timestamp as exactly 10 base32 characters.
     *
     * The value is written most significant digit first and zero padded, so that
     * lexicographic order of the output equals numeric order of the input.
     *
     * @throws InvalidTimestamp if @p time fails `validate_time`.
     *
     * @code
     * Base32::encode_time(1469918176385); // "01ARYZ6S41"
     * @endcode
     */
    static std::string encode_time(double time);

    /**
     * @brief Decodes a 10-character time prefix back into milliseconds.
     *
     * Accepts either the bare 10-character time part or a full 26-character ULID,
     * in which case only the first 10 characters are read.
     *
     * @throws NotBase32 on a wrong length or a non-alphabet character.
     * @throws InvalidTimestamp if the decoded value exceeds 2^48 - 1 (prefix above "7ZZZZZZZZZ").
     */
    static std::uint64_t decode_time(std::string_view text);

    /**
     * @brief Draws 16 independent digits from @p prng.
     *
     * Each digit is requested as `prng(0, 31)`.
     *
     * @throws DependencyContractViolation if @p prng is empty or returns a value
     * outside `[0, 31]`.
     */
    static RandomDigits random_digits(const Prng& prng);

    /**
     * @brief Produces the 16-character random half of a ULID.
     * @see random_digits
     */
    static std::string encode_random(const Prng& prng);

    /**
     * @brief Returns the lexicographically next string of the same length.
     *
     * The last character is advanced by one alphabet step; a character already at
     * the maximum ('Z') becomes '0' and the carry moves one position left.
     *
     * @code
     * Base32::increment("0000000000000009"); // "000000000000000A"
     * Base32::increment("000000000000000Z"); // "0000000000000010"
     * @endcode
     *
     * @throws NotBase32 if @p text is empty or holds a non-alphabet character.
     * @throws SequenceExhausted if every character is already 'Z'.
     */
    static std::string increment(std::string_view text);

    /**
     * @brief In-place increment over raw digit indices.
     *
     * This is the carry loop behind `increment`. The loop ends either at the
     * first digit below the maximum or after the most significant digit.
     *
     * @param digits Pointer to @p count digit indices, most significant first.
     * @param count Number of digits.
     * @throws SequenceExhausted if all digits were at the maximum. In that case
     * @p digits is left zeroed, so callers that must stay consistent work on a copy.
     */
    static void increment_digits(std::uint8_t* digits, std::size_t count);

    /// @brief Maps digit indices back to alphabet characters.
    static std::string to_text(const std::uint8_t* digits, std::size_t count);

    /// @brief Convenience overload for the random tail.
    static std::string to_text(const RandomDigits& digits);
};

} // namespace ulidkit::codec
