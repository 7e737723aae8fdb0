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
 * @file base32.cpp
 * @brief Implementation of the ULID base32 codec.
 *
 * @details
 * Character-to-digit lookups go through a 256-entry table built at compile time
 * from `kAlphabet`, so decoding and increment never search the alphabet.
 */

#include "ulidkit/codec/base32.hpp"

#include "ulidkit/error.hpp"

#include <cmath>
#include <vector>

namespace ulidkit::codec {

namespace {

/**
 * @brief Inverse of `kAlphabet`: character code -> digit index, `-1` for foreign characters.
 */
struct DecodeTable {
    std::array<std::int8_t, 256> digits{};

    constexpr DecodeTable()
    {
        for (auto& d : digits) {
            d = -1;
        }
        for (std::size_t i = 0; i < kAlphabet.size(); ++i) {
            digits[static_cast<unsigned char>(kAlphabet[i])] = static_cast<std::int8_t>(i);
        }
    }
};

constexpr DecodeTable kDecodeTable{};

static_assert(kAlphabet.size() == kAlphabetSize, "ULID alphabet must hold 32 symbols");

/**
 * @brief Converts text into digit indices, rejecting any foreign character.
 */
std::vector<std::uint8_t> to_digits(std::string_view text)
{
    std::vector<std::uint8_t> digits(text.size());
    for (std::size_t i = 0; i < text.size(); ++i) {
        int d = Base32::digit_of(text[i]);
        if (d < 0) {
            throw NotBase32(text[i], i);
        }
        digits[i] = static_cast<std::uint8_t>(d);
    }
    return digits;
}

} // namespace

int Base32::digit_of(char c)
{
    return kDecodeTable.digits[static_cast<unsigned char>(c)];
}

std::uint64_t Base32::validate_time(double time)
{
    if (std::isnan(time)) {
        throw InvalidTimestamp(TimestampViolation::NotANumber, time);
    }
    // kMaxTime < 2^53, so the comparison is exact.
    if (time > static_cast<double>(kMaxTime)) {
        throw InvalidTimestamp(TimestampViolation::TooLarge, time);
    }
    if (time < 0) {
        throw InvalidTimestamp(TimestampViolation::Negative, time);
    }
    if (std::trunc(time) != time) {
        throw InvalidTimestamp(TimestampViolation::NotIntegral, time);
    }
    return static_cast<std::uint64_t>(time);
}

/**
 * @brief Encodes a timestamp by repeated division.
 *
 * Implementation Strategy:
 * 1. **Validation**: Reject anything outside the 48-bit integral domain.
 * 2. **Digit Extraction**: Ten rounds of `mod 32` / `div 32`, written right to left,
 * which yields a fixed-width, zero-padded big-endian rendering.
 */
std::string Base32::encode_time(double time)
{
    std::uint64_t value = validate_time(time);

    std::string out(kTimeLength, kAlphabet[0]);
    for (std::size_t i = kTimeLength; i > 0; --i) {
        out[i - 1] = kAlphabet[value % kAlphabetSize];
        value /= kAlphabetSize;
    }
    return out;
}

std::uint64_t Base32::decode_time(std::string_view text)
{
    if (text.size() != kTimeLength && text.size() != kUlidLength) {
        throw NotBase32("Expected a " + std::to_string(kTimeLength) + "-character time part or a " +
                        std::to_string(kUlidLength) + "-character ULID, got " +
                        std::to_string(text.size()) + " characters");
    }

    std::uint64_t value = 0;
    for (std::size_t i = 0; i < kTimeLength; ++i) {
        int d = digit_of(text[i]);
        if (d < 0) {
            throw NotBase32(text[i], i);
        }
        value = value * kAlphabetSize + static_cast<std::uint64_t>(d);
    }

    // Ten digits hold 50 bits; the top two must be clear.
    if (value > kMaxTime) {
        throw InvalidTimestamp(TimestampViolation::TooLarge, static_cast<double>(value));
    }
    return value;
}

RandomDigits Base32::random_digits(const Prng& prng)
{
    if (!prng) {
        throw DependencyContractViolation("prng function is empty");
    }

    RandomDigits digits{};
    for (auto& d : digits) {
        std::int64_t draw = prng(0, kMaxDigit);
        if (draw < 0 || draw > kMaxDigit) {
            throw DependencyContractViolation("prng(0, 31) returned " + std::to_string(draw));
        }
        d = static_cast<std::uint8_t>(draw);
    }
    return digits;
}

std::string Base32::encode_random(const Prng& prng)
{
    return to_text(random_digits(prng));
}

std::string Base32::increment(std::string_view text)
{
    if (text.empty()) {
        throw NotBase32("Cannot increment an empty string");
    }

    std::vector<std::uint8_t> digits = to_digits(text);
    increment_digits(digits.data(), digits.size());
    return to_text(digits.data(), digits.size());
}

/**
 * @brief Carry loop over digit indices.
 *
 * Walks from the least significant position. A digit at `kMaxDigit` wraps to 0
 * and the carry continues; the first digit below the maximum absorbs the carry
 * and terminates the loop. Falling off the front means the sequence is spent.
 */
void Base32::increment_digits(std::uint8_t* digits, std::size_t count)
{
    for (std::size_t i = count; i > 0; --i) {
        std::uint8_t& d = digits[i - 1];
        if (d < kMaxDigit) {
            ++d;
            return;
        }
        d = 0;
    }
    throw SequenceExhausted(count);
}

std::string Base32::to_text(const std::uint8_t* digits, std::size_t count)
{
    std::string out(count, kAlphabet[0]);
    for (std::size_t i = 0; i < count; ++i) {
        out[i] = kAlphabet[digits[i]];
    }
    return out;
}

std::string Base32::to_text(const RandomDigits& digits)
{
    return to_text(digits.data(), digits.size());
}

} // namespace ulidkit::codec
