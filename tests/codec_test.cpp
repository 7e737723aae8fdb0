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
 * @file codec_test.cpp
 * @brief Unit tests for the base32 time/random encodings and digit increment.
 */

#include "ulidkit/codec/base32.hpp"
#include "ulidkit/error.hpp"
#include "framework.hpp"

#include <cmath>
#include <cstdint>
#include <limits>
#include <random>
#include <string>

using ulidkit::codec::Base32;
using ulidkit::codec::kAlphabet;

namespace {

/// @brief Every character of @p s belongs to the ULID alphabet.
bool all_base32(const std::string& s)
{
    for (char c : s) {
        if (Base32::digit_of(c) < 0) {
            return false;
        }
    }
    return true;
}

/// @brief A prng that always answers @p value.
ulidkit::codec::Prng constant_prng(std::int64_t value)
{
    return [value](std::int64_t, std::int64_t) { return value; };
}

} // namespace

/**
 * @brief The alphabet is the Crockford ordering with its inverse table in sync.
 */
void test_alphabet_ordering()
{
    ASSERT_EQ(kAlphabet.size(), static_cast<size_t>(32));
    ASSERT_EQ(Base32::digit_of('0'), 0);
    ASSERT_EQ(Base32::digit_of('9'), 9);
    ASSERT_EQ(Base32::digit_of('A'), 10);
    ASSERT_EQ(Base32::digit_of('Z'), 31);
    ASSERT_EQ(kAlphabet[31], 'Z');

    for (std::size_t i = 0; i < kAlphabet.size(); ++i) {
        ASSERT_EQ(Base32::digit_of(kAlphabet[i]), static_cast<int>(i));
        if (i > 0) {
            // Ascending characters keep string order equal to numeric order.
            ASSERT_TRUE(kAlphabet[i - 1] < kAlphabet[i]);
        }
    }

    // Visually ambiguous letters and lowercase are excluded.
    ASSERT_EQ(Base32::digit_of('I'), -1);
    ASSERT_EQ(Base32::digit_of('L'), -1);
    ASSERT_EQ(Base32::digit_of('O'), -1);
    ASSERT_EQ(Base32::digit_of('U'), -1);
    ASSERT_EQ(Base32::digit_of('a'), -1);
}

void test_encode_time_known_vectors()
{
    ASSERT_EQ(Base32::encode_time(1469918176385), std::string("01ARYZ6S41"));
    ASSERT_EQ(Base32::encode_time(0), std::string("0000000000"));
    ASSERT_EQ(Base32::encode_time(1), std::string("0000000001"));
    ASSERT_EQ(Base32::encode_time(1000), std::string("00000000Z8"));
    ASSERT_EQ(Base32::encode_time(static_cast<double>(ulidkit::codec::kMaxTime)),
              std::string("7ZZZZZZZZZ"));
}

/**
 * @brief decode_time(encode_time(t)) == t over boundaries and random samples.
 */
void test_encode_time_roundtrip()
{
    const std::uint64_t boundaries[] = {0,
                                        31,
                                        32,
                                        1023,
                                        1024,
                                        1469918176385ULL,
                                        (std::uint64_t{1} << 40),
                                        ulidkit::codec::kMaxTime - 1,
                                        ulidkit::codec::kMaxTime};
    for (std::uint64_t t : boundaries) {
        std::string encoded = Base32::encode_time(static_cast<double>(t));
        ASSERT_EQ(encoded.size(), ulidkit::codec::kTimeLength);
        ASSERT_TRUE(all_base32(encoded));
        ASSERT_EQ(Base32::decode_time(encoded), t);
    }

    std::mt19937_64 engine(42);
    std::uniform_int_distribution<std::uint64_t> dist(0, ulidkit::codec::kMaxTime);
    for (int i = 0; i < 1000; ++i) {
        std::uint64_t t = dist(engine);
        ASSERT_EQ(Base32::decode_time(Base32::encode_time(static_cast<double>(t))), t);
    }
}

/**
 * @brief Encoded order follows numeric order.
 */
void test_encode_time_sorts_lexicographically()
{
    ASSERT_TRUE(Base32::encode_time(999) < Base32::encode_time(1000));
    ASSERT_TRUE(Base32::encode_time(31) < Base32::encode_time(32));
    ASSERT_TRUE(Base32::encode_time(1469918176385) < Base32::encode_time(1469918176386));
}

/**
 * @brief -1, 2^48, 1.5 and NaN are rejected, each with the matching constraint.
 */
void test_encode_time_rejects_invalid()
{
    ASSERT_THROWS(Base32::encode_time(-1), ulidkit::InvalidTimestamp);
    ASSERT_THROWS(Base32::encode_time(281474976710656.0), ulidkit::InvalidTimestamp);
    ASSERT_THROWS(Base32::encode_time(1.5), ulidkit::InvalidTimestamp);
    ASSERT_THROWS(Base32::encode_time(std::nan("")), ulidkit::InvalidTimestamp);
    ASSERT_THROWS(Base32::encode_time(std::numeric_limits<double>::infinity()),
                  ulidkit::InvalidTimestamp);

    auto violation_of = [](double t) {
        try {
            Base32::encode_time(t);
        } catch (const ulidkit::InvalidTimestamp& e) {
            ASSERT_TRUE(e.code() == ulidkit::ErrorCode::InvalidTimestamp);
            return e.violation();
        }
        throw std::runtime_error("timestamp was accepted");
    };

    ASSERT_TRUE(violation_of(-1) == ulidkit::TimestampViolation::Negative);
    ASSERT_TRUE(violation_of(281474976710656.0) == ulidkit::TimestampViolation::TooLarge);
    ASSERT_TRUE(violation_of(1.5) == ulidkit::TimestampViolation::NotIntegral);
    ASSERT_TRUE(violation_of(std::nan("")) == ulidkit::TimestampViolation::NotANumber);
}

void test_encode_random_shape()
{
    std::mt19937_64 engine(7);
    ulidkit::codec::Prng prng = [&engine](std::int64_t min, std::int64_t max) {
        return std::uniform_int_distribution<std::int64_t>(min, max)(engine);
    };

    for (int i = 0; i < 100; ++i) {
        std::string random = Base32::encode_random(prng);
        ASSERT_EQ(random.size(), ulidkit::codec::kRandomLength);
        ASSERT_TRUE(all_base32(random));
    }

    ASSERT_EQ(Base32::encode_random(constant_prng(0)), std::string("0000000000000000"));
    ASSERT_EQ(Base32::encode_random(constant_prng(31)), std::string("ZZZZZZZZZZZZZZZZ"));
}

/**
 * @brief Every digit is requested as prng(0, 31).
 */
void test_encode_random_requests_digit_range()
{
    int calls = 0;
    bool range_ok = true;
    ulidkit::codec::Prng prng = [&](std::int64_t min, std::int64_t max) -> std::int64_t {
        ++calls;
        range_ok = range_ok && min == 0 && max == 31;
        return calls % 32;
    };

    std::string random = Base32::encode_random(prng);
    ASSERT_EQ(calls, 16);
    ASSERT_TRUE(range_ok);
    ASSERT_EQ(random, std::string("123456789ABCDEFG"));
}

void test_encode_random_rejects_broken_prng()
{
    ASSERT_THROWS(Base32::encode_random(constant_prng(32)), ulidkit::DependencyContractViolation);
    ASSERT_THROWS(Base32::encode_random(constant_prng(-1)), ulidkit::DependencyContractViolation);
    ASSERT_THROWS(Base32::encode_random(ulidkit::codec::Prng{}),
                  ulidkit::DependencyContractViolation);
}

void test_increment_basic()
{
    ASSERT_EQ(Base32::increment("0000000000000000"), std::string("0000000000000001"));
    ASSERT_EQ(Base32::increment("0000000000000009"), std::string("000000000000000A"));
    ASSERT_EQ(Base32::increment("000000000000000H"), std::string("000000000000000J"));
    ASSERT_EQ(Base32::increment("A109C"), std::string("A109D"));
}

/**
 * @brief A trailing 'Z' wraps to '0' and the carry moves left until absorbed.
 */
void test_increment_carry()
{
    ASSERT_EQ(Base32::increment("000000000000000Z"), std::string("0000000000000010"));
    ASSERT_EQ(Base32::increment("A1YZ"), std::string("A1Z0"));
    ASSERT_EQ(Base32::increment("CZZZ"), std::string("D000"));
    ASSERT_EQ(Base32::increment("0ZZZZZZZZZZZZZZZ"), std::string("1000000000000000"));
    ASSERT_EQ(Base32::increment("Y"), std::string("Z"));
}

void test_increment_rejects_foreign_characters()
{
    ASSERT_THROWS(Base32::increment("000000000000000I"), ulidkit::NotBase32);
    ASSERT_THROWS(Base32::increment("000000000000000a"), ulidkit::NotBase32);
    ASSERT_THROWS(Base32::increment("0000-00000000000"), ulidkit::NotBase32);
    ASSERT_THROWS(Base32::increment(""), ulidkit::NotBase32);
}

/**
 * @brief All-maximum input cannot be advanced without growing; it raises instead of wrapping.
 */
void test_increment_exhausted()
{
    ASSERT_THROWS(Base32::increment("ZZZZZZZZZZZZZZZZ"), ulidkit::SequenceExhausted);
    ASSERT_THROWS(Base32::increment("Z"), ulidkit::SequenceExhausted);

    try {
        Base32::increment("ZZZZZZZZZZZZZZZZ");
        ulidkit::test::fail(__FILE__, __LINE__, "increment of an all-Z tail returned");
    } catch (const ulidkit::UlidError& e) {
        ASSERT_TRUE(e.code() == ulidkit::ErrorCode::SequenceExhausted);
    }
}

void test_decode_time_rejects_malformed()
{
    ASSERT_THROWS(Base32::decode_time("0000"), ulidkit::NotBase32);
    ASSERT_THROWS(Base32::decode_time("00000000O0"), ulidkit::NotBase32);
    ASSERT_THROWS(Base32::decode_time("8000000000"), ulidkit::InvalidTimestamp);

    // A full ULID decodes from its time prefix.
    ASSERT_EQ(Base32::decode_time("01ARYZ6S41TSV4RRFFQ69G5FAV"), std::uint64_t{1469918176385});
}
