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
 * @file framework.hpp
 * @brief A lightweight, header-only unit testing micro-framework for ulidkit.
 *
 * @details
 * Provides ANSI-colored terminal output, exception-protected execution blocks,
 * and assertion macros, including one for expected exceptions.
 */

#pragma once

#include <functional>
#include <iostream>
#include <stdexcept>
#include <string>
#include <string_view>

namespace ulidkit::test {

// ========================================================================
// Global Metrics
// ========================================================================

inline int passed_count = 0; ///< Cumulative successful test counter.
inline int failed_count = 0; ///< Cumulative failed test counter.

/**
 * @brief Thrown by assertion primitives after the failure has been reported and counted.
 */
class AssertionFailure : public std::runtime_error {
  public:
    AssertionFailure() : std::runtime_error("Assertion failed") {}
};

// ========================================================================
// Assertion Primitives
// ========================================================================

inline void fail(const char* file, int line, const std::string& detail)
{
    std::cout << "\033[31m[FAIL]\033[0m " << file << ":" << line
              << " -> Assertion failed: " << detail << std::endl;
    failed_count++;
    throw AssertionFailure();
}

/**
 * @brief Validates that two generic values are equivalent.
 */
template <typename T> void assert_eq(T val1, T val2, const char* file, int line, const char* expr)
{
    if (val1 != val2) {
        std::cout << "\033[31m[FAIL]\033[0m " << file << ":" << line
                  << " -> Assertion failed: " << expr << " (" << val1 << " != " << val2 << ")"
                  << std::endl;
        failed_count++;
        throw AssertionFailure();
    }
}

/**
 * @brief Validates that two generic values are NOT equivalent.
 */
template <typename T> void assert_ne(T val1, T val2, const char* file, int line, const char* expr)
{
    if (val1 == val2) {
        std::cout << "\033[31m[FAIL]\033[0m " << file << ":" << line
                  << " -> Assertion failed: " << expr << " (" << val1 << " == " << val2 << ")"
                  << std::endl;
        failed_count++;
        throw AssertionFailure();
    }
}

/**
 * @brief Validates that a boolean expression evaluates to true.
 */
inline void assert_true(bool cond, const char* file, int line, const char* expr)
{
    if (!cond) {
        fail(file, line, std::string(expr) + " is FALSE");
    }
}

/**
 * @brief Validates that a boolean expression evaluates to false.
 */
inline void assert_false(bool cond, const char* file, int line, const char* expr)
{
    if (cond) {
        fail(file, line, std::string(expr) + " is TRUE");
    }
}

// ========================================================================
// Execution Orchestrator
// ========================================================================

/**
 * @brief Executes a test case within a protected execution context.
 *
 * An exception escaping the test body that is not an `AssertionFailure` is
 * reported and counted as a failure.
 */
inline void run(std::string_view name, std::function<void()> func)
{
    std::cout << "[RUN  ] " << name << "... " << std::flush;
    try {
        func();
        std::cout << "\r\033[32m[PASS]\033[0m " << name << "          " << std::endl;
        passed_count++;
    } catch (const AssertionFailure&) {
        // Already reported and counted by the assertion primitive.
        std::cout << "\r\033[31m[FAIL]\033[0m " << name << "          " << std::endl;
    } catch (const std::exception& e) {
        std::cout << "\r\033[31m[FAIL]\033[0m " << name << " -> unexpected exception: " << e.what()
                  << std::endl;
        failed_count++;
    }
}

/**
 * @brief Emits a summary report of the current test session.
 */
inline void print_summary()
{
    std::cout << "\n\033[36m=== ulidkit Test Summary ===\033[0m" << std::endl;
    std::cout << "Passed: " << passed_count << std::endl;
    if (failed_count > 0) {
        std::cout << "Failed: \033[31m" << failed_count << "\033[0m" << std::endl;
    } else {
        std::cout << "Failed: 0" << std::endl;
    }
    std::cout << "Total:  " << (passed_count + failed_count) << std::endl;
}

} // namespace ulidkit::test

// ============================================================================
// API Macros
// ============================================================================

#define ASSERT_EQ(a, b) ulidkit::test::assert_eq((a), (b), __FILE__, __LINE__, #a " == " #b)

#define ASSERT_NE(a, b) ulidkit::test::assert_ne((a), (b), __FILE__, __LINE__, #a " != " #b)

#define ASSERT_TRUE(a) ulidkit::test::assert_true((a), __FILE__, __LINE__, #a)

#define ASSERT_FALSE(a) ulidkit::test::assert_false((a), __FILE__, __LINE__, #a)

/**
 * @def ASSERT_THROWS
 * @brief Passes only if evaluating @p expr throws @p exc_type (or a subclass).
 *
 * Any other exception propagates to `run()` and fails the test there.
 */
#define ASSERT_THROWS(expr, exc_type)                                                              \
    do {                                                                                           \
        bool caught_expected_ = false;                                                             \
        try {                                                                                      \
            (void)(expr);                                                                          \
        } catch (const exc_type&) {                                                                \
            caught_expected_ = true;                                                               \
        }                                                                                          \
        ulidkit::test::assert_true(caught_expected_, __FILE__, __LINE__,                           \
                                   #expr " throws " #exc_type);                                    \
    } while (0)

/**
 * @def RUN_TEST
 * @brief Orchestrates the execution of a named test function.
 */
#define RUN_TEST(func_name) ulidkit::test::run(#func_name, func_name)
