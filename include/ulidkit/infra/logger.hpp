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
 * @file logger.hpp
 * @brief Thread-safe diagnostic logging facility for ulidkit.
 *
 * @details
 * This header declares the `Logger` class, the single reporting interface used by
 * the resolver, the generator and the CLI. It guarantees atomic output to the
 * standard streams across threads and filters messages below a process-wide
 * minimum severity.
 */

#pragma once

#include <atomic>
#include <mutex>
#include <string>

namespace ulidkit::infra {

/**
 * @enum LogLevel
 * @brief Defines the severity hierarchy for diagnostic messages.
 */
enum class LogLevel {
    TRACE, ///< Per-identifier details (e.g. monotonic stalls).
    DEBUG, ///< Dependency selection and generator construction.
    INFO,  ///< Nominal operational events (e.g. CLI bootstrap).
    WARN,  ///< Degraded dependencies accepted through a tolerance flag.
    ERROR, ///< Recoverable failures.
    FATAL  ///< Failures that end the process.
};

/**
 * @class Logger
 * @brief A static utility class providing system-wide logging capabilities.
 *
 * @details
 * Messages below the configured level are dropped before the lock is taken.
 * The default level is `INFO`.
 */
class Logger {
  public:
    /**
     * @brief Writes a formatted diagnostic message to the console.
     *
     * The output includes a timestamp, the severity tag and the payload.
     *
     * **Stream Routing Logic:**
     * - `TRACE`, `DEBUG`, `INFO`: Routed to `std::cout`.
     * - `WARN`, `ERROR`, `FATAL`: Routed to `std::cerr`.
     * - Everything goes to `std::cerr` once `route_all_to_stderr(true)` is set.
     *
     * @param level The severity classification of the message.
     * @param message The content payload to be logged.
     *
     * @code
     * ulidkit::infra::Logger::log(LogLevel::WARN, "Resolver: falling back to mt19937_64");
     * @endcode
     */
    static void log(LogLevel level, const std::string& message);

    /// @brief Sets the minimum severity that reaches the console.
    static void set_level(LogLevel level);

    static LogLevel level();

    /**
     * @brief Sends every severity to `std::cerr`.
     *
     * Used by tools whose `std::cout` carries data rather than diagnostics.
     */
    static void route_all_to_stderr(bool enabled);

    /**
     * @brief Whether a message of @p level would be written.
     *
     * Lets hot paths skip building a message that would be discarded.
     */
    static bool enabled(LogLevel level);

  private:
    /// @brief Guards `std::cout` and `std::cerr` against interleaved entries.
    static std::mutex mutex_;

    static std::atomic<LogLevel> threshold_;

    static std::atomic<bool> stderr_only_;
};

} // namespace ulidkit::infra
