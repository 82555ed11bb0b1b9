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
 * @brief Thread-safe diagnostic logging facility for Keystone.
 *
 * @details
 * Declares the `Logger` class, the single reporting channel used by the identifier
 * subsystem and the reference store. Output is serialized across threads and filtered
 * by a process-wide minimum severity.
 */

#pragma once

#include <atomic>
#include <mutex>
#include <string>

namespace keystone::infra {

/**
 * @enum LogLevel
 * @brief Severity hierarchy for diagnostic messages, lowest first.
 */
enum class LogLevel {
    TRACE, ///< Per-record execution flow (e.g., each identifier handed out).
    DEBUG, ///< Internal state transitions (e.g., counter verification steps).
    INFO,  ///< Nominal operational events (e.g., table provisioned, store online).
    WARN,  ///< Recoverable anomalies (e.g., a provisioning race lost).
    ERROR, ///< Failed store operations surfaced to a caller.
    FATAL  ///< Corrupt state or unrecoverable startup failures.
};

/**
 * @class Logger
 * @brief A static utility class providing system-wide logging capabilities.
 *
 * @details
 * Every entry carries a timestamp and a colour-coded severity tag. Entries below the
 * configured threshold are dropped before the lock is taken.
 */
class Logger {
  public:
    /**
     * @brief Writes a formatted diagnostic message to the console.
     *
     * **Stream Routing Logic:**
     * - `TRACE`, `DEBUG`, `INFO`: `std::cout`.
     * - `WARN`, `ERROR`, `FATAL`: `std::cerr`.
     *
     * @param level The severity classification of the message.
     * @param message The content payload, by convention prefixed with `"Subsystem: "`.
     *
     * @code
     * keystone::infra::Logger::log(LogLevel::INFO, "Counter: Verified counter for items");
     * @endcode
     */
    static void log(LogLevel level, const std::string& message);

    /// @brief Sets the minimum severity that reaches the console.
    static void set_level(LogLevel level);

    /// @brief Returns the current minimum severity.
    static LogLevel level();

    /**
     * @brief Parses a level name (`trace`, `debug`, `info`, `warn`, `error`, `fatal`).
     *
     * Matching ignores case and surrounding whitespace.
     *
     * @param name The textual level, typically read from `KEYSTONE_LOG_LEVEL`.
     * @param fallback Returned when `name` is empty or unrecognized.
     */
    static LogLevel parse_level(const std::string& name, LogLevel fallback = LogLevel::INFO);

  private:
    /// @brief Guards `std::cout` / `std::cerr` against interleaved entries.
    static std::mutex mutex_;

    /// @brief Minimum severity emitted.
    static std::atomic<LogLevel> threshold_;
};

} // namespace keystone::infra
