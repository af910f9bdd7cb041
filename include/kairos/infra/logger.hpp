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
 * @brief Thread-safe diagnostic logging facility for Kairos.
 *
 * @details
 * This header declares the `Logger` class, the single reporting channel used by
 * the generators and the `kairos` executable. Output to `stdout`/`stderr` is
 * serialized across threads, and a process-wide threshold drops low-severity
 * entries before any formatting work is done.
 */

#pragma once

#include <atomic>
#include <mutex>
#include <string>
#include <string_view>

namespace kairos::infra {

/**
 * @enum LogLevel
 * @brief Defines the severity hierarchy for diagnostic messages.
 */
enum class LogLevel {
    TRACE, ///< Per-call details (timestamps, sequence values).
    DEBUG, ///< One-time initialisation events (seeding, address resolution).
    INFO,  ///< Nominal operational events.
    WARN,  ///< Degraded but correct behaviour (e.g. random node fallback).
    ERROR, ///< A generation call failed and is being reported to the caller.
    FATAL  ///< The executable cannot continue.
};

/**
 * @class Logger
 * @brief A static utility class providing process-wide logging.
 *
 * @details
 * Entries below the configured threshold are discarded without taking the lock.
 * Everything else is written atomically with a timestamp and a colour-coded tag.
 */
class Logger {
  public:
    /**
     * @brief Writes a formatted diagnostic message to the console.
     *
     * **Stream Routing Logic:**
     * - `TRACE`, `DEBUG`, `INFO`: Routed to `std::cout`.
     * - `WARN`, `ERROR`, `FATAL`: Routed to `std::cerr`.
     *
     * @param level The severity classification of the message.
     * @param message The content payload to be logged.
     *
     * @code
     * // Example Usage:
     * kairos::infra::Logger::log(LogLevel::WARN, "Node: falling back to random address.");
     * @endcode
     */
    static void log(LogLevel level, const std::string& message);

    /// @brief Sets the minimum severity that reaches the console (default `INFO`).
    static void set_level(LogLevel level);

    /// @brief The current minimum severity.
    static LogLevel level();

    /// @brief True if a message at `level` would be written.
    static bool enabled(LogLevel level);

    /**
     * @brief Maps a level name to a `LogLevel`.
     *
     * Accepts `trace`, `debug`, `info`, `warn`, `error`, `fatal` in any letter case.
     *
     * @param text The level name.
     * @param fallback Returned when `text` is not a known level name.
     */
    static LogLevel parse_level(std::string_view text, LogLevel fallback);

  private:
    /// @brief Serializes access to `std::cout` and `std::cerr`.
    static std::mutex mutex_;

    /// @brief Minimum severity written to the console.
    static std::atomic<LogLevel> threshold_;
};

} // namespace kairos::infra
