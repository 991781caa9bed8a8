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
 * @brief Thread-safe diagnostic logging facility for UUIDForge.
 *
 * @details
 * Declares the `Logger` class used by the generator and the command-line tool
 * to report latch initialization, hardware-address fallbacks and fatal errors.
 * Output to `stdout`/`stderr` is serialized across threads and filtered by a
 * process-wide severity threshold.
 */

#pragma once

#include <atomic>
#include <mutex>
#include <string>

namespace uuidforge::infra {

/**
 * @enum LogLevel
 * @brief Defines the severity hierarchy for diagnostic messages.
 */
enum class LogLevel {
    TRACE, ///< Granular execution flow details.
    DEBUG, ///< Diagnostic information (e.g., clock sequence seeding).
    INFO,  ///< Nominal operational events.
    WARN,  ///< Recovered anomalies (e.g., no hardware address found).
    ERROR, ///< Failures reported back to the caller.
    FATAL  ///< Failures that terminate the command-line tool.
};

/**
 * @class Logger
 * @brief A static utility class providing process-wide logging.
 *
 * @details
 * Messages below the configured threshold are dropped before the console lock
 * is taken, so DEBUG logging on hot generation paths costs one atomic load.
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
     * uuidforge::infra::Logger::log(LogLevel::WARN, "Generator: no hardware address.");
     * @endcode
     */
    static void log(LogLevel level, const std::string& message);

    /**
     * @brief Sets the minimum severity that reaches the console.
     *
     * @param level The new threshold. Defaults to `LogLevel::INFO`.
     */
    static void set_level(LogLevel level);

    /// @brief Returns the current severity threshold.
    static LogLevel level();

    /// @brief Reports whether a message of the given severity would be written.
    static bool enabled(LogLevel level);

  private:
    /// @brief Guards `std::cout` and `std::cerr` against interleaved output.
    static std::mutex mutex_;

    /// @brief Active severity threshold.
    static std::atomic<LogLevel> threshold_;
};

} // namespace uuidforge::infra
