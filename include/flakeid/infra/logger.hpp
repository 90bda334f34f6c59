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
 * @brief Thread-safe diagnostic logging facility for FlakeID.
 *
 * @details
 * This header declares the `Logger` class, the single reporting channel of the
 * library and the command-line tool. Generators report construction and clock
 * anomalies through it, registries report mutations, and the CLI reports
 * failures. Output is serialized so that lines from concurrent generators never
 * interleave.
 */

#pragma once

#include <atomic>
#include <mutex>
#include <string>

namespace flakeid::infra {

/**
 * @enum LogLevel
 * @brief Defines the severity hierarchy for diagnostic messages.
 */
enum class LogLevel {
    TRACE, ///< Per-ID execution details.
    DEBUG, ///< Diagnostic information for troubleshooting.
    INFO,  ///< Nominal events (generator created, registry resized).
    WARN,  ///< Anomalies that were absorbed (clock stepped back, reused timestamp).
    ERROR, ///< Failed operations reported back to the caller.
    FATAL  ///< Failures that end the command-line tool.
};

/**
 * @brief Resolves a level from "trace", "debug", "info", "warn", "error" or "fatal".
 * @return false if the name is unknown; `out` is left untouched.
 */
bool parse_log_level(const std::string& name, LogLevel& out);

/**
 * @class Logger
 * @brief A static utility class providing system-wide logging capabilities.
 */
class Logger {
  public:
    /**
     * @brief Writes a formatted diagnostic message to the console.
     *
     * The output includes a timestamp, the severity tag, and the payload.
     * Messages below the minimum level are dropped.
     *
     * **Stream Routing Logic:**
     * - `TRACE`, `DEBUG`, `INFO`: Routed to `std::cout`.
     * - `WARN`, `ERROR`, `FATAL`: Routed to `std::cerr`.
     *
     * @param level The severity classification of the message.
     * @param message The content payload to be logged.
     *
     * @code
     * flakeid::infra::Logger::log(LogLevel::WARN, "Snowflake: clock moved back 3 ms");
     * @endcode
     */
    static void log(LogLevel level, const std::string& message);

    /// @brief Sets the minimum level that reaches the console (default INFO).
    static void set_level(LogLevel level);

    /// @brief Returns the current minimum level.
    static LogLevel level();

  private:
    /// @brief Guards access to `std::cout` and `std::cerr`.
    static std::mutex mutex_;

    /// @brief Minimum level that is emitted.
    static std::atomic<LogLevel> min_level_;
};

} // namespace flakeid::infra
