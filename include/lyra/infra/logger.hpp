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
 * @brief Thread-safe diagnostic logging facility for Lyra.
 *
 * @details
 * This header declares the `Logger` class, the single reporting channel used by
 * every subsystem of the editing engine (history, codec, storage tiers, autosave,
 * recovery). Output is serialized through a process-wide mutex so that lines
 * written from worker threads (durable writes, remote pushes) never interleave
 * with lines written from the event loop.
 */

#pragma once

#include <mutex>
#include <string>

namespace lyra::infra {

/**
 * @enum LogLevel
 * @brief Defines the severity hierarchy for diagnostic messages.
 *
 * Used to categorize the criticality of log entries, to filter them against the
 * configured threshold, and to pick the output stream (Standard Output vs. Standard Error).
 */
enum class LogLevel {
    TRACE, ///< Granular execution flow details (timer arming, merge decisions).
    DEBUG, ///< Diagnostic information (compression ratios, eviction candidates).
    INFO,  ///< Nominal operational events (session opened, draft recovered).
    WARN,  ///< Degraded durability that the engine recovered from.
    ERROR, ///< Defects and data integrity problems (invariant violation, corrupted draft).
    FATAL  ///< Bootstrap failures that stop the process.
};

/**
 * @class Logger
 * @brief A static utility class providing system-wide logging capabilities.
 *
 * @details
 * Messages below the active threshold are discarded before the lock is taken.
 * The threshold defaults to `INFO` and can be seeded from the `LYRA_LOG_LEVEL`
 * environment variable via `init_from_env()`.
 */
class Logger {
  public:
    /**
     * @brief Writes a formatted diagnostic message to the console.
     *
     * The output includes a timestamp, the severity tag, and the payload.
     *
     * **Stream Routing Logic:**
     * - `TRACE`, `DEBUG`, `INFO`: Routed to `std::cout`.
     * - `WARN`, `ERROR`, `FATAL`: Routed to `std::cerr`.
     *
     * @param level The severity classification of the message.
     * @param message The content payload to be logged.
     *
     * @code
     * lyra::infra::Logger::log(LogLevel::WARN, "Quota: durable tier exhausted for song-42");
     * @endcode
     */
    static void log(LogLevel level, const std::string& message);

    /**
     * @brief Sets the minimum severity that reaches the console.
     */
    static void set_threshold(LogLevel level);

    /// @brief Returns the active minimum severity.
    static LogLevel threshold();

    /**
     * @brief Enables or disables ANSI colour sequences (disable when piping to files).
     */
    static void set_color(bool enabled);

    /**
     * @brief Parses a textual level name ("trace", "debug", "info", "warn", "error", "fatal").
     *
     * @param name Case-insensitive level name.
     * @param out Receives the parsed level on success.
     * @return true If the name was recognized.
     */
    static bool parse_level(const std::string& name, LogLevel& out);

    /**
     * @brief Applies `LYRA_LOG_LEVEL` from the environment, if set and valid.
     */
    static void init_from_env();

  private:
    /// @brief Guards access to `std::cout` and `std::cerr`.
    static std::mutex mutex_;

    static LogLevel threshold_;
    static bool color_;
};

} // namespace lyra::infra
