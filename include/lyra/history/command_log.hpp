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
 * @file command_log.hpp
 * @brief Bounded undo/redo history with time-windowed coalescing.
 *
 * @details
 * The `CommandLog` stores an ordered sequence of `Command`s and a cursor
 * `position` (0..length). Entries below the cursor are applied; entries at or
 * above it are redo-able. Appending while `position < length` discards the
 * redo branch (no undo tree).
 *
 * **Bounded history:** once `maxHistorySize` is exceeded the oldest entries are
 * dropped, which permanently forfeits undo beyond that point.
 *
 * **Coalescing:** a keystroke command that continues the previous keystroke
 * (same kind, contiguous range, within `mergeWindowMs`) extends the previous
 * entry instead of creating a new one, so one typing burst is one undo step.
 *
 * **Defects:** if an entry no longer fits the buffer during undo or redo, the log
 * logs the `InvariantViolation`, resets itself, notifies the reset listener, and
 * leaves the buffer exactly as it was.
 */

#pragma once

#include "lyra/history/command.hpp"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <string>

namespace lyra::history {

/**
 * @struct HistoryOptions
 * @brief Tunables of the undo/redo engine.
 */
struct HistoryOptions {
    size_t max_history_size = 100;
    std::int64_t merge_window_ms = 500;
};

/**
 * @struct HistoryInfo
 * @brief Snapshot of cursor-derived counters.
 */
struct HistoryInfo {
    size_t undo_count = 0;
    size_t redo_count = 0;
    size_t max_size = 0;
};

/**
 * @struct StepResult
 * @brief Outcome of `undo()` / `redo()`.
 */
struct StepResult {
    /// @brief A command was applied to the buffer.
    bool applied = false;
    /// @brief Another step in the same direction is possible.
    bool can_continue = false;
    /// @brief The log was reset because of an invariant violation.
    bool reset = false;
};

/**
 * @class CommandLog
 * @brief In-memory history of one editing session.
 */
class CommandLog {
  public:
    /// @brief Invoked with a human readable reason after an invariant reset.
    using ResetListener = std::function<void(const std::string& reason)>;

    explicit CommandLog(HistoryOptions options = HistoryOptions{});

    /**
     * @brief Records an edit that has already been applied to the buffer.
     *
     * @return std::uint64_t The id of the entry now holding the edit (the
     * previous entry's id when the command was coalesced).
     */
    std::uint64_t append(Command command);

    /**
     * @brief Inverts the command at `position - 1` on `content`.
     *
     * No-op when `position == 0`.
     */
    StepResult undo(std::string& content);

    /**
     * @brief Re-applies the command at `position` on `content`.
     *
     * No-op when `position == length`.
     */
    StepResult redo(std::string& content);

    bool can_undo() const { return position_ > 0; }
    bool can_redo() const { return position_ < entries_.size(); }

    size_t length() const { return entries_.size(); }
    size_t position() const { return position_; }

    const std::deque<Command>& entries() const { return entries_; }

    /// @brief Drops every entry and rewinds the cursor.
    void clear();

    HistoryInfo info() const;

    const HistoryOptions& options() const { return options_; }

    /**
     * @brief Replaces the options; a smaller `max_history_size` trims immediately.
     */
    void update_options(const HistoryOptions& options);

    void set_reset_listener(ResetListener listener) { reset_listener_ = std::move(listener); }

    /**
     * @brief Exports the log as JSON for debugging (never used for persistence).
     *
     * Format: `{"position":n,"length":m,"entries":[{"id":..,"kind":"insert",
     * "start":..,"end":..,"before":"..","after":"..","timestamp":..}]}`
     */
    std::string serialize_history() const;

  private:
    bool try_coalesce(const Command& command);
    void enforce_limit();
    void reset(const std::string& reason);

    HistoryOptions options_;
    std::deque<Command> entries_;
    size_t position_ = 0;
    std::uint64_t next_id_ = 1;
    ResetListener reset_listener_;
};

} // namespace lyra::history
