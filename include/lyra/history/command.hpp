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
 * @file command.hpp
 * @brief Invertible edit descriptions recorded by the undo/redo engine.
 *
 * @details
 * A `Command` is the unit of history: it carries enough text to move the
 * buffer forward (`after` replaces `range`) and backward (`before` replaces the
 * post-edit range). Commands never hold full-document snapshots.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace lyra::history {

/**
 * @enum EditKind
 * @brief Shape of an edit.
 */
enum class EditKind {
    INSERT, ///< `before` is empty; `range` is the empty insertion point.
    DELETE, ///< `after` is empty; `range` covers the removed text.
    REPLACE ///< Both sides carry text; never coalesced.
};

const char* to_string(EditKind kind);

/**
 * @struct TextRange
 * @brief Half-open byte interval `[start, end)` in the pre-edit document.
 */
struct TextRange {
    size_t start = 0;
    size_t end = 0;

    size_t length() const { return end - start; }
};

/**
 * @class InvariantViolation
 * @brief Raised when a command does not fit the buffer it is applied to.
 *
 * This signals a programming defect (history and buffer diverged), never bad
 * user input. It is caught inside `CommandLog`, which resets itself.
 */
class InvariantViolation : public std::logic_error {
  public:
    explicit InvariantViolation(const std::string& what) : std::logic_error(what) {}
};

/**
 * @struct Command
 * @brief One atomic, invertible edit.
 */
struct Command {
    /// @brief Sequence number assigned by the `CommandLog` on append.
    std::uint64_t id = 0;

    EditKind kind = EditKind::INSERT;

    TextRange range;

    /// @brief Text removed or replaced (restored by undo).
    std::string before;

    /// @brief Text inserted or replacing (restored by redo).
    std::string after;

    /// @brief Monotonic clock reading at creation, in milliseconds.
    std::int64_t timestamp = 0;

    /// @brief Set for keystroke-sized edits that may continue the previous command.
    bool mergeable_with_previous = false;

    static Command insert(size_t offset, std::string text, std::int64_t timestamp,
                          bool mergeable = false);

    static Command erase(size_t offset, std::string removed, std::int64_t timestamp,
                         bool mergeable = false);

    static Command replace(size_t offset, std::string before, std::string after,
                           std::int64_t timestamp);

    /**
     * @brief Transforms state n-1 into state n.
     *
     * @throws InvariantViolation If `range` is out of bounds or the buffer does
     * not contain `before` at `range`. The buffer is untouched in that case.
     */
    void apply_forward(std::string& content) const;

    /**
     * @brief Transforms state n back into state n-1.
     *
     * @throws InvariantViolation If the post-edit range does not hold `after`.
     * The buffer is untouched in that case.
     */
    void apply_inverse(std::string& content) const;

    /**
     * @brief Whether `next` continues this command contiguously.
     *
     * - INSERT then INSERT: `next` starts where this command's inserted text ends.
     * - DELETE then DELETE: `next` ends where this deletion starts (backspace) or
     *   starts at the same offset (forward delete).
     * - REPLACE never continues.
     *
     * Timing is checked by the `CommandLog`, not here.
     */
    bool is_contiguous_with(const Command& next) const;

    /**
     * @brief Extends this command so that it also covers `next`.
     *
     * @pre `is_contiguous_with(next)`.
     */
    void absorb(const Command& next);
};

} // namespace lyra::history
