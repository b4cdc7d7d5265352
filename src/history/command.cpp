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
 * @file command.cpp
 * @brief Forward/inverse application and coalescing of edit commands.
 */

#include "lyra/history/command.hpp"

#include <utility>

namespace lyra::history {

const char* to_string(EditKind kind)
{
    switch (kind) {
    case EditKind::INSERT:
        return "insert";
    case EditKind::DELETE:
        return "delete";
    case EditKind::REPLACE:
        return "replace";
    }
    return "unknown";
}

Command Command::insert(size_t offset, std::string text, std::int64_t timestamp, bool mergeable)
{
    Command c;
    c.kind = EditKind::INSERT;
    c.range = TextRange{offset, offset};
    c.after = std::move(text);
    c.timestamp = timestamp;
    c.mergeable_with_previous = mergeable;
    return c;
}

Command Command::erase(size_t offset, std::string removed, std::int64_t timestamp, bool mergeable)
{
    Command c;
    c.kind = EditKind::DELETE;
    c.range = TextRange{offset, offset + removed.size()};
    c.before = std::move(removed);
    c.timestamp = timestamp;
    c.mergeable_with_previous = mergeable;
    return c;
}

Command Command::replace(size_t offset, std::string before, std::string after,
                         std::int64_t timestamp)
{
    Command c;
    c.kind = EditKind::REPLACE;
    c.range = TextRange{offset, offset + before.size()};
    c.before = std::move(before);
    c.after = std::move(after);
    c.timestamp = timestamp;
    return c;
}

void Command::apply_forward(std::string& content) const
{
    if (range.end < range.start || range.end > content.size()) {
        throw InvariantViolation("command " + std::to_string(id) + " range [" +
                                 std::to_string(range.start) + "," + std::to_string(range.end) +
                                 ") exceeds document length " + std::to_string(content.size()));
    }
    if (range.length() != before.size() ||
        content.compare(range.start, before.size(), before) != 0) {
        throw InvariantViolation("command " + std::to_string(id) +
                                 " does not match the document at offset " +
                                 std::to_string(range.start));
    }
    content.replace(range.start, before.size(), after);
}

void Command::apply_inverse(std::string& content) const
{
    const size_t post_end = range.start + after.size();
    if (post_end > content.size()) {
        throw InvariantViolation("command " + std::to_string(id) + " post-edit range [" +
                                 std::to_string(range.start) + "," + std::to_string(post_end) +
                                 ") exceeds document length " + std::to_string(content.size()));
    }
    if (content.compare(range.start, after.size(), after) != 0) {
        throw InvariantViolation("command " + std::to_string(id) +
                                 " cannot be inverted: document changed at offset " +
                                 std::to_string(range.start));
    }
    content.replace(range.start, after.size(), before);
}

bool Command::is_contiguous_with(const Command& next) const
{
    if (kind != next.kind) {
        return false;
    }
    switch (kind) {
    case EditKind::INSERT:
        return next.range.start == range.start + after.size();
    case EditKind::DELETE:
        return next.range.end == range.start || next.range.start == range.start;
    case EditKind::REPLACE:
        return false;
    }
    return false;
}

void Command::absorb(const Command& next)
{
    if (kind == EditKind::INSERT) {
        after += next.after;
    } else if (next.range.end == range.start) {
        // Backspace: the new deletion sits immediately left of the old one.
        before = next.before + before;
        range.start = next.range.start;
        range.end = range.start + before.size();
    } else {
        // Forward delete: text keeps collapsing into the same offset.
        before += next.before;
        range.end = range.start + before.size();
    }
    timestamp = next.timestamp;
}

} // namespace lyra::history
