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
 * @file command_log.cpp
 * @brief Implementation of the undo/redo engine.
 */

#include "lyra/history/command_log.hpp"

#include "lyra/infra/logger.hpp"

#include <cJSON.h>
#include <cstdlib>

namespace lyra::history {

CommandLog::CommandLog(HistoryOptions options) : options_(options)
{
    if (options_.max_history_size == 0) {
        options_.max_history_size = 1;
    }
}

/**
 * @brief Coalesces `command` into the last entry when it continues a typing burst.
 *
 * Conditions: both commands are flagged mergeable, nothing is redo-able, the
 * ranges are contiguous, and the new command falls within the merge window of
 * the last one.
 */
bool CommandLog::try_coalesce(const Command& command)
{
    if (!command.mergeable_with_previous || entries_.empty() || position_ != entries_.size()) {
        return false;
    }

    Command& last = entries_.back();
    if (!last.mergeable_with_previous) {
        return false;
    }
    if (command.timestamp - last.timestamp > options_.merge_window_ms) {
        return false;
    }
    if (!last.is_contiguous_with(command)) {
        return false;
    }

    last.absorb(command);
    infra::Logger::log(infra::LogLevel::TRACE,
                       "History: Coalesced " + std::string(to_string(command.kind)) +
                           " into command " + std::to_string(last.id));
    return true;
}

std::uint64_t CommandLog::append(Command command)
{
    if (try_coalesce(command)) {
        return entries_.back().id;
    }

    // A new edit after undo discards the redo branch.
    if (position_ < entries_.size()) {
        entries_.erase(entries_.begin() + static_cast<std::ptrdiff_t>(position_), entries_.end());
    }

    command.id = next_id_++;
    const std::uint64_t id = command.id;
    entries_.push_back(std::move(command));
    position_ = entries_.size();

    enforce_limit();
    return id;
}

void CommandLog::enforce_limit()
{
    if (entries_.size() <= options_.max_history_size) {
        return;
    }
    size_t excess = entries_.size() - options_.max_history_size;
    entries_.erase(entries_.begin(), entries_.begin() + static_cast<std::ptrdiff_t>(excess));
    position_ = (position_ > excess) ? position_ - excess : 0;
    infra::Logger::log(infra::LogLevel::TRACE,
                       "History: Dropped " + std::to_string(excess) + " oldest command(s)");
}

StepResult CommandLog::undo(std::string& content)
{
    StepResult result;
    if (position_ == 0) {
        return result;
    }

    try {
        entries_[position_ - 1].apply_inverse(content);
    } catch (const InvariantViolation& e) {
        reset(e.what());
        result.reset = true;
        return result;
    }

    --position_;
    result.applied = true;
    result.can_continue = position_ > 0;
    return result;
}

StepResult CommandLog::redo(std::string& content)
{
    StepResult result;
    if (position_ == entries_.size()) {
        return result;
    }

    try {
        entries_[position_].apply_forward(content);
    } catch (const InvariantViolation& e) {
        reset(e.what());
        result.reset = true;
        return result;
    }

    ++position_;
    result.applied = true;
    result.can_continue = position_ < entries_.size();
    return result;
}

void CommandLog::clear()
{
    entries_.clear();
    position_ = 0;
}

void CommandLog::reset(const std::string& reason)
{
    infra::Logger::log(infra::LogLevel::ERROR,
                       "History: Invariant violation, discarding " +
                           std::to_string(entries_.size()) + " command(s): " + reason);
    clear();
    if (reset_listener_) {
        reset_listener_(reason);
    }
}

HistoryInfo CommandLog::info() const
{
    HistoryInfo info;
    info.undo_count = position_;
    info.redo_count = entries_.size() - position_;
    info.max_size = options_.max_history_size;
    return info;
}

void CommandLog::update_options(const HistoryOptions& options)
{
    options_ = options;
    if (options_.max_history_size == 0) {
        options_.max_history_size = 1;
    }
    enforce_limit();
}

std::string CommandLog::serialize_history() const
{
    cJSON* root = cJSON_CreateObject();
    cJSON_AddNumberToObject(root, "position", static_cast<double>(position_));
    cJSON_AddNumberToObject(root, "length", static_cast<double>(entries_.size()));

    cJSON* arr = cJSON_AddArrayToObject(root, "entries");
    for (const auto& c : entries_) {
        cJSON* item = cJSON_CreateObject();
        cJSON_AddNumberToObject(item, "id", static_cast<double>(c.id));
        cJSON_AddStringToObject(item, "kind", to_string(c.kind));
        cJSON_AddNumberToObject(item, "start", static_cast<double>(c.range.start));
        cJSON_AddNumberToObject(item, "end", static_cast<double>(c.range.end));
        cJSON_AddStringToObject(item, "before", c.before.c_str());
        cJSON_AddStringToObject(item, "after", c.after.c_str());
        cJSON_AddNumberToObject(item, "timestamp", static_cast<double>(c.timestamp));
        cJSON_AddItemToArray(arr, item);
    }

    char* raw = cJSON_PrintUnformatted(root);
    std::string out = raw ? raw : "{}";
    free(raw);
    cJSON_Delete(root);
    return out;
}

} // namespace lyra::history
