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
 * @file editor_session.cpp
 * @brief Session lifecycle, edit recording and baseline seeding.
 */

#include "lyra/session/editor_session.hpp"

#include "lyra/infra/hash.hpp"
#include "lyra/infra/logger.hpp"

#include <exception>

namespace lyra::session {

namespace {

/// @brief True when `text` is exactly one UTF-8 code point (a keystroke).
bool is_single_code_point(const std::string& text)
{
    if (text.empty()) {
        return false;
    }
    unsigned char lead = static_cast<unsigned char>(text[0]);
    size_t expected = 1;
    if (lead >= 0xF0)
        expected = 4;
    else if (lead >= 0xE0)
        expected = 3;
    else if (lead >= 0xC0)
        expected = 2;
    return text.size() == expected;
}

} // namespace

EditorSession::EditorSession(DocumentRef document, infra::EventLoop& loop,
                             storage::DraftStore& store, const Config& config,
                             RemoteSyncClient* remote, infra::WorkerPool* pool)
    : document_(std::move(document)), loop_(loop), store_(store), config_(config),
      remote_(remote), history_(config.history_options()),
      autosave_(document_.id, loop, store, [this]() -> const std::string& { return content_; },
                config.autosave_options(), remote, pool)
{
    autosave_.set_server_identity(document_.has_server_identity);

    history_.set_reset_listener([this](const std::string& reason) {
        ++history_resets_;
        infra::Logger::log(infra::LogLevel::WARN, "Session: History of " + document_.id +
                                                      " reset, content preserved (" + reason +
                                                      ")");
    });
}

EditorSession::~EditorSession()
{
    if (open_ && !closed_) {
        close();
    }
}

const RecoveryOutcome& EditorSession::open()
{
    if (open_) {
        return recovery_;
    }

    store_.open_document(document_.id);
    store_.purge_expired(config_.max_draft_age_ms);

    RecoveryResolver resolver(store_, remote_);
    recovery_ = resolver.resolve(document_.id, document_.has_server_identity);
    content_ = recovery_.content;

    const std::string hash = infra::content_hash(content_);
    switch (recovery_.source) {
    case RecoverySource::VOLATILE:
        // Unsynced local edits: durable tier is behind until the next save.
        autosave_.set_baseline(recovery_.durable_hash, hash, recovery_.remote_hash);
        break;
    case RecoverySource::DURABLE:
        autosave_.set_baseline(hash, recovery_.volatile_hash, recovery_.remote_hash);
        break;
    case RecoverySource::REMOTE:
    case RecoverySource::NONE:
        autosave_.set_baseline(hash, recovery_.volatile_hash, hash);
        break;
    }

    open_ = true;

    if (recovery_.found()) {
        infra::Logger::log(infra::LogLevel::INFO,
                           "Session: Opened " + document_.id + " from " +
                               to_string(recovery_.source) + " (saved " +
                               recovery_.age_text(loop_.clock().wall_ms()) + ")");
    } else {
        infra::Logger::log(infra::LogLevel::INFO, "Session: Opened new document " + document_.id);
    }

    if (autosave_.is_dirty()) {
        autosave_.notify_edit();
    }
    return recovery_;
}

infra::Status EditorSession::check_editable() const
{
    if (!open_ || closed_) {
        return infra::Status::error(infra::ErrorCode::INVALID_ARGUMENT,
                                    "session for " + document_.id + " is not open");
    }
    return infra::Status::success();
}

void EditorSession::record(history::Command command)
{
    history_.append(std::move(command));
    autosave_.notify_edit();
}

infra::Status EditorSession::insert(size_t offset, const std::string& text)
{
    infra::Status st = check_editable();
    if (!st.ok()) {
        return st;
    }
    if (offset > content_.size()) {
        return infra::Status::error(infra::ErrorCode::INVALID_ARGUMENT,
                                    "insert offset " + std::to_string(offset) +
                                        " beyond end of document");
    }
    if (text.empty()) {
        return infra::Status::success();
    }

    auto command = history::Command::insert(offset, text, loop_.clock().monotonic_ms(),
                                            is_single_code_point(text));
    content_.insert(offset, text);
    record(std::move(command));
    return infra::Status::success();
}

infra::Status EditorSession::erase(size_t offset, size_t length)
{
    infra::Status st = check_editable();
    if (!st.ok()) {
        return st;
    }
    if (offset > content_.size() || length > content_.size() - offset) {
        return infra::Status::error(infra::ErrorCode::INVALID_ARGUMENT,
                                    "delete range beyond end of document");
    }
    if (length == 0) {
        return infra::Status::success();
    }

    std::string removed = content_.substr(offset, length);
    bool keystroke = is_single_code_point(removed);
    auto command =
        history::Command::erase(offset, std::move(removed), loop_.clock().monotonic_ms(), keystroke);
    content_.erase(offset, length);
    record(std::move(command));
    return infra::Status::success();
}

infra::Status EditorSession::replace(size_t offset, size_t length, const std::string& text)
{
    infra::Status st = check_editable();
    if (!st.ok()) {
        return st;
    }
    if (offset > content_.size() || length > content_.size() - offset) {
        return infra::Status::error(infra::ErrorCode::INVALID_ARGUMENT,
                                    "replace range beyond end of document");
    }
    if (length == 0) {
        return insert(offset, text);
    }
    if (text.empty()) {
        return erase(offset, length);
    }

    auto command = history::Command::replace(offset, content_.substr(offset, length), text,
                                             loop_.clock().monotonic_ms());
    content_.replace(offset, length, text);
    record(std::move(command));
    return infra::Status::success();
}

history::StepResult EditorSession::undo()
{
    if (!check_editable().ok()) {
        return history::StepResult{};
    }
    history::StepResult result = history_.undo(content_);
    if (result.applied) {
        autosave_.notify_edit();
    }
    return result;
}

history::StepResult EditorSession::redo()
{
    if (!check_editable().ok()) {
        return history::StepResult{};
    }
    history::StepResult result = history_.redo(content_);
    if (result.applied) {
        autosave_.notify_edit();
    }
    return result;
}

void EditorSession::force_save()
{
    if (check_editable().ok()) {
        autosave_.force_save();
    }
}

void EditorSession::suspend()
{
    if (check_editable().ok()) {
        autosave_.suspend();
    }
}

void EditorSession::close()
{
    if (!open_ || closed_) {
        return;
    }
    autosave_.close();
    store_.close_document(document_.id);
    closed_ = true;
    infra::Logger::log(infra::LogLevel::INFO, "Session: Closed " + document_.id);
}

infra::Status EditorSession::clear_drafts()
{
    infra::Status st = check_editable();
    if (!st.ok()) {
        return st;
    }
    return autosave_.clear_drafts();
}

infra::Status EditorSession::discard_recovery()
{
    infra::Status st = check_editable();
    if (!st.ok()) {
        return st;
    }

    std::string canonical;
    if (remote_ && document_.has_server_identity) {
        try {
            if (auto snapshot = remote_->fetch(document_.id)) {
                canonical = std::move(snapshot->content);
            }
        } catch (const std::exception& e) {
            infra::Logger::log(infra::LogLevel::WARN, "Session: Remote fetch of " + document_.id +
                                                          " failed, keeping recovered draft: " +
                                                          e.what());
            return infra::Status::error(infra::ErrorCode::REMOTE_SYNC_FAILED, e.what());
        }
    }

    content_ = std::move(canonical);
    history_.clear();
    recovery_ = RecoveryOutcome{};

    infra::Logger::log(infra::LogLevel::INFO,
                       "Session: Discarded recovered draft of " + document_.id);
    return autosave_.clear_drafts();
}

void EditorSession::set_server_identity(bool has_identity)
{
    document_.has_server_identity = has_identity;
    autosave_.set_server_identity(has_identity);
}

} // namespace lyra::session
