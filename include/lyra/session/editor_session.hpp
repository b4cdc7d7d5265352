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
 * @file editor_session.hpp
 * @brief One open document: live buffer, undo/redo history and autosave.
 *
 * @details
 * Lifecycle:
 * 1. `open()` purges expired drafts, resolves the starting content and seeds
 *    the buffer.
 * 2. Edits mutate the buffer, are recorded in the `CommandLog` and re-arm the
 *    autosave debounce.
 * 3. `close()` performs a final synchronous flush and releases the document's
 *    eviction protection.
 *
 * The history is never persisted; only the resulting content is.
 */

#pragma once

#include "lyra/history/command_log.hpp"
#include "lyra/infra/event_loop.hpp"
#include "lyra/infra/status.hpp"
#include "lyra/infra/worker_pool.hpp"
#include "lyra/session/autosave.hpp"
#include "lyra/session/config.hpp"
#include "lyra/session/recovery.hpp"
#include "lyra/session/remote_sync.hpp"
#include "lyra/storage/draft_store.hpp"

#include <cstddef>
#include <memory>
#include <string>

namespace lyra::session {

/**
 * @struct DocumentRef
 * @brief Identity of the edited document.
 */
struct DocumentRef {
    std::string id;
    /// @brief The document exists in the remote store and may be pushed.
    bool has_server_identity = false;
};

/**
 * @class EditorSession
 * @brief Editing session bound to one document.
 */
class EditorSession {
  public:
    EditorSession(DocumentRef document, infra::EventLoop& loop, storage::DraftStore& store,
                  const Config& config, RemoteSyncClient* remote = nullptr,
                  infra::WorkerPool* pool = nullptr);

    /// @brief Closes the session if the caller did not.
    ~EditorSession();

    EditorSession(const EditorSession&) = delete;
    EditorSession& operator=(const EditorSession&) = delete;

    /**
     * @brief Purges expired drafts, runs recovery and seeds the buffer.
     */
    const RecoveryOutcome& open();

    /// @name Edits
    /// Offsets are byte offsets into the UTF-8 buffer. Out-of-range offsets
    /// return INVALID_ARGUMENT and leave the buffer untouched.
    /// @{
    infra::Status insert(size_t offset, const std::string& text);
    infra::Status erase(size_t offset, size_t length);
    infra::Status replace(size_t offset, size_t length, const std::string& text);
    /// @}

    history::StepResult undo();
    history::StepResult redo();
    bool can_undo() const { return history_.can_undo(); }
    bool can_redo() const { return history_.can_redo(); }

    void force_save();
    void suspend();
    void close();

    /// @brief Deletes this document's drafts; the session becomes clean.
    infra::Status clear_drafts();

    /**
     * @brief Rejects the recovered draft: drops local drafts and restarts from
     * the remote canonical content, or from empty content.
     *
     * @return REMOTE_SYNC_FAILED, with buffer, history and drafts untouched,
     *         when the canonical content cannot be fetched.
     */
    infra::Status discard_recovery();

    std::string serialize_history() const { return history_.serialize_history(); }

    void set_server_identity(bool has_identity);

    const std::string& id() const { return document_.id; }
    const std::string& content() const { return content_; }
    bool is_open() const { return open_; }

    SaveState save_state() const { return autosave_.state(); }
    const RemoteState& remote_state() const { return autosave_.remote_state(); }
    history::HistoryInfo history_info() const { return history_.info(); }
    const RecoveryOutcome& recovery() const { return recovery_; }

    /// @brief Number of times the history was reset after an invariant violation.
    size_t history_resets() const { return history_resets_; }

    history::CommandLog& history() { return history_; }
    AutoSave& autosave() { return autosave_; }

  private:
    infra::Status check_editable() const;
    void record(history::Command command);

    DocumentRef document_;
    infra::EventLoop& loop_;
    storage::DraftStore& store_;
    Config config_;
    RemoteSyncClient* remote_;

    std::string content_;
    history::CommandLog history_;
    AutoSave autosave_;
    RecoveryOutcome recovery_;

    bool open_ = false;
    bool closed_ = false;
    size_t history_resets_ = 0;
};

} // namespace lyra::session
