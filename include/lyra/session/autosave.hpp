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
 * @file autosave.hpp
 * @brief Debounced, throttled save scheduler for one editing session.
 *
 * @details
 * **State machine:** `IDLE -> PENDING -> SAVING -> {SAVED | ERROR}`; `SAVED`
 * returns to `IDLE` after `cooldown_ms`, or to `PENDING` when edits arrived while
 * the save was in flight.
 *
 * **Save cycle** (debounce fired, forced, suspended or closing):
 * 1. Hash the live content.
 * 2. Write the volatile tier unless it already holds this hash.
 * 3. Write the durable tier unless it already holds this hash and at least
 *    `throttle_ms` passed since the last durable write (forced cycles skip the
 *    throttle). A throttled durable write is re-armed for the end of the window.
 * 4. Push to the remote store, independently, when the document has a server
 *    identity and the remote throttle allows it.
 *
 * Saving unchanged content twice performs no tier write the second time.
 *
 * **Threading:** every method runs on the event loop thread. Durable writes and
 * remote pushes go to the `WorkerPool` when one is supplied; their completions
 * re-enter the loop through `EventLoop::post()`. Without a pool, the write is
 * deferred to the next loop iteration. At most one durable write is in flight.
 *
 * Local and remote durability are reported as two separate signals: a failed
 * push never changes the local `SaveStatus`.
 */

#pragma once

#include "lyra/infra/event_loop.hpp"
#include "lyra/infra/status.hpp"
#include "lyra/infra/worker_pool.hpp"
#include "lyra/session/remote_sync.hpp"
#include "lyra/storage/draft_store.hpp"

#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>

namespace lyra::session {

/**
 * @enum SaveStatus
 * @brief Local durability status.
 */
enum class SaveStatus { IDLE, PENDING, SAVING, SAVED, ERROR };

const char* to_string(SaveStatus status);

/**
 * @enum RemoteStatus
 * @brief Remote durability status.
 */
enum class RemoteStatus {
    UNKNOWN, ///< Nothing pushed yet in this session.
    PENDING, ///< A push attempt (or its retry back-off) is in progress.
    SYNCED,  ///< The last push succeeded.
    FAILED,  ///< Attempts exhausted: "not backed up remotely".
    SKIPPED  ///< No server identity, or no remote client configured.
};

const char* to_string(RemoteStatus status);

/**
 * @struct SaveState
 * @brief Snapshot reported to the caller.
 */
struct SaveState {
    SaveStatus status = SaveStatus::IDLE;
    /// @brief Wall milliseconds of the last successful local write.
    std::int64_t last_saved_at = 0;
    infra::Status last_error;
    /// @brief Live content differs from the last durably persisted draft.
    bool is_dirty = false;
};

/**
 * @struct RemoteState
 * @brief Remote push status reported alongside `SaveState`.
 */
struct RemoteState {
    RemoteStatus status = RemoteStatus::UNKNOWN;
    Revision last_revision;
    /// @brief Attempts spent on the current (or last) push.
    int attempts = 0;
    infra::Status last_error;
    std::int64_t last_synced_at = 0;
};

/**
 * @struct AutoSaveOptions
 * @brief Timing parameters; see `Config` for defaults.
 */
struct AutoSaveOptions {
    std::int64_t debounce_ms = 1000;
    std::int64_t throttle_ms = 10000;
    std::int64_t cooldown_ms = 2000;
    int remote_max_attempts = 3;
    std::int64_t remote_backoff_ms = 1000;
    std::int64_t remote_timeout_ms = 15000;
};

/**
 * @class AutoSave
 * @brief Save scheduler bound to one document.
 */
class AutoSave {
  public:
    /// @brief Returns the live buffer. Called on the loop thread only.
    using ContentProvider = std::function<const std::string&()>;

    using StateListener = std::function<void(const SaveState&, const RemoteState&)>;

    /**
     * @param loop Event loop driving timers and completions. Must outlive the scheduler.
     * @param store Shared draft store. Must outlive the scheduler.
     * @param remote Optional remote client, owned by the application.
     * @param pool Optional worker pool for durable writes and pushes.
     */
    AutoSave(std::string document_id, infra::EventLoop& loop, storage::DraftStore& store,
             ContentProvider content, AutoSaveOptions options = AutoSaveOptions{},
             RemoteSyncClient* remote = nullptr, infra::WorkerPool* pool = nullptr);

    /// @brief Cancels timers and waits for an in-flight durable write.
    ~AutoSave();

    AutoSave(const AutoSave&) = delete;
    AutoSave& operator=(const AutoSave&) = delete;

    /**
     * @brief Seeds the hashes the tiers and remote are known to hold.
     *
     * Empty strings mean "nothing stored".
     */
    void set_baseline(const std::string& durable_hash, const std::string& volatile_hash,
                      const std::string& remote_hash);

    void set_server_identity(bool has_identity);
    bool has_server_identity() const { return has_server_identity_; }

    /// @brief Re-arms the debounce timer after an edit.
    void notify_edit();

    /**
     * @brief Runs the save path now, bypassing the debounce and durable throttle.
     *
     * Returns once the local writes have completed.
     */
    void force_save();

    /// @brief The session is about to be hidden or suspended; flushes like `force_save()`.
    void suspend();

    /**
     * @brief Cancels pending timers and performs one final synchronous flush.
     *
     * Later calls are no-ops; edits after `close()` are ignored.
     */
    void close();

    /**
     * @brief Deletes the document's drafts from both tiers; the state returns to IDLE, not dirty.
     */
    infra::Status clear_drafts();

    SaveState state() const;
    const RemoteState& remote_state() const { return remote_state_; }
    bool is_dirty() const;
    bool closed() const { return closed_; }

    void set_listener(StateListener listener) { listener_ = std::move(listener); }

    const std::string& last_durable_hash() const { return last_durable_hash_; }

    /**
     * @brief Delay before retry number `attempt` (1-based): `backoff_ms` doubled
     * per earlier attempt, capped at `kMaxRetryDelayMs` or at `backoff_ms` when
     * that is larger.
     */
    static std::int64_t retry_delay(std::int64_t backoff_ms, int attempt);

    static constexpr std::int64_t kMaxRetryDelayMs = 5 * 60 * 1000;

    /// @name Write counters
    /// @{
    size_t volatile_writes() const { return volatile_writes_; }
    size_t durable_writes() const { return durable_writes_; }
    size_t push_attempts() const { return push_attempts_; }
    /// @}

  private:
    template <typename F> infra::EventLoop::Task guarded(F f)
    {
        std::weak_ptr<bool> alive = alive_;
        return [alive, f]() {
            if (alive.lock()) {
                f();
            }
        };
    }

    void run_cycle(bool forced);
    void start_durable_write(const std::string& content, const std::string& hash);
    void finish_durable_write();
    void finish_cycle(const infra::Status& result, bool wrote);

    void arm_debounce();
    void arm_throttle(std::int64_t delay_ms);
    void arm_cooldown();
    void cancel_timer(infra::EventLoop::TimerId& id);

    void maybe_push();
    void start_push();
    void on_push_result(std::uint64_t attempt_id, const PushResult& result);
    void on_push_failure(const infra::Status& status);

    void notify();

    std::string document_id_;
    infra::EventLoop& loop_;
    storage::DraftStore& store_;
    ContentProvider content_;
    AutoSaveOptions options_;
    RemoteSyncClient* remote_;
    infra::WorkerPool* pool_;

    bool has_server_identity_ = false;
    bool closed_ = false;

    SaveStatus status_ = SaveStatus::IDLE;
    std::int64_t last_saved_at_ = 0;
    infra::Status last_error_;
    bool follow_up_ = false;

    std::string last_durable_hash_;
    std::string last_volatile_hash_;
    std::optional<std::int64_t> last_durable_at_;

    /// @brief Result of the in-flight durable write; invalid when none is in flight.
    std::future<infra::Status> pending_write_;
    std::string in_flight_hash_;
    infra::Status cycle_error_;

    infra::EventLoop::TimerId debounce_timer_ = infra::EventLoop::kNoTimer;
    infra::EventLoop::TimerId throttle_timer_ = infra::EventLoop::kNoTimer;
    infra::EventLoop::TimerId cooldown_timer_ = infra::EventLoop::kNoTimer;

    RemoteState remote_state_;
    std::string last_remote_hash_;
    std::string pushing_hash_;
    std::optional<std::int64_t> last_remote_at_;
    bool push_active_ = false;
    bool push_follow_up_ = false;
    int push_attempt_ = 0;
    std::uint64_t push_attempt_id_ = 0;

    infra::EventLoop::TimerId remote_throttle_timer_ = infra::EventLoop::kNoTimer;
    infra::EventLoop::TimerId remote_retry_timer_ = infra::EventLoop::kNoTimer;
    infra::EventLoop::TimerId remote_timeout_timer_ = infra::EventLoop::kNoTimer;

    size_t volatile_writes_ = 0;
    size_t durable_writes_ = 0;
    size_t push_attempts_ = 0;

    StateListener listener_;

    /// @brief Expires with the scheduler; posted tasks and timers check it before running.
    std::shared_ptr<bool> alive_;
};

} // namespace lyra::session
