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
 * @file autosave.cpp
 * @brief Implementation of the save scheduler state machine.
 */

#include "lyra/session/autosave.hpp"

#include "lyra/infra/hash.hpp"
#include "lyra/infra/logger.hpp"

#include <algorithm>
#include <exception>

namespace lyra::session {

using infra::EventLoop;
using infra::LogLevel;
using infra::Logger;

const char* to_string(SaveStatus status)
{
    switch (status) {
    case SaveStatus::IDLE:
        return "idle";
    case SaveStatus::PENDING:
        return "pending";
    case SaveStatus::SAVING:
        return "saving";
    case SaveStatus::SAVED:
        return "saved";
    case SaveStatus::ERROR:
        return "error";
    }
    return "unknown";
}

const char* to_string(RemoteStatus status)
{
    switch (status) {
    case RemoteStatus::UNKNOWN:
        return "unknown";
    case RemoteStatus::PENDING:
        return "pending";
    case RemoteStatus::SYNCED:
        return "synced";
    case RemoteStatus::FAILED:
        return "failed";
    case RemoteStatus::SKIPPED:
        return "skipped";
    }
    return "unknown";
}

AutoSave::AutoSave(std::string document_id, EventLoop& loop, storage::DraftStore& store,
                   ContentProvider content, AutoSaveOptions options, RemoteSyncClient* remote,
                   infra::WorkerPool* pool)
    : document_id_(std::move(document_id)), loop_(loop), store_(store),
      content_(std::move(content)), options_(options), remote_(remote), pool_(pool),
      alive_(std::make_shared<bool>(true))
{
    if (!remote_) {
        remote_state_.status = RemoteStatus::SKIPPED;
    }
}

AutoSave::~AutoSave()
{
    cancel_timer(debounce_timer_);
    cancel_timer(throttle_timer_);
    cancel_timer(cooldown_timer_);
    cancel_timer(remote_throttle_timer_);
    cancel_timer(remote_retry_timer_);
    cancel_timer(remote_timeout_timer_);

    // An accepted durable write is completed, never dropped.
    if (pending_write_.valid()) {
        infra::Status st = pending_write_.get();
        if (!st.ok()) {
            Logger::log(LogLevel::WARN,
                        "AutoSave: Final durable write of " + document_id_ + " failed: " +
                            st.describe());
        }
    }
}

void AutoSave::set_baseline(const std::string& durable_hash, const std::string& volatile_hash,
                            const std::string& remote_hash)
{
    last_durable_hash_ = durable_hash;
    last_volatile_hash_ = volatile_hash;
    last_remote_hash_ = remote_hash;
}

void AutoSave::set_server_identity(bool has_identity)
{
    has_server_identity_ = has_identity;
    if (!remote_) {
        return;
    }
    if (has_identity && remote_state_.status == RemoteStatus::SKIPPED) {
        remote_state_.status = RemoteStatus::UNKNOWN;
    } else if (!has_identity) {
        remote_state_.status = RemoteStatus::SKIPPED;
    }
}

void AutoSave::cancel_timer(EventLoop::TimerId& id)
{
    if (id != EventLoop::kNoTimer) {
        loop_.cancel(id);
        id = EventLoop::kNoTimer;
    }
}

// ============================================================================
// Local save path
// ============================================================================

void AutoSave::notify_edit()
{
    if (closed_) {
        return;
    }

    cancel_timer(cooldown_timer_);

    if (status_ == SaveStatus::SAVING) {
        // Saves never overlap; the edit is picked up by a follow-up cycle.
        follow_up_ = true;
        return;
    }

    bool changed = status_ != SaveStatus::PENDING;
    status_ = SaveStatus::PENDING;
    arm_debounce();
    if (changed) {
        notify();
    }
}

void AutoSave::arm_debounce()
{
    cancel_timer(debounce_timer_);
    debounce_timer_ = loop_.schedule_after(options_.debounce_ms, guarded([this] {
        debounce_timer_ = EventLoop::kNoTimer;
        Logger::log(LogLevel::TRACE, "AutoSave: Debounce fired for " + document_id_);
        run_cycle(false);
    }));
}

void AutoSave::arm_throttle(std::int64_t delay_ms)
{
    if (throttle_timer_ != EventLoop::kNoTimer && loop_.is_scheduled(throttle_timer_)) {
        return;
    }
    Logger::log(LogLevel::TRACE, "AutoSave: Durable write of " + document_id_ +
                                     " throttled for " + std::to_string(delay_ms) + "ms");
    throttle_timer_ = loop_.schedule_after(delay_ms, guarded([this] {
        throttle_timer_ = EventLoop::kNoTimer;
        if (closed_) {
            return;
        }
        if (status_ == SaveStatus::SAVING) {
            follow_up_ = true;
            return;
        }
        run_cycle(false);
    }));
}

void AutoSave::arm_cooldown()
{
    cancel_timer(cooldown_timer_);
    cooldown_timer_ = loop_.schedule_after(options_.cooldown_ms, guarded([this] {
        cooldown_timer_ = EventLoop::kNoTimer;
        if (status_ == SaveStatus::SAVED) {
            status_ = SaveStatus::IDLE;
            notify();
        }
    }));
}

/**
 * @brief One save cycle.
 *
 * A forced cycle first completes the in-flight durable write (if any), then
 * writes both tiers regardless of the durable throttle.
 */
void AutoSave::run_cycle(bool forced)
{
    if (status_ == SaveStatus::SAVING) {
        if (!forced) {
            follow_up_ = true;
            return;
        }
        finish_durable_write();
    }
    cancel_timer(debounce_timer_);

    const std::string& content = content_();
    const std::string hash = infra::content_hash(content);

    status_ = SaveStatus::SAVING;
    cycle_error_ = infra::Status::success();
    bool wrote = false;

    if (hash != last_volatile_hash_) {
        infra::Status st = store_.write_draft(storage::Tier::VOLATILE, document_id_, content);
        if (st.ok()) {
            last_volatile_hash_ = hash;
            ++volatile_writes_;
            wrote = true;
        } else {
            cycle_error_ = st;
        }
    }

    bool durable_started = false;
    if (hash != last_durable_hash_) {
        const std::int64_t now = loop_.clock().monotonic_ms();
        bool throttle_open = !last_durable_at_ || now - *last_durable_at_ >= options_.throttle_ms;
        if (forced || throttle_open) {
            cancel_timer(throttle_timer_);
            start_durable_write(content, hash);
            durable_started = true;
        } else {
            arm_throttle(*last_durable_at_ + options_.throttle_ms - now);
        }
    } else if (!wrote && cycle_error_.ok()) {
        Logger::log(LogLevel::TRACE, "AutoSave: " + document_id_ + " unchanged, nothing to save");
    }

    maybe_push();

    if (!durable_started) {
        finish_cycle(cycle_error_, wrote);
    } else {
        notify();
    }
}

void AutoSave::start_durable_write(const std::string& content, const std::string& hash)
{
    last_durable_at_ = loop_.clock().monotonic_ms();
    in_flight_hash_ = hash;

    storage::DraftStore& store = store_;
    std::string document_id = document_id_;
    std::string snapshot = content;

    auto job = [&store, document_id, snapshot]() {
        return store.write_draft(storage::Tier::DURABLE, document_id, snapshot);
    };

    if (!pool_) {
        pending_write_ = std::async(std::launch::deferred, job);
        loop_.post(guarded([this] { finish_durable_write(); }));
        return;
    }

    auto promise = std::make_shared<std::promise<infra::Status>>();
    pending_write_ = promise->get_future();

    EventLoop& loop = loop_;
    std::weak_ptr<bool> alive = alive_;
    pool_->enqueue([job, promise, &loop, alive, this]() {
        try {
            promise->set_value(job());
        } catch (const std::exception& e) {
            promise->set_value(infra::Status::error(infra::ErrorCode::IO_ERROR, e.what()));
        }
        loop.post([alive, this]() {
            if (alive.lock()) {
                finish_durable_write();
            }
        });
    });
}

void AutoSave::finish_durable_write()
{
    if (!pending_write_.valid()) {
        return;
    }

    infra::Status st = pending_write_.get();
    if (st.ok()) {
        last_durable_hash_ = in_flight_hash_;
        ++durable_writes_;
        Logger::log(LogLevel::DEBUG, "AutoSave: Durable draft of " + document_id_ + " saved");
        finish_cycle(st, true);
        return;
    }

    if (st.code == infra::ErrorCode::QUOTA_EXCEEDED) {
        Logger::log(LogLevel::WARN, "AutoSave: " + document_id_ +
                                        " could not be persisted (quota exhausted); editing "
                                        "continues in memory");
    } else {
        Logger::log(LogLevel::WARN,
                    "AutoSave: Durable save of " + document_id_ + " failed: " + st.describe());
    }
    finish_cycle(st, false);
}

void AutoSave::finish_cycle(const infra::Status& result, bool wrote)
{
    if (result.ok()) {
        status_ = SaveStatus::SAVED;
        last_error_ = infra::Status::success();
        if (wrote) {
            last_saved_at_ = loop_.clock().wall_ms();
        }
        if (!closed_) {
            arm_cooldown();
        }
    } else {
        status_ = SaveStatus::ERROR;
        last_error_ = result;
    }

    if (follow_up_ && !closed_) {
        follow_up_ = false;
        status_ = SaveStatus::PENDING;
        arm_debounce();
    }
    notify();
}

void AutoSave::force_save()
{
    if (closed_) {
        return;
    }
    run_cycle(true);
    finish_durable_write();
}

void AutoSave::suspend()
{
    Logger::log(LogLevel::DEBUG, "AutoSave: Suspending " + document_id_ + ", flushing");
    force_save();
}

void AutoSave::close()
{
    if (closed_) {
        return;
    }
    cancel_timer(debounce_timer_);
    cancel_timer(throttle_timer_);

    run_cycle(true);
    finish_durable_write();
    closed_ = true;

    cancel_timer(debounce_timer_);
    cancel_timer(throttle_timer_);
    cancel_timer(cooldown_timer_);
    cancel_timer(remote_throttle_timer_);
    cancel_timer(remote_retry_timer_);
    cancel_timer(remote_timeout_timer_);

    Logger::log(LogLevel::DEBUG, "AutoSave: Closed " + document_id_ + " (" +
                                     to_string(status_) + ")");
}

infra::Status AutoSave::clear_drafts()
{
    finish_durable_write();
    cancel_timer(debounce_timer_);
    cancel_timer(throttle_timer_);
    cancel_timer(cooldown_timer_);

    infra::Status result = infra::Status::success();
    for (storage::Tier tier : {storage::Tier::VOLATILE, storage::Tier::DURABLE}) {
        infra::Status st = store_.remove_draft(tier, document_id_);
        if (!st.ok() && st.code != infra::ErrorCode::NOT_FOUND) {
            result = st;
        }
    }

    const std::string hash = infra::content_hash(content_());
    last_durable_hash_ = hash;
    last_volatile_hash_ = hash;
    follow_up_ = false;
    status_ = SaveStatus::IDLE;
    last_error_ = infra::Status::success();

    Logger::log(LogLevel::INFO, "AutoSave: Cleared drafts of " + document_id_);
    notify();
    return result;
}

SaveState AutoSave::state() const
{
    SaveState s;
    s.status = status_;
    s.last_saved_at = last_saved_at_;
    s.last_error = last_error_;
    s.is_dirty = is_dirty();
    return s;
}

bool AutoSave::is_dirty() const
{
    return infra::content_hash(content_()) != last_durable_hash_;
}

void AutoSave::notify()
{
    if (listener_) {
        listener_(state(), remote_state_);
    }
}

// ============================================================================
// Remote push path
// ============================================================================

void AutoSave::maybe_push()
{
    if (!remote_) {
        return;
    }
    if (!has_server_identity_) {
        // A document that does not exist remotely yet is never pushed.
        remote_state_.status = RemoteStatus::SKIPPED;
        return;
    }

    const std::string hash = infra::content_hash(content_());
    if (hash == last_remote_hash_) {
        return;
    }
    if (push_active_) {
        push_follow_up_ = true;
        return;
    }

    const std::int64_t now = loop_.clock().monotonic_ms();
    if (last_remote_at_ && now - *last_remote_at_ < options_.throttle_ms) {
        if (remote_throttle_timer_ == EventLoop::kNoTimer ||
            !loop_.is_scheduled(remote_throttle_timer_)) {
            remote_throttle_timer_ =
                loop_.schedule_after(*last_remote_at_ + options_.throttle_ms - now, guarded([this] {
                    remote_throttle_timer_ = EventLoop::kNoTimer;
                    maybe_push();
                }));
        }
        return;
    }

    last_remote_at_ = now;
    push_attempt_ = 0;
    start_push();
}

void AutoSave::start_push()
{
    const std::string& content = content_();
    pushing_hash_ = infra::content_hash(content);

    ++push_attempt_;
    ++push_attempts_;
    push_active_ = true;
    remote_state_.status = RemoteStatus::PENDING;
    remote_state_.attempts = push_attempt_;

    const std::uint64_t attempt_id = ++push_attempt_id_;

    remote_timeout_timer_ = loop_.schedule_after(options_.remote_timeout_ms, guarded([this,
                                                                                       attempt_id] {
        remote_timeout_timer_ = EventLoop::kNoTimer;
        if (push_active_ && attempt_id == push_attempt_id_) {
            on_push_failure(infra::Status::error(
                infra::ErrorCode::REMOTE_TIMEOUT,
                "no answer within " + std::to_string(options_.remote_timeout_ms) + "ms"));
        }
    }));

    std::string snapshot = content;

    if (!pool_) {
        loop_.post(guarded([this, attempt_id, snapshot] {
            on_push_result(attempt_id, remote_->push(document_id_, snapshot));
        }));
    } else {
        RemoteSyncClient* client = remote_;
        std::string document_id = document_id_;
        EventLoop& loop = loop_;
        std::weak_ptr<bool> alive = alive_;
        pool_->enqueue([client, document_id, snapshot, &loop, alive, attempt_id, this]() {
            PushResult result;
            try {
                result = client->push(document_id, snapshot);
            } catch (const std::exception& e) {
                result.status = infra::Status::error(infra::ErrorCode::REMOTE_SYNC_FAILED, e.what());
            }
            loop.post([alive, attempt_id, result, this]() {
                if (alive.lock()) {
                    on_push_result(attempt_id, result);
                }
            });
        });
    }

    notify();
}

void AutoSave::on_push_result(std::uint64_t attempt_id, const PushResult& result)
{
    if (!push_active_ || attempt_id != push_attempt_id_) {
        Logger::log(LogLevel::DEBUG, "Remote: Ignoring stale push result for " + document_id_);
        return;
    }

    if (!result.status.ok()) {
        on_push_failure(result.status);
        return;
    }

    cancel_timer(remote_timeout_timer_);
    push_active_ = false;
    last_remote_hash_ = pushing_hash_;

    remote_state_.status = RemoteStatus::SYNCED;
    remote_state_.last_revision = result.revision;
    remote_state_.last_error = infra::Status::success();
    remote_state_.last_synced_at = loop_.clock().wall_ms();

    Logger::log(LogLevel::DEBUG, "Remote: " + document_id_ + " synced at revision " +
                                     result.revision.id);
    notify();

    if (push_follow_up_) {
        push_follow_up_ = false;
        maybe_push();
    }
}

std::int64_t AutoSave::retry_delay(std::int64_t backoff_ms, int attempt)
{
    const std::int64_t ceiling = std::max(kMaxRetryDelayMs, backoff_ms);
    std::int64_t delay = backoff_ms;
    for (int i = 1; i < attempt && delay < ceiling; ++i) {
        delay = delay > ceiling / 2 ? ceiling : delay * 2;
    }
    return std::min(delay, ceiling);
}

void AutoSave::on_push_failure(const infra::Status& status)
{
    cancel_timer(remote_timeout_timer_);
    // Late answers of the failed attempt are ignored.
    ++push_attempt_id_;
    remote_state_.last_error = status;

    if (push_attempt_ < options_.remote_max_attempts && !closed_) {
        std::int64_t delay = retry_delay(options_.remote_backoff_ms, push_attempt_);
        Logger::log(LogLevel::WARN, "Remote: Push " + std::to_string(push_attempt_) + "/" +
                                        std::to_string(options_.remote_max_attempts) + " of " +
                                        document_id_ + " failed (" + status.describe() +
                                        "), retrying in " + std::to_string(delay) + "ms");
        remote_retry_timer_ = loop_.schedule_after(delay, guarded([this] {
            remote_retry_timer_ = EventLoop::kNoTimer;
            start_push();
        }));
        notify();
        return;
    }

    push_active_ = false;
    remote_state_.status = RemoteStatus::FAILED;
    Logger::log(LogLevel::WARN, "Remote: " + document_id_ + " not backed up remotely after " +
                                    std::to_string(push_attempt_) + " attempt(s): " +
                                    status.describe());
    notify();

    if (push_follow_up_) {
        push_follow_up_ = false;
        maybe_push();
    }
}

} // namespace lyra::session
