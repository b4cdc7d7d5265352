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
 * @file autosave_test.cpp
 * @brief Scheduling tests for the autosave pipeline and the editing session.
 *
 * @details
 * Every test drives time through `Rig::tick`, so debounce, throttle, cooldown
 * and back-off timers fire deterministically. Unless a test attaches a
 * `WorkerPool`, durable writes and pushes complete on the event loop; the
 * pool tests drain it with `wait_idle()` before reading results.
 */

#include "fixtures.hpp"
#include "framework.hpp"
#include "lyra/infra/hash.hpp"
#include "lyra/infra/worker_pool.hpp"
#include "lyra/session/autosave.hpp"
#include "lyra/session/config.hpp"
#include "lyra/session/editor_session.hpp"

#include <chrono>
#include <future>
#include <thread>

using lyra::infra::ErrorCode;
using lyra::infra::Status;
using lyra::infra::WorkerPool;
using lyra::session::AutoSave;
using lyra::session::Config;
using lyra::session::DocumentRef;
using lyra::session::EditorSession;
using lyra::session::RemoteStatus;
using lyra::session::SaveStatus;
using lyra::storage::Draft;
using lyra::storage::Tier;

namespace {

std::string stored(lyra::test::Rig& rig, Tier tier, const std::string& id)
{
    Draft draft;
    std::string content;
    Status st = rig.store->read_draft(tier, id, draft, content);
    ASSERT_TRUE(st.ok());
    return content;
}

} // namespace

/**
 * @brief Each edit restarts the debounce; one save follows the last edit.
 */
void test_debounce_resets_on_edit()
{
    lyra::test::Rig rig;
    EditorSession session(DocumentRef{"song", false}, rig.loop, *rig.store, Config{});
    session.open();

    ASSERT_TRUE(session.insert(0, "a").ok());
    ASSERT_TRUE(session.save_state().status == SaveStatus::PENDING);

    rig.tick(600);
    ASSERT_TRUE(session.insert(1, "b").ok());
    rig.tick(900);
    ASSERT_EQ(rig.volatile_tier->sets, 0);

    rig.tick(100);
    ASSERT_EQ(rig.volatile_tier->sets, 1);
    ASSERT_EQ(rig.durable_tier->sets, 1);
    ASSERT_TRUE(session.save_state().status == SaveStatus::SAVED);
    ASSERT_FALSE(session.save_state().is_dirty);
    ASSERT_EQ(stored(rig, Tier::DURABLE, "song"), std::string("ab"));

    // Cooldown returns the indicator to idle.
    rig.tick(2000);
    ASSERT_TRUE(session.save_state().status == SaveStatus::IDLE);
}

/**
 * @brief Saving unchanged content performs zero tier writes.
 */
void test_save_is_idempotent()
{
    lyra::test::Rig rig;
    EditorSession session(DocumentRef{"song", false}, rig.loop, *rig.store, Config{});
    session.open();

    ASSERT_TRUE(session.insert(0, "[D]Take me home").ok());
    session.force_save();
    ASSERT_EQ(rig.volatile_tier->sets, 1);
    ASSERT_EQ(rig.durable_tier->sets, 1);

    session.force_save();
    rig.tick(5000);
    ASSERT_EQ(rig.volatile_tier->sets, 1);
    ASSERT_EQ(rig.durable_tier->sets, 1);
}

void test_undo_to_saved_content_writes_nothing()
{
    lyra::test::Rig rig;
    EditorSession session(DocumentRef{"song", false}, rig.loop, *rig.store, Config{});
    session.open();

    ASSERT_TRUE(session.insert(0, "a").ok());
    session.force_save();
    rig.tick(1000);

    ASSERT_TRUE(session.insert(1, "b").ok());
    ASSERT_TRUE(session.undo().applied);
    ASSERT_EQ(session.content(), std::string("a"));

    rig.tick(1000);
    ASSERT_EQ(rig.volatile_tier->sets, 1);
    ASSERT_EQ(rig.durable_tier->sets, 1);
    ASSERT_FALSE(session.save_state().is_dirty);
}

/**
 * @brief Durable writes inside the throttle window wait for a trailing timer.
 */
void test_durable_throttle_trailing_write()
{
    lyra::test::Rig rig;
    EditorSession session(DocumentRef{"song", false}, rig.loop, *rig.store, Config{});
    session.open();

    ASSERT_TRUE(session.insert(0, "a").ok());
    rig.tick(1000);
    ASSERT_EQ(rig.durable_tier->sets, 1);

    ASSERT_TRUE(session.insert(1, "b").ok());
    rig.tick(1000);
    ASSERT_EQ(rig.volatile_tier->sets, 2);
    ASSERT_EQ(rig.durable_tier->sets, 1);
    ASSERT_TRUE(session.save_state().is_dirty);

    // The window opened by the first durable write closes at t=11000.
    rig.tick(8999);
    ASSERT_EQ(rig.durable_tier->sets, 1);

    rig.tick(1);
    ASSERT_EQ(rig.durable_tier->sets, 2);
    ASSERT_FALSE(session.save_state().is_dirty);
    ASSERT_EQ(stored(rig, Tier::DURABLE, "song"), std::string("ab"));
}

void test_force_save_bypasses_throttle()
{
    lyra::test::Rig rig;
    EditorSession session(DocumentRef{"song", false}, rig.loop, *rig.store, Config{});
    session.open();

    ASSERT_TRUE(session.insert(0, "a").ok());
    rig.tick(1000);
    ASSERT_TRUE(session.insert(1, "b").ok());
    session.force_save();

    ASSERT_EQ(rig.durable_tier->sets, 2);
    ASSERT_FALSE(session.save_state().is_dirty);
}

/**
 * @brief An edit while a save is in flight schedules one follow-up cycle.
 */
void test_edit_during_save_triggers_follow_up()
{
    lyra::test::Rig rig;
    std::string doc = "first";
    AutoSave autosave("song", rig.loop, *rig.store,
                      [&doc]() -> const std::string& { return doc; });
    autosave.set_baseline(lyra::infra::content_hash(""), "", "");

    bool edited = false;
    autosave.set_listener([&](const lyra::session::SaveState& state,
                              const lyra::session::RemoteState&) {
        if (state.status == SaveStatus::SAVING && !edited) {
            edited = true;
            doc += " more";
            autosave.notify_edit();
        }
    });

    autosave.notify_edit();
    rig.tick(1000);

    ASSERT_TRUE(edited);
    ASSERT_EQ(autosave.durable_writes(), static_cast<size_t>(1));
    ASSERT_TRUE(autosave.state().status == SaveStatus::PENDING);
    ASSERT_TRUE(autosave.is_dirty());
    ASSERT_EQ(stored(rig, Tier::DURABLE, "song"), std::string("first"));

    rig.tick(1000);
    ASSERT_EQ(stored(rig, Tier::VOLATILE, "song"), std::string("first more"));

    autosave.force_save();
    ASSERT_EQ(autosave.durable_writes(), static_cast<size_t>(2));
    ASSERT_EQ(stored(rig, Tier::DURABLE, "song"), std::string("first more"));
}

/**
 * @brief A full durable tier is reported, not fatal: content and editing survive.
 */
void test_quota_exhaustion_keeps_editing()
{
    lyra::test::Rig rig(1 << 20, 64);
    EditorSession session(DocumentRef{"song", false}, rig.loop, *rig.store, Config{});
    session.open();

    ASSERT_TRUE(session.insert(0, "[G]Country roads").ok());
    session.force_save();

    auto state = session.save_state();
    ASSERT_TRUE(state.status == SaveStatus::ERROR);
    ASSERT_TRUE(state.last_error.code == ErrorCode::QUOTA_EXCEEDED);
    ASSERT_TRUE(state.is_dirty);
    ASSERT_EQ(session.content(), std::string("[G]Country roads"));

    ASSERT_TRUE(session.insert(16, ", take me home").ok());
    ASSERT_TRUE(rig.store->has_draft(Tier::VOLATILE, "song"));
}

void test_remote_skipped_without_identity()
{
    lyra::test::Rig rig;
    lyra::test::FakeRemote remote;
    EditorSession session(DocumentRef{"local-only", false}, rig.loop, *rig.store, Config{},
                          &remote);
    session.open();

    ASSERT_TRUE(session.insert(0, "draft").ok());
    session.force_save();
    rig.tick(20000);

    ASSERT_EQ(remote.pushes, 0);
    ASSERT_TRUE(session.remote_state().status == RemoteStatus::SKIPPED);
}

void test_remote_push_synced_and_throttled()
{
    lyra::test::Rig rig;
    lyra::test::FakeRemote remote;
    remote.revision_time = rig.clock.wall_ms();
    EditorSession session(DocumentRef{"song", true}, rig.loop, *rig.store, Config{}, &remote);
    session.open();

    ASSERT_TRUE(session.insert(0, "v1").ok());
    session.force_save();
    rig.loop.run_until_idle();

    ASSERT_EQ(remote.pushes, 1);
    ASSERT_TRUE(session.remote_state().status == RemoteStatus::SYNCED);
    ASSERT_EQ(session.remote_state().last_revision.id, std::string("rev-1"));
    ASSERT_EQ(remote.documents["song"].content, std::string("v1"));

    // A forced save inside the window does not bypass the remote throttle.
    ASSERT_TRUE(session.insert(2, "!").ok());
    session.force_save();
    rig.loop.run_until_idle();
    ASSERT_EQ(remote.pushes, 1);

    rig.tick(10000);
    ASSERT_EQ(remote.pushes, 2);
    ASSERT_EQ(remote.documents["song"].content, std::string("v1!"));
}

/**
 * @brief Failed pushes retry with doubling back-off, then give up.
 */
void test_remote_retry_then_failed()
{
    lyra::test::Rig rig;
    lyra::test::FakeRemote remote;
    remote.failures = 5;
    EditorSession session(DocumentRef{"song", true}, rig.loop, *rig.store, Config{}, &remote);
    session.open();

    ASSERT_TRUE(session.insert(0, "x").ok());
    session.force_save();
    rig.loop.run_until_idle();
    ASSERT_EQ(remote.pushes, 1);
    ASSERT_TRUE(session.remote_state().status == RemoteStatus::PENDING);

    rig.tick(999);
    ASSERT_EQ(remote.pushes, 1);
    rig.tick(1);
    ASSERT_EQ(remote.pushes, 2);

    rig.tick(1999);
    ASSERT_EQ(remote.pushes, 2);
    rig.tick(1);
    ASSERT_EQ(remote.pushes, 3);

    ASSERT_TRUE(session.remote_state().status == RemoteStatus::FAILED);
    ASSERT_TRUE(session.remote_state().last_error.code == ErrorCode::REMOTE_SYNC_FAILED);

    rig.tick(60000);
    ASSERT_EQ(remote.pushes, 3);
    // Local persistence is unaffected by the remote outcome.
    ASSERT_FALSE(session.save_state().is_dirty);
}

void test_remote_retry_recovers()
{
    lyra::test::Rig rig;
    lyra::test::FakeRemote remote;
    remote.failures = 1;
    EditorSession session(DocumentRef{"song", true}, rig.loop, *rig.store, Config{}, &remote);
    session.open();

    ASSERT_TRUE(session.insert(0, "x").ok());
    session.force_save();
    rig.loop.run_until_idle();
    rig.tick(1000);

    ASSERT_EQ(remote.pushes, 2);
    ASSERT_TRUE(session.remote_state().status == RemoteStatus::SYNCED);
    ASSERT_EQ(session.remote_state().attempts, 2);
}

/**
 * @brief Back-off doubles per attempt and stays bounded for any attempt count.
 */
void test_remote_backoff_is_bounded()
{
    ASSERT_EQ(AutoSave::retry_delay(1000, 1), 1000);
    ASSERT_EQ(AutoSave::retry_delay(1000, 2), 2000);
    ASSERT_EQ(AutoSave::retry_delay(1000, 4), 8000);
    ASSERT_EQ(AutoSave::retry_delay(1000, 64), AutoSave::kMaxRetryDelayMs);
    ASSERT_EQ(AutoSave::retry_delay(1000, 1000), AutoSave::kMaxRetryDelayMs);

    // A base delay above the ceiling is used as is.
    const std::int64_t huge = std::int64_t{1} << 50;
    ASSERT_EQ(AutoSave::retry_delay(huge, 70), huge);

    Config config;
    ASSERT_TRUE(config.apply("remoteMaxAttempts", "70").ok());
    ASSERT_TRUE(config.validate().ok());
}

/**
 * @brief Saves and pushes run on worker threads and land back on the loop.
 */
void test_pool_save_lands_on_loop()
{
    lyra::test::Rig rig;
    lyra::test::FakeRemote remote;
    WorkerPool pool(2);
    EditorSession session(DocumentRef{"song", true}, rig.loop, *rig.store, Config{}, &remote,
                          &pool);
    session.open();

    ASSERT_TRUE(session.insert(0, "[G]verse").ok());
    rig.tick(1000);
    pool.wait_idle();
    rig.loop.run_until_idle();

    ASSERT_TRUE(session.save_state().status == SaveStatus::SAVED);
    ASSERT_FALSE(session.save_state().is_dirty);
    ASSERT_EQ(session.autosave().durable_writes(), static_cast<size_t>(1));
    ASSERT_EQ(stored(rig, Tier::DURABLE, "song"), std::string("[G]verse"));

    ASSERT_EQ(remote.pushes, 1);
    ASSERT_TRUE(session.remote_state().status == RemoteStatus::SYNCED);
    ASSERT_EQ(remote.documents["song"].content, std::string("[G]verse"));
}

/**
 * @brief A forced save waits for the queued durable write, then writes the latest content.
 */
void test_pool_force_save_during_write()
{
    lyra::test::Rig rig;
    WorkerPool pool(1);
    EditorSession session(DocumentRef{"song", false}, rig.loop, *rig.store, Config{}, nullptr,
                          &pool);
    session.open();

    // Occupy the only worker so the durable write stays queued.
    std::promise<void> gate;
    std::shared_future<void> opened = gate.get_future().share();
    pool.enqueue([opened] { opened.wait(); });

    ASSERT_TRUE(session.insert(0, "a").ok());
    rig.tick(1000);
    ASSERT_TRUE(session.save_state().status == SaveStatus::SAVING);
    ASSERT_EQ(rig.volatile_tier->sets, 1);

    ASSERT_TRUE(session.insert(1, "b").ok());
    std::thread opener([&gate] {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        gate.set_value();
    });
    session.force_save();
    opener.join();

    ASSERT_TRUE(session.save_state().status == SaveStatus::SAVED);
    ASSERT_FALSE(session.save_state().is_dirty);
    ASSERT_EQ(session.autosave().durable_writes(), static_cast<size_t>(2));
    ASSERT_EQ(stored(rig, Tier::DURABLE, "song"), std::string("ab"));

    // Completions posted by the workers find nothing left to finish.
    pool.wait_idle();
    rig.loop.run_until_idle();
    ASSERT_EQ(session.autosave().durable_writes(), static_cast<size_t>(2));
}

/**
 * @brief Suspending flushes pending edits to both tiers before returning.
 */
void test_suspend_flushes()
{
    lyra::test::Rig rig;
    WorkerPool pool(2);
    EditorSession session(DocumentRef{"song", false}, rig.loop, *rig.store, Config{}, nullptr,
                          &pool);
    session.open();

    ASSERT_TRUE(session.insert(0, "{chorus}").ok());
    session.autosave().suspend();

    ASSERT_TRUE(session.save_state().status == SaveStatus::SAVED);
    ASSERT_EQ(stored(rig, Tier::VOLATILE, "song"), std::string("{chorus}"));
    ASSERT_EQ(stored(rig, Tier::DURABLE, "song"), std::string("{chorus}"));

    pool.wait_idle();
    rig.loop.run_until_idle();
}

/**
 * @brief Closing with a push in flight leaves no timer behind.
 */
void test_close_cancels_remote_timers()
{
    lyra::test::Rig rig;
    lyra::test::FakeRemote remote;
    {
        EditorSession session(DocumentRef{"song", true}, rig.loop, *rig.store, Config{},
                              &remote);
        session.open();
        ASSERT_TRUE(session.insert(0, "x").ok());
        session.close();
        ASSERT_EQ(rig.loop.pending_timers(), static_cast<size_t>(0));
    }
    rig.loop.run_until_idle();
    ASSERT_EQ(rig.loop.pending_timers(), static_cast<size_t>(0));
}

/**
 * @brief Closing flushes pending edits to both tiers and stops editing.
 */
void test_close_flushes()
{
    lyra::test::Rig rig;
    {
        EditorSession session(DocumentRef{"song", false}, rig.loop, *rig.store, Config{});
        session.open();
        ASSERT_TRUE(session.insert(0, "[Am]last line").ok());
        rig.tick(100);
        session.close();

        ASSERT_TRUE(session.insert(0, "x").code == ErrorCode::INVALID_ARGUMENT);
        ASSERT_FALSE(session.undo().applied);
    }

    ASSERT_EQ(stored(rig, Tier::DURABLE, "song"), std::string("[Am]last line"));
    ASSERT_EQ(stored(rig, Tier::VOLATILE, "song"), std::string("[Am]last line"));
    ASSERT_TRUE(rig.store->open_documents().empty());
    ASSERT_EQ(rig.loop.pending_timers(), static_cast<size_t>(0));
}

void test_clear_drafts()
{
    lyra::test::Rig rig;
    EditorSession session(DocumentRef{"song", false}, rig.loop, *rig.store, Config{});
    session.open();
    ASSERT_TRUE(session.insert(0, "abc").ok());
    session.force_save();

    ASSERT_TRUE(session.clear_drafts().ok());
    ASSERT_FALSE(rig.store->has_draft(Tier::VOLATILE, "song"));
    ASSERT_FALSE(rig.store->has_draft(Tier::DURABLE, "song"));
    ASSERT_TRUE(session.save_state().status == SaveStatus::IDLE);
    ASSERT_FALSE(session.save_state().is_dirty);
    ASSERT_EQ(session.content(), std::string("abc"));
}

void test_session_rejects_bad_offsets()
{
    lyra::test::Rig rig;
    EditorSession session(DocumentRef{"song", false}, rig.loop, *rig.store, Config{});

    ASSERT_TRUE(session.insert(0, "x").code == ErrorCode::INVALID_ARGUMENT);
    session.open();
    ASSERT_TRUE(session.insert(1, "x").code == ErrorCode::INVALID_ARGUMENT);
    ASSERT_TRUE(session.insert(0, "chord").ok());
    ASSERT_TRUE(session.erase(3, 5).code == ErrorCode::INVALID_ARGUMENT);
    ASSERT_TRUE(session.replace(0, 5, "verse").ok());
    ASSERT_EQ(session.content(), std::string("verse"));

    ASSERT_TRUE(session.undo().applied);
    ASSERT_EQ(session.content(), std::string("chord"));
}

/**
 * @brief Options parse from JSON; unknown keys are ignored, bad values rejected.
 */
void test_config_from_json()
{
    Status st;
    Config cfg = Config::from_json(
        R"({"debounceMs": 250, "evictionPolicy": "proactive", "compressionEnabled": false,
            "futureOption": 1})",
        st);
    ASSERT_TRUE(st.ok());
    ASSERT_EQ(cfg.debounce_ms, static_cast<std::int64_t>(250));
    ASSERT_TRUE(cfg.eviction_policy == lyra::storage::EvictionPolicy::PROACTIVE);
    ASSERT_FALSE(cfg.compression_enabled);
    ASSERT_EQ(cfg.throttle_ms, static_cast<std::int64_t>(10000));

    Config::from_json(R"({"throttleMs": "soon"})", st);
    ASSERT_TRUE(st.code == ErrorCode::INVALID_ARGUMENT);
    Config::from_json(R"({"debounceMs": 1.5})", st);
    ASSERT_TRUE(st.code == ErrorCode::INVALID_ARGUMENT);
    Config::from_json("[1, 2]", st);
    ASSERT_TRUE(st.code == ErrorCode::INVALID_ARGUMENT);
}

void test_config_assignments_and_validation()
{
    Config cfg;
    ASSERT_TRUE(cfg.validate().ok());
    ASSERT_TRUE(cfg.apply_assignment("maxHistorySize=20").ok());
    ASSERT_EQ(cfg.history_options().max_history_size, static_cast<size_t>(20));

    ASSERT_TRUE(cfg.apply_assignment("debounceMs").code == ErrorCode::INVALID_ARGUMENT);
    ASSERT_TRUE(cfg.apply_assignment("noSuchKey=1").code == ErrorCode::INVALID_ARGUMENT);

    ASSERT_TRUE(cfg.apply_assignment("throttleMs=0").ok());
    ASSERT_TRUE(cfg.validate().code == ErrorCode::INVALID_ARGUMENT);

    Config round;
    round.cooldown_ms = 777;
    Status st;
    Config parsed = Config::from_json(round.to_json(), st);
    ASSERT_TRUE(st.ok());
    ASSERT_EQ(parsed.cooldown_ms, static_cast<std::int64_t>(777));
}
