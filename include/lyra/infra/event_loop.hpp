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
 * @file event_loop.hpp
 * @brief Single-threaded cooperative event loop with millisecond timers.
 *
 * @details
 * Every piece of session state (CommandLog, AutoSave state machine, save status)
 * is mutated only from tasks executed by this loop. Work that may block (durable
 * tier writes, remote pushes) runs elsewhere and re-enters the loop through
 * `post()`, which is the only thread-safe entry point.
 *
 * Timers are expressed against the injected `Clock`, so the same debounce and
 * throttle logic runs unchanged against `SteadyClock` in production and against
 * `ManualClock` in tests.
 */

#pragma once

#include "lyra/infra/clock.hpp"

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>

namespace lyra::infra {

/**
 * @class EventLoop
 * @brief FIFO task queue plus a deadline-ordered timer set.
 *
 * **Ordering:**
 * - Posted tasks run in submission order.
 * - Due timers run in deadline order; equal deadlines run in scheduling order.
 * - Posted tasks are drained before due timers on each iteration.
 */
class EventLoop {
  public:
    using Task = std::function<void()>;
    using TimerId = std::uint64_t;

    /// @brief Value never returned by `schedule_after`; usable as an "unarmed" marker.
    static constexpr TimerId kNoTimer = 0;

    /**
     * @param clock Time source for timer deadlines. Must outlive the loop.
     */
    explicit EventLoop(const Clock& clock);

    EventLoop(const EventLoop&) = delete;
    EventLoop& operator=(const EventLoop&) = delete;

    const Clock& clock() const { return clock_; }

    /**
     * @brief Enqueues a task for the next loop iteration. Thread-safe.
     */
    void post(Task task);

    /**
     * @brief Schedules `task` to run once `delay_ms` have elapsed on the monotonic clock.
     *
     * @return TimerId Handle accepted by `cancel()`.
     */
    TimerId schedule_after(std::int64_t delay_ms, Task task);

    /**
     * @brief Cancels a pending timer.
     *
     * @return true If the timer was still pending.
     */
    bool cancel(TimerId id);

    /// @brief True while the timer has neither fired nor been cancelled.
    bool is_scheduled(TimerId id) const;

    /**
     * @brief Runs posted tasks and due timers until neither remains.
     *
     * Timers whose deadline lies in the future are left untouched; this call
     * never sleeps.
     *
     * @return std::size_t The number of tasks executed.
     */
    std::size_t run_until_idle();

    /**
     * @brief Blocking loop for production use; returns after `stop()`.
     *
     * Sleeps on a condition variable until the next timer deadline or the next
     * `post()`.
     */
    void run();

    /// @brief Requests `run()` to return. Thread-safe.
    void stop();

    /// @brief Number of armed timers.
    std::size_t pending_timers() const;

  private:
    struct Timer {
        std::int64_t deadline;
        Task task;
    };

    bool pop_posted(Task& out);
    bool pop_due_timer(Task& out);

    const Clock& clock_;

    mutable std::mutex mutex_;
    std::condition_variable wakeup_;

    std::deque<Task> posted_;

    /// @brief Armed timers keyed by id; ids grow monotonically so map order breaks deadline ties.
    std::map<TimerId, Timer> timers_;

    TimerId next_id_ = 1;
    bool stop_ = false;
};

} // namespace lyra::infra
