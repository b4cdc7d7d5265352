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
 * @file event_loop.cpp
 * @brief Implementation of the cooperative event loop.
 */

#include "lyra/infra/event_loop.hpp"

#include <chrono>

namespace lyra::infra {

EventLoop::EventLoop(const Clock& clock) : clock_(clock) {}

void EventLoop::post(Task task)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        posted_.push_back(std::move(task));
    }
    wakeup_.notify_one();
}

EventLoop::TimerId EventLoop::schedule_after(std::int64_t delay_ms, Task task)
{
    if (delay_ms < 0) {
        delay_ms = 0;
    }
    TimerId id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        id = next_id_++;
        timers_.emplace(id, Timer{clock_.monotonic_ms() + delay_ms, std::move(task)});
    }
    wakeup_.notify_one();
    return id;
}

bool EventLoop::cancel(TimerId id)
{
    if (id == kNoTimer) {
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    return timers_.erase(id) > 0;
}

bool EventLoop::is_scheduled(TimerId id) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return timers_.count(id) > 0;
}

std::size_t EventLoop::pending_timers() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return timers_.size();
}

bool EventLoop::pop_posted(Task& out)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (posted_.empty()) {
        return false;
    }
    out = std::move(posted_.front());
    posted_.pop_front();
    return true;
}

/**
 * @brief Detaches the earliest due timer, if any.
 *
 * The timer is removed before it runs so that a task re-arming its own
 * timer (debounce reset) never observes a stale entry.
 */
bool EventLoop::pop_due_timer(Task& out)
{
    std::lock_guard<std::mutex> lock(mutex_);
    const std::int64_t now = clock_.monotonic_ms();

    auto best = timers_.end();
    for (auto it = timers_.begin(); it != timers_.end(); ++it) {
        if (it->second.deadline > now) {
            continue;
        }
        if (best == timers_.end() || it->second.deadline < best->second.deadline) {
            best = it;
        }
    }
    if (best == timers_.end()) {
        return false;
    }
    out = std::move(best->second.task);
    timers_.erase(best);
    return true;
}

std::size_t EventLoop::run_until_idle()
{
    std::size_t executed = 0;
    while (true) {
        Task task;
        if (pop_posted(task) || pop_due_timer(task)) {
            if (task) {
                task();
            }
            ++executed;
            continue;
        }
        return executed;
    }
}

void EventLoop::run()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_ = false;
    }

    while (true) {
        run_until_idle();

        std::unique_lock<std::mutex> lock(mutex_);
        if (stop_) {
            return;
        }
        if (!posted_.empty()) {
            continue;
        }

        if (timers_.empty()) {
            wakeup_.wait(lock, [this] { return stop_ || !posted_.empty() || !timers_.empty(); });
            continue;
        }

        std::int64_t next = timers_.begin()->second.deadline;
        for (const auto& [id, timer] : timers_) {
            if (timer.deadline < next) {
                next = timer.deadline;
            }
        }
        std::int64_t wait_ms = next - clock_.monotonic_ms();
        if (wait_ms > 0) {
            wakeup_.wait_for(lock, std::chrono::milliseconds(wait_ms),
                             [this] { return stop_ || !posted_.empty(); });
        }
    }
}

void EventLoop::stop()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_ = true;
    }
    wakeup_.notify_all();
}

} // namespace lyra::infra
