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
 * @file worker_pool.hpp
 * @brief Thread pool that keeps blocking draft I/O off the editing loop.
 *
 * @details
 * This header defines the `WorkerPool` class, a Producer-Consumer pool used by
 * the autosave scheduler for the two operations allowed to suspend a save:
 * the durable-tier write and the remote push. Jobs never touch session state
 * directly; they hand their result back to the `EventLoop` with `post()`.
 */

#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace lyra::infra {

/**
 * @class WorkerPool
 * @brief A thread-safe worker pool for executing jobs asynchronously.
 *
 * **Concurrency Model:**
 * - **Producers:** The event loop thread `enqueue()`s jobs.
 * - **Consumers:** Worker threads sleep on a condition variable until work is available.
 * - **Shutdown:** The destructor drains the queue before joining, so an accepted
 *   durable write is never silently dropped.
 */
class WorkerPool {
  public:
    /**
     * @brief Spawns `threads` workers (at least one).
     *
     * Draft writes for a single document are already serialized by the autosave
     * state machine, so two workers are enough for most editors.
     */
    explicit WorkerPool(size_t threads = 2);

    /**
     * @brief Stops accepting work, runs what is queued and joins every worker.
     */
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /**
     * @brief Submits a job for asynchronous execution.
     *
     * @code
     * pool.enqueue([&store, draft, &loop] {
     *     auto status = store.write(draft);
     *     loop.post([status] { ... });
     * });
     * @endcode
     */
    void enqueue(std::function<void()> job);

    /// @brief Blocks until the queue is empty and no job is running.
    void wait_idle();

    size_t size() const { return workers_.size(); }

  private:
    void worker_loop();

    std::vector<std::thread> workers_;

    std::queue<std::function<void()>> jobs_;

    std::mutex queue_mutex_;

    /// @brief Wakes workers on new jobs or shutdown.
    std::condition_variable condition_;

    /// @brief Wakes `wait_idle()` callers when the pool drains.
    std::condition_variable idle_;

    size_t active_ = 0;

    std::atomic<bool> stop_;
};

} // namespace lyra::infra
