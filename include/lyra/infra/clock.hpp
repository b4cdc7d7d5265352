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
 * @file clock.hpp
 * @brief Injectable time sources.
 *
 * @details
 * Two readings are exposed:
 * - **Monotonic** milliseconds drive command timestamps, merge windows, debounce,
 *   throttle and back-off timers.
 * - **Wall** milliseconds since the Unix epoch stamp drafts (`savedAt`) and LRU
 *   access times, because those must stay comparable across process restarts.
 */

#pragma once

#include <cstdint>
#include <mutex>

namespace lyra::infra {

/**
 * @class Clock
 * @brief Abstract time source.
 */
class Clock {
  public:
    virtual ~Clock() = default;

    virtual std::int64_t monotonic_ms() const = 0;

    virtual std::int64_t wall_ms() const = 0;
};

/**
 * @class SteadyClock
 * @brief Production clock backed by `std::chrono::steady_clock` and `system_clock`.
 */
class SteadyClock : public Clock {
  public:
    std::int64_t monotonic_ms() const override;
    std::int64_t wall_ms() const override;
};

/**
 * @class ManualClock
 * @brief Test clock advanced explicitly. Thread-safe.
 */
class ManualClock : public Clock {
  public:
    explicit ManualClock(std::int64_t start_wall_ms = 1'700'000'000'000);

    std::int64_t monotonic_ms() const override;
    std::int64_t wall_ms() const override;

    /// @brief Moves both readings forward by `delta_ms`.
    void advance(std::int64_t delta_ms);

    /// @brief Pins the wall reading without touching the monotonic one.
    void set_wall(std::int64_t wall_ms);

  private:
    mutable std::mutex mutex_;
    std::int64_t monotonic_ = 0;
    std::int64_t wall_;
};

} // namespace lyra::infra
