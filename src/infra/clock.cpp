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
 * @file clock.cpp
 * @brief Time source implementations.
 */

#include "lyra/infra/clock.hpp"

#include <chrono>

namespace lyra::infra {

std::int64_t SteadyClock::monotonic_ms() const
{
    auto now = std::chrono::steady_clock::now().time_since_epoch();
    return std::chrono::duration_cast<std::chrono::milliseconds>(now).count();
}

std::int64_t SteadyClock::wall_ms() const
{
    auto now = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration_cast<std::chrono::milliseconds>(now).count();
}

ManualClock::ManualClock(std::int64_t start_wall_ms) : wall_(start_wall_ms) {}

std::int64_t ManualClock::monotonic_ms() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return monotonic_;
}

std::int64_t ManualClock::wall_ms() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return wall_;
}

void ManualClock::advance(std::int64_t delta_ms)
{
    std::lock_guard<std::mutex> lock(mutex_);
    monotonic_ += delta_ms;
    wall_ += delta_ms;
}

void ManualClock::set_wall(std::int64_t wall_ms)
{
    std::lock_guard<std::mutex> lock(mutex_);
    wall_ = wall_ms;
}

} // namespace lyra::infra
