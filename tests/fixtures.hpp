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
 * @file fixtures.hpp
 * @brief Shared collaborators for engine tests.
 *
 * @details
 * - `ScratchDir`: RAII clean-room directory, purged before and after use.
 * - `CountingTier`: in-memory tier that counts writes (idempotence checks).
 * - `FakeRemote`: scripted remote store.
 * - `Rig`: a manual clock, an event loop and a draft store over two
 *   in-memory tiers.
 * - `frame_declaring()`: a zstd frame whose header lies about its size.
 */

#pragma once

#include "lyra/infra/clock.hpp"
#include "lyra/infra/event_loop.hpp"
#include "lyra/session/remote_sync.hpp"
#include "lyra/storage/draft_store.hpp"
#include "lyra/storage/memory_tier.hpp"
#include "lyra/storage/tiered_store.hpp"

#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <string>

namespace lyra::test {

/**
 * @class ScratchDir
 * @brief RAII infrastructure for isolated filesystem tests.
 */
class ScratchDir {
  public:
    explicit ScratchDir(std::string path) : path_(std::move(path)) { purge(); }

    ~ScratchDir() { purge(); }

    const std::string& path() const { return path_; }

    void purge()
    {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

  private:
    std::string path_;
};

/**
 * @class CountingTier
 * @brief `MemoryTier` that records how many writes reached it.
 */
class CountingTier : public storage::MemoryTier {
  public:
    explicit CountingTier(size_t capacity) : storage::MemoryTier(capacity) {}

    infra::Status set(const std::string& key, const std::string& bytes) override
    {
        ++sets;
        return storage::MemoryTier::set(key, bytes);
    }

    int sets = 0;
};

/**
 * @class FakeRemote
 * @brief Remote store double; pushes fail while `failures` is positive.
 */
class FakeRemote : public session::RemoteSyncClient {
  public:
    session::PushResult push(const std::string& document_id, const std::string& content) override
    {
        ++pushes;
        if (failures > 0) {
            --failures;
            return session::PushResult{
                infra::Status::error(infra::ErrorCode::REMOTE_SYNC_FAILED, "503 unavailable"),
                session::Revision{}};
        }
        session::Revision rev{"rev-" + std::to_string(pushes), revision_time};
        documents[document_id] = session::RemoteSnapshot{content, rev};
        return session::PushResult{infra::Status::success(), rev};
    }

    std::optional<session::RemoteSnapshot> fetch(const std::string& document_id) override
    {
        auto it = documents.find(document_id);
        if (it == documents.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    int pushes = 0;
    int failures = 0;
    std::int64_t revision_time = 0;
    std::map<std::string, session::RemoteSnapshot> documents;
};

/**
 * @brief Builds a zstd frame header announcing `declared` content bytes,
 * followed by a one-byte raw block.
 *
 * Layout: magic, descriptor (8-byte content size, no checksum, no dictionary),
 * window descriptor, little-endian content size, last raw block of "a".
 */
inline std::string frame_declaring(std::uint64_t declared)
{
    std::string frame("\x28\xB5\x2F\xFD", 4);
    frame.push_back(static_cast<char>(0xC0));
    frame.push_back(static_cast<char>(0x00));
    for (int i = 0; i < 8; ++i) {
        frame.push_back(static_cast<char>((declared >> (8 * i)) & 0xFF));
    }
    frame.append("\x09\x00\x00", 3);
    frame.push_back('a');
    return frame;
}

/**
 * @struct Rig
 * @brief Deterministic engine environment built on `ManualClock`.
 */
struct Rig {
    explicit Rig(size_t volatile_capacity = 1 << 20, size_t durable_capacity = 1 << 20,
                 storage::DraftStoreOptions options = storage::DraftStoreOptions{})
        : loop(clock)
    {
        auto vol = std::make_unique<CountingTier>(volatile_capacity);
        auto dur = std::make_unique<CountingTier>(durable_capacity);
        volatile_tier = vol.get();
        durable_tier = dur.get();
        tiers = std::make_unique<storage::TieredStore>(std::move(vol), std::move(dur));
        store = std::make_unique<storage::DraftStore>(*tiers, clock, options);
    }

    /// @brief Advances time by `ms` and runs everything that became due.
    void tick(std::int64_t ms)
    {
        clock.advance(ms);
        loop.run_until_idle();
    }

    infra::ManualClock clock;
    infra::EventLoop loop;
    CountingTier* volatile_tier = nullptr;
    CountingTier* durable_tier = nullptr;
    std::unique_ptr<storage::TieredStore> tiers;
    std::unique_ptr<storage::DraftStore> store;
};

} // namespace lyra::test
