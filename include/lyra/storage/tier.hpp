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
 * @file tier.hpp
 * @brief Uniform key/value contract shared by both storage tiers.
 *
 * @details
 * Two ownership scopes exist:
 * - **VOLATILE:** scoped to the current process; fast, small quota, lost on exit.
 * - **DURABLE:** scoped to the installation; larger quota, survives restarts.
 *
 * Implementations are not internally synchronized. The `DraftStore` serializes
 * every access behind its reader-writer lock.
 */

#pragma once

#include "lyra/infra/status.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace lyra::storage {

/**
 * @enum Tier
 * @brief Storage scope of a draft.
 */
enum class Tier {
    VOLATILE, ///< Process-local (in-memory map).
    DURABLE   ///< Installation-wide (data directory).
};

/// @brief "volatile" or "durable".
const char* to_string(Tier tier);

/**
 * @brief Parses "volatile" / "durable" (case-insensitive).
 */
bool parse_tier(const std::string& name, Tier& out);

/**
 * @struct TierUsage
 * @brief Byte accounting of one tier.
 */
struct TierUsage {
    size_t used = 0;
    size_t capacity = 0;
};

/**
 * @class TierStore
 * @brief Abstract byte-oriented key/value store with a capacity ceiling.
 */
class TierStore {
  public:
    virtual ~TierStore() = default;

    /// @brief Returns the stored bytes, or `std::nullopt` when the key is absent.
    virtual std::optional<std::string> get(const std::string& key) = 0;

    /**
     * @brief Stores `bytes` under `key`, replacing any previous value.
     *
     * The previous value of the same key does not count against capacity.
     *
     * @return QUOTA_EXCEEDED if the write would exceed capacity (nothing is
     * written), IO_ERROR on backend failure.
     */
    virtual infra::Status set(const std::string& key, const std::string& bytes) = 0;

    /// @brief Deletes `key`; NOT_FOUND when absent.
    virtual infra::Status remove(const std::string& key) = 0;

    virtual std::vector<std::string> keys() = 0;

    virtual TierUsage usage() = 0;
};

} // namespace lyra::storage
