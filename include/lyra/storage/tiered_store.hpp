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
 * @file tiered_store.hpp
 * @brief Routes the uniform key/value contract to the volatile and durable tiers.
 *
 * @details
 * Keys are namespaced per document: `draft:{documentId}`. There are no
 * cross-document keys, so one document owns at most one record per tier.
 */

#pragma once

#include "lyra/storage/tier.hpp"

#include <memory>

namespace lyra::storage {

/**
 * @class TieredStore
 * @brief Owner of both tier backends.
 */
class TieredStore {
  public:
    TieredStore(std::unique_ptr<TierStore> volatile_tier, std::unique_ptr<TierStore> durable_tier);

    std::optional<std::string> get(Tier tier, const std::string& key);

    /// @brief Fails with QUOTA_EXCEEDED when the tier is full; eviction is the caller's job.
    infra::Status set(Tier tier, const std::string& key, const std::string& bytes);

    infra::Status remove(Tier tier, const std::string& key);

    std::vector<std::string> keys(Tier tier);

    /// @brief `(used, capacity)` of a tier.
    TierUsage estimate_usage(Tier tier);

    TierStore& backend(Tier tier);

    /// @brief `draft:{documentId}`.
    static std::string draft_key(const std::string& document_id);

    /**
     * @brief Extracts the document id from a draft key.
     *
     * @return false If `key` is not in the draft namespace.
     */
    static bool parse_draft_key(const std::string& key, std::string& document_id);

  private:
    std::unique_ptr<TierStore> volatile_;
    std::unique_ptr<TierStore> durable_;
};

} // namespace lyra::storage
