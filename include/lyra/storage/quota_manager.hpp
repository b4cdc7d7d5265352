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
 * @file quota_manager.hpp
 * @brief Per-tier usage index and least-recently-used eviction.
 *
 * @details
 * Storage is a shared, installation-wide resource, so eviction is global
 * across every document that shares a tier. Documents with an open editing
 * session are protected and never evicted.
 */

#pragma once

#include "lyra/infra/status.hpp"
#include "lyra/storage/tiered_store.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace lyra::storage {

/**
 * @struct QuotaEntry
 * @brief Index record of one stored draft.
 */
struct QuotaEntry {
    /// @brief Bytes the record occupies in its tier.
    size_t size_bytes = 0;
    /// @brief Wall milliseconds of the last read or write.
    std::int64_t last_accessed = 0;
    /// @brief Wall milliseconds of the last write.
    std::int64_t saved_at = 0;
};

/**
 * @class QuotaManager
 * @brief Tracks `documentId -> (sizeBytes, lastAccessed)` per tier and evicts LRU drafts.
 *
 * Not synchronized; owned and locked by the `DraftStore`.
 */
class QuotaManager {
  public:
    explicit QuotaManager(TieredStore& store);

    /// @brief Inserts or replaces the index entry of a draft.
    void record(Tier tier, const std::string& document_id, const QuotaEntry& entry);

    /// @brief Refreshes `last_accessed` of an indexed draft.
    void touch(Tier tier, const std::string& document_id, std::int64_t now);

    void forget(Tier tier, const std::string& document_id);

    void clear(Tier tier);

    std::optional<QuotaEntry> entry(Tier tier, const std::string& document_id) const;

    const std::map<std::string, QuotaEntry>& index(Tier tier) const;

    /**
     * @brief Candidates in eviction order: ascending `last_accessed`, ties by document id.
     */
    std::vector<std::pair<std::string, QuotaEntry>> eviction_order(Tier tier) const;

    /**
     * @brief Frees space until `required_bytes` more fit in `tier`.
     *
     * Computes `used + required - capacity`; while positive, removes the least
     * recently used draft that is not in `protected_docs`.
     *
     * @param evicted Receives the ids of evicted documents, when non-null.
     * @return QUOTA_EXCEEDED if the evictable drafts do not free enough space.
     * Drafts evicted before the failure stay evicted.
     */
    infra::Status ensure_capacity(Tier tier, size_t required_bytes,
                                  const std::set<std::string>& protected_docs,
                                  std::vector<std::string>* evicted = nullptr);

  private:
    std::map<std::string, QuotaEntry>& slot(Tier tier);

    TieredStore& store_;
    std::map<std::string, QuotaEntry> volatile_index_;
    std::map<std::string, QuotaEntry> durable_index_;
};

} // namespace lyra::storage
