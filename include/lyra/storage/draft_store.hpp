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
 * @file draft_store.hpp
 * @brief Thread-safe orchestration of Codec, TieredStore and QuotaManager.
 *
 * @details
 * `DraftStore` is the single entry point through which editing sessions persist
 * and read drafts. It is explicitly constructed and owned by the application
 * and passed by reference to every session; there is no process-wide instance.
 *
 * **Concurrency Control:** a `std::shared_mutex` guards the tiers and the quota
 * index. Durable writes may arrive from worker threads while the event loop
 * reads stats or writes the volatile tier.
 *
 * **Write path:**
 * 1. Reject content larger than `max_draft_size` (DRAFT_TOO_LARGE).
 * 2. Encode through the Codec (raw fallback on compression failure).
 * 3. Under the `PROACTIVE` policy, ensure capacity before durable writes.
 * 4. Write; on QUOTA_EXCEEDED evict least-recently-used drafts and retry once.
 * 5. Index the new record for future eviction decisions.
 */

#pragma once

#include "lyra/codec/codec.hpp"
#include "lyra/infra/clock.hpp"
#include "lyra/infra/status.hpp"
#include "lyra/storage/draft.hpp"
#include "lyra/storage/quota_manager.hpp"
#include "lyra/storage/tiered_store.hpp"

#include <cstdint>
#include <map>
#include <set>
#include <shared_mutex>
#include <string>
#include <vector>

namespace lyra::storage {

/**
 * @enum EvictionPolicy
 * @brief When the quota manager is consulted.
 */
enum class EvictionPolicy {
    LAZY,     ///< Evict only after a write failed with QUOTA_EXCEEDED, then retry once.
    PROACTIVE ///< Ensure capacity before every durable write.
};

const char* to_string(EvictionPolicy policy);
bool parse_eviction_policy(const std::string& name, EvictionPolicy& out);

/**
 * @struct DraftStoreOptions
 * @brief Construction parameters of a `DraftStore`.
 */
struct DraftStoreOptions {
    size_t max_draft_size = 5 * 1024 * 1024;
    bool compression_enabled = true;
    int compression_level = 3;
    EvictionPolicy eviction_policy = EvictionPolicy::LAZY;
};

/**
 * @struct DraftSummary
 * @brief Header-level description of a stored draft (no payload).
 */
struct DraftSummary {
    std::string document_id;
    Tier tier = Tier::VOLATILE;
    size_t size_bytes = 0;
    std::int64_t last_accessed = 0;
    std::int64_t saved_at = 0;
};

/**
 * @struct TierStats
 * @brief Usage of one tier as reported by the diagnostics surface.
 */
struct TierStats {
    size_t used = 0;
    size_t capacity = 0;
    size_t drafts = 0;
};

/**
 * @struct StorageStats
 * @brief `{tier: {used, capacity}}` for both tiers.
 */
struct StorageStats {
    TierStats volatile_tier;
    TierStats durable_tier;
};

/**
 * @class DraftStore
 * @brief Persistence controller for drafts of every document.
 */
class DraftStore {
  public:
    /**
     * @brief Builds the store and rebuilds the quota index from existing record headers.
     *
     * Unreadable records are indexed with `last_accessed = 0` so they are the first
     * eviction candidates.
     *
     * @param store Tier backends. Must outlive the `DraftStore`.
     * @param clock Source of `savedAt` and LRU access times.
     */
    DraftStore(TieredStore& store, const infra::Clock& clock,
               DraftStoreOptions options = DraftStoreOptions{});

    /**
     * @brief Encodes and persists `content` as the draft of `document_id` in `tier`.
     *
     * @param written Receives the stored draft on success, when non-null.
     * @return DRAFT_TOO_LARGE, QUOTA_EXCEEDED (after one evict-and-retry) or IO_ERROR.
     */
    infra::Status write_draft(Tier tier, const std::string& document_id,
                              const std::string& content, Draft* written = nullptr);

    /**
     * @brief Reads, decodes and decompresses a draft; refreshes its LRU access time.
     *
     * The content hash is not verified here; see `RecoveryResolver`.
     *
     * @return NOT_FOUND or CORRUPTED_DRAFT.
     */
    infra::Status read_draft(Tier tier, const std::string& document_id, Draft& draft,
                             std::string& content);

    infra::Status remove_draft(Tier tier, const std::string& document_id);

    bool has_draft(Tier tier, const std::string& document_id) const;

    /// @brief Indexed drafts of one tier, least recently used first.
    std::vector<DraftSummary> list_drafts(Tier tier) const;

    /**
     * @brief Deletes drafts saved more than `max_age_ms` ago from both tiers.
     *
     * Drafts of open documents are kept.
     *
     * @return size_t The number of deleted drafts.
     */
    size_t purge_expired(std::int64_t max_age_ms);

    StorageStats storage_stats() const;

    /// @brief Deletes every draft in both tiers, including those of open documents.
    infra::Status clear_all();

    /// @brief Protects a document's drafts from eviction and purging.
    void open_document(const std::string& document_id);
    void close_document(const std::string& document_id);
    std::set<std::string> open_documents() const;

    const codec::Codec& codec() const { return codec_; }
    const DraftStoreOptions& options() const { return options_; }

  private:
    void rebuild_index(Tier tier);
    infra::Status put_locked(Tier tier, const std::string& document_id,
                             const std::string& record, size_t required);

    TieredStore& store_;
    const infra::Clock& clock_;
    DraftStoreOptions options_;
    codec::Codec codec_;
    QuotaManager quota_;

    /// @brief Open documents are reference counted; two sessions may share one.
    std::map<std::string, int> open_docs_;

    mutable std::shared_mutex rw_lock_;
};

} // namespace lyra::storage
