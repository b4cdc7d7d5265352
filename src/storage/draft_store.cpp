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
 * @file draft_store.cpp
 * @brief Implementation of the draft persistence controller.
 */

#include "lyra/storage/draft_store.hpp"

#include "lyra/infra/hash.hpp"
#include "lyra/infra/logger.hpp"
#include "lyra/infra/string.hpp"

#include <algorithm>
#include <mutex>
#include <stdexcept>

namespace lyra::storage {

const char* to_string(EvictionPolicy policy)
{
    return policy == EvictionPolicy::LAZY ? "lazy" : "proactive";
}

bool parse_eviction_policy(const std::string& name, EvictionPolicy& out)
{
    std::string n = infra::String::to_lower(infra::String::trim(name));
    if (n == "lazy") {
        out = EvictionPolicy::LAZY;
        return true;
    }
    if (n == "proactive") {
        out = EvictionPolicy::PROACTIVE;
        return true;
    }
    return false;
}

DraftStore::DraftStore(TieredStore& store, const infra::Clock& clock, DraftStoreOptions options)
    : store_(store), clock_(clock), options_(options),
      codec_(options.compression_enabled, options.compression_level), quota_(store)
{
    rebuild_index(Tier::VOLATILE);
    rebuild_index(Tier::DURABLE);

    infra::Logger::log(infra::LogLevel::DEBUG,
                       "Storage: Indexed " +
                           std::to_string(quota_.index(Tier::VOLATILE).size()) +
                           " volatile and " + std::to_string(quota_.index(Tier::DURABLE).size()) +
                           " durable draft(s)");
}

void DraftStore::rebuild_index(Tier tier)
{
    for (const auto& key : store_.keys(tier)) {
        std::string document_id;
        if (!TieredStore::parse_draft_key(key, document_id)) {
            continue;
        }

        auto bytes = store_.get(tier, key);
        if (!bytes) {
            continue;
        }

        QuotaEntry entry;
        entry.size_bytes = bytes->size();

        Draft draft;
        infra::Status st = decode_record(*bytes, draft);
        if (st.ok()) {
            entry.last_accessed = draft.saved_at;
            entry.saved_at = draft.saved_at;
        } else {
            infra::Logger::log(infra::LogLevel::WARN, "Storage: Unreadable " +
                                                          std::string(to_string(tier)) +
                                                          " draft " + document_id + ": " +
                                                          st.message);
        }
        quota_.record(tier, document_id, entry);
    }
}

/**
 * @brief Writes a record, evicting and retrying once on QUOTA_EXCEEDED.
 *
 * Caller holds the unique lock.
 */
infra::Status DraftStore::put_locked(Tier tier, const std::string& document_id,
                                     const std::string& record, size_t required)
{
    std::set<std::string> protected_docs;
    for (const auto& [id, count] : open_docs_) {
        protected_docs.insert(id);
    }
    // The document being written replaces its own record.
    protected_docs.insert(document_id);

    if (tier == Tier::DURABLE && options_.eviction_policy == EvictionPolicy::PROACTIVE) {
        infra::Status st = quota_.ensure_capacity(tier, required, protected_docs);
        if (!st.ok()) {
            return st;
        }
    }

    const std::string key = TieredStore::draft_key(document_id);
    infra::Status st = store_.set(tier, key, record);
    if (st.code != infra::ErrorCode::QUOTA_EXCEEDED) {
        return st;
    }

    infra::Logger::log(infra::LogLevel::WARN, "Quota: " + std::string(to_string(tier)) +
                                                  " write for " + document_id +
                                                  " rejected, evicting");

    infra::Status evicted = quota_.ensure_capacity(tier, required, protected_docs);
    if (!evicted.ok()) {
        return evicted;
    }
    return store_.set(tier, key, record);
}

infra::Status DraftStore::write_draft(Tier tier, const std::string& document_id,
                                      const std::string& content, Draft* written)
{
    if (content.size() > options_.max_draft_size) {
        infra::Logger::log(infra::LogLevel::WARN,
                           "Storage: Draft for " + document_id + " rejected (" +
                               std::to_string(content.size()) + " > " +
                               std::to_string(options_.max_draft_size) + " bytes)");
        return infra::Status::error(infra::ErrorCode::DRAFT_TOO_LARGE,
                                    "content is " + std::to_string(content.size()) +
                                        " bytes, limit is " +
                                        std::to_string(options_.max_draft_size));
    }

    codec::EncodedContent encoded = codec_.encode(content);

    Draft draft;
    draft.document_id = document_id;
    draft.compressed_content = std::move(encoded.bytes);
    draft.compressed = encoded.compressed;
    draft.content_hash = infra::content_hash(content);
    draft.content_length = content.size();
    draft.size_bytes = draft.compressed_content.size();
    draft.saved_at = clock_.wall_ms();
    draft.tier = tier;

    std::string record = encode_record(draft);

    std::unique_lock lock(rw_lock_);

    size_t previous = 0;
    if (auto existing = quota_.entry(tier, document_id)) {
        previous = existing->size_bytes;
    }
    size_t required = record.size() > previous ? record.size() - previous : 0;

    infra::Status st = put_locked(tier, document_id, record, required);
    if (!st.ok()) {
        infra::Logger::log(infra::LogLevel::WARN, "Storage: " + std::string(to_string(tier)) +
                                                      " save of " + document_id +
                                                      " failed: " + st.describe());
        return st;
    }

    quota_.record(tier, document_id, QuotaEntry{record.size(), draft.saved_at, draft.saved_at});

    infra::Logger::log(infra::LogLevel::TRACE,
                       "Storage: Saved " + std::string(to_string(tier)) + " draft " +
                           document_id + " (" + std::to_string(record.size()) + " bytes)");

    if (written) {
        *written = std::move(draft);
    }
    return infra::Status::success();
}

infra::Status DraftStore::read_draft(Tier tier, const std::string& document_id, Draft& draft,
                                     std::string& content)
{
    std::unique_lock lock(rw_lock_);

    auto bytes = store_.get(tier, TieredStore::draft_key(document_id));
    if (!bytes) {
        return infra::Status::error(infra::ErrorCode::NOT_FOUND,
                                    "no " + std::string(to_string(tier)) + " draft for " +
                                        document_id);
    }

    infra::Status st = decode_record(*bytes, draft);
    if (!st.ok()) {
        return st;
    }

    try {
        content = codec_.decode(codec::EncodedContent{draft.compressed_content, draft.compressed},
                                draft.content_length);
    } catch (const std::exception& e) {
        return infra::Status::error(infra::ErrorCode::CORRUPTED_DRAFT, e.what());
    }
    if (content.size() != draft.content_length) {
        return infra::Status::error(infra::ErrorCode::CORRUPTED_DRAFT,
                                    "content length mismatch for " + document_id);
    }

    quota_.touch(tier, document_id, clock_.wall_ms());
    return infra::Status::success();
}

infra::Status DraftStore::remove_draft(Tier tier, const std::string& document_id)
{
    std::unique_lock lock(rw_lock_);
    quota_.forget(tier, document_id);
    return store_.remove(tier, TieredStore::draft_key(document_id));
}

bool DraftStore::has_draft(Tier tier, const std::string& document_id) const
{
    std::shared_lock lock(rw_lock_);
    return quota_.entry(tier, document_id).has_value();
}

std::vector<DraftSummary> DraftStore::list_drafts(Tier tier) const
{
    std::shared_lock lock(rw_lock_);

    std::vector<DraftSummary> out;
    for (const auto& [document_id, entry] : quota_.eviction_order(tier)) {
        out.push_back(DraftSummary{document_id, tier, entry.size_bytes, entry.last_accessed,
                                   entry.saved_at});
    }
    return out;
}

size_t DraftStore::purge_expired(std::int64_t max_age_ms)
{
    std::unique_lock lock(rw_lock_);

    const std::int64_t now = clock_.wall_ms();
    size_t purged = 0;

    for (Tier tier : {Tier::VOLATILE, Tier::DURABLE}) {
        std::vector<std::string> expired;
        for (const auto& [document_id, entry] : quota_.index(tier)) {
            if (open_docs_.count(document_id) > 0) {
                continue;
            }
            if (now - entry.saved_at > max_age_ms) {
                expired.push_back(document_id);
            }
        }

        for (const auto& document_id : expired) {
            infra::Status st = store_.remove(tier, TieredStore::draft_key(document_id));
            if (!st.ok() && st.code != infra::ErrorCode::NOT_FOUND) {
                infra::Logger::log(infra::LogLevel::WARN,
                                   "Storage: Purge of " + document_id + " failed: " +
                                       st.describe());
                continue;
            }
            quota_.forget(tier, document_id);
            ++purged;
        }
    }

    if (purged > 0) {
        infra::Logger::log(infra::LogLevel::INFO,
                           "Storage: Purged " + std::to_string(purged) + " expired draft(s)");
    }
    return purged;
}

StorageStats DraftStore::storage_stats() const
{
    std::shared_lock lock(rw_lock_);

    auto collect = [this](Tier tier) {
        TierUsage usage = store_.estimate_usage(tier);
        return TierStats{usage.used, usage.capacity, quota_.index(tier).size()};
    };

    StorageStats stats;
    stats.volatile_tier = collect(Tier::VOLATILE);
    stats.durable_tier = collect(Tier::DURABLE);
    return stats;
}

infra::Status DraftStore::clear_all()
{
    std::unique_lock lock(rw_lock_);

    infra::Status result = infra::Status::success();
    size_t removed = 0;

    for (Tier tier : {Tier::VOLATILE, Tier::DURABLE}) {
        for (const auto& key : store_.keys(tier)) {
            std::string document_id;
            if (!TieredStore::parse_draft_key(key, document_id)) {
                continue;
            }
            infra::Status st = store_.remove(tier, key);
            if (st.ok()) {
                ++removed;
            } else if (st.code != infra::ErrorCode::NOT_FOUND) {
                result = st;
            }
        }
        quota_.clear(tier);
    }

    infra::Logger::log(infra::LogLevel::INFO,
                       "Storage: Cleared " + std::to_string(removed) + " draft(s)");
    return result;
}

void DraftStore::open_document(const std::string& document_id)
{
    std::unique_lock lock(rw_lock_);
    ++open_docs_[document_id];
}

void DraftStore::close_document(const std::string& document_id)
{
    std::unique_lock lock(rw_lock_);
    auto it = open_docs_.find(document_id);
    if (it != open_docs_.end() && --it->second <= 0) {
        open_docs_.erase(it);
    }
}

std::set<std::string> DraftStore::open_documents() const
{
    std::shared_lock lock(rw_lock_);
    std::set<std::string> out;
    for (const auto& [id, count] : open_docs_) {
        out.insert(id);
    }
    return out;
}

} // namespace lyra::storage
