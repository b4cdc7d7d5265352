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
 * @file quota_manager.cpp
 * @brief LRU eviction over the per-tier draft index.
 */

#include "lyra/storage/quota_manager.hpp"

#include "lyra/infra/logger.hpp"

#include <algorithm>

namespace lyra::storage {

QuotaManager::QuotaManager(TieredStore& store) : store_(store) {}

std::map<std::string, QuotaEntry>& QuotaManager::slot(Tier tier)
{
    return tier == Tier::VOLATILE ? volatile_index_ : durable_index_;
}

const std::map<std::string, QuotaEntry>& QuotaManager::index(Tier tier) const
{
    return tier == Tier::VOLATILE ? volatile_index_ : durable_index_;
}

void QuotaManager::record(Tier tier, const std::string& document_id, const QuotaEntry& entry)
{
    slot(tier)[document_id] = entry;
}

void QuotaManager::touch(Tier tier, const std::string& document_id, std::int64_t now)
{
    auto& idx = slot(tier);
    auto it = idx.find(document_id);
    if (it != idx.end()) {
        it->second.last_accessed = now;
    }
}

void QuotaManager::forget(Tier tier, const std::string& document_id)
{
    slot(tier).erase(document_id);
}

void QuotaManager::clear(Tier tier)
{
    slot(tier).clear();
}

std::optional<QuotaEntry> QuotaManager::entry(Tier tier, const std::string& document_id) const
{
    const auto& idx = index(tier);
    auto it = idx.find(document_id);
    if (it == idx.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<std::pair<std::string, QuotaEntry>> QuotaManager::eviction_order(Tier tier) const
{
    const auto& idx = index(tier);
    std::vector<std::pair<std::string, QuotaEntry>> order(idx.begin(), idx.end());
    std::stable_sort(order.begin(), order.end(), [](const auto& a, const auto& b) {
        return a.second.last_accessed < b.second.last_accessed;
    });
    return order;
}

infra::Status QuotaManager::ensure_capacity(Tier tier, size_t required_bytes,
                                            const std::set<std::string>& protected_docs,
                                            std::vector<std::string>* evicted)
{
    TierUsage usage = store_.estimate_usage(tier);
    auto overflow = [&]() -> long long {
        return static_cast<long long>(usage.used) + static_cast<long long>(required_bytes) -
               static_cast<long long>(usage.capacity);
    };

    if (overflow() <= 0) {
        return infra::Status::success();
    }

    infra::Logger::log(infra::LogLevel::DEBUG,
                       "Quota: " + std::string(to_string(tier)) + " tier needs " +
                           std::to_string(overflow()) + " more byte(s)");

    for (const auto& [document_id, entry] : eviction_order(tier)) {
        if (overflow() <= 0) {
            break;
        }
        if (protected_docs.count(document_id) > 0) {
            continue;
        }

        infra::Status removed = store_.remove(tier, TieredStore::draft_key(document_id));
        if (!removed.ok() && removed.code != infra::ErrorCode::NOT_FOUND) {
            infra::Logger::log(infra::LogLevel::WARN, "Quota: Could not evict " + document_id +
                                                          ": " + removed.describe());
            continue;
        }

        forget(tier, document_id);
        if (evicted) {
            evicted->push_back(document_id);
        }
        infra::Logger::log(infra::LogLevel::INFO,
                           "Quota: Evicted " + std::string(to_string(tier)) + " draft " +
                               document_id + " (" + std::to_string(entry.size_bytes) + " bytes)");

        usage = store_.estimate_usage(tier);
    }

    if (overflow() > 0) {
        return infra::Status::error(infra::ErrorCode::QUOTA_EXCEEDED,
                                    std::string(to_string(tier)) + " tier exhausted: " +
                                        std::to_string(overflow()) +
                                        " byte(s) short after eviction");
    }
    return infra::Status::success();
}

} // namespace lyra::storage
