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
 * @file tiered_store.cpp
 * @brief Tier routing and key namespacing.
 */

#include "lyra/storage/tiered_store.hpp"

#include <stdexcept>

namespace lyra::storage {

namespace {
constexpr const char* kDraftPrefix = "draft:";
constexpr size_t kDraftPrefixLength = 6;
} // namespace

TieredStore::TieredStore(std::unique_ptr<TierStore> volatile_tier,
                         std::unique_ptr<TierStore> durable_tier)
    : volatile_(std::move(volatile_tier)), durable_(std::move(durable_tier))
{
    if (!volatile_ || !durable_) {
        throw std::invalid_argument("TieredStore requires both tier backends");
    }
}

TierStore& TieredStore::backend(Tier tier)
{
    return tier == Tier::VOLATILE ? *volatile_ : *durable_;
}

std::optional<std::string> TieredStore::get(Tier tier, const std::string& key)
{
    return backend(tier).get(key);
}

infra::Status TieredStore::set(Tier tier, const std::string& key, const std::string& bytes)
{
    return backend(tier).set(key, bytes);
}

infra::Status TieredStore::remove(Tier tier, const std::string& key)
{
    return backend(tier).remove(key);
}

std::vector<std::string> TieredStore::keys(Tier tier)
{
    return backend(tier).keys();
}

TierUsage TieredStore::estimate_usage(Tier tier)
{
    return backend(tier).usage();
}

std::string TieredStore::draft_key(const std::string& document_id)
{
    return kDraftPrefix + document_id;
}

bool TieredStore::parse_draft_key(const std::string& key, std::string& document_id)
{
    if (key.size() <= kDraftPrefixLength || key.compare(0, kDraftPrefixLength, kDraftPrefix) != 0) {
        return false;
    }
    document_id = key.substr(kDraftPrefixLength);
    return true;
}

} // namespace lyra::storage
