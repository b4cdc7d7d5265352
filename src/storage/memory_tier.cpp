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
 * @file memory_tier.cpp
 * @brief Map-backed volatile tier.
 */

#include "lyra/storage/memory_tier.hpp"

namespace lyra::storage {

MemoryTier::MemoryTier(size_t capacity) : capacity_(capacity) {}

std::optional<std::string> MemoryTier::get(const std::string& key)
{
    auto it = data_.find(key);
    if (it == data_.end()) {
        return std::nullopt;
    }
    return it->second;
}

infra::Status MemoryTier::set(const std::string& key, const std::string& bytes)
{
    size_t previous = 0;
    auto it = data_.find(key);
    if (it != data_.end()) {
        previous = it->second.size();
    }

    size_t projected = used_ - previous + bytes.size();
    if (projected > capacity_) {
        return infra::Status::error(infra::ErrorCode::QUOTA_EXCEEDED,
                                    "memory tier full (" + std::to_string(projected) + " > " +
                                        std::to_string(capacity_) + " bytes)");
    }

    data_[key] = bytes;
    used_ = projected;
    return infra::Status::success();
}

infra::Status MemoryTier::remove(const std::string& key)
{
    auto it = data_.find(key);
    if (it == data_.end()) {
        return infra::Status::error(infra::ErrorCode::NOT_FOUND, "no such key: " + key);
    }
    used_ -= it->second.size();
    data_.erase(it);
    return infra::Status::success();
}

std::vector<std::string> MemoryTier::keys()
{
    std::vector<std::string> out;
    out.reserve(data_.size());
    for (const auto& [key, value] : data_) {
        out.push_back(key);
    }
    return out;
}

TierUsage MemoryTier::usage()
{
    return TierUsage{used_, capacity_};
}

} // namespace lyra::storage
