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
 * @file memory_tier.hpp
 * @brief In-process implementation of the volatile tier.
 */

#pragma once

#include "lyra/storage/tier.hpp"

#include <map>

namespace lyra::storage {

/**
 * @class MemoryTier
 * @brief Ordered map of byte strings with a byte capacity.
 *
 * Used for the volatile tier in production and as an injectable fake for
 * either tier in tests.
 */
class MemoryTier : public TierStore {
  public:
    explicit MemoryTier(size_t capacity);

    std::optional<std::string> get(const std::string& key) override;
    infra::Status set(const std::string& key, const std::string& bytes) override;
    infra::Status remove(const std::string& key) override;
    std::vector<std::string> keys() override;
    TierUsage usage() override;

  private:
    size_t capacity_;
    size_t used_ = 0;
    std::map<std::string, std::string> data_;
};

} // namespace lyra::storage
