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
 * @file file_tier.hpp
 * @brief Directory-backed implementation of the durable tier.
 *
 * @details
 * Every key is persisted as one file `<escaped-key>.lyd` inside the data
 * directory. Writes never modify a file in place: the new value is written to a
 * temporary sibling and atomically renamed over the old one, so a crash leaves
 * either the previous value or the new one, never a torn record.
 *
 * **Key escaping:** `[A-Za-z0-9_-]` are kept; every other byte becomes `.XX`
 * (two lowercase hex digits), so `draft:song/1` maps to `draft.3asong.2f1.lyd`.
 */

#pragma once

#include "lyra/storage/tier.hpp"

namespace lyra::storage {

/**
 * @class FileTier
 * @brief One-file-per-key persistent store with a byte capacity.
 */
class FileTier : public TierStore {
  public:
    /**
     * @brief Configures the tier.
     *
     * @param base_path Directory holding the `.lyd` files.
     * @param capacity Byte ceiling across all files of the tier.
     */
    FileTier(std::string base_path, size_t capacity);

    /**
     * @brief Creates the data directory tree if it does not exist.
     *
     * @throws std::filesystem::filesystem_error If the directory cannot be created.
     */
    void init();

    std::optional<std::string> get(const std::string& key) override;
    infra::Status set(const std::string& key, const std::string& bytes) override;
    infra::Status remove(const std::string& key) override;
    std::vector<std::string> keys() override;
    TierUsage usage() override;

    const std::string& base_path() const { return base_path_; }

    static std::string escape_key(const std::string& key);
    static bool unescape_key(const std::string& name, std::string& key);

  private:
    /// @brief Resolves a key to `<base_path>/<escaped>.lyd`.
    std::string get_path(const std::string& key) const;

    std::string base_path_;
    size_t capacity_;
};

} // namespace lyra::storage
