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
 * @file config.hpp
 * @brief Engine configuration: defaults, JSON loading and `key=value` overrides.
 *
 * @details
 * Option names are the camelCase keys accepted in configuration files and on
 * the command line (`--set throttleMs=5000`).
 */

#pragma once

#include "lyra/history/command_log.hpp"
#include "lyra/infra/status.hpp"
#include "lyra/storage/draft_store.hpp"

#include <cstdint>
#include <string>

namespace lyra::session {

struct AutoSaveOptions;

/**
 * @struct Config
 * @brief Every recognized option with its default.
 */
struct Config {
    std::int64_t debounce_ms = 1000;
    std::int64_t throttle_ms = 10000;
    std::int64_t cooldown_ms = 2000;

    size_t max_history_size = 100;
    std::int64_t merge_window_ms = 500;

    size_t max_draft_size = 5 * 1024 * 1024;
    bool compression_enabled = true;
    int compression_level = 3;

    size_t volatile_capacity = 5 * 1024 * 1024;
    size_t durable_capacity = 50 * 1024 * 1024;
    storage::EvictionPolicy eviction_policy = storage::EvictionPolicy::LAZY;

    int remote_max_attempts = 3;
    std::int64_t remote_backoff_ms = 1000;
    std::int64_t remote_timeout_ms = 15000;

    std::int64_t max_draft_age_ms = 7LL * 24 * 60 * 60 * 1000;

    std::string data_dir = "./lyra_data";
    std::string log_level = "info";

    /**
     * @brief Parses a JSON object of options over the defaults.
     *
     * Unknown keys are logged and ignored.
     *
     * @param status Receives INVALID_ARGUMENT for malformed JSON or wrongly typed values.
     *
     * @code
     * infra::Status st;
     * auto cfg = Config::from_json(R"({"debounceMs": 250, "evictionPolicy": "proactive"})", st);
     * @endcode
     */
    static Config from_json(const std::string& text, infra::Status& status);

    /**
     * @brief Applies a single textual override.
     *
     * @return INVALID_ARGUMENT for unknown keys or unparsable values.
     */
    infra::Status apply(const std::string& key, const std::string& value);

    /// @brief Applies a `key=value` pair.
    infra::Status apply_assignment(const std::string& assignment);

    /// @brief Rejects zero or negative intervals, capacities and limits.
    infra::Status validate() const;

    history::HistoryOptions history_options() const;
    storage::DraftStoreOptions store_options() const;
    AutoSaveOptions autosave_options() const;

    /// @brief Effective configuration as a compact JSON object.
    std::string to_json() const;
};

} // namespace lyra::session
