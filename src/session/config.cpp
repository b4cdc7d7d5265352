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
 * @file config.cpp
 * @brief Option parsing and validation.
 */

#include "lyra/session/config.hpp"

#include "lyra/infra/logger.hpp"
#include "lyra/infra/string.hpp"
#include "lyra/session/autosave.hpp"

#include <cJSON.h>
#include <cmath>
#include <cstdlib>
#include <stdexcept>
#include <utility>

namespace lyra::session {

namespace {

infra::Status invalid(const std::string& key, const std::string& value)
{
    return infra::Status::error(infra::ErrorCode::INVALID_ARGUMENT,
                                "invalid value for " + key + ": '" + value + "'");
}

bool parse_int(const std::string& text, long long& out)
{
    std::string t = infra::String::trim(text);
    if (t.empty()) {
        return false;
    }
    try {
        size_t pos = 0;
        out = std::stoll(t, &pos);
        return pos == t.size();
    } catch (const std::logic_error&) {
        return false;
    }
}

bool parse_bool(const std::string& text, bool& out)
{
    std::string t = infra::String::to_lower(infra::String::trim(text));
    if (t == "true" || t == "1" || t == "yes" || t == "on") {
        out = true;
        return true;
    }
    if (t == "false" || t == "0" || t == "no" || t == "off") {
        out = false;
        return true;
    }
    return false;
}

const char* const kKnownOptions[] = {
    "debounceMs",        "throttleMs",       "cooldownMs",        "maxHistorySize",
    "mergeWindowMs",     "maxDraftSize",     "compressionEnabled", "compressionLevel",
    "volatileCapacity",  "durableCapacity",  "evictionPolicy",    "remoteMaxAttempts",
    "remoteBackoffMs",   "remoteTimeoutMs",  "maxDraftAgeMs",     "dataDir",
    "logLevel",
};

bool is_known_option(const std::string& key)
{
    for (const char* known : kKnownOptions) {
        if (key == known) {
            return true;
        }
    }
    return false;
}

} // namespace

infra::Status Config::apply(const std::string& key, const std::string& value)
{
    long long n = 0;
    bool b = false;

    if (key == "debounceMs" || key == "throttleMs" || key == "cooldownMs" ||
        key == "mergeWindowMs" || key == "remoteBackoffMs" || key == "remoteTimeoutMs" ||
        key == "maxDraftAgeMs") {
        if (!parse_int(value, n)) {
            return invalid(key, value);
        }
        if (key == "debounceMs")
            debounce_ms = n;
        else if (key == "throttleMs")
            throttle_ms = n;
        else if (key == "cooldownMs")
            cooldown_ms = n;
        else if (key == "mergeWindowMs")
            merge_window_ms = n;
        else if (key == "remoteBackoffMs")
            remote_backoff_ms = n;
        else if (key == "remoteTimeoutMs")
            remote_timeout_ms = n;
        else
            max_draft_age_ms = n;
        return infra::Status::success();
    }

    if (key == "maxHistorySize" || key == "maxDraftSize" || key == "volatileCapacity" ||
        key == "durableCapacity") {
        if (!parse_int(value, n) || n < 0) {
            return invalid(key, value);
        }
        size_t v = static_cast<size_t>(n);
        if (key == "maxHistorySize")
            max_history_size = v;
        else if (key == "maxDraftSize")
            max_draft_size = v;
        else if (key == "volatileCapacity")
            volatile_capacity = v;
        else
            durable_capacity = v;
        return infra::Status::success();
    }

    if (key == "compressionLevel" || key == "remoteMaxAttempts") {
        if (!parse_int(value, n)) {
            return invalid(key, value);
        }
        if (key == "compressionLevel")
            compression_level = static_cast<int>(n);
        else
            remote_max_attempts = static_cast<int>(n);
        return infra::Status::success();
    }

    if (key == "compressionEnabled") {
        if (!parse_bool(value, b)) {
            return invalid(key, value);
        }
        compression_enabled = b;
        return infra::Status::success();
    }

    if (key == "evictionPolicy") {
        if (!storage::parse_eviction_policy(value, eviction_policy)) {
            return invalid(key, value);
        }
        return infra::Status::success();
    }

    if (key == "dataDir") {
        if (infra::String::trim(value).empty()) {
            return invalid(key, value);
        }
        data_dir = infra::String::trim(value);
        return infra::Status::success();
    }

    if (key == "logLevel") {
        infra::LogLevel level;
        if (!infra::Logger::parse_level(value, level)) {
            return invalid(key, value);
        }
        log_level = infra::String::to_lower(infra::String::trim(value));
        return infra::Status::success();
    }

    return infra::Status::error(infra::ErrorCode::INVALID_ARGUMENT, "unknown option: " + key);
}

infra::Status Config::apply_assignment(const std::string& assignment)
{
    std::string key;
    std::string value;
    if (!infra::String::split_once(assignment, '=', key, value)) {
        return infra::Status::error(infra::ErrorCode::INVALID_ARGUMENT,
                                    "expected key=value, got '" + assignment + "'");
    }
    return apply(key, value);
}

Config Config::from_json(const std::string& text, infra::Status& status)
{
    Config cfg;
    status = infra::Status::success();

    cJSON* root = cJSON_Parse(text.c_str());
    if (!root || !cJSON_IsObject(root)) {
        cJSON_Delete(root);
        status = infra::Status::error(infra::ErrorCode::INVALID_ARGUMENT,
                                      "configuration is not a JSON object");
        return cfg;
    }

    cJSON* item = nullptr;
    cJSON_ArrayForEach(item, root)
    {
        std::string key = item->string ? item->string : "";
        if (!is_known_option(key)) {
            infra::Logger::log(infra::LogLevel::WARN, "Config: Ignoring unknown option " + key);
            continue;
        }

        std::string value;

        if (cJSON_IsNumber(item)) {
            if (item->valuedouble != std::floor(item->valuedouble)) {
                status = invalid(key, std::to_string(item->valuedouble));
                break;
            }
            value = std::to_string(static_cast<long long>(item->valuedouble));
        } else if (cJSON_IsBool(item)) {
            value = cJSON_IsTrue(item) ? "true" : "false";
        } else if (cJSON_IsString(item)) {
            value = item->valuestring;
        } else {
            status = infra::Status::error(infra::ErrorCode::INVALID_ARGUMENT,
                                          "unsupported value type for " + key);
            break;
        }

        infra::Status st = cfg.apply(key, value);
        if (!st.ok()) {
            status = st;
            break;
        }
    }

    cJSON_Delete(root);
    return cfg;
}

infra::Status Config::validate() const
{
    auto positive = [](const char* name, long long v) {
        if (v <= 0) {
            return infra::Status::error(infra::ErrorCode::INVALID_ARGUMENT,
                                        std::string(name) + " must be positive");
        }
        return infra::Status::success();
    };

    const std::pair<const char*, long long> checks[] = {
        {"debounceMs", debounce_ms},
        {"throttleMs", throttle_ms},
        {"cooldownMs", cooldown_ms},
        {"maxHistorySize", static_cast<long long>(max_history_size)},
        {"maxDraftSize", static_cast<long long>(max_draft_size)},
        {"volatileCapacity", static_cast<long long>(volatile_capacity)},
        {"durableCapacity", static_cast<long long>(durable_capacity)},
        {"remoteMaxAttempts", remote_max_attempts},
        {"remoteBackoffMs", remote_backoff_ms},
        {"remoteTimeoutMs", remote_timeout_ms},
        {"maxDraftAgeMs", max_draft_age_ms},
    };
    for (const auto& [name, value] : checks) {
        infra::Status st = positive(name, value);
        if (!st.ok()) {
            return st;
        }
    }

    if (merge_window_ms < 0) {
        return infra::Status::error(infra::ErrorCode::INVALID_ARGUMENT,
                                    "mergeWindowMs must not be negative");
    }
    return infra::Status::success();
}

history::HistoryOptions Config::history_options() const
{
    return history::HistoryOptions{max_history_size, merge_window_ms};
}

storage::DraftStoreOptions Config::store_options() const
{
    storage::DraftStoreOptions o;
    o.max_draft_size = max_draft_size;
    o.compression_enabled = compression_enabled;
    o.compression_level = compression_level;
    o.eviction_policy = eviction_policy;
    return o;
}

AutoSaveOptions Config::autosave_options() const
{
    AutoSaveOptions o;
    o.debounce_ms = debounce_ms;
    o.throttle_ms = throttle_ms;
    o.cooldown_ms = cooldown_ms;
    o.remote_max_attempts = remote_max_attempts;
    o.remote_backoff_ms = remote_backoff_ms;
    o.remote_timeout_ms = remote_timeout_ms;
    return o;
}

std::string Config::to_json() const
{
    cJSON* root = cJSON_CreateObject();
    cJSON_AddNumberToObject(root, "debounceMs", static_cast<double>(debounce_ms));
    cJSON_AddNumberToObject(root, "throttleMs", static_cast<double>(throttle_ms));
    cJSON_AddNumberToObject(root, "cooldownMs", static_cast<double>(cooldown_ms));
    cJSON_AddNumberToObject(root, "maxHistorySize", static_cast<double>(max_history_size));
    cJSON_AddNumberToObject(root, "mergeWindowMs", static_cast<double>(merge_window_ms));
    cJSON_AddNumberToObject(root, "maxDraftSize", static_cast<double>(max_draft_size));
    cJSON_AddBoolToObject(root, "compressionEnabled", compression_enabled ? 1 : 0);
    cJSON_AddNumberToObject(root, "compressionLevel", compression_level);
    cJSON_AddNumberToObject(root, "volatileCapacity", static_cast<double>(volatile_capacity));
    cJSON_AddNumberToObject(root, "durableCapacity", static_cast<double>(durable_capacity));
    cJSON_AddStringToObject(root, "evictionPolicy", storage::to_string(eviction_policy));
    cJSON_AddNumberToObject(root, "remoteMaxAttempts", remote_max_attempts);
    cJSON_AddNumberToObject(root, "remoteBackoffMs", static_cast<double>(remote_backoff_ms));
    cJSON_AddNumberToObject(root, "remoteTimeoutMs", static_cast<double>(remote_timeout_ms));
    cJSON_AddNumberToObject(root, "maxDraftAgeMs", static_cast<double>(max_draft_age_ms));
    cJSON_AddStringToObject(root, "dataDir", data_dir.c_str());
    cJSON_AddStringToObject(root, "logLevel", log_level.c_str());

    char* raw = cJSON_PrintUnformatted(root);
    std::string out = raw ? raw : "{}";
    free(raw);
    cJSON_Delete(root);
    return out;
}

} // namespace lyra::session
