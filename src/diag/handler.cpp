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
 * @file handler.cpp
 * @brief Implementation of the request processing pipeline.
 *
 * @details
 * 1. **Ingest**: parse the raw JSON request.
 * 2. **Dispatch**: route the action to the store or the session.
 * 3. **Respond**: format the result into a standardized JSON response.
 */

#include "lyra/diag/handler.hpp"

#include <cJSON.h>
#include <cstdlib>

namespace lyra::diag {

namespace {

cJSON* tier_stats_json(const storage::TierStats& stats)
{
    cJSON* obj = cJSON_CreateObject();
    cJSON_AddNumberToObject(obj, "used", static_cast<double>(stats.used));
    cJSON_AddNumberToObject(obj, "capacity", static_cast<double>(stats.capacity));
    cJSON_AddNumberToObject(obj, "drafts", static_cast<double>(stats.drafts));
    return obj;
}

cJSON* state_json(const session::EditorSession& s)
{
    cJSON* root = cJSON_CreateObject();

    session::SaveState save = s.save_state();
    cJSON* local = cJSON_AddObjectToObject(root, "save");
    cJSON_AddStringToObject(local, "status", session::to_string(save.status));
    cJSON_AddNumberToObject(local, "lastSavedAt", static_cast<double>(save.last_saved_at));
    cJSON_AddBoolToObject(local, "isDirty", save.is_dirty ? 1 : 0);
    if (!save.last_error.ok()) {
        cJSON_AddStringToObject(local, "lastError", save.last_error.describe().c_str());
    }

    const session::RemoteState& rs = s.remote_state();
    cJSON* remote = cJSON_AddObjectToObject(root, "remote");
    cJSON_AddStringToObject(remote, "status", session::to_string(rs.status));
    cJSON_AddNumberToObject(remote, "attempts", rs.attempts);
    cJSON_AddStringToObject(remote, "revision", rs.last_revision.id.c_str());
    if (!rs.last_error.ok()) {
        cJSON_AddStringToObject(remote, "lastError", rs.last_error.describe().c_str());
    }

    history::HistoryInfo info = s.history_info();
    cJSON* hist = cJSON_AddObjectToObject(root, "history");
    cJSON_AddNumberToObject(hist, "undoCount", static_cast<double>(info.undo_count));
    cJSON_AddNumberToObject(hist, "redoCount", static_cast<double>(info.redo_count));
    cJSON_AddNumberToObject(hist, "maxSize", static_cast<double>(info.max_size));
    cJSON_AddNumberToObject(hist, "resets", static_cast<double>(s.history_resets()));

    return root;
}

bool get_size(cJSON* req, const char* name, size_t& out)
{
    cJSON* item = cJSON_GetObjectItem(req, name);
    // Negative, NaN and values past 2^53 are not valid offsets.
    if (!cJSON_IsNumber(item) ||
        !(item->valuedouble >= 0.0 && item->valuedouble <= 9007199254740992.0)) {
        return false;
    }
    out = static_cast<size_t>(item->valuedouble);
    return true;
}

bool get_text(cJSON* req, const char* name, std::string& out)
{
    cJSON* item = cJSON_GetObjectItem(req, name);
    if (!cJSON_IsString(item)) {
        return false;
    }
    out = item->valuestring;
    return true;
}

} // namespace

std::string Handler::process(Context& ctx, const std::string& raw_json)
{
    if (raw_json.empty()) {
        return "{\"status\":\"error\",\"message\":\"Empty request payload\"}";
    }

    cJSON* req = cJSON_Parse(raw_json.c_str());
    if (!req) {
        return "{\"status\":\"error\",\"message\":\"Invalid JSON syntax\"}";
    }

    cJSON* act = cJSON_GetObjectItem(req, "action");
    std::string action = cJSON_IsString(act) ? act->valuestring : "";

    if (action == "exit") {
        cJSON_Delete(req);
        return "{\"status\":\"goodbye\",\"message\":\"Closing session\"}";
    }

    cJSON* resp_root = cJSON_CreateObject();
    infra::Status result = infra::Status::success();
    std::string msg;
    session::EditorSession* s = ctx.session;

    auto missing = [&result](const std::string& what) {
        result = infra::Status::error(infra::ErrorCode::INVALID_ARGUMENT, "Missing " + what);
    };

    bool needs_session = action == "insert" || action == "delete" || action == "replace" ||
                         action == "undo" || action == "redo" || action == "save" ||
                         action == "suspend" || action == "content" || action == "state" ||
                         action == "history" || action == "clear_drafts" || action == "discard";

    if (needs_session && !s) {
        result = infra::Status::error(infra::ErrorCode::INVALID_ARGUMENT,
                                      "No open document for action: " + action);
    } else if (action == "stats") {
        storage::StorageStats stats = ctx.store.storage_stats();
        cJSON* data = cJSON_AddObjectToObject(resp_root, "data");
        cJSON_AddItemToObject(data, "volatile", tier_stats_json(stats.volatile_tier));
        cJSON_AddItemToObject(data, "durable", tier_stats_json(stats.durable_tier));
    } else if (action == "drafts") {
        cJSON* arr = cJSON_AddArrayToObject(resp_root, "data");
        for (storage::Tier tier : {storage::Tier::VOLATILE, storage::Tier::DURABLE}) {
            for (const auto& d : ctx.store.list_drafts(tier)) {
                cJSON* item = cJSON_CreateObject();
                cJSON_AddStringToObject(item, "documentId", d.document_id.c_str());
                cJSON_AddStringToObject(item, "tier", storage::to_string(d.tier));
                cJSON_AddNumberToObject(item, "sizeBytes", static_cast<double>(d.size_bytes));
                cJSON_AddNumberToObject(item, "lastAccessed",
                                        static_cast<double>(d.last_accessed));
                cJSON_AddNumberToObject(item, "savedAt", static_cast<double>(d.saved_at));
                cJSON_AddItemToArray(arr, item);
            }
        }
    } else if (action == "purge") {
        cJSON* age = cJSON_GetObjectItem(req, "maxAgeMs");
        if (!cJSON_IsNumber(age) || age->valuedouble < 0) {
            missing("argument: 'maxAgeMs'");
        } else {
            size_t purged = ctx.store.purge_expired(static_cast<std::int64_t>(age->valuedouble));
            cJSON_AddNumberToObject(resp_root, "purged", static_cast<double>(purged));
        }
    } else if (action == "clear_all") {
        result = ctx.store.clear_all();
        msg = "All drafts cleared";
    } else if (action == "insert") {
        size_t offset = 0;
        std::string text;
        if (!get_size(req, "offset", offset) || !get_text(req, "text", text)) {
            missing("arguments: 'offset' or 'text'");
        } else {
            result = s->insert(offset, text);
        }
    } else if (action == "delete") {
        size_t offset = 0;
        size_t length = 0;
        if (!get_size(req, "offset", offset) || !get_size(req, "length", length)) {
            missing("arguments: 'offset' or 'length'");
        } else {
            result = s->erase(offset, length);
        }
    } else if (action == "replace") {
        size_t offset = 0;
        size_t length = 0;
        std::string text;
        if (!get_size(req, "offset", offset) || !get_size(req, "length", length) ||
            !get_text(req, "text", text)) {
            missing("arguments: 'offset', 'length' or 'text'");
        } else {
            result = s->replace(offset, length, text);
        }
    } else if (action == "undo" || action == "redo") {
        history::StepResult step = action == "undo" ? s->undo() : s->redo();
        cJSON_AddBoolToObject(resp_root, "applied", step.applied ? 1 : 0);
        cJSON_AddBoolToObject(resp_root, "canContinue", step.can_continue ? 1 : 0);
        if (step.reset) {
            msg = "History reset after an internal inconsistency; content preserved";
        }
    } else if (action == "save") {
        s->force_save();
        cJSON_AddItemToObject(resp_root, "data", state_json(*s));
    } else if (action == "suspend") {
        s->suspend();
        cJSON_AddItemToObject(resp_root, "data", state_json(*s));
    } else if (action == "content") {
        cJSON_AddStringToObject(resp_root, "content", s->content().c_str());
    } else if (action == "state") {
        cJSON_AddItemToObject(resp_root, "data", state_json(*s));
    } else if (action == "history") {
        cJSON* history = cJSON_Parse(s->serialize_history().c_str());
        if (history) {
            cJSON_AddItemToObject(resp_root, "data", history);
        } else {
            result = infra::Status::error(infra::ErrorCode::INVALID_ARGUMENT,
                                          "History export failed");
        }
    } else if (action == "clear_drafts") {
        result = s->clear_drafts();
        msg = "Drafts cleared";
    } else if (action == "discard") {
        result = s->discard_recovery();
        msg = "Recovered draft discarded";
    } else {
        result = infra::Status::error(infra::ErrorCode::INVALID_ARGUMENT,
                                      "Unknown action opcode: " + action);
    }

    cJSON_AddStringToObject(resp_root, "status", result.ok() ? "ok" : "error");
    if (!result.ok()) {
        cJSON_AddStringToObject(resp_root, "code", infra::to_string(result.code));
        msg = result.message;
    }
    if (!msg.empty()) {
        cJSON_AddStringToObject(resp_root, "message", msg.c_str());
    }

    char* raw_output = cJSON_PrintUnformatted(resp_root);
    std::string final_response = raw_output ? raw_output : "{}";

    free(raw_output);
    cJSON_Delete(resp_root);
    cJSON_Delete(req);

    return final_response;
}

} // namespace lyra::diag
