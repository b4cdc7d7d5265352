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
 * @file handler.hpp
 * @brief JSON request dispatcher for diagnostics and scripted editing.
 *
 * @details
 * The `Handler` bridges line-oriented JSON requests (from the command line
 * front-end or a test) and the engine: it parses the request, routes the
 * `action` to the `DraftStore` or the open `EditorSession`, and serializes the
 * result into a standardized response.
 */

#pragma once

#include "lyra/session/editor_session.hpp"
#include "lyra/storage/draft_store.hpp"

#include <string>

namespace lyra::diag {

/**
 * @struct Context
 * @brief Targets of a request.
 */
struct Context {
    storage::DraftStore& store;
    /// @brief Open session for editing actions; null for store-only requests.
    session::EditorSession* session = nullptr;
};

/**
 * @class Handler
 * @brief A static controller for interpreting requests and marshaling responses.
 */
class Handler {
  public:
    /**
     * @brief Processes a raw request and returns the serialized response.
     *
     * **Response Formats:**
     * - **Success:** `{"status": "ok", "data": <result>}`
     * - **Error:** `{"status": "error", "code": "<ERROR_CODE>", "message": "<description>"}`
     *
     * **Store actions:** `stats`, `drafts`, `purge` (`maxAgeMs`), `clear_all`.
     *
     * **Session actions:** `insert` (`offset`, `text`), `delete` (`offset`,
     * `length`), `replace` (`offset`, `length`, `text`), `undo`, `redo`, `save`,
     * `suspend`, `content`, `state`, `history`, `clear_drafts`, `discard`.
     *
     * @code
     * {"action": "insert", "offset": 0, "text": "[G]Amazing grace"}
     * @endcode
     */
    static std::string process(Context& ctx, const std::string& raw_json);
};

} // namespace lyra::diag
