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
 * @file remote_sync.hpp
 * @brief Boundary to the remote document store.
 *
 * @details
 * The client is owned by the surrounding application, never by the engine, and
 * must outlive every session it is handed to. When a `WorkerPool` is supplied
 * to a session, `push()` is invoked from worker threads and must be thread-safe.
 */

#pragma once

#include "lyra/infra/status.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace lyra::session {

/**
 * @struct Revision
 * @brief Server-assigned version marker.
 */
struct Revision {
    std::string id;
    std::int64_t timestamp_ms = 0;
};

/**
 * @struct PushResult
 * @brief Outcome of one push attempt.
 */
struct PushResult {
    infra::Status status;
    Revision revision;
};

/**
 * @struct RemoteSnapshot
 * @brief Last known remote content of a document.
 */
struct RemoteSnapshot {
    std::string content;
    Revision revision;
};

/**
 * @class RemoteSyncClient
 * @brief Pushes content to, and fetches content from, the remote store.
 */
class RemoteSyncClient {
  public:
    virtual ~RemoteSyncClient() = default;

    /**
     * @brief Uploads the full content of a document.
     *
     * A failed push reports REMOTE_SYNC_FAILED; it must not throw.
     */
    virtual PushResult push(const std::string& document_id, const std::string& content) = 0;

    /**
     * @brief Canonical remote content, or `std::nullopt` for unknown documents.
     *
     * May throw on transport failure; callers log and treat the content as absent.
     */
    virtual std::optional<RemoteSnapshot> fetch(const std::string& document_id) = 0;
};

} // namespace lyra::session
