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
 * @file recovery.hpp
 * @brief Picks the authoritative starting content when a document is opened.
 *
 * @details
 * Up to three candidates are gathered: the volatile draft, the durable draft and
 * the last known remote content. Each local draft is decompressed and its
 * `contentHash` recomputed; a mismatch (or an undecodable record) discards the
 * candidate as corrupted and purges it from its tier.
 *
 * **Resolution rule:** the latest timestamp wins; on an exact tie the most
 * local candidate wins (volatile, then durable, then remote).
 */

#pragma once

#include "lyra/infra/status.hpp"
#include "lyra/session/remote_sync.hpp"
#include "lyra/storage/draft_store.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace lyra::session {

/**
 * @enum RecoverySource
 * @brief Where the starting content came from.
 */
enum class RecoverySource {
    NONE,     ///< No candidate: start from empty content.
    VOLATILE, ///< Volatile-tier draft.
    DURABLE,  ///< Durable-tier draft.
    REMOTE    ///< Remote store content.
};

const char* to_string(RecoverySource source);

/**
 * @struct DiscardedCandidate
 * @brief A candidate rejected during resolution.
 */
struct DiscardedCandidate {
    RecoverySource source = RecoverySource::NONE;
    infra::Status reason;
};

/**
 * @struct RecoveryOutcome
 * @brief Result of `RecoveryResolver::resolve()`.
 */
struct RecoveryOutcome {
    RecoverySource source = RecoverySource::NONE;
    std::string content;

    /// @brief `savedAt` of a local draft, or the revision timestamp of the remote content.
    std::int64_t timestamp = 0;

    /// @brief Remote revision; only set when `source == REMOTE`.
    Revision revision;

    /// @brief Hashes of the valid candidates, empty when absent.
    std::string volatile_hash;
    std::string durable_hash;
    std::string remote_hash;

    std::vector<DiscardedCandidate> discarded;

    bool found() const { return source != RecoverySource::NONE; }

    /**
     * @brief Human readable age: "just now", "1 minute ago", "3 hours ago", "2 days ago".
     */
    std::string age_text(std::int64_t now_ms) const;

    /**
     * @brief First 100 characters of the content, or 97 followed by "...".
     *
     * Counts UTF-8 code points, never splitting a multi-byte sequence.
     */
    std::string preview() const;
};

/**
 * @class RecoveryResolver
 * @brief Reconciles local drafts and remote content for one document.
 */
class RecoveryResolver {
  public:
    /**
     * @param remote Optional; without it the remote candidate is always absent.
     */
    RecoveryResolver(storage::DraftStore& store, RemoteSyncClient* remote = nullptr);

    /**
     * @brief Gathers, verifies and ranks the candidates of `document_id`.
     *
     * @param fetch_remote Whether to query the remote store (documents without a
     * server identity have no remote content).
     * @param purge_corrupted Deletes drafts that fail verification. Read-only
     * inspection passes false; corrupted drafts are still reported in `discarded`.
     */
    RecoveryOutcome resolve(const std::string& document_id, bool fetch_remote,
                            bool purge_corrupted = true);

    static std::string format_age(std::int64_t timestamp_ms, std::int64_t now_ms);

  private:
    storage::DraftStore& store_;
    RemoteSyncClient* remote_;
};

} // namespace lyra::session
