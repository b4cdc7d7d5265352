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
 * @file recovery.cpp
 * @brief Candidate gathering, integrity checks and tie-breaking.
 */

#include "lyra/session/recovery.hpp"

#include "lyra/infra/hash.hpp"
#include "lyra/infra/logger.hpp"

#include <exception>

namespace lyra::session {

namespace {

struct Candidate {
    RecoverySource source;
    std::string content;
    std::int64_t timestamp;
    Revision revision;
    std::string hash;
};

/// @brief Lower rank wins a timestamp tie.
int rank(RecoverySource source)
{
    switch (source) {
    case RecoverySource::VOLATILE:
        return 0;
    case RecoverySource::DURABLE:
        return 1;
    case RecoverySource::REMOTE:
        return 2;
    case RecoverySource::NONE:
        break;
    }
    return 3;
}

std::string plural(std::int64_t n, const char* unit)
{
    return std::to_string(n) + " " + unit + (n == 1 ? "" : "s") + " ago";
}

} // namespace

const char* to_string(RecoverySource source)
{
    switch (source) {
    case RecoverySource::NONE:
        return "none";
    case RecoverySource::VOLATILE:
        return "volatile";
    case RecoverySource::DURABLE:
        return "durable";
    case RecoverySource::REMOTE:
        return "remote";
    }
    return "none";
}

std::string RecoveryResolver::format_age(std::int64_t timestamp_ms, std::int64_t now_ms)
{
    std::int64_t seconds = (now_ms - timestamp_ms) / 1000;
    if (seconds < 60) {
        return "just now";
    }
    std::int64_t minutes = seconds / 60;
    if (minutes < 60) {
        return plural(minutes, "minute");
    }
    std::int64_t hours = minutes / 60;
    if (hours < 24) {
        return plural(hours, "hour");
    }
    return plural(hours / 24, "day");
}

std::string RecoveryOutcome::age_text(std::int64_t now_ms) const
{
    return RecoveryResolver::format_age(timestamp, now_ms);
}

std::string RecoveryOutcome::preview() const
{
    constexpr size_t kLimit = 100;
    constexpr size_t kKept = 97;

    size_t code_points = 0;
    size_t cut = 0;
    for (size_t i = 0; i < content.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(content[i]);
        if ((c & 0xC0) == 0x80) {
            continue;
        }
        if (code_points == kKept) {
            cut = i;
        }
        ++code_points;
    }

    if (code_points <= kLimit) {
        return content;
    }
    return content.substr(0, cut) + "...";
}

RecoveryResolver::RecoveryResolver(storage::DraftStore& store, RemoteSyncClient* remote)
    : store_(store), remote_(remote)
{
}

RecoveryOutcome RecoveryResolver::resolve(const std::string& document_id, bool fetch_remote,
                                          bool purge_corrupted)
{
    RecoveryOutcome outcome;
    std::vector<Candidate> candidates;

    for (storage::Tier tier : {storage::Tier::VOLATILE, storage::Tier::DURABLE}) {
        const RecoverySource source =
            tier == storage::Tier::VOLATILE ? RecoverySource::VOLATILE : RecoverySource::DURABLE;

        storage::Draft draft;
        std::string content;
        infra::Status st = store_.read_draft(tier, document_id, draft, content);
        if (st.code == infra::ErrorCode::NOT_FOUND) {
            continue;
        }

        if (st.ok()) {
            std::string hash = infra::content_hash(content);
            if (hash == draft.content_hash) {
                (source == RecoverySource::VOLATILE ? outcome.volatile_hash
                                                    : outcome.durable_hash) = hash;
                candidates.push_back(
                    Candidate{source, std::move(content), draft.saved_at, Revision{}, hash});
                continue;
            }
            st = infra::Status::error(infra::ErrorCode::CORRUPTED_DRAFT,
                                      "content hash mismatch (stored " + draft.content_hash +
                                          ", computed " + hash + ")");
        }

        infra::Logger::log(infra::LogLevel::ERROR,
                           "Recovery: Discarding corrupted " + std::string(to_string(source)) +
                               " draft of " + document_id + ": " + st.message);
        outcome.discarded.push_back(DiscardedCandidate{source, st});
        if (!purge_corrupted) {
            continue;
        }

        infra::Status purged = store_.remove_draft(tier, document_id);
        if (!purged.ok() && purged.code != infra::ErrorCode::NOT_FOUND) {
            infra::Logger::log(infra::LogLevel::WARN,
                               "Recovery: Could not purge corrupted draft: " + purged.describe());
        }
    }

    if (fetch_remote && remote_) {
        std::optional<RemoteSnapshot> snapshot;
        try {
            snapshot = remote_->fetch(document_id);
        } catch (const std::exception& e) {
            infra::Logger::log(infra::LogLevel::WARN, "Recovery: Remote fetch of " + document_id +
                                                          " failed: " + e.what());
            outcome.discarded.push_back(DiscardedCandidate{
                RecoverySource::REMOTE,
                infra::Status::error(infra::ErrorCode::REMOTE_SYNC_FAILED, e.what())});
        }
        if (snapshot) {
            std::string hash = infra::content_hash(snapshot->content);
            outcome.remote_hash = hash;
            candidates.push_back(Candidate{RecoverySource::REMOTE, std::move(snapshot->content),
                                           snapshot->revision.timestamp_ms, snapshot->revision,
                                           hash});
        }
    }

    const Candidate* best = nullptr;
    for (const auto& c : candidates) {
        if (!best || c.timestamp > best->timestamp ||
            (c.timestamp == best->timestamp && rank(c.source) < rank(best->source))) {
            best = &c;
        }
    }

    if (!best) {
        infra::Logger::log(infra::LogLevel::DEBUG, "Recovery: No draft for " + document_id);
        return outcome;
    }

    outcome.source = best->source;
    outcome.content = best->content;
    outcome.timestamp = best->timestamp;
    outcome.revision = best->revision;

    infra::Logger::log(infra::LogLevel::INFO, "Recovery: " + document_id + " restored from " +
                                                  to_string(best->source) + " (" +
                                                  std::to_string(best->content.size()) +
                                                  " bytes)");
    return outcome;
}

} // namespace lyra::session
