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
 * @file status.hpp
 * @brief Error taxonomy and result type shared by all Lyra subsystems.
 *
 * @details
 * Storage, quota and synchronization operations report failures through a
 * `Status` value instead of throwing. Every code listed here is recoverable:
 * the caller degrades a durability guarantee, it never drops the live buffer.
 */

#pragma once

#include <string>
#include <utility>

namespace lyra::infra {

/**
 * @enum ErrorCode
 * @brief Classification of engine failures.
 */
enum class ErrorCode {
    OK,                  ///< No failure.
    COMPRESSION_FAILED,  ///< Codec rejected the input; content is stored raw.
    QUOTA_EXCEEDED,      ///< A tier has no room left, even after eviction.
    CORRUPTED_DRAFT,     ///< A stored draft failed decoding or hash verification.
    REMOTE_SYNC_FAILED,  ///< The remote store rejected or failed a push.
    REMOTE_TIMEOUT,      ///< A remote push did not answer within the configured timeout.
    INVARIANT_VIOLATION, ///< Internal CommandLog defect; history was reset.
    DRAFT_TOO_LARGE,     ///< Content exceeds `maxDraftSize`.
    IO_ERROR,            ///< Filesystem failure in the durable tier.
    NOT_FOUND,           ///< Requested key or draft does not exist.
    INVALID_ARGUMENT     ///< Malformed configuration or request.
};

/**
 * @brief Returns the canonical upper-case name of an error code (e.g. "QUOTA_EXCEEDED").
 */
const char* to_string(ErrorCode code);

/**
 * @struct Status
 * @brief Outcome of a fallible operation.
 */
struct Status {
    ErrorCode code = ErrorCode::OK;
    std::string message;

    bool ok() const { return code == ErrorCode::OK; }

    static Status success() { return Status{}; }

    static Status error(ErrorCode code, std::string message)
    {
        return Status{code, std::move(message)};
    }

    /// @brief "OK" or "<CODE>: <message>".
    std::string describe() const;
};

} // namespace lyra::infra
