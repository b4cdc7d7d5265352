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
 * @file status.cpp
 * @brief Names for the error taxonomy.
 */

#include "lyra/infra/status.hpp"

namespace lyra::infra {

const char* to_string(ErrorCode code)
{
    switch (code) {
    case ErrorCode::OK:
        return "OK";
    case ErrorCode::COMPRESSION_FAILED:
        return "COMPRESSION_FAILED";
    case ErrorCode::QUOTA_EXCEEDED:
        return "QUOTA_EXCEEDED";
    case ErrorCode::CORRUPTED_DRAFT:
        return "CORRUPTED_DRAFT";
    case ErrorCode::REMOTE_SYNC_FAILED:
        return "REMOTE_SYNC_FAILED";
    case ErrorCode::REMOTE_TIMEOUT:
        return "REMOTE_TIMEOUT";
    case ErrorCode::INVARIANT_VIOLATION:
        return "INVARIANT_VIOLATION";
    case ErrorCode::DRAFT_TOO_LARGE:
        return "DRAFT_TOO_LARGE";
    case ErrorCode::IO_ERROR:
        return "IO_ERROR";
    case ErrorCode::NOT_FOUND:
        return "NOT_FOUND";
    case ErrorCode::INVALID_ARGUMENT:
        return "INVALID_ARGUMENT";
    }
    return "UNKNOWN";
}

std::string Status::describe() const
{
    if (ok()) {
        return "OK";
    }
    if (message.empty()) {
        return to_string(code);
    }
    return std::string(to_string(code)) + ": " + message;
}

} // namespace lyra::infra
