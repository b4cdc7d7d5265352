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
 * @file draft.hpp
 * @brief The persisted checkpoint of a document and its on-disk record format.
 *
 * @details
 * A draft record is laid out as:
 *
 * | bytes | field                                        |
 * |-------|----------------------------------------------|
 * | 4     | magic `LYD1`                                 |
 * | 4     | header length H (u32, little endian)         |
 * | H     | JSON header (cJSON)                          |
 * | 4     | payload length P (u32, little endian)        |
 * | P     | payload (zstd frame or raw UTF-8)            |
 *
 * Header fields: `documentId`, `contentHash`, `contentLength`, `sizeBytes`,
 * `savedAt`, `compressed`, `tier`, `format` (`"zstd"` or `"raw"`).
 *
 * The header is readable without touching the payload, which lets the quota
 * index be rebuilt at startup from record headers alone.
 */

#pragma once

#include "lyra/infra/status.hpp"
#include "lyra/storage/tier.hpp"

#include <cstddef>
#include <cstdint>
#include <string>

namespace lyra::storage {

/**
 * @struct Draft
 * @brief A compressed, durable checkpoint of a document's content.
 */
struct Draft {
    std::string document_id;

    /// @brief Stored payload (zstd frame when `compressed`, raw text otherwise).
    std::string compressed_content;

    bool compressed = false;

    /// @brief Hash of the uncompressed content.
    std::string content_hash;

    /// @brief Length of the uncompressed content in bytes.
    size_t content_length = 0;

    /// @brief Length of the stored payload in bytes.
    size_t size_bytes = 0;

    /// @brief Wall clock milliseconds of the save.
    std::int64_t saved_at = 0;

    Tier tier = Tier::VOLATILE;
};

/**
 * @brief Serializes a draft into the binary record format.
 */
std::string encode_record(const Draft& draft);

/**
 * @brief Parses a draft record.
 *
 * @return CORRUPTED_DRAFT on a bad magic, truncated frame, malformed header or
 * payload length mismatch. `out` is unspecified in that case.
 */
infra::Status decode_record(const std::string& bytes, Draft& out);

} // namespace lyra::storage
