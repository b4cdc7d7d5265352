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
 * @file draft.cpp
 * @brief Binary framing of draft records.
 *
 * @details
 * Frames use 4-byte length prefixes so the reader never scans for delimiters
 * and binary zstd payloads pass through unmodified.
 */

#include "lyra/storage/draft.hpp"

#include <cJSON.h>
#include <cstdlib>
#include <cstring>

namespace lyra::storage {

namespace {

constexpr char kMagic[4] = {'L', 'Y', 'D', '1'};

void put_u32(std::string& out, std::uint32_t value)
{
    for (int i = 0; i < 4; ++i) {
        out.push_back(static_cast<char>((value >> (8 * i)) & 0xFF));
    }
}

bool get_u32(const std::string& in, size_t& cursor, std::uint32_t& value)
{
    if (in.size() - cursor < 4) {
        return false;
    }
    value = 0;
    for (int i = 0; i < 4; ++i) {
        value |= static_cast<std::uint32_t>(static_cast<unsigned char>(in[cursor + i])) << (8 * i);
    }
    cursor += 4;
    return true;
}

infra::Status corrupted(const std::string& why)
{
    return infra::Status::error(infra::ErrorCode::CORRUPTED_DRAFT, why);
}

} // namespace

std::string encode_record(const Draft& draft)
{
    cJSON* header = cJSON_CreateObject();
    cJSON_AddStringToObject(header, "documentId", draft.document_id.c_str());
    cJSON_AddStringToObject(header, "contentHash", draft.content_hash.c_str());
    cJSON_AddNumberToObject(header, "contentLength", static_cast<double>(draft.content_length));
    cJSON_AddNumberToObject(header, "sizeBytes",
                            static_cast<double>(draft.compressed_content.size()));
    cJSON_AddNumberToObject(header, "savedAt", static_cast<double>(draft.saved_at));
    cJSON_AddBoolToObject(header, "compressed", draft.compressed ? 1 : 0);
    cJSON_AddStringToObject(header, "tier", to_string(draft.tier));
    cJSON_AddStringToObject(header, "format", draft.compressed ? "zstd" : "raw");

    char* raw = cJSON_PrintUnformatted(header);
    std::string header_text = raw ? raw : "{}";
    free(raw);
    cJSON_Delete(header);

    std::string out;
    out.reserve(12 + header_text.size() + draft.compressed_content.size());
    out.append(kMagic, sizeof(kMagic));
    put_u32(out, static_cast<std::uint32_t>(header_text.size()));
    out.append(header_text);
    put_u32(out, static_cast<std::uint32_t>(draft.compressed_content.size()));
    out.append(draft.compressed_content);
    return out;
}

infra::Status decode_record(const std::string& bytes, Draft& out)
{
    if (bytes.size() < sizeof(kMagic) || std::memcmp(bytes.data(), kMagic, sizeof(kMagic)) != 0) {
        return corrupted("bad record magic");
    }

    size_t cursor = sizeof(kMagic);
    std::uint32_t header_length = 0;
    if (!get_u32(bytes, cursor, header_length) || bytes.size() - cursor < header_length) {
        return corrupted("truncated record header");
    }

    std::string header_text = bytes.substr(cursor, header_length);
    cursor += header_length;

    std::uint32_t payload_length = 0;
    if (!get_u32(bytes, cursor, payload_length) || bytes.size() - cursor != payload_length) {
        return corrupted("payload length mismatch");
    }

    cJSON* header = cJSON_Parse(header_text.c_str());
    if (!header || !cJSON_IsObject(header)) {
        cJSON_Delete(header);
        return corrupted("malformed record header");
    }

    cJSON* id = cJSON_GetObjectItem(header, "documentId");
    cJSON* hash = cJSON_GetObjectItem(header, "contentHash");
    cJSON* length = cJSON_GetObjectItem(header, "contentLength");
    cJSON* saved_at = cJSON_GetObjectItem(header, "savedAt");
    cJSON* compressed = cJSON_GetObjectItem(header, "compressed");
    cJSON* tier = cJSON_GetObjectItem(header, "tier");

    bool valid = cJSON_IsString(id) && cJSON_IsString(hash) && cJSON_IsNumber(length) &&
                 cJSON_IsNumber(saved_at) && cJSON_IsBool(compressed) && cJSON_IsString(tier);
    if (!valid) {
        cJSON_Delete(header);
        return corrupted("record header is missing fields");
    }

    // Integral values beyond 2^53 cannot come from a record this module wrote.
    constexpr double kMaxExact = 9007199254740992.0;
    if (!(length->valuedouble >= 0.0 && length->valuedouble <= kMaxExact) ||
        !(saved_at->valuedouble >= -kMaxExact && saved_at->valuedouble <= kMaxExact)) {
        cJSON_Delete(header);
        return corrupted("record header has out-of-range numbers");
    }

    out.document_id = id->valuestring;
    out.content_hash = hash->valuestring;
    out.content_length = static_cast<size_t>(length->valuedouble);
    out.saved_at = static_cast<std::int64_t>(saved_at->valuedouble);
    out.compressed = cJSON_IsTrue(compressed);
    bool tier_ok = parse_tier(tier->valuestring, out.tier);
    cJSON_Delete(header);

    if (!tier_ok) {
        return corrupted("unknown tier in record header");
    }

    out.compressed_content = bytes.substr(cursor, payload_length);
    out.size_bytes = out.compressed_content.size();
    return infra::Status::success();
}

} // namespace lyra::storage
