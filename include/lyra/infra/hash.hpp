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
 * @file hash.hpp
 * @brief Content fingerprinting for drafts.
 *
 * @details
 * The engine needs a deterministic fingerprint of the *uncompressed* document
 * text to detect corrupted drafts, skip idempotent saves and compute the dirty
 * flag. The digest is SHA-256 as computed by OpenSSL libcrypto.
 */

#pragma once

#include <string>

namespace lyra::infra {

/**
 * @brief Computes the SHA-256 digest of `content`.
 *
 * @return std::string 64 lowercase hexadecimal characters.
 *
 * @code
 * std::string h = lyra::infra::content_hash("{title: Amazing Grace}");
 * @endcode
 */
std::string content_hash(const std::string& content);

} // namespace lyra::infra
