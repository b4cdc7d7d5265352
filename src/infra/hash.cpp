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
 * @file hash.cpp
 * @brief SHA-256 content digest via OpenSSL.
 */

#include "lyra/infra/hash.hpp"

#include <iomanip>
#include <openssl/sha.h>
#include <sstream>

namespace lyra::infra {

std::string content_hash(const std::string& content)
{
    unsigned char digest[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(content.data()), content.size(), digest);

    std::stringstream ss;
    ss << std::hex << std::setfill('0');
    for (unsigned char byte : digest) {
        ss << std::setw(2) << static_cast<int>(byte);
    }
    return ss.str();
}

} // namespace lyra::infra
