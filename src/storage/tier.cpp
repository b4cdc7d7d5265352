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
 * @file tier.cpp
 * @brief Tier naming helpers.
 */

#include "lyra/storage/tier.hpp"

#include "lyra/infra/string.hpp"

namespace lyra::storage {

const char* to_string(Tier tier)
{
    return tier == Tier::VOLATILE ? "volatile" : "durable";
}

bool parse_tier(const std::string& name, Tier& out)
{
    std::string n = infra::String::to_lower(infra::String::trim(name));
    if (n == "volatile") {
        out = Tier::VOLATILE;
        return true;
    }
    if (n == "durable") {
        out = Tier::DURABLE;
        return true;
    }
    return false;
}

} // namespace lyra::storage
