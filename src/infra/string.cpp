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
 * @file string.cpp
 * @brief Implementation of the string manipulation primitives.
 */

#include "lyra/infra/string.hpp"

#include <algorithm>
#include <cctype>

namespace lyra::infra {

/**
 * @brief Trims leading and trailing whitespace from a string instance.
 *
 * @note The use of `static_cast<unsigned char>` prevents undefined behavior
 * with `std::isspace` for characters with negative values in signed `char`
 * environments (UTF-8 lead bytes in song lyrics, for instance).
 */
std::string String::trim(const std::string& s)
{
    auto start = s.begin();
    while (start != s.end() && std::isspace(static_cast<unsigned char>(*start))) {
        start++;
    }

    if (start == s.end()) {
        return "";
    }

    auto end = s.end();
    do {
        end--;
    } while (std::distance(start, end) > 0 && std::isspace(static_cast<unsigned char>(*end)));

    return std::string(start, end + 1);
}

bool String::split_once(const std::string& s, char sep, std::string& key, std::string& value)
{
    auto pos = s.find(sep);
    if (pos == std::string::npos) {
        return false;
    }
    key = trim(s.substr(0, pos));
    value = trim(s.substr(pos + 1));
    return !key.empty();
}

std::string String::to_lower(const std::string& s)
{
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

} // namespace lyra::infra
