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
 * @file string.hpp
 * @brief Supplementary string manipulation primitives.
 *
 * @details
 * This header defines the `String` utility class, a static extension to
 * `std::string` used by the configuration layer (`key=value` overrides), the
 * logger (level names) and the command line front-end.
 */

#pragma once

#include <string>

namespace lyra::infra {

/**
 * @class String
 * @brief A static container for text processing algorithms.
 */
class String {
  public:
    /**
     * @brief Trims leading and trailing whitespace from a string.
     *
     * @param s The source string to process.
     * @return std::string A new string without surrounding whitespace.
     * Returns an empty string if the input is empty or consists solely of whitespace.
     *
     * @code
     * std::string clean = lyra::infra::String::trim("  debounceMs = 250 \n"); // "debounceMs = 250"
     * @endcode
     */
    static std::string trim(const std::string& s);

    /**
     * @brief Splits `s` at the first occurrence of `sep`.
     *
     * Both halves are trimmed. Fails when the separator is absent or the key is empty.
     *
     * @param s Input such as `"throttleMs=5000"`.
     * @param sep Separator character.
     * @param key Receives the left-hand side.
     * @param value Receives the right-hand side.
     * @return true If the split succeeded.
     */
    static bool split_once(const std::string& s, char sep, std::string& key, std::string& value);

    /// @brief ASCII lower-casing.
    static std::string to_lower(const std::string& s);
};

} // namespace lyra::infra
