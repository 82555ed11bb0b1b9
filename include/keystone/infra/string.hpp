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
 * Static helpers used when reading textual configuration (identifier strategy names,
 * log level names) where callers may pass padded or mixed-case values.
 */

#pragma once

#include <string>

namespace keystone::infra {

/**
 * @class String
 * @brief A static container for text processing algorithms.
 */
class String {
  public:
    /**
     * @brief Trims leading and trailing whitespace from a string.
     *
     * Whitespace is whatever `std::isspace` accepts in the "C" locale (space, `\t`,
     * `\n`, `\r`, `\v`, `\f`).
     *
     * @param s The source string to process.
     * @return std::string The trimmed copy; empty if `s` is empty or all whitespace.
     *
     * @code
     * std::string clean = keystone::infra::String::trim("  increment \n"); // "increment"
     * @endcode
     */
    static std::string trim(const std::string& s);

    /**
     * @brief Returns an ASCII lower-cased copy of `s`.
     *
     * Non-ASCII bytes are copied unchanged.
     */
    static std::string to_lower(const std::string& s);
};

} // namespace keystone::infra
