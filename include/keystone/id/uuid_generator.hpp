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
 * @file uuid_generator.hpp
 * @brief Random identifier strategy: Version 4 UUIDs.
 *
 * @details
 * Declares `UuidGenerator`, the stateless generator behind tables configured with
 * `"type": "uuid"`. It needs no store and no verification.
 */

#pragma once

#include <string>

namespace keystone::id {

/**
 * @class UuidGenerator
 * @brief A static utility for generating standard Version 4 UUIDs.
 *
 * @details
 * All 128 bits come from `std::random_device`, the operating system's secure random
 * source, so identifiers cannot be predicted from earlier ones. Thread-safe.
 */
class UuidGenerator {
  public:
    /**
     * @brief Generates a random Version 4 UUID string.
     *
     * Layout: `xxxxxxxx-xxxx-4xxx-yxxx-xxxxxxxxxxxx`, lowercase hex, 36 characters.
     * - `4`: the version nibble (Version 4, Random).
     * - `y`: the RFC 4122 variant nibble, one of `{8, 9, a, b}`.
     *
     * @code
     * std::string id = keystone::id::UuidGenerator::generate();
     * @endcode
     */
    static std::string generate();
};

} // namespace keystone::id
