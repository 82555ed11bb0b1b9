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
 * @file uuid_generator.cpp
 * @brief RFC 4122 Version 4 UUID generation.
 */

#include "keystone/id/uuid_generator.hpp"

#include <array>
#include <cstdint>
#include <random>

namespace keystone::id {

/**
 * @brief Generates an RFC 4122 compliant Version 4 UUID.
 *
 * Implementation Strategy:
 * 1. **Entropy Source**: 16 bytes read from a `thread_local` `std::random_device`
 * (the kernel's CSPRNG on Linux), four bytes per draw. No PRNG is seeded from it.
 * 2. **Protocol Compliance**:
 * - Byte 6 high nibble set to `0100` (Version 4).
 * - Byte 8 high bits set to `10` (RFC 4122 variant).
 * 3. **Formatting**: lowercase hex with hyphens after bytes 4, 6, 8 and 10.
 */
std::string UuidGenerator::generate()
{
    static thread_local std::random_device rd;
    static constexpr char kHex[] = "0123456789abcdef";

    std::array<std::uint8_t, 16> bytes{};
    for (std::size_t i = 0; i < bytes.size(); i += 4) {
        std::uint32_t word = static_cast<std::uint32_t>(rd());
        bytes[i] = static_cast<std::uint8_t>(word);
        bytes[i + 1] = static_cast<std::uint8_t>(word >> 8);
        bytes[i + 2] = static_cast<std::uint8_t>(word >> 16);
        bytes[i + 3] = static_cast<std::uint8_t>(word >> 24);
    }

    bytes[6] = static_cast<std::uint8_t>((bytes[6] & 0x0F) | 0x40);
    bytes[8] = static_cast<std::uint8_t>((bytes[8] & 0x3F) | 0x80);

    std::string out;
    out.reserve(36);
    for (std::size_t i = 0; i < bytes.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            out.push_back('-');
        }
        out.push_back(kHex[bytes[i] >> 4]);
        out.push_back(kHex[bytes[i] & 0x0F]);
    }
    return out;
}

} // namespace keystone::id
