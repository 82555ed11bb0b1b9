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
 * @file radix.hpp
 * @brief Positional rendering of counter values in bases 2 through 62.
 *
 * @details
 * Digits are taken, in increasing value, from `0-9`, then `a-z`, then `A-Z`. Bases up to
 * 36 therefore agree with conventional lowercase base conversion, and base 62 gives the
 * most compact form.
 */

#pragma once

#include <cstdint>
#include <string>

namespace keystone::id {

class Radix {
  public:
    static constexpr int kMinRadix = 2;
    static constexpr int kMaxRadix = 62;

    /// @brief The digit alphabet, index = digit value.
    static constexpr const char* kAlphabet =
        "0123456789abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ";

    /**
     * @brief Renders `value` in `radix`. No sign, no padding; 0 renders as `"0"`.
     * @throws std::invalid_argument If `radix` is outside 2-62.
     */
    static std::string encode(std::uint64_t value, int radix);

    /**
     * @brief Parses a string produced by `encode` with the same radix.
     *
     * @throws std::invalid_argument On an empty string, a symbol outside the alphabet or
     * not valid in `radix`, or `radix` outside 2-62.
     * @throws std::out_of_range If the value does not fit in 64 bits.
     */
    static std::uint64_t decode(const std::string& text, int radix);

    /// @brief Whether `radix` is within 2-62.
    static bool valid(int radix)
    {
        return radix >= kMinRadix && radix <= kMaxRadix;
    }
};

} // namespace keystone::id
