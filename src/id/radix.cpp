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
 * @file radix.cpp
 * @brief Implementation of the base 2-62 codec.
 */

#include "keystone/id/radix.hpp"

#include <algorithm>
#include <limits>
#include <stdexcept>

namespace keystone::id {

namespace {

int digit_value(char c)
{
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'z')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'Z')
        return c - 'A' + 36;
    return -1;
}

void require_radix(int radix)
{
    if (!Radix::valid(radix)) {
        throw std::invalid_argument("Radix: base " + std::to_string(radix) +
                                    " outside supported range 2-62");
    }
}

} // namespace

std::string Radix::encode(std::uint64_t value, int radix)
{
    require_radix(radix);

    if (value == 0) {
        return "0";
    }

    const auto base = static_cast<std::uint64_t>(radix);
    std::string out;
    while (value > 0) {
        out.push_back(kAlphabet[value % base]);
        value /= base;
    }
    std::reverse(out.begin(), out.end());
    return out;
}

std::uint64_t Radix::decode(const std::string& text, int radix)
{
    require_radix(radix);

    if (text.empty()) {
        throw std::invalid_argument("Radix: empty input");
    }

    const auto base = static_cast<std::uint64_t>(radix);
    const std::uint64_t max = std::numeric_limits<std::uint64_t>::max();
    std::uint64_t value = 0;

    for (char c : text) {
        int digit = digit_value(c);
        if (digit < 0 || digit >= radix) {
            throw std::invalid_argument(std::string("Radix: symbol '") + c +
                                        "' invalid in base " + std::to_string(radix));
        }

        auto d = static_cast<std::uint64_t>(digit);
        if (value > (max - d) / base) {
            throw std::out_of_range("Radix: '" + text + "' overflows 64 bits");
        }
        value = value * base + d;
    }
    return value;
}

} // namespace keystone::id
