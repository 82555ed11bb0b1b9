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
 * @file identifier_config.hpp
 * @brief Per-table identifier configuration and the table descriptor carrying it.
 *
 * @details
 * A host declares a table once and compiles its identifier options into an
 * `IdentifierConfig`. The configuration is immutable from then on except for the
 * `verified` flag, which the counter allocator raises after provisioning the counter
 * record. Each configuration owns its own flag; nothing is shared between tables.
 *
 * Options object accepted by `IdentifierConfig::compile`:
 * @code
 * { "type": "increment", "table": "_counters", "record": "orders",
 *   "key": "value", "initial": 1000, "radix": 62 }
 * { "type": "uuid" }
 * @endcode
 */

#pragma once

#include <cJSON.h>
#include <atomic>
#include <cstdint>
#include <memory>
#include <string>

namespace keystone::id {

/**
 * @enum Strategy
 * @brief How identifiers are produced for a table.
 */
enum class Strategy {
    RANDOM, ///< Version 4 UUID strings (`"uuid"`).
    COUNTER ///< Radix-encoded values of a durable counter (`"increment"`).
};

/**
 * @struct IdentifierConfig
 * @brief Compiled identifier options of one table.
 */
struct IdentifierConfig {
    static constexpr const char* kDefaultCounterTable = "_counters";
    static constexpr const char* kDefaultField = "value";
    static constexpr std::int64_t kDefaultInitial = 1;
    static constexpr int kDefaultRadix = 10;

    Strategy strategy = Strategy::RANDOM;

    /// @brief Set once the counter record is known to exist. Always true for `RANDOM`.
    std::atomic<bool> verified{true};

    // Counter strategy only.

    /// @brief Name of the counter table, resolved through the `Store` on every use.
    std::string counter_table;
    /// @brief Key of the counter record; defaults to the owning table's name.
    std::string record_key;
    /// @brief Field of the counter record holding the running value.
    std::string field_name;
    /// @brief First value handed out.
    std::int64_t initial_value = kDefaultInitial;
    /// @brief Base the value is rendered in, 2-62.
    int radix = kDefaultRadix;

    /**
     * @brief Compiles an options object for the table named `table_name`.
     *
     * `type` is matched after trimming and lower-casing. Counter fields left out of the
     * options take the defaults above.
     *
     * @return The configuration, or null when `options` is null (the table has no
     * identifier configuration).
     * @throws std::invalid_argument On an unknown `type`, a non-integer `initial`, a radix
     * outside 2-62, an empty name, or any option of the wrong JSON type.
     */
    static std::shared_ptr<IdentifierConfig> compile(const std::string& table_name,
                                                     const cJSON* options);
};

/**
 * @struct Table
 * @brief What the identifier subsystem needs to know about a host table.
 */
struct Table {
    std::string name;

    /// @brief Member holding a record's primary key.
    std::string primary = "id";

    /// @brief Null when the table assigns no identifiers.
    std::shared_ptr<IdentifierConfig> id;
};

} // namespace keystone::id
