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
 * @file counter_allocator.hpp
 * @brief Durable counter behind incrementing identifiers.
 *
 * @details
 * Declares `CounterAllocator`, which lazily provisions a table's counter record and
 * hands out strictly increasing values from it.
 *
 * **Verification State Machine** (per `IdentifierConfig`):
 * `Unverified -> Verifying -> Verified`. Only `Verified` is recorded (the config's
 * `verified` flag); a failed verification leaves the config `Unverified` and the next
 * call starts over.
 *
 * **Counter Record Layout:** `{ "id": <record_key>, <field_name>: <last value handed out> }`
 */

#pragma once

#include "keystone/id/identifier_config.hpp"
#include "keystone/storage/store.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace keystone::id {

/**
 * @class CounterAllocator
 * @brief Verifies counter records and allocates values from them.
 *
 * @details
 * Holds a reference to the store only; all per-table state lives in the
 * `IdentifierConfig`. Calls block on the store and may run concurrently from several
 * threads. Two threads can both find a config unverified and provision at once; the
 * store's conflict policy decides the outcome and the loser receives a retryable
 * `IdError`.
 */
class CounterAllocator {
  public:
    explicit CounterAllocator(storage::Store& store);

    /**
     * @brief Ensures the counter table and record exist.
     *
     * @param config Counter configuration; a verified config returns immediately.
     * @param owner Name of the table the identifiers are for (used in error messages).
     * @param allocate When true and the record has to be created or initialized, the
     * stored baseline is `initial_value` and that value is returned as already consumed.
     *
     * @return The allocated baseline, or `std::nullopt` if nothing was allocated.
     *
     * @throws IdError `COUNTER_TABLE_PROVISION_FAILED`, `COUNTER_RECORD_READ_FAILED`,
     * `COUNTER_RECORD_INSERT_FAILED`, `COUNTER_RECORD_INIT_FAILED` (all retryable) or
     * `CORRUPT_COUNTER_RECORD`.
     */
    std::optional<std::int64_t> verify(IdentifierConfig& config, const std::string& owner,
                                       bool allocate);

    /**
     * @brief Allocates the next identifier and renders it in the configured radix.
     *
     * The first call on a fresh record returns `initial_value` straight from
     * verification. Every later call is one atomic increment on the store.
     *
     * @throws IdError Any error from `verify`, or `INCREMENT_FAILED`.
     */
    std::string next(IdentifierConfig& config, const std::string& owner);

  private:
    storage::Store& store_;

    std::string encode(std::int64_t value, const IdentifierConfig& config,
                       const std::string& owner) const;
};

} // namespace keystone::id
