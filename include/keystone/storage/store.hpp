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
 * @file store.hpp
 * @brief Table-record contract the identifier subsystem requires from its host store.
 *
 * @details
 * The identifier subsystem never owns tables. It reaches its counter table through
 * this interface by name, so any document store that can provision a table, read,
 * insert and update a keyed record, and atomically increment a numeric field can host
 * incrementing identifiers. `storage::Db` is the implementation shipped here.
 */

#pragma once

#include "keystone/infra/json.hpp"

#include <cJSON.h>
#include <cstdint>
#include <string>

namespace keystone::storage {

/**
 * @struct TableOptions
 * @brief Provisioning flags for `Store::provision_table`.
 */
struct TableOptions {
    bool purge = false;     ///< Discard existing records if the table already exists.
    bool secondary = false; ///< Request secondary indexes on the table.
};

/**
 * @class Store
 * @brief Abstract keyed-record store.
 *
 * Records are cJSON objects keyed by their string `id` member. Every operation reports
 * failure through its `bool` return; implementations log the cause.
 */
class Store {
  public:
    virtual ~Store() = default;

    /**
     * @brief Ensures `table` exists. Idempotent unless `options.purge` is set.
     */
    virtual bool provision_table(const std::string& table, const TableOptions& options) = 0;

    /**
     * @brief Reads the record stored under `key`.
     *
     * @param out Receives an owned copy of the record, or null if there is none.
     * @return false Only if the read itself failed (e.g., unknown table).
     */
    virtual bool get_record(const std::string& table, const std::string& key,
                            infra::JsonPtr& out) = 0;

    /**
     * @brief Inserts `record` under its `id` member.
     * @return false If the record has no string `id`, the key is taken, or I/O failed.
     */
    virtual bool insert_record(const std::string& table, const cJSON* record) = 0;

    /**
     * @brief Merges the members of `changes` into the record stored under `key`.
     * @return false If there is no such record or I/O failed.
     */
    virtual bool update_record(const std::string& table, const std::string& key,
                               const cJSON* changes) = 0;

    /**
     * @brief Atomically adds `delta` to `field` of the record under `key`.
     *
     * @param new_value Receives the field's value after the increment.
     * @return false If there is no such record, the field is not numeric, or I/O failed.
     */
    virtual bool increment_field(const std::string& table, const std::string& key,
                                 const std::string& field, std::int64_t delta,
                                 std::int64_t& new_value) = 0;
};

} // namespace keystone::storage
