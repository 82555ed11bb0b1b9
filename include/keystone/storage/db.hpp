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
 * @file db.hpp
 * @brief Durable keyed-record store implementing the `Store` contract.
 *
 * @details
 * `Db` keeps every table in memory as a map from record key to cJSON document and
 * persists each mutation through `Engine` before publishing it. It is the store the
 * identifier subsystem's counters live in when Keystone runs standalone.
 */

#pragma once

#include "keystone/infra/json.hpp"
#include "keystone/storage/engine.hpp"
#include "keystone/storage/store.hpp"

#include <cJSON.h>
#include <cstddef>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>

namespace keystone::storage {

/**
 * @class Db
 * @brief In-memory tables backed by append-only logs.
 *
 * @details
 * **Core Responsibilities:**
 * - **Concurrency Control:** `std::shared_mutex` reader-writer lock; reads are shared,
 *   every mutation (including `increment_field`) is exclusive, which makes increments
 *   atomic for all threads sharing the instance.
 * - **Persistence:** every mutation appends the record's full new snapshot.
 * - **Recovery:** the constructor replays all logs; later snapshots supersede earlier ones.
 * - **Conflict Policy:** inserting an existing key is rejected (no last-write-wins).
 */
class Db : public Store {
  public:
    /**
     * @brief Opens (or creates) the store under `data_dir` and replays its logs.
     * @throws std::filesystem::filesystem_error If the directory cannot be created.
     */
    explicit Db(std::string data_dir);

    ~Db() override;

    Db(const Db&) = delete;
    Db& operator=(const Db&) = delete;

    bool provision_table(const std::string& table, const TableOptions& options) override;

    bool get_record(const std::string& table, const std::string& key,
                    infra::JsonPtr& out) override;

    bool insert_record(const std::string& table, const cJSON* record) override;

    bool update_record(const std::string& table, const std::string& key,
                       const cJSON* changes) override;

    bool increment_field(const std::string& table, const std::string& key,
                         const std::string& field, std::int64_t delta,
                         std::int64_t& new_value) override;

    /// @brief Whether `table` has been provisioned (or recovered from disk).
    bool has_table(const std::string& table) const;

    /// @brief Number of records in `table`; 0 for unknown tables.
    std::size_t count(const std::string& table) const;

  private:
    using Table = std::unordered_map<std::string, infra::JsonPtr>;

    /// @brief The persistence layer responsible for physical disk I/O.
    Engine storage_;

    /// @brief Concurrency primitive for thread-safe memory access.
    mutable std::shared_mutex rw_lock_;

    /// @brief Table name -> record key -> document.
    std::unordered_map<std::string, Table> tables_;

    /// @brief Tables whose log may end in a partial frame; rewritten before the next append.
    std::unordered_set<std::string> damaged_;

    void load_all();
    bool persist(const std::string& table, const cJSON* record);
    bool compact_table(const std::string& table);
};

} // namespace keystone::storage
