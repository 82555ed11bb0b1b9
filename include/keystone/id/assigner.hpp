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
 * @file assigner.hpp
 * @brief Assigns primary keys to records about to be written to a table.
 *
 * @details
 * `Assigner` is the entry point a host calls on its insert path. It dispatches to the
 * table's strategy (`UuidGenerator` or `CounterAllocator`) and delivers results through
 * the `Scheduler`'s futures.
 */

#pragma once

#include "keystone/id/counter_allocator.hpp"
#include "keystone/id/identifier_config.hpp"
#include "keystone/infra/json.hpp"
#include "keystone/infra/scheduler.hpp"
#include "keystone/storage/store.hpp"

#include <cJSON.h>
#include <future>

namespace keystone::id {

/**
 * @class Assigner
 * @brief Identifier assignment orchestrator.
 *
 * @details
 * **Assignment Pipeline:**
 * 1. **Pass-through:** a table without identifier configuration gets its input back
 *    unchanged, as a cJSON reference node whose `child` is the input's own `child`.
 * 2. **Partition:** records whose primary-key member is present are carried through;
 *    the others are shallow-copied.
 * 3. **Allocate:** copies receive identifiers one at a time, in input order, inside a
 *    single scheduler task. Serial allocation keeps a batch from racing its own counter
 *    verification.
 * 4. **Emit:** the result has the input's shape and order.
 *
 * The caller's records are never modified. Results are views: unchanged records and
 * the members of copied records are references into the input, which must outlive the
 * result.
 */
class Assigner {
  public:
    /**
     * @param store Host store holding counter tables.
     * @param scheduler Pool the asynchronous operations run on.
     */
    Assigner(storage::Store& store, infra::Scheduler& scheduler);

    /**
     * @brief Assigns identifiers to the records in `records` that lack one.
     *
     * @param table The destination table. Copied into the task; only `records` must stay
     * alive until the future is ready.
     * @param records One record object, or an array of record objects.
     *
     * @return A future for the records with identifiers. `get()` rethrows the first
     * `IdError` raised while allocating, or `std::invalid_argument` if an element is not
     * an object; no partial batch is produced. When nothing needs an identifier the
     * result is not `records` itself but a reference to it: a separate `JsonPtr` sharing
     * the same members, which frees none of them.
     *
     * @code
     * infra::JsonPtr batch = infra::Json::parse(R"([{"name":"a"},{"id":"x","name":"b"}])");
     * infra::JsonPtr out = assigner.assign(orders, batch.get()).get();
     * @endcode
     */
    std::future<infra::JsonPtr> assign(const Table& table, const cJSON* records);

    /**
     * @brief Eagerly verifies the table's counter without allocating.
     *
     * Resolves immediately for tables without configuration or with the random strategy.
     */
    std::future<void> verify(const Table& table);

    /**
     * @brief Produces one identifier for `table`, blocking on the store if needed.
     *
     * @return A string node (UUID or radix-encoded counter value).
     * @throws IdError From the counter strategy.
     * @throws std::invalid_argument If the table has no identifier configuration.
     */
    infra::JsonPtr allocate(const Table& table);

  private:
    CounterAllocator counters_;
    infra::Scheduler& scheduler_;

    infra::JsonPtr assign_now(const Table& table, const cJSON* records);
};

} // namespace keystone::id
