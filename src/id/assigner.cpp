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
 * @file assigner.cpp
 * @brief Implementation of the identifier assignment pipeline.
 */

#include "keystone/id/assigner.hpp"

#include "keystone/id/uuid_generator.hpp"
#include "keystone/infra/logger.hpp"

#include <stdexcept>
#include <vector>

namespace keystone::id {

namespace {

bool has_primary(const cJSON* record, const std::string& primary)
{
    return cJSON_GetObjectItemCaseSensitive(record, primary.c_str()) != nullptr;
}

void require_object(const cJSON* record, const Table& table)
{
    if (!cJSON_IsObject(record)) {
        throw std::invalid_argument("Assign: records for " + table.name + " must be objects");
    }
}

} // namespace

Assigner::Assigner(storage::Store& store, infra::Scheduler& scheduler)
    : counters_(store), scheduler_(scheduler)
{
}

std::future<infra::JsonPtr> Assigner::assign(const Table& table, const cJSON* records)
{
    return scheduler_.submit([this, table, records]() { return assign_now(table, records); });
}

std::future<void> Assigner::verify(const Table& table)
{
    return scheduler_.submit([this, table]() {
        if (table.id && table.id->strategy == Strategy::COUNTER) {
            counters_.verify(*table.id, table.name, false);
        }
    });
}

infra::JsonPtr Assigner::allocate(const Table& table)
{
    if (!table.id) {
        throw std::invalid_argument("Assign: table " + table.name +
                                    " has no identifier configuration");
    }

    if (table.id->strategy == Strategy::RANDOM) {
        return infra::JsonPtr(cJSON_CreateString(UuidGenerator::generate().c_str()));
    }
    return infra::JsonPtr(cJSON_CreateString(counters_.next(*table.id, table.name).c_str()));
}

/**
 * @details
 * Runs on a scheduler worker. Copies that still need an identifier are collected as
 * raw pointers into `result`, which owns them; if an allocation throws, `result` is
 * destroyed with everything built so far.
 */
infra::JsonPtr Assigner::assign_now(const Table& table, const cJSON* records)
{
    if (!table.id) {
        return infra::Json::view(records);
    }

    if (!cJSON_IsArray(records)) {
        require_object(records, table);
        if (has_primary(records, table.primary)) {
            return infra::Json::view(records);
        }

        infra::JsonPtr copy = infra::Json::shallow_copy(records);
        cJSON_AddItemToObject(copy.get(), table.primary.c_str(), allocate(table).release());
        return copy;
    }

    infra::JsonPtr result(cJSON_CreateArray());
    std::vector<cJSON*> pending;

    const cJSON* item = nullptr;
    cJSON_ArrayForEach(item, records)
    {
        require_object(item, table);
        if (has_primary(item, table.primary)) {
            cJSON_AddItemReferenceToArray(result.get(), const_cast<cJSON*>(item));
            continue;
        }

        cJSON* copy = infra::Json::shallow_copy(item).release();
        cJSON_AddItemToArray(result.get(), copy);
        pending.push_back(copy);
    }

    if (pending.empty()) {
        return infra::Json::view(records);
    }

    infra::Logger::log(infra::LogLevel::DEBUG,
                       "Assign: " + std::to_string(pending.size()) + " of " +
                           std::to_string(cJSON_GetArraySize(records)) + " record(s) in " +
                           table.name + " need ids");

    for (cJSON* copy : pending) {
        cJSON_AddItemToObject(copy, table.primary.c_str(), allocate(table).release());
    }
    return result;
}

} // namespace keystone::id
