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
 * @file counter_allocator.cpp
 * @brief Implementation of counter verification and allocation.
 *
 * @details
 * The baseline written when a counter record is created or initialized is the last
 * value considered handed out:
 * - `initial_value - 1` when verifying ahead of time, so the first increment yields
 *   `initial_value`;
 * - `initial_value` when verifying on behalf of an allocation, in which case that
 *   value is returned to the caller directly and the next increment yields
 *   `initial_value + 1`.
 * Either way no value is handed out twice.
 */

#include "keystone/id/counter_allocator.hpp"

#include "keystone/id/error.hpp"
#include "keystone/id/radix.hpp"
#include "keystone/infra/json.hpp"
#include "keystone/infra/logger.hpp"

namespace keystone::id {

namespace {

[[noreturn]] void fail(ErrorCode code, const std::string& message)
{
    infra::Logger::log(code == ErrorCode::CORRUPT_COUNTER_RECORD ? infra::LogLevel::FATAL
                                                                  : infra::LogLevel::ERROR,
                       "Counter: " + message);
    throw IdError(code, message);
}

} // namespace

CounterAllocator::CounterAllocator(storage::Store& store) : store_(store) {}

std::optional<std::int64_t> CounterAllocator::verify(IdentifierConfig& config,
                                                     const std::string& owner, bool allocate)
{
    if (config.verified.load()) {
        return std::nullopt;
    }

    infra::Logger::log(infra::LogLevel::DEBUG, "Counter: Verifying " + config.counter_table +
                                                   "/" + config.record_key + " for " + owner);

    storage::TableOptions options;
    options.purge = false;
    options.secondary = false;
    if (!store_.provision_table(config.counter_table, options)) {
        fail(ErrorCode::COUNTER_TABLE_PROVISION_FAILED,
             "Failed creating increment id table: " + owner);
    }

    infra::JsonPtr record;
    if (!store_.get_record(config.counter_table, config.record_key, record)) {
        fail(ErrorCode::COUNTER_RECORD_READ_FAILED,
             "Failed verifying increment id record: " + owner);
    }

    std::int64_t baseline = allocate ? config.initial_value : config.initial_value - 1;
    std::optional<std::int64_t> allocated;
    if (allocate) {
        allocated = baseline;
    }

    if (record) {
        const cJSON* field =
            cJSON_GetObjectItemCaseSensitive(record.get(), config.field_name.c_str());

        if (field == nullptr) {
            // Left behind by an earlier run or seeded externally without the field.
            infra::JsonPtr changes(cJSON_CreateObject());
            cJSON_AddNumberToObject(changes.get(), config.field_name.c_str(),
                                    static_cast<double>(baseline));

            if (!store_.update_record(config.counter_table, config.record_key, changes.get())) {
                fail(ErrorCode::COUNTER_RECORD_INIT_FAILED,
                     "Failed initializing key-value pair to increment id record: " + owner);
            }

            config.verified.store(true);
            infra::Logger::log(infra::LogLevel::INFO,
                               "Counter: Initialized existing record for " + owner);
            return allocated;
        }

        std::int64_t current = 0;
        if (!infra::Json::as_integer(field, current)) {
            fail(ErrorCode::CORRUPT_COUNTER_RECORD,
                 "Increment id record contains non-integer value: " + owner);
        }
        // -1 is the eager baseline of a counter starting at 0.
        if (current < -1) {
            fail(ErrorCode::CORRUPT_COUNTER_RECORD,
                 "Increment id record contains negative value: " + owner);
        }

        config.verified.store(true);
        infra::Logger::log(infra::LogLevel::INFO, "Counter: Verified counter for " + owner +
                                                      " at " + std::to_string(current));
        return std::nullopt;
    }

    infra::JsonPtr item(cJSON_CreateObject());
    cJSON_AddStringToObject(item.get(), "id", config.record_key.c_str());
    cJSON_AddNumberToObject(item.get(), config.field_name.c_str(), static_cast<double>(baseline));

    if (!store_.insert_record(config.counter_table, item.get())) {
        fail(ErrorCode::COUNTER_RECORD_INSERT_FAILED,
             "Failed inserting increment id record: " + owner);
    }

    config.verified.store(true);
    infra::Logger::log(infra::LogLevel::INFO, "Counter: Created counter record for " + owner);
    return allocated;
}

std::string CounterAllocator::next(IdentifierConfig& config, const std::string& owner)
{
    std::optional<std::int64_t> allocated = verify(config, owner, true);
    if (allocated) {
        return encode(*allocated, config, owner);
    }

    std::int64_t value = 0;
    if (!store_.increment_field(config.counter_table, config.record_key, config.field_name, 1,
                                value)) {
        fail(ErrorCode::INCREMENT_FAILED, "Failed allocating increment id: " + owner);
    }

    infra::Logger::log(infra::LogLevel::TRACE,
                       "Counter: Allocated " + std::to_string(value) + " for " + owner);
    return encode(value, config, owner);
}

std::string CounterAllocator::encode(std::int64_t value, const IdentifierConfig& config,
                                     const std::string& owner) const
{
    if (value < 0) {
        fail(ErrorCode::CORRUPT_COUNTER_RECORD,
             "Increment id record produced negative value: " + owner);
    }
    return Radix::encode(static_cast<std::uint64_t>(value), config.radix);
}

} // namespace keystone::id
