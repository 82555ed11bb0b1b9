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
 * @file main.cpp
 * @brief Command-line front end for Keystone identifier allocation.
 *
 * @details
 * Opens a record store, declares one table with incrementing identifiers, and assigns
 * identifiers to a batch of fresh records, printing one identifier per line. Running it
 * repeatedly against the same data directory continues the same counter.
 */

#include "keystone/id/assigner.hpp"
#include "keystone/id/error.hpp"
#include "keystone/id/identifier_config.hpp"
#include "keystone/infra/json.hpp"
#include "keystone/infra/logger.hpp"
#include "keystone/infra/scheduler.hpp"
#include "keystone/storage/db.hpp"

#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>

/**
 * @brief Prints usage instructions to stdout.
 */
void print_help(const char* binary_name)
{
    std::cout << "Usage: " << binary_name << " [DATA_PATH] [TABLE] [COUNT] [RADIX]\n"
              << "Options:\n"
              << "  DATA_PATH   Directory holding the record store (Default: ./keystone_data)\n"
              << "  TABLE       Table the identifiers are allocated for (Default: items)\n"
              << "  COUNT       Number of identifiers to allocate (Default: 5)\n"
              << "  RADIX       Base 2-62 the counter is rendered in, or 'uuid' (Default: 10)\n"
              << "  --help      Show this help message\n"
              << "Environment:\n"
              << "  KEYSTONE_LOG_LEVEL  trace|debug|info|warn|error|fatal (Default: info)\n";
}

int main(int argc, char* argv[])
{
    if (argc > 1 && std::string(argv[1]) == "--help") {
        print_help(argv[0]);
        return 0;
    }

    if (const char* level = std::getenv("KEYSTONE_LOG_LEVEL")) {
        keystone::infra::Logger::set_level(keystone::infra::Logger::parse_level(level));
    }

    std::string data_path = "./keystone_data";
    std::string table_name = "items";
    int count = 5;
    std::string radix = "10";

    try {
        if (argc > 1)
            data_path = argv[1];
        if (argc > 2)
            table_name = argv[2];
        if (argc > 3)
            count = std::stoi(argv[3]);
        if (argc > 4)
            radix = argv[4];

        if (count < 1) {
            throw std::invalid_argument("COUNT must be at least 1");
        }

        keystone::infra::JsonPtr options(cJSON_CreateObject());
        if (radix == "uuid") {
            cJSON_AddStringToObject(options.get(), "type", "uuid");
        } else {
            cJSON_AddStringToObject(options.get(), "type", "increment");
            cJSON_AddNumberToObject(options.get(), "radix", std::stoi(radix));
        }

        keystone::id::Table table;
        table.name = table_name;
        table.id = keystone::id::IdentifierConfig::compile(table_name, options.get());

        keystone::infra::Logger::log(keystone::infra::LogLevel::INFO,
                                     "Config: Persistence Path set to '" + data_path + "'");

        keystone::storage::Db db(data_path);
        keystone::infra::Scheduler scheduler(1);
        keystone::id::Assigner assigner(db, scheduler);

        keystone::infra::JsonPtr records(cJSON_CreateArray());
        for (int i = 0; i < count; ++i) {
            cJSON* record = cJSON_CreateObject();
            cJSON_AddNumberToObject(record, "seq", i);
            cJSON_AddItemToArray(records.get(), record);
        }

        keystone::infra::JsonPtr assigned = assigner.assign(table, records.get()).get();

        const cJSON* record = nullptr;
        cJSON_ArrayForEach(record, assigned.get())
        {
            const cJSON* id = cJSON_GetObjectItemCaseSensitive(record, table.primary.c_str());
            if (cJSON_IsString(id) && id->valuestring != nullptr) {
                std::cout << id->valuestring << "\n";
            }
        }
        std::cout.flush();

    } catch (const keystone::id::IdError& e) {
        keystone::infra::Logger::log(keystone::infra::LogLevel::FATAL,
                                     std::string("System: ") + keystone::id::to_string(e.code()) +
                                         ": " + e.what());
        // EX_TEMPFAIL: running again may succeed.
        return e.retryable() ? 75 : 1;
    } catch (const std::exception& e) {
        keystone::infra::Logger::log(keystone::infra::LogLevel::FATAL,
                                     "System: Critical Failure: " + std::string(e.what()));
        return 1;
    }

    return 0;
}
