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
 * @file identifier_config.cpp
 * @brief Compilation of identifier options into `IdentifierConfig`.
 */

#include "keystone/id/identifier_config.hpp"

#include "keystone/id/radix.hpp"
#include "keystone/infra/json.hpp"
#include "keystone/infra/logger.hpp"
#include "keystone/infra/string.hpp"

#include <stdexcept>

namespace keystone::id {

namespace {

std::string string_option(const cJSON* options, const char* name, const std::string& fallback)
{
    const cJSON* node = cJSON_GetObjectItemCaseSensitive(options, name);
    if (node == nullptr || cJSON_IsNull(node)) {
        return fallback;
    }
    if (!cJSON_IsString(node) || node->valuestring == nullptr || node->valuestring[0] == '\0') {
        throw std::invalid_argument(std::string("Config: option '") + name +
                                    "' must be a non-empty string");
    }
    return node->valuestring;
}

std::int64_t integer_option(const cJSON* options, const char* name, std::int64_t fallback)
{
    const cJSON* node = cJSON_GetObjectItemCaseSensitive(options, name);
    if (node == nullptr || cJSON_IsNull(node)) {
        return fallback;
    }

    std::int64_t value = 0;
    if (!infra::Json::as_integer(node, value)) {
        throw std::invalid_argument(std::string("Config: option '") + name +
                                    "' must be an integer");
    }
    return value;
}

} // namespace

std::shared_ptr<IdentifierConfig> IdentifierConfig::compile(const std::string& table_name,
                                                            const cJSON* options)
{
    if (options == nullptr) {
        return nullptr;
    }
    if (!cJSON_IsObject(options)) {
        throw std::invalid_argument("Config: identifier options for " + table_name +
                                    " must be an object");
    }

    std::string type = infra::String::to_lower(infra::String::trim(string_option(options, "type", "")));
    auto config = std::make_shared<IdentifierConfig>();

    if (type == "uuid") {
        config->strategy = Strategy::RANDOM;
        config->verified.store(true);
        infra::Logger::log(infra::LogLevel::DEBUG, "Config: " + table_name + " uses uuid ids");
        return config;
    }

    if (type != "increment") {
        throw std::invalid_argument("Config: unknown identifier type '" + type + "' for " +
                                    table_name);
    }

    config->strategy = Strategy::COUNTER;
    config->verified.store(false);
    config->counter_table = string_option(options, "table", kDefaultCounterTable);
    config->record_key = string_option(options, "record", table_name);
    config->field_name = string_option(options, "key", kDefaultField);
    config->initial_value = integer_option(options, "initial", kDefaultInitial);

    std::int64_t radix = integer_option(options, "radix", kDefaultRadix);
    if (radix < Radix::kMinRadix || radix > Radix::kMaxRadix) {
        throw std::invalid_argument("Config: radix " + std::to_string(radix) + " for " +
                                    table_name + " outside 2-62");
    }
    config->radix = static_cast<int>(radix);

    // Counter values are rendered unsigned.
    if (config->initial_value < 0) {
        throw std::invalid_argument("Config: negative initial value for " + table_name);
    }
    if (config->record_key.empty()) {
        throw std::invalid_argument("Config: empty counter record key for " + table_name);
    }

    infra::Logger::log(infra::LogLevel::DEBUG,
                       "Config: " + table_name + " uses increment ids from " +
                           config->counter_table + "/" + config->record_key + "." +
                           config->field_name + " (radix " + std::to_string(config->radix) + ")");
    return config;
}

} // namespace keystone::id
