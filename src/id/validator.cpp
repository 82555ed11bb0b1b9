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
 * @file validator.cpp
 * @brief Implementation of identifier normalization.
 */

#include "keystone/id/validator.hpp"

#include "keystone/id/error.hpp"

#include <string>

namespace keystone::id {

namespace {

// UTF-8 continuation bytes (10xxxxxx) do not start a code point.
std::size_t code_points(const char* text)
{
    std::size_t n = 0;
    for (const char* p = text; *p != '\0'; ++p) {
        if ((static_cast<unsigned char>(*p) & 0xC0) != 0x80) {
            ++n;
        }
    }
    return n;
}

} // namespace

/**
 * @brief Validates a single element and returns the node that is the identifier.
 *
 * The returned pointer aliases `value` (or its `id` member); callers copy it.
 */
const cJSON* Validator::validate(const cJSON* value)
{
    // Arrays nested inside a batch are containers without an `id` member.
    if (cJSON_IsObject(value) || cJSON_IsArray(value)) {
        const cJSON* id = cJSON_GetObjectItemCaseSensitive(value, "id");
        if (id == nullptr) {
            throw IdError(ErrorCode::MISSING_OBJECT_ID, "Invalid object id");
        }
        value = id;
    }

    if (value == nullptr || cJSON_IsNull(value)) {
        throw IdError(ErrorCode::NULL_OR_UNDEFINED_ID, "Invalid null or undefined id");
    }

    if (cJSON_IsString(value) && value->valuestring != nullptr &&
        code_points(value->valuestring) > kMaxIdLength) {
        throw IdError(ErrorCode::IDENTIFIER_TOO_LONG,
                      std::string("Invalid id length: ") + value->valuestring);
    }

    return value;
}

infra::JsonPtr Validator::normalize(const cJSON* input, bool allow_batch)
{
    if (!cJSON_IsArray(input)) {
        return infra::JsonPtr(cJSON_Duplicate(validate(input), 1));
    }

    if (!allow_batch) {
        throw IdError(ErrorCode::UNSUPPORTED_BATCH, "Array of ids not supported");
    }

    if (cJSON_GetArraySize(input) == 0) {
        throw IdError(ErrorCode::EMPTY_BATCH, "Empty array of ids not supported");
    }

    infra::JsonPtr normalized(cJSON_CreateArray());
    const cJSON* element = nullptr;
    cJSON_ArrayForEach(element, input)
    {
        cJSON_AddItemToArray(normalized.get(), cJSON_Duplicate(validate(element), 1));
    }
    return normalized;
}

} // namespace keystone::id
