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
 * @file json.cpp
 * @brief Implementation of the cJSON ownership and inspection helpers.
 */

#include "keystone/infra/json.hpp"

#include <cmath>

namespace keystone::infra {

JsonPtr Json::parse(const std::string& text)
{
    return JsonPtr(cJSON_Parse(text.c_str()));
}

std::string Json::print(const cJSON* node)
{
    if (!node) {
        return "";
    }

    char* raw = cJSON_PrintUnformatted(node);
    if (!raw) {
        return "";
    }

    std::string out(raw);
    cJSON_free(raw);
    return out;
}

bool Json::as_integer(const cJSON* node, std::int64_t& out)
{
    if (!cJSON_IsNumber(node)) {
        return false;
    }

    double value = node->valuedouble;
    if (!std::isfinite(value) || std::floor(value) != value) {
        return false;
    }
    if (std::fabs(value) > static_cast<double>(kMaxSafeInteger)) {
        return false;
    }

    out = static_cast<std::int64_t>(value);
    return true;
}

/**
 * @details
 * cJSON reference containers point at the first child of the referenced container and
 * carry `cJSON_IsReference`, which `cJSON_Delete` honours by not descending into them.
 */
JsonPtr Json::view(const cJSON* node)
{
    if (!node) {
        return nullptr;
    }

    if (cJSON_IsObject(node)) {
        return JsonPtr(cJSON_CreateObjectReference(node->child));
    }
    if (cJSON_IsArray(node)) {
        return JsonPtr(cJSON_CreateArrayReference(node->child));
    }

    // Scalars: wrap in a one-element array reference and detach the reference copy.
    JsonPtr holder(cJSON_CreateArray());
    if (!holder) {
        return nullptr;
    }
    cJSON_AddItemReferenceToArray(holder.get(), const_cast<cJSON*>(node));
    return JsonPtr(cJSON_DetachItemFromArray(holder.get(), 0));
}

JsonPtr Json::shallow_copy(const cJSON* object)
{
    if (!cJSON_IsObject(object)) {
        return nullptr;
    }

    JsonPtr copy(cJSON_CreateObject());
    if (!copy) {
        return nullptr;
    }

    const cJSON* member = nullptr;
    cJSON_ArrayForEach(member, object)
    {
        cJSON_AddItemReferenceToObject(copy.get(), member->string, const_cast<cJSON*>(member));
    }
    return copy;
}

} // namespace keystone::infra
