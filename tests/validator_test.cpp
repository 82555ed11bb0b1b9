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
 * @file validator_test.cpp
 * @brief Unit tests for identifier normalization.
 */

#include "framework.hpp"
#include "keystone/id/error.hpp"
#include "keystone/id/validator.hpp"
#include "keystone/infra/json.hpp"

#include <cJSON.h>
#include <string>

using keystone::id::ErrorCode;
using keystone::id::Validator;
using keystone::infra::Json;
using keystone::infra::JsonPtr;

void test_normalize_string_passthrough()
{
    JsonPtr in(cJSON_CreateString("customer-17"));
    JsonPtr out = Validator::normalize(in.get());
    ASSERT_TRUE(cJSON_IsString(out.get()));
    ASSERT_EQ(std::string(out->valuestring), std::string("customer-17"));
}

/**
 * @brief 127 characters is the limit; one more is rejected.
 */
void test_normalize_length_boundary()
{
    std::string at_limit(127, 'a');
    JsonPtr ok(cJSON_CreateString(at_limit.c_str()));
    JsonPtr out = Validator::normalize(ok.get());
    ASSERT_EQ(std::string(out->valuestring), at_limit);

    std::string over(128, 'a');
    JsonPtr too_long(cJSON_CreateString(over.c_str()));
    ASSERT_THROWS_CODE(Validator::normalize(too_long.get()), ErrorCode::IDENTIFIER_TOO_LONG);
}

/**
 * @brief Length counts characters, not UTF-8 bytes.
 */
void test_normalize_length_counts_code_points()
{
    std::string wide;
    for (int i = 0; i < 127; ++i) {
        wide += "\xC3\xA9"; // U+00E9, two bytes each
    }
    JsonPtr in(cJSON_CreateString(wide.c_str()));
    JsonPtr out = Validator::normalize(in.get());
    ASSERT_EQ(std::string(out->valuestring), wide);
}

void test_normalize_number_not_coerced()
{
    JsonPtr in(cJSON_CreateNumber(5));
    JsonPtr out = Validator::normalize(in.get());
    ASSERT_TRUE(cJSON_IsNumber(out.get()));
    ASSERT_EQ(out->valuedouble, 5.0);
}

void test_normalize_object_extracts_id()
{
    JsonPtr in = Json::parse(R"({"id": 5, "name": "x"})");
    JsonPtr out = Validator::normalize(in.get());
    ASSERT_TRUE(cJSON_IsNumber(out.get()));
    ASSERT_EQ(out->valuedouble, 5.0);
}

void test_normalize_object_without_id()
{
    JsonPtr in = Json::parse("{}");
    ASSERT_THROWS_CODE(Validator::normalize(in.get()), ErrorCode::MISSING_OBJECT_ID);
}

void test_normalize_null_and_undefined()
{
    JsonPtr null_value(cJSON_CreateNull());
    ASSERT_THROWS_CODE(Validator::normalize(null_value.get()), ErrorCode::NULL_OR_UNDEFINED_ID);
    ASSERT_THROWS_CODE(Validator::normalize(nullptr), ErrorCode::NULL_OR_UNDEFINED_ID);

    JsonPtr null_member = Json::parse(R"({"id": null})");
    ASSERT_THROWS_CODE(Validator::normalize(null_member.get()), ErrorCode::NULL_OR_UNDEFINED_ID);
}

void test_normalize_batch_disallowed()
{
    JsonPtr in = Json::parse("[1,2,3]");
    ASSERT_THROWS_CODE(Validator::normalize(in.get(), false), ErrorCode::UNSUPPORTED_BATCH);
}

void test_normalize_batch_allowed()
{
    JsonPtr in = Json::parse("[1,2,3]");
    JsonPtr out = Validator::normalize(in.get(), true);
    ASSERT_EQ(Json::print(out.get()), std::string("[1,2,3]"));
}

void test_normalize_batch_mixed_forms()
{
    JsonPtr in = Json::parse(R"([{"id":"a"}, "b", 3])");
    JsonPtr out = Validator::normalize(in.get(), true);
    ASSERT_EQ(Json::print(out.get()), std::string(R"(["a","b",3])"));
}

void test_normalize_empty_batch()
{
    JsonPtr in = Json::parse("[]");
    ASSERT_THROWS_CODE(Validator::normalize(in.get(), true), ErrorCode::EMPTY_BATCH);
}

/**
 * @brief A batch fails on its first invalid element, whatever follows.
 */
void test_normalize_batch_short_circuits()
{
    std::string over(128, 'z');
    JsonPtr in(cJSON_CreateArray());
    cJSON_AddItemToArray(in.get(), cJSON_CreateString("ok"));
    cJSON_AddItemToArray(in.get(), cJSON_CreateObject());
    cJSON_AddItemToArray(in.get(), cJSON_CreateString(over.c_str()));

    ASSERT_THROWS_CODE(Validator::normalize(in.get(), true), ErrorCode::MISSING_OBJECT_ID);
}

void test_validation_errors_not_retryable()
{
    try {
        Validator::normalize(nullptr);
    } catch (const keystone::id::IdError& e) {
        ASSERT_TRUE(e.category() == keystone::id::ErrorCategory::VALIDATION);
        ASSERT_FALSE(e.retryable());
        return;
    }
    ASSERT_TRUE(false);
}
