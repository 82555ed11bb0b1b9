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
 * @file assigner_test.cpp
 * @brief Tests for option compilation and the identifier assignment pipeline.
 */

#include "faulty_store.hpp"
#include "framework.hpp"
#include "temp_dir.hpp"

#include "keystone/id/assigner.hpp"
#include "keystone/id/error.hpp"
#include "keystone/id/identifier_config.hpp"
#include "keystone/infra/json.hpp"
#include "keystone/infra/scheduler.hpp"
#include "keystone/storage/db.hpp"

#include <future>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

using keystone::id::Assigner;
using keystone::id::ErrorCode;
using keystone::id::IdentifierConfig;
using keystone::id::Strategy;
using keystone::id::Table;
using keystone::infra::Json;
using keystone::infra::JsonPtr;
using keystone::infra::Scheduler;
using keystone::storage::Db;
using keystone::test::FaultyStore;
using keystone::test::TempDir;

namespace {

const std::string kAssignDir = "./test_data_assign";

Table make_table(const std::string& options)
{
    Table table;
    table.name = "orders";
    if (!options.empty()) {
        JsonPtr parsed = Json::parse(options);
        table.id = IdentifierConfig::compile(table.name, parsed.get());
    }
    return table;
}

bool compile_rejects(const std::string& options)
{
    JsonPtr parsed = Json::parse(options);
    try {
        IdentifierConfig::compile("orders", parsed.get());
    } catch (const std::invalid_argument&) {
        return true;
    }
    return false;
}

} // namespace

void test_compile_defaults()
{
    ASSERT_TRUE(IdentifierConfig::compile("orders", nullptr) == nullptr);

    JsonPtr uuid = Json::parse(R"({"type":"uuid"})");
    auto random = IdentifierConfig::compile("orders", uuid.get());
    ASSERT_TRUE(random->strategy == Strategy::RANDOM);
    ASSERT_TRUE(random->verified.load());

    JsonPtr increment = Json::parse(R"({"type":" Increment "})");
    auto counter = IdentifierConfig::compile("orders", increment.get());
    ASSERT_TRUE(counter->strategy == Strategy::COUNTER);
    ASSERT_FALSE(counter->verified.load());
    ASSERT_EQ(counter->counter_table, std::string("_counters"));
    ASSERT_EQ(counter->record_key, std::string("orders"));
    ASSERT_EQ(counter->field_name, std::string("value"));
    ASSERT_EQ(counter->initial_value, static_cast<std::int64_t>(1));
    ASSERT_EQ(counter->radix, 10);
}

void test_compile_rejects_bad_options()
{
    ASSERT_TRUE(compile_rejects(R"({"type":"serial"})"));
    ASSERT_TRUE(compile_rejects(R"({})"));
    ASSERT_TRUE(compile_rejects(R"({"type":"increment","radix":1})"));
    ASSERT_TRUE(compile_rejects(R"({"type":"increment","radix":63})"));
    ASSERT_TRUE(compile_rejects(R"({"type":"increment","initial":-1})"));
    ASSERT_TRUE(compile_rejects(R"({"type":"increment","initial":1.5})"));
    ASSERT_TRUE(compile_rejects(R"({"type":"increment","table":""})"));
    ASSERT_TRUE(compile_rejects(R"(["increment"])"));
    ASSERT_FALSE(compile_rejects(R"({"type":"increment","radix":62,"initial":0})"));
}

/**
 * @brief Without configuration the input comes back untouched and nothing is stored.
 */
void test_assign_passthrough()
{
    TempDir dir(kAssignDir);
    Db db(dir.path());
    FaultyStore store(db);
    Scheduler scheduler(2);
    Assigner assigner(store, scheduler);
    Table plain = make_table("");

    JsonPtr records = Json::parse(R"([{"name":"a"},{"name":"b"}])");
    JsonPtr out = assigner.assign(plain, records.get()).get();

    ASSERT_TRUE(out->child == records->child);
    ASSERT_TRUE((out->type & cJSON_IsReference) != 0);
    ASSERT_EQ(Json::print(out.get()), std::string(R"([{"name":"a"},{"name":"b"}])"));
    ASSERT_EQ(store.total_calls(), static_cast<size_t>(0));

    // Releasing the result leaves the caller's records intact.
    out.reset();
    ASSERT_EQ(Json::print(records.get()), std::string(R"([{"name":"a"},{"name":"b"}])"));

    JsonPtr single = Json::parse(R"({"name":"c"})");
    JsonPtr same = assigner.assign(plain, single.get()).get();
    ASSERT_TRUE(same->child == single->child);
}

void test_assign_single_record_uuid()
{
    TempDir dir(kAssignDir);
    Db db(dir.path());
    FaultyStore store(db);
    Scheduler scheduler(2);
    Assigner assigner(store, scheduler);
    Table table = make_table(R"({"type":"uuid"})");

    JsonPtr record = Json::parse(R"({"name":"a"})");
    JsonPtr out = assigner.assign(table, record.get()).get();

    const cJSON* id = cJSON_GetObjectItemCaseSensitive(out.get(), "id");
    ASSERT_TRUE(cJSON_IsString(id));
    ASSERT_EQ(std::string(id->valuestring).length(), static_cast<size_t>(36));
    ASSERT_EQ(std::string(id->valuestring)[14], '4');

    // The caller's record is not modified.
    ASSERT_FALSE(cJSON_HasObjectItem(record.get(), "id"));
    ASSERT_EQ(store.total_calls(), static_cast<size_t>(0));
}

void test_assign_single_record_with_key()
{
    TempDir dir(kAssignDir);
    Db db(dir.path());
    FaultyStore store(db);
    Scheduler scheduler(1);
    Assigner assigner(store, scheduler);
    Table table = make_table(R"({"type":"increment"})");

    JsonPtr record = Json::parse(R"({"id":"given","name":"a"})");
    JsonPtr out = assigner.assign(table, record.get()).get();

    ASSERT_EQ(Json::print(out.get()), std::string(R"({"id":"given","name":"a"})"));
    ASSERT_EQ(store.total_calls(), static_cast<size_t>(0));
}

/**
 * @brief Mixed batch: identifiers go to the records without a key, in input order.
 */
void test_assign_mixed_batch_counter()
{
    TempDir dir(kAssignDir);
    Db db(dir.path());
    Scheduler scheduler(2);
    Assigner assigner(db, scheduler);
    Table table = make_table(R"({"type":"increment"})");

    const std::string input = R"([{"name":"a"},{"id":"x","name":"b"},{"name":"c"}])";
    JsonPtr records = Json::parse(input);
    JsonPtr out = assigner.assign(table, records.get()).get();

    ASSERT_EQ(Json::print(out.get()),
              std::string(
                  R"([{"name":"a","id":"1"},{"id":"x","name":"b"},{"name":"c","id":"2"}])"));
    ASSERT_EQ(Json::print(records.get()), input);
}

void test_assign_custom_primary_key()
{
    TempDir dir(kAssignDir);
    Db db(dir.path());
    Scheduler scheduler(1);
    Assigner assigner(db, scheduler);
    Table table = make_table(R"({"type":"increment","initial":100,"radix":16})");
    table.primary = "sku";

    JsonPtr records = Json::parse(R"([{"id":"ignored"},{"sku":"s-1"}])");
    JsonPtr out = assigner.assign(table, records.get()).get();

    ASSERT_EQ(Json::print(out.get()),
              std::string(R"([{"id":"ignored","sku":"64"},{"sku":"s-1"}])"));
}

void test_assign_keyed_batch_no_store_calls()
{
    TempDir dir(kAssignDir);
    Db db(dir.path());
    FaultyStore store(db);
    Scheduler scheduler(2);
    Assigner assigner(store, scheduler);
    Table table = make_table(R"({"type":"increment"})");

    JsonPtr records = Json::parse(R"([{"id":"a"},{"id":"b"}])");
    JsonPtr out = assigner.assign(table, records.get()).get();

    ASSERT_TRUE(out->child == records->child);
    ASSERT_EQ(store.total_calls(), static_cast<size_t>(0));
    ASSERT_FALSE(table.id->verified.load());
}

/**
 * @brief A failed allocation fails the whole batch; the input stays untouched.
 */
void test_assign_batch_failure_is_atomic()
{
    TempDir dir(kAssignDir);
    Db db(dir.path());
    FaultyStore store(db);
    Scheduler scheduler(1);
    Assigner assigner(store, scheduler);
    Table table = make_table(R"({"type":"increment"})");

    // The first record is served by verification, the second needs an increment.
    store.fail_increment = true;
    const std::string input = R"([{"name":"a"},{"name":"b"}])";
    JsonPtr records = Json::parse(input);

    std::future<JsonPtr> pending = assigner.assign(table, records.get());
    ASSERT_THROWS_CODE(pending.get(), ErrorCode::INCREMENT_FAILED);
    ASSERT_EQ(Json::print(records.get()), input);

    store.fail_increment = false;
    JsonPtr out = assigner.assign(table, records.get()).get();
    ASSERT_EQ(Json::print(out.get()), std::string(R"([{"name":"a","id":"2"},{"name":"b","id":"3"}])"));
}

void test_assign_rejects_non_object()
{
    TempDir dir(kAssignDir);
    Db db(dir.path());
    Scheduler scheduler(1);
    Assigner assigner(db, scheduler);
    Table table = make_table(R"({"type":"uuid"})");

    JsonPtr records = Json::parse(R"([{"name":"a"}, 7])");
    bool rejected = false;
    try {
        assigner.assign(table, records.get()).get();
    } catch (const std::invalid_argument&) {
        rejected = true;
    }
    ASSERT_TRUE(rejected);
}

/**
 * @brief After eager verification, concurrent assignments draw distinct values.
 */
void test_assign_concurrent_after_verify()
{
    TempDir dir(kAssignDir);
    Db db(dir.path());
    Scheduler scheduler(4);
    Assigner assigner(db, scheduler);
    Table table = make_table(R"({"type":"increment","radix":36})");

    assigner.verify(table).get();
    ASSERT_TRUE(table.id->verified.load());

    std::vector<JsonPtr> inputs;
    std::vector<std::future<JsonPtr>> futures;
    for (int i = 0; i < 50; ++i) {
        inputs.push_back(Json::parse(R"({"name":"n"})"));
        futures.push_back(assigner.assign(table, inputs.back().get()));
    }

    std::set<std::string> ids;
    for (auto& f : futures) {
        JsonPtr out = f.get();
        ids.insert(cJSON_GetObjectItemCaseSensitive(out.get(), "id")->valuestring);
    }
    ASSERT_EQ(ids.size(), static_cast<size_t>(50));
    ASSERT_TRUE(ids.count("1e") == 1); // 50 in base 36
}

void test_verify_random_is_noop()
{
    TempDir dir(kAssignDir);
    Db db(dir.path());
    FaultyStore store(db);
    Scheduler scheduler(1);
    Assigner assigner(store, scheduler);

    assigner.verify(make_table(R"({"type":"uuid"})")).get();
    assigner.verify(make_table("")).get();
    ASSERT_EQ(store.total_calls(), static_cast<size_t>(0));
}

void test_allocate_requires_config()
{
    TempDir dir(kAssignDir);
    Db db(dir.path());
    Scheduler scheduler(1);
    Assigner assigner(db, scheduler);

    bool rejected = false;
    try {
        assigner.allocate(make_table(""));
    } catch (const std::invalid_argument&) {
        rejected = true;
    }
    ASSERT_TRUE(rejected);

    JsonPtr id = assigner.allocate(make_table(R"({"type":"increment","initial":7})"));
    ASSERT_EQ(std::string(id->valuestring), std::string("7"));
}

/**
 * @brief Faults switched on and off while assignments run on workers: every future
 * either yields a fresh identifier or reports the increment failure, never a duplicate.
 */
void test_assign_faults_toggled_concurrently()
{
    TempDir dir(kAssignDir);
    Db db(dir.path());
    FaultyStore store(db);
    Scheduler scheduler(4);
    Assigner assigner(store, scheduler);
    Table table = make_table(R"({"type":"increment"})");
    assigner.verify(table).get();

    std::vector<JsonPtr> inputs;
    std::vector<std::future<JsonPtr>> futures;
    for (int i = 0; i < 100; ++i) {
        store.fail_increment = (i % 3 == 0);
        inputs.push_back(Json::parse(R"({"name":"n"})"));
        futures.push_back(assigner.assign(table, inputs.back().get()));
    }
    store.fail_increment = false;

    std::set<std::string> ids;
    int failures = 0;
    for (auto& f : futures) {
        try {
            JsonPtr out = f.get();
            ids.insert(cJSON_GetObjectItemCaseSensitive(out.get(), "id")->valuestring);
        } catch (const keystone::id::IdError& e) {
            ASSERT_TRUE(e.code() == ErrorCode::INCREMENT_FAILED);
            ++failures;
        }
    }
    ASSERT_EQ(ids.size() + static_cast<size_t>(failures), static_cast<size_t>(100));
    ASSERT_EQ(store.call_count("increment_field"), static_cast<size_t>(100));
    ASSERT_EQ(store.last_options().purge, false);
}
