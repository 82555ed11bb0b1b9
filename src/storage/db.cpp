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
 * @file db.cpp
 * @brief Implementation of the durable keyed-record store.
 *
 * @details
 * Every mutation follows the same sequence: build the new snapshot beside the live
 * record, append it to the table log, and only then swap it into memory. A failed
 * append therefore leaves both disk and memory at the previous state. It also marks the
 * table damaged: the engine's rollback of the partial frame can itself fail, so the log
 * is rewritten from memory before anything else is appended to it.
 */

#include "keystone/storage/db.hpp"

#include "keystone/infra/logger.hpp"

#include <mutex>
#include <vector>

namespace keystone::storage {

namespace {

/// Auto-compaction threshold: replay found more than this many frames...
constexpr std::size_t kCompactionMinFrames = 100;
/// ...and more than this many frames per live record.
constexpr std::size_t kCompactionRatio = 2;

bool valid_table_name(const std::string& name)
{
    return !name.empty() && name.find('/') == std::string::npos &&
           name.find('\\') == std::string::npos && name != "." && name != "..";
}

const char* record_key(const cJSON* record)
{
    const cJSON* id = cJSON_GetObjectItemCaseSensitive(record, "id");
    if (cJSON_IsString(id) && id->valuestring != nullptr) {
        return id->valuestring;
    }
    return nullptr;
}

} // namespace

/**
 * @brief Constructs the store and performs crash recovery.
 *
 * **Startup Sequence:**
 * 1. Creates the data directory if needed.
 * 2. Replays every table log (`load_all`).
 */
Db::Db(std::string data_dir) : storage_(std::move(data_dir))
{
    infra::Logger::log(infra::LogLevel::INFO, "Core: Initializing Keystone record store...");
    storage_.init();
    load_all();
    infra::Logger::log(infra::LogLevel::INFO,
                       "Core: Store online with " + std::to_string(tables_.size()) + " table(s).");
}

Db::~Db()
{
    infra::Logger::log(infra::LogLevel::DEBUG, "Core: Closing record store.");
}

/**
 * @brief Restores state by replaying the Append-Only Logs.
 *
 * **Replay Strategy:**
 * - Each frame is a full record snapshot; a later snapshot of a key replaces the earlier.
 * - Frames that fail to parse or carry no string `id` are skipped and reported.
 * - Counter records accumulate one frame per increment, so a log dominated by superseded
 *   snapshots is compacted right after replay.
 * - A log ending in a torn frame is rewritten before anything is appended to it.
 */
void Db::load_all()
{
    infra::Logger::log(infra::LogLevel::DEBUG, "Core: Replaying table logs...");

    for (const auto& name : storage_.list_tables()) {
        bool torn = false;
        std::vector<std::string> logs = storage_.load_log(name, torn);
        Table& table = tables_[name];

        for (const auto& frame : logs) {
            infra::JsonPtr doc = infra::Json::parse(frame);
            if (!doc) {
                infra::Logger::log(infra::LogLevel::ERROR,
                                   "Core: Detected corrupt frame in " + name + ". Skipping.");
                continue;
            }

            const char* key = record_key(doc.get());
            if (!key) {
                infra::Logger::log(infra::LogLevel::ERROR,
                                   "Core: Frame without record id in " + name + ". Skipping.");
                continue;
            }
            std::string k(key);
            table[k] = std::move(doc);
        }

        infra::Logger::log(infra::LogLevel::TRACE, "Core: Loaded " + std::to_string(table.size()) +
                                                       " record(s) into " + name);

        if (torn) {
            infra::Logger::log(infra::LogLevel::WARN, "Maintenance: Rewriting torn log of " + name);
            if (!compact_table(name)) {
                damaged_.insert(name);
            }
        } else if (logs.size() > kCompactionMinFrames &&
                   logs.size() > table.size() * kCompactionRatio) {
            infra::Logger::log(infra::LogLevel::INFO, "Maintenance: Auto-compacting " + name);
            compact_table(name);
        }
    }
}

bool Db::persist(const std::string& table, const cJSON* record)
{
    std::string raw = infra::Json::print(record);
    if (raw.empty()) {
        infra::Logger::log(infra::LogLevel::ERROR, "Core: Failed to serialize record for " + table);
        return false;
    }

    if (damaged_.count(table)) {
        // Memory still holds the last committed state; rewrite the log from it.
        if (!compact_table(table)) {
            return false;
        }
        damaged_.erase(table);
    }

    if (!storage_.append(table, raw)) {
        infra::Logger::log(infra::LogLevel::ERROR, "Core: Log append failed for " + table);
        damaged_.insert(table);
        return false;
    }
    return true;
}

bool Db::compact_table(const std::string& table)
{
    auto it = tables_.find(table);
    if (it == tables_.end()) {
        return false;
    }

    std::vector<std::string> active_docs;
    active_docs.reserve(it->second.size());
    for (const auto& [key, doc] : it->second) {
        active_docs.push_back(infra::Json::print(doc.get()));
    }

    bool ok = storage_.compact(table, active_docs);
    if (ok)
        infra::Logger::log(infra::LogLevel::DEBUG, "Maintenance: Compaction complete for " + table);
    else
        infra::Logger::log(infra::LogLevel::ERROR, "Maintenance: Compaction failed for " + table);
    return ok;
}

bool Db::provision_table(const std::string& table, const TableOptions& options)
{
    if (!valid_table_name(table)) {
        infra::Logger::log(infra::LogLevel::ERROR, "Core: Invalid table name '" + table + "'");
        return false;
    }

    std::unique_lock lock(rw_lock_);

    if (options.secondary) {
        infra::Logger::log(infra::LogLevel::DEBUG,
                           "Core: Secondary indexes are not maintained; ignoring for " + table);
    }

    auto it = tables_.find(table);
    if (it != tables_.end()) {
        if (!options.purge) {
            return true;
        }

        // Rewrite the log first so a failed purge leaves the records in place.
        if (!storage_.compact(table, {})) {
            infra::Logger::log(infra::LogLevel::ERROR, "Core: Failed to purge table " + table);
            return false;
        }
        it->second.clear();
        damaged_.erase(table);
        infra::Logger::log(infra::LogLevel::INFO, "Core: Purged table " + table);
        return true;
    }

    if (!storage_.create(table)) {
        infra::Logger::log(infra::LogLevel::ERROR, "Core: Failed to create log for " + table);
        return false;
    }
    tables_[table];
    infra::Logger::log(infra::LogLevel::INFO, "Core: Provisioned table " + table);
    return true;
}

bool Db::get_record(const std::string& table, const std::string& key, infra::JsonPtr& out)
{
    std::shared_lock lock(rw_lock_);

    auto t = tables_.find(table);
    if (t == tables_.end()) {
        infra::Logger::log(infra::LogLevel::ERROR, "Core: Read from unknown table " + table);
        return false;
    }

    auto r = t->second.find(key);
    if (r == t->second.end()) {
        out.reset();
        return true;
    }

    out.reset(cJSON_Duplicate(r->second.get(), 1));
    return out != nullptr;
}

bool Db::insert_record(const std::string& table, const cJSON* record)
{
    const char* key = record_key(record);
    if (!cJSON_IsObject(record) || !key) {
        infra::Logger::log(infra::LogLevel::ERROR,
                           "Core: Insert into " + table + " rejected: record has no string id");
        return false;
    }

    std::unique_lock lock(rw_lock_);

    auto t = tables_.find(table);
    if (t == tables_.end()) {
        infra::Logger::log(infra::LogLevel::ERROR, "Core: Insert into unknown table " + table);
        return false;
    }

    if (t->second.count(key)) {
        infra::Logger::log(infra::LogLevel::WARN, "Core: Insert into " + table +
                                                      " rejected: duplicate id " + key);
        return false;
    }

    infra::JsonPtr doc(cJSON_Duplicate(record, 1));
    if (!doc || !persist(table, doc.get())) {
        return false;
    }

    std::string k(key);
    t->second.emplace(k, std::move(doc));
    infra::Logger::log(infra::LogLevel::TRACE, "CRUD: Inserted " + k + " -> " + table);
    return true;
}

bool Db::update_record(const std::string& table, const std::string& key, const cJSON* changes)
{
    if (!cJSON_IsObject(changes)) {
        return false;
    }

    std::unique_lock lock(rw_lock_);

    auto t = tables_.find(table);
    if (t == tables_.end()) {
        infra::Logger::log(infra::LogLevel::ERROR, "Core: Update on unknown table " + table);
        return false;
    }

    auto r = t->second.find(key);
    if (r == t->second.end()) {
        infra::Logger::log(infra::LogLevel::ERROR,
                           "Core: Update on missing record " + key + " in " + table);
        return false;
    }

    infra::JsonPtr next(cJSON_Duplicate(r->second.get(), 1));
    if (!next) {
        return false;
    }

    const cJSON* change = nullptr;
    cJSON_ArrayForEach(change, changes)
    {
        // The key is immutable.
        if (std::string(change->string) == "id") {
            continue;
        }

        cJSON* value = cJSON_Duplicate(change, 1);
        if (!value) {
            return false;
        }
        if (cJSON_HasObjectItem(next.get(), change->string)) {
            cJSON_ReplaceItemInObjectCaseSensitive(next.get(), change->string, value);
        } else {
            cJSON_AddItemToObject(next.get(), change->string, value);
        }
    }

    if (!persist(table, next.get())) {
        return false;
    }
    r->second = std::move(next);
    infra::Logger::log(infra::LogLevel::TRACE, "CRUD: Updated " + key + " -> " + table);
    return true;
}

/**
 * @brief Read-modify-write of one numeric field under the writer lock.
 *
 * A missing field counts as 0. A present, non-integer field fails the call.
 */
bool Db::increment_field(const std::string& table, const std::string& key,
                         const std::string& field, std::int64_t delta, std::int64_t& new_value)
{
    std::unique_lock lock(rw_lock_);

    auto t = tables_.find(table);
    if (t == tables_.end()) {
        infra::Logger::log(infra::LogLevel::ERROR, "Core: Increment on unknown table " + table);
        return false;
    }

    auto r = t->second.find(key);
    if (r == t->second.end()) {
        infra::Logger::log(infra::LogLevel::ERROR,
                           "Core: Increment on missing record " + key + " in " + table);
        return false;
    }

    std::int64_t current = 0;
    const cJSON* node = cJSON_GetObjectItemCaseSensitive(r->second.get(), field.c_str());
    if (node && !infra::Json::as_integer(node, current)) {
        infra::Logger::log(infra::LogLevel::ERROR, "Core: Increment on non-integer field " +
                                                       field + " of " + key + " in " + table);
        return false;
    }

    std::int64_t result = current + delta;
    if (result > infra::Json::kMaxSafeInteger || result < -infra::Json::kMaxSafeInteger) {
        infra::Logger::log(infra::LogLevel::ERROR,
                           "Core: Increment overflow on " + field + " of " + key + " in " + table);
        return false;
    }

    infra::JsonPtr next(cJSON_Duplicate(r->second.get(), 1));
    if (!next) {
        return false;
    }
    cJSON* number = cJSON_CreateNumber(static_cast<double>(result));
    if (!number) {
        return false;
    }
    if (node) {
        cJSON_ReplaceItemInObjectCaseSensitive(next.get(), field.c_str(), number);
    } else {
        cJSON_AddItemToObject(next.get(), field.c_str(), number);
    }

    if (!persist(table, next.get())) {
        return false;
    }
    r->second = std::move(next);
    new_value = result;
    return true;
}

bool Db::has_table(const std::string& table) const
{
    std::shared_lock lock(rw_lock_);
    return tables_.count(table) > 0;
}

std::size_t Db::count(const std::string& table) const
{
    std::shared_lock lock(rw_lock_);
    auto t = tables_.find(table);
    return t == tables_.end() ? 0 : t->second.size();
}

} // namespace keystone::storage
