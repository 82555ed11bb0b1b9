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
 * @file engine.hpp
 * @brief Low-level disk persistence layer.
 *
 * @details
 * Declares the `Engine` class, which owns the physical files behind `storage::Db`.
 * Each table is one append-only log of record snapshots; the newest snapshot of a key
 * wins on replay.
 */

#pragma once

#include <string>
#include <vector>

namespace keystone::storage {

/**
 * @class Engine
 * @brief Manages table durability using an Append-Only Log (AOL) strategy.
 *
 * @details
 * **Storage Characteristics:**
 * 1. **Sequential Writes:** every mutation appends one frame.
 * 2. **Durability:** frames are handed to the OS before the in-memory state changes.
 * 3. **Crash Recovery:** state is rebuilt by replaying each log from the beginning; a
 *    truncated trailing frame is ignored.
 */
class Engine {
  public:
    /**
     * @param base_path Directory holding the table logs (`<table>.kst`).
     */
    explicit Engine(std::string base_path);

    /**
     * @brief Creates the base directory if needed.
     * @throws std::filesystem::filesystem_error If the directory cannot be created.
     */
    void init();

    /**
     * @brief Creates an empty log for `table` if none exists.
     * @return true If the log exists afterwards.
     */
    bool create(const std::string& table);

    /**
     * @brief Replays the frames of `table`'s log in write order.
     * @param torn Set when the log ends in an incomplete frame. Appending after a torn
     * tail would misalign every later frame, so the caller must rewrite the log first.
     */
    std::vector<std::string> load_log(const std::string& table, bool& torn);

    /**
     * @brief Appends one frame to `table`'s log.
     * @return false On any filesystem error. The log is truncated back to its previous
     * size first; if even that fails, the log may end in a partial frame.
     */
    bool append(const std::string& table, const std::string& raw_json);

    /**
     * @brief Rewrites `table`'s log to contain exactly `active_docs`.
     *
     * Writes a temporary file and renames it over the log, so a crash leaves either
     * the old or the new log intact.
     */
    bool compact(const std::string& table, const std::vector<std::string>& active_docs);

    /**
     * @brief Lists tables that have a log under the base directory.
     */
    std::vector<std::string> list_tables();

  private:
    std::string base_path_;

    /// @brief `get_path("_counters")` -> `<base>/_counters.kst`
    std::string get_path(const std::string& table);
};

} // namespace keystone::storage
