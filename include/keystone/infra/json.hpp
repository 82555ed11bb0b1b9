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
 * @file json.hpp
 * @brief Ownership and inspection helpers for cJSON documents.
 *
 * @details
 * Records and identifier values travel through Keystone as cJSON trees. `JsonPtr`
 * gives them single-owner RAII semantics so that error paths (which throw) never leak.
 * The remaining helpers cover what the identifier subsystem needs on top of the cJSON
 * API: exact integer inspection and non-owning views / shallow copies.
 */

#pragma once

#include <cJSON.h>
#include <cstdint>
#include <memory>
#include <string>

namespace keystone::infra {

/// @brief Deleter releasing a cJSON tree through `cJSON_Delete`.
struct JsonDeleter {
    void operator()(cJSON* node) const
    {
        if (node) {
            cJSON_Delete(node);
        }
    }
};

/// @brief Owning handle to a cJSON tree.
using JsonPtr = std::unique_ptr<cJSON, JsonDeleter>;

/**
 * @class Json
 * @brief Static helpers around the cJSON API.
 */
class Json {
  public:
    /// @brief Largest magnitude a cJSON number (an IEEE double) represents exactly.
    static constexpr std::int64_t kMaxSafeInteger = 9007199254740991LL;

    /**
     * @brief Parses a JSON text.
     * @return The parsed tree, or null when the text is not valid JSON.
     */
    static JsonPtr parse(const std::string& text);

    /**
     * @brief Serializes a tree without whitespace.
     * @return The JSON text, or an empty string when `node` is null or printing fails.
     */
    static std::string print(const cJSON* node);

    /**
     * @brief Reads `node` as an exact integer.
     *
     * Succeeds only for numbers with no fractional part whose magnitude does not exceed
     * `kMaxSafeInteger`. Strings, booleans and non-integral numbers are rejected.
     *
     * @param node The value to inspect (may be null).
     * @param out Receives the integer on success.
     * @return true If `node` holds an exact integer.
     */
    static bool as_integer(const cJSON* node, std::int64_t& out);

    /**
     * @brief Creates a non-owning view of `node`.
     *
     * For objects and arrays the view is a reference container sharing `node`'s
     * children; for scalars it is a reference copy. Deleting the view never frees
     * anything owned by `node`, so `node` must outlive it.
     */
    static JsonPtr view(const cJSON* node);

    /**
     * @brief Shallow-copies an object.
     *
     * The result is a new owned object whose members are references to `object`'s
     * members. Members added to the copy afterwards are owned by the copy; `object` is
     * never modified.
     *
     * @return The copy, or null if `object` is not an object or allocation failed.
     */
    static JsonPtr shallow_copy(const cJSON* object);
};

} // namespace keystone::infra
