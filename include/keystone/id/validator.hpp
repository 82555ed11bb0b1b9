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
 * @file validator.hpp
 * @brief Normalization of caller-supplied record identifiers.
 */

#pragma once

#include "keystone/infra/json.hpp"

#include <cJSON.h>
#include <cstddef>

namespace keystone::id {

/**
 * @class Validator
 * @brief Checks that a value can serve as a record identifier.
 *
 * @details
 * Accepted identifiers are any non-null JSON value, with strings limited to
 * `kMaxIdLength` characters. An object stands for the record it describes and is
 * replaced by its `id` member. Numbers and strings pass through untouched; nothing
 * is coerced.
 */
class Validator {
  public:
    /// @brief Longest accepted string identifier, counted in Unicode code points.
    static constexpr std::size_t kMaxIdLength = 127;

    /**
     * @brief Normalizes one identifier or, when allowed, a batch of them.
     *
     * @param input A single value, a record object, or an array of either. `nullptr`
     * stands for an absent ("undefined") value.
     * @param allow_batch Whether an array input is acceptable.
     * @return An owned copy of the identifier, or an array of identifiers in input order.
     *
     * @throws IdError `UNSUPPORTED_BATCH`, `EMPTY_BATCH`, `MISSING_OBJECT_ID`,
     * `NULL_OR_UNDEFINED_ID` or `IDENTIFIER_TOO_LONG`. A batch fails on its first invalid
     * element; no partial result is produced.
     *
     * @code
     * JsonPtr in = Json::parse(R"({"id": 5, "name": "x"})");
     * JsonPtr id = Validator::normalize(in.get()); // 5
     * @endcode
     */
    static infra::JsonPtr normalize(const cJSON* input, bool allow_batch = false);

  private:
    static const cJSON* validate(const cJSON* value);
};

} // namespace keystone::id
