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
 * @file error.hpp
 * @brief Error taxonomy of the identifier subsystem.
 *
 * @details
 * Every failure surfaced by validation, counter provisioning or allocation is an
 * `IdError`. Callers decide between retry and abort from `code()`, `category()` or
 * `retryable()`, never from the message text.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace keystone::id {

/**
 * @enum ErrorCategory
 * @brief Groups error codes by how a caller should react.
 */
enum class ErrorCategory {
    VALIDATION,   ///< Caller input rejected as-is. Never retried.
    PROVISIONING, ///< Counter setup failed before any value was handed out. Safe to retry.
    CORRUPTION,   ///< Stored counter state is unusable. Needs operator correction.
    ALLOCATION    ///< The increment itself failed. Retry policy belongs to the caller.
};

/**
 * @enum ErrorCode
 * @brief Distinguishable failure kinds.
 */
enum class ErrorCode {
    UNSUPPORTED_BATCH,
    EMPTY_BATCH,
    MISSING_OBJECT_ID,
    NULL_OR_UNDEFINED_ID,
    IDENTIFIER_TOO_LONG,
    COUNTER_TABLE_PROVISION_FAILED,
    COUNTER_RECORD_READ_FAILED,
    COUNTER_RECORD_INSERT_FAILED,
    COUNTER_RECORD_INIT_FAILED,
    CORRUPT_COUNTER_RECORD,
    INCREMENT_FAILED
};

/// @brief Stable name of a code, e.g. `"CorruptCounterRecord"`.
const char* to_string(ErrorCode code);

/// @brief The category a code belongs to.
ErrorCategory category_of(ErrorCode code);

/**
 * @class IdError
 * @brief Exception raised by every identifier operation.
 */
class IdError : public std::runtime_error {
  public:
    IdError(ErrorCode code, const std::string& message);

    ErrorCode code() const noexcept
    {
        return code_;
    }

    ErrorCategory category() const noexcept
    {
        return category_of(code_);
    }

    /**
     * @brief Whether repeating the same call can succeed without outside intervention.
     *
     * True for provisioning failures only: the config is still unverified, so the next
     * call re-runs verification. Allocation failures report false because this layer
     * cannot tell a lost request from a completed increment.
     */
    bool retryable() const noexcept
    {
        return category() == ErrorCategory::PROVISIONING;
    }

  private:
    ErrorCode code_;
};

} // namespace keystone::id
