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
 * @file error.cpp
 * @brief Names and categories for identifier error codes.
 */

#include "keystone/id/error.hpp"

namespace keystone::id {

const char* to_string(ErrorCode code)
{
    switch (code) {
    case ErrorCode::UNSUPPORTED_BATCH:
        return "UnsupportedBatch";
    case ErrorCode::EMPTY_BATCH:
        return "EmptyBatch";
    case ErrorCode::MISSING_OBJECT_ID:
        return "MissingObjectId";
    case ErrorCode::NULL_OR_UNDEFINED_ID:
        return "NullOrUndefinedId";
    case ErrorCode::IDENTIFIER_TOO_LONG:
        return "IdentifierTooLong";
    case ErrorCode::COUNTER_TABLE_PROVISION_FAILED:
        return "CounterTableProvisionFailed";
    case ErrorCode::COUNTER_RECORD_READ_FAILED:
        return "CounterRecordReadFailed";
    case ErrorCode::COUNTER_RECORD_INSERT_FAILED:
        return "CounterRecordInsertFailed";
    case ErrorCode::COUNTER_RECORD_INIT_FAILED:
        return "CounterRecordInitFailed";
    case ErrorCode::CORRUPT_COUNTER_RECORD:
        return "CorruptCounterRecord";
    case ErrorCode::INCREMENT_FAILED:
        return "IncrementFailed";
    }
    return "Unknown";
}

ErrorCategory category_of(ErrorCode code)
{
    switch (code) {
    case ErrorCode::UNSUPPORTED_BATCH:
    case ErrorCode::EMPTY_BATCH:
    case ErrorCode::MISSING_OBJECT_ID:
    case ErrorCode::NULL_OR_UNDEFINED_ID:
    case ErrorCode::IDENTIFIER_TOO_LONG:
        return ErrorCategory::VALIDATION;
    case ErrorCode::COUNTER_TABLE_PROVISION_FAILED:
    case ErrorCode::COUNTER_RECORD_READ_FAILED:
    case ErrorCode::COUNTER_RECORD_INSERT_FAILED:
    case ErrorCode::COUNTER_RECORD_INIT_FAILED:
        return ErrorCategory::PROVISIONING;
    case ErrorCode::CORRUPT_COUNTER_RECORD:
        return ErrorCategory::CORRUPTION;
    case ErrorCode::INCREMENT_FAILED:
        return ErrorCategory::ALLOCATION;
    }
    return ErrorCategory::ALLOCATION;
}

IdError::IdError(ErrorCode code, const std::string& message)
    : std::runtime_error(message), code_(code)
{
}

} // namespace keystone::id
