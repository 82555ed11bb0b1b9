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
 * @file framework.hpp
 * @brief A lightweight, header-only unit testing micro-framework for Keystone.
 *
 * @details
 * ANSI-coloured terminal output, exception-protected test bodies, and assertion macros
 * that record file and line. `ASSERT_THROWS_CODE` checks the `ErrorCode` carried by an
 * `IdError` so tests assert on error kinds rather than messages.
 */

#pragma once

#include "keystone/id/error.hpp"

#include <functional>
#include <iostream>
#include <stdexcept>
#include <string>
#include <string_view>

namespace keystone::test {

inline int passed_count = 0; ///< Cumulative successful test counter.
inline int failed_count = 0; ///< Cumulative failed test counter.

/**
 * @brief Validates that two generic values are equivalent.
 */
template <typename T> void assert_eq(T val1, T val2, const char* file, int line, const char* expr)
{
    if (val1 != val2) {
        std::cout << "\033[31m[FAIL]\033[0m " << file << ":" << line
                  << " -> Assertion failed: " << expr << " (" << val1 << " != " << val2 << ")"
                  << std::endl;
        failed_count++;
        throw std::runtime_error("Assertion failed");
    }
}

/**
 * @brief Validates that two generic values are NOT equivalent.
 */
template <typename T> void assert_ne(T val1, T val2, const char* file, int line, const char* expr)
{
    if (val1 == val2) {
        std::cout << "\033[31m[FAIL]\033[0m " << file << ":" << line
                  << " -> Assertion failed: " << expr << " (" << val1 << " == " << val2 << ")"
                  << std::endl;
        failed_count++;
        throw std::runtime_error("Assertion failed");
    }
}

inline void assert_true(bool cond, const char* file, int line, const char* expr)
{
    if (!cond) {
        std::cout << "\033[31m[FAIL]\033[0m " << file << ":" << line
                  << " -> Assertion failed: " << expr << " is FALSE" << std::endl;
        failed_count++;
        throw std::runtime_error("Assertion failed");
    }
}

inline void assert_false(bool cond, const char* file, int line, const char* expr)
{
    if (cond) {
        std::cout << "\033[31m[FAIL]\033[0m " << file << ":" << line
                  << " -> Assertion failed: " << expr << " is TRUE" << std::endl;
        failed_count++;
        throw std::runtime_error("Assertion failed");
    }
}

/**
 * @brief Validates that `body` throws an `IdError` carrying `expected`.
 */
inline void assert_throws_code(const std::function<void()>& body, id::ErrorCode expected,
                               const char* file, int line, const char* expr)
{
    try {
        body();
    } catch (const id::IdError& e) {
        if (e.code() == expected) {
            return;
        }
        std::cout << "\033[31m[FAIL]\033[0m " << file << ":" << line << " -> " << expr
                  << " threw " << id::to_string(e.code()) << ", expected "
                  << id::to_string(expected) << std::endl;
        failed_count++;
        throw std::runtime_error("Assertion failed");
    }

    std::cout << "\033[31m[FAIL]\033[0m " << file << ":" << line << " -> " << expr
              << " did not throw " << id::to_string(expected) << std::endl;
    failed_count++;
    throw std::runtime_error("Assertion failed");
}

/**
 * @brief Executes a test case within a protected execution context.
 *
 * Failures raised outside the assertion primitives (an unexpected exception from the
 * code under test) are reported and counted here.
 */
inline void run(std::string_view name, const std::function<void()>& func)
{
    std::cout << "[RUN  ] " << name << "... " << std::flush;
    int failures_before = failed_count;
    try {
        func();
        std::cout << "\r\033[32m[PASS]\033[0m " << name << "          " << std::endl;
        passed_count++;
    } catch (const std::exception& e) {
        if (failed_count == failures_before) {
            std::cout << "\n\033[31m[FAIL]\033[0m Unexpected exception: " << e.what() << std::endl;
            failed_count++;
        }
        std::cout << "\r\033[31m[FAIL]\033[0m " << name << "          " << std::endl;
    }
}

/**
 * @brief Emits a summary report of the current test session.
 */
inline void print_summary()
{
    std::cout << "\n\033[36m=== Keystone Test Summary ===\033[0m" << std::endl;
    std::cout << "Passed: " << passed_count << std::endl;
    if (failed_count > 0) {
        std::cout << "Failed: \033[31m" << failed_count << "\033[0m" << std::endl;
    } else {
        std::cout << "Failed: 0" << std::endl;
    }
    std::cout << "Total:  " << (passed_count + failed_count) << std::endl;
}

} // namespace keystone::test

#define ASSERT_EQ(a, b) keystone::test::assert_eq((a), (b), __FILE__, __LINE__, #a " == " #b)

#define ASSERT_NE(a, b) keystone::test::assert_ne((a), (b), __FILE__, __LINE__, #a " != " #b)

#define ASSERT_TRUE(a) keystone::test::assert_true((a), __FILE__, __LINE__, #a)

#define ASSERT_FALSE(a) keystone::test::assert_false((a), __FILE__, __LINE__, #a)

/**
 * @def ASSERT_THROWS_CODE
 * @brief Asserts that `stmt` throws `keystone::id::IdError` with code `code`.
 */
#define ASSERT_THROWS_CODE(stmt, code)                                                             \
    keystone::test::assert_throws_code([&]() { stmt; }, (code), __FILE__, __LINE__, #stmt)

#define RUN_TEST(func_name) keystone::test::run(#func_name, func_name)
