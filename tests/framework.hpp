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
 * @brief Header-only test harness for idforge.
 *
 * @details
 * Each assertion reports file and line, counts the failure and unwinds the
 * current test with `AssertionFailure`; `run()` isolates tests from each other.
 */

#pragma once

#include <functional>
#include <iostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace idforge::test {

// ========================================================================
// Global Metrics
// ========================================================================

inline int passed_count = 0; ///< Cumulative successful test counter.
inline int failed_count = 0; ///< Cumulative failed test counter.

/// @brief Thrown by assertion primitives after the failure has been reported.
struct AssertionFailure : std::runtime_error {
    AssertionFailure() : std::runtime_error("Assertion failed") {}
};

// ========================================================================
// Assertion Primitives
// ========================================================================

/// @brief Fails unless `val1 == val2`; both values are printed on failure.
template <typename T> void assert_eq(T val1, T val2, const char* file, int line, const char* expr)
{
    if (val1 != val2) {
        std::cout << "\033[31m[FAIL]\033[0m " << file << ":" << line
                  << " -> Assertion failed: " << expr << " (" << val1 << " != " << val2 << ")"
                  << std::endl;
        failed_count++;
        throw AssertionFailure();
    }
}

/// @brief Fails when `val1 == val2`.
template <typename T> void assert_ne(T val1, T val2, const char* file, int line, const char* expr)
{
    if (val1 == val2) {
        std::cout << "\033[31m[FAIL]\033[0m " << file << ":" << line
                  << " -> Assertion failed: " << expr << " (" << val1 << " == " << val2 << ")"
                  << std::endl;
        failed_count++;
        throw AssertionFailure();
    }
}

inline void assert_true(bool cond, const char* file, int line, const char* expr)
{
    if (!cond) {
        std::cout << "\033[31m[FAIL]\033[0m " << file << ":" << line
                  << " -> Assertion failed: " << expr << " is FALSE" << std::endl;
        failed_count++;
        throw AssertionFailure();
    }
}

inline void assert_true_false(bool cond, const char* file, int line, const char* expr)
{
    if (cond) {
        std::cout << "\033[31m[FAIL]\033[0m " << file << ":" << line
                  << " -> Assertion failed: " << expr << " is TRUE" << std::endl;
        failed_count++;
        throw AssertionFailure();
    }
}

// ========================================================================
// Execution Orchestrator
// ========================================================================

/**
 * @brief Executes a test case within a protected execution context.
 *
 * An exception other than `AssertionFailure` escaping the test is reported and
 * counted as a failure.
 */
inline void run(std::string_view name, std::function<void()> func)
{
    std::cout << "[RUN  ] " << name << "... " << std::flush;
    try {
        func();
        std::cout << "\r\033[32m[PASS]\033[0m " << name << "          " << std::endl;
        passed_count++;
    } catch (const AssertionFailure&) {
        // Already reported and counted by the assertion primitive.
        std::cout << "\r\033[31m[FAIL]\033[0m " << name << "          " << std::endl;
    } catch (const std::exception& e) {
        failed_count++;
        std::cout << "\r\033[31m[FAIL]\033[0m " << name << " -> unexpected exception: " << e.what()
                  << std::endl;
    }
}

/// @brief Prints pass/fail totals for the session.
inline void print_summary()
{
    std::cout << "\n\033[36m=== idforge Test Summary ===\033[0m" << std::endl;
    std::cout << "Passed: " << passed_count << std::endl;
    if (failed_count > 0) {
        std::cout << "Failed: \033[31m" << failed_count << "\033[0m" << std::endl;
    } else {
        std::cout << "Failed: 0" << std::endl;
    }
    std::cout << "Total:  " << (passed_count + failed_count) << std::endl;
}

} // namespace idforge::test

// ============================================================================
// API Macros
// ============================================================================

/**
 * @def ASSERT_EQ
 * @brief Macro for equality assertions. Includes file and line metadata.
 */
#define ASSERT_EQ(a, b) idforge::test::assert_eq((a), (b), __FILE__, __LINE__, #a " == " #b)

/**
 * @def ASSERT_NE
 * @brief Macro for inequality assertions. Includes file and line metadata.
 */
#define ASSERT_NE(a, b) idforge::test::assert_ne((a), (b), __FILE__, __LINE__, #a " != " #b)

/**
 * @def ASSERT_TRUE
 * @brief Macro for truthiness assertions.
 */
#define ASSERT_TRUE(a) idforge::test::assert_true((a), __FILE__, __LINE__, #a)

/**
 * @def ASSERT_FALSE
 * @brief Macro for falsiness assertions.
 */
#define ASSERT_FALSE(a) idforge::test::assert_true_false((a), __FILE__, __LINE__, #a)

/**
 * @def ASSERT_THROWS
 * @brief Asserts that evaluating @p expr throws an exception of type @p type.
 */
#define ASSERT_THROWS(expr, type)                                                              \
    do {                                                                                       \
        bool caught_ = false;                                                                  \
        try {                                                                                  \
            (void)(expr);                                                                      \
        } catch (const type&) {                                                                \
            caught_ = true;                                                                    \
        }                                                                                      \
        idforge::test::assert_true(caught_, __FILE__, __LINE__, #expr " throws " #type);       \
    } while (0)

/**
 * @def RUN_TEST
 * @brief Orchestrates the execution of a named test function.
 */
#define RUN_TEST(func_name) idforge::test::run(#func_name, func_name)
