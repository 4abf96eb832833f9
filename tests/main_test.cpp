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
 * @file main_test.cpp
 * @brief Central orchestrator for the idforge test suite.
 *
 * @details
 * Aggregates unit and integration tests across all subsystems:
 * Infrastructure, Codecs, Clock, Generators, Batch Engine, Configuration,
 * Service Handler and the process-wide entry points.
 */

#include "framework.hpp"
#include "idforge/infra/logger.hpp"

#include <iostream>

// ============================================================================
// Forward Declarations
// ============================================================================
// The following test functions are implemented in their respective
// translation units (e.g., infra_test.cpp, codec_test.cpp, etc.).

// Infrastructure Subsystem (infra_test.cpp)
void test_string_trim();
void test_string_trim_empty();
void test_string_to_lower_and_strip();
void test_string_parse_int();
void test_logger_levels();
void test_scheduler_submit();
void test_scheduler_propagates_exceptions();
void test_scheduler_default_size();

// Codecs and Value Types (codec_test.cpp)
void test_format_uuid();
void test_hex_codec();
void test_base64url_vectors();
void test_base64url_rejects();
void test_uuid_parse_forms();
void test_uuid_nil_and_variants();
void test_uuid_namespaces();
void test_uuid_hash();
void test_nano_alphabet_rules();
void test_encode_nano_rejection();
void test_identifier_accessors();

// Monotonic Counter (clock_test.cpp)
void test_counter_sequence_within_tick();
void test_counter_reserve_ranges();
void test_counter_clock_rollback();
void test_counter_exhaustion_waits();
void test_counter_clock_failure();
void test_counter_rejects_bad_limits();
void test_counter_concurrent_unique();

// Single-Value Generators (generator_test.cpp)
void test_uuid4_layout();
void test_uuid7_layout();
void test_uuid1_layout();
void test_v1_node_drawn_once();
void test_sequential_ordering();
void test_short_id_shape();
void test_nano_id_default();
void test_nano_id_custom_alphabet();
void test_nano_id_rejects_bad_input();
void test_entropy_failure_propagates();
void test_context_requires_sources();
void test_system_entropy();

// Batch Engine (batch_test.cpp)
void test_partitioner_plan();
void test_batch_lengths_and_shapes();
void test_uuid7_batch_chunk_order();
void test_batch_zero_count();
void test_batch_rejects_bad_counts();
void test_batch_rejects_bad_options();
void test_batches_disjoint();
void test_concurrent_callers_unique();
void test_entropy_failure_aborts_batch();
void test_clock_failure_aborts_batch();
void test_batch_after_fork();

// Configuration (config_test.cpp)
void test_config_defaults();
void test_config_overrides();
void test_config_rejects_invalid();
void test_config_to_json();
void test_config_load_file();

// Service Handler (handler_test.cpp)
void test_handle_uuid_request();
void test_handle_nano_request();
void test_handle_invalid_json();
void test_handle_rejected_arguments();
void test_handle_ping_and_exit();
void test_serve_loop();

// Process-Wide Entry Points (facade_test.cpp)
void test_facade_configure();
void test_facade_single_values();
void test_facade_batches();

/**
 * @brief Test Suite Execution Entry Point.
 *
 * @return
 * - 0: All tests passed (Success).
 * - 1: One or more assertions failed (Exit failure for CI pipelines).
 */
int main()
{
    std::cout << "\033[36mInitiating idforge Test Suite...\033[0m" << std::endl;

    // Keep expected warnings (clock rollback, rejected requests) out of the report.
    idforge::infra::Logger::set_level(idforge::infra::LogLevel::FATAL);

    // --- 1. Infrastructure Subsystem Tests ---
    RUN_TEST(test_string_trim);
    RUN_TEST(test_string_trim_empty);
    RUN_TEST(test_string_to_lower_and_strip);
    RUN_TEST(test_string_parse_int);
    RUN_TEST(test_logger_levels);
    RUN_TEST(test_scheduler_submit);
    RUN_TEST(test_scheduler_propagates_exceptions);
    RUN_TEST(test_scheduler_default_size);

    // --- 2. Codecs and Value Types ---
    RUN_TEST(test_format_uuid);
    RUN_TEST(test_hex_codec);
    RUN_TEST(test_base64url_vectors);
    RUN_TEST(test_base64url_rejects);
    RUN_TEST(test_uuid_parse_forms);
    RUN_TEST(test_uuid_nil_and_variants);
    RUN_TEST(test_uuid_namespaces);
    RUN_TEST(test_uuid_hash);
    RUN_TEST(test_nano_alphabet_rules);
    RUN_TEST(test_encode_nano_rejection);
    RUN_TEST(test_identifier_accessors);

    // --- 3. Monotonic Counter ---
    // Verifies sequencing, rollback holding and exhaustion waits.
    RUN_TEST(test_counter_sequence_within_tick);
    RUN_TEST(test_counter_reserve_ranges);
    RUN_TEST(test_counter_clock_rollback);
    RUN_TEST(test_counter_exhaustion_waits);
    RUN_TEST(test_counter_clock_failure);
    RUN_TEST(test_counter_rejects_bad_limits);
    RUN_TEST(test_counter_concurrent_unique);

    // --- 4. Single-Value Generators ---
    RUN_TEST(test_uuid4_layout);
    RUN_TEST(test_uuid7_layout);
    RUN_TEST(test_uuid1_layout);
    RUN_TEST(test_v1_node_drawn_once);
    RUN_TEST(test_sequential_ordering);
    RUN_TEST(test_short_id_shape);
    RUN_TEST(test_nano_id_default);
    RUN_TEST(test_nano_id_custom_alphabet);
    RUN_TEST(test_nano_id_rejects_bad_input);
    RUN_TEST(test_entropy_failure_propagates);
    RUN_TEST(test_context_requires_sources);
    RUN_TEST(test_system_entropy);

    // --- 5. Batch Engine ---
    // Verifies partitioning, uniqueness across batches and threads, all-or-nothing failure.
    RUN_TEST(test_partitioner_plan);
    RUN_TEST(test_batch_lengths_and_shapes);
    RUN_TEST(test_uuid7_batch_chunk_order);
    RUN_TEST(test_batch_zero_count);
    RUN_TEST(test_batch_rejects_bad_counts);
    RUN_TEST(test_batch_rejects_bad_options);
    RUN_TEST(test_batches_disjoint);
    RUN_TEST(test_concurrent_callers_unique);
    RUN_TEST(test_entropy_failure_aborts_batch);
    RUN_TEST(test_clock_failure_aborts_batch);
    RUN_TEST(test_batch_after_fork);

    // --- 6. Configuration ---
    RUN_TEST(test_config_defaults);
    RUN_TEST(test_config_overrides);
    RUN_TEST(test_config_rejects_invalid);
    RUN_TEST(test_config_to_json);
    RUN_TEST(test_config_load_file);

    // --- 7. Service Handler ---
    // Verifies the request dispatcher (JSON-In -> Generate -> JSON-Out).
    RUN_TEST(test_handle_uuid_request);
    RUN_TEST(test_handle_nano_request);
    RUN_TEST(test_handle_invalid_json);
    RUN_TEST(test_handle_rejected_arguments);
    RUN_TEST(test_handle_ping_and_exit);
    RUN_TEST(test_serve_loop);

    // --- 8. Process-Wide Entry Points ---
    // Configuration must precede the first use of the default engine.
    RUN_TEST(test_facade_configure);
    RUN_TEST(test_facade_single_values);
    RUN_TEST(test_facade_batches);

    // Render the final results summary to stdout.
    idforge::test::print_summary();

    // Signal exit status: Non-zero if failures occurred.
    return (idforge::test::failed_count == 0) ? 0 : 1;
}
