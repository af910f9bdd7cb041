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
 * @brief Central orchestrator for the Kairos Test Suite.
 *
 * @details
 * This file serves as the main entry point for the testing environment. It
 * aggregates unit and integration tests across all subsystems:
 * Core Types, Infrastructure, Layouts, Clock State, Generators and Report.
 */

#include "framework.hpp"
#include "kairos/infra/logger.hpp"

#include <iostream>

// ============================================================================
// Forward Declarations
// ============================================================================
// The following test functions are implemented in their respective
// translation units (e.g., uuid_test.cpp, generator_test.cpp, etc.).

// Core Types (uuid_test.cpp)
void test_uuid_canonical_format();
void test_uuid_nil();
void test_uuid_version_and_variant_bits();
void test_uuid_variant_classification();
void test_uuid_ordering();

// Infrastructure Subsystem and Runner (infra_test.cpp)
void test_logger_parse_level();
void test_logger_threshold();
void test_digest_known_answers();
void test_system_random_fill();
void test_runner_counts_unknown_exception();

// Version Layouts (encoder_test.cpp)
void test_timestamp_conversions();
void test_encode_v1_rfc_vector();
void test_encode_v3_v5_rfc_vectors();
void test_encode_v4_rfc_vector();
void test_encode_v6_rfc_vector();
void test_encode_v7_rfc_vector();
void test_encode_v6_sorts_by_time();

// Clock State (clock_state_test.cpp)
void test_clock_sequence_seeded_once();
void test_clock_sequence_increments_on_stall();
void test_clock_sequence_wraps();
void test_clock_sequence_shared_across_modes();
void test_clock_sequence_seed_failure_retries();
void test_monotonic_counter_resets_per_millisecond();
void test_monotonic_counter_clock_regression();
void test_monotonic_counter_wraps();
void test_node_cache_resolves_once();
void test_node_cache_random_fallback();
void test_node_cache_unavailable();

// Generators (generator_test.cpp)
void test_generator_v4_zero_random();
void test_generator_v4_uniqueness();
void test_generator_v4_source_failure();
void test_generator_name_based_deterministic();
void test_generator_v1_clock_collision();
void test_generator_v1_node_cached();
void test_generator_v1_random_node();
void test_generator_v1_node_fallback_failure();
void test_generator_failure_logged_once();
void test_generator_v6_fresh_tail();
void test_generator_v7_rfc_vector();
void test_generator_v7_same_millisecond();
void test_batch_same_millisecond_increasing();
void test_batch_spans_milliseconds();
void test_batch_rejects_non_positive_size();
void test_batch_oversized_count();
void test_batch_random_failure();
void test_batch_generator_forwards();
void test_generator_concurrent_uniqueness();
void test_default_generator_shared();

// Executable Report (report_test.cpp)
void test_report_success();
void test_report_error();

/**
 * @brief Test Suite Execution Entry Point.
 *
 * @return
 * - 0: All tests passed (Success).
 * - 1: One or more assertions failed (Exit failure for CI pipelines).
 */
int main()
{
    std::cout << "\033[36mInitiating Kairos Test Suite...\033[0m" << std::endl;

    // Failure paths are exercised on purpose; keep their log lines out of the report.
    kairos::infra::Logger::set_level(kairos::infra::LogLevel::FATAL);

    // --- 1. Core Types ---
    RUN_TEST(test_uuid_canonical_format);
    RUN_TEST(test_uuid_nil);
    RUN_TEST(test_uuid_version_and_variant_bits);
    RUN_TEST(test_uuid_variant_classification);
    RUN_TEST(test_uuid_ordering);

    // --- 2. Infrastructure Subsystem ---
    RUN_TEST(test_logger_parse_level);
    RUN_TEST(test_logger_threshold);
    RUN_TEST(test_digest_known_answers);
    RUN_TEST(test_system_random_fill);
    RUN_TEST(test_runner_counts_unknown_exception);

    // --- 3. Version Layouts ---
    // Verifies byte placement against the published examples.
    RUN_TEST(test_timestamp_conversions);
    RUN_TEST(test_encode_v1_rfc_vector);
    RUN_TEST(test_encode_v3_v5_rfc_vectors);
    RUN_TEST(test_encode_v4_rfc_vector);
    RUN_TEST(test_encode_v6_rfc_vector);
    RUN_TEST(test_encode_v7_rfc_vector);
    RUN_TEST(test_encode_v6_sorts_by_time);

    // --- 4. Clock State ---
    RUN_TEST(test_clock_sequence_seeded_once);
    RUN_TEST(test_clock_sequence_increments_on_stall);
    RUN_TEST(test_clock_sequence_wraps);
    RUN_TEST(test_clock_sequence_shared_across_modes);
    RUN_TEST(test_clock_sequence_seed_failure_retries);
    RUN_TEST(test_monotonic_counter_resets_per_millisecond);
    RUN_TEST(test_monotonic_counter_clock_regression);
    RUN_TEST(test_monotonic_counter_wraps);
    RUN_TEST(test_node_cache_resolves_once);
    RUN_TEST(test_node_cache_random_fallback);
    RUN_TEST(test_node_cache_unavailable);

    // --- 5. Generators ---
    // Deterministic providers first, then the system-backed uniqueness runs.
    RUN_TEST(test_generator_v4_zero_random);
    RUN_TEST(test_generator_v4_source_failure);
    RUN_TEST(test_generator_name_based_deterministic);
    RUN_TEST(test_generator_v1_clock_collision);
    RUN_TEST(test_generator_v1_node_cached);
    RUN_TEST(test_generator_v1_random_node);
    RUN_TEST(test_generator_v1_node_fallback_failure);
    RUN_TEST(test_generator_failure_logged_once);
    RUN_TEST(test_generator_v6_fresh_tail);
    RUN_TEST(test_generator_v7_rfc_vector);
    RUN_TEST(test_generator_v7_same_millisecond);
    RUN_TEST(test_batch_same_millisecond_increasing);
    RUN_TEST(test_batch_spans_milliseconds);
    RUN_TEST(test_batch_rejects_non_positive_size);
    RUN_TEST(test_batch_oversized_count);
    RUN_TEST(test_batch_random_failure);
    RUN_TEST(test_batch_generator_forwards);
    RUN_TEST(test_generator_v4_uniqueness);
    RUN_TEST(test_generator_concurrent_uniqueness);
    RUN_TEST(test_default_generator_shared);

    // --- 6. Executable Report ---
    RUN_TEST(test_report_success);
    RUN_TEST(test_report_error);

    // Render the final results summary to stdout.
    kairos::test::print_summary();

    // Signal exit status: Non-zero if failures occurred.
    return (kairos::test::failed_count == 0) ? 0 : 1;
}
