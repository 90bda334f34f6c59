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
 * @brief Central orchestrator for the FlakeID Test Suite.
 *
 * @details
 * This file serves as the main entry point for the testing environment. It
 * aggregates unit and integration tests across all subsystems:
 * Core, Infrastructure, Snowflake Generation, Registries, and the ID Domain Type.
 */

#include "flakeid/infra/logger.hpp"
#include "framework.hpp"

#include <iostream>

// ============================================================================
// Forward Declarations
// ============================================================================
// The following test functions are implemented in their respective
// translation units (e.g., core_test.cpp, snowflake_test.cpp, etc.).

// Core Vocabulary (core_test.cpp)
void test_error_message_format();
void test_batch_error_carries_partial_ids();
void test_enum_names();
void test_enum_parsing();
void test_generator_config_family();

// Infrastructure Subsystem (infra_test.cpp)
void test_string_trim();
void test_string_trim_empty();
void test_string_to_int64();
void test_string_to_int64_rejects();
void test_log_level_names();
void test_logger_threshold();
void test_settings_full_document();
void test_settings_defaults();
void test_settings_rejects();
void test_settings_load_file();

// Snowflake Subsystem (snowflake_test.cpp)
void test_snowflake_unique_and_increasing();
void test_snowflake_round_trip();
void test_snowflake_config_bounds();
void test_snowflake_batch_size_limits();
void test_snowflake_large_batch();
void test_snowflake_sequence_overflow_under_load();
void test_snowflake_sequence_exhaustion_waits();
void test_snowflake_batch_partial_on_clock_backward();
void test_snowflake_clock_backward_error();
void test_snowflake_clock_backward_wait_recovers();
void test_snowflake_clock_backward_wait_beyond_tolerance();
void test_snowflake_clock_backward_use_last_timestamp();
void test_snowflake_clock_backward_wait_retries_exhausted();
void test_snowflake_batch_use_last_timestamp_exhaustion();
void test_snowflake_metrics_toggle();
void test_snowflake_validator_future_boundary();
void test_snowflake_generator_validates_on_its_clock();
void test_snowflake_validator_batch();
void test_snowflake_parser_fields();
void test_snowflake_factory();
void test_snowflake_concurrent_uniqueness();

// Registry Subsystem (registry_test.cpp)
void test_context_registers_snowflake();
void test_type_registry_errors();
void test_type_registry_replace();
void test_registry_key_rules();
void test_registry_lifecycle();
void test_registry_create_failures();
void test_registry_capacity();
void test_registry_capacity_limits();
void test_registry_concurrent_get_or_create();
void test_context_default_generator();

// ID Domain Type (domain_test.cpp)
void test_id_from_string_radixes();
void test_id_from_string_rejects();
void test_id_text_forms();
void test_id_predicates_and_ordering();
void test_id_json_round_trip();
void test_id_json_rejects();
void test_id_registry_helpers();
void test_id_extract_sentinels();

/**
 * @brief Test Suite Execution Entry Point.
 *
 * Orchestrates the sequential execution of registered test cases.
 *
 * @return
 * - 0: All tests passed (Success).
 * - 1: One or more assertions failed (Exit failure for CI pipelines).
 */
int main()
{
    std::cout << "\033[36mInitiating FlakeID Test Suite...\033[0m" << std::endl;

    // Clock-backward and registry tests log on purpose; keep the report readable.
    flakeid::infra::Logger::set_level(flakeid::infra::LogLevel::FATAL);

    // --- 1. Core Vocabulary Tests ---
    RUN_TEST(test_error_message_format);
    RUN_TEST(test_batch_error_carries_partial_ids);
    RUN_TEST(test_enum_names);
    RUN_TEST(test_enum_parsing);
    RUN_TEST(test_generator_config_family);

    // --- 2. Infrastructure Subsystem Tests ---
    // Verifies the foundational blocks (String Primitives, Logger, Settings).
    RUN_TEST(test_string_trim);
    RUN_TEST(test_string_trim_empty);
    RUN_TEST(test_string_to_int64);
    RUN_TEST(test_string_to_int64_rejects);
    RUN_TEST(test_log_level_names);
    RUN_TEST(test_logger_threshold);
    RUN_TEST(test_settings_full_document);
    RUN_TEST(test_settings_defaults);
    RUN_TEST(test_settings_rejects);
    RUN_TEST(test_settings_load_file);

    // --- 3. Snowflake Subsystem Tests ---
    // Verifies layout, ordering, clock policies, batching and thread safety.
    RUN_TEST(test_snowflake_unique_and_increasing);
    RUN_TEST(test_snowflake_round_trip);
    RUN_TEST(test_snowflake_config_bounds);
    RUN_TEST(test_snowflake_batch_size_limits);
    RUN_TEST(test_snowflake_large_batch);
    RUN_TEST(test_snowflake_sequence_overflow_under_load);
    RUN_TEST(test_snowflake_sequence_exhaustion_waits);
    RUN_TEST(test_snowflake_batch_partial_on_clock_backward);
    RUN_TEST(test_snowflake_clock_backward_error);
    RUN_TEST(test_snowflake_clock_backward_wait_recovers);
    RUN_TEST(test_snowflake_clock_backward_wait_beyond_tolerance);
    RUN_TEST(test_snowflake_clock_backward_use_last_timestamp);
    RUN_TEST(test_snowflake_clock_backward_wait_retries_exhausted);
    RUN_TEST(test_snowflake_batch_use_last_timestamp_exhaustion);
    RUN_TEST(test_snowflake_metrics_toggle);
    RUN_TEST(test_snowflake_validator_future_boundary);
    RUN_TEST(test_snowflake_generator_validates_on_its_clock);
    RUN_TEST(test_snowflake_validator_batch);
    RUN_TEST(test_snowflake_parser_fields);
    RUN_TEST(test_snowflake_factory);
    RUN_TEST(test_snowflake_concurrent_uniqueness);

    // --- 4. Registry Subsystem Tests ---
    // Verifies type lookup, keyed instances, capacity and the composition root.
    RUN_TEST(test_context_registers_snowflake);
    RUN_TEST(test_type_registry_errors);
    RUN_TEST(test_type_registry_replace);
    RUN_TEST(test_registry_key_rules);
    RUN_TEST(test_registry_lifecycle);
    RUN_TEST(test_registry_create_failures);
    RUN_TEST(test_registry_capacity);
    RUN_TEST(test_registry_capacity_limits);
    RUN_TEST(test_registry_concurrent_get_or_create);
    RUN_TEST(test_context_default_generator);

    // --- 5. ID Domain Type Tests ---
    RUN_TEST(test_id_from_string_radixes);
    RUN_TEST(test_id_from_string_rejects);
    RUN_TEST(test_id_text_forms);
    RUN_TEST(test_id_predicates_and_ordering);
    RUN_TEST(test_id_json_round_trip);
    RUN_TEST(test_id_json_rejects);
    RUN_TEST(test_id_registry_helpers);
    RUN_TEST(test_id_extract_sentinels);

    // Render the final results summary to stdout.
    flakeid::test::print_summary();

    // Signal exit status: Non-zero if failures occurred.
    return (flakeid::test::failed_count == 0) ? 0 : 1;
}
