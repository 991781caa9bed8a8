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
 * @brief Central orchestrator for the UUIDForge Test Suite.
 *
 * @details
 * Aggregates the unit tests of every subsystem: Infrastructure, the UUID
 * value type, Codec, Name Hashing, Generator and Storage adapters.
 */

#include "framework.hpp"
#include "uuidforge/infra/logger.hpp"

#include <iostream>

// ============================================================================
// Forward Declarations
// ============================================================================
// The following test functions are implemented in their respective
// translation units (e.g., uuid_test.cpp, codec_test.cpp, etc.).

// Infrastructure Subsystem (infra_test.cpp)
void test_logger_threshold();
void test_once_latch_retry_after_failure();
void test_once_latch_concurrent();
void test_string_to_long();

// UUID Value Type (uuid_test.cpp)
void test_uuid_bytes();
void test_uuid_to_string();
void test_uuid_equality();
void test_uuid_version();
void test_uuid_variant_decoding();
void test_uuid_set_variant();
void test_uuid_namespaces();
void test_uuid_nil();
void test_uuid_ordering_and_hash();

// Codec Subsystem (codec_test.cpp)
void test_codec_from_bytes();
void test_codec_to_binary();
void test_codec_from_string_forms();
void test_codec_from_string_short();
void test_codec_from_string_long();
void test_codec_from_string_invalid();
void test_codec_error_message();
void test_codec_or_nil();
void test_codec_to_text();
void test_codec_round_trip_generated();

// Name Hashing Subsystem (hash_test.cpp)
void test_hash_md5_known_answers();
void test_hash_sha1_known_answers();
void test_hash_determinism();

// Generator Subsystem (generator_test.cpp)
void test_generator_v1_layout();
void test_generator_v1_same_tick();
void test_generator_v6_layout();
void test_generator_v6_monotonic();
void test_generator_v7_layout();
void test_generator_v7_monotonic();
void test_generator_v2_domains();
void test_generator_name_based();
void test_generator_v4();
void test_generator_v4_partial_reads();
void test_generator_v4_faulty_random();
void test_generator_v1_faulty_random();
void test_generator_missing_hardware_address();
void test_generator_missing_hardware_address_and_faulty_random();
void test_generator_hardware_provider_error();
void test_generator_system_hardware_address();
void test_generator_concurrent_v1();
void test_generator_default_instance();

// Storage Adapters (storage_test.cpp)
void test_store_value_from_uuid();
void test_store_scan_accepted_types();
void test_store_scan_rejected_types();
void test_store_scan_nullable();
void test_json_encoding();
void test_json_decoding();

/**
 * @brief Test Suite Execution Entry Point.
 *
 * @return
 * - 0: All tests passed (Success).
 * - 1: One or more assertions failed (Exit failure for CI pipelines).
 */
int main()
{
    std::cout << "\033[36mInitiating UUIDForge Test Suite...\033[0m" << std::endl;

    // Expected fallbacks log at WARN; keep the report readable.
    uuidforge::infra::Logger::set_level(uuidforge::infra::LogLevel::ERROR);

    // --- 1. Infrastructure Subsystem Tests ---
    RUN_TEST(test_logger_threshold);
    RUN_TEST(test_once_latch_retry_after_failure);
    RUN_TEST(test_once_latch_concurrent);
    RUN_TEST(test_string_to_long);

    // --- 2. UUID Value Type Tests ---
    RUN_TEST(test_uuid_bytes);
    RUN_TEST(test_uuid_to_string);
    RUN_TEST(test_uuid_equality);
    RUN_TEST(test_uuid_version);
    RUN_TEST(test_uuid_variant_decoding);
    RUN_TEST(test_uuid_set_variant);
    RUN_TEST(test_uuid_namespaces);
    RUN_TEST(test_uuid_nil);
    RUN_TEST(test_uuid_ordering_and_hash);

    // --- 3. Codec Subsystem Tests ---
    // Verifies the binary form and the strict text grammar.
    RUN_TEST(test_codec_from_bytes);
    RUN_TEST(test_codec_to_binary);
    RUN_TEST(test_codec_from_string_forms);
    RUN_TEST(test_codec_from_string_short);
    RUN_TEST(test_codec_from_string_long);
    RUN_TEST(test_codec_from_string_invalid);
    RUN_TEST(test_codec_error_message);
    RUN_TEST(test_codec_or_nil);
    RUN_TEST(test_codec_to_text);
    RUN_TEST(test_codec_round_trip_generated);

    // --- 4. Name Hashing Tests ---
    RUN_TEST(test_hash_md5_known_answers);
    RUN_TEST(test_hash_sha1_known_answers);
    RUN_TEST(test_hash_determinism);

    // --- 5. Generator Subsystem Tests ---
    // Verifies layouts, monotonicity, fault handling and thread safety.
    RUN_TEST(test_generator_v1_layout);
    RUN_TEST(test_generator_v1_same_tick);
    RUN_TEST(test_generator_v6_layout);
    RUN_TEST(test_generator_v6_monotonic);
    RUN_TEST(test_generator_v7_layout);
    RUN_TEST(test_generator_v7_monotonic);
    RUN_TEST(test_generator_v2_domains);
    RUN_TEST(test_generator_name_based);
    RUN_TEST(test_generator_v4);
    RUN_TEST(test_generator_v4_partial_reads);
    RUN_TEST(test_generator_v4_faulty_random);
    RUN_TEST(test_generator_v1_faulty_random);
    RUN_TEST(test_generator_missing_hardware_address);
    RUN_TEST(test_generator_missing_hardware_address_and_faulty_random);
    RUN_TEST(test_generator_hardware_provider_error);
    RUN_TEST(test_generator_system_hardware_address);
    RUN_TEST(test_generator_concurrent_v1);
    RUN_TEST(test_generator_default_instance);

    // --- 6. Storage Adapter Tests ---
    RUN_TEST(test_store_value_from_uuid);
    RUN_TEST(test_store_scan_accepted_types);
    RUN_TEST(test_store_scan_rejected_types);
    RUN_TEST(test_store_scan_nullable);
    RUN_TEST(test_json_encoding);
    RUN_TEST(test_json_decoding);

    // Render the final results summary to stdout.
    uuidforge::test::print_summary();

    // Signal exit status: Non-zero if failures occurred.
    return (uuidforge::test::failed_count == 0) ? 0 : 1;
}
