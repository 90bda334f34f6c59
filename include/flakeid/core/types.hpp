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
 * @file types.hpp
 * @brief Discriminants and value objects shared across generator families.
 */

#pragma once

#include <cstdint>
#include <string>

namespace flakeid::core {

/**
 * @enum GeneratorType
 * @brief Selects the factory, parser and validator used by the registries.
 *
 * Only `Snowflake` ships with an implementation; `Uuid` and `Custom` are
 * reserved slots that applications may register their own implementations for.
 */
enum class GeneratorType {
    Snowflake, ///< "snowflake"
    Uuid,      ///< "uuid"
    Custom     ///< "custom"
};

/**
 * @enum ClockBackwardStrategy
 * @brief Policy applied when the clock reads earlier than the last used timestamp.
 */
enum class ClockBackwardStrategy {
    Error,           ///< Fail immediately (default).
    Wait,            ///< Sleep for small drifts, fail beyond the tolerance.
    UseLastTimestamp ///< Keep issuing IDs from the last timestamp.
};

/// @brief Canonical lowercase name ("snowflake", "uuid", "custom").
const char* to_string(GeneratorType type);

/// @brief "Error", "Wait", "UseLastTimestamp" or "Unknown".
const char* to_string(ClockBackwardStrategy strategy);

/// @brief True for the three declared generator types.
bool is_valid(GeneratorType type);

/// @brief True for the three declared strategies.
bool is_valid(ClockBackwardStrategy strategy);

/**
 * @brief Resolves a generator type from its canonical name.
 * @throws core::Error (InvalidGeneratorType) for unknown names.
 */
GeneratorType parse_generator_type(const std::string& name);

/**
 * @brief Resolves a strategy from "error", "wait" or "use_last_timestamp".
 * @throws core::Error (InvalidConfig) for unknown names.
 */
ClockBackwardStrategy parse_strategy(const std::string& name);

/**
 * @struct IdInfo
 * @brief Decoded components of a single ID.
 */
struct IdInfo {
    int64_t id = 0;            ///< The raw ID.
    int64_t timestamp_ms = 0;  ///< Absolute Unix timestamp in milliseconds.
    int64_t datacenter_id = 0; ///< Datacenter component.
    int64_t worker_id = 0;     ///< Worker component.
    int64_t sequence = 0;      ///< Per-millisecond sequence component.
};

} // namespace flakeid::core
