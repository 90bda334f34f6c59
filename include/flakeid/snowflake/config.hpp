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
 * @file config.hpp
 * @brief Construction parameters of a Snowflake generator.
 */

#pragma once

#include "flakeid/core/types.hpp"
#include "flakeid/infra/clock.hpp"
#include "flakeid/snowflake/layout.hpp"

#include <cstdint>

namespace flakeid::snowflake {

/**
 * @struct Config
 * @brief Parameters copied into a `Generator` at construction.
 *
 * @code
 * flakeid::snowflake::Config cfg;
 * cfg.datacenter_id = 3;
 * cfg.worker_id = 7;
 * cfg.clock_backward_strategy = flakeid::core::ClockBackwardStrategy::Wait;
 * cfg.enable_metrics = true;
 * @endcode
 */
struct Config {
    /// @brief Datacenter component, [0, 31].
    int64_t datacenter_id = 0;

    /// @brief Worker component, [0, 31].
    int64_t worker_id = 0;

    /// @brief Policy for a clock that reads earlier than the last used timestamp.
    core::ClockBackwardStrategy clock_backward_strategy = core::ClockBackwardStrategy::Error;

    /// @brief Largest drift absorbed by the Wait strategy, [0, 1000] ms.
    int64_t clock_backward_tolerance_ms = kDefaultClockBackwardToleranceMs;

    /// @brief Collect generation counters (small per-ID cost when enabled).
    bool enable_metrics = false;

    /// @brief Time source; empty means the system clock.
    infra::Clock clock;

    /**
     * @brief Checks every bound.
     * @throws core::Error InvalidDatacenterId, InvalidWorkerId or InvalidConfig.
     */
    void validate() const;

    /**
     * @brief Replaces an out-of-range tolerance with the 5 ms default.
     */
    void apply_defaults();
};

} // namespace flakeid::snowflake
