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
 * @file config.cpp
 * @brief Bounds checking and defaulting of generator parameters.
 */

#include "flakeid/snowflake/config.hpp"

#include "flakeid/core/error.hpp"

#include <string>

namespace flakeid::snowflake {

void Config::validate() const
{
    if (datacenter_id < 0 || datacenter_id > kMaxDatacenterId) {
        throw core::Error(core::ErrorCode::InvalidDatacenterId,
                          "got " + std::to_string(datacenter_id) + ", valid range [0, " +
                              std::to_string(kMaxDatacenterId) + "]");
    }

    if (worker_id < 0 || worker_id > kMaxWorkerId) {
        throw core::Error(core::ErrorCode::InvalidWorkerId,
                          "got " + std::to_string(worker_id) + ", valid range [0, " +
                              std::to_string(kMaxWorkerId) + "]");
    }

    if (!core::is_valid(clock_backward_strategy)) {
        throw core::Error(core::ErrorCode::InvalidConfig, "unknown clock backward strategy");
    }

    if (clock_backward_tolerance_ms < 0) {
        throw core::Error(core::ErrorCode::InvalidConfig,
                          "clock backward tolerance must be non-negative, got " +
                              std::to_string(clock_backward_tolerance_ms) + " ms");
    }

    if (clock_backward_tolerance_ms > kMaxClockBackwardToleranceMs) {
        throw core::Error(core::ErrorCode::InvalidConfig,
                          "clock backward tolerance too large: max " +
                              std::to_string(kMaxClockBackwardToleranceMs) + " ms, got " +
                              std::to_string(clock_backward_tolerance_ms) + " ms");
    }
}

void Config::apply_defaults()
{
    if (clock_backward_tolerance_ms < 0 ||
        clock_backward_tolerance_ms > kMaxClockBackwardToleranceMs) {
        clock_backward_tolerance_ms = kDefaultClockBackwardToleranceMs;
    }
}

} // namespace flakeid::snowflake
