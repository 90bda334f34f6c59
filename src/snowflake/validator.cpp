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
 * @file validator.cpp
 * @brief Implementation of the Snowflake ID validity checks.
 */

#include "flakeid/snowflake/validator.hpp"

#include "flakeid/core/error.hpp"
#include "flakeid/snowflake/layout.hpp"

#include <string>
#include <utility>

namespace flakeid::snowflake {

Validator::Validator(infra::Clock clock) : clock_(std::move(clock)) {}

void Validator::validate(int64_t id) const
{
    if (id <= 0) {
        throw core::Error(core::ErrorCode::InvalidSnowflakeId,
                          "id must be positive, got " + std::to_string(id));
    }

    // Unreachable for positive ids under the current layout.
    int64_t timestamp = (id >> kTimestampShift) + kEpochMs;
    if (timestamp < kEpochMs) {
        throw core::Error(core::ErrorCode::InvalidSnowflakeId,
                          "timestamp " + std::to_string(timestamp) + " is before epoch " +
                              std::to_string(kEpochMs));
    }

    int64_t now = infra::now_ms(clock_);
    if (timestamp > now + kMaxFutureToleranceMs) {
        throw core::Error(core::ErrorCode::InvalidSnowflakeId,
                          "timestamp " + std::to_string(timestamp) +
                              " is too far in the future (current: " + std::to_string(now) +
                              ", max tolerance: " + std::to_string(kMaxFutureToleranceMs) +
                              " ms)");
    }
}

void Validator::validate_batch(const std::vector<int64_t>& ids) const
{
    for (std::size_t i = 0; i < ids.size(); ++i) {
        try {
            validate(ids[i]);
        } catch (const core::Error& e) {
            throw core::Error(e.code(),
                              "invalid ID at index " + std::to_string(i) + ": " + e.detail());
        }
    }
}

} // namespace flakeid::snowflake
