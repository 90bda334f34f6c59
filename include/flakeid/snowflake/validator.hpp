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
 * @file validator.hpp
 * @brief Structural validation of Snowflake IDs.
 */

#pragma once

#include "flakeid/core/interface.hpp"
#include "flakeid/infra/clock.hpp"

#include <cstdint>
#include <vector>

namespace flakeid::snowflake {

/**
 * @class Validator
 * @brief Rejects IDs that this scheme could never have produced.
 *
 * An ID is invalid when it is not positive, when its decoded timestamp lies
 * before `kEpochMs`, or when it lies more than `kMaxFutureToleranceMs` past the
 * current time of `clock`.
 */
class Validator : public core::Validator {
  public:
    /**
     * @param clock Source of "now" for the future-tolerance check; empty means
     * the system clock.
     */
    explicit Validator(infra::Clock clock = {});

    void validate(int64_t id) const override;
    void validate_batch(const std::vector<int64_t>& ids) const override;

  private:
    infra::Clock clock_;
};

} // namespace flakeid::snowflake
