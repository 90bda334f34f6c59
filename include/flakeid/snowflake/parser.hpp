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
 * @file parser.hpp
 * @brief Decoding of Snowflake IDs into their components.
 */

#pragma once

#include "flakeid/core/interface.hpp"
#include "flakeid/infra/clock.hpp"
#include "flakeid/snowflake/validator.hpp"

#include <cstdint>

namespace flakeid::snowflake {

/**
 * @class Parser
 * @brief Shift-and-mask decoder for the 41/5/5/12 layout.
 *
 * `parse` validates before decoding; the `extract_*` accessors skip validation
 * and only guard against non-positive input.
 */
class Parser : public core::Parser {
  public:
    /**
     * @param clock Forwarded to the embedded `Validator`.
     */
    explicit Parser(infra::Clock clock = {});

    core::IdInfo parse(int64_t id) const override;

    int64_t extract_timestamp(int64_t id) const override;
    int64_t extract_datacenter_id(int64_t id) const override;
    int64_t extract_worker_id(int64_t id) const override;
    int64_t extract_sequence(int64_t id) const override;

    /// @brief The validator `parse` checks against.
    const Validator& validator() const { return validator_; }

  private:
    Validator validator_;
};

} // namespace flakeid::snowflake
