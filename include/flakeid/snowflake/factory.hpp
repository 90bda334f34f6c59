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
 * @file factory.hpp
 * @brief Registry entry point for building Snowflake generators.
 */

#pragma once

#include "flakeid/core/interface.hpp"

#include <memory>

namespace flakeid::snowflake {

/**
 * @class Factory
 * @brief Builds a `snowflake::Generator` from the `snowflake::Config` alternative.
 */
class Factory : public core::Factory {
  public:
    std::shared_ptr<core::Generator> create(const core::GeneratorConfig& config) const override;
};

} // namespace flakeid::snowflake
