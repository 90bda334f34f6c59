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
 * @file factory.cpp
 * @brief Implementation of the Snowflake generator factory.
 */

#include "flakeid/snowflake/factory.hpp"

#include "flakeid/core/error.hpp"
#include "flakeid/snowflake/generator.hpp"

namespace flakeid::snowflake {

std::shared_ptr<core::Generator> Factory::create(const core::GeneratorConfig& config) const
{
    const Config* snowflake_config = std::get_if<Config>(&config);
    if (snowflake_config == nullptr) {
        throw core::Error(core::ErrorCode::InvalidConfig,
                          std::holds_alternative<std::monostate>(config)
                              ? "config cannot be empty"
                              : "invalid config type: expected snowflake::Config");
    }

    return std::make_shared<Generator>(*snowflake_config);
}

} // namespace flakeid::snowflake
