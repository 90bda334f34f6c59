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
 * @file generator_config.hpp
 * @brief Tagged union of the configuration types of every generator family.
 *
 * @details
 * Factories receive a `GeneratorConfig` and pick the alternative that belongs
 * to their family. `std::monostate` stands for "no configuration supplied".
 * Adding a family means adding its config type to the variant and teaching
 * `generator_type_of` about it.
 */

#pragma once

#include "flakeid/core/types.hpp"
#include "flakeid/snowflake/config.hpp"

#include <optional>
#include <variant>

namespace flakeid::core {

using GeneratorConfig = std::variant<std::monostate, snowflake::Config>;

/**
 * @brief Family a configuration belongs to; empty for `std::monostate`.
 */
inline std::optional<GeneratorType> generator_type_of(const GeneratorConfig& config)
{
    if (std::holds_alternative<snowflake::Config>(config)) {
        return GeneratorType::Snowflake;
    }
    return std::nullopt;
}

} // namespace flakeid::core
