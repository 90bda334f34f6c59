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
 * @file types.cpp
 * @brief Name mapping for generator types and clock-backward strategies.
 */

#include "flakeid/core/types.hpp"

#include "flakeid/core/error.hpp"

namespace flakeid::core {

const char* to_string(GeneratorType type)
{
    switch (type) {
    case GeneratorType::Snowflake:
        return "snowflake";
    case GeneratorType::Uuid:
        return "uuid";
    case GeneratorType::Custom:
        return "custom";
    }
    return "invalid";
}

const char* to_string(ClockBackwardStrategy strategy)
{
    switch (strategy) {
    case ClockBackwardStrategy::Error:
        return "Error";
    case ClockBackwardStrategy::Wait:
        return "Wait";
    case ClockBackwardStrategy::UseLastTimestamp:
        return "UseLastTimestamp";
    }
    return "Unknown";
}

bool is_valid(GeneratorType type)
{
    switch (type) {
    case GeneratorType::Snowflake:
    case GeneratorType::Uuid:
    case GeneratorType::Custom:
        return true;
    }
    return false;
}

bool is_valid(ClockBackwardStrategy strategy)
{
    switch (strategy) {
    case ClockBackwardStrategy::Error:
    case ClockBackwardStrategy::Wait:
    case ClockBackwardStrategy::UseLastTimestamp:
        return true;
    }
    return false;
}

GeneratorType parse_generator_type(const std::string& name)
{
    if (name == "snowflake") {
        return GeneratorType::Snowflake;
    }
    if (name == "uuid") {
        return GeneratorType::Uuid;
    }
    if (name == "custom") {
        return GeneratorType::Custom;
    }
    throw Error(ErrorCode::InvalidGeneratorType, "unknown generator type '" + name + "'");
}

ClockBackwardStrategy parse_strategy(const std::string& name)
{
    if (name == "error") {
        return ClockBackwardStrategy::Error;
    }
    if (name == "wait") {
        return ClockBackwardStrategy::Wait;
    }
    if (name == "use_last_timestamp") {
        return ClockBackwardStrategy::UseLastTimestamp;
    }
    throw Error(ErrorCode::InvalidConfig, "unknown clock backward strategy '" + name + "'");
}

} // namespace flakeid::core
