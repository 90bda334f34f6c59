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
 * @file core_test.cpp
 * @brief Unit tests for the shared vocabulary (error codes, enums, config union).
 */

#include "flakeid/core/error.hpp"
#include "flakeid/core/generator_config.hpp"
#include "flakeid/core/types.hpp"
#include "framework.hpp"

#include <string>
#include <vector>

using flakeid::core::ClockBackwardStrategy;
using flakeid::core::ErrorCode;
using flakeid::core::GeneratorType;

/**
 * @brief The message carries the code name, the detail stays accessible on its own.
 */
void test_error_message_format()
{
    flakeid::core::Error e(ErrorCode::InvalidWorkerId, "got 40");

    ASSERT_EQ(std::string(e.what()), std::string("InvalidWorkerId: got 40"));
    ASSERT_EQ(e.detail(), std::string("got 40"));
    ASSERT_TRUE(e.code() == ErrorCode::InvalidWorkerId);
}

void test_batch_error_carries_partial_ids()
{
    std::vector<int64_t> produced = {10, 11, 12};
    flakeid::core::BatchError e(ErrorCode::ClockMovedBackwards, "drift", produced, 50);

    ASSERT_TRUE(e.code() == ErrorCode::ClockMovedBackwards);
    ASSERT_EQ(e.partial_ids().size(), static_cast<size_t>(3));
    ASSERT_EQ(e.partial_ids()[2], static_cast<int64_t>(12));
    ASSERT_EQ(e.requested(), static_cast<size_t>(50));

    // Still catchable as a plain Error.
    ASSERT_THROWS_CODE(throw e, ErrorCode::ClockMovedBackwards);
}

/**
 * @brief Name mapping of both enums, including values outside the declared set.
 */
void test_enum_names()
{
    ASSERT_EQ(std::string(flakeid::core::to_string(GeneratorType::Snowflake)),
              std::string("snowflake"));
    ASSERT_EQ(std::string(flakeid::core::to_string(GeneratorType::Uuid)), std::string("uuid"));
    ASSERT_EQ(std::string(flakeid::core::to_string(GeneratorType::Custom)), std::string("custom"));

    ASSERT_EQ(std::string(flakeid::core::to_string(ClockBackwardStrategy::UseLastTimestamp)),
              std::string("UseLastTimestamp"));
    ASSERT_EQ(std::string(flakeid::core::to_string(static_cast<ClockBackwardStrategy>(42))),
              std::string("Unknown"));

    ASSERT_TRUE(flakeid::core::is_valid(GeneratorType::Custom));
    ASSERT_FALSE(flakeid::core::is_valid(static_cast<GeneratorType>(7)));
    ASSERT_TRUE(flakeid::core::is_valid(ClockBackwardStrategy::Wait));
    ASSERT_FALSE(flakeid::core::is_valid(static_cast<ClockBackwardStrategy>(-1)));
}

void test_enum_parsing()
{
    ASSERT_TRUE(flakeid::core::parse_generator_type("uuid") == GeneratorType::Uuid);
    ASSERT_TRUE(flakeid::core::parse_strategy("use_last_timestamp") ==
                ClockBackwardStrategy::UseLastTimestamp);
    ASSERT_TRUE(flakeid::core::parse_strategy("wait") == ClockBackwardStrategy::Wait);

    ASSERT_THROWS_CODE(flakeid::core::parse_generator_type("Snowflake"),
                       ErrorCode::InvalidGeneratorType);
    ASSERT_THROWS_CODE(flakeid::core::parse_strategy("retry"), ErrorCode::InvalidConfig);
}

void test_generator_config_family()
{
    flakeid::core::GeneratorConfig empty;
    ASSERT_FALSE(flakeid::core::generator_type_of(empty).has_value());

    flakeid::core::GeneratorConfig snowflake = flakeid::snowflake::Config{};
    ASSERT_TRUE(flakeid::core::generator_type_of(snowflake) == GeneratorType::Snowflake);
}
