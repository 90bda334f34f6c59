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
 * @file registry_test.cpp
 * @brief Unit tests for the type registries, the instance registry and the context.
 *
 * @details
 * Every test builds its own `Context`, so no state leaks between cases.
 */

#include "flakeid/core/error.hpp"
#include "flakeid/registry/context.hpp"
#include "flakeid/registry/registry.hpp"
#include "flakeid/snowflake/config.hpp"
#include "flakeid/snowflake/factory.hpp"
#include "flakeid/snowflake/parser.hpp"
#include "framework.hpp"

#include <algorithm>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using flakeid::core::ErrorCode;
using flakeid::core::GeneratorType;
using flakeid::registry::Context;

namespace {

flakeid::snowflake::Config node(int64_t datacenter, int64_t worker)
{
    flakeid::snowflake::Config cfg;
    cfg.datacenter_id = datacenter;
    cfg.worker_id = worker;
    return cfg;
}

} // namespace

// ============================================================================
// Type registries
// ============================================================================

void test_context_registers_snowflake()
{
    Context ctx;

    ASSERT_TRUE(ctx.factories().has(GeneratorType::Snowflake));
    ASSERT_TRUE(ctx.parsers().has(GeneratorType::Snowflake));
    ASSERT_TRUE(ctx.validators().has(GeneratorType::Snowflake));

    ASSERT_FALSE(ctx.factories().has(GeneratorType::Uuid));
    ASSERT_EQ(ctx.parsers().list().size(), static_cast<size_t>(1));
}

void test_type_registry_errors()
{
    Context ctx;

    ASSERT_THROWS_CODE(ctx.factories().get(GeneratorType::Uuid), ErrorCode::FactoryNotFound);
    ASSERT_THROWS_CODE(ctx.parsers().get(GeneratorType::Custom), ErrorCode::ParserNotFound);
    ASSERT_THROWS_CODE(ctx.validators().get(GeneratorType::Uuid), ErrorCode::ValidatorNotFound);

    ASSERT_THROWS_CODE(ctx.parsers().register_type(GeneratorType::Custom, nullptr),
                       ErrorCode::InvalidConfig);
    ASSERT_THROWS_CODE(ctx.parsers().register_type(static_cast<GeneratorType>(12),
                                                   std::make_shared<flakeid::snowflake::Parser>()),
                       ErrorCode::InvalidGeneratorType);
}

/**
 * @brief Registering into a reserved slot makes it resolvable; re-registering replaces.
 */
void test_type_registry_replace()
{
    Context ctx;

    auto first = std::make_shared<flakeid::snowflake::Parser>();
    auto second = std::make_shared<flakeid::snowflake::Parser>();

    ctx.parsers().register_type(GeneratorType::Custom, first);
    ASSERT_TRUE(ctx.parsers().get(GeneratorType::Custom) == first);

    ctx.parsers().register_type(GeneratorType::Custom, second);
    ASSERT_TRUE(ctx.parsers().get(GeneratorType::Custom) == second);

    std::vector<GeneratorType> types = ctx.parsers().list();
    ASSERT_EQ(types.size(), static_cast<size_t>(2));
    ASSERT_TRUE(types[0] == GeneratorType::Snowflake);
    ASSERT_TRUE(types[1] == GeneratorType::Custom);
}

// ============================================================================
// Instance registry
// ============================================================================

void test_registry_key_rules()
{
    flakeid::registry::validate_key("user-service_v1.2");
    flakeid::registry::validate_key(std::string(256, 'k'));

    ASSERT_THROWS_CODE(flakeid::registry::validate_key(""), ErrorCode::InvalidKey);
    ASSERT_THROWS_CODE(flakeid::registry::validate_key(std::string(257, 'k')),
                       ErrorCode::InvalidKey);
    ASSERT_THROWS_CODE(flakeid::registry::validate_key("bad key"), ErrorCode::InvalidKeyFormat);
    ASSERT_THROWS_CODE(flakeid::registry::validate_key("orders/eu"), ErrorCode::InvalidKeyFormat);

    Context ctx;
    ASSERT_THROWS_CODE(ctx.generators().create("a:b", GeneratorType::Snowflake, node(0, 0)),
                       ErrorCode::InvalidKeyFormat);
    ASSERT_THROWS_CODE(ctx.generators().get(""), ErrorCode::InvalidKey);
    ASSERT_FALSE(ctx.generators().has("a:b"));
}

void test_registry_lifecycle()
{
    Context ctx;
    flakeid::registry::Registry& reg = ctx.generators();

    auto orders = reg.create("orders", GeneratorType::Snowflake, node(1, 1));
    reg.create("users", GeneratorType::Snowflake, node(1, 2));

    ASSERT_EQ(reg.count(), static_cast<size_t>(2));
    ASSERT_TRUE(reg.has("orders"));
    ASSERT_TRUE(reg.get("orders") == orders);

    std::vector<std::string> keys = reg.list_keys();
    std::sort(keys.begin(), keys.end());
    ASSERT_EQ(keys.size(), static_cast<size_t>(2));
    ASSERT_EQ(keys[0], std::string("orders"));
    ASSERT_EQ(keys[1], std::string("users"));

    ASSERT_THROWS_CODE(reg.create("orders", GeneratorType::Snowflake, node(2, 2)),
                       ErrorCode::GeneratorAlreadyExists);

    reg.remove("orders");
    ASSERT_FALSE(reg.has("orders"));
    ASSERT_THROWS_CODE(reg.get("orders"), ErrorCode::GeneratorNotFound);
    ASSERT_THROWS_CODE(reg.remove("orders"), ErrorCode::GeneratorNotFound);

    // A removed instance stays usable by whoever still holds it.
    ASSERT_TRUE(orders->next_id() > 0);

    reg.clear();
    ASSERT_EQ(reg.count(), static_cast<size_t>(0));
}

void test_registry_create_failures()
{
    Context ctx;
    flakeid::registry::Registry& reg = ctx.generators();

    ASSERT_THROWS_CODE(reg.create("u", GeneratorType::Uuid, node(0, 0)),
                       ErrorCode::FactoryNotFound);
    ASSERT_THROWS_CODE(reg.create("x", static_cast<GeneratorType>(5), node(0, 0)),
                       ErrorCode::InvalidGeneratorType);
    ASSERT_THROWS_CODE(reg.create("e", GeneratorType::Snowflake, flakeid::core::GeneratorConfig{}),
                       ErrorCode::InvalidConfig);
    ASSERT_THROWS_CODE(reg.create("w", GeneratorType::Snowflake, node(0, 99)),
                       ErrorCode::InvalidWorkerId);

    // A factory registered under another family still rejects a Snowflake config.
    ctx.factories().register_type(GeneratorType::Uuid,
                                  std::make_shared<flakeid::snowflake::Factory>());
    ASSERT_THROWS_CODE(reg.create("u", GeneratorType::Uuid, node(0, 0)),
                       ErrorCode::InvalidConfig);
    ASSERT_FALSE(reg.has("u"));

    // Failed creations leave nothing behind.
    ASSERT_EQ(reg.count(), static_cast<size_t>(0));
}

/**
 * @brief Capacity of two: the third entry is refused until one is removed.
 */
void test_registry_capacity()
{
    Context ctx;
    flakeid::registry::Registry& reg = ctx.generators();

    ASSERT_EQ(reg.max_generators(), flakeid::registry::kDefaultMaxGenerators);

    reg.set_max_generators(2);
    reg.create("a", GeneratorType::Snowflake, node(0, 1));
    reg.create("b", GeneratorType::Snowflake, node(0, 2));

    ASSERT_THROWS_CODE(reg.create("c", GeneratorType::Snowflake, node(0, 3)),
                       ErrorCode::MaxGeneratorsReached);
    ASSERT_THROWS_CODE(reg.get_or_create("c", GeneratorType::Snowflake, node(0, 3)),
                       ErrorCode::MaxGeneratorsReached);

    // Existing keys are still served at capacity.
    ASSERT_TRUE(reg.get_or_create("a", GeneratorType::Snowflake, node(0, 9))->worker_id() == 1);

    ASSERT_THROWS_CODE(reg.set_max_generators(1), ErrorCode::InvalidConfig);
    ASSERT_EQ(reg.max_generators(), 2);

    reg.remove("a");
    reg.create("c", GeneratorType::Snowflake, node(0, 3));
    ASSERT_EQ(reg.count(), static_cast<size_t>(2));
}

void test_registry_capacity_limits()
{
    Context ctx;
    flakeid::registry::Registry& reg = ctx.generators();

    ASSERT_THROWS_CODE(reg.set_max_generators(0), ErrorCode::InvalidConfig);
    ASSERT_THROWS_CODE(reg.set_max_generators(-4), ErrorCode::InvalidConfig);
    ASSERT_THROWS_CODE(reg.set_max_generators(flakeid::registry::kAbsoluteMaxGenerators + 1),
                       ErrorCode::InvalidConfig);

    reg.set_max_generators(flakeid::registry::kAbsoluteMaxGenerators);
    ASSERT_EQ(reg.max_generators(), flakeid::registry::kAbsoluteMaxGenerators);
}

/**
 * @brief Racing `get_or_create` calls for one key all get the same single instance.
 */
void test_registry_concurrent_get_or_create()
{
    Context ctx;
    flakeid::registry::Registry& reg = ctx.generators();

    const int threads = 16;
    std::vector<std::shared_ptr<flakeid::core::Generator>> results(threads);
    std::vector<std::thread> workers;

    for (int t = 0; t < threads; ++t) {
        workers.emplace_back([&, t]() {
            results[t] = reg.get_or_create("shared", GeneratorType::Snowflake, node(4, 4));
        });
    }
    for (auto& w : workers) {
        w.join();
    }

    ASSERT_EQ(reg.count(), static_cast<size_t>(1));
    for (const auto& r : results) {
        ASSERT_TRUE(r != nullptr);
        ASSERT_TRUE(r == results[0]);
    }
}

void test_context_default_generator()
{
    Context ctx;

    auto first = ctx.default_generator();
    auto second = ctx.default_generator();

    ASSERT_TRUE(first == second);
    ASSERT_EQ(first->datacenter_id(), static_cast<int64_t>(0));
    ASSERT_EQ(first->worker_id(), static_cast<int64_t>(0));
    ASSERT_TRUE(ctx.generators().has(flakeid::registry::kDefaultGeneratorKey));

    // Separate contexts share nothing.
    Context other;
    ASSERT_FALSE(other.generators().has(flakeid::registry::kDefaultGeneratorKey));
}
