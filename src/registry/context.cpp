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

#include "flakeid/registry/context.hpp"

#include "flakeid/snowflake/config.hpp"
#include "flakeid/snowflake/factory.hpp"
#include "flakeid/snowflake/parser.hpp"
#include "flakeid/snowflake/validator.hpp"

namespace flakeid::registry {

Context::Context() : generators_(factories_)
{
    factories_.register_type(core::GeneratorType::Snowflake,
                             std::make_shared<snowflake::Factory>());
    parsers_.register_type(core::GeneratorType::Snowflake, std::make_shared<snowflake::Parser>());
    validators_.register_type(core::GeneratorType::Snowflake,
                              std::make_shared<snowflake::Validator>());
}

std::shared_ptr<core::Generator> Context::default_generator()
{
    snowflake::Config config;
    config.datacenter_id = 0;
    config.worker_id = 0;
    return generators_.get_or_create(kDefaultGeneratorKey, core::GeneratorType::Snowflake,
                                     config);
}

} // namespace flakeid::registry
