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
 * @file context.hpp
 * @brief Composition root owning the type registries and the instance registry.
 *
 * @details
 * A `Context` replaces process-wide singletons: the application builds one at
 * startup and passes it (or the registries it exposes) to the code that needs
 * them. Tests build their own and never share state.
 */

#pragma once

#include "flakeid/core/interface.hpp"
#include "flakeid/registry/registry.hpp"
#include "flakeid/registry/type_registry.hpp"

#include <memory>
#include <string>

namespace flakeid::registry {

/// @brief Key under which `Context::default_generator` stores its instance.
inline constexpr const char* kDefaultGeneratorKey = "default";

/**
 * @class Context
 * @brief Owns a factory, parser and validator registry plus a generator registry.
 *
 * A new context has the Snowflake factory, parser and validator registered.
 */
class Context {
  public:
    Context();

    // Registry holds a reference to factories_.
    Context(const Context&) = delete;
    Context& operator=(const Context&) = delete;

    FactoryRegistry& factories() { return factories_; }
    const FactoryRegistry& factories() const { return factories_; }

    ParserRegistry& parsers() { return parsers_; }
    const ParserRegistry& parsers() const { return parsers_; }

    ValidatorRegistry& validators() { return validators_; }
    const ValidatorRegistry& validators() const { return validators_; }

    Registry& generators() { return generators_; }
    const Registry& generators() const { return generators_; }

    /**
     * @brief Returns the Snowflake generator (datacenter 0, worker 0) kept
     * under the `"default"` key, creating it on first use.
     */
    std::shared_ptr<core::Generator> default_generator();

  private:
    FactoryRegistry factories_;
    ParserRegistry parsers_;
    ValidatorRegistry validators_;
    Registry generators_;
};

} // namespace flakeid::registry
