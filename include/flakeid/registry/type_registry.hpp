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
 * @file type_registry.hpp
 * @brief Maps from generator type to factory, parser and validator implementations.
 *
 * @details
 * The three registries share one implementation, `TypeRegistry<T>`, differing
 * only in the interface they store and the error code raised on a miss.
 * Registration is last-writer-wins, so an application can replace a built-in
 * implementation or fill the reserved `uuid` and `custom` slots without any
 * change to this code.
 */

#pragma once

#include "flakeid/core/error.hpp"
#include "flakeid/core/interface.hpp"
#include "flakeid/core/types.hpp"
#include "flakeid/infra/logger.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <utility>
#include <vector>

namespace flakeid::registry {

/**
 * @class TypeRegistry
 * @brief Thread-safe `GeneratorType -> shared_ptr<T>` map.
 *
 * @tparam T The stored interface (`core::Factory`, `core::Parser`, `core::Validator`).
 */
template <typename T> class TypeRegistry {
  public:
    /**
     * @brief Stores `impl` under `type`, replacing any previous entry.
     * @throws core::Error InvalidGeneratorType for an undeclared type,
     * InvalidConfig for a null implementation.
     */
    void register_type(core::GeneratorType type, std::shared_ptr<T> impl)
    {
        if (!core::is_valid(type)) {
            throw core::Error(core::ErrorCode::InvalidGeneratorType,
                              std::string(core::to_string(type)));
        }
        if (!impl) {
            throw core::Error(core::ErrorCode::InvalidConfig, kind_ + " cannot be null");
        }

        {
            std::unique_lock lock(mutex_);
            entries_[type] = std::move(impl);
        }

        infra::Logger::log(infra::LogLevel::DEBUG, "Registry: " + kind_ + " registered for '" +
                                                       core::to_string(type) + "'");
    }

    /**
     * @brief Looks up the implementation for `type`.
     * @throws core::Error with this registry's not-found code.
     */
    std::shared_ptr<T> get(core::GeneratorType type) const
    {
        std::shared_lock lock(mutex_);
        auto it = entries_.find(type);
        if (it == entries_.end()) {
            throw core::Error(not_found_, kind_ + " not registered for '" +
                                              core::to_string(type) + "'");
        }
        return it->second;
    }

    bool has(core::GeneratorType type) const
    {
        std::shared_lock lock(mutex_);
        return entries_.count(type) > 0;
    }

    /// @brief Registered types in enum order.
    std::vector<core::GeneratorType> list() const
    {
        std::shared_lock lock(mutex_);
        std::vector<core::GeneratorType> types;
        types.reserve(entries_.size());
        for (const auto& entry : entries_) {
            types.push_back(entry.first);
        }
        return types;
    }

  protected:
    TypeRegistry(std::string kind, core::ErrorCode not_found)
        : kind_(std::move(kind)), not_found_(not_found)
    {
    }

  private:
    const std::string kind_;
    const core::ErrorCode not_found_;
    mutable std::shared_mutex mutex_;
    std::map<core::GeneratorType, std::shared_ptr<T>> entries_;
};

/// @brief Factories by generator type; misses raise `FactoryNotFound`.
class FactoryRegistry : public TypeRegistry<core::Factory> {
  public:
    FactoryRegistry() : TypeRegistry("factory", core::ErrorCode::FactoryNotFound) {}
};

/// @brief Parsers by generator type; misses raise `ParserNotFound`.
class ParserRegistry : public TypeRegistry<core::Parser> {
  public:
    ParserRegistry() : TypeRegistry("parser", core::ErrorCode::ParserNotFound) {}
};

/// @brief Validators by generator type; misses raise `ValidatorNotFound`.
class ValidatorRegistry : public TypeRegistry<core::Validator> {
  public:
    ValidatorRegistry() : TypeRegistry("validator", core::ErrorCode::ValidatorNotFound) {}
};

} // namespace flakeid::registry
