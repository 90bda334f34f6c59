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
 * @file registry.hpp
 * @brief Keyed, capacity-bounded store of live generator instances.
 *
 * @details
 * Applications that need several generators (one per tenant, per shard, per
 * entity type) keep them here under string keys instead of threading them
 * through their own code.
 */

#pragma once

#include "flakeid/core/generator_config.hpp"
#include "flakeid/core/interface.hpp"
#include "flakeid/core/types.hpp"
#include "flakeid/registry/type_registry.hpp"

#include <cstddef>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace flakeid::registry {

/// @brief Capacity applied to a new registry.
inline constexpr int kDefaultMaxGenerators = 100;

/// @brief Ceiling accepted by `set_max_generators`.
inline constexpr int kAbsoluteMaxGenerators = 100000;

/// @brief Longest accepted instance key.
inline constexpr std::size_t kMaxKeyLength = 256;

/**
 * @brief Checks an instance key against `^[a-zA-Z0-9_\-.]+$` and the length limit.
 * @throws core::Error InvalidKey (empty, too long) or InvalidKeyFormat.
 */
void validate_key(const std::string& key);

/**
 * @class Registry
 * @brief Thread-safe `key -> Generator` map.
 *
 * @details
 * **Concurrency Model:**
 * - Readers (`get`, `has`, `count`, `list_keys`, `max_generators`) take a
 *   shared lock and run concurrently.
 * - Writers (`create`, `get_or_create`, `remove`, `clear`,
 *   `set_max_generators`) take the exclusive lock. `get_or_create` performs
 *   its lookup and its creation inside the same exclusive section, so racing
 *   callers for one key all receive the single instance that was created.
 *
 * Generators are handed out as `shared_ptr`; removing a key does not
 * invalidate instances that callers still hold.
 */
class Registry {
  public:
    /**
     * @param factories Factory lookup used to build new instances; must
     * outlive the registry.
     */
    explicit Registry(const FactoryRegistry& factories);

    /**
     * @brief Builds and stores a new generator under `key`.
     *
     * @throws core::Error InvalidKey, InvalidKeyFormat, InvalidGeneratorType,
     * GeneratorAlreadyExists, MaxGeneratorsReached, FactoryNotFound, or any
     * error raised by the factory.
     */
    std::shared_ptr<core::Generator> create(const std::string& key, core::GeneratorType type,
                                            const core::GeneratorConfig& config);

    /**
     * @brief Returns the generator under `key`.
     * @throws core::Error InvalidKey, InvalidKeyFormat or GeneratorNotFound.
     */
    std::shared_ptr<core::Generator> get(const std::string& key) const;

    /**
     * @brief Returns the generator under `key`, building it first if absent.
     *
     * An existing instance is returned as is; `type` and `config` are only
     * used on a miss.
     */
    std::shared_ptr<core::Generator> get_or_create(const std::string& key,
                                                   core::GeneratorType type,
                                                   const core::GeneratorConfig& config);

    /// @brief False for unknown or malformed keys.
    bool has(const std::string& key) const;

    /**
     * @brief Drops the registry's reference to the generator under `key`.
     * @throws core::Error InvalidKey, InvalidKeyFormat or GeneratorNotFound.
     */
    void remove(const std::string& key);

    /// @brief Drops every entry.
    void clear();

    std::size_t count() const;

    /// @brief Keys in unspecified order.
    std::vector<std::string> list_keys() const;

    /**
     * @brief Changes the capacity.
     * @throws core::Error InvalidConfig if `max` is not in [1, 100000] or is
     * below the current number of entries.
     */
    void set_max_generators(int max);

    int max_generators() const;

  private:
    /// @brief Builds and stores an instance; caller holds the exclusive lock.
    std::shared_ptr<core::Generator> insert_locked(const std::string& key,
                                                   core::GeneratorType type,
                                                   const core::GeneratorConfig& config);

    const FactoryRegistry& factories_;
    mutable std::shared_mutex rw_lock_;
    std::unordered_map<std::string, std::shared_ptr<core::Generator>> generators_;
    int max_generators_ = kDefaultMaxGenerators;
};

} // namespace flakeid::registry
