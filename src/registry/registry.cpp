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
 * @file registry.cpp
 * @brief Implementation of the keyed generator instance registry.
 */

#include "flakeid/registry/registry.hpp"

#include "flakeid/core/error.hpp"
#include "flakeid/infra/logger.hpp"

#include <cctype>
#include <mutex>
#include <optional>

namespace flakeid::registry {

namespace {

bool is_key_char(char c)
{
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-' || c == '.';
}

} // namespace

void validate_key(const std::string& key)
{
    if (key.empty()) {
        throw core::Error(core::ErrorCode::InvalidKey, "key cannot be empty");
    }

    if (key.size() > kMaxKeyLength) {
        throw core::Error(core::ErrorCode::InvalidKey,
                          "key too long (max " + std::to_string(kMaxKeyLength) + "), got " +
                              std::to_string(key.size()));
    }

    for (char c : key) {
        if (!is_key_char(c)) {
            throw core::Error(core::ErrorCode::InvalidKeyFormat,
                              "key '" + key + "' contains invalid characters");
        }
    }
}

Registry::Registry(const FactoryRegistry& factories) : factories_(factories) {}

std::shared_ptr<core::Generator> Registry::create(const std::string& key,
                                                  core::GeneratorType type,
                                                  const core::GeneratorConfig& config)
{
    validate_key(key);
    if (!core::is_valid(type)) {
        throw core::Error(core::ErrorCode::InvalidGeneratorType, core::to_string(type));
    }

    std::unique_lock lock(rw_lock_);

    if (generators_.count(key) > 0) {
        throw core::Error(core::ErrorCode::GeneratorAlreadyExists, "key '" + key + "'");
    }

    return insert_locked(key, type, config);
}

std::shared_ptr<core::Generator> Registry::get(const std::string& key) const
{
    validate_key(key);

    std::shared_lock lock(rw_lock_);

    auto it = generators_.find(key);
    if (it == generators_.end()) {
        throw core::Error(core::ErrorCode::GeneratorNotFound, "key '" + key + "'");
    }
    return it->second;
}

std::shared_ptr<core::Generator> Registry::get_or_create(const std::string& key,
                                                         core::GeneratorType type,
                                                         const core::GeneratorConfig& config)
{
    validate_key(key);
    if (!core::is_valid(type)) {
        throw core::Error(core::ErrorCode::InvalidGeneratorType, core::to_string(type));
    }

    std::unique_lock lock(rw_lock_);

    auto it = generators_.find(key);
    if (it != generators_.end()) {
        return it->second;
    }

    return insert_locked(key, type, config);
}

bool Registry::has(const std::string& key) const
{
    try {
        validate_key(key);
    } catch (const core::Error&) {
        return false;
    }

    std::shared_lock lock(rw_lock_);
    return generators_.count(key) > 0;
}

void Registry::remove(const std::string& key)
{
    validate_key(key);

    {
        std::unique_lock lock(rw_lock_);
        if (generators_.erase(key) == 0) {
            throw core::Error(core::ErrorCode::GeneratorNotFound, "key '" + key + "'");
        }
    }

    infra::Logger::log(infra::LogLevel::INFO, "Registry: Generator removed, key='" + key + "'");
}

void Registry::clear()
{
    {
        std::unique_lock lock(rw_lock_);
        generators_.clear();
    }

    infra::Logger::log(infra::LogLevel::INFO, "Registry: All generators cleared");
}

std::size_t Registry::count() const
{
    std::shared_lock lock(rw_lock_);
    return generators_.size();
}

std::vector<std::string> Registry::list_keys() const
{
    std::shared_lock lock(rw_lock_);

    std::vector<std::string> keys;
    keys.reserve(generators_.size());
    for (const auto& entry : generators_) {
        keys.push_back(entry.first);
    }
    return keys;
}

void Registry::set_max_generators(int max)
{
    if (max <= 0) {
        throw core::Error(core::ErrorCode::InvalidConfig,
                          "max generators must be positive, got " + std::to_string(max));
    }

    if (max > kAbsoluteMaxGenerators) {
        throw core::Error(core::ErrorCode::InvalidConfig,
                          "max generators cannot exceed absolute limit " +
                              std::to_string(kAbsoluteMaxGenerators) + ", got " +
                              std::to_string(max));
    }

    std::size_t current;
    {
        std::unique_lock lock(rw_lock_);
        current = generators_.size();
        if (current > static_cast<std::size_t>(max)) {
            throw core::Error(core::ErrorCode::InvalidConfig,
                              "current generator count " + std::to_string(current) +
                                  " exceeds new max " + std::to_string(max));
        }
        max_generators_ = max;
    }

    infra::Logger::log(infra::LogLevel::INFO, "Registry: Capacity set to " +
                                                  std::to_string(max) + " (in use: " +
                                                  std::to_string(current) + ")");
}

int Registry::max_generators() const
{
    std::shared_lock lock(rw_lock_);
    return max_generators_;
}

std::shared_ptr<core::Generator> Registry::insert_locked(const std::string& key,
                                                         core::GeneratorType type,
                                                         const core::GeneratorConfig& config)
{
    if (generators_.size() >= static_cast<std::size_t>(max_generators_)) {
        throw core::Error(core::ErrorCode::MaxGeneratorsReached,
                          "current " + std::to_string(generators_.size()) + ", max " +
                              std::to_string(max_generators_));
    }

    std::shared_ptr<core::Factory> factory = factories_.get(type);

    std::optional<core::GeneratorType> family = core::generator_type_of(config);
    if (family && *family != type) {
        throw core::Error(core::ErrorCode::InvalidConfig,
                          std::string("config of type ") + core::to_string(*family) +
                              " cannot build a " + core::to_string(type) + " generator");
    }

    std::shared_ptr<core::Generator> generator = factory->create(config);

    generators_.emplace(key, generator);

    infra::Logger::log(infra::LogLevel::INFO, "Registry: Generator created, key='" + key +
                                                  "', type=" + core::to_string(type));

    return generator;
}

} // namespace flakeid::registry
