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
 * @file interface.hpp
 * @brief Abstract contracts implemented by every generator family.
 *
 * @details
 * The registries only ever see these four interfaces. A family (Snowflake
 * today, UUID or a custom scheme later) provides one implementation of each
 * and registers them under its `GeneratorType`.
 *
 * All operations report failure by throwing `flakeid::core::Error`.
 */

#pragma once

#include "flakeid/core/generator_config.hpp"
#include "flakeid/core/types.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace flakeid::core {

/**
 * @class Validator
 * @brief Structural validity check of an ID.
 */
class Validator {
  public:
    virtual ~Validator() = default;

    /**
     * @brief Throws `InvalidSnowflakeId` (or the family's equivalent) if `id` is invalid.
     */
    virtual void validate(int64_t id) const = 0;

    /**
     * @brief Validates every element, stopping at the first invalid one.
     *
     * The error message names the index of the offending element. An empty
     * vector is valid.
     */
    virtual void validate_batch(const std::vector<int64_t>& ids) const = 0;
};

/**
 * @class Parser
 * @brief Decodes an ID into its components.
 */
class Parser {
  public:
    virtual ~Parser() = default;

    /**
     * @brief Validates `id`, then decodes it.
     * @throws core::Error if the ID is structurally invalid.
     */
    virtual IdInfo parse(int64_t id) const = 0;

    /// @brief Non-validating fast path; 0 for `id <= 0`.
    virtual int64_t extract_timestamp(int64_t id) const = 0;

    /// @brief Non-validating fast path; -1 for `id <= 0`.
    virtual int64_t extract_datacenter_id(int64_t id) const = 0;

    /// @brief Non-validating fast path; -1 for `id <= 0`.
    virtual int64_t extract_worker_id(int64_t id) const = 0;

    /// @brief Non-validating fast path; -1 for `id <= 0`.
    virtual int64_t extract_sequence(int64_t id) const = 0;
};

/**
 * @class Generator
 * @brief Thread-safe source of unique IDs.
 */
class Generator {
  public:
    virtual ~Generator() = default;

    /// @brief Family of this generator.
    virtual GeneratorType type() const = 0;

    /**
     * @brief Produces the next ID.
     * @throws core::Error ClockMovedBackwards when the clock policy refuses.
     */
    virtual int64_t next_id() = 0;

    /**
     * @brief Produces `n` IDs in one critical section.
     *
     * @throws core::Error InvalidBatchSize for `n` outside [1, 100000].
     * @throws core::BatchError when generation stops midway; it carries the IDs
     * produced so far.
     */
    virtual std::vector<int64_t> next_id_batch(int n) = 0;

    virtual int64_t worker_id() const = 0;
    virtual int64_t datacenter_id() const = 0;

    /**
     * @brief Counter export; `{"metrics_enabled": 0}` when metrics are off.
     */
    virtual std::map<std::string, uint64_t> metrics() const = 0;

    /// @brief Zeroes the counters (no-op when metrics are off).
    virtual void reset_metrics() = 0;

    /// @brief IDs produced so far (0 when metrics are off).
    virtual uint64_t id_count() const = 0;

    /// @brief Decodes an ID with this generator's parser.
    virtual IdInfo parse_id(int64_t id) const = 0;

    /// @brief Validates an ID with this generator's validator.
    virtual void validate_id(int64_t id) const = 0;
};

/**
 * @class Factory
 * @brief Builds generators of one family from a `GeneratorConfig`.
 */
class Factory {
  public:
    virtual ~Factory() = default;

    /**
     * @brief Creates a generator.
     * @throws core::Error InvalidConfig if `config` holds another family's
     * alternative (or none), plus any validation error of the family.
     */
    virtual std::shared_ptr<Generator> create(const GeneratorConfig& config) const = 0;
};

} // namespace flakeid::core
