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
 * @file generator.hpp
 * @brief The Snowflake ID generation state machine.
 *
 * @details
 * A `Generator` owns the (last timestamp, sequence) state of one
 * (datacenter, worker) pair and turns wall-clock readings into strictly
 * increasing 64-bit IDs. Two generators configured with the same pair will
 * produce colliding IDs; assigning distinct pairs is the caller's job.
 */

#pragma once

#include "flakeid/core/interface.hpp"
#include "flakeid/snowflake/config.hpp"
#include "flakeid/snowflake/metrics.hpp"
#include "flakeid/snowflake/parser.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace flakeid::snowflake {

/**
 * @class Generator
 * @brief Thread-safe Snowflake generator.
 *
 * @details
 * **Concurrency Model:**
 * Every call to `next_id` or `next_id_batch` runs under one mutex for its whole
 * duration, including the sleeps of the Wait strategy and the poll loop that
 * waits out an exhausted sequence. One instance therefore tops out at 4096 IDs
 * per millisecond, and a caller stuck in a wait stalls every other caller of
 * the same instance. Metrics may be read concurrently without that mutex.
 *
 * @code
 * flakeid::snowflake::Config cfg;
 * cfg.datacenter_id = 5;
 * cfg.worker_id = 10;
 * flakeid::snowflake::Generator gen(cfg);
 * int64_t id = gen.next_id();
 * @endcode
 */
class Generator : public core::Generator {
  public:
    /**
     * @brief Validates and defaults `config`, then keeps a private copy of it.
     * @throws core::Error InvalidDatacenterId, InvalidWorkerId or InvalidConfig.
     */
    explicit Generator(Config config);

    /**
     * @brief Shorthand for a generator with default policy and metrics off.
     */
    static std::shared_ptr<Generator> create(int64_t datacenter_id, int64_t worker_id);

    core::GeneratorType type() const override { return core::GeneratorType::Snowflake; }

    int64_t next_id() override;
    std::vector<int64_t> next_id_batch(int n) override;

    int64_t worker_id() const override { return config_.worker_id; }
    int64_t datacenter_id() const override { return config_.datacenter_id; }

    std::map<std::string, uint64_t> metrics() const override;
    void reset_metrics() override;
    uint64_t id_count() const override;

    core::IdInfo parse_id(int64_t id) const override;
    void validate_id(int64_t id) const override;

    /// @brief The effective (validated, defaulted) configuration.
    const Config& config() const { return config_; }

  private:
    int64_t current_ms() const;

    /**
     * @brief Applies the clock-backward policy.
     *
     * Called with the mutex held when `now < last_timestamp_`.
     * @return The timestamp to generate with (never below `last_timestamp_`).
     * @throws core::Error ClockMovedBackwards when the policy refuses.
     */
    int64_t resolve_clock_backward(int64_t now);

    /**
     * @brief Polls the clock until it passes `last_timestamp_`.
     *
     * Records the overflow and the time spent waiting when metrics are on.
     */
    int64_t wait_next_millis();

    int64_t compose(int64_t timestamp) const;

    const Config config_;
    const int64_t precomputed_bits_;
    const std::unique_ptr<Metrics> metrics_;
    const Parser parser_;

    std::mutex mutex_;
    int64_t last_timestamp_ = -1;
    int64_t sequence_ = -1;
};

} // namespace flakeid::snowflake
