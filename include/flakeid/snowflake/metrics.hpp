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
 * @file metrics.hpp
 * @brief Lock-free generation counters.
 *
 * @details
 * Counters are updated by the generator while it holds its own mutex, but are
 * atomics so that monitoring threads may read them at any time without
 * contending on that mutex.
 */

#pragma once

#include <atomic>
#include <cstdint>
#include <map>
#include <string>

namespace flakeid::snowflake {

/**
 * @struct MetricsSnapshot
 * @brief Plain copy of the counters at one instant.
 */
struct MetricsSnapshot {
    uint64_t id_count = 0;
    uint64_t sequence_overflow = 0;
    uint64_t clock_backward = 0;
    uint64_t wait_count = 0;
    uint64_t total_wait_time_ns = 0;
};

/**
 * @class Metrics
 * @brief Atomic counters owned by one generator.
 */
class Metrics {
  public:
    std::atomic<uint64_t> id_count{0};           ///< IDs handed out.
    std::atomic<uint64_t> sequence_overflow{0};  ///< Sequence exhaustions within one ms.
    std::atomic<uint64_t> clock_backward{0};     ///< Backward clock observations.
    std::atomic<uint64_t> wait_count{0};         ///< Waits for the next millisecond.
    std::atomic<uint64_t> total_wait_time_ns{0}; ///< Cumulative time spent in those waits.

    /// @brief Zeroes every counter.
    void reset();

    /// @brief Copies every counter.
    MetricsSnapshot snapshot() const;

    /**
     * @brief Exports the counters under their public names.
     *
     * Keys: `metrics_enabled` (always 1), `id_count`, `sequence_overflow`,
     * `clock_backward`, `wait_count`, `avg_wait_time_ns` (0 when no wait happened).
     */
    std::map<std::string, uint64_t> to_map() const;
};

} // namespace flakeid::snowflake
