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
 * @file metrics.cpp
 * @brief Snapshot and export of the generation counters.
 */

#include "flakeid/snowflake/metrics.hpp"

namespace flakeid::snowflake {

void Metrics::reset()
{
    id_count.store(0);
    sequence_overflow.store(0);
    clock_backward.store(0);
    wait_count.store(0);
    total_wait_time_ns.store(0);
}

MetricsSnapshot Metrics::snapshot() const
{
    MetricsSnapshot s;
    s.id_count = id_count.load();
    s.sequence_overflow = sequence_overflow.load();
    s.clock_backward = clock_backward.load();
    s.wait_count = wait_count.load();
    s.total_wait_time_ns = total_wait_time_ns.load();
    return s;
}

std::map<std::string, uint64_t> Metrics::to_map() const
{
    MetricsSnapshot s = snapshot();
    uint64_t avg_wait = s.wait_count > 0 ? s.total_wait_time_ns / s.wait_count : 0;

    return {
        {"metrics_enabled", 1},
        {"id_count", s.id_count},
        {"sequence_overflow", s.sequence_overflow},
        {"clock_backward", s.clock_backward},
        {"wait_count", s.wait_count},
        {"avg_wait_time_ns", avg_wait},
    };
}

} // namespace flakeid::snowflake
