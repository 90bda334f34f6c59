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
 * @file parser.cpp
 * @brief Implementation of the Snowflake ID decoder.
 */

#include "flakeid/snowflake/parser.hpp"

#include "flakeid/snowflake/layout.hpp"

#include <utility>

namespace flakeid::snowflake {

Parser::Parser(infra::Clock clock) : validator_(std::move(clock)) {}

core::IdInfo Parser::parse(int64_t id) const
{
    validator_.validate(id);

    core::IdInfo info;
    info.id = id;
    info.timestamp_ms = (id >> kTimestampShift) + kEpochMs;
    info.datacenter_id = (id >> kDatacenterIdShift) & kMaxDatacenterId;
    info.worker_id = (id >> kWorkerIdShift) & kMaxWorkerId;
    info.sequence = id & kMaxSequence;
    return info;
}

int64_t Parser::extract_timestamp(int64_t id) const
{
    if (id <= 0) {
        return 0;
    }
    return (id >> kTimestampShift) + kEpochMs;
}

int64_t Parser::extract_datacenter_id(int64_t id) const
{
    if (id <= 0) {
        return -1;
    }
    return (id >> kDatacenterIdShift) & kMaxDatacenterId;
}

int64_t Parser::extract_worker_id(int64_t id) const
{
    if (id <= 0) {
        return -1;
    }
    return (id >> kWorkerIdShift) & kMaxWorkerId;
}

int64_t Parser::extract_sequence(int64_t id) const
{
    if (id <= 0) {
        return -1;
    }
    return id & kMaxSequence;
}

} // namespace flakeid::snowflake
