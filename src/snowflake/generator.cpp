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
 * @file generator.cpp
 * @brief Implementation of the Snowflake generation state machine.
 *
 * @details
 * State transitions per generated ID:
 * 1. **Clock read**: take the current millisecond.
 * 2. **Backward check**: if it precedes the last used millisecond, apply the
 *    configured clock-backward policy.
 * 3. **Sequence step**: same millisecond increments the sequence (waiting for
 *    the next millisecond once 4095 is used), a new millisecond resets it.
 * 4. **Compose**: pack timestamp offset, fixed node bits and sequence.
 */

#include "flakeid/snowflake/generator.hpp"

#include "flakeid/core/error.hpp"
#include "flakeid/infra/logger.hpp"
#include "flakeid/snowflake/layout.hpp"

#include <algorithm>
#include <chrono>
#include <string>
#include <thread>
#include <utility>

namespace flakeid::snowflake {

namespace {

Config prepare(Config config)
{
    config.validate();
    config.apply_defaults();
    return config;
}

} // namespace

Generator::Generator(Config config)
    : config_(prepare(std::move(config))),
      precomputed_bits_((config_.datacenter_id << kDatacenterIdShift) |
                        (config_.worker_id << kWorkerIdShift)),
      metrics_(config_.enable_metrics ? std::make_unique<Metrics>() : nullptr),
      parser_(config_.clock)
{
    infra::Logger::log(infra::LogLevel::INFO,
                       "Snowflake: Generator created (datacenter=" +
                           std::to_string(config_.datacenter_id) +
                           ", worker=" + std::to_string(config_.worker_id) +
                           ", strategy=" + core::to_string(config_.clock_backward_strategy) +
                           ", metrics=" + (config_.enable_metrics ? "on" : "off") + ")");
}

std::shared_ptr<Generator> Generator::create(int64_t datacenter_id, int64_t worker_id)
{
    Config config;
    config.datacenter_id = datacenter_id;
    config.worker_id = worker_id;
    return std::make_shared<Generator>(std::move(config));
}

int64_t Generator::next_id()
{
    std::lock_guard<std::mutex> lock(mutex_);

    int64_t timestamp = current_ms();

    if (timestamp < last_timestamp_) {
        timestamp = resolve_clock_backward(timestamp);
    }

    if (timestamp == last_timestamp_) {
        if (sequence_ >= kMaxSequence) {
            timestamp = wait_next_millis();
            sequence_ = -1;
            last_timestamp_ = timestamp;
        }
        sequence_++;
    } else {
        sequence_ = 0;
        last_timestamp_ = timestamp;
    }

    int64_t id = compose(timestamp) | sequence_;

    if (metrics_) {
        metrics_->id_count.fetch_add(1);
    }

    return id;
}

/**
 * @brief Fills a batch millisecond by millisecond.
 *
 * Each pass hands out every sequence number still free in the current
 * millisecond (up to what is left of the request) from one precomposed base,
 * so the clock is read once per millisecond rather than once per ID.
 */
std::vector<int64_t> Generator::next_id_batch(int n)
{
    if (n <= 0) {
        throw core::Error(core::ErrorCode::InvalidBatchSize,
                          "batch size must be positive, got " + std::to_string(n));
    }
    if (n > kMaxBatchSize) {
        throw core::Error(core::ErrorCode::InvalidBatchSize,
                          "batch size too large (max " + std::to_string(kMaxBatchSize) +
                              "), got " + std::to_string(n));
    }

    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<int64_t> ids;
    ids.reserve(static_cast<std::size_t>(n));
    int64_t remaining = n;

    while (remaining > 0) {
        int64_t timestamp = current_ms();

        if (timestamp < last_timestamp_) {
            try {
                timestamp = resolve_clock_backward(timestamp);
            } catch (const core::Error& e) {
                std::size_t produced = ids.size();
                if (metrics_) {
                    metrics_->id_count.fetch_add(produced);
                }
                infra::Logger::log(infra::LogLevel::ERROR,
                                   "Snowflake: Batch interrupted after " +
                                       std::to_string(produced) + "/" + std::to_string(n) +
                                       " IDs: " + e.detail());
                throw core::BatchError(e.code(),
                                       e.detail() + " (generated " + std::to_string(produced) +
                                           "/" + std::to_string(n) + " IDs)",
                                       std::move(ids), static_cast<std::size_t>(n));
            }
        }

        int64_t available;
        if (timestamp == last_timestamp_) {
            available = kMaxSequence - sequence_;
            if (available <= 0) {
                timestamp = wait_next_millis();
                sequence_ = -1;
                last_timestamp_ = timestamp;
                available = kMaxSequence + 1;
            }
        } else {
            sequence_ = -1;
            last_timestamp_ = timestamp;
            available = kMaxSequence + 1;
        }

        int64_t take = std::min(remaining, available);
        int64_t base = compose(timestamp);
        for (int64_t i = 0; i < take; ++i) {
            sequence_++;
            ids.push_back(base | sequence_);
        }
        remaining -= take;
    }

    if (metrics_) {
        metrics_->id_count.fetch_add(static_cast<uint64_t>(n));
    }

    return ids;
}

std::map<std::string, uint64_t> Generator::metrics() const
{
    if (!metrics_) {
        return {{"metrics_enabled", 0}};
    }
    return metrics_->to_map();
}

void Generator::reset_metrics()
{
    if (metrics_) {
        metrics_->reset();
    }
}

uint64_t Generator::id_count() const
{
    if (!metrics_) {
        return 0;
    }
    return metrics_->id_count.load();
}

core::IdInfo Generator::parse_id(int64_t id) const
{
    return parser_.parse(id);
}

void Generator::validate_id(int64_t id) const
{
    parser_.validator().validate(id);
}

int64_t Generator::current_ms() const
{
    return infra::now_ms(config_.clock);
}

int64_t Generator::resolve_clock_backward(int64_t now)
{
    int64_t offset = last_timestamp_ - now;

    if (metrics_) {
        metrics_->clock_backward.fetch_add(1);
    }

    infra::Logger::log(infra::LogLevel::WARN,
                       "Snowflake: Clock moved backwards by " + std::to_string(offset) +
                           " ms (strategy=" +
                           core::to_string(config_.clock_backward_strategy) + ")");

    switch (config_.clock_backward_strategy) {
    case core::ClockBackwardStrategy::Error:
        throw core::Error(core::ErrorCode::ClockMovedBackwards,
                          "detected backward drift of " + std::to_string(offset) + " ms");

    case core::ClockBackwardStrategy::Wait:
        if (offset > config_.clock_backward_tolerance_ms) {
            throw core::Error(core::ErrorCode::ClockMovedBackwards,
                              "backward drift " + std::to_string(offset) +
                                  " ms exceeds tolerance " +
                                  std::to_string(config_.clock_backward_tolerance_ms) + " ms");
        }
        for (int retry = 0; retry < kMaxWaitRetries; ++retry) {
            std::this_thread::sleep_for(std::chrono::milliseconds(offset + 1));
            int64_t current = current_ms();
            if (current >= last_timestamp_) {
                return current;
            }
            offset = last_timestamp_ - current;
        }
        throw core::Error(core::ErrorCode::ClockMovedBackwards,
                          "backward drift persisted after " + std::to_string(kMaxWaitRetries) +
                              " retries");

    case core::ClockBackwardStrategy::UseLastTimestamp:
        infra::Logger::log(infra::LogLevel::WARN,
                           "Snowflake: Reusing last timestamp " + std::to_string(last_timestamp_) +
                               " until the clock catches up");
        return last_timestamp_;
    }

    throw core::Error(core::ErrorCode::ClockMovedBackwards, "unknown clock backward strategy");
}

int64_t Generator::wait_next_millis()
{
    if (metrics_) {
        metrics_->sequence_overflow.fetch_add(1);
        metrics_->wait_count.fetch_add(1);
    }

    auto started = std::chrono::steady_clock::now();

    int64_t timestamp = current_ms();
    while (timestamp <= last_timestamp_) {
        std::this_thread::sleep_for(std::chrono::microseconds(kSpinSleepMicros));
        timestamp = current_ms();
    }

    if (metrics_) {
        auto waited = std::chrono::duration_cast<std::chrono::nanoseconds>(
                          std::chrono::steady_clock::now() - started)
                          .count();
        metrics_->total_wait_time_ns.fetch_add(static_cast<uint64_t>(waited));
    }

    return timestamp;
}

int64_t Generator::compose(int64_t timestamp) const
{
    return ((timestamp - kEpochMs) << kTimestampShift) | precomputed_bits_;
}

} // namespace flakeid::snowflake
