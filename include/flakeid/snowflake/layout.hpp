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
 * @file layout.hpp
 * @brief Bit layout and operational limits of a Snowflake ID.
 *
 * @details
 * ```
 * +--------+----------------------+---------------+-----------+----------------+
 * | 1 bit  | 41 bits              | 5 bits        | 5 bits    | 12 bits        |
 * | unused | ms since kEpochMs    | datacenter ID | worker ID | sequence       |
 * +--------+----------------------+---------------+-----------+----------------+
 * ```
 * The layout is fixed at compile time. Changing `kEpochMs` is a breaking
 * migration: IDs issued under the old epoch lose their ordering relative to
 * new ones.
 */

#pragma once

#include <cstdint>

namespace flakeid::snowflake {

/// @brief 2023-01-01T00:00:00+08:00 in Unix milliseconds.
inline constexpr int64_t kEpochMs = 1672502400000LL;

inline constexpr int kTimestampBits = 41;
inline constexpr int kDatacenterIdBits = 5;
inline constexpr int kWorkerIdBits = 5;
inline constexpr int kSequenceBits = 12;

inline constexpr int64_t kMaxDatacenterId = (int64_t{1} << kDatacenterIdBits) - 1; // 31
inline constexpr int64_t kMaxWorkerId = (int64_t{1} << kWorkerIdBits) - 1;         // 31
inline constexpr int64_t kMaxSequence = (int64_t{1} << kSequenceBits) - 1;         // 4095

inline constexpr int kWorkerIdShift = kSequenceBits;                                   // 12
inline constexpr int kDatacenterIdShift = kSequenceBits + kWorkerIdBits;               // 17
inline constexpr int kTimestampShift = kSequenceBits + kWorkerIdBits + kDatacenterIdBits; // 22

/// @brief Sleep between clock polls while waiting out an exhausted sequence.
inline constexpr int64_t kSpinSleepMicros = 100;

/// @brief Clock-backward tolerance applied when none (or an invalid one) is set.
inline constexpr int64_t kDefaultClockBackwardToleranceMs = 5;

/// @brief Upper bound for the clock-backward tolerance.
inline constexpr int64_t kMaxClockBackwardToleranceMs = 1000;

/// @brief Re-checks performed by the Wait strategy before giving up.
inline constexpr int kMaxWaitRetries = 10;

/// @brief Largest batch accepted by `next_id_batch`.
inline constexpr int kMaxBatchSize = 100000;

/// @brief How far past "now" a decoded timestamp may lie and still validate.
inline constexpr int64_t kMaxFutureToleranceMs = 60 * 1000;

} // namespace flakeid::snowflake
