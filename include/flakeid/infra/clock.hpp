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
 * @file clock.hpp
 * @brief Millisecond time source used by generators and validators.
 *
 * @details
 * Components that depend on wall-clock time take a `Clock` so that clock
 * anomalies (NTP steps, leap smearing) can be simulated deterministically.
 * An empty `Clock` means "use the system clock".
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>

namespace flakeid::infra {

/// @brief Returns the current Unix time in milliseconds.
using Clock = std::function<int64_t()>;

/// @brief Reads `std::chrono::system_clock` as Unix milliseconds.
inline int64_t system_now_ms()
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

/// @brief Reads `clock`, falling back to the system clock when it is empty.
inline int64_t now_ms(const Clock& clock)
{
    return clock ? clock() : system_now_ms();
}

} // namespace flakeid::infra
