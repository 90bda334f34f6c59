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
 * @file settings.hpp
 * @brief JSON-backed runtime settings for the command-line tool and embedders.
 *
 * @details
 * A settings document looks like:
 *
 * @code{.json}
 * {
 *   "log_level": "info",
 *   "max_generators": 100,
 *   "generator": {
 *     "datacenter_id": 1,
 *     "worker_id": 2,
 *     "clock_backward_strategy": "wait",
 *     "clock_backward_tolerance_ms": 5,
 *     "enable_metrics": true
 *   }
 * }
 * @endcode
 *
 * Every key is optional and unknown keys are ignored.
 */

#pragma once

#include "flakeid/infra/logger.hpp"
#include "flakeid/registry/registry.hpp"
#include "flakeid/snowflake/config.hpp"

#include <string>

namespace flakeid::infra {

/**
 * @struct Settings
 * @brief Parsed settings with defaults for absent keys.
 */
struct Settings {
    snowflake::Config generator;
    int max_generators = registry::kDefaultMaxGenerators;

    /// @brief WARN keeps stdout free of INFO lines when IDs are printed there.
    LogLevel log_level = LogLevel::WARN;
};

/**
 * @brief Parses a settings document.
 *
 * The generator section is validated with `snowflake::Config::validate`.
 *
 * @throws core::Error InvalidConfig for malformed JSON, a value of the wrong
 * type or an unknown level or strategy name; the bound errors of
 * `Config::validate` for out-of-range generator values.
 */
Settings parse_settings(const std::string& json);

/**
 * @brief Reads and parses the settings file at `path`.
 * @throws core::Error InvalidConfig if the file cannot be read, plus every
 * error of `parse_settings`.
 */
Settings load_settings(const std::string& path);

} // namespace flakeid::infra
