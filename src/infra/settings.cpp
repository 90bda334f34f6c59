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
 * @file settings.cpp
 * @brief Implementation of the settings loader.
 */

#include "flakeid/infra/settings.hpp"

#include "flakeid/core/error.hpp"
#include "flakeid/core/types.hpp"

#include <cJSON.h>
#include <cmath>
#include <fstream>
#include <sstream>

namespace flakeid::infra {

namespace {

core::Error invalid(const std::string& detail)
{
    return core::Error(core::ErrorCode::InvalidConfig, detail);
}

/// @brief Reads an integral number member into `out`; absent members leave it untouched.
template <typename Int> void read_int(const cJSON* object, const char* key, Int& out)
{
    const cJSON* node = cJSON_GetObjectItemCaseSensitive(object, key);
    if (node == nullptr) {
        return;
    }
    if (!cJSON_IsNumber(node) || std::floor(node->valuedouble) != node->valuedouble) {
        throw invalid(std::string("'") + key + "' must be an integer");
    }
    if (std::fabs(node->valuedouble) > 1e9) {
        throw invalid(std::string("'") + key + "' is out of range");
    }
    out = static_cast<Int>(node->valuedouble);
}

/// @brief Reads a string member; returns false when absent.
bool read_string(const cJSON* object, const char* key, std::string& out)
{
    const cJSON* node = cJSON_GetObjectItemCaseSensitive(object, key);
    if (node == nullptr) {
        return false;
    }
    if (!cJSON_IsString(node) || node->valuestring == nullptr) {
        throw invalid(std::string("'") + key + "' must be a string");
    }
    out = node->valuestring;
    return true;
}

/**
 * @brief Fills `out` from the document rooted at `root`.
 *
 * Kept separate from `parse_settings` so that the caller owns the single
 * `cJSON_Delete` on every exit path.
 */
void apply(const cJSON* root, Settings& out)
{
    if (!cJSON_IsObject(root)) {
        throw invalid("settings document must be a JSON object");
    }

    std::string level_name;
    if (read_string(root, "log_level", level_name) &&
        !parse_log_level(level_name, out.log_level)) {
        throw invalid("unknown log level '" + level_name + "'");
    }

    read_int(root, "max_generators", out.max_generators);
    if (out.max_generators <= 0 || out.max_generators > registry::kAbsoluteMaxGenerators) {
        throw invalid("'max_generators' must be in [1, " +
                      std::to_string(registry::kAbsoluteMaxGenerators) + "]");
    }

    const cJSON* gen = cJSON_GetObjectItemCaseSensitive(root, "generator");
    if (gen == nullptr) {
        return;
    }
    if (!cJSON_IsObject(gen)) {
        throw invalid("'generator' must be an object");
    }

    read_int(gen, "datacenter_id", out.generator.datacenter_id);
    read_int(gen, "worker_id", out.generator.worker_id);
    read_int(gen, "clock_backward_tolerance_ms", out.generator.clock_backward_tolerance_ms);

    std::string strategy;
    if (read_string(gen, "clock_backward_strategy", strategy)) {
        out.generator.clock_backward_strategy = core::parse_strategy(strategy);
    }

    const cJSON* metrics = cJSON_GetObjectItemCaseSensitive(gen, "enable_metrics");
    if (metrics != nullptr) {
        if (!cJSON_IsBool(metrics)) {
            throw invalid("'enable_metrics' must be a boolean");
        }
        out.generator.enable_metrics = cJSON_IsTrue(metrics);
    }
}

} // namespace

Settings parse_settings(const std::string& json)
{
    cJSON* root = cJSON_Parse(json.c_str());
    if (root == nullptr) {
        throw invalid("settings are not valid JSON");
    }

    Settings settings;
    try {
        apply(root, settings);
    } catch (const core::Error&) {
        cJSON_Delete(root);
        throw;
    }
    cJSON_Delete(root);

    settings.generator.validate();
    return settings;
}

Settings load_settings(const std::string& path)
{
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw invalid("cannot open settings file '" + path + "'");
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    Logger::log(LogLevel::DEBUG, "Settings: Loading '" + path + "'");

    return parse_settings(buffer.str());
}

} // namespace flakeid::infra
