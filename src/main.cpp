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
 * @file main.cpp
 * @brief Command-line entry point.
 *
 * @details
 * This file contains the `main` function which orchestrates:
 * 1. Argument Parsing (settings file first, flags override it).
 * 2. Context Bootstrap (registries and the configured generator).
 * 3. One action: generate IDs, decode an ID, or validate an ID.
 */

#include "flakeid/core/error.hpp"
#include "flakeid/core/types.hpp"
#include "flakeid/domain/id.hpp"
#include "flakeid/infra/logger.hpp"
#include "flakeid/infra/settings.hpp"
#include "flakeid/infra/string.hpp"
#include "flakeid/registry/context.hpp"
#include "flakeid/snowflake/layout.hpp"

#include <cJSON.h>
#include <cstdlib>
#include <iostream>
#include <map>
#include <memory>
#include <string>
#include <vector>

using flakeid::infra::Logger;
using flakeid::infra::LogLevel;

namespace {

/// @brief Options gathered from argv.
struct Options {
    std::string config_path;
    std::string parse_id;
    std::string validate_id;
    int count = 1;
    bool help = false;

    // Overrides applied on top of the settings file.
    bool has_datacenter = false;
    int64_t datacenter = 0;
    bool has_worker = false;
    int64_t worker = 0;
    std::string strategy;
    bool has_tolerance = false;
    int64_t tolerance = 0;
    bool metrics = false;
};

/**
 * @brief Prints usage instructions to stdout.
 */
void print_help(const char* binary_name)
{
    std::cout << "Usage: " << binary_name << " [OPTIONS]\n"
              << "Options:\n"
              << "  --config PATH      Load settings from a JSON file\n"
              << "  --datacenter N     Datacenter ID, 0-31 (Default: 0)\n"
              << "  --worker N         Worker ID, 0-31 (Default: 0)\n"
              << "  --strategy NAME    error | wait | use_last_timestamp (Default: error)\n"
              << "  --tolerance MS     Clock drift absorbed by 'wait', 0-1000 (Default: 5)\n"
              << "  --count N          Number of IDs to print (Default: 1)\n"
              << "  --metrics          Print generator counters as JSON after generating\n"
              << "  --parse ID         Print the components of ID as JSON\n"
              << "  --validate ID      Exit 0 if ID is valid, 1 otherwise\n"
              << "  --help             Show this help message\n";
}

int64_t to_number(const std::string& flag, const std::string& text)
{
    int64_t value = 0;
    if (!flakeid::infra::String::to_int64(text, 10, value)) {
        throw flakeid::core::Error(flakeid::core::ErrorCode::InvalidConfig,
                                   flag + " expects an integer, got '" + text + "'");
    }
    return value;
}

Options parse_args(int argc, char* argv[])
{
    Options opts;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help") {
            opts.help = true;
            continue;
        }
        if (arg == "--metrics") {
            opts.metrics = true;
            continue;
        }

        if (i + 1 >= argc) {
            throw flakeid::core::Error(flakeid::core::ErrorCode::InvalidConfig,
                                       "missing value for '" + arg + "'");
        }
        std::string value = argv[++i];

        if (arg == "--config") {
            opts.config_path = value;
        } else if (arg == "--datacenter") {
            opts.has_datacenter = true;
            opts.datacenter = to_number(arg, value);
        } else if (arg == "--worker") {
            opts.has_worker = true;
            opts.worker = to_number(arg, value);
        } else if (arg == "--strategy") {
            opts.strategy = value;
        } else if (arg == "--tolerance") {
            opts.has_tolerance = true;
            opts.tolerance = to_number(arg, value);
        } else if (arg == "--count") {
            int64_t n = to_number(arg, value);
            if (n < 1 || n > flakeid::snowflake::kMaxBatchSize) {
                throw flakeid::core::Error(flakeid::core::ErrorCode::InvalidBatchSize,
                                           "--count must be in [1, " +
                                               std::to_string(flakeid::snowflake::kMaxBatchSize) +
                                               "], got " + value);
            }
            opts.count = static_cast<int>(n);
        } else if (arg == "--parse") {
            opts.parse_id = value;
        } else if (arg == "--validate") {
            opts.validate_id = value;
        } else {
            throw flakeid::core::Error(flakeid::core::ErrorCode::InvalidConfig,
                                       "unknown option '" + arg + "'");
        }
    }

    return opts;
}

/// @brief Serializes a string-to-number map as a compact JSON object.
std::string to_json(const std::map<std::string, int64_t>& fields)
{
    cJSON* root = cJSON_CreateObject();
    for (const auto& field : fields) {
        cJSON_AddNumberToObject(root, field.first.c_str(), static_cast<double>(field.second));
    }

    char* raw = cJSON_PrintUnformatted(root);
    std::string out(raw);

    free(raw);
    cJSON_Delete(root);

    return out;
}

} // namespace

/**
 * @brief Main Execution Entry Point.
 */
int main(int argc, char* argv[])
{
    try {
        // 1. Argument Parsing
        Options opts = parse_args(argc, argv);
        if (opts.help) {
            print_help(argv[0]);
            return 0;
        }

        // 2. Settings (file, then flag overrides)
        flakeid::infra::Settings settings;
        if (!opts.config_path.empty()) {
            settings = flakeid::infra::load_settings(opts.config_path);
        }
        if (opts.has_datacenter) {
            settings.generator.datacenter_id = opts.datacenter;
        }
        if (opts.has_worker) {
            settings.generator.worker_id = opts.worker;
        }
        if (!opts.strategy.empty()) {
            settings.generator.clock_backward_strategy =
                flakeid::core::parse_strategy(opts.strategy);
        }
        if (opts.has_tolerance) {
            settings.generator.clock_backward_tolerance_ms = opts.tolerance;
        }
        if (opts.metrics) {
            settings.generator.enable_metrics = true;
        }

        Logger::set_level(settings.log_level);

        // 3. Context Bootstrap
        flakeid::registry::Context ctx;
        ctx.generators().set_max_generators(settings.max_generators);

        // 4a. Decode
        if (!opts.parse_id.empty()) {
            flakeid::domain::Id id = flakeid::domain::Id::from_string(opts.parse_id);
            flakeid::core::IdInfo info = id.parse(ctx.parsers());

            // The id itself is emitted as a string to survive double conversion.
            cJSON* root = cJSON_CreateObject();
            cJSON_AddStringToObject(root, "id", id.to_string().c_str());
            cJSON_AddNumberToObject(root, "timestamp_ms", static_cast<double>(info.timestamp_ms));
            cJSON_AddNumberToObject(root, "datacenter_id",
                                    static_cast<double>(info.datacenter_id));
            cJSON_AddNumberToObject(root, "worker_id", static_cast<double>(info.worker_id));
            cJSON_AddNumberToObject(root, "sequence", static_cast<double>(info.sequence));

            char* raw = cJSON_PrintUnformatted(root);
            std::cout << raw << "\n";
            free(raw);
            cJSON_Delete(root);
            return 0;
        }

        // 4b. Validate
        if (!opts.validate_id.empty()) {
            flakeid::domain::Id id = flakeid::domain::Id::from_string(opts.validate_id);
            id.validate(ctx.validators());
            std::cout << "valid\n";
            return 0;
        }

        // 4c. Generate
        std::shared_ptr<flakeid::core::Generator> generator = ctx.generators().create(
            flakeid::registry::kDefaultGeneratorKey, flakeid::core::GeneratorType::Snowflake,
            settings.generator);

        if (opts.count == 1) {
            std::cout << generator->next_id() << "\n";
        } else {
            for (int64_t id : generator->next_id_batch(opts.count)) {
                std::cout << id << "\n";
            }
        }

        if (settings.generator.enable_metrics) {
            std::map<std::string, int64_t> fields;
            for (const auto& counter : generator->metrics()) {
                fields[counter.first] = static_cast<int64_t>(counter.second);
            }
            std::cout << to_json(fields) << "\n";
        }

    } catch (const flakeid::core::BatchError& e) {
        // IDs produced before the failure are still unique; hand them out.
        for (int64_t id : e.partial_ids()) {
            std::cout << id << "\n";
        }
        Logger::log(LogLevel::FATAL, "System: " + std::string(e.what()) + " (" +
                                         std::to_string(e.partial_ids().size()) + "/" +
                                         std::to_string(e.requested()) + " produced)");
        return 1;
    } catch (const std::exception& e) {
        Logger::log(LogLevel::FATAL, "System: " + std::string(e.what()));
        return 1;
    }

    return 0;
}
