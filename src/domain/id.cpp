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
 * @file id.cpp
 * @brief Implementation of the `Id` value type.
 */

#include "flakeid/domain/id.hpp"

#include "flakeid/core/error.hpp"
#include "flakeid/infra/string.hpp"

#include <cJSON.h>
#include <cstdlib>

namespace flakeid::domain {

namespace {

/// @brief Renders `value` in base 2 or 16 with `prefix`, keeping a leading '-'.
std::string to_radix(int64_t value, unsigned base, const char* prefix)
{
    static const char kDigits[] = "0123456789abcdef";

    bool negative = value < 0;
    uint64_t magnitude = negative ? 0 - static_cast<uint64_t>(value) : static_cast<uint64_t>(value);

    std::string digits;
    do {
        digits.insert(digits.begin(), kDigits[magnitude % base]);
        magnitude /= base;
    } while (magnitude != 0);

    return (negative ? "-" : "") + std::string(prefix) + digits;
}

Id checked(int64_t value)
{
    if (value < 0) {
        throw core::Error(core::ErrorCode::InvalidIdFormat,
                          "ID must be non-negative, got " + std::to_string(value));
    }
    return Id(value);
}

} // namespace

Id Id::from_string(const std::string& text)
{
    if (text.empty()) {
        throw core::Error(core::ErrorCode::InvalidIdFormat, "ID string cannot be empty");
    }

    if (text.size() > kMaxIdTextLength) {
        throw core::Error(core::ErrorCode::InvalidIdFormat,
                          "ID string too long: max " + std::to_string(kMaxIdTextLength) +
                              " characters, got " + std::to_string(text.size()));
    }

    int base = 10;
    std::string digits = text;
    if (text.size() >= 2 && text[0] == '0') {
        if (text[1] == 'x' || text[1] == 'X') {
            base = 16;
        } else if (text[1] == 'b' || text[1] == 'B') {
            base = 2;
        }
    }
    if (base != 10) {
        digits = text.substr(2);
        if (digits.empty()) {
            throw core::Error(core::ErrorCode::InvalidIdFormat,
                              "missing digits after '" + text.substr(0, 2) + "'");
        }
    }

    int64_t value = 0;
    if (!infra::String::to_int64(digits, base, value)) {
        throw core::Error(core::ErrorCode::InvalidIdFormat, "cannot parse '" + text + "'");
    }

    return checked(value);
}

/**
 * @details
 * cJSON stores numbers as `double`, which cannot hold every 64-bit ID. For a
 * JSON number the raw (trimmed) text is therefore converted directly once cJSON
 * has confirmed it is a single well-formed number.
 */
Id Id::from_json(const std::string& json)
{
    if (json.empty()) {
        throw core::Error(core::ErrorCode::InvalidIdFormat, "empty JSON data");
    }

    if (json.size() > kMaxIdTextLength) {
        throw core::Error(core::ErrorCode::InvalidIdFormat,
                          "JSON data too large: max " + std::to_string(kMaxIdTextLength) +
                              " bytes, got " + std::to_string(json.size()));
    }

    cJSON* root = cJSON_ParseWithOpts(json.c_str(), nullptr, 1);
    if (root == nullptr) {
        throw core::Error(core::ErrorCode::InvalidIdFormat, "malformed JSON: " + json);
    }

    int64_t value = 0;
    bool ok = false;
    std::string reason;

    if (cJSON_IsString(root)) {
        std::string text = root->valuestring;
        if (text.empty()) {
            reason = "ID string cannot be empty";
        } else {
            ok = infra::String::to_int64(text, 10, value);
            if (!ok) {
                reason = "invalid ID string '" + text + "'";
            }
        }
    } else if (cJSON_IsNumber(root)) {
        ok = infra::String::to_int64(infra::String::trim(json), 10, value);
        if (!ok) {
            reason = "ID number must be an integer in int64 range, got " + json;
        }
    } else {
        reason = "expected string or number, got " + json;
    }

    cJSON_Delete(root);

    if (!ok) {
        throw core::Error(core::ErrorCode::InvalidIdFormat, reason);
    }
    return checked(value);
}

std::string Id::to_string() const
{
    return std::to_string(value_);
}

std::string Id::hex() const
{
    return to_radix(value_, 16, "0x");
}

std::string Id::binary() const
{
    return to_radix(value_, 2, "0b");
}

std::string Id::to_json() const
{
    cJSON* node = cJSON_CreateString(to_string().c_str());
    char* raw = cJSON_PrintUnformatted(node);
    std::string out(raw);

    free(raw);
    cJSON_Delete(node);

    return out;
}

core::IdInfo Id::parse(const registry::ParserRegistry& parsers, core::GeneratorType type) const
{
    return parsers.get(type)->parse(value_);
}

void Id::validate(const registry::ValidatorRegistry& validators, core::GeneratorType type) const
{
    validators.get(type)->validate(value_);
}

int64_t Id::extract_timestamp(const registry::ParserRegistry& parsers,
                              core::GeneratorType type) const
{
    if (!parsers.has(type)) {
        return 0;
    }
    return parsers.get(type)->extract_timestamp(value_);
}

int64_t Id::extract_datacenter_id(const registry::ParserRegistry& parsers,
                                  core::GeneratorType type) const
{
    if (!parsers.has(type)) {
        return -1;
    }
    return parsers.get(type)->extract_datacenter_id(value_);
}

int64_t Id::extract_worker_id(const registry::ParserRegistry& parsers,
                              core::GeneratorType type) const
{
    if (!parsers.has(type)) {
        return -1;
    }
    return parsers.get(type)->extract_worker_id(value_);
}

int64_t Id::extract_sequence(const registry::ParserRegistry& parsers,
                             core::GeneratorType type) const
{
    if (!parsers.has(type)) {
        return -1;
    }
    return parsers.get(type)->extract_sequence(value_);
}

} // namespace flakeid::domain
