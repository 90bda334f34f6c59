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
 * @file id.hpp
 * @brief Value type wrapping a generated 64-bit identifier.
 *
 * @details
 * `Id` is what application code stores and transports. It renders as decimal,
 * hexadecimal or binary text, round-trips through JSON as a string (so that
 * JavaScript clients never see a rounded number), and decodes itself through
 * whichever parser or validator is registered for its generator type.
 */

#pragma once

#include "flakeid/core/types.hpp"
#include "flakeid/registry/type_registry.hpp"

#include <cstddef>
#include <cstdint>
#include <string>

namespace flakeid::domain {

/// @brief Largest integer a JavaScript `Number` holds exactly (2^53 - 1).
inline constexpr int64_t kMaxSafeJavaScriptInteger = 9007199254740991LL;

/// @brief Longest text accepted by `Id::from_string` and `Id::from_json`.
inline constexpr std::size_t kMaxIdTextLength = 100;

/**
 * @class Id
 * @brief A generated identifier with text, JSON and decoding helpers.
 */
class Id {
  public:
    constexpr Id() = default;
    constexpr explicit Id(int64_t value) : value_(value) {}

    /**
     * @brief Parses decimal, `0x`/`0X` hexadecimal or `0b`/`0B` binary text.
     *
     * @code
     * Id a = Id::from_string("255");
     * Id b = Id::from_string("0xff");
     * Id c = Id::from_string("0b11111111"); // a == b == c
     * @endcode
     *
     * @throws core::Error InvalidIdFormat for empty, over-long, malformed,
     * out-of-range or negative input.
     */
    static Id from_string(const std::string& text);

    /**
     * @brief Decodes a JSON string (`"123"`) or integral JSON number (`123`).
     * @throws core::Error InvalidIdFormat.
     */
    static Id from_json(const std::string& json);

    constexpr int64_t value() const { return value_; }

    /// @brief Decimal rendering.
    std::string to_string() const;

    /// @brief Lower-case hexadecimal rendering with a `0x` prefix.
    std::string hex() const;

    /// @brief Binary rendering with a `0b` prefix.
    std::string binary() const;

    /// @brief The value as a JSON string literal, e.g. `"123"`.
    std::string to_json() const;

    constexpr bool is_zero() const { return value_ == 0; }
    constexpr bool is_valid() const { return value_ > 0; }

    constexpr bool is_safe_for_javascript() const
    {
        return value_ >= 0 && value_ <= kMaxSafeJavaScriptInteger;
    }

    /**
     * @brief Decodes the ID with the parser registered for `type`.
     * @throws core::Error ParserNotFound or any error raised by the parser.
     */
    core::IdInfo parse(const registry::ParserRegistry& parsers,
                       core::GeneratorType type = core::GeneratorType::Snowflake) const;

    /**
     * @brief Checks the ID with the validator registered for `type`.
     * @throws core::Error ValidatorNotFound or any error raised by the validator.
     */
    void validate(const registry::ValidatorRegistry& validators,
                  core::GeneratorType type = core::GeneratorType::Snowflake) const;

    /// @name Field extraction
    /// Return 0 (timestamp) or -1 (other fields) when the ID cannot be decoded
    /// or no parser is registered for `type`.
    /// @{
    int64_t extract_timestamp(const registry::ParserRegistry& parsers,
                              core::GeneratorType type = core::GeneratorType::Snowflake) const;
    int64_t extract_datacenter_id(const registry::ParserRegistry& parsers,
                                  core::GeneratorType type = core::GeneratorType::Snowflake) const;
    int64_t extract_worker_id(const registry::ParserRegistry& parsers,
                              core::GeneratorType type = core::GeneratorType::Snowflake) const;
    int64_t extract_sequence(const registry::ParserRegistry& parsers,
                             core::GeneratorType type = core::GeneratorType::Snowflake) const;
    /// @}

    friend constexpr bool operator==(Id a, Id b) { return a.value_ == b.value_; }
    friend constexpr bool operator!=(Id a, Id b) { return a.value_ != b.value_; }
    friend constexpr bool operator<(Id a, Id b) { return a.value_ < b.value_; }
    friend constexpr bool operator>(Id a, Id b) { return a.value_ > b.value_; }
    friend constexpr bool operator<=(Id a, Id b) { return a.value_ <= b.value_; }
    friend constexpr bool operator>=(Id a, Id b) { return a.value_ >= b.value_; }

  private:
    int64_t value_ = 0;
};

} // namespace flakeid::domain
