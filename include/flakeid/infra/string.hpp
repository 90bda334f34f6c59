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
 * @file string.hpp
 * @brief Supplementary string manipulation primitives.
 *
 * @details
 * Text helpers used when decoding IDs from user input: whitespace trimming and
 * strict, overflow-checked integer conversion in an arbitrary radix.
 */

#pragma once

#include <cstdint>
#include <string>

namespace flakeid::infra {

/**
 * @class String
 * @brief A static container for text processing algorithms.
 */
class String {
  public:
    /**
     * @brief Trims leading and trailing whitespace from a string.
     *
     * @param s The source string to process.
     * @return std::string The trimmed content, empty if `s` is all whitespace.
     *
     * @code
     * std::string clean = flakeid::infra::String::trim("  12345 \n"); // "12345"
     * @endcode
     */
    static std::string trim(const std::string& s);

    /**
     * @brief Converts the whole of `s` to a signed 64-bit integer.
     *
     * Accepts an optional leading `-` followed by at least one digit valid in
     * `base`. Rejects empty input, stray characters (including whitespace) and
     * values outside the `int64_t` range.
     *
     * @param s The digits to convert.
     * @param base Radix in [2, 36].
     * @param out Receives the value on success; untouched on failure.
     * @return true on success.
     */
    static bool to_int64(const std::string& s, int base, int64_t& out);
};

} // namespace flakeid::infra
