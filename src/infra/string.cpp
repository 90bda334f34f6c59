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
 * @file string.cpp
 * @brief Implementation of the string manipulation primitives.
 */

#include "flakeid/infra/string.hpp"

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <iterator>

namespace flakeid::infra {

/**
 * @brief Trims leading and trailing whitespace from a string instance.
 *
 * @note The use of `static_cast<unsigned char>` is required to avoid undefined
 * behavior with `std::isspace` on negative `char` values.
 */
std::string String::trim(const std::string& s)
{
    auto start = s.begin();
    while (start != s.end() && std::isspace(static_cast<unsigned char>(*start))) {
        start++;
    }

    if (start == s.end()) {
        return "";
    }

    auto end = s.end();
    do {
        end--;
    } while (std::distance(start, end) > 0 && std::isspace(static_cast<unsigned char>(*end)));

    return std::string(start, end + 1);
}

bool String::to_int64(const std::string& s, int base, int64_t& out)
{
    if (s.empty() || base < 2 || base > 36) {
        return false;
    }

    // strtoll skips leading whitespace and accepts '+' and "0x"; reject those here
    // so that only the exact digit string is converted.
    std::size_t first = (s[0] == '-') ? 1 : 0;
    if (first >= s.size()) {
        return false;
    }
    for (std::size_t i = first; i < s.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(s[i]);
        int digit;
        if (std::isdigit(c)) {
            digit = c - '0';
        } else if (std::isalpha(c)) {
            digit = std::tolower(c) - 'a' + 10;
        } else {
            return false;
        }
        if (digit >= base) {
            return false;
        }
    }

    errno = 0;
    char* end = nullptr;
    long long value = std::strtoll(s.c_str(), &end, base);
    if (errno == ERANGE || end != s.c_str() + s.size()) {
        return false;
    }

    out = static_cast<int64_t>(value);
    return true;
}

} // namespace flakeid::infra
