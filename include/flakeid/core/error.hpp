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
 * @file error.hpp
 * @brief Error taxonomy shared by every FlakeID subsystem.
 *
 * @details
 * All failures raised by the library are instances of `flakeid::core::Error`.
 * The attached `ErrorCode` is the stable, comparable part of the error; the
 * message carries the human-readable detail (offending values, limits).
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace flakeid::core {

/**
 * @enum ErrorCode
 * @brief Discriminant used by callers to branch on a failure.
 */
enum class ErrorCode {
    InvalidConfig,          ///< Empty, mismatched or out-of-bounds configuration.
    InvalidWorkerId,        ///< Worker ID outside [0, 31].
    InvalidDatacenterId,    ///< Datacenter ID outside [0, 31].
    ClockMovedBackwards,    ///< Backward clock drift that could not be absorbed.
    InvalidBatchSize,       ///< Batch size outside [1, 100000].
    InvalidSnowflakeId,     ///< Non-positive, pre-epoch or too-future ID.
    InvalidIdFormat,        ///< Malformed textual or JSON representation of an ID.
    InvalidGeneratorType,   ///< Unknown generator type discriminant.
    FactoryNotFound,        ///< No factory registered for the type.
    ParserNotFound,         ///< No parser registered for the type.
    ValidatorNotFound,      ///< No validator registered for the type.
    GeneratorAlreadyExists, ///< Instance key already taken.
    GeneratorNotFound,      ///< Instance key unknown.
    MaxGeneratorsReached,   ///< Instance registry is at capacity.
    InvalidKey,             ///< Empty or over-long instance key.
    InvalidKeyFormat        ///< Instance key contains forbidden characters.
};

/**
 * @brief Returns the stable name of an error code (e.g. "ClockMovedBackwards").
 */
const char* to_string(ErrorCode code);

/**
 * @class Error
 * @brief Exception type raised by all FlakeID operations.
 *
 * The `what()` string has the form `"<CodeName>: <detail>"`.
 *
 * @code
 * try {
 *     auto id = generator->next_id();
 * } catch (const flakeid::core::Error& e) {
 *     if (e.code() == flakeid::core::ErrorCode::ClockMovedBackwards) {
 *         // retry later
 *     }
 * }
 * @endcode
 */
class Error : public std::runtime_error {
  public:
    Error(ErrorCode code, const std::string& detail);

    ErrorCode code() const noexcept { return code_; }

    /// @brief The message without the code prefix.
    const std::string& detail() const noexcept { return detail_; }

  private:
    ErrorCode code_;
    std::string detail_;
};

/**
 * @class BatchError
 * @brief Raised when a batch is interrupted after some IDs were produced.
 *
 * The IDs generated before the failure are valid, unique and already consumed
 * from the generator's sequence space; they are handed back to the caller
 * instead of being discarded.
 */
class BatchError : public Error {
  public:
    BatchError(ErrorCode code, const std::string& detail, std::vector<int64_t> partial_ids,
               std::size_t requested);

    /// @brief IDs produced before the failure, in generation order.
    const std::vector<int64_t>& partial_ids() const noexcept { return partial_ids_; }

    /// @brief Size of the batch originally requested.
    std::size_t requested() const noexcept { return requested_; }

  private:
    std::vector<int64_t> partial_ids_;
    std::size_t requested_;
};

} // namespace flakeid::core
