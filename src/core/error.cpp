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
 * @file error.cpp
 * @brief Implementation of the FlakeID error types.
 */

#include "flakeid/core/error.hpp"

#include <utility>

namespace flakeid::core {

const char* to_string(ErrorCode code)
{
    switch (code) {
    case ErrorCode::InvalidConfig:
        return "InvalidConfig";
    case ErrorCode::InvalidWorkerId:
        return "InvalidWorkerId";
    case ErrorCode::InvalidDatacenterId:
        return "InvalidDatacenterId";
    case ErrorCode::ClockMovedBackwards:
        return "ClockMovedBackwards";
    case ErrorCode::InvalidBatchSize:
        return "InvalidBatchSize";
    case ErrorCode::InvalidSnowflakeId:
        return "InvalidSnowflakeId";
    case ErrorCode::InvalidIdFormat:
        return "InvalidIdFormat";
    case ErrorCode::InvalidGeneratorType:
        return "InvalidGeneratorType";
    case ErrorCode::FactoryNotFound:
        return "FactoryNotFound";
    case ErrorCode::ParserNotFound:
        return "ParserNotFound";
    case ErrorCode::ValidatorNotFound:
        return "ValidatorNotFound";
    case ErrorCode::GeneratorAlreadyExists:
        return "GeneratorAlreadyExists";
    case ErrorCode::GeneratorNotFound:
        return "GeneratorNotFound";
    case ErrorCode::MaxGeneratorsReached:
        return "MaxGeneratorsReached";
    case ErrorCode::InvalidKey:
        return "InvalidKey";
    case ErrorCode::InvalidKeyFormat:
        return "InvalidKeyFormat";
    }
    return "Unknown";
}

Error::Error(ErrorCode code, const std::string& detail)
    : std::runtime_error(std::string(to_string(code)) + ": " + detail), code_(code),
      detail_(detail)
{
}

BatchError::BatchError(ErrorCode code, const std::string& detail,
                       std::vector<int64_t> partial_ids, std::size_t requested)
    : Error(code, detail), partial_ids_(std::move(partial_ids)), requested_(requested)
{
}

} // namespace flakeid::core
