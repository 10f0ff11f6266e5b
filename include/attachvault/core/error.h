#pragma once

#include <string>

namespace attachvault::core {

/// @brief Canonical error codes used across modules and mapped to HTTP responses.
enum class ErrorCode {
    kOk = 0,
    kInvalidArgument,
    kValidation,
    kPayloadTooLarge,
    kNotFound,
    kAlreadyExists,
    kInvalidState,
    kOutOfRange,
    kIntegrity,
    kPathTraversal,
    kIoError,
    kDbError,
    kUnauthorized,
    kForbidden,
    kInternal,
};

/// @brief Error payload describing a failure with a code and human-readable message.
struct Error {
    ErrorCode code{ErrorCode::kOk};
    std::string message;
};

/// @brief Stable upper-case name for an error code (used in JSON error envelopes).
const char* ErrorCodeName(ErrorCode code);

}  // namespace attachvault::core
