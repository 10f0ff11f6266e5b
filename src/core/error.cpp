#include "attachvault/core/error.h"

namespace attachvault::core {

const char* ErrorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::kOk:
            return "OK";
        case ErrorCode::kInvalidArgument:
            return "INVALID_ARGUMENT";
        case ErrorCode::kValidation:
            return "VALIDATION_FAILED";
        case ErrorCode::kPayloadTooLarge:
            return "PAYLOAD_TOO_LARGE";
        case ErrorCode::kNotFound:
            return "NOT_FOUND";
        case ErrorCode::kAlreadyExists:
            return "ALREADY_EXISTS";
        case ErrorCode::kInvalidState:
            return "INVALID_STATE";
        case ErrorCode::kOutOfRange:
            return "OUT_OF_RANGE";
        case ErrorCode::kIntegrity:
            return "INTEGRITY_ERROR";
        case ErrorCode::kPathTraversal:
            return "PATH_TRAVERSAL";
        case ErrorCode::kIoError:
            return "IO_ERROR";
        case ErrorCode::kDbError:
            return "DB_ERROR";
        case ErrorCode::kUnauthorized:
            return "UNAUTHORIZED";
        case ErrorCode::kForbidden:
            return "FORBIDDEN";
        case ErrorCode::kInternal:
            return "INTERNAL";
    }
    return "INTERNAL";
}

}  // namespace attachvault::core
