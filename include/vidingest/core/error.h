#pragma once

#include <string>

namespace vidingest::core {

/// @brief Canonical error codes used across modules and mapped to HTTP responses.
enum class ErrorCode {
    kOk = 0,
    kInvalidArgument,
    kPayloadTooLarge,
    kNotFound,
    kExpired,
    kConflict,
    kIncompleteUpload,
    kIntegrityError,
    kRateLimited,
    kStorageUnavailable,
    kInternal,
};

/// @brief Error payload describing a failure with a code and human-readable message.
struct Error {
    ErrorCode code{ErrorCode::kOk};
    std::string message;
};

/// @brief Stable upper-case name of an error code, used in the JSON error envelope.
const char* ErrorCodeName(ErrorCode code);

}  // namespace vidingest::core
