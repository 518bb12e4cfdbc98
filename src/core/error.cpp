#include "vidingest/core/error.h"

namespace vidingest::core {

const char* ErrorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::kOk:
            return "OK";
        case ErrorCode::kInvalidArgument:
            return "VALIDATION_ERROR";
        case ErrorCode::kPayloadTooLarge:
            return "FILE_TOO_LARGE";
        case ErrorCode::kNotFound:
            return "NOT_FOUND";
        case ErrorCode::kExpired:
            return "UPLOAD_EXPIRED";
        case ErrorCode::kConflict:
            return "CONFLICT";
        case ErrorCode::kIncompleteUpload:
            return "INCOMPLETE_UPLOAD";
        case ErrorCode::kIntegrityError:
            return "INTEGRITY_ERROR";
        case ErrorCode::kRateLimited:
            return "RATE_LIMITED";
        case ErrorCode::kStorageUnavailable:
            return "STORAGE_UNAVAILABLE";
        case ErrorCode::kInternal:
            return "INTERNAL";
    }
    return "INTERNAL";
}

}  // namespace vidingest::core
