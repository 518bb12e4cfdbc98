#include "vidingest/metadata/metadata_store.h"

namespace vidingest::metadata {

const char* ToString(SessionStatus status) {
    switch (status) {
        case SessionStatus::kPending:
            return "pending";
        case SessionStatus::kUploading:
            return "uploading";
        case SessionStatus::kAssembling:
            return "assembling";
        case SessionStatus::kCompleted:
            return "completed";
        case SessionStatus::kFailed:
            return "failed";
        case SessionStatus::kExpired:
            return "expired";
    }
    return "unknown";
}

std::optional<SessionStatus> ParseSessionStatus(const std::string& value) {
    if (value == "pending") return SessionStatus::kPending;
    if (value == "uploading") return SessionStatus::kUploading;
    if (value == "assembling") return SessionStatus::kAssembling;
    if (value == "completed") return SessionStatus::kCompleted;
    if (value == "failed") return SessionStatus::kFailed;
    if (value == "expired") return SessionStatus::kExpired;
    return std::nullopt;
}

const char* ToString(ArtifactStatus status) {
    switch (status) {
        case ArtifactStatus::kUploading:
            return "uploading";
        case ArtifactStatus::kUploaded:
            return "uploaded";
        case ArtifactStatus::kQueued:
            return "queued";
        case ArtifactStatus::kFailed:
            return "failed";
    }
    return "unknown";
}

std::optional<ArtifactStatus> ParseArtifactStatus(const std::string& value) {
    if (value == "uploading") return ArtifactStatus::kUploading;
    if (value == "uploaded") return ArtifactStatus::kUploaded;
    if (value == "queued") return ArtifactStatus::kQueued;
    if (value == "failed") return ArtifactStatus::kFailed;
    return std::nullopt;
}

}  // namespace vidingest::metadata
