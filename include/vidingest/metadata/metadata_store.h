#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "vidingest/core/error.h"
#include "vidingest/core/result.h"

namespace vidingest::metadata {

/// @brief Upload session state machine.
///
/// pending -> uploading -> assembling -> completed | failed, and
/// pending/uploading -> expired. Terminal states never move again.
enum class SessionStatus {
    kPending,
    kUploading,
    kAssembling,
    kCompleted,
    kFailed,
    kExpired,
};

/// @brief Lifecycle of the video record that an upload session produces.
enum class ArtifactStatus {
    kUploading,
    kUploaded,
    kQueued,
    kFailed,
};

const char* ToString(SessionStatus status);
std::optional<SessionStatus> ParseSessionStatus(const std::string& value);

const char* ToString(ArtifactStatus status);
std::optional<ArtifactStatus> ParseArtifactStatus(const std::string& value);

/// @brief One resumable upload attempt.
struct UploadSession {
    std::string id;
    std::string video_id;
    std::string filename;
    std::string owner;
    std::uint64_t file_size{0};
    std::uint64_t chunk_size{0};
    int total_chunks{0};
    int uploaded_chunks{0};
    SessionStatus status{SessionStatus::kPending};
    std::string created_at;
    std::string updated_at;
    std::string expires_at;
    std::string completed_at;
};

/// @brief Video record owning the assembled artifact.
struct Video {
    std::string id;
    std::string title;
    std::string filename;
    std::string original_filename;
    std::uint64_t file_size{0};
    std::uint64_t final_size{0};
    std::string file_hash;
    std::string mime_type;
    ArtifactStatus status{ArtifactStatus::kUploading};
    std::string upload_method{"chunked"};
    std::string uploader_id;
    std::string created_at;
    std::string uploaded_at;
};

/// @brief Per-upload performance record.
struct UploadMetric {
    std::string id;
    std::string video_id;
    std::string upload_method{"chunked"};
    std::uint64_t file_size{0};
    long long upload_duration_ms{0};
    long long assembly_duration_ms{0};
    std::uint64_t throughput_bps{0};
    int retry_count{0};
    std::string created_at;
};

/// @brief Abstract persistence for sessions, videos and upload metrics.
///
/// Session status changes go through CompareAndSetSessionStatus (or
/// CompleteSession) so that concurrent actors agree on a single winner.
class MetadataStore {
public:
    virtual ~MetadataStore() = default;

    virtual core::Result<Video> CreateVideo(const Video& video) = 0;
    virtual core::Result<Video> GetVideo(const std::string& video_id) = 0;
    virtual core::Result<void> UpdateVideoStatus(const std::string& video_id,
                                                 ArtifactStatus status) = 0;
    /// @brief Record the assembled size/hash and move the video to `uploaded`.
    virtual core::Result<Video> MarkVideoUploaded(const std::string& video_id,
                                                  std::uint64_t final_size,
                                                  const std::string& file_hash,
                                                  const std::string& title) = 0;

    virtual core::Result<UploadSession> CreateSession(const UploadSession& session) = 0;
    virtual core::Result<UploadSession> GetSession(const std::string& session_id) = 0;
    /// @brief Atomically move a session from `expected` to `next`.
    /// @return true if this caller performed the transition, false if the status had moved on.
    virtual core::Result<bool> CompareAndSetSessionStatus(const std::string& session_id,
                                                          SessionStatus expected,
                                                          SessionStatus next) = 0;
    /// @brief Raise the persisted uploaded-chunk count; never lowers it.
    virtual core::Result<void> UpdateSessionProgress(const std::string& session_id,
                                                     int uploaded_chunks) = 0;
    /// @brief assembling -> completed, stamping completed_at.
    virtual core::Result<bool> CompleteSession(const std::string& session_id,
                                               int uploaded_chunks) = 0;
    /// @brief Pending/uploading sessions whose expires_at is before the cutoff, oldest first.
    virtual core::Result<std::vector<UploadSession>> ListExpiredSessions(
        const std::string& expires_before, int limit) = 0;

    virtual core::Result<void> RecordUploadMetric(const UploadMetric& metric) = 0;
    virtual core::Result<std::vector<UploadMetric>> ListUploadMetrics(int limit) = 0;
};

}  // namespace vidingest::metadata
