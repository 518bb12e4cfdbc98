#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "vidingest/chunks/chunk_store.h"
#include "vidingest/core/config.h"
#include "vidingest/core/result.h"
#include "vidingest/metadata/metadata_store.h"
#include "vidingest/queue/transcode_queue.h"
#include "vidingest/ratelimit/rate_limiter.h"
#include "vidingest/storage/local_storage.h"
#include "vidingest/upload/assembler.h"

namespace vidingest::upload {

/// @brief Parameters of POST /upload/init.
struct InitRequest {
    std::string filename;
    std::uint64_t file_size{0};
    int total_chunks{0};
    // Zero selects the configured default.
    std::uint64_t chunk_size{0};
    std::string mime_type;
    std::string uploader_id;
    std::string title;
    std::string identity;
};

/// @brief Result of one chunk submission.
struct ChunkOutcome {
    std::string session_id;
    int chunk_number{0};
    int uploaded_chunks{0};
    int total_chunks{0};
    double progress_percent{0.0};
    bool duplicate{false};
};

/// @brief Result of a successful completion.
struct CompletionResult {
    std::string video_id;
    std::string session_id;
    metadata::ArtifactStatus status{metadata::ArtifactStatus::kUploaded};
    std::string file_hash;
    std::uint64_t file_size{0};
    long long upload_duration_ms{0};
    long long assembly_duration_ms{0};
    std::uint64_t throughput_bps{0};
};

/// @brief Read-only view of a session and its chunk progress.
struct SessionView {
    metadata::UploadSession session;
    chunks::Progress progress;
};

/// @brief Owns the upload session state machine.
///
/// Every status change goes through the metadata store's compare-and-set, so
/// concurrent requests on the same session agree on one outcome. Chunk
/// presence lives in the chunk store; the session's uploaded count mirrors it.
class SessionManager {
public:
    SessionManager(core::UploadConfig config, metadata::MetadataStore& metadata,
                   chunks::ChunkStore& chunk_store, storage::LocalStorage& storage,
                   ratelimit::RateLimiter& limiter, queue::TranscodeQueue& transcode_queue);

    /// @param retry_after_out receives the wait in seconds when rate limited.
    core::Result<metadata::UploadSession> Init(const InitRequest& request,
                                               int* retry_after_out = nullptr);

    core::Result<ChunkOutcome> AcceptChunk(const std::string& session_id, int chunk_number,
                                           const std::string& data, const std::string& identity,
                                           int* retry_after_out = nullptr);

    /// @brief Assemble a session whose chunks are all present.
    /// @param missing_out receives the missing chunk numbers on kIncompleteUpload.
    core::Result<CompletionResult> Complete(const std::string& session_id,
                                            const std::string& title,
                                            std::vector<int>* missing_out = nullptr);

    core::Result<SessionView> Status(const std::string& session_id);

    core::Result<metadata::Video> GetVideo(const std::string& video_id);
    core::Result<std::vector<metadata::UploadMetric>> ListMetrics(int limit);

    /// @brief Strip directory components and characters outside [A-Za-z0-9._-].
    static std::string SanitizeFilename(const std::string& filename);

private:
    core::Result<metadata::UploadSession> LoadWritable(const std::string& session_id);
    std::uint64_t ExpectedChunkSize(const metadata::UploadSession& session,
                                    int chunk_number) const;
    core::Result<CompletionResult> FailAssembly(const metadata::UploadSession& session,
                                                const core::Error& error);
    void ReleaseChunks(const std::string& session_id);
    void MarkVideoFailed(const std::string& video_id);

    core::UploadConfig config_;
    metadata::MetadataStore& metadata_;
    chunks::ChunkStore& chunk_store_;
    storage::LocalStorage& storage_;
    ratelimit::RateLimiter& limiter_;
    queue::TranscodeQueue& transcode_queue_;
    Assembler assembler_;
};

}  // namespace vidingest::upload
