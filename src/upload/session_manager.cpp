#include "vidingest/upload/session_manager.h"

#include <cctype>
#include <filesystem>
#include <system_error>

#include "vidingest/core/ids.h"
#include "vidingest/core/logger.h"
#include "vidingest/core/time.h"
#include "vidingest/observability/metrics.h"

namespace vidingest::upload {
namespace {

using metadata::ArtifactStatus;
using metadata::SessionStatus;

core::Error RateLimitedError(const ratelimit::Decision& decision, int* retry_after_out) {
    if (retry_after_out) {
        *retry_after_out = decision.reset_after_seconds;
    }
    return core::Error{core::ErrorCode::kRateLimited,
                       "rate limit exceeded, retry after " +
                           std::to_string(decision.reset_after_seconds) + "s"};
}

bool DeadlinePassed(const metadata::UploadSession& session) {
    return !session.expires_at.empty() && session.expires_at <= core::NowIso8601();
}

double Percent(int uploaded, int total) {
    chunks::Progress progress;
    progress.total_chunks = total;
    progress.uploaded_count = uploaded;
    return progress.percent();
}

}  // namespace

SessionManager::SessionManager(core::UploadConfig config, metadata::MetadataStore& metadata,
                               chunks::ChunkStore& chunk_store, storage::LocalStorage& storage,
                               ratelimit::RateLimiter& limiter,
                               queue::TranscodeQueue& transcode_queue)
    : config_(std::move(config)),
      metadata_(metadata),
      chunk_store_(chunk_store),
      storage_(storage),
      limiter_(limiter),
      transcode_queue_(transcode_queue),
      assembler_(storage) {}

std::string SessionManager::SanitizeFilename(const std::string& filename) {
    std::string base = filename;
    const auto slash = base.find_last_of("/\\");
    if (slash != std::string::npos) {
        base = base.substr(slash + 1);
    }
    std::string out;
    out.reserve(base.size());
    for (char c : base) {
        const auto uc = static_cast<unsigned char>(c);
        if (std::isspace(uc)) {
            out.push_back('_');
        } else if (std::isalnum(uc) || c == '.' || c == '-' || c == '_') {
            out.push_back(c);
        }
    }
    // Leading dots would produce hidden files; trailing ones lose the extension.
    const auto first = out.find_first_not_of("._");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = out.find_last_not_of("._");
    return out.substr(first, last - first + 1);
}

core::Result<metadata::UploadSession> SessionManager::Init(const InitRequest& request,
                                                           int* retry_after_out) {
    const auto decision = limiter_.Allow(request.identity, ratelimit::Category::kInit);
    if (!decision.allowed) {
        return RateLimitedError(decision, retry_after_out);
    }

    const std::string filename = SanitizeFilename(request.filename);
    if (filename.empty() || filename.size() > 255) {
        return core::Error{core::ErrorCode::kInvalidArgument, "invalid filename"};
    }
    const std::string extension = storage::LocalStorage::ExtensionOf(filename);
    if (config_.allowed_extensions.count(extension) == 0) {
        return core::Error{core::ErrorCode::kInvalidArgument,
                           "file type not allowed: " + (extension.empty() ? filename : extension)};
    }
    if (request.file_size == 0) {
        return core::Error{core::ErrorCode::kInvalidArgument, "file_size must be positive"};
    }
    if (request.file_size > config_.max_upload_size) {
        return core::Error{core::ErrorCode::kPayloadTooLarge,
                           "file_size exceeds maximum of " +
                               std::to_string(config_.max_upload_size) + " bytes"};
    }
    const std::uint64_t chunk_size =
        request.chunk_size == 0 ? config_.default_chunk_size : request.chunk_size;
    if (chunk_size < config_.min_chunk_size || chunk_size > config_.max_chunk_size) {
        return core::Error{core::ErrorCode::kInvalidArgument,
                           "chunk_size must be between " + std::to_string(config_.min_chunk_size) +
                               " and " + std::to_string(config_.max_chunk_size)};
    }
    const std::uint64_t derived = (request.file_size + chunk_size - 1) / chunk_size;
    if (derived < 1 || derived > static_cast<std::uint64_t>(config_.max_chunks)) {
        return core::Error{core::ErrorCode::kInvalidArgument,
                           "upload needs " + std::to_string(derived) +
                               " chunks; maximum is " + std::to_string(config_.max_chunks)};
    }
    const int total_chunks = static_cast<int>(derived);
    if (request.total_chunks != total_chunks) {
        return core::Error{core::ErrorCode::kInvalidArgument,
                           "total_chunks must be " + std::to_string(total_chunks) +
                               " for file_size " + std::to_string(request.file_size) +
                               " and chunk_size " + std::to_string(chunk_size)};
    }

    metadata::Video video;
    video.id = core::GenerateId();
    video.title = request.title.empty() ? filename : request.title;
    video.filename = video.id + "." + extension;
    video.original_filename = filename;
    video.file_size = request.file_size;
    video.mime_type = request.mime_type.empty() ? "video/mp4" : request.mime_type;
    video.status = ArtifactStatus::kUploading;
    video.uploader_id = request.uploader_id.empty() ? request.identity : request.uploader_id;
    auto created_video = metadata_.CreateVideo(video);
    if (!created_video.ok()) {
        return created_video.error();
    }

    metadata::UploadSession session;
    session.id = core::GenerateId();
    session.video_id = video.id;
    session.filename = filename;
    session.owner = request.identity;
    session.file_size = request.file_size;
    session.chunk_size = chunk_size;
    session.total_chunks = total_chunks;
    session.status = SessionStatus::kPending;
    session.expires_at = core::NowIso8601WithOffsetSeconds(config_.expiry_seconds);
    auto created = metadata_.CreateSession(session);
    if (!created.ok()) {
        MarkVideoFailed(video.id);
        return created.error();
    }

    auto tracking = chunk_store_.CreateSession(session.id, total_chunks, config_.expiry_seconds);
    if (!tracking.ok()) {
        core::LogError("chunk tracking unavailable for session " + session.id + ": " +
                       tracking.error().message);
        auto moved = metadata_.CompareAndSetSessionStatus(session.id, SessionStatus::kPending,
                                                          SessionStatus::kFailed);
        if (!moved.ok()) {
            core::LogError("failed to mark session " + session.id + " failed: " +
                           moved.error().message);
        }
        MarkVideoFailed(video.id);
        return tracking.error();
    }

    observability::RecordSessionCreated();
    core::LogInfo("upload session " + session.id + " created for video " + video.id + " (" +
                  std::to_string(total_chunks) + " chunks of " + std::to_string(chunk_size) +
                  " bytes)");
    return created.value();
}

core::Result<metadata::UploadSession> SessionManager::LoadWritable(const std::string& session_id) {
    auto loaded = metadata_.GetSession(session_id);
    if (!loaded.ok()) {
        return loaded.error();
    }
    const auto& session = loaded.value();
    switch (session.status) {
        case SessionStatus::kExpired:
            return core::Error{core::ErrorCode::kExpired, "upload session has expired"};
        case SessionStatus::kCompleted:
            return core::Error{core::ErrorCode::kConflict, "upload session is already completed"};
        case SessionStatus::kAssembling:
            return core::Error{core::ErrorCode::kConflict, "upload session is being assembled"};
        case SessionStatus::kFailed:
            return core::Error{core::ErrorCode::kConflict, "upload session has failed"};
        case SessionStatus::kPending:
        case SessionStatus::kUploading:
            break;
    }
    if (DeadlinePassed(session)) {
        return core::Error{core::ErrorCode::kExpired, "upload session has expired"};
    }
    return loaded;
}

std::uint64_t SessionManager::ExpectedChunkSize(const metadata::UploadSession& session,
                                                int chunk_number) const {
    if (chunk_number < session.total_chunks) {
        return session.chunk_size;
    }
    return session.file_size -
           static_cast<std::uint64_t>(session.total_chunks - 1) * session.chunk_size;
}

core::Result<ChunkOutcome> SessionManager::AcceptChunk(const std::string& session_id,
                                                       int chunk_number, const std::string& data,
                                                       const std::string& identity,
                                                       int* retry_after_out) {
    const auto decision = limiter_.Allow(identity, ratelimit::Category::kChunk);
    if (!decision.allowed) {
        return RateLimitedError(decision, retry_after_out);
    }

    auto loaded = LoadWritable(session_id);
    if (!loaded.ok()) {
        return loaded.error();
    }
    const auto session = loaded.value();
    if (chunk_number < 1 || chunk_number > session.total_chunks) {
        return core::Error{core::ErrorCode::kInvalidArgument,
                           "chunk_number must be between 1 and " +
                               std::to_string(session.total_chunks)};
    }
    const auto expected = ExpectedChunkSize(session, chunk_number);
    if (data.size() != expected) {
        return core::Error{core::ErrorCode::kInvalidArgument,
                           "chunk " + std::to_string(chunk_number) + " must be " +
                               std::to_string(expected) + " bytes, got " +
                               std::to_string(data.size())};
    }

    ChunkOutcome outcome;
    outcome.session_id = session_id;
    outcome.chunk_number = chunk_number;
    outcome.total_chunks = session.total_chunks;

    auto present = chunk_store_.IsChunkPresent(session_id, chunk_number);
    if (!present.ok()) {
        return present.error();
    }
    if (present.value()) {
        auto progress = chunk_store_.GetProgress(session_id, session.total_chunks);
        if (!progress.ok()) {
            return progress.error();
        }
        outcome.duplicate = true;
        outcome.uploaded_chunks = progress.value().uploaded_count;
        outcome.progress_percent = progress.value().percent();
        observability::RecordChunkAccepted(true, 0);
        core::LogDebug("duplicate chunk " + std::to_string(chunk_number) + " for session " +
                       session_id);
        return outcome;
    }

    auto stored = storage_.WriteChunk(session_id, chunk_number, data);
    if (!stored.ok()) {
        core::LogError("failed to store chunk " + std::to_string(chunk_number) +
                       " for session " + session_id + ": " + stored.error().message);
        return stored.error();
    }

    auto marked = chunk_store_.MarkChunkUploaded(session_id, chunk_number,
                                                 stored.value().size_bytes,
                                                 stored.value().content_hash);
    if (!marked.ok()) {
        if (marked.code() == core::ErrorCode::kNotFound) {
            // Tracking was released by a completion or a sweep after the session was loaded.
            auto removed = storage_.DeleteChunks(session_id);
            if (!removed.ok()) {
                core::LogWarning("failed to delete chunk files for session " + session_id +
                                 ": " + removed.error().message);
            }
            auto current = LoadWritable(session_id);
            if (!current.ok()) {
                return current.error();
            }
            return core::Error{core::ErrorCode::kExpired, "upload session has expired"};
        }
        return marked.error();
    }

    outcome.duplicate = !marked.value().was_new;
    outcome.uploaded_chunks = marked.value().uploaded_count;
    outcome.progress_percent = Percent(outcome.uploaded_chunks, session.total_chunks);
    observability::RecordChunkAccepted(outcome.duplicate, stored.value().size_bytes);

    if (session.status == SessionStatus::kPending) {
        auto moved = metadata_.CompareAndSetSessionStatus(session_id, SessionStatus::kPending,
                                                          SessionStatus::kUploading);
        if (!moved.ok()) {
            core::LogWarning("failed to mark session " + session_id +
                             " uploading: " + moved.error().message);
        }
    }
    auto progressed = metadata_.UpdateSessionProgress(session_id, outcome.uploaded_chunks);
    if (!progressed.ok()) {
        // The chunk store stays authoritative; the session count catches up on the next chunk.
        core::LogWarning("failed to persist progress for session " + session_id + ": " +
                         progressed.error().message);
    }

    core::LogDebug("chunk " + std::to_string(chunk_number) + "/" +
                   std::to_string(session.total_chunks) + " stored for session " + session_id);
    return outcome;
}

void SessionManager::ReleaseChunks(const std::string& session_id) {
    auto tracking = chunk_store_.DeleteSession(session_id);
    if (!tracking.ok()) {
        core::LogWarning("failed to delete chunk tracking for session " + session_id + ": " +
                         tracking.error().message);
    }
    auto bytes = storage_.DeleteChunks(session_id);
    if (!bytes.ok()) {
        core::LogWarning("failed to delete chunk files for session " + session_id + ": " +
                         bytes.error().message);
    }
}

void SessionManager::MarkVideoFailed(const std::string& video_id) {
    auto updated = metadata_.UpdateVideoStatus(video_id, ArtifactStatus::kFailed);
    if (!updated.ok()) {
        core::LogError("failed to mark video " + video_id + " failed: " +
                       updated.error().message);
    }
}

core::Result<CompletionResult> SessionManager::FailAssembly(const metadata::UploadSession& session,
                                                            const core::Error& error) {
    core::LogError("assembly failed for session " + session.id + ": " + error.message);
    observability::RecordAssembly(false);
    auto moved = metadata_.CompareAndSetSessionStatus(session.id, SessionStatus::kAssembling,
                                                      SessionStatus::kFailed);
    if (!moved.ok()) {
        core::LogError("failed to mark session " + session.id + " failed: " +
                       moved.error().message);
    }
    MarkVideoFailed(session.video_id);
    ReleaseChunks(session.id);
    return error;
}

core::Result<CompletionResult> SessionManager::Complete(const std::string& session_id,
                                                        const std::string& title,
                                                        std::vector<int>* missing_out) {
    auto loaded = LoadWritable(session_id);
    if (!loaded.ok()) {
        return loaded.error();
    }
    const auto session = loaded.value();

    auto progress = chunk_store_.GetProgress(session_id, session.total_chunks);
    if (!progress.ok()) {
        return progress.error();
    }
    if (!progress.value().complete()) {
        // A concurrent completion releases tracking; report its outcome instead.
        auto current = LoadWritable(session_id);
        if (!current.ok()) {
            return current.error();
        }
        if (missing_out) {
            *missing_out = progress.value().missing;
        }
        return core::Error{core::ErrorCode::kIncompleteUpload,
                           "upload incomplete: " +
                               std::to_string(progress.value().missing.size()) +
                               " chunks missing"};
    }

    auto claimed = metadata_.CompareAndSetSessionStatus(session_id, SessionStatus::kUploading,
                                                        SessionStatus::kAssembling);
    if (!claimed.ok()) {
        return claimed.error();
    }
    if (!claimed.value()) {
        // The first chunk's pending -> uploading bump may not have landed yet.
        claimed = metadata_.CompareAndSetSessionStatus(session_id, SessionStatus::kPending,
                                                       SessionStatus::kAssembling);
        if (!claimed.ok()) {
            return claimed.error();
        }
        if (!claimed.value()) {
            // Lost to another completion or to the sweeper; report the state that won.
            auto current = LoadWritable(session_id);
            if (!current.ok()) {
                return current.error();
            }
            return core::Error{core::ErrorCode::kConflict,
                               "upload session is already being assembled or finished"};
        }
    }

    // Retry accounting must be read before the chunk records are released.
    int retry_count = 0;
    auto records = chunk_store_.ListChunks(session_id);
    if (records.ok()) {
        for (const auto& record : records.value()) {
            retry_count += record.retry_count;
        }
    } else {
        core::LogWarning("retry count unavailable for session " + session_id + ": " +
                         records.error().message);
    }

    core::LogInfo("assembling session " + session_id + " (" +
                  std::to_string(session.total_chunks) + " chunks)");
    AssemblyRequest request;
    request.session_id = session_id;
    request.total_chunks = session.total_chunks;
    request.declared_size = session.file_size;
    const std::string extension = storage::LocalStorage::ExtensionOf(session.filename);
    request.output_path = storage_.ArtifactPath(session.video_id, extension);
    auto assembled = assembler_.Assemble(request);
    if (!assembled.ok()) {
        return FailAssembly(session, assembled.error());
    }
    const auto& artifact = assembled.value();

    auto video = metadata_.MarkVideoUploaded(session.video_id, artifact.size_bytes,
                                             artifact.sha256, title);
    if (!video.ok()) {
        std::error_code ec;
        std::filesystem::remove(artifact.path, ec);
        return FailAssembly(session, video.error());
    }
    auto completed = metadata_.CompleteSession(session_id, session.total_chunks);
    if (!completed.ok() || !completed.value()) {
        std::error_code ec;
        std::filesystem::remove(artifact.path, ec);
        return FailAssembly(session,
                            completed.ok()
                                ? core::Error{core::ErrorCode::kConflict,
                                              "session left assembling state unexpectedly"}
                                : completed.error());
    }

    CompletionResult result;
    result.video_id = session.video_id;
    result.session_id = session_id;
    result.status = ArtifactStatus::kUploaded;
    result.file_hash = artifact.sha256;
    result.file_size = artifact.size_bytes;
    result.assembly_duration_ms = artifact.duration_ms;
    const long long elapsed = core::MillisecondsSince(session.created_at);
    result.upload_duration_ms = elapsed > 0 ? elapsed : 0;
    result.throughput_bps =
        artifact.size_bytes * 1000ULL /
        static_cast<std::uint64_t>(result.upload_duration_ms > 0 ? result.upload_duration_ms : 1);

    queue::TranscodeJob job;
    job.video_id = session.video_id;
    job.filename = video.value().filename;
    job.filepath = artifact.path;
    job.original_filename = video.value().original_filename;
    job.file_size = artifact.size_bytes;
    job.file_hash = artifact.sha256;
    job.queued_at = core::NowIso8601();
    auto published = transcode_queue_.Publish(job);
    if (published.ok()) {
        auto queued = metadata_.UpdateVideoStatus(session.video_id, ArtifactStatus::kQueued);
        if (queued.ok()) {
            result.status = ArtifactStatus::kQueued;
        } else {
            core::LogWarning("failed to mark video " + session.video_id +
                             " queued: " + queued.error().message);
        }
    } else {
        core::LogWarning("transcode job not published for video " + session.video_id + ": " +
                         published.error().message);
    }

    metadata::UploadMetric metric;
    metric.id = core::GenerateId();
    metric.video_id = session.video_id;
    metric.file_size = artifact.size_bytes;
    metric.upload_duration_ms = result.upload_duration_ms;
    metric.assembly_duration_ms = result.assembly_duration_ms;
    metric.throughput_bps = result.throughput_bps;
    metric.retry_count = retry_count;
    auto recorded = metadata_.RecordUploadMetric(metric);
    if (!recorded.ok()) {
        core::LogWarning("failed to record upload metric for video " + session.video_id + ": " +
                         recorded.error().message);
    }

    ReleaseChunks(session_id);
    observability::RecordAssembly(true);
    core::LogInfo("session " + session_id + " completed: video " + session.video_id + " " +
                  std::to_string(artifact.size_bytes) + " bytes sha256=" + artifact.sha256);
    return result;
}

core::Result<SessionView> SessionManager::Status(const std::string& session_id) {
    auto loaded = metadata_.GetSession(session_id);
    if (!loaded.ok()) {
        return loaded.error();
    }
    SessionView view;
    view.session = loaded.value();

    if (view.session.status == SessionStatus::kCompleted) {
        // Tracking was released on completion; every chunk made it.
        std::vector<int> all;
        all.reserve(static_cast<size_t>(view.session.total_chunks));
        for (int number = 1; number <= view.session.total_chunks; ++number) {
            all.push_back(number);
        }
        view.progress = chunks::BuildProgress(view.session.total_chunks, all);
        return view;
    }

    auto progress = chunk_store_.GetProgress(session_id, view.session.total_chunks);
    if (!progress.ok()) {
        return progress.error();
    }
    view.progress = progress.value();
    if ((view.session.status == SessionStatus::kPending ||
         view.session.status == SessionStatus::kUploading) &&
        DeadlinePassed(view.session)) {
        // Past its deadline but not yet swept.
        view.session.status = SessionStatus::kExpired;
    }
    return view;
}

core::Result<metadata::Video> SessionManager::GetVideo(const std::string& video_id) {
    return metadata_.GetVideo(video_id);
}

core::Result<std::vector<metadata::UploadMetric>> SessionManager::ListMetrics(int limit) {
    return metadata_.ListUploadMetrics(limit);
}

}  // namespace vidingest::upload
