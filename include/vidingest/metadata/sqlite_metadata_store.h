#pragma once

#include <cstdint>
#include <mutex>
#include <string>

#include <Poco/Data/Session.h>

#include "vidingest/metadata/metadata_store.h"

namespace vidingest::metadata {

/// @brief SQLite-backed metadata store for single-node mode.
class SqliteMetadataStore : public MetadataStore {
public:
    explicit SqliteMetadataStore(const std::string& db_path);

    core::Result<Video> CreateVideo(const Video& video) override;
    core::Result<Video> GetVideo(const std::string& video_id) override;
    core::Result<void> UpdateVideoStatus(const std::string& video_id,
                                         ArtifactStatus status) override;
    core::Result<Video> MarkVideoUploaded(const std::string& video_id, std::uint64_t final_size,
                                          const std::string& file_hash,
                                          const std::string& title) override;

    core::Result<UploadSession> CreateSession(const UploadSession& session) override;
    core::Result<UploadSession> GetSession(const std::string& session_id) override;
    core::Result<bool> CompareAndSetSessionStatus(const std::string& session_id,
                                                  SessionStatus expected,
                                                  SessionStatus next) override;
    core::Result<void> UpdateSessionProgress(const std::string& session_id,
                                             int uploaded_chunks) override;
    core::Result<bool> CompleteSession(const std::string& session_id,
                                       int uploaded_chunks) override;
    core::Result<std::vector<UploadSession>> ListExpiredSessions(
        const std::string& expires_before, int limit) override;

    core::Result<void> RecordUploadMetric(const UploadMetric& metric) override;
    core::Result<std::vector<UploadMetric>> ListUploadMetrics(int limit) override;

private:
    // Schema creation is done once per store instance; in production this will be migrated.
    void InitSchema();
    core::Result<Video> GetVideoLocked(const std::string& video_id);
    core::Result<UploadSession> GetSessionLocked(const std::string& session_id);
    int ChangedRows();

    // Poco::Data::Session is not thread-safe; every statement runs under this lock.
    std::mutex mutex_;
    Poco::Data::Session session_;
};

}  // namespace vidingest::metadata
