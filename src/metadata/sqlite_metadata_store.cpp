#include "vidingest/metadata/sqlite_metadata_store.h"

#include <Poco/Data/SQLite/Connector.h>
#include <Poco/Data/SessionFactory.h>
#include <Poco/Data/Statement.h>

#include "vidingest/core/time.h"

namespace {
using namespace Poco::Data::Keywords;

vidingest::core::Error DbError(const Poco::Exception& ex) {
    return vidingest::core::Error{vidingest::core::ErrorCode::kStorageUnavailable,
                                  ex.displayText()};
}
}  // namespace

namespace vidingest::metadata {

SqliteMetadataStore::SqliteMetadataStore(const std::string& db_path)
    : session_([](const std::string& path) {
          Poco::Data::SQLite::Connector::registerConnector();
          return Poco::Data::Session("SQLite", path);
      }(db_path)) {
    InitSchema();
}

void SqliteMetadataStore::InitSchema() {
    session_ << "PRAGMA journal_mode = WAL", now;
    session_ << "PRAGMA foreign_keys = ON", now;

    session_ <<
            "CREATE TABLE IF NOT EXISTS videos ("
            "id TEXT PRIMARY KEY,"
            "title TEXT NOT NULL,"
            "filename TEXT NOT NULL,"
            "original_filename TEXT NOT NULL,"
            "file_size INTEGER NOT NULL,"
            "final_size INTEGER NOT NULL DEFAULT 0,"
            "file_hash TEXT NOT NULL DEFAULT '',"
            "mime_type TEXT NOT NULL,"
            "status TEXT NOT NULL,"
            "upload_method TEXT NOT NULL,"
            "uploader_id TEXT NOT NULL,"
            "created_at TEXT NOT NULL,"
            "uploaded_at TEXT NOT NULL DEFAULT ''"
            ")",
        now;

    session_ <<
            "CREATE TABLE IF NOT EXISTS upload_sessions ("
            "id TEXT PRIMARY KEY,"
            "video_id TEXT NOT NULL,"
            "filename TEXT NOT NULL,"
            "owner TEXT NOT NULL,"
            "file_size INTEGER NOT NULL,"
            "chunk_size INTEGER NOT NULL,"
            "total_chunks INTEGER NOT NULL,"
            "uploaded_chunks INTEGER NOT NULL DEFAULT 0,"
            "status TEXT NOT NULL,"
            "created_at TEXT NOT NULL,"
            "updated_at TEXT NOT NULL,"
            "expires_at TEXT NOT NULL,"
            "completed_at TEXT NOT NULL DEFAULT '',"
            "FOREIGN KEY(video_id) REFERENCES videos(id)"
            ")",
        now;

    session_ <<
            "CREATE TABLE IF NOT EXISTS upload_metrics ("
            "id TEXT PRIMARY KEY,"
            "video_id TEXT NOT NULL,"
            "upload_method TEXT NOT NULL,"
            "file_size INTEGER NOT NULL,"
            "upload_duration_ms INTEGER NOT NULL,"
            "assembly_duration_ms INTEGER NOT NULL,"
            "throughput_bps INTEGER NOT NULL,"
            "retry_count INTEGER NOT NULL DEFAULT 0,"
            "created_at TEXT NOT NULL"
            ")",
        now;

    session_ <<
            "CREATE INDEX IF NOT EXISTS idx_upload_sessions_status_expires_at "
            "ON upload_sessions(status, expires_at)",
        now;
    session_ <<
            "CREATE INDEX IF NOT EXISTS idx_upload_metrics_created_at "
            "ON upload_metrics(created_at)",
        now;
}

int SqliteMetadataStore::ChangedRows() {
    int changed = 0;
    session_ << "SELECT changes()", into(changed), now;
    return changed;
}

core::Result<Video> SqliteMetadataStore::CreateVideo(const Video& video) {
    std::lock_guard<std::mutex> lock(mutex_);
    try {
        std::string id = video.id;
        std::string title = video.title;
        std::string filename = video.filename;
        std::string original_filename = video.original_filename;
        std::uint64_t file_size = video.file_size;
        std::string mime_type = video.mime_type;
        std::string status = ToString(video.status);
        std::string upload_method = video.upload_method;
        std::string uploader_id = video.uploader_id;
        std::string created_at = core::NowIso8601();
        session_ <<
                "INSERT INTO videos(id, title, filename, original_filename, file_size, mime_type, "
                "status, upload_method, uploader_id, created_at) "
                "VALUES(?, ?, ?, ?, ?, ?, ?, ?, ?, ?)",
            use(id), use(title), use(filename), use(original_filename), use(file_size),
            use(mime_type), use(status), use(upload_method), use(uploader_id), use(created_at),
            now;
        return GetVideoLocked(video.id);
    } catch (const Poco::Exception& ex) {
        return DbError(ex);
    }
}

core::Result<Video> SqliteMetadataStore::GetVideo(const std::string& video_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    try {
        return GetVideoLocked(video_id);
    } catch (const Poco::Exception& ex) {
        return DbError(ex);
    }
}

core::Result<Video> SqliteMetadataStore::GetVideoLocked(const std::string& video_id) {
    Video video;
    std::string status;
    std::string id_value = video_id;
    Poco::Data::Statement select(session_);
    select <<
            "SELECT id, title, filename, original_filename, file_size, final_size, file_hash, "
            "mime_type, status, upload_method, uploader_id, created_at, uploaded_at "
            "FROM videos WHERE id = ?",
        use(id_value), into(video.id), into(video.title), into(video.filename),
        into(video.original_filename), into(video.file_size), into(video.final_size),
        into(video.file_hash), into(video.mime_type), into(status), into(video.upload_method),
        into(video.uploader_id), into(video.created_at), into(video.uploaded_at), now;

    if (video.id.empty()) {
        return core::Error{core::ErrorCode::kNotFound, "video not found"};
    }
    video.status = ParseArtifactStatus(status).value_or(ArtifactStatus::kFailed);
    return video;
}

core::Result<void> SqliteMetadataStore::UpdateVideoStatus(const std::string& video_id,
                                                          ArtifactStatus status) {
    std::lock_guard<std::mutex> lock(mutex_);
    try {
        std::string status_value = ToString(status);
        std::string id_value = video_id;
        session_ << "UPDATE videos SET status = ? WHERE id = ?", use(status_value),
            use(id_value), now;
        if (ChangedRows() == 0) {
            return core::Error{core::ErrorCode::kNotFound, "video not found"};
        }
        return core::Ok();
    } catch (const Poco::Exception& ex) {
        return DbError(ex);
    }
}

core::Result<Video> SqliteMetadataStore::MarkVideoUploaded(const std::string& video_id,
                                                           std::uint64_t final_size,
                                                           const std::string& file_hash,
                                                           const std::string& title) {
    std::lock_guard<std::mutex> lock(mutex_);
    try {
        std::string id_value = video_id;
        std::uint64_t size_value = final_size;
        std::string hash_value = file_hash;
        std::string title_value = title;
        std::string status_value = ToString(ArtifactStatus::kUploaded);
        std::string uploaded_at = core::NowIso8601();
        // An empty title keeps whatever was supplied at init.
        session_ <<
                "UPDATE videos SET final_size = ?, file_hash = ?, status = ?, uploaded_at = ?, "
                "title = CASE WHEN ? = '' THEN title ELSE ? END WHERE id = ?",
            use(size_value), use(hash_value), use(status_value), use(uploaded_at),
            use(title_value), use(title_value), use(id_value), now;
        if (ChangedRows() == 0) {
            return core::Error{core::ErrorCode::kNotFound, "video not found"};
        }
        return GetVideoLocked(video_id);
    } catch (const Poco::Exception& ex) {
        return DbError(ex);
    }
}

core::Result<UploadSession> SqliteMetadataStore::CreateSession(const UploadSession& session) {
    std::lock_guard<std::mutex> lock(mutex_);
    try {
        std::string id = session.id;
        std::string video_id = session.video_id;
        std::string filename = session.filename;
        std::string owner = session.owner;
        std::uint64_t file_size = session.file_size;
        std::uint64_t chunk_size = session.chunk_size;
        int total_chunks = session.total_chunks;
        std::string status = ToString(session.status);
        std::string now_time = core::NowIso8601();
        std::string expires_at = session.expires_at;
        session_ <<
                "INSERT INTO upload_sessions(id, video_id, filename, owner, file_size, chunk_size, "
                "total_chunks, uploaded_chunks, status, created_at, updated_at, expires_at) "
                "VALUES(?, ?, ?, ?, ?, ?, ?, 0, ?, ?, ?, ?)",
            use(id), use(video_id), use(filename), use(owner), use(file_size), use(chunk_size),
            use(total_chunks), use(status), use(now_time), use(now_time), use(expires_at), now;
        return GetSessionLocked(session.id);
    } catch (const Poco::Exception& ex) {
        // Primary key collisions surface here as well.
        return core::Error{core::ErrorCode::kConflict, ex.displayText()};
    }
}

core::Result<UploadSession> SqliteMetadataStore::GetSession(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    try {
        return GetSessionLocked(session_id);
    } catch (const Poco::Exception& ex) {
        return DbError(ex);
    }
}

core::Result<UploadSession> SqliteMetadataStore::GetSessionLocked(const std::string& session_id) {
    UploadSession upload;
    std::string status;
    std::string id_value = session_id;
    Poco::Data::Statement select(session_);
    select <<
            "SELECT id, video_id, filename, owner, file_size, chunk_size, total_chunks, "
            "uploaded_chunks, status, created_at, updated_at, expires_at, completed_at "
            "FROM upload_sessions WHERE id = ?",
        use(id_value), into(upload.id), into(upload.video_id), into(upload.filename),
        into(upload.owner), into(upload.file_size), into(upload.chunk_size),
        into(upload.total_chunks), into(upload.uploaded_chunks), into(status),
        into(upload.created_at), into(upload.updated_at), into(upload.expires_at),
        into(upload.completed_at), now;

    if (upload.id.empty()) {
        return core::Error{core::ErrorCode::kNotFound, "upload session not found"};
    }
    auto parsed = ParseSessionStatus(status);
    if (!parsed) {
        return core::Error{core::ErrorCode::kInternal, "unknown session status: " + status};
    }
    upload.status = *parsed;
    return upload;
}

core::Result<bool> SqliteMetadataStore::CompareAndSetSessionStatus(const std::string& session_id,
                                                                   SessionStatus expected,
                                                                   SessionStatus next) {
    std::lock_guard<std::mutex> lock(mutex_);
    try {
        std::string id_value = session_id;
        std::string expected_value = ToString(expected);
        std::string next_value = ToString(next);
        std::string now_time = core::NowIso8601();
        session_ << "UPDATE upload_sessions SET status = ?, updated_at = ? "
                    "WHERE id = ? AND status = ?",
            use(next_value), use(now_time), use(id_value), use(expected_value), now;
        return ChangedRows() == 1;
    } catch (const Poco::Exception& ex) {
        return DbError(ex);
    }
}

core::Result<void> SqliteMetadataStore::UpdateSessionProgress(const std::string& session_id,
                                                              int uploaded_chunks) {
    std::lock_guard<std::mutex> lock(mutex_);
    try {
        std::string id_value = session_id;
        int uploaded_value = uploaded_chunks;
        std::string now_time = core::NowIso8601();
        session_ <<
                "UPDATE upload_sessions SET uploaded_chunks = MIN(total_chunks, "
                "MAX(uploaded_chunks, ?)), updated_at = ? WHERE id = ?",
            use(uploaded_value), use(now_time), use(id_value), now;
        if (ChangedRows() == 0) {
            return core::Error{core::ErrorCode::kNotFound, "upload session not found"};
        }
        return core::Ok();
    } catch (const Poco::Exception& ex) {
        return DbError(ex);
    }
}

core::Result<bool> SqliteMetadataStore::CompleteSession(const std::string& session_id,
                                                        int uploaded_chunks) {
    std::lock_guard<std::mutex> lock(mutex_);
    try {
        std::string id_value = session_id;
        int uploaded_value = uploaded_chunks;
        std::string now_time = core::NowIso8601();
        std::string completed_value = ToString(SessionStatus::kCompleted);
        std::string assembling_value = ToString(SessionStatus::kAssembling);
        session_ <<
                "UPDATE upload_sessions SET status = ?, uploaded_chunks = MIN(total_chunks, ?), "
                "completed_at = ?, updated_at = ? WHERE id = ? AND status = ?",
            use(completed_value), use(uploaded_value), use(now_time), use(now_time),
            use(id_value), use(assembling_value), now;
        return ChangedRows() == 1;
    } catch (const Poco::Exception& ex) {
        return DbError(ex);
    }
}

core::Result<std::vector<UploadSession>> SqliteMetadataStore::ListExpiredSessions(
    const std::string& expires_before, int limit) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<UploadSession> sessions;
    try {
        UploadSession upload;
        std::string status;
        std::string cutoff_value = expires_before;
        int limit_value = limit;
        Poco::Data::Statement select(session_);
        select <<
                "SELECT id, video_id, filename, owner, file_size, chunk_size, total_chunks, "
                "uploaded_chunks, status, created_at, updated_at, expires_at, completed_at "
                "FROM upload_sessions "
                "WHERE status IN ('pending', 'uploading') AND expires_at < ? "
                "ORDER BY expires_at ASC LIMIT ?",
            use(cutoff_value), use(limit_value), into(upload.id), into(upload.video_id),
            into(upload.filename), into(upload.owner), into(upload.file_size),
            into(upload.chunk_size), into(upload.total_chunks), into(upload.uploaded_chunks),
            into(status), into(upload.created_at), into(upload.updated_at),
            into(upload.expires_at), into(upload.completed_at), range(0, 1);

        while (!select.done()) {
            upload = {};
            status.clear();
            select.execute();
            if (upload.id.empty()) {
                continue;
            }
            upload.status = ParseSessionStatus(status).value_or(SessionStatus::kPending);
            sessions.push_back(upload);
        }
    } catch (const Poco::Exception& ex) {
        return DbError(ex);
    }
    return sessions;
}

core::Result<void> SqliteMetadataStore::RecordUploadMetric(const UploadMetric& metric) {
    std::lock_guard<std::mutex> lock(mutex_);
    try {
        std::string id = metric.id;
        std::string video_id = metric.video_id;
        std::string upload_method = metric.upload_method;
        std::uint64_t file_size = metric.file_size;
        Poco::Int64 upload_duration = metric.upload_duration_ms;
        Poco::Int64 assembly_duration = metric.assembly_duration_ms;
        std::uint64_t throughput = metric.throughput_bps;
        int retry_count = metric.retry_count;
        std::string created_at = core::NowIso8601();
        session_ <<
                "INSERT INTO upload_metrics(id, video_id, upload_method, file_size, "
                "upload_duration_ms, assembly_duration_ms, throughput_bps, retry_count, "
                "created_at) VALUES(?, ?, ?, ?, ?, ?, ?, ?, ?)",
            use(id), use(video_id), use(upload_method), use(file_size), use(upload_duration),
            use(assembly_duration), use(throughput), use(retry_count), use(created_at), now;
        return core::Ok();
    } catch (const Poco::Exception& ex) {
        return DbError(ex);
    }
}

core::Result<std::vector<UploadMetric>> SqliteMetadataStore::ListUploadMetrics(int limit) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<UploadMetric> metrics;
    try {
        UploadMetric metric;
        Poco::Int64 upload_duration = 0;
        Poco::Int64 assembly_duration = 0;
        int limit_value = limit;
        Poco::Data::Statement select(session_);
        select <<
                "SELECT id, video_id, upload_method, file_size, upload_duration_ms, "
                "assembly_duration_ms, throughput_bps, retry_count, created_at "
                "FROM upload_metrics ORDER BY created_at DESC, rowid DESC LIMIT ?",
            use(limit_value), into(metric.id), into(metric.video_id), into(metric.upload_method),
            into(metric.file_size), into(upload_duration), into(assembly_duration),
            into(metric.throughput_bps), into(metric.retry_count), into(metric.created_at),
            range(0, 1);

        while (!select.done()) {
            metric = {};
            select.execute();
            if (metric.id.empty()) {
                continue;
            }
            metric.upload_duration_ms = upload_duration;
            metric.assembly_duration_ms = assembly_duration;
            metrics.push_back(metric);
        }
    } catch (const Poco::Exception& ex) {
        return DbError(ex);
    }
    return metrics;
}

}  // namespace vidingest::metadata
