#include "vidingest/chunks/sqlite_chunk_store.h"

#include <Poco/Data/SQLite/Connector.h>
#include <Poco/Data/Statement.h>
#include <Poco/Data/Transaction.h>

#include "vidingest/core/time.h"

namespace {
using namespace Poco::Data::Keywords;

vidingest::core::Error DbError(const Poco::Exception& ex) {
    return vidingest::core::Error{vidingest::core::ErrorCode::kStorageUnavailable,
                                  ex.displayText()};
}
}  // namespace

namespace vidingest::chunks {

SqliteChunkStore::SqliteChunkStore(const std::string& db_path)
    : session_([](const std::string& path) {
          Poco::Data::SQLite::Connector::registerConnector();
          return Poco::Data::Session("SQLite", path);
      }(db_path)) {
    InitSchema();
}

void SqliteChunkStore::InitSchema() {
    session_ << "PRAGMA journal_mode = WAL", now;
    session_ << "PRAGMA foreign_keys = ON", now;

    session_ <<
            "CREATE TABLE IF NOT EXISTS chunk_sessions ("
            "session_id TEXT PRIMARY KEY,"
            "total_chunks INTEGER NOT NULL,"
            "uploaded_count INTEGER NOT NULL DEFAULT 0,"
            "ttl_seconds INTEGER NOT NULL,"
            "expires_at TEXT NOT NULL"
            ")",
        now;

    session_ <<
            "CREATE TABLE IF NOT EXISTS chunk_records ("
            "session_id TEXT NOT NULL,"
            "chunk_number INTEGER NOT NULL,"
            "byte_size INTEGER NOT NULL,"
            "content_hash TEXT NOT NULL,"
            "uploaded_at TEXT NOT NULL,"
            "retry_count INTEGER NOT NULL DEFAULT 0,"
            "PRIMARY KEY(session_id, chunk_number),"
            "FOREIGN KEY(session_id) REFERENCES chunk_sessions(session_id) ON DELETE CASCADE"
            ")",
        now;

    session_ <<
            "CREATE INDEX IF NOT EXISTS idx_chunk_sessions_expires_at "
            "ON chunk_sessions(expires_at)",
        now;
}

core::Result<void> SqliteChunkStore::CreateSession(const std::string& session_id,
                                                   int total_chunks, int ttl_seconds) {
    if (total_chunks <= 0 || ttl_seconds <= 0) {
        return core::Error{core::ErrorCode::kInvalidArgument,
                           "total_chunks and ttl must be positive"};
    }
    std::lock_guard<std::mutex> lock(mutex_);
    try {
        std::string id_value = session_id;
        int total_value = total_chunks;
        int ttl_value = ttl_seconds;
        std::string expires_at = core::NowIso8601WithOffsetSeconds(ttl_seconds);
        session_ <<
                "INSERT INTO chunk_sessions(session_id, total_chunks, uploaded_count, "
                "ttl_seconds, expires_at) VALUES(?, ?, 0, ?, ?) "
                "ON CONFLICT(session_id) DO UPDATE SET expires_at = excluded.expires_at, "
                "ttl_seconds = excluded.ttl_seconds",
            use(id_value), use(total_value), use(ttl_value), use(expires_at), now;
        return core::Ok();
    } catch (const Poco::Exception& ex) {
        return DbError(ex);
    }
}

core::Result<MarkResult> SqliteChunkStore::MarkChunkUploaded(const std::string& session_id,
                                                             int chunk_number,
                                                             std::uint64_t byte_size,
                                                             const std::string& content_hash) {
    std::lock_guard<std::mutex> lock(mutex_);
    try {
        Poco::Data::Transaction tx(session_);

        std::string id_value = session_id;
        std::string now_time = core::NowIso8601();
        int total_chunks = 0;
        int ttl_seconds = 0;
        std::string expires_at;
        session_ << "SELECT total_chunks, ttl_seconds, expires_at FROM chunk_sessions "
                    "WHERE session_id = ?",
            use(id_value), into(total_chunks), into(ttl_seconds), into(expires_at), now;
        if (expires_at.empty() || expires_at <= now_time) {
            return core::Error{core::ErrorCode::kNotFound, "chunk session not found or expired"};
        }
        if (chunk_number < 1 || chunk_number > total_chunks) {
            return core::Error{core::ErrorCode::kInvalidArgument, "chunk number out of range"};
        }

        int number_value = chunk_number;
        std::uint64_t size_value = byte_size;
        std::string hash_value = content_hash;
        session_ <<
                "INSERT OR IGNORE INTO chunk_records(session_id, chunk_number, byte_size, "
                "content_hash, uploaded_at, retry_count) VALUES(?, ?, ?, ?, ?, 0)",
            use(id_value), use(number_value), use(size_value), use(hash_value), use(now_time),
            now;
        int inserted = 0;
        session_ << "SELECT changes()", into(inserted), now;

        MarkResult result;
        result.was_new = inserted == 1;
        if (!result.was_new) {
            // Re-upload of a known chunk: overwrite in place, never re-count.
            session_ <<
                    "UPDATE chunk_records SET byte_size = ?, content_hash = ?, uploaded_at = ?, "
                    "retry_count = retry_count + 1 WHERE session_id = ? AND chunk_number = ?",
                use(size_value), use(hash_value), use(now_time), use(id_value),
                use(number_value), now;
        }

        int increment = result.was_new ? 1 : 0;
        std::string refreshed = core::NowIso8601WithOffsetSeconds(ttl_seconds);
        session_ <<
                "UPDATE chunk_sessions SET uploaded_count = uploaded_count + ?, expires_at = ? "
                "WHERE session_id = ?",
            use(increment), use(refreshed), use(id_value), now;
        session_ << "SELECT uploaded_count FROM chunk_sessions WHERE session_id = ?",
            use(id_value), into(result.uploaded_count), now;

        tx.commit();
        return result;
    } catch (const Poco::Exception& ex) {
        return DbError(ex);
    }
}

core::Result<bool> SqliteChunkStore::IsChunkPresent(const std::string& session_id,
                                                    int chunk_number) {
    std::lock_guard<std::mutex> lock(mutex_);
    try {
        std::string id_value = session_id;
        int number_value = chunk_number;
        int count = 0;
        session_ << "SELECT COUNT(*) FROM chunk_records WHERE session_id = ? AND chunk_number = ?",
            use(id_value), use(number_value), into(count), now;
        return count > 0;
    } catch (const Poco::Exception& ex) {
        return DbError(ex);
    }
}

core::Result<Progress> SqliteChunkStore::GetProgress(const std::string& session_id,
                                                     int total_chunks) {
    std::lock_guard<std::mutex> lock(mutex_);
    try {
        std::vector<int> present;
        std::string id_value = session_id;
        session_ << "SELECT chunk_number FROM chunk_records WHERE session_id = ? "
                    "ORDER BY chunk_number ASC",
            use(id_value), into(present), now;
        return BuildProgress(total_chunks, present);
    } catch (const Poco::Exception& ex) {
        return DbError(ex);
    }
}

core::Result<std::vector<ChunkRecord>> SqliteChunkStore::ListChunks(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ChunkRecord> records;
    try {
        ChunkRecord record;
        std::string id_value = session_id;
        Poco::Data::Statement select(session_);
        select <<
                "SELECT session_id, chunk_number, byte_size, content_hash, uploaded_at, "
                "retry_count FROM chunk_records WHERE session_id = ? ORDER BY chunk_number ASC",
            use(id_value), into(record.session_id), into(record.chunk_number),
            into(record.byte_size), into(record.content_hash), into(record.uploaded_at),
            into(record.retry_count), range(0, 1);

        while (!select.done()) {
            record = {};
            select.execute();
            if (!record.session_id.empty()) {
                records.push_back(record);
            }
        }
    } catch (const Poco::Exception& ex) {
        return DbError(ex);
    }
    return records;
}

core::Result<void> SqliteChunkStore::DeleteSession(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    try {
        Poco::Data::Transaction tx(session_);
        std::string id_value = session_id;
        session_ << "DELETE FROM chunk_records WHERE session_id = ?", use(id_value), now;
        session_ << "DELETE FROM chunk_sessions WHERE session_id = ?", use(id_value), now;
        tx.commit();
        return core::Ok();
    } catch (const Poco::Exception& ex) {
        return DbError(ex);
    }
}

core::Result<int> SqliteChunkStore::PurgeExpired(const std::string& now_iso8601) {
    std::lock_guard<std::mutex> lock(mutex_);
    try {
        Poco::Data::Transaction tx(session_);
        std::string cutoff = now_iso8601;
        session_ <<
                "DELETE FROM chunk_records WHERE session_id IN "
                "(SELECT session_id FROM chunk_sessions WHERE expires_at <= ?)",
            use(cutoff), now;
        session_ << "DELETE FROM chunk_sessions WHERE expires_at <= ?", use(cutoff), now;
        int purged = 0;
        session_ << "SELECT changes()", into(purged), now;
        tx.commit();
        return purged;
    } catch (const Poco::Exception& ex) {
        return DbError(ex);
    }
}

}  // namespace vidingest::chunks
