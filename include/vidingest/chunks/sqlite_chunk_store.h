#pragma once

#include <mutex>
#include <string>

#include <Poco/Data/Session.h>

#include "vidingest/chunks/chunk_store.h"

namespace vidingest::chunks {

/// @brief SQLite-backed chunk store; each mutation is one serialized transaction.
class SqliteChunkStore : public ChunkStore {
public:
    explicit SqliteChunkStore(const std::string& db_path);

    core::Result<void> CreateSession(const std::string& session_id, int total_chunks,
                                     int ttl_seconds) override;
    core::Result<MarkResult> MarkChunkUploaded(const std::string& session_id, int chunk_number,
                                               std::uint64_t byte_size,
                                               const std::string& content_hash) override;
    core::Result<bool> IsChunkPresent(const std::string& session_id, int chunk_number) override;
    core::Result<Progress> GetProgress(const std::string& session_id, int total_chunks) override;
    core::Result<std::vector<ChunkRecord>> ListChunks(const std::string& session_id) override;
    core::Result<void> DeleteSession(const std::string& session_id) override;
    core::Result<int> PurgeExpired(const std::string& now_iso8601) override;

private:
    void InitSchema();

    std::mutex mutex_;
    Poco::Data::Session session_;
};

}  // namespace vidingest::chunks
