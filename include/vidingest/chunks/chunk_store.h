#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "vidingest/core/error.h"
#include "vidingest/core/result.h"

namespace vidingest::chunks {

/// @brief Bookkeeping for one uploaded chunk (payload bytes live in storage).
struct ChunkRecord {
    std::string session_id;
    int chunk_number{0};
    std::uint64_t byte_size{0};
    std::string content_hash;
    std::string uploaded_at;
    int retry_count{0};
};

/// @brief Outcome of recording a chunk.
struct MarkResult {
    bool was_new{false};
    int uploaded_count{0};
};

/// @brief Presence summary of a session's chunks against [1..total_chunks].
struct Progress {
    int total_chunks{0};
    int uploaded_count{0};
    std::vector<int> uploaded;
    std::vector<int> missing;

    bool complete() const { return total_chunks > 0 && missing.empty(); }
    /// Percentage rounded to two decimals.
    double percent() const;
};

/// @brief Builds the exact complement of `present` against [1..total_chunks].
Progress BuildProgress(int total_chunks, const std::vector<int>& present);

/// @brief Durable, TTL-backed chunk presence tracking.
///
/// Implementations must count each distinct chunk number exactly once no matter
/// how many concurrent MarkChunkUploaded calls race on it.
class ChunkStore {
public:
    virtual ~ChunkStore() = default;

    /// @brief Establish zero-progress tracking; re-creating refreshes the TTL only.
    virtual core::Result<void> CreateSession(const std::string& session_id, int total_chunks,
                                             int ttl_seconds) = 0;
    /// @brief Record a chunk; fails with kNotFound once the session is gone or its TTL elapsed.
    virtual core::Result<MarkResult> MarkChunkUploaded(const std::string& session_id,
                                                       int chunk_number, std::uint64_t byte_size,
                                                       const std::string& content_hash) = 0;
    virtual core::Result<bool> IsChunkPresent(const std::string& session_id,
                                              int chunk_number) = 0;
    virtual core::Result<Progress> GetProgress(const std::string& session_id,
                                               int total_chunks) = 0;
    virtual core::Result<std::vector<ChunkRecord>> ListChunks(const std::string& session_id) = 0;
    /// @brief Remove all bookkeeping for a session. Safe to repeat.
    virtual core::Result<void> DeleteSession(const std::string& session_id) = 0;
    /// @brief Drop sessions whose TTL elapsed before `now_iso8601`; returns how many.
    virtual core::Result<int> PurgeExpired(const std::string& now_iso8601) = 0;
};

}  // namespace vidingest::chunks
