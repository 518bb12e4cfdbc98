#pragma once

#include <cstdint>
#include <string>

#include "vidingest/core/error.h"
#include "vidingest/core/result.h"

namespace vidingest::storage {

/// @brief Attributes of a chunk payload after it has been durably written.
struct StoredChunk {
    std::string path;
    std::string content_hash;
    std::uint64_t size_bytes{0};
};

/// @brief Local filesystem storage for chunk payloads and assembled artifacts.
///
/// Layout under base_path: chunks/<session>/chunk_<NNNNNN> and raw/<video>.<ext>.
/// Every write lands in temp_path first and is renamed into place.
class LocalStorage {
public:
    LocalStorage(std::string base_path, std::string temp_path);

    /// @brief Atomically (re)write one chunk and return its MD5 fast hash.
    core::Result<StoredChunk> WriteChunk(const std::string& session_id, int chunk_number,
                                         const std::string& data);
    /// @brief Remove a session's chunk directory. Missing directories are not an error.
    core::Result<void> DeleteChunks(const std::string& session_id);

    std::string ChunkPath(const std::string& session_id, int chunk_number) const;
    std::string ArtifactPath(const std::string& video_id, const std::string& extension) const;
    /// @brief A fresh, unique path under temp_path.
    std::string TempPath() const;

    const std::string& base_path() const { return base_path_; }
    const std::string& temp_path() const { return temp_path_; }

    static bool IsSafeName(const std::string& name);
    /// @brief Lower-case extension without the dot, or empty when there is none.
    static std::string ExtensionOf(const std::string& filename);

private:
    std::string base_path_;
    std::string temp_path_;
};

}  // namespace vidingest::storage
