#pragma once

#include <cstdint>
#include <fstream>
#include <mutex>
#include <string>

#include "vidingest/core/result.h"

namespace vidingest::queue {

/// @brief "Ready to transcode" notification for one assembled artifact.
struct TranscodeJob {
    std::string video_id;
    std::string filename;
    std::string filepath;
    std::string original_filename;
    std::uint64_t file_size{0};
    std::string file_hash;
    std::string upload_method{"chunked"};
    std::string queued_at;

    std::string ToJsonLine() const;
};

/// @brief Sink for transcode notifications.
class TranscodeQueue {
public:
    virtual ~TranscodeQueue() = default;

    virtual core::Result<void> Publish(const TranscodeJob& job) = 0;
};

/// @brief Appends one JSON object per line to a spool file, flushed per job.
class SpoolTranscodeQueue : public TranscodeQueue {
public:
    explicit SpoolTranscodeQueue(std::string spool_path);

    core::Result<void> Publish(const TranscodeJob& job) override;

    const std::string& spool_path() const { return spool_path_; }

private:
    std::string spool_path_;
    std::mutex mutex_;
    std::ofstream out_;
};

}  // namespace vidingest::queue
