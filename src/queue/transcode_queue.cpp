#include "vidingest/queue/transcode_queue.h"

#include <filesystem>
#include <sstream>

#include <Poco/JSON/Object.h>

namespace vidingest::queue {

std::string TranscodeJob::ToJsonLine() const {
    Poco::JSON::Object::Ptr job = new Poco::JSON::Object();
    job->set("video_id", video_id);
    job->set("filename", filename);
    job->set("filepath", filepath);
    job->set("original_filename", original_filename);
    job->set("file_size", static_cast<Poco::UInt64>(file_size));
    job->set("file_hash", file_hash);
    job->set("upload_method", upload_method);
    job->set("queued_at", queued_at);
    std::ostringstream out;
    job->stringify(out);
    return out.str();
}

SpoolTranscodeQueue::SpoolTranscodeQueue(std::string spool_path)
    : spool_path_(std::move(spool_path)) {
    const auto parent = std::filesystem::path(spool_path_).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent);
    }
    out_.open(spool_path_, std::ios::out | std::ios::app);
}

core::Result<void> SpoolTranscodeQueue::Publish(const TranscodeJob& job) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!out_.is_open()) {
        out_.clear();
        out_.open(spool_path_, std::ios::out | std::ios::app);
        if (!out_.is_open()) {
            return core::Error{core::ErrorCode::kStorageUnavailable,
                               "transcode spool unavailable: " + spool_path_};
        }
    }
    out_ << job.ToJsonLine() << '\n';
    out_.flush();
    if (!out_) {
        out_.close();
        return core::Error{core::ErrorCode::kStorageUnavailable, "failed to append transcode job"};
    }
    return core::Ok();
}

}  // namespace vidingest::queue
