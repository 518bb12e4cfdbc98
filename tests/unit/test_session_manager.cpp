#include <atomic>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <gtest/gtest.h>
#include <Poco/DigestEngine.h>
#include <Poco/SHA2Engine.h>
#include <Poco/UUIDGenerator.h>

#include "vidingest/chunks/sqlite_chunk_store.h"
#include "vidingest/metadata/sqlite_metadata_store.h"
#include "vidingest/queue/transcode_queue.h"
#include "vidingest/ratelimit/rate_limiter.h"
#include "vidingest/storage/local_storage.h"
#include "vidingest/upload/session_manager.h"

using vidingest::core::ErrorCode;
using vidingest::metadata::ArtifactStatus;
using vidingest::metadata::SessionStatus;

namespace {

constexpr std::uint64_t kFileSize = 3000000;
constexpr std::uint64_t kChunkSize = 1048576;
const char* kIdentity = "ip:127.0.0.1";

vidingest::core::UploadConfig MakeUploadConfig() {
    vidingest::core::UploadConfig config;
    config.default_chunk_size = kChunkSize;
    return config;
}

/// Forwards to a real store; each hook runs once, just before the matching call.
class HookedChunkStore : public vidingest::chunks::ChunkStore {
public:
    explicit HookedChunkStore(vidingest::chunks::ChunkStore& inner) : inner_(inner) {}

    vidingest::core::Result<void> CreateSession(const std::string& session_id, int total_chunks,
                                                int ttl_seconds) override {
        return inner_.CreateSession(session_id, total_chunks, ttl_seconds);
    }
    vidingest::core::Result<vidingest::chunks::MarkResult> MarkChunkUploaded(
        const std::string& session_id, int chunk_number, std::uint64_t byte_size,
        const std::string& content_hash) override {
        RunOnce(before_mark);
        return inner_.MarkChunkUploaded(session_id, chunk_number, byte_size, content_hash);
    }
    vidingest::core::Result<bool> IsChunkPresent(const std::string& session_id,
                                                 int chunk_number) override {
        return inner_.IsChunkPresent(session_id, chunk_number);
    }
    vidingest::core::Result<vidingest::chunks::Progress> GetProgress(
        const std::string& session_id, int total_chunks) override {
        RunOnce(before_progress);
        return inner_.GetProgress(session_id, total_chunks);
    }
    vidingest::core::Result<std::vector<vidingest::chunks::ChunkRecord>> ListChunks(
        const std::string& session_id) override {
        return inner_.ListChunks(session_id);
    }
    vidingest::core::Result<void> DeleteSession(const std::string& session_id) override {
        return inner_.DeleteSession(session_id);
    }
    vidingest::core::Result<int> PurgeExpired(const std::string& now_iso8601) override {
        return inner_.PurgeExpired(now_iso8601);
    }

    std::function<void()> before_mark;
    std::function<void()> before_progress;

private:
    static void RunOnce(std::function<void()>& hook) {
        if (hook) {
            auto run = std::move(hook);
            hook = nullptr;
            run();
        }
    }

    vidingest::chunks::ChunkStore& inner_;
};

/// Owns one complete upload stack rooted in a temp directory.
struct Harness {
    explicit Harness(vidingest::core::RateLimitConfig limits = {})
        : root(MakeRoot()),
          metadata((root / "metadata.db").string()),
          chunk_store((root / "chunks.db").string()),
          hooked(chunk_store),
          storage((root / "data").string(), (root / "tmp").string()),
          limiter(limits, std::make_shared<vidingest::ratelimit::InMemoryRateLimitBackend>()),
          transcode_queue((root / "queue" / "transcode.jsonl").string()),
          manager(MakeUploadConfig(), metadata, hooked, storage, limiter, transcode_queue) {}

    static std::filesystem::path MakeRoot() {
        const auto root = std::filesystem::temp_directory_path() /
                          ("vidingest_sessions_" + Poco::UUIDGenerator().createOne().toString());
        std::filesystem::create_directories(root);
        return root;
    }

    ~Harness() {
        std::error_code ec;
        std::filesystem::remove_all(root, ec);
    }

    std::filesystem::path root;
    vidingest::metadata::SqliteMetadataStore metadata;
    vidingest::chunks::SqliteChunkStore chunk_store;
    HookedChunkStore hooked;
    vidingest::storage::LocalStorage storage;
    vidingest::ratelimit::RateLimiter limiter;
    vidingest::queue::SpoolTranscodeQueue transcode_queue;
    vidingest::upload::SessionManager manager;
};

std::string MakePayload(std::uint64_t size) {
    std::string payload(size, '\0');
    for (std::uint64_t i = 0; i < size; ++i) {
        payload[i] = static_cast<char>((i * 31 + 7) % 251);
    }
    return payload;
}

std::string ChunkOf(const std::string& payload, int number) {
    const auto offset = static_cast<std::size_t>(number - 1) * kChunkSize;
    return payload.substr(offset, kChunkSize);
}

std::string Sha256Hex(const std::string& data) {
    Poco::SHA2Engine256 engine;
    engine.update(data);
    return Poco::DigestEngine::digestToHex(engine.digest());
}

vidingest::upload::InitRequest MakeInit() {
    vidingest::upload::InitRequest request;
    request.filename = "holiday clip.mp4";
    request.file_size = kFileSize;
    request.total_chunks = 3;
    request.chunk_size = kChunkSize;
    request.identity = kIdentity;
    return request;
}

}  // namespace

TEST(SessionManager, OutOfOrderUploadAssemblesOriginalBytes) {
    Harness harness;
    const auto payload = MakePayload(kFileSize);

    auto session = harness.manager.Init(MakeInit());
    ASSERT_TRUE(session.ok());
    EXPECT_EQ(session.value().status, SessionStatus::kPending);
    EXPECT_EQ(session.value().total_chunks, 3);
    EXPECT_EQ(session.value().filename, "holiday_clip.mp4");
    const auto id = session.value().id;

    auto second = harness.manager.AcceptChunk(id, 2, ChunkOf(payload, 2), kIdentity);
    ASSERT_TRUE(second.ok());
    EXPECT_FALSE(second.value().duplicate);
    EXPECT_EQ(second.value().uploaded_chunks, 1);
    EXPECT_DOUBLE_EQ(second.value().progress_percent, 33.33);

    auto first = harness.manager.AcceptChunk(id, 1, ChunkOf(payload, 1), kIdentity);
    ASSERT_TRUE(first.ok());
    EXPECT_EQ(first.value().uploaded_chunks, 2);

    std::vector<int> missing;
    auto early = harness.manager.Complete(id, "", &missing);
    ASSERT_FALSE(early.ok());
    EXPECT_EQ(early.code(), ErrorCode::kIncompleteUpload);
    EXPECT_EQ(missing, (std::vector<int>{3}));

    auto last = harness.manager.AcceptChunk(id, 3, ChunkOf(payload, 3), kIdentity);
    ASSERT_TRUE(last.ok());
    EXPECT_EQ(last.value().uploaded_chunks, 3);
    EXPECT_DOUBLE_EQ(last.value().progress_percent, 100.0);

    auto completed = harness.manager.Complete(id, "Beach day");
    ASSERT_TRUE(completed.ok());
    EXPECT_EQ(completed.value().file_size, kFileSize);
    EXPECT_EQ(completed.value().file_hash, Sha256Hex(payload));
    EXPECT_EQ(completed.value().status, ArtifactStatus::kQueued);

    auto video = harness.manager.GetVideo(completed.value().video_id);
    ASSERT_TRUE(video.ok());
    EXPECT_EQ(video.value().status, ArtifactStatus::kQueued);
    EXPECT_EQ(video.value().title, "Beach day");
    EXPECT_EQ(video.value().final_size, kFileSize);
    EXPECT_EQ(video.value().original_filename, "holiday_clip.mp4");

    auto status = harness.manager.Status(id);
    ASSERT_TRUE(status.ok());
    EXPECT_EQ(status.value().session.status, SessionStatus::kCompleted);
    EXPECT_EQ(status.value().progress.uploaded_count, 3);
    EXPECT_TRUE(status.value().progress.missing.empty());

    EXPECT_FALSE(std::filesystem::exists(harness.root / "data" / "chunks" / id));
    EXPECT_TRUE(std::filesystem::exists(harness.storage.ArtifactPath(completed.value().video_id,
                                                                     "mp4")));

    std::ifstream spool(harness.transcode_queue.spool_path());
    std::string line;
    ASSERT_TRUE(std::getline(spool, line));
    EXPECT_NE(line.find(completed.value().video_id), std::string::npos);

    auto metrics = harness.manager.ListMetrics(10);
    ASSERT_TRUE(metrics.ok());
    ASSERT_EQ(metrics.value().size(), 1u);
    EXPECT_EQ(metrics.value()[0].file_size, kFileSize);
}

TEST(SessionManager, InitValidatesRequest) {
    Harness harness;

    auto bad_type = MakeInit();
    bad_type.filename = "notes.txt";
    auto rejected = harness.manager.Init(bad_type);
    ASSERT_FALSE(rejected.ok());
    EXPECT_EQ(rejected.code(), ErrorCode::kInvalidArgument);

    auto empty = MakeInit();
    empty.file_size = 0;
    EXPECT_EQ(harness.manager.Init(empty).code(), ErrorCode::kInvalidArgument);

    auto huge = MakeInit();
    huge.file_size = 3ULL * 1024 * 1024 * 1024;
    huge.total_chunks = 3072;
    EXPECT_EQ(harness.manager.Init(huge).code(), ErrorCode::kPayloadTooLarge);

    auto wrong_count = MakeInit();
    wrong_count.total_chunks = 4;
    EXPECT_EQ(harness.manager.Init(wrong_count).code(), ErrorCode::kInvalidArgument);

    auto tiny_chunks = MakeInit();
    tiny_chunks.chunk_size = 1024;
    tiny_chunks.total_chunks = 2930;
    EXPECT_EQ(harness.manager.Init(tiny_chunks).code(), ErrorCode::kInvalidArgument);

    auto traversal = MakeInit();
    traversal.filename = "../";
    EXPECT_EQ(harness.manager.Init(traversal).code(), ErrorCode::kInvalidArgument);
}

TEST(SessionManager, InitDefaultsChunkSize) {
    Harness harness;

    auto request = MakeInit();
    request.chunk_size = 0;
    auto session = harness.manager.Init(request);
    ASSERT_TRUE(session.ok());
    EXPECT_EQ(session.value().chunk_size, kChunkSize);

    auto video = harness.manager.GetVideo(session.value().video_id);
    ASSERT_TRUE(video.ok());
    EXPECT_EQ(video.value().mime_type, "video/mp4");
    EXPECT_EQ(video.value().uploader_id, kIdentity);
    EXPECT_EQ(video.value().status, ArtifactStatus::kUploading);
}

TEST(SessionManager, DuplicateChunkDoesNotDoubleCount) {
    Harness harness;
    const auto payload = MakePayload(kFileSize);
    auto session = harness.manager.Init(MakeInit());
    ASSERT_TRUE(session.ok());
    const auto id = session.value().id;

    ASSERT_TRUE(harness.manager.AcceptChunk(id, 1, ChunkOf(payload, 1), kIdentity).ok());
    auto again = harness.manager.AcceptChunk(id, 1, ChunkOf(payload, 1), kIdentity);
    ASSERT_TRUE(again.ok());
    EXPECT_TRUE(again.value().duplicate);
    EXPECT_EQ(again.value().uploaded_chunks, 1);

    auto status = harness.manager.Status(id);
    ASSERT_TRUE(status.ok());
    EXPECT_EQ(status.value().session.status, SessionStatus::kUploading);
    EXPECT_EQ(status.value().session.uploaded_chunks, 1);
    EXPECT_EQ(status.value().progress.missing, (std::vector<int>{2, 3}));
}

TEST(SessionManager, ChunkBoundsAndLengthAreEnforced) {
    Harness harness;
    const auto payload = MakePayload(kFileSize);
    auto session = harness.manager.Init(MakeInit());
    ASSERT_TRUE(session.ok());
    const auto id = session.value().id;

    EXPECT_EQ(harness.manager.AcceptChunk(id, 0, ChunkOf(payload, 1), kIdentity).code(),
              ErrorCode::kInvalidArgument);
    EXPECT_EQ(harness.manager.AcceptChunk(id, 4, ChunkOf(payload, 1), kIdentity).code(),
              ErrorCode::kInvalidArgument);
    // The last chunk carries the remainder, not a full chunk.
    EXPECT_EQ(harness.manager.AcceptChunk(id, 3, ChunkOf(payload, 1), kIdentity).code(),
              ErrorCode::kInvalidArgument);
    EXPECT_EQ(harness.manager.AcceptChunk(id, 1, "short", kIdentity).code(),
              ErrorCode::kInvalidArgument);

    auto status = harness.manager.Status(id);
    ASSERT_TRUE(status.ok());
    EXPECT_EQ(status.value().session.status, SessionStatus::kPending);
    EXPECT_EQ(status.value().progress.uploaded_count, 0);
}

TEST(SessionManager, UnknownSessionIsNotFound) {
    Harness harness;

    EXPECT_EQ(harness.manager.AcceptChunk("missing", 1, "x", kIdentity).code(),
              ErrorCode::kNotFound);
    EXPECT_EQ(harness.manager.Complete("missing", "").code(), ErrorCode::kNotFound);
    EXPECT_EQ(harness.manager.Status("missing").code(), ErrorCode::kNotFound);
}

TEST(SessionManager, CompletedSessionRejectsFurtherWork) {
    Harness harness;
    const auto payload = MakePayload(kFileSize);
    auto session = harness.manager.Init(MakeInit());
    ASSERT_TRUE(session.ok());
    const auto id = session.value().id;
    for (int number = 1; number <= 3; ++number) {
        ASSERT_TRUE(harness.manager.AcceptChunk(id, number, ChunkOf(payload, number), kIdentity)
                        .ok());
    }
    ASSERT_TRUE(harness.manager.Complete(id, "").ok());

    EXPECT_EQ(harness.manager.Complete(id, "").code(), ErrorCode::kConflict);
    EXPECT_EQ(harness.manager.AcceptChunk(id, 1, ChunkOf(payload, 1), kIdentity).code(),
              ErrorCode::kConflict);
}

TEST(SessionManager, ConcurrentCompletionHasOneWinner) {
    Harness harness;
    const auto payload = MakePayload(kFileSize);
    auto session = harness.manager.Init(MakeInit());
    ASSERT_TRUE(session.ok());
    const auto id = session.value().id;
    for (int number = 1; number <= 3; ++number) {
        ASSERT_TRUE(harness.manager.AcceptChunk(id, number, ChunkOf(payload, number), kIdentity)
                        .ok());
    }

    std::atomic<int> winners{0};
    std::atomic<int> conflicts{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 4; ++i) {
        threads.emplace_back([&harness, &id, &winners, &conflicts]() {
            auto result = harness.manager.Complete(id, "");
            if (result.ok()) {
                ++winners;
            } else if (result.code() == ErrorCode::kConflict) {
                ++conflicts;
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(winners.load(), 1);
    EXPECT_EQ(conflicts.load(), 3);
    auto metrics = harness.manager.ListMetrics(10);
    ASSERT_TRUE(metrics.ok());
    EXPECT_EQ(metrics.value().size(), 1u);
}

TEST(SessionManager, RateLimitedChunkDoesNotMutate) {
    vidingest::core::RateLimitConfig limits;
    limits.chunk_max_requests = 1;
    Harness harness(limits);
    const auto payload = MakePayload(kFileSize);
    auto session = harness.manager.Init(MakeInit());
    ASSERT_TRUE(session.ok());
    const auto id = session.value().id;

    ASSERT_TRUE(harness.manager.AcceptChunk(id, 1, ChunkOf(payload, 1), kIdentity).ok());

    int retry_after = 0;
    auto limited =
        harness.manager.AcceptChunk(id, 2, ChunkOf(payload, 2), kIdentity, &retry_after);
    ASSERT_FALSE(limited.ok());
    EXPECT_EQ(limited.code(), ErrorCode::kRateLimited);
    EXPECT_GT(retry_after, 0);

    auto status = harness.manager.Status(id);
    ASSERT_TRUE(status.ok());
    EXPECT_EQ(status.value().progress.uploaded, (std::vector<int>{1}));
    EXPECT_FALSE(std::filesystem::exists(harness.storage.ChunkPath(id, 2)));

    // Other clients keep their own quota.
    EXPECT_TRUE(harness.manager.AcceptChunk(id, 2, ChunkOf(payload, 2), "ip:10.0.0.9").ok());
}

TEST(SessionManager, RateLimitedInitCreatesNothing) {
    vidingest::core::RateLimitConfig limits;
    limits.init_max_requests = 1;
    Harness harness(limits);

    ASSERT_TRUE(harness.manager.Init(MakeInit()).ok());
    int retry_after = 0;
    auto limited = harness.manager.Init(MakeInit(), &retry_after);
    ASSERT_FALSE(limited.ok());
    EXPECT_EQ(limited.code(), ErrorCode::kRateLimited);
    EXPECT_GT(retry_after, 0);
}

TEST(SessionManager, AssemblyFailureFailsSessionAndVideo) {
    Harness harness;
    const auto payload = MakePayload(kFileSize);

    auto session = harness.manager.Init(MakeInit());
    ASSERT_TRUE(session.ok());
    const auto id = session.value().id;
    const auto video_id = session.value().video_id;
    for (int number = 1; number <= 3; ++number) {
        ASSERT_TRUE(harness.manager.AcceptChunk(id, number, ChunkOf(payload, number), kIdentity)
                        .ok());
    }
    ASSERT_TRUE(std::filesystem::remove(harness.storage.ChunkPath(id, 2)));

    auto completed = harness.manager.Complete(id, "");
    ASSERT_FALSE(completed.ok());
    EXPECT_EQ(completed.code(), ErrorCode::kIntegrityError);

    EXPECT_EQ(harness.metadata.GetSession(id).value().status, SessionStatus::kFailed);
    EXPECT_EQ(harness.metadata.GetVideo(video_id).value().status, ArtifactStatus::kFailed);
    EXPECT_FALSE(std::filesystem::exists(harness.storage.ArtifactPath(video_id, "mp4")));
    EXPECT_FALSE(std::filesystem::exists(harness.root / "data" / "chunks" / id));
    EXPECT_TRUE(harness.chunk_store.ListChunks(id).value().empty());

    EXPECT_EQ(harness.manager.Complete(id, "").code(), ErrorCode::kConflict);
}

TEST(SessionManager, ChunkAfterTrackingReleasedLeavesNoFiles) {
    Harness harness;
    const auto payload = MakePayload(kFileSize);

    auto session = harness.manager.Init(MakeInit());
    ASSERT_TRUE(session.ok());
    const auto id = session.value().id;
    ASSERT_TRUE(harness.manager.AcceptChunk(id, 1, ChunkOf(payload, 1), kIdentity).ok());
    ASSERT_TRUE(harness.chunk_store.DeleteSession(id).ok());

    auto late = harness.manager.AcceptChunk(id, 2, ChunkOf(payload, 2), kIdentity);
    ASSERT_FALSE(late.ok());
    EXPECT_EQ(late.code(), ErrorCode::kExpired);
    EXPECT_FALSE(std::filesystem::exists(harness.root / "data" / "chunks" / id));
}

TEST(SessionManager, ChunkRacingCompletionReportsConflict) {
    Harness harness;
    const auto payload = MakePayload(kFileSize);

    auto session = harness.manager.Init(MakeInit());
    ASSERT_TRUE(session.ok());
    const auto id = session.value().id;
    ASSERT_TRUE(harness.manager.AcceptChunk(id, 1, ChunkOf(payload, 1), kIdentity).ok());

    // Another caller finishes the session between the presence check and the mark.
    harness.hooked.before_mark = [&harness, id]() {
        ASSERT_TRUE(harness.metadata
                        .CompareAndSetSessionStatus(id, SessionStatus::kUploading,
                                                    SessionStatus::kAssembling)
                        .value());
        ASSERT_TRUE(harness.metadata.CompleteSession(id, 3).value());
        ASSERT_TRUE(harness.chunk_store.DeleteSession(id).ok());
        ASSERT_TRUE(harness.storage.DeleteChunks(id).ok());
    };

    auto racing = harness.manager.AcceptChunk(id, 2, ChunkOf(payload, 2), kIdentity);
    ASSERT_FALSE(racing.ok());
    EXPECT_EQ(racing.code(), ErrorCode::kConflict);
    EXPECT_FALSE(std::filesystem::exists(harness.root / "data" / "chunks" / id));
}

TEST(SessionManager, CompletionRacingSweepReportsExpired) {
    Harness harness;
    const auto payload = MakePayload(kFileSize);

    auto session = harness.manager.Init(MakeInit());
    ASSERT_TRUE(session.ok());
    const auto id = session.value().id;
    for (int number = 1; number <= 3; ++number) {
        ASSERT_TRUE(harness.manager.AcceptChunk(id, number, ChunkOf(payload, number), kIdentity)
                        .ok());
    }

    // The sweeper expires the session after it was loaded but before it is claimed.
    harness.hooked.before_progress = [&harness, id]() {
        ASSERT_TRUE(harness.metadata
                        .CompareAndSetSessionStatus(id, SessionStatus::kUploading,
                                                    SessionStatus::kExpired)
                        .value());
    };

    auto completed = harness.manager.Complete(id, "");
    ASSERT_FALSE(completed.ok());
    EXPECT_EQ(completed.code(), ErrorCode::kExpired);
    EXPECT_EQ(harness.metadata.GetSession(id).value().status, SessionStatus::kExpired);
}
