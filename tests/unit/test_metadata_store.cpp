#include <filesystem>
#include <string>

#include <gtest/gtest.h>
#include <Poco/UUIDGenerator.h>

#include "vidingest/core/time.h"
#include "vidingest/metadata/sqlite_metadata_store.h"

using vidingest::metadata::ArtifactStatus;
using vidingest::metadata::SessionStatus;

namespace {

std::filesystem::path MakeTempDbPath() {
    const auto name = "vidingest_test_" + Poco::UUIDGenerator().createOne().toString() + ".db";
    return std::filesystem::temp_directory_path() / name;
}

vidingest::metadata::Video MakeVideo(const std::string& id) {
    vidingest::metadata::Video video;
    video.id = id;
    video.title = "Holiday";
    video.filename = id + ".mp4";
    video.original_filename = "holiday.mp4";
    video.file_size = 3000000;
    video.mime_type = "video/mp4";
    video.uploader_id = "alice";
    return video;
}

vidingest::metadata::UploadSession MakeSession(const std::string& id, const std::string& video_id,
                                               const std::string& expires_at) {
    vidingest::metadata::UploadSession session;
    session.id = id;
    session.video_id = video_id;
    session.filename = "holiday.mp4";
    session.owner = "ip:127.0.0.1";
    session.file_size = 3000000;
    session.chunk_size = 1048576;
    session.total_chunks = 3;
    session.expires_at = expires_at;
    return session;
}

}  // namespace

TEST(MetadataStore, CreateAndFetchVideo) {
    const auto db_path = MakeTempDbPath();

    {
        vidingest::metadata::SqliteMetadataStore store(db_path.string());
        auto created = store.CreateVideo(MakeVideo("v1"));
        ASSERT_TRUE(created.ok());
        EXPECT_EQ(created.value().status, ArtifactStatus::kUploading);
        EXPECT_FALSE(created.value().created_at.empty());

        auto fetched = store.GetVideo("v1");
        ASSERT_TRUE(fetched.ok());
        EXPECT_EQ(fetched.value().original_filename, "holiday.mp4");
        EXPECT_EQ(fetched.value().upload_method, "chunked");

        auto missing = store.GetVideo("nope");
        ASSERT_FALSE(missing.ok());
        EXPECT_EQ(missing.code(), vidingest::core::ErrorCode::kNotFound);
    }

    std::filesystem::remove(db_path);
}

TEST(MetadataStore, MarkVideoUploadedKeepsTitleWhenEmpty) {
    const auto db_path = MakeTempDbPath();

    {
        vidingest::metadata::SqliteMetadataStore store(db_path.string());
        ASSERT_TRUE(store.CreateVideo(MakeVideo("v1")).ok());

        auto uploaded = store.MarkVideoUploaded("v1", 3000000, "abc123", "");
        ASSERT_TRUE(uploaded.ok());
        EXPECT_EQ(uploaded.value().status, ArtifactStatus::kUploaded);
        EXPECT_EQ(uploaded.value().title, "Holiday");
        EXPECT_EQ(uploaded.value().final_size, 3000000u);
        EXPECT_EQ(uploaded.value().file_hash, "abc123");
        EXPECT_FALSE(uploaded.value().uploaded_at.empty());

        auto renamed = store.MarkVideoUploaded("v1", 3000000, "abc123", "Beach day");
        ASSERT_TRUE(renamed.ok());
        EXPECT_EQ(renamed.value().title, "Beach day");

        ASSERT_TRUE(store.UpdateVideoStatus("v1", ArtifactStatus::kQueued).ok());
        EXPECT_EQ(store.GetVideo("v1").value().status, ArtifactStatus::kQueued);
    }

    std::filesystem::remove(db_path);
}

TEST(MetadataStore, SessionCompareAndSet) {
    const auto db_path = MakeTempDbPath();

    {
        vidingest::metadata::SqliteMetadataStore store(db_path.string());
        ASSERT_TRUE(store.CreateVideo(MakeVideo("v1")).ok());
        const auto deadline = vidingest::core::NowIso8601WithOffsetSeconds(60);
        auto created = store.CreateSession(MakeSession("s1", "v1", deadline));
        ASSERT_TRUE(created.ok());
        EXPECT_EQ(created.value().status, SessionStatus::kPending);
        EXPECT_EQ(created.value().uploaded_chunks, 0);

        auto moved = store.CompareAndSetSessionStatus("s1", SessionStatus::kPending,
                                                      SessionStatus::kUploading);
        ASSERT_TRUE(moved.ok());
        EXPECT_TRUE(moved.value());

        auto stale = store.CompareAndSetSessionStatus("s1", SessionStatus::kPending,
                                                      SessionStatus::kAssembling);
        ASSERT_TRUE(stale.ok());
        EXPECT_FALSE(stale.value());
        EXPECT_EQ(store.GetSession("s1").value().status, SessionStatus::kUploading);

        auto unknown = store.CompareAndSetSessionStatus("missing", SessionStatus::kPending,
                                                        SessionStatus::kUploading);
        ASSERT_TRUE(unknown.ok());
        EXPECT_FALSE(unknown.value());
    }

    std::filesystem::remove(db_path);
}

TEST(MetadataStore, DuplicateSessionIdConflicts) {
    const auto db_path = MakeTempDbPath();

    {
        vidingest::metadata::SqliteMetadataStore store(db_path.string());
        ASSERT_TRUE(store.CreateVideo(MakeVideo("v1")).ok());
        const auto expires = vidingest::core::NowIso8601WithOffsetSeconds(60);
        ASSERT_TRUE(store.CreateSession(MakeSession("s1", "v1", expires)).ok());

        auto again = store.CreateSession(MakeSession("s1", "v1", expires));
        ASSERT_FALSE(again.ok());
        EXPECT_EQ(again.code(), vidingest::core::ErrorCode::kConflict);
    }

    std::filesystem::remove(db_path);
}

TEST(MetadataStore, ProgressOnlyRisesAndIsCapped) {
    const auto db_path = MakeTempDbPath();

    {
        vidingest::metadata::SqliteMetadataStore store(db_path.string());
        ASSERT_TRUE(store.CreateVideo(MakeVideo("v1")).ok());
        ASSERT_TRUE(store.CreateSession(
                         MakeSession("s1", "v1", vidingest::core::NowIso8601WithOffsetSeconds(60)))
                        .ok());

        ASSERT_TRUE(store.UpdateSessionProgress("s1", 2).ok());
        ASSERT_TRUE(store.UpdateSessionProgress("s1", 1).ok());
        EXPECT_EQ(store.GetSession("s1").value().uploaded_chunks, 2);

        ASSERT_TRUE(store.UpdateSessionProgress("s1", 9).ok());
        EXPECT_EQ(store.GetSession("s1").value().uploaded_chunks, 3);

        auto missing = store.UpdateSessionProgress("missing", 1);
        ASSERT_FALSE(missing.ok());
        EXPECT_EQ(missing.code(), vidingest::core::ErrorCode::kNotFound);
    }

    std::filesystem::remove(db_path);
}

TEST(MetadataStore, CompleteSessionRequiresAssembling) {
    const auto db_path = MakeTempDbPath();

    {
        vidingest::metadata::SqliteMetadataStore store(db_path.string());
        ASSERT_TRUE(store.CreateVideo(MakeVideo("v1")).ok());
        ASSERT_TRUE(store.CreateSession(
                         MakeSession("s1", "v1", vidingest::core::NowIso8601WithOffsetSeconds(60)))
                        .ok());

        auto early = store.CompleteSession("s1", 3);
        ASSERT_TRUE(early.ok());
        EXPECT_FALSE(early.value());

        ASSERT_TRUE(store.CompareAndSetSessionStatus("s1", SessionStatus::kPending,
                                                     SessionStatus::kAssembling)
                        .value());
        auto done = store.CompleteSession("s1", 3);
        ASSERT_TRUE(done.ok());
        EXPECT_TRUE(done.value());

        auto session = store.GetSession("s1").value();
        EXPECT_EQ(session.status, SessionStatus::kCompleted);
        EXPECT_EQ(session.uploaded_chunks, 3);
        EXPECT_FALSE(session.completed_at.empty());
    }

    std::filesystem::remove(db_path);
}

TEST(MetadataStore, ListExpiredSessionsSkipsActiveAndTerminal) {
    const auto db_path = MakeTempDbPath();

    {
        vidingest::metadata::SqliteMetadataStore store(db_path.string());
        ASSERT_TRUE(store.CreateVideo(MakeVideo("v1")).ok());
        const auto past = vidingest::core::NowIso8601WithOffsetSeconds(-120);
        const auto older = vidingest::core::NowIso8601WithOffsetSeconds(-600);
        const auto future = vidingest::core::NowIso8601WithOffsetSeconds(600);
        ASSERT_TRUE(store.CreateSession(MakeSession("late", "v1", past)).ok());
        ASSERT_TRUE(store.CreateSession(MakeSession("oldest", "v1", older)).ok());
        ASSERT_TRUE(store.CreateSession(MakeSession("fresh", "v1", future)).ok());
        ASSERT_TRUE(store.CreateSession(MakeSession("busy", "v1", past)).ok());
        ASSERT_TRUE(store.CompareAndSetSessionStatus("busy", SessionStatus::kPending,
                                                     SessionStatus::kAssembling)
                        .value());

        auto expired = store.ListExpiredSessions(vidingest::core::NowIso8601(), 10);
        ASSERT_TRUE(expired.ok());
        ASSERT_EQ(expired.value().size(), 2u);
        EXPECT_EQ(expired.value()[0].id, "oldest");
        EXPECT_EQ(expired.value()[1].id, "late");

        auto limited = store.ListExpiredSessions(vidingest::core::NowIso8601(), 1);
        ASSERT_TRUE(limited.ok());
        ASSERT_EQ(limited.value().size(), 1u);
    }

    std::filesystem::remove(db_path);
}

TEST(MetadataStore, UploadMetricsNewestFirst) {
    const auto db_path = MakeTempDbPath();

    {
        vidingest::metadata::SqliteMetadataStore store(db_path.string());
        ASSERT_TRUE(store.CreateVideo(MakeVideo("v1")).ok());
        for (int i = 0; i < 3; ++i) {
            vidingest::metadata::UploadMetric metric;
            metric.id = "m" + std::to_string(i);
            metric.video_id = "v1";
            metric.file_size = 1000;
            metric.upload_duration_ms = 100 * (i + 1);
            metric.retry_count = i;
            ASSERT_TRUE(store.RecordUploadMetric(metric).ok());
        }

        auto metrics = store.ListUploadMetrics(2);
        ASSERT_TRUE(metrics.ok());
        ASSERT_EQ(metrics.value().size(), 2u);
        EXPECT_EQ(metrics.value()[0].id, "m2");
        EXPECT_EQ(metrics.value()[0].retry_count, 2);
        EXPECT_EQ(metrics.value()[1].id, "m1");
    }

    std::filesystem::remove(db_path);
}
