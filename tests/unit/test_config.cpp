#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

#include <gtest/gtest.h>
#include <Poco/UUIDGenerator.h>

#include "vidingest/core/config.h"

namespace {

std::filesystem::path MakeTempConfigPath() {
    const auto name = "vidingest_cfg_" + Poco::UUIDGenerator().createOne().toString() + ".json";
    return std::filesystem::temp_directory_path() / name;
}

void WriteConfig(const std::filesystem::path& path, const std::string& upload_block,
                 bool tls_enabled = false) {
    std::ofstream out(path);
    out << "{\n"
        << "  \"server\": {\n"
        << "    \"host\": \"127.0.0.1\",\n"
        << "    \"port\": 8080,\n"
        << "    \"threads\": 1,\n"
        << "    \"tls\": {\"enabled\": " << (tls_enabled ? "true" : "false")
        << ", \"certificate\": \"\", \"private_key\": \"\"},\n"
        << "    \"limits\": {\"max_body_bytes\": 16777216}\n"
        << "  },\n"
        << "  \"storage\": {\"base_path\": \"data\", \"temp_path\": \"data/tmp\"},\n"
        << "  \"upload\": " << upload_block << ",\n"
        << "  \"observability\": {\"log_level\": \"warning\"}\n"
        << "}\n";
}

}  // namespace

TEST(Config, DefaultsApplyWhenKeysAreMissing) {
    const auto path = MakeTempConfigPath();
    WriteConfig(path, "{}");

    auto config = vidingest::core::LoadConfig(path.string());
    EXPECT_EQ(config.server.host, "127.0.0.1");
    EXPECT_EQ(config.server.threads, 1);
    EXPECT_EQ(config.upload.max_upload_size, 2147483648ULL);
    EXPECT_EQ(config.upload.default_chunk_size, 1048576u);
    EXPECT_EQ(config.upload.min_chunk_size, 65536u);
    EXPECT_EQ(config.upload.max_chunk_size, 10485760u);
    EXPECT_EQ(config.upload.max_chunks, 10000);
    EXPECT_EQ(config.upload.expiry_seconds, 86400);
    EXPECT_EQ(config.upload.allowed_extensions.size(), 6u);
    EXPECT_TRUE(config.rate_limit.enabled);
    EXPECT_EQ(config.rate_limit.window_seconds, 60);
    EXPECT_EQ(config.sweeper.interval_seconds, 300);
    EXPECT_EQ(config.observability.log_level, "warning");

    std::filesystem::remove(path);
}

TEST(Config, ParsesExtensionListLeniently) {
    const auto path = MakeTempConfigPath();
    WriteConfig(path, "{\"allowed_extensions\": \" MP4, .mov ,,webm\"}");

    auto config = vidingest::core::LoadConfig(path.string());
    const auto& extensions = config.upload.allowed_extensions;
    EXPECT_EQ(extensions.size(), 3u);
    EXPECT_EQ(extensions.count("mp4"), 1u);
    EXPECT_EQ(extensions.count("mov"), 1u);
    EXPECT_EQ(extensions.count("webm"), 1u);

    std::filesystem::remove(path);
}

TEST(Config, RejectsMinChunkAboveMax) {
    const auto path = MakeTempConfigPath();
    WriteConfig(path, "{\"min_chunk_size\": 2000000, \"max_chunk_size\": 1000000}");

    EXPECT_THROW(vidingest::core::LoadConfig(path.string()), std::invalid_argument);

    std::filesystem::remove(path);
}

TEST(Config, RejectsDefaultChunkOutsideBounds) {
    const auto path = MakeTempConfigPath();
    WriteConfig(path, "{\"default_chunk_size\": 1024}");

    EXPECT_THROW(vidingest::core::LoadConfig(path.string()), std::invalid_argument);

    std::filesystem::remove(path);
}

TEST(Config, RejectsChunkLargerThanBodyLimit) {
    const auto path = MakeTempConfigPath();
    WriteConfig(path, "{\"max_chunk_size\": 33554432}");

    EXPECT_THROW(vidingest::core::LoadConfig(path.string()), std::invalid_argument);

    std::filesystem::remove(path);
}

TEST(Config, RejectsEmptyExtensionList) {
    const auto path = MakeTempConfigPath();
    WriteConfig(path, "{\"allowed_extensions\": \" , \"}");

    EXPECT_THROW(vidingest::core::LoadConfig(path.string()), std::invalid_argument);

    std::filesystem::remove(path);
}

TEST(Config, TlsEnabledRequiresCertificateAndKey) {
    const auto path = MakeTempConfigPath();
    WriteConfig(path, "{}", true);

    EXPECT_THROW(vidingest::core::LoadConfig(path.string()), std::invalid_argument);

    std::filesystem::remove(path);
}

TEST(Config, EnvironmentOverridesUploadLimits) {
    vidingest::core::Config config;
    ::setenv("VIDINGEST_MAX_UPLOAD_SIZE", "5000000", 1);
    ::setenv("VIDINGEST_RATE_LIMIT_CHUNK", "7", 1);

    vidingest::core::ApplyEnvironmentOverrides(config);
    EXPECT_EQ(config.upload.max_upload_size, 5000000u);
    EXPECT_EQ(config.rate_limit.chunk_max_requests, 7);

    ::unsetenv("VIDINGEST_MAX_UPLOAD_SIZE");
    ::unsetenv("VIDINGEST_RATE_LIMIT_CHUNK");
}

TEST(Config, EnvironmentOverrideMustBePositive) {
    vidingest::core::Config config;
    ::setenv("VIDINGEST_UPLOAD_EXPIRY", "soon", 1);

    EXPECT_THROW(vidingest::core::ApplyEnvironmentOverrides(config), std::invalid_argument);

    ::unsetenv("VIDINGEST_UPLOAD_EXPIRY");
}

TEST(Config, LoadsDatabasePaths) {
    const auto path = MakeTempConfigPath();
    {
        std::ofstream out(path);
        out << "{\"sqlite\": {\"path\": \"/tmp/meta.db\", \"chunk_store_path\": \"/tmp/c.db\"}}";
    }

    auto db = vidingest::core::LoadDatabaseConfig(path.string());
    EXPECT_EQ(db.metadata_path, "/tmp/meta.db");
    EXPECT_EQ(db.chunk_store_path, "/tmp/c.db");

    std::filesystem::remove(path);
}
