#pragma once

#include <cstdint>
#include <set>
#include <string>

namespace vidingest::core {

/// @brief TLS configuration for the HTTP server.
struct TlsConfig {
    bool enabled{false};
    std::string certificate;
    std::string private_key;
};

/// @brief Request/connection limits for the HTTP server.
struct LimitsConfig {
    std::uint64_t max_body_bytes{16777216};
    int request_timeout_seconds{60};
};

/// @brief HTTP server configuration (bind address, TLS, limits).
struct ServerConfig {
    std::string host{"0.0.0.0"};
    int port{8080};
    int threads{4};
    int worker_threads{8};
    TlsConfig tls;
    LimitsConfig limits;
};

/// @brief Storage configuration for local filesystem backend.
struct StorageConfig {
    std::string base_path{"data"};
    std::string temp_path{"data/tmp"};
};

/// @brief Chunked upload policy.
struct UploadConfig {
    std::uint64_t max_upload_size{2147483648ULL};
    std::uint64_t default_chunk_size{1048576};
    std::uint64_t min_chunk_size{65536};
    std::uint64_t max_chunk_size{10485760};
    int max_chunks{10000};
    int expiry_seconds{86400};
    std::set<std::string> allowed_extensions{"mp4", "avi", "mov", "mkv", "flv", "wmv"};
};

/// @brief Sliding-window admission limits per client identity.
struct RateLimitConfig {
    bool enabled{true};
    int window_seconds{60};
    int init_max_requests{30};
    int chunk_max_requests{2000};
};

/// @brief Background expiry sweeper schedule.
struct SweeperConfig {
    bool enabled{true};
    int interval_seconds{300};
    int max_sessions_per_sweep{200};
};

/// @brief Transcode notification spool.
struct QueueConfig {
    std::string spool_path{"data/queue/transcode.jsonl"};
};

/// @brief Observability settings (logging).
struct ObservabilityConfig {
    std::string log_level{"information"};
};

/// @brief Top-level configuration for vidingest.
struct Config {
    ServerConfig server;
    StorageConfig storage;
    UploadConfig upload;
    RateLimitConfig rate_limit;
    SweeperConfig sweeper;
    QueueConfig queue;
    ObservabilityConfig observability;
};

/// @brief SQLite locations for session metadata and chunk bookkeeping.
struct DatabaseConfig {
    std::string metadata_path{"data/metadata.db"};
    std::string chunk_store_path{"data/chunks.db"};
};

/// @brief Load server configuration from a JSON file, then apply environment overrides.
/// @throws std::invalid_argument when a value is out of range.
Config LoadConfig(const std::string& path);
/// @brief Load SQLite database paths from a JSON file.
DatabaseConfig LoadDatabaseConfig(const std::string& path);
/// @brief Apply VIDINGEST_* environment overrides to the upload and rate-limit settings.
void ApplyEnvironmentOverrides(Config& config);
/// @brief Fail fast on inconsistent settings.
/// @throws std::invalid_argument describing the first violated constraint.
void ValidateConfig(const Config& config);

}  // namespace vidingest::core
