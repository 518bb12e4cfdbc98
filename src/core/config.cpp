#include "vidingest/core/config.h"

#include <cctype>
#include <sstream>
#include <stdexcept>

#include <Poco/AutoPtr.h>
#include <Poco/Environment.h>
#include <Poco/NumberParser.h>
#include <Poco/String.h>
#include <Poco/Util/JSONConfiguration.h>

namespace vidingest::core {

namespace {

bool IsBlank(const std::string& value) {
    for (char c : value) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return true;
}

std::set<std::string> ParseExtensions(const std::string& value) {
    std::set<std::string> out;
    std::stringstream ss(value);
    std::string item;
    while (std::getline(ss, item, ',')) {
        auto trimmed = Poco::toLower(Poco::trim(item));
        if (!trimmed.empty() && trimmed.front() == '.') {
            trimmed.erase(0, 1);
        }
        if (!trimmed.empty()) {
            out.insert(trimmed);
        }
    }
    return out;
}

template <typename T>
void OverrideFromEnv(const std::string& name, T& target) {
    if (!Poco::Environment::has(name)) {
        return;
    }
    const auto raw = Poco::trim(Poco::Environment::get(name));
    Poco::UInt64 parsed = 0;
    if (!Poco::NumberParser::tryParseUnsigned64(raw, parsed) || parsed == 0) {
        throw std::invalid_argument(name + " must be a positive integer");
    }
    target = static_cast<T>(parsed);
}

}  // namespace

Config LoadConfig(const std::string& path) {
    Poco::AutoPtr<Poco::Util::JSONConfiguration> cfg(
        new Poco::Util::JSONConfiguration(path));

    Config config;
    config.server.host = cfg->getString("server.host", "0.0.0.0");
    config.server.port = cfg->getInt("server.port", 8080);
    config.server.threads = cfg->getInt("server.threads", 4);
    config.server.worker_threads = cfg->getInt("server.worker_threads", 8);
    config.server.tls.enabled = cfg->getBool("server.tls.enabled", false);
    config.server.tls.certificate = cfg->getString("server.tls.certificate", "");
    config.server.tls.private_key = cfg->getString("server.tls.private_key", "");
    config.server.limits.max_body_bytes =
        static_cast<std::uint64_t>(cfg->getInt64("server.limits.max_body_bytes", 16777216));
    config.server.limits.request_timeout_seconds =
        cfg->getInt("server.limits.request_timeout_seconds", 60);

    config.storage.base_path = cfg->getString("storage.base_path", "data");
    config.storage.temp_path = cfg->getString("storage.temp_path", "data/tmp");

    config.upload.max_upload_size =
        static_cast<std::uint64_t>(cfg->getInt64("upload.max_upload_size", 2147483648LL));
    config.upload.default_chunk_size =
        static_cast<std::uint64_t>(cfg->getInt64("upload.default_chunk_size", 1048576));
    config.upload.min_chunk_size =
        static_cast<std::uint64_t>(cfg->getInt64("upload.min_chunk_size", 65536));
    config.upload.max_chunk_size =
        static_cast<std::uint64_t>(cfg->getInt64("upload.max_chunk_size", 10485760));
    config.upload.max_chunks = cfg->getInt("upload.max_chunks", 10000);
    config.upload.expiry_seconds = cfg->getInt("upload.expiry_seconds", 86400);
    if (cfg->has("upload.allowed_extensions")) {
        config.upload.allowed_extensions =
            ParseExtensions(cfg->getString("upload.allowed_extensions"));
    }

    config.rate_limit.enabled = cfg->getBool("rate_limit.enabled", true);
    config.rate_limit.window_seconds = cfg->getInt("rate_limit.window_seconds", 60);
    config.rate_limit.init_max_requests = cfg->getInt("rate_limit.init_max_requests", 30);
    config.rate_limit.chunk_max_requests = cfg->getInt("rate_limit.chunk_max_requests", 2000);

    config.sweeper.enabled = cfg->getBool("sweeper.enabled", true);
    config.sweeper.interval_seconds = cfg->getInt("sweeper.interval_seconds", 300);
    config.sweeper.max_sessions_per_sweep = cfg->getInt("sweeper.max_sessions_per_sweep", 200);

    config.queue.spool_path = cfg->getString("queue.spool_path", "data/queue/transcode.jsonl");

    config.observability.log_level = cfg->getString("observability.log_level", "information");

    ApplyEnvironmentOverrides(config);
    ValidateConfig(config);
    return config;
}

void ApplyEnvironmentOverrides(Config& config) {
    OverrideFromEnv("VIDINGEST_MAX_UPLOAD_SIZE", config.upload.max_upload_size);
    OverrideFromEnv("VIDINGEST_MIN_CHUNK_SIZE", config.upload.min_chunk_size);
    OverrideFromEnv("VIDINGEST_MAX_CHUNK_SIZE", config.upload.max_chunk_size);
    OverrideFromEnv("VIDINGEST_MAX_CHUNKS", config.upload.max_chunks);
    OverrideFromEnv("VIDINGEST_UPLOAD_EXPIRY", config.upload.expiry_seconds);
    OverrideFromEnv("VIDINGEST_RATE_LIMIT_WINDOW", config.rate_limit.window_seconds);
    OverrideFromEnv("VIDINGEST_RATE_LIMIT_INIT", config.rate_limit.init_max_requests);
    OverrideFromEnv("VIDINGEST_RATE_LIMIT_CHUNK", config.rate_limit.chunk_max_requests);
}

void ValidateConfig(const Config& config) {
    if (config.server.threads <= 0 || config.server.worker_threads <= 0) {
        throw std::invalid_argument("server.threads and server.worker_threads must be positive");
    }
    if (config.server.limits.request_timeout_seconds <= 0) {
        throw std::invalid_argument("server.limits.request_timeout_seconds must be positive");
    }
    if (config.server.tls.enabled &&
        (IsBlank(config.server.tls.certificate) || IsBlank(config.server.tls.private_key))) {
        throw std::invalid_argument(
            "server.tls.enabled=true requires certificate and private_key");
    }
    const auto& upload = config.upload;
    if (upload.max_upload_size == 0) {
        throw std::invalid_argument("upload.max_upload_size must be positive");
    }
    if (upload.min_chunk_size == 0 || upload.min_chunk_size > upload.max_chunk_size) {
        throw std::invalid_argument("upload.min_chunk_size must be in [1, max_chunk_size]");
    }
    if (upload.default_chunk_size < upload.min_chunk_size ||
        upload.default_chunk_size > upload.max_chunk_size) {
        throw std::invalid_argument(
            "upload.default_chunk_size must be within [min_chunk_size, max_chunk_size]");
    }
    // A chunk body travels in one request, so it has to fit the body limit.
    if (upload.max_chunk_size > config.server.limits.max_body_bytes) {
        throw std::invalid_argument(
            "upload.max_chunk_size must not exceed server.limits.max_body_bytes");
    }
    if (upload.max_chunks <= 0) {
        throw std::invalid_argument("upload.max_chunks must be positive");
    }
    if (upload.expiry_seconds <= 0) {
        throw std::invalid_argument("upload.expiry_seconds must be positive");
    }
    if (upload.allowed_extensions.empty()) {
        throw std::invalid_argument("upload.allowed_extensions must not be empty");
    }
    if (config.rate_limit.window_seconds <= 0 || config.rate_limit.init_max_requests <= 0 ||
        config.rate_limit.chunk_max_requests <= 0) {
        throw std::invalid_argument("rate_limit window and thresholds must be positive");
    }
    if (config.sweeper.interval_seconds <= 0) {
        throw std::invalid_argument("sweeper.interval_seconds must be positive");
    }
    if (config.sweeper.max_sessions_per_sweep <= 0) {
        throw std::invalid_argument("sweeper.max_sessions_per_sweep must be positive");
    }
}

DatabaseConfig LoadDatabaseConfig(const std::string& path) {
    Poco::AutoPtr<Poco::Util::JSONConfiguration> cfg(
        new Poco::Util::JSONConfiguration(path));
    DatabaseConfig db;
    db.metadata_path = cfg->getString("sqlite.path", "data/metadata.db");
    db.chunk_store_path = cfg->getString("sqlite.chunk_store_path", "data/chunks.db");
    return db;
}

}  // namespace vidingest::core
