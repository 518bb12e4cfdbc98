#include <filesystem>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio/io_context.hpp>

#include "vidingest/chunks/sqlite_chunk_store.h"
#include "vidingest/core/config.h"
#include "vidingest/core/logger.h"
#include "vidingest/http/http_server.h"
#include "vidingest/http/route_registration.h"
#include "vidingest/http/router.h"
#include "vidingest/metadata/sqlite_metadata_store.h"
#include "vidingest/queue/transcode_queue.h"
#include "vidingest/ratelimit/rate_limiter.h"
#include "vidingest/storage/local_storage.h"
#include "vidingest/upload/expiry_sweeper.h"
#include "vidingest/upload/session_manager.h"

namespace {

std::string GetArgValue(int argc, char** argv, const std::string& key,
                        const std::string& default_value) {
    for (int i = 1; i < argc - 1; ++i) {
        if (argv[i] == key) {
            return argv[i + 1];
        }
    }
    return default_value;
}

void EnsureParentDirectory(const std::string& path) {
    const auto parent = std::filesystem::path(path).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent);
    }
}

}  // namespace

int main(int argc, char** argv) {
    const std::string config_path = GetArgValue(argc, argv, "--config", "config/server.json");
    const std::string db_path = GetArgValue(argc, argv, "--database", "config/database.json");

    vidingest::core::Config config;
    vidingest::core::DatabaseConfig database;
    try {
        config = vidingest::core::LoadConfig(config_path);
        database = vidingest::core::LoadDatabaseConfig(db_path);
    } catch (const std::exception& ex) {
        std::cerr << "vidingest: invalid configuration: " << ex.what() << std::endl;
        return 1;
    }
    vidingest::core::InitLogging(config.observability.log_level);

    EnsureParentDirectory(database.metadata_path);
    EnsureParentDirectory(database.chunk_store_path);
    auto metadata =
        std::make_shared<vidingest::metadata::SqliteMetadataStore>(database.metadata_path);
    auto chunk_store =
        std::make_shared<vidingest::chunks::SqliteChunkStore>(database.chunk_store_path);
    auto storage = std::make_shared<vidingest::storage::LocalStorage>(config.storage.base_path,
                                                                      config.storage.temp_path);
    auto limiter = std::make_shared<vidingest::ratelimit::RateLimiter>(
        config.rate_limit, std::make_shared<vidingest::ratelimit::InMemoryRateLimitBackend>());
    auto transcode_queue =
        std::make_shared<vidingest::queue::SpoolTranscodeQueue>(config.queue.spool_path);
    auto sessions = std::make_shared<vidingest::upload::SessionManager>(
        config.upload, *metadata, *chunk_store, *storage, *limiter, *transcode_queue);

    vidingest::http::Router router;
    vidingest::http::RegisterUploadRoutes(router, sessions);

    boost::asio::io_context ioc(config.server.threads);
    vidingest::upload::ExpirySweeper sweeper(config.sweeper, *metadata, *chunk_store, *storage);
    sweeper.Start(ioc);

    vidingest::http::HttpServer server(ioc, config, std::move(router));
    try {
        server.Run();
    } catch (const std::exception& ex) {
        vidingest::core::LogError(ex.what());
        return 1;
    }

    std::vector<std::thread> threads;
    threads.reserve(static_cast<size_t>(config.server.threads));
    for (int i = 0; i < config.server.threads; ++i) {
        threads.emplace_back([&ioc]() { ioc.run(); });
    }
    for (auto& t : threads) {
        t.join();
    }

    return 0;
}
