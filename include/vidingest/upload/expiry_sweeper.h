#pragma once

#include <memory>
#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include "vidingest/chunks/chunk_store.h"
#include "vidingest/core/config.h"
#include "vidingest/core/result.h"
#include "vidingest/metadata/metadata_store.h"
#include "vidingest/storage/local_storage.h"

namespace vidingest::upload {

/// @brief Outcome of one sweep.
struct SweepReport {
    int expired{0};
    // Sessions whose status moved on (e.g. into assembling) before they could be expired.
    int skipped{0};
    int orphans_purged{0};
};

/// @brief Periodically reclaims sessions that passed their deadline without completing.
class ExpirySweeper {
public:
    ExpirySweeper(core::SweeperConfig config, metadata::MetadataStore& metadata,
                  chunks::ChunkStore& chunk_store, storage::LocalStorage& storage);

    /// @brief Schedule sweeps on the io_context every interval_seconds.
    void Start(boost::asio::io_context& ioc);

    /// @brief Expire sessions whose deadline is before `now_iso8601`.
    core::Result<SweepReport> SweepOnce(const std::string& now_iso8601);

private:
    void Schedule();

    core::SweeperConfig config_;
    metadata::MetadataStore& metadata_;
    chunks::ChunkStore& chunk_store_;
    storage::LocalStorage& storage_;
    std::unique_ptr<boost::asio::steady_timer> timer_;
};

}  // namespace vidingest::upload
