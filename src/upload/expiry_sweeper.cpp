#include "vidingest/upload/expiry_sweeper.h"

#include <chrono>

#include <boost/system/error_code.hpp>

#include "vidingest/core/logger.h"
#include "vidingest/core/time.h"
#include "vidingest/observability/metrics.h"

namespace vidingest::upload {

using metadata::ArtifactStatus;
using metadata::SessionStatus;

ExpirySweeper::ExpirySweeper(core::SweeperConfig config, metadata::MetadataStore& metadata,
                             chunks::ChunkStore& chunk_store, storage::LocalStorage& storage)
    : config_(std::move(config)),
      metadata_(metadata),
      chunk_store_(chunk_store),
      storage_(storage) {}

void ExpirySweeper::Start(boost::asio::io_context& ioc) {
    if (!config_.enabled) {
        return;
    }
    timer_ = std::make_unique<boost::asio::steady_timer>(ioc);
    Schedule();
}

void ExpirySweeper::Schedule() {
    if (!timer_) {
        return;
    }
    timer_->expires_after(std::chrono::seconds(config_.interval_seconds));
    timer_->async_wait([this](const boost::system::error_code& ec) {
        if (ec) {
            return;
        }
        auto report = SweepOnce(core::NowIso8601());
        if (!report.ok()) {
            core::LogError("expiry sweep failed: " + report.error().message);
        } else if (report.value().expired > 0 || report.value().orphans_purged > 0) {
            core::LogInfo("expiry sweep reclaimed " + std::to_string(report.value().expired) +
                          " sessions, " + std::to_string(report.value().orphans_purged) +
                          " orphaned trackers");
        }
        Schedule();
    });
}

core::Result<SweepReport> ExpirySweeper::SweepOnce(const std::string& now_iso8601) {
    auto expired = metadata_.ListExpiredSessions(now_iso8601, config_.max_sessions_per_sweep);
    if (!expired.ok()) {
        return expired.error();
    }

    SweepReport report;
    for (const auto& session : expired.value()) {
        auto moved = metadata_.CompareAndSetSessionStatus(session.id, session.status,
                                                          SessionStatus::kExpired);
        if (!moved.ok()) {
            core::LogWarning("failed to expire session " + session.id + ": " +
                             moved.error().message);
            ++report.skipped;
            continue;
        }
        if (!moved.value()) {
            // Lost to a concurrent chunk or completion; the next sweep re-evaluates it.
            ++report.skipped;
            continue;
        }

        auto tracking = chunk_store_.DeleteSession(session.id);
        if (!tracking.ok()) {
            core::LogWarning("failed to delete chunk tracking for expired session " + session.id +
                             ": " + tracking.error().message);
        }
        auto bytes = storage_.DeleteChunks(session.id);
        if (!bytes.ok()) {
            core::LogWarning("failed to delete chunk files for expired session " + session.id +
                             ": " + bytes.error().message);
        }
        auto video = metadata_.UpdateVideoStatus(session.video_id, ArtifactStatus::kFailed);
        if (!video.ok()) {
            core::LogWarning("failed to mark video " + session.video_id + " failed: " +
                             video.error().message);
        }
        core::LogInfo("upload session " + session.id + " expired");
        ++report.expired;
    }

    auto purged = chunk_store_.PurgeExpired(now_iso8601);
    if (purged.ok()) {
        report.orphans_purged = purged.value();
    } else {
        core::LogWarning("failed to purge expired chunk tracking: " + purged.error().message);
    }

    observability::RecordSessionsExpired(report.expired);
    return report;
}

}  // namespace vidingest::upload
