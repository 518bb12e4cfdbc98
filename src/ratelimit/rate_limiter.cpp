#include "vidingest/ratelimit/rate_limiter.h"

#include "vidingest/core/logger.h"
#include "vidingest/observability/metrics.h"

namespace vidingest::ratelimit {

const char* ToString(Category category) {
    switch (category) {
        case Category::kInit:
            return "init";
        case Category::kChunk:
            return "chunk";
    }
    return "unknown";
}

InMemoryRateLimitBackend::InMemoryRateLimitBackend(std::size_t evict_every)
    : evict_every_(evict_every > 0 ? evict_every : 1) {}

InMemoryRateLimitBackend::Clock::time_point InMemoryRateLimitBackend::Now() const {
    return Clock::now() + skew_;
}

void InMemoryRateLimitBackend::Advance(std::chrono::seconds delta) {
    std::lock_guard<std::mutex> lock(mutex_);
    skew_ += delta;
}

std::size_t InMemoryRateLimitBackend::TrackedKeys() {
    std::lock_guard<std::mutex> lock(mutex_);
    return windows_.size();
}

void InMemoryRateLimitBackend::EvictIdle(Clock::time_point now) {
    for (auto it = windows_.begin(); it != windows_.end();) {
        const auto& window = it->second;
        if (window.hits.empty() || now - window.hits.back() >= window.span) {
            it = windows_.erase(it);
        } else {
            ++it;
        }
    }
}

core::Result<Decision> InMemoryRateLimitBackend::Hit(const std::string& key, int limit,
                                                     std::chrono::seconds window) {
    if (limit <= 0 || window.count() <= 0) {
        return core::Error{core::ErrorCode::kInvalidArgument, "invalid rate limit"};
    }
    std::lock_guard<std::mutex> lock(mutex_);
    const auto now = Now();
    if (++hits_since_evict_ >= evict_every_) {
        hits_since_evict_ = 0;
        EvictIdle(now);
    }
    auto& window_state = windows_[key];
    window_state.span = window;
    auto& hits = window_state.hits;
    while (!hits.empty() && now - hits.front() >= window) {
        hits.pop_front();
    }

    Decision decision;
    if (static_cast<int>(hits.size()) >= limit) {
        decision.allowed = false;
        decision.remaining = 0;
        const auto wait = std::chrono::duration_cast<std::chrono::seconds>(
            hits.front() + window - now);
        // Round partial seconds up so clients never retry too early.
        decision.reset_after_seconds = static_cast<int>(wait.count()) + 1;
        return decision;
    }
    hits.push_back(now);
    decision.allowed = true;
    decision.remaining = limit - static_cast<int>(hits.size());
    decision.reset_after_seconds = static_cast<int>(window.count());
    return decision;
}

RateLimiter::RateLimiter(core::RateLimitConfig config, std::shared_ptr<RateLimitBackend> backend)
    : config_(std::move(config)), backend_(std::move(backend)) {}

int RateLimiter::LimitFor(Category category) const {
    return category == Category::kInit ? config_.init_max_requests : config_.chunk_max_requests;
}

Decision RateLimiter::Allow(const std::string& identity, Category category) {
    Decision decision;
    if (!config_.enabled) {
        decision.remaining = LimitFor(category);
        return decision;
    }
    if (!backend_) {
        core::LogWarning("rate limiter has no backend; allowing request");
        observability::RecordRateLimiterFailOpen();
        return decision;
    }

    const std::string key = std::string(ToString(category)) + ":" + identity;
    auto result =
        backend_->Hit(key, LimitFor(category), std::chrono::seconds(config_.window_seconds));
    if (!result.ok()) {
        core::LogWarning("rate limiter backend failed, failing open: " + result.error().message);
        observability::RecordRateLimiterFailOpen();
        return decision;
    }
    if (!result.value().allowed) {
        observability::RecordRateLimited(ToString(category));
    }
    return result.value();
}

}  // namespace vidingest::ratelimit
