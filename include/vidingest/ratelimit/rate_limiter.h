#pragma once

#include <chrono>
#include <cstddef>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <string>

#include "vidingest/core/config.h"
#include "vidingest/core/result.h"

namespace vidingest::ratelimit {

/// @brief Operation families with separate quotas.
enum class Category {
    kInit,
    kChunk,
};

const char* ToString(Category category);

/// @brief Admission decision for one request.
struct Decision {
    bool allowed{true};
    int remaining{0};
    int reset_after_seconds{0};
};

/// @brief Storage for sliding-window counters, keyed by "<category>:<identity>".
///
/// Implementations must make the check-and-record in Hit atomic per key.
class RateLimitBackend {
public:
    virtual ~RateLimitBackend() = default;

    /// @brief Record a hit if fewer than `limit` hits fall within `window`.
    virtual core::Result<Decision> Hit(const std::string& key, int limit,
                                       std::chrono::seconds window) = 0;
};

/// @brief Process-local backend keeping a timestamp deque per key.
///
/// Every `evict_every` hits, keys with no hit inside their window are dropped.
class InMemoryRateLimitBackend : public RateLimitBackend {
public:
    using Clock = std::chrono::steady_clock;

    explicit InMemoryRateLimitBackend(std::size_t evict_every = 1024);

    core::Result<Decision> Hit(const std::string& key, int limit,
                               std::chrono::seconds window) override;

    /// @brief Test hook: pretend `delta` has elapsed for every key.
    void Advance(std::chrono::seconds delta);

    /// @brief Number of keys currently holding window state.
    std::size_t TrackedKeys();

private:
    struct Window {
        std::deque<Clock::time_point> hits;
        Clock::duration span{Clock::duration::zero()};
    };

    Clock::time_point Now() const;
    void EvictIdle(Clock::time_point now);

    std::mutex mutex_;
    std::map<std::string, Window> windows_;
    Clock::duration skew_{Clock::duration::zero()};
    std::size_t evict_every_;
    std::size_t hits_since_evict_{0};
};

/// @brief Per-identity sliding-window limiter consulted before init and chunk mutations.
///
/// Backend failures fail open: the request is allowed and the failure is logged.
class RateLimiter {
public:
    RateLimiter(core::RateLimitConfig config, std::shared_ptr<RateLimitBackend> backend);

    Decision Allow(const std::string& identity, Category category);

    bool enabled() const { return config_.enabled; }

private:
    int LimitFor(Category category) const;

    core::RateLimitConfig config_;
    std::shared_ptr<RateLimitBackend> backend_;
};

}  // namespace vidingest::ratelimit
