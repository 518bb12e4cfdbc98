#pragma once

#include <string>

namespace vidingest::observability {

/// @brief Render Prometheus-style metrics for the `/metrics` endpoint.
std::string RenderMetrics();
/// @brief Record a completed HTTP request for metrics.
void RecordRequest(int status_code, long long latency_ms);

void RecordSessionCreated();
void RecordChunkAccepted(bool duplicate, unsigned long long bytes);
void RecordAssembly(bool succeeded);
void RecordSessionsExpired(int count);
void RecordRateLimited(const std::string& category);
/// @brief A rate-limiter backend error let a request through.
void RecordRateLimiterFailOpen();

}  // namespace vidingest::observability
