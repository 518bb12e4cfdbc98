#include "vidingest/observability/metrics.h"

#include <atomic>
#include <cstdint>

namespace vidingest::observability {
namespace {
std::atomic<std::uint64_t> g_total_requests{0};
std::atomic<std::uint64_t> g_requests_2xx{0};
std::atomic<std::uint64_t> g_requests_4xx{0};
std::atomic<std::uint64_t> g_requests_5xx{0};
std::atomic<std::uint64_t> g_latency_ms_total{0};

std::atomic<std::uint64_t> g_sessions_created{0};
std::atomic<std::uint64_t> g_chunks_accepted{0};
std::atomic<std::uint64_t> g_chunks_duplicate{0};
std::atomic<std::uint64_t> g_chunk_bytes{0};
std::atomic<std::uint64_t> g_assemblies_succeeded{0};
std::atomic<std::uint64_t> g_assemblies_failed{0};
std::atomic<std::uint64_t> g_sessions_expired{0};
std::atomic<std::uint64_t> g_rate_limited_init{0};
std::atomic<std::uint64_t> g_rate_limited_chunk{0};
std::atomic<std::uint64_t> g_rate_limiter_fail_open{0};

std::string Counter(const std::string& name, const std::string& help,
                    const std::atomic<std::uint64_t>& value) {
    return "# HELP " + name + " " + help + "\n" + "# TYPE " + name + " counter\n" + name + " " +
           std::to_string(value.load(std::memory_order_relaxed)) + "\n";
}
}  // namespace

void RecordRequest(int status_code, long long latency_ms) {
    g_total_requests.fetch_add(1, std::memory_order_relaxed);
    g_latency_ms_total.fetch_add(static_cast<std::uint64_t>(latency_ms),
                                 std::memory_order_relaxed);
    if (status_code >= 200 && status_code < 300) {
        g_requests_2xx.fetch_add(1, std::memory_order_relaxed);
    } else if (status_code >= 400 && status_code < 500) {
        g_requests_4xx.fetch_add(1, std::memory_order_relaxed);
    } else if (status_code >= 500) {
        g_requests_5xx.fetch_add(1, std::memory_order_relaxed);
    }
}

void RecordSessionCreated() { g_sessions_created.fetch_add(1, std::memory_order_relaxed); }

void RecordChunkAccepted(bool duplicate, unsigned long long bytes) {
    if (duplicate) {
        g_chunks_duplicate.fetch_add(1, std::memory_order_relaxed);
        return;
    }
    g_chunks_accepted.fetch_add(1, std::memory_order_relaxed);
    g_chunk_bytes.fetch_add(bytes, std::memory_order_relaxed);
}

void RecordAssembly(bool succeeded) {
    if (succeeded) {
        g_assemblies_succeeded.fetch_add(1, std::memory_order_relaxed);
    } else {
        g_assemblies_failed.fetch_add(1, std::memory_order_relaxed);
    }
}

void RecordSessionsExpired(int count) {
    if (count > 0) {
        g_sessions_expired.fetch_add(static_cast<std::uint64_t>(count),
                                     std::memory_order_relaxed);
    }
}

void RecordRateLimited(const std::string& category) {
    if (category == "init") {
        g_rate_limited_init.fetch_add(1, std::memory_order_relaxed);
    } else {
        g_rate_limited_chunk.fetch_add(1, std::memory_order_relaxed);
    }
}

void RecordRateLimiterFailOpen() {
    g_rate_limiter_fail_open.fetch_add(1, std::memory_order_relaxed);
}

std::string RenderMetrics() {
    std::string out =
        "# HELP vidingest_up 1 if server is up\n"
        "# TYPE vidingest_up gauge\n"
        "vidingest_up 1\n";
    out += Counter("vidingest_http_requests_total", "Total HTTP requests processed",
                   g_total_requests);
    out += Counter("vidingest_http_requests_2xx", "Total 2xx responses", g_requests_2xx);
    out += Counter("vidingest_http_requests_4xx", "Total 4xx responses", g_requests_4xx);
    out += Counter("vidingest_http_requests_5xx", "Total 5xx responses", g_requests_5xx);
    out += Counter("vidingest_http_request_latency_ms_sum", "Sum of request latencies in ms",
                   g_latency_ms_total);
    out += Counter("vidingest_upload_sessions_created_total", "Upload sessions initialized",
                   g_sessions_created);
    out += Counter("vidingest_chunks_accepted_total", "Distinct chunks stored",
                   g_chunks_accepted);
    out += Counter("vidingest_chunks_duplicate_total", "Chunk uploads that were duplicates",
                   g_chunks_duplicate);
    out += Counter("vidingest_chunk_bytes_total", "Bytes of distinct chunks stored",
                   g_chunk_bytes);
    out += Counter("vidingest_assemblies_succeeded_total", "Artifacts assembled",
                   g_assemblies_succeeded);
    out += Counter("vidingest_assemblies_failed_total", "Assemblies that failed",
                   g_assemblies_failed);
    out += Counter("vidingest_sessions_expired_total", "Sessions reclaimed by the sweeper",
                   g_sessions_expired);
    out += "# HELP vidingest_rate_limited_total Requests rejected by the rate limiter\n"
           "# TYPE vidingest_rate_limited_total counter\n"
           "vidingest_rate_limited_total{category=\"init\"} " +
           std::to_string(g_rate_limited_init.load(std::memory_order_relaxed)) + "\n" +
           "vidingest_rate_limited_total{category=\"chunk\"} " +
           std::to_string(g_rate_limited_chunk.load(std::memory_order_relaxed)) + "\n";
    out += Counter("vidingest_rate_limiter_fail_open_total",
                   "Requests allowed because the limiter backend failed",
                   g_rate_limiter_fail_open);
    return out;
}

}  // namespace vidingest::observability
