#pragma once

#include <cstdint>
#include <string>

namespace vidingest::core {

/// @brief One access-log record, emitted once per HTTP response.
struct RequestLogEntry {
    std::string request_id;
    std::string method;
    std::string target;
    std::string remote;
    int status{0};
    long long latency_ms{0};
    std::uint64_t request_bytes{0};
    std::uint64_t response_bytes{0};
};

/// @brief Route the "vidingest" logger to the console at the given level.
///
/// Accepts the Poco level names (trace, debug, information, notice, warning,
/// error, critical, fatal); unknown names fall back to information.
void InitLogging(const std::string& level);
void LogInfo(const std::string& message);
void LogWarning(const std::string& message);
void LogError(const std::string& message);
void LogDebug(const std::string& message);
/// @brief Log a structured JSON line for an HTTP exchange. Server errors log at warning.
void LogRequest(const RequestLogEntry& entry);
/// @brief Escape a string for embedding in a JSON string literal.
std::string EscapeJson(const std::string& value);

}  // namespace vidingest::core
