#include "vidingest/core/logger.h"

#include <cstdio>

#include <Poco/AutoPtr.h>
#include <Poco/ConsoleChannel.h>
#include <Poco/Exception.h>
#include <Poco/FormattingChannel.h>
#include <Poco/Logger.h>
#include <Poco/PatternFormatter.h>

namespace vidingest::core {

namespace {

Poco::Logger& ServiceLogger() {
    return Poco::Logger::get("vidingest");
}

void AppendField(std::string& out, const char* key, const std::string& value) {
    out += ",\"";
    out += key;
    out += "\":\"";
    out += EscapeJson(value);
    out += '"';
}

void AppendField(std::string& out, const char* key, long long value) {
    out += ",\"";
    out += key;
    out += "\":";
    out += std::to_string(value);
}

}  // namespace

std::string EscapeJson(const std::string& value) {
    std::string out;
    out.reserve(value.size() + 8);
    for (char ch : value) {
        switch (ch) {
            case '"':
                out += "\\\"";
                break;
            case '\\':
                out += "\\\\";
                break;
            case '\n':
                out += "\\n";
                break;
            case '\r':
                out += "\\r";
                break;
            case '\t':
                out += "\\t";
                break;
            default:
                if (static_cast<unsigned char>(ch) < 0x20) {
                    char escaped[8];
                    std::snprintf(escaped, sizeof(escaped), "\\u%04x",
                                  static_cast<unsigned int>(static_cast<unsigned char>(ch)));
                    out += escaped;
                } else {
                    out += ch;
                }
                break;
        }
    }
    return out;
}

void InitLogging(const std::string& level) {
    Poco::AutoPtr<Poco::ConsoleChannel> console(new Poco::ConsoleChannel());
    Poco::AutoPtr<Poco::PatternFormatter> formatter(
        new Poco::PatternFormatter("%Y-%m-%dT%H:%M:%S.%iZ [%p] %s: %t"));
    formatter->setProperty("times", "UTC");
    Poco::AutoPtr<Poco::FormattingChannel> channel(new Poco::FormattingChannel(formatter, console));
    ServiceLogger().setChannel(channel);

    try {
        ServiceLogger().setLevel(Poco::Logger::parseLevel(level));
    } catch (const Poco::InvalidArgumentException&) {
        ServiceLogger().setLevel(Poco::Message::PRIO_INFORMATION);
        ServiceLogger().warning("unknown log level '" + level + "', using information");
    }
}

void LogInfo(const std::string& message) { ServiceLogger().information(message); }
void LogWarning(const std::string& message) { ServiceLogger().warning(message); }
void LogError(const std::string& message) { ServiceLogger().error(message); }
void LogDebug(const std::string& message) { ServiceLogger().debug(message); }

void LogRequest(const RequestLogEntry& entry) {
    std::string line = "{\"event\":\"http_request\"";
    AppendField(line, "request_id", entry.request_id);
    AppendField(line, "method", entry.method);
    AppendField(line, "target", entry.target);
    AppendField(line, "remote", entry.remote);
    AppendField(line, "status", static_cast<long long>(entry.status));
    AppendField(line, "latency_ms", entry.latency_ms);
    AppendField(line, "bytes_in", static_cast<long long>(entry.request_bytes));
    AppendField(line, "bytes_out", static_cast<long long>(entry.response_bytes));
    line += '}';

    if (entry.status >= 500) {
        LogWarning(line);
    } else {
        LogInfo(line);
    }
}

}  // namespace vidingest::core
