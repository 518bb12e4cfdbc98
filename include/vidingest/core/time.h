#pragma once

#include <string>

namespace vidingest::core {

/// @brief Returns the current time as ISO8601 UTC with microseconds.
std::string NowIso8601();
/// @brief Returns a UTC ISO8601 timestamp offset from now by delta seconds.
std::string NowIso8601WithOffsetSeconds(long long delta_seconds);
/// @brief Milliseconds elapsed since an ISO8601 timestamp; -1 if it cannot be parsed.
long long MillisecondsSince(const std::string& iso8601);

}  // namespace vidingest::core
