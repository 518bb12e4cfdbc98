#pragma once

#include <string>

namespace vidingest::core {

/// @brief Generate a unique request ID for correlation.
std::string GenerateRequestId();
/// @brief Generate an opaque identifier for upload sessions and artifacts.
std::string GenerateId();

}  // namespace vidingest::core
