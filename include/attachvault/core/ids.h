#pragma once

#include <string>

namespace attachvault::core {

/// @brief Generate a unique request ID for correlation.
std::string GenerateRequestId();
/// @brief Generate a random (version 4) UUID used for attachment ids and upload sessions.
std::string GenerateRandomId();

}  // namespace attachvault::core
