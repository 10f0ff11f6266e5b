#pragma once

#include <chrono>
#include <string>

namespace attachvault::core {

/// @brief Returns the current time formatted as ISO8601 UTC.
/// Timestamps produced here sort lexicographically in time order, which the
/// SQLite queries rely on.
std::string NowIso8601();
/// @brief Returns a UTC ISO8601 timestamp offset from now (negative offsets lie in the past).
std::string Iso8601FromNow(std::chrono::seconds offset);

}  // namespace attachvault::core
