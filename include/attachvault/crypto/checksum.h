#pragma once

#include <string>

namespace attachvault::crypto {

/// @brief Lower-case hex SHA-256 digest of data.
std::string Sha256Hex(const std::string& data);

}  // namespace attachvault::crypto
