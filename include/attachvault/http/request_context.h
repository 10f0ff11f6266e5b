#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace attachvault::http {

/// @brief Per-request metadata used for logging, identity and error responses.
struct RequestContext {
    std::string request_id;
    std::string method;
    std::string target;
    std::string remote;
    /// Set by the identity middleware from the upstream gateway's X-User-Id header.
    std::optional<std::int64_t> user_id;
};

}  // namespace attachvault::http
