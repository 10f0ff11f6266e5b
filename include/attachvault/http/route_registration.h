#pragma once

#include <memory>
#include <string>

#include "attachvault/http/router.h"

namespace attachvault::attachments {
class UploadOrchestrator;
}

namespace attachvault::http {

/// Header through which the upstream auth gateway passes the authenticated user id.
inline constexpr const char* kUserIdHeader = "X-User-Id";
inline constexpr const char* kUploadSessionHeader = "X-Upload-Session";
inline constexpr const char* kAttachmentsPrefix = "/api/attachments";

/// Registers /healthz, /readyz and /metrics.
void RegisterOperationalRoutes(Router& router);

/// Registers the attachment API under kAttachmentsPrefix.
void RegisterAttachmentRoutes(Router& router,
                              std::shared_ptr<attachments::UploadOrchestrator> orchestrator);

/// @brief Rejects requests under `prefix` that lack a positive integer X-User-Id with 401,
/// and stores the parsed id in the request context otherwise.
Middleware RequireUserIdentity(const std::string& prefix);

}  // namespace attachvault::http
