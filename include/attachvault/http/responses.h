#pragma once

#include <string>

#include <boost/beast/http/status.hpp>

#include "attachvault/core/error.h"
#include "attachvault/http/router.h"

namespace attachvault::http {

/// @brief HTTP status for a pipeline error code.
boost::beast::http::status StatusFor(core::ErrorCode code);

HttpResponse JsonResponse(boost::beast::http::status status, int version,
                          const std::string& body);

/// @brief {"error":{"code","message","request_id"}} envelope.
HttpResponse ErrorResponse(boost::beast::http::status status, int version,
                           const std::string& code, const std::string& message,
                           const std::string& request_id);
HttpResponse ErrorResponse(const core::Error& error, int version, const std::string& request_id);

}  // namespace attachvault::http
