#include "attachvault/http/responses.h"

#include <sstream>

#include <Poco/JSON/Object.h>

namespace attachvault::http {

namespace http = boost::beast::http;

http::status StatusFor(core::ErrorCode code) {
    switch (code) {
        case core::ErrorCode::kOk:
            return http::status::ok;
        case core::ErrorCode::kValidation:
            return http::status::unprocessable_entity;
        case core::ErrorCode::kInvalidArgument:
        case core::ErrorCode::kOutOfRange:
        case core::ErrorCode::kPathTraversal:
            return http::status::bad_request;
        case core::ErrorCode::kUnauthorized:
            return http::status::unauthorized;
        case core::ErrorCode::kForbidden:
            return http::status::forbidden;
        case core::ErrorCode::kNotFound:
            return http::status::not_found;
        case core::ErrorCode::kAlreadyExists:
        case core::ErrorCode::kInvalidState:
            return http::status::conflict;
        case core::ErrorCode::kPayloadTooLarge:
            return http::status::payload_too_large;
        case core::ErrorCode::kIntegrity:
        case core::ErrorCode::kIoError:
        case core::ErrorCode::kDbError:
        case core::ErrorCode::kInternal:
            break;
    }
    return http::status::internal_server_error;
}

HttpResponse JsonResponse(http::status status, int version, const std::string& body) {
    HttpResponse response{status, version};
    response.set(http::field::content_type, "application/json");
    response.body() = body;
    response.prepare_payload();
    return response;
}

HttpResponse ErrorResponse(http::status status, int version, const std::string& code,
                           const std::string& message, const std::string& request_id) {
    Poco::JSON::Object::Ptr error = new Poco::JSON::Object();
    error->set("code", code);
    error->set("message", message);
    error->set("request_id", request_id);
    Poco::JSON::Object envelope;
    envelope.set("error", error);
    std::ostringstream out;
    envelope.stringify(out);
    return JsonResponse(status, version, out.str());
}

HttpResponse ErrorResponse(const core::Error& error, int version, const std::string& request_id) {
    // Server-side faults keep their detail in the log, not on the wire.
    const auto status = StatusFor(error.code);
    std::string message = error.message;
    if (error.code == core::ErrorCode::kIntegrity) {
        message = "file integrity check failed";
    } else if (status == http::status::internal_server_error) {
        message = "internal server error";
    }
    return ErrorResponse(status, version, core::ErrorCodeName(error.code), message, request_id);
}

}  // namespace attachvault::http
