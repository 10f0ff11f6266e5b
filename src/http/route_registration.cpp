#include "attachvault/http/route_registration.h"

#include <cstdint>
#include <optional>
#include <sstream>
#include <string>

#include <Poco/Dynamic/Var.h>
#include <Poco/JSON/Object.h>
#include <Poco/JSON/Parser.h>
#include <Poco/URI.h>

#include "attachvault/attachments/upload_orchestrator.h"
#include "attachvault/http/responses.h"
#include "attachvault/observability/metrics.h"

namespace attachvault::http {
namespace {

namespace beast_http = boost::beast::http;

std::string GetQueryParam(const std::string& target, const std::string& key) {
    try {
        Poco::URI uri(target);
        for (const auto& [name, value] : uri.getQueryParameters()) {
            if (name == key) {
                return value;
            }
        }
    } catch (const Poco::Exception&) {
        // A malformed query reads as an absent parameter.
    }
    return "";
}

std::optional<std::int64_t> ParseInt64(const std::string& value) {
    if (value.empty()) {
        return std::nullopt;
    }
    try {
        size_t consumed = 0;
        const long long parsed = std::stoll(value, &consumed);
        if (consumed != value.size()) {
            return std::nullopt;
        }
        return static_cast<std::int64_t>(parsed);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::optional<std::string> Header(const HttpRequest& req, const char* name) {
    auto it = req.find(name);
    if (it == req.end()) {
        return std::nullopt;
    }
    return std::string(it->value());
}

/// Media type without parameters ("image/jpeg; q=1" -> "image/jpeg").
std::string ClaimedContentType(const HttpRequest& req) {
    auto value = Header(req, "Content-Type").value_or("application/octet-stream");
    value = value.substr(0, value.find(';'));
    const auto first = value.find_first_not_of(" \t");
    const auto last = value.find_last_not_of(" \t");
    if (first == std::string::npos) {
        return "application/octet-stream";
    }
    return value.substr(first, last - first + 1);
}

std::string Stringify(const Poco::JSON::Object& obj) {
    std::ostringstream out;
    obj.stringify(out);
    return out.str();
}

Poco::JSON::Object AttachmentJson(const metadata::Attachment& attachment) {
    Poco::JSON::Object obj;
    obj.set("id", attachment.id);
    if (attachment.comment_id) {
        obj.set("comment_id", static_cast<Poco::Int64>(*attachment.comment_id));
    } else {
        obj.set("comment_id", Poco::Dynamic::Var());
    }
    obj.set("uploader_id", static_cast<Poco::Int64>(attachment.uploader_id));
    obj.set("filename", attachment.filename);
    obj.set("content_type", attachment.content_type);
    obj.set("file_size", static_cast<Poco::UInt64>(attachment.file_size));
    obj.set("status", std::string(metadata::ToString(attachment.status)));
    obj.set("checksum_sha256", attachment.checksum_sha256);
    obj.set("total_chunks", attachment.total_chunks);
    obj.set("received_chunks", attachment.received_chunks);
    obj.set("created_at", attachment.created_at);
    obj.set("updated_at", attachment.updated_at);
    return obj;
}

/// Parses a JSON object body; Poco throws on malformed input.
core::Result<Poco::JSON::Object::Ptr> ParseBody(const std::string& body) {
    try {
        Poco::JSON::Parser parser;
        auto result = parser.parse(body);
        auto obj = result.extract<Poco::JSON::Object::Ptr>();
        if (!obj) {
            return core::Error{core::ErrorCode::kInvalidArgument, "expected a JSON object"};
        }
        return obj;
    } catch (const std::exception& ex) {
        return core::Error{core::ErrorCode::kInvalidArgument,
                           std::string("invalid JSON body: ") + ex.what()};
    }
}

core::Result<attachments::ChunkedUploadRequest> ParseInitRequest(const std::string& body) {
    auto parsed = ParseBody(body);
    if (!parsed.ok()) {
        return parsed.error();
    }
    const auto& obj = parsed.value();
    try {
        attachments::ChunkedUploadRequest request;
        request.filename = obj->optValue<std::string>("filename", "");
        request.content_type = obj->getValue<std::string>("content_type");
        const auto total_size = obj->getValue<Poco::Int64>("total_size");
        if (total_size <= 0) {
            return core::Error{core::ErrorCode::kInvalidArgument, "total_size must be positive"};
        }
        request.total_size = static_cast<std::uint64_t>(total_size);
        request.total_chunks = obj->getValue<int>("total_chunks");
        return request;
    } catch (const std::exception& ex) {
        return core::Error{core::ErrorCode::kInvalidArgument,
                           std::string("invalid upload init request: ") + ex.what()};
    }
}

HttpResponse JsonBody(beast_http::status status, int version, const Poco::JSON::Object& obj) {
    return JsonResponse(status, version, Stringify(obj));
}

}  // namespace

void RegisterOperationalRoutes(Router& router) {
    router.Add("GET", "/healthz",
               [](const RequestContext& ctx, const HttpRequest& req, const RouteParams&)
                   -> core::Result<HttpResponse> {
                   return JsonResponse(beast_http::status::ok, req.version(),
                                       "{\"status\":\"ok\",\"request_id\":\"" + ctx.request_id +
                                           "\"}");
               });

    router.Add("GET", "/readyz",
               [](const RequestContext& ctx, const HttpRequest& req, const RouteParams&)
                   -> core::Result<HttpResponse> {
                   return JsonResponse(beast_http::status::ok, req.version(),
                                       "{\"status\":\"ready\",\"request_id\":\"" +
                                           ctx.request_id + "\"}");
               });

    router.Add("GET", "/metrics",
               [](const RequestContext&, const HttpRequest& req, const RouteParams&)
                   -> core::Result<HttpResponse> {
                   HttpResponse response{beast_http::status::ok, req.version()};
                   response.set(beast_http::field::content_type, "text/plain; version=0.0.4");
                   response.body() = observability::RenderMetrics();
                   response.prepare_payload();
                   return response;
               });
}

Middleware RequireUserIdentity(const std::string& prefix) {
    return [prefix](RequestContext& ctx, HttpRequest& req,
                    RouteParams&) -> std::optional<HttpResponse> {
        const auto target = std::string(req.target());
        if (target.compare(0, prefix.size(), prefix) != 0) {
            return std::nullopt;
        }
        auto header = Header(req, kUserIdHeader);
        auto user_id = header ? ParseInt64(*header) : std::nullopt;
        if (!user_id || *user_id <= 0) {
            return ErrorResponse(beast_http::status::unauthorized, req.version(),
                                 core::ErrorCodeName(core::ErrorCode::kUnauthorized),
                                 "missing or invalid X-User-Id", ctx.request_id);
        }
        ctx.user_id = *user_id;
        return std::nullopt;
    };
}

void RegisterAttachmentRoutes(Router& router,
                              std::shared_ptr<attachments::UploadOrchestrator> orchestrator) {
    const std::string base = kAttachmentsPrefix;

    router.Add("POST", base + "/upload",
               [orchestrator](const RequestContext& ctx, const HttpRequest& req,
                              const RouteParams&) -> core::Result<HttpResponse> {
                   const auto filename = GetQueryParam(std::string(req.target()), "filename");
                   auto created = orchestrator->SimpleUpload(*ctx.user_id, filename,
                                                             ClaimedContentType(req), req.body());
                   if (!created.ok()) {
                       return created.error();
                   }
                   return JsonBody(beast_http::status::created, req.version(),
                                   AttachmentJson(created.value()));
               });

    router.Add("POST", base + "/upload/init",
               [orchestrator](const RequestContext& ctx, const HttpRequest& req,
                              const RouteParams&) -> core::Result<HttpResponse> {
                   auto request = ParseInitRequest(req.body());
                   if (!request.ok()) {
                       return request.error();
                   }
                   auto session = orchestrator->InitChunkedUpload(*ctx.user_id, request.value());
                   if (!session.ok()) {
                       return session.error();
                   }
                   Poco::JSON::Object body;
                   body.set("upload_id", session.value().upload_id);
                   body.set("upload_session", session.value().upload_session);
                   body.set("total_chunks", session.value().total_chunks);
                   return JsonBody(beast_http::status::created, req.version(), body);
               });

    router.Add("PATCH", base + "/upload/{id}/chunk/{index}",
               [orchestrator](const RequestContext& ctx, const HttpRequest& req,
                              const RouteParams& params) -> core::Result<HttpResponse> {
                   auto index = ParseInt64(params.at("index"));
                   if (!index || *index < INT32_MIN || *index > INT32_MAX) {
                       return core::Error{core::ErrorCode::kInvalidArgument,
                                          "chunk index must be an integer"};
                   }
                   auto receipt = orchestrator->UploadChunk(
                       *ctx.user_id, params.at("id"), static_cast<int>(*index), req.body(),
                       Header(req, kUploadSessionHeader));
                   if (!receipt.ok()) {
                       return receipt.error();
                   }
                   Poco::JSON::Object body;
                   body.set("status", std::string("ok"));
                   body.set("chunk_index", receipt.value().chunk_index);
                   body.set("received_chunks", receipt.value().received_chunks);
                   body.set("total_chunks", receipt.value().total_chunks);
                   return JsonBody(beast_http::status::ok, req.version(), body);
               });

    router.Add("POST", base + "/upload/{id}/complete",
               [orchestrator](const RequestContext& ctx, const HttpRequest& req,
                              const RouteParams& params) -> core::Result<HttpResponse> {
                   auto processing = orchestrator->CompleteUpload(*ctx.user_id, params.at("id"));
                   if (!processing.ok()) {
                       return processing.error();
                   }
                   Poco::JSON::Object body;
                   Poco::JSON::Object::Ptr attachment =
                       new Poco::JSON::Object(AttachmentJson(processing.value()));
                   body.set("attachment", attachment);
                   body.set("message",
                            std::string("Upload is being processed. Status will change to "
                                        "'ready' when complete."));
                   return JsonBody(beast_http::status::accepted, req.version(), body);
               });

    router.Add("GET", base + "/{id}/download",
               [orchestrator](const RequestContext&, const HttpRequest& req,
                              const RouteParams& params) -> core::Result<HttpResponse> {
                   auto file = orchestrator->Download(params.at("id"));
                   if (!file.ok()) {
                       return file.error();
                   }
                   const auto& attachment = file.value().attachment;
                   HttpResponse response{beast_http::status::ok, req.version()};
                   response.set(beast_http::field::content_type, attachment.content_type);
                   response.set(beast_http::field::content_disposition,
                                "attachment; filename=\"" + attachment.filename + "\"");
                   response.set("X-Content-Type-Options", "nosniff");
                   response.body() = std::move(file.value().data);
                   response.prepare_payload();
                   return response;
               });

    router.Add("GET", base + "/{id}",
               [orchestrator](const RequestContext&, const HttpRequest& req,
                              const RouteParams& params) -> core::Result<HttpResponse> {
                   auto attachment = orchestrator->GetInfo(params.at("id"));
                   if (!attachment.ok()) {
                       return attachment.error();
                   }
                   return JsonBody(beast_http::status::ok, req.version(),
                                   AttachmentJson(attachment.value()));
               });

    router.Add("DELETE", base + "/{id}",
               [orchestrator](const RequestContext& ctx, const HttpRequest& req,
                              const RouteParams& params) -> core::Result<HttpResponse> {
                   auto deleted = orchestrator->Delete(*ctx.user_id, params.at("id"));
                   if (!deleted.ok()) {
                       return deleted.error();
                   }
                   HttpResponse response{beast_http::status::no_content, req.version()};
                   response.prepare_payload();
                   return response;
               });

    router.Add("POST", base + "/{id}/link",
               [orchestrator](const RequestContext& ctx, const HttpRequest& req,
                              const RouteParams& params) -> core::Result<HttpResponse> {
                   auto parsed = ParseBody(req.body());
                   if (!parsed.ok()) {
                       return parsed.error();
                   }
                   Poco::Int64 comment_id = 0;
                   try {
                       comment_id = parsed.value()->getValue<Poco::Int64>("comment_id");
                   } catch (const std::exception& ex) {
                       return core::Error{core::ErrorCode::kInvalidArgument,
                                          std::string("comment_id is required: ") + ex.what()};
                   }
                   auto linked = orchestrator->LinkToComment(
                       params.at("id"), static_cast<std::int64_t>(comment_id), *ctx.user_id);
                   if (!linked.ok()) {
                       return linked.error();
                   }
                   return JsonBody(beast_http::status::ok, req.version(),
                                   AttachmentJson(linked.value()));
               });
}

}  // namespace attachvault::http
