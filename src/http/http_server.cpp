#include "attachvault/http/http_server.h"

#include <array>
#include <chrono>
#include <cstdint>
#include <exception>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>

#include "attachvault/core/ids.h"
#include "attachvault/core/logger.h"
#include "attachvault/http/responses.h"
#include "attachvault/observability/metrics.h"

namespace {
namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;
using attachvault::http::ErrorResponse;
using attachvault::http::HttpRequest;
using attachvault::http::HttpResponse;
using attachvault::http::RequestContext;
using attachvault::http::Router;
using attachvault::tasks::TaskQueue;

constexpr std::size_t kBufferSize = 8192;

template <typename Stream>
class Session : public std::enable_shared_from_this<Session<Stream>> {
public:
    Session(Stream&& stream, std::shared_ptr<const Router> router,
            std::shared_ptr<TaskQueue> handlers, std::uint64_t max_body_bytes)
        : stream_(std::move(stream)),
          router_(std::move(router)),
          handlers_(std::move(handlers)),
          max_body_bytes_(max_body_bytes) {}

    void Start() {
        // TLS handshake happens once per connection when enabled.
        if constexpr (std::is_same_v<Stream, beast::ssl_stream<beast::tcp_stream>>) {
            stream_.async_handshake(net::ssl::stream_base::server,
                                    beast::bind_front_handler(&Session::OnHandshake,
                                                              this->shared_from_this()));
        } else {
            DoReadHeader();
        }
    }

private:
    void OnHandshake(beast::error_code ec) {
        if (ec) {
            attachvault::core::LogError("TLS handshake failed: " + ec.message());
            return;
        }
        DoReadHeader();
    }

    void DoReadHeader() {
        parser_.emplace();
        parser_->body_limit(max_body_bytes_);
        http::async_read_header(stream_, buffer_, *parser_,
                                beast::bind_front_handler(&Session::OnReadHeader,
                                                          this->shared_from_this()));
    }

    void OnReadHeader(beast::error_code ec, std::size_t) {
        if (ec == http::error::end_of_stream) {
            return DoClose();
        }
        if (ec) {
            attachvault::core::LogError("Read header failed: " + ec.message());
            return;
        }

        request_id_ = attachvault::core::GenerateRequestId();
        request_start_ = std::chrono::steady_clock::now();
        request_method_ = std::string(parser_->get().method_string());
        request_target_ = std::string(parser_->get().target());
        request_remote_ = GetRemoteAddress();

        body_.clear();
        if (parser_->is_done()) {
            return HandleRequest();
        }
        DoReadBodyChunk();
    }

    void DoReadBodyChunk() {
        parser_->get().body().data = body_buffer_.data();
        parser_->get().body().size = body_buffer_.size();
        http::async_read(stream_, buffer_, *parser_,
                         beast::bind_front_handler(&Session::OnBodyChunk,
                                                   this->shared_from_this()));
    }

    void OnBodyChunk(beast::error_code ec, std::size_t) {
        if (ec == http::error::body_limit) {
            auto response = ErrorResponse(http::status::payload_too_large,
                                          parser_->get().version(), "PAYLOAD_TOO_LARGE",
                                          "request body exceeds server limit", request_id_);
            response.keep_alive(false);
            return Send(std::move(response));
        }
        if (ec && ec != http::error::need_buffer) {
            attachvault::core::LogError("Read body failed: " + ec.message());
            return;
        }
        const auto bytes = body_buffer_.size() - parser_->get().body().size;
        body_.append(body_buffer_.data(), bytes);
        if (parser_->is_done()) {
            return HandleRequest();
        }
        DoReadBodyChunk();
    }

    void HandleRequest() {
        // Convert buffer_body parser into a string_body request for routing handlers.
        auto request = std::make_shared<HttpRequest>();
        request->method(parser_->get().method());
        request->target(parser_->get().target());
        request->version(parser_->get().version());
        request->keep_alive(parser_->get().keep_alive());
        for (const auto& field : parser_->get()) {
            request->set(field.name_string(), field.value());
        }
        request->body() = std::move(body_);
        request->prepare_payload();

        RequestContext ctx;
        ctx.request_id = request_id_;
        ctx.method = request_method_;
        ctx.target = request_target_;
        ctx.remote = request_remote_;

        if (!handlers_) {
            return Send(Dispatch(ctx, *request));
        }
        // No other operation is pending on this session until the response is posted back.
        auto self = this->shared_from_this();
        handlers_->Post("request " + request_id_, [self, ctx, request]() {
            auto response = std::make_shared<HttpResponse>(self->Dispatch(ctx, *request));
            net::post(self->stream_.get_executor(),
                      [self, response]() { self->Send(std::move(*response)); });
        });
    }

    HttpResponse Dispatch(const RequestContext& ctx, const HttpRequest& request) const {
        try {
            auto result = router_->Route(ctx, request);
            if (!result.ok()) {
                const auto& error = result.error();
                if (attachvault::http::StatusFor(error.code) ==
                    http::status::internal_server_error) {
                    attachvault::core::LogError("Request " + ctx.request_id + " failed: " +
                                                attachvault::core::ErrorCodeName(error.code) +
                                                ": " + error.message);
                }
                auto response = ErrorResponse(error, request.version(), ctx.request_id);
                response.keep_alive(request.keep_alive());
                return response;
            }
            result.value().keep_alive(request.keep_alive());
            return std::move(result.value());
        } catch (const std::exception& ex) {
            attachvault::core::LogError("Request " + ctx.request_id + " threw: " + ex.what());
            return ErrorResponse(http::status::internal_server_error, request.version(),
                                 "INTERNAL", "internal server error", ctx.request_id);
        }
    }

    void Send(HttpResponse&& response) {
        response.set(http::field::server, "AttachVault");
        response.set("X-Request-Id", request_id_);
        const auto latency = std::chrono::duration_cast<std::chrono::milliseconds>(
                                 std::chrono::steady_clock::now() - request_start_)
                                 .count();
        attachvault::core::LogRequest(request_id_, request_method_, request_target_,
                                      request_remote_, response.result_int(), latency);
        attachvault::observability::RecordRequest(response.result_int(), latency);
        auto sp = std::make_shared<HttpResponse>(std::move(response));
        http::async_write(stream_, *sp,
                          beast::bind_front_handler(&Session::OnWrite, this->shared_from_this(),
                                                    sp->need_eof(), sp));
    }

    void OnWrite(bool close, std::shared_ptr<HttpResponse>, beast::error_code ec, std::size_t) {
        if (ec) {
            attachvault::core::LogError("Write failed: " + ec.message());
            return;
        }
        if (close) {
            return DoClose();
        }
        DoReadHeader();
    }

    void DoClose() {
        beast::error_code ec;
        if constexpr (std::is_same_v<Stream, beast::ssl_stream<beast::tcp_stream>>) {
            stream_.shutdown(ec);
        } else {
            stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
        }
    }

    std::string GetRemoteAddress() const {
        beast::error_code ec;
        auto endpoint = beast::get_lowest_layer(stream_).socket().remote_endpoint(ec);
        if (ec) {
            return "unknown";
        }
        return endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
    }

    Stream stream_;
    beast::flat_buffer buffer_;
    std::optional<http::request_parser<http::buffer_body>> parser_;
    std::array<char, kBufferSize> body_buffer_{};

    std::shared_ptr<const Router> router_;
    std::shared_ptr<TaskQueue> handlers_;
    std::uint64_t max_body_bytes_{0};

    std::string request_id_;
    std::string request_method_;
    std::string request_target_;
    std::string request_remote_;
    std::chrono::steady_clock::time_point request_start_{};
    std::string body_;
};

class Listener : public std::enable_shared_from_this<Listener> {
public:
    Listener(net::io_context& ioc, std::shared_ptr<const Router> router,
             std::shared_ptr<TaskQueue> handlers, std::uint64_t max_body_bytes,
             net::ssl::context* ssl_ctx)
        : acceptor_(ioc),
          router_(std::move(router)),
          handlers_(std::move(handlers)),
          max_body_bytes_(max_body_bytes),
          ssl_ctx_(ssl_ctx) {}

    bool Open(const tcp::endpoint& endpoint) {
        beast::error_code ec;
        acceptor_.open(endpoint.protocol(), ec);
        if (!ec) {
            acceptor_.set_option(net::socket_base::reuse_address(true), ec);
        }
        if (!ec) {
            acceptor_.bind(endpoint, ec);
        }
        if (!ec) {
            acceptor_.listen(net::socket_base::max_listen_connections, ec);
        }
        if (ec) {
            attachvault::core::LogError("Listen on " + endpoint.address().to_string() + ":" +
                                        std::to_string(endpoint.port()) +
                                        " failed: " + ec.message());
            return false;
        }
        return true;
    }

    void Run() { DoAccept(); }

private:
    void DoAccept() {
        acceptor_.async_accept(beast::bind_front_handler(&Listener::OnAccept,
                                                         shared_from_this()));
    }

    void OnAccept(beast::error_code ec, tcp::socket socket) {
        if (ec) {
            attachvault::core::LogError("Accept failed: " + ec.message());
        } else if (ssl_ctx_) {
            auto stream = beast::ssl_stream<beast::tcp_stream>(std::move(socket), *ssl_ctx_);
            std::make_shared<Session<beast::ssl_stream<beast::tcp_stream>>>(
                std::move(stream), router_, handlers_, max_body_bytes_)
                ->Start();
        } else {
            auto stream = beast::tcp_stream(std::move(socket));
            std::make_shared<Session<beast::tcp_stream>>(std::move(stream), router_, handlers_,
                                                         max_body_bytes_)
                ->Start();
        }
        DoAccept();
    }

    tcp::acceptor acceptor_;
    std::shared_ptr<const Router> router_;
    std::shared_ptr<TaskQueue> handlers_;
    std::uint64_t max_body_bytes_{0};
    net::ssl::context* ssl_ctx_{nullptr};
};

}  // namespace

namespace attachvault::http {

HttpServer::HttpServer(boost::asio::io_context& ioc, const core::ServerConfig& config,
                       Router router, std::shared_ptr<tasks::TaskQueue> handlers)
    : ioc_(ioc),
      config_(config),
      router_(std::make_shared<const Router>(std::move(router))),
      handlers_(std::move(handlers)) {
    if (config_.tls.enabled) {
        ssl_context_ = std::make_unique<net::ssl::context>(net::ssl::context::tlsv12_server);
        ssl_context_->use_certificate_chain_file(config_.tls.certificate);
        ssl_context_->use_private_key_file(config_.tls.private_key, net::ssl::context::pem);
    }
}

bool HttpServer::Run() {
    beast::error_code ec;
    const auto address = net::ip::make_address(config_.host, ec);
    if (ec) {
        core::LogError("Invalid listen address " + config_.host + ": " + ec.message());
        return false;
    }
    const tcp::endpoint endpoint{address, static_cast<unsigned short>(config_.port)};

    auto listener = std::make_shared<Listener>(ioc_, router_, handlers_,
                                               config_.limits.max_body_bytes,
                                               ssl_context_ ? ssl_context_.get() : nullptr);
    if (!listener->Open(endpoint)) {
        return false;
    }
    listener->Run();
    core::LogInfo("Listening on " + config_.host + ":" + std::to_string(config_.port) +
                  (ssl_context_ ? " (TLS)" : ""));
    return true;
}

}  // namespace attachvault::http
