#pragma once

#include <memory>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ssl/context.hpp>

#include "attachvault/core/config.h"
#include "attachvault/http/router.h"
#include "attachvault/tasks/task_queue.h"

namespace attachvault::http {

/// @brief HTTP server bootstrapper (acceptor + optional TLS context).
///
/// Sessions read and write on the io_context. Routing runs on `handlers`
/// when one is given, otherwise inline on the io thread.
class HttpServer {
public:
    /// @throws boost::system::system_error if the TLS certificate or key cannot be loaded.
    HttpServer(boost::asio::io_context& ioc, const core::ServerConfig& config, Router router,
               std::shared_ptr<tasks::TaskQueue> handlers = nullptr);
    /// @brief Bind and start accepting; false if the listen address could not be bound.
    bool Run();

private:
    boost::asio::io_context& ioc_;
    core::ServerConfig config_;
    std::shared_ptr<const Router> router_;
    std::shared_ptr<tasks::TaskQueue> handlers_;
    std::unique_ptr<boost::asio::ssl::context> ssl_context_;
};

}  // namespace attachvault::http
