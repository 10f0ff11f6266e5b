#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include <csignal>
#include <exception>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "attachvault/attachments/orphan_reaper.h"
#include "attachvault/attachments/upload_orchestrator.h"
#include "attachvault/core/config.h"
#include "attachvault/core/logger.h"
#include "attachvault/crypto/file_encryptor.h"
#include "attachvault/events/logging_event_sink.h"
#include "attachvault/http/http_server.h"
#include "attachvault/http/route_registration.h"
#include "attachvault/http/router.h"
#include "attachvault/metadata/sqlite_metadata_store.h"
#include "attachvault/storage/local_storage.h"
#include "attachvault/storage/memory_storage.h"
#include "attachvault/tasks/task_queue.h"
#include "attachvault/validation/file_validator.h"

namespace {

std::string GetArgValue(int argc, char** argv, const std::string& key,
                        const std::string& default_value) {
    for (int i = 1; i < argc - 1; ++i) {
        if (argv[i] == key) {
            return argv[i + 1];
        }
    }
    return default_value;
}

std::shared_ptr<attachvault::storage::StorageBackend> MakeStorage(
    const attachvault::core::StorageConfig& config) {
    if (config.backend == "memory") {
        attachvault::core::LogWarning(
            "Using in-memory storage; attachments will not survive a restart");
        return std::make_shared<attachvault::storage::MemoryStorage>();
    }
    return std::make_shared<attachvault::storage::LocalStorage>(config.base_path);
}

}  // namespace

int main(int argc, char** argv) {
    const std::string config_path = GetArgValue(argc, argv, "--config", "config/server.json");
    const std::string db_path = GetArgValue(argc, argv, "--database", "config/database.json");

    attachvault::core::Config config;
    std::string sqlite_path;
    try {
        config = attachvault::core::LoadConfig(config_path);
        sqlite_path = attachvault::core::LoadDatabasePath(db_path);
    } catch (const std::exception& ex) {
        std::cerr << "Failed to load configuration: " << ex.what() << std::endl;
        return 1;
    }
    attachvault::core::InitLogging(config.observability.log_level);

    if (attachvault::core::IsPlaceholderMasterKey(config.crypto.master_key)) {
        attachvault::core::LogWarning(
            "crypto.master_key is unset or a placeholder; set " +
            std::string(attachvault::core::kMasterKeyEnv) + " before storing real attachments");
    }

    std::shared_ptr<attachvault::metadata::SqliteMetadataStore> store;
    std::shared_ptr<attachvault::storage::StorageBackend> storage;
    std::shared_ptr<attachvault::validation::FileValidator> validator;
    try {
        const auto db_parent = std::filesystem::path(sqlite_path).parent_path();
        if (!db_parent.empty()) {
            std::filesystem::create_directories(db_parent);
        }
        store = std::make_shared<attachvault::metadata::SqliteMetadataStore>(sqlite_path);
        storage = MakeStorage(config.storage);
        validator = std::make_shared<attachvault::validation::FileValidator>(
            config.attachments.size_limits, config.attachments.allowed_content_types);
    } catch (const std::exception& ex) {
        attachvault::core::LogError(std::string("Startup failed: ") + ex.what());
        return 1;
    }

    auto encryptor =
        std::make_shared<const attachvault::crypto::FileEncryptor>(config.crypto.master_key);
    auto events = std::make_shared<attachvault::events::LoggingEventSink>();
    auto tasks = std::make_shared<attachvault::tasks::TaskQueue>(
        static_cast<std::size_t>(config.attachments.worker_threads));
    auto handlers = std::make_shared<attachvault::tasks::TaskQueue>(
        static_cast<std::size_t>(config.server.handler_threads));
    auto orchestrator = std::make_shared<attachvault::attachments::UploadOrchestrator>(
        config.attachments, store, storage, encryptor, validator, events, tasks);
    attachvault::attachments::OrphanReaper reaper(config.attachments, store, storage);

    attachvault::http::Router router;
    router.Use(attachvault::http::RequireUserIdentity(attachvault::http::kAttachmentsPrefix));
    attachvault::http::RegisterOperationalRoutes(router);
    attachvault::http::RegisterAttachmentRoutes(router, orchestrator);

    boost::asio::io_context ioc(config.server.threads);
    std::unique_ptr<attachvault::http::HttpServer> server;
    try {
        server = std::make_unique<attachvault::http::HttpServer>(ioc, config.server,
                                                                 std::move(router), handlers);
    } catch (const std::exception& ex) {
        attachvault::core::LogError(std::string("TLS setup failed: ") + ex.what());
        return 1;
    }
    if (!server->Run()) {
        return 1;
    }
    if (config.attachments.reaper_enabled) {
        reaper.Start();
    }

    boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
    signals.async_wait([&ioc](const boost::system::error_code&, int) {
        attachvault::core::LogInfo("Shutting down");
        ioc.stop();
    });

    std::vector<std::thread> threads;
    threads.reserve(static_cast<size_t>(config.server.threads));
    for (int i = 0; i < config.server.threads; ++i) {
        threads.emplace_back([&ioc]() { ioc.run(); });
    }
    for (auto& t : threads) {
        t.join();
    }

    // Everything below still needs the store and storage.
    reaper.Stop();
    handlers->Drain();
    tasks->Drain();
    return 0;
}
