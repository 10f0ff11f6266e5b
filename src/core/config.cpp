#include "attachvault/core/config.h"

#include <cctype>
#include <stdexcept>

#include <Poco/AutoPtr.h>
#include <Poco/Environment.h>
#include <Poco/Util/JSONConfiguration.h>

namespace attachvault::core {

namespace {

bool IsBlank(const std::string& value) {
    for (char c : value) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return true;
}

std::uint64_t GetBytes(const Poco::Util::JSONConfiguration& cfg, const std::string& key,
                       std::uint64_t default_value) {
    const auto value = cfg.getInt64(key, static_cast<Poco::Int64>(default_value));
    if (value <= 0) {
        throw std::invalid_argument(key + " must be positive");
    }
    return static_cast<std::uint64_t>(value);
}

std::vector<std::string> GetStringArray(const Poco::Util::JSONConfiguration& cfg,
                                        const std::string& key) {
    std::vector<std::string> values;
    for (int i = 0;; ++i) {
        const auto item_key = key + "[" + std::to_string(i) + "]";
        if (!cfg.has(item_key)) {
            break;
        }
        values.push_back(cfg.getString(item_key));
    }
    return values;
}

}  // namespace

Config LoadConfig(const std::string& path) {
    Poco::AutoPtr<Poco::Util::JSONConfiguration> cfg(
        new Poco::Util::JSONConfiguration(path));

    Config config;
    config.server.host = cfg->getString("server.host", "0.0.0.0");
    config.server.port = cfg->getInt("server.port", 8080);
    config.server.threads = cfg->getInt("server.threads", 4);
    config.server.handler_threads = cfg->getInt("server.handler_threads", 4);
    config.server.tls.enabled = cfg->getBool("server.tls.enabled", false);
    config.server.tls.certificate = cfg->getString("server.tls.certificate", "");
    config.server.tls.private_key = cfg->getString("server.tls.private_key", "");
    config.server.limits.max_body_bytes =
        GetBytes(*cfg, "server.limits.max_body_bytes", config.server.limits.max_body_bytes);

    config.storage.backend = cfg->getString("storage.backend", "local");
    config.storage.base_path = cfg->getString("storage.base_path", "data/storage");

    auto& attachments = config.attachments;
    attachments.simple_upload_limit_bytes = GetBytes(
        *cfg, "attachments.simple_upload_limit_bytes", attachments.simple_upload_limit_bytes);
    attachments.max_chunks = cfg->getInt("attachments.max_chunks", 10000);
    attachments.orphan_ttl_minutes = cfg->getInt("attachments.orphan_ttl_minutes", 60);
    attachments.reaper_enabled = cfg->getBool("attachments.reaper_enabled", true);
    attachments.reaper_interval_seconds = cfg->getInt("attachments.reaper_interval_seconds", 300);
    attachments.max_orphans_per_sweep = cfg->getInt("attachments.max_orphans_per_sweep", 200);
    attachments.worker_threads = cfg->getInt("attachments.worker_threads", 2);
    attachments.size_limits.image =
        GetBytes(*cfg, "attachments.size_limits.image", attachments.size_limits.image);
    attachments.size_limits.video =
        GetBytes(*cfg, "attachments.size_limits.video", attachments.size_limits.video);
    attachments.size_limits.audio =
        GetBytes(*cfg, "attachments.size_limits.audio", attachments.size_limits.audio);
    attachments.size_limits.document =
        GetBytes(*cfg, "attachments.size_limits.document", attachments.size_limits.document);
    attachments.allowed_content_types = GetStringArray(*cfg, "attachments.allowed_content_types");

    config.crypto.master_key = cfg->getString("crypto.master_key", "");
    const auto env_key = Poco::Environment::get(kMasterKeyEnv, "");
    if (!env_key.empty()) {
        config.crypto.master_key = env_key;
    }

    config.observability.log_level = cfg->getString("observability.log_level", "information");

    if (config.storage.backend != "local" && config.storage.backend != "memory") {
        throw std::invalid_argument("storage.backend must be \"local\" or \"memory\"");
    }
    if (config.storage.backend == "local" && IsBlank(config.storage.base_path)) {
        throw std::invalid_argument("storage.backend=local requires non-empty storage.base_path");
    }
    if (config.server.threads <= 0) {
        throw std::invalid_argument("server.threads must be positive");
    }
    if (config.server.handler_threads <= 0) {
        throw std::invalid_argument("server.handler_threads must be positive");
    }
    if (attachments.max_chunks <= 0) {
        throw std::invalid_argument("attachments.max_chunks must be positive");
    }
    if (attachments.orphan_ttl_minutes <= 0) {
        throw std::invalid_argument("attachments.orphan_ttl_minutes must be positive");
    }
    if (attachments.reaper_interval_seconds <= 0) {
        throw std::invalid_argument("attachments.reaper_interval_seconds must be positive");
    }
    if (attachments.max_orphans_per_sweep <= 0) {
        throw std::invalid_argument("attachments.max_orphans_per_sweep must be positive");
    }
    if (attachments.worker_threads <= 0) {
        throw std::invalid_argument("attachments.worker_threads must be positive");
    }
    return config;
}

std::string LoadDatabasePath(const std::string& path) {
    Poco::AutoPtr<Poco::Util::JSONConfiguration> cfg(
        new Poco::Util::JSONConfiguration(path));
    return cfg->getString("sqlite.path", "data/metadata.db");
}

bool IsPlaceholderMasterKey(const std::string& master_key) {
    return IsBlank(master_key) || master_key.find("CHANGE-THIS") != std::string::npos;
}

}  // namespace attachvault::core
