#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace attachvault::core {

/// @brief TLS configuration for the HTTP server.
struct TlsConfig {
    bool enabled{false};
    std::string certificate;
    std::string private_key;
};

/// @brief Request/connection limits for the HTTP server.
struct LimitsConfig {
    std::uint64_t max_body_bytes{268435456};
};

/// @brief HTTP server configuration (bind address, TLS, limits).
struct ServerConfig {
    std::string host{"0.0.0.0"};
    int port{8080};
    int threads{4};
    /// Worker threads that run request handlers off the io threads.
    int handler_threads{4};
    TlsConfig tls;
    LimitsConfig limits;
};

/// @brief Storage backend selection ("local" or "memory") and local root.
struct StorageConfig {
    std::string backend{"local"};
    std::string base_path{"data/storage"};
};

/// @brief Per-category byte ceilings applied to uploads.
struct SizeLimitsConfig {
    std::uint64_t image{20ULL * 1024 * 1024};
    std::uint64_t video{200ULL * 1024 * 1024};
    std::uint64_t audio{50ULL * 1024 * 1024};
    std::uint64_t document{30ULL * 1024 * 1024};
};

/// @brief Attachment pipeline settings (upload limits, reaper, background workers).
struct AttachmentsConfig {
    std::uint64_t simple_upload_limit_bytes{5ULL * 1024 * 1024};
    int max_chunks{10000};
    int orphan_ttl_minutes{60};
    bool reaper_enabled{true};
    int reaper_interval_seconds{300};
    int max_orphans_per_sweep{200};
    int worker_threads{2};
    SizeLimitsConfig size_limits;
    /// Empty means "every type the validator knows".
    std::vector<std::string> allowed_content_types;
};

/// @brief Master key material used to wrap per-file keys.
struct CryptoConfig {
    std::string master_key;
};

/// @brief Observability settings (logging).
struct ObservabilityConfig {
    std::string log_level{"information"};
};

/// @brief Top-level configuration for AttachVault.
struct Config {
    ServerConfig server;
    StorageConfig storage;
    AttachmentsConfig attachments;
    CryptoConfig crypto;
    ObservabilityConfig observability;
};

/// @brief Environment variable that overrides `crypto.master_key` when set.
inline constexpr const char* kMasterKeyEnv = "ATTACHVAULT_MASTER_KEY";

/// @brief Load server configuration from a JSON file.
/// @throws std::invalid_argument when a value is out of range.
Config LoadConfig(const std::string& path);
/// @brief Load SQLite metadata DB path from a JSON file.
std::string LoadDatabasePath(const std::string& path);
/// @brief True when the master key is empty or still the shipped placeholder.
bool IsPlaceholderMasterKey(const std::string& master_key);

}  // namespace attachvault::core
