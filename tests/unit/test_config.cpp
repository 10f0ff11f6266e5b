#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

#include <gtest/gtest.h>
#include <Poco/Environment.h>
#include <Poco/UUIDGenerator.h>

#include "attachvault/core/config.h"

namespace {

std::filesystem::path MakeTempConfigPath() {
    const auto name = "attachvault_cfg_" + Poco::UUIDGenerator().createOne().toString() + ".json";
    return std::filesystem::temp_directory_path() / name;
}

void WriteConfig(const std::filesystem::path& path, const std::string& storage_section,
                 const std::string& attachments_section,
                 const std::string& extra_server_fields = "") {
    std::ofstream out(path);
    out << "{\n"
        << "  \"server\": {\n"
        << "    \"host\": \"127.0.0.1\",\n"
        << "    \"port\": 8080,\n"
        << "    \"threads\": 1,\n"
        << extra_server_fields
        << "    \"tls\": {\"enabled\": false, \"certificate\": \"\", \"private_key\": \"\"},\n"
        << "    \"limits\": {\"max_body_bytes\": 1048576}\n"
        << "  },\n"
        << "  \"storage\": " << storage_section << ",\n"
        << "  \"attachments\": " << attachments_section << ",\n"
        << "  \"crypto\": {\"master_key\": \"from-file\"},\n"
        << "  \"observability\": {\"log_level\": \"warning\"}\n"
        << "}\n";
}

}  // namespace

TEST(Config, LoadsAttachmentSettings) {
    const auto path = MakeTempConfigPath();
    WriteConfig(path, "{\"backend\": \"memory\"}",
                "{\"orphan_ttl_minutes\": 5, \"reaper_interval_seconds\": 30,"
                " \"max_orphans_per_sweep\": 10, \"worker_threads\": 3,"
                " \"size_limits\": {\"image\": 1024},"
                " \"allowed_content_types\": [\"image/png\", \"application/pdf\"]}");

    Poco::Environment::set(attachvault::core::kMasterKeyEnv, "");
    auto config = attachvault::core::LoadConfig(path.string());
    EXPECT_EQ(config.storage.backend, "memory");
    EXPECT_EQ(config.attachments.orphan_ttl_minutes, 5);
    EXPECT_EQ(config.attachments.reaper_interval_seconds, 30);
    EXPECT_EQ(config.attachments.max_orphans_per_sweep, 10);
    EXPECT_EQ(config.attachments.worker_threads, 3);
    EXPECT_EQ(config.server.handler_threads, 4);
    EXPECT_EQ(config.attachments.size_limits.image, 1024u);
    EXPECT_EQ(config.attachments.size_limits.video, 200ULL * 1024 * 1024);
    EXPECT_EQ(config.attachments.simple_upload_limit_bytes, 5ULL * 1024 * 1024);
    ASSERT_EQ(config.attachments.allowed_content_types.size(), 2u);
    EXPECT_EQ(config.attachments.allowed_content_types[1], "application/pdf");

    std::filesystem::remove(path);
}

TEST(Config, RejectsUnknownStorageBackend) {
    const auto path = MakeTempConfigPath();
    WriteConfig(path, "{\"backend\": \"s3\"}", "{}");

    EXPECT_THROW({ (void)attachvault::core::LoadConfig(path.string()); }, std::invalid_argument);

    std::filesystem::remove(path);
}

TEST(Config, LocalBackendRequiresBasePath) {
    const auto path = MakeTempConfigPath();
    WriteConfig(path, "{\"backend\": \"local\", \"base_path\": \"  \"}", "{}");

    EXPECT_THROW({ (void)attachvault::core::LoadConfig(path.string()); }, std::invalid_argument);

    std::filesystem::remove(path);
}

TEST(Config, LoadsHandlerThreads) {
    const auto path = MakeTempConfigPath();
    WriteConfig(path, "{\"backend\": \"memory\"}", "{}", "    \"handler_threads\": 6,\n");
    EXPECT_EQ(attachvault::core::LoadConfig(path.string()).server.handler_threads, 6);

    WriteConfig(path, "{\"backend\": \"memory\"}", "{}", "    \"handler_threads\": 0,\n");
    EXPECT_THROW({ (void)attachvault::core::LoadConfig(path.string()); }, std::invalid_argument);

    std::filesystem::remove(path);
}

TEST(Config, RejectsNonPositiveOrphanTtl) {
    const auto path = MakeTempConfigPath();
    WriteConfig(path, "{\"backend\": \"memory\"}", "{\"orphan_ttl_minutes\": 0}");

    EXPECT_THROW({ (void)attachvault::core::LoadConfig(path.string()); }, std::invalid_argument);

    std::filesystem::remove(path);
}

TEST(Config, RejectsNegativeSizeLimit) {
    const auto path = MakeTempConfigPath();
    WriteConfig(path, "{\"backend\": \"memory\"}", "{\"size_limits\": {\"audio\": -1}}");

    EXPECT_THROW({ (void)attachvault::core::LoadConfig(path.string()); }, std::invalid_argument);

    std::filesystem::remove(path);
}

TEST(Config, EnvironmentOverridesMasterKey) {
    const auto path = MakeTempConfigPath();
    WriteConfig(path, "{\"backend\": \"memory\"}", "{}");

    Poco::Environment::set(attachvault::core::kMasterKeyEnv, "from-env");
    auto config = attachvault::core::LoadConfig(path.string());
    EXPECT_EQ(config.crypto.master_key, "from-env");
    Poco::Environment::set(attachvault::core::kMasterKeyEnv, "");

    std::filesystem::remove(path);
}

TEST(Config, DetectsPlaceholderMasterKey) {
    EXPECT_TRUE(attachvault::core::IsPlaceholderMasterKey(""));
    EXPECT_TRUE(attachvault::core::IsPlaceholderMasterKey("   "));
    EXPECT_TRUE(attachvault::core::IsPlaceholderMasterKey("CHANGE-THIS-master-key-material"));
    EXPECT_FALSE(attachvault::core::IsPlaceholderMasterKey("a-real-secret"));
}
