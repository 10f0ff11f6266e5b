#include <filesystem>
#include <fstream>

#include <gtest/gtest.h>
#include <Poco/UUIDGenerator.h>

#include "attachvault/storage/local_storage.h"
#include "attachvault/storage/memory_storage.h"

using attachvault::core::ErrorCode;
using attachvault::storage::ValidateStorageKey;

TEST(PathSafety, AcceptsNestedKeys) {
    EXPECT_TRUE(ValidateStorageKey("attachments/ab/cd/id/photo.jpg").ok());
    EXPECT_TRUE(ValidateStorageKey("obj-1.txt").ok());
    EXPECT_TRUE(ValidateStorageKey("a/b.chunk_000001").ok());
}

TEST(PathSafety, RejectsTraversal) {
    for (const auto* key : {"../secret", "..", "a/../b", "./a", "a/./b", "/etc/passwd",
                            "a//b", "a/", "a\\b", ""}) {
        auto result = ValidateStorageKey(key);
        ASSERT_FALSE(result.ok()) << key;
        EXPECT_EQ(result.error().code, ErrorCode::kPathTraversal) << key;
    }
}

TEST(PathSafety, RejectsEmbeddedNul) {
    const std::string key("a\0b", 3);
    auto result = ValidateStorageKey(key);
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().code, ErrorCode::kPathTraversal);
}

TEST(PathSafety, MemoryStorageRejectsTraversal) {
    attachvault::storage::MemoryStorage storage;
    EXPECT_EQ(storage.Store("../escape", "x").error().code, ErrorCode::kPathTraversal);
    EXPECT_EQ(storage.Retrieve("a/../../b").error().code, ErrorCode::kPathTraversal);
    EXPECT_EQ(storage.Delete("/abs").error().code, ErrorCode::kPathTraversal);
    EXPECT_TRUE(storage.ListKeys().empty());
}

TEST(PathSafety, LocalStorageRejectsTraversalAndStagingPrefix) {
    const auto base = std::filesystem::temp_directory_path() /
                      ("attachvault_paths_" + Poco::UUIDGenerator().createOne().toString());
    attachvault::storage::LocalStorage storage(base.string());

    EXPECT_EQ(storage.Store("../outside.txt", "x").error().code, ErrorCode::kPathTraversal);
    EXPECT_FALSE(std::filesystem::exists(base.parent_path() / "outside.txt"));
    EXPECT_EQ(storage.Store(".staging/x", "x").error().code, ErrorCode::kPathTraversal);
    EXPECT_EQ(storage.Exists("a/../../b").error().code, ErrorCode::kPathTraversal);

    std::filesystem::remove_all(base);
}

TEST(PathSafety, LocalStorageRejectsSymlinkEscape) {
    const auto base = std::filesystem::temp_directory_path() /
                      ("attachvault_paths_" + Poco::UUIDGenerator().createOne().toString());
    const auto outside = std::filesystem::temp_directory_path() /
                         ("attachvault_outside_" + Poco::UUIDGenerator().createOne().toString());
    std::filesystem::create_directories(outside);
    {
        std::ofstream out(outside / "secret.txt");
        out << "secret";
    }
    attachvault::storage::LocalStorage storage(base.string());
    std::error_code ec;
    std::filesystem::create_directory_symlink(outside, storage.root() / "link", ec);
    if (ec) {
        GTEST_SKIP() << "symlinks unavailable: " << ec.message();
    }

    auto result = storage.Retrieve("link/secret.txt");
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().code, ErrorCode::kPathTraversal);

    std::filesystem::remove_all(base);
    std::filesystem::remove_all(outside);
}
