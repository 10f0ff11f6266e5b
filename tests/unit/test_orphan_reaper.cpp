#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <thread>

#include <gtest/gtest.h>
#include <Poco/UUIDGenerator.h>

#include "attachvault/attachments/orphan_reaper.h"
#include "attachvault/attachments/storage_keys.h"
#include "attachvault/core/ids.h"
#include "attachvault/core/time.h"
#include "attachvault/metadata/sqlite_metadata_store.h"
#include "attachvault/observability/metrics.h"
#include "attachvault/storage/memory_storage.h"

using attachvault::core::ErrorCode;
using attachvault::metadata::Attachment;
using attachvault::metadata::AttachmentStatus;

namespace {

class OrphanReaperTest : public ::testing::Test {
protected:
    void SetUp() override {
        db_path_ = std::filesystem::temp_directory_path() /
                   ("attachvault_reaper_" + Poco::UUIDGenerator().createOne().toString() + ".db");
        store_ = std::make_shared<attachvault::metadata::SqliteMetadataStore>(db_path_.string());
        storage_ = std::make_shared<attachvault::storage::MemoryStorage>();
        config_.orphan_ttl_minutes = 60;
        config_.max_orphans_per_sweep = 50;
    }

    void TearDown() override {
        store_.reset();
        std::filesystem::remove(db_path_);
    }

    Attachment Seed(AttachmentStatus status, int age_minutes, int total_chunks = 1) {
        return SeedAged(status, std::chrono::minutes(age_minutes), total_chunks);
    }

    // Row plus stored objects, created `age` ago.
    Attachment SeedAged(AttachmentStatus status, std::chrono::seconds age, int total_chunks = 1) {
        Attachment attachment;
        attachment.id = attachvault::core::GenerateRandomId();
        attachment.uploader_id = 3;
        attachment.filename = "doc.pdf";
        attachment.content_type = "application/pdf";
        attachment.file_size = 10;
        attachment.storage_key =
            attachvault::attachments::BuildStorageKey(attachment.id, attachment.filename);
        attachment.encrypted_file_key = "wrapped";
        attachment.status = status;
        attachment.total_chunks = total_chunks;
        attachment.created_at = attachvault::core::Iso8601FromNow(-age);
        EXPECT_TRUE(store_->CreateAttachment(attachment).ok());
        if (status == AttachmentStatus::kUploading) {
            for (int i = 0; i < total_chunks; ++i) {
                EXPECT_TRUE(
                    storage_->Store(attachvault::attachments::ChunkKey(attachment.storage_key, i),
                                    "chunk")
                        .ok());
            }
        } else {
            EXPECT_TRUE(storage_->Store(attachment.storage_key, "sealed").ok());
        }
        return attachment;
    }

    attachvault::core::AttachmentsConfig config_;
    std::filesystem::path db_path_;
    std::shared_ptr<attachvault::metadata::SqliteMetadataStore> store_;
    std::shared_ptr<attachvault::storage::MemoryStorage> storage_;
};

}  // namespace

TEST_F(OrphanReaperTest, ReclaimsExpiredUnlinkedAttachments) {
    auto ready = Seed(AttachmentStatus::kReady, 120);
    auto uploading = Seed(AttachmentStatus::kUploading, 90, 3);
    auto quarantined = Seed(AttachmentStatus::kQuarantined, 61);

    attachvault::attachments::OrphanReaper reaper(config_, store_, storage_);
    const auto before = attachvault::observability::CounterValue(
        attachvault::observability::AttachmentCounter::kOrphansReaped);
    EXPECT_EQ(reaper.SweepOnce(), 3);

    for (const auto& attachment : {ready, uploading, quarantined}) {
        EXPECT_EQ(store_->GetAttachment(attachment.id).error().code, ErrorCode::kNotFound);
    }
    EXPECT_TRUE(storage_->ListKeys().empty());
    EXPECT_EQ(attachvault::observability::CounterValue(
                  attachvault::observability::AttachmentCounter::kOrphansReaped),
              before + 3);

    EXPECT_EQ(reaper.SweepOnce(), 0);
}

TEST_F(OrphanReaperTest, KeepsAttachmentsWithinTtl) {
    auto fresh = Seed(AttachmentStatus::kReady, 5);

    attachvault::attachments::OrphanReaper reaper(config_, store_, storage_);
    EXPECT_EQ(reaper.SweepOnce(), 0);
    EXPECT_TRUE(store_->GetAttachment(fresh.id).ok());
    EXPECT_TRUE(storage_->Exists(fresh.storage_key).value());
}

TEST_F(OrphanReaperTest, KeepsLinkedAttachments) {
    auto linked = Seed(AttachmentStatus::kReady, 600);
    ASSERT_TRUE(store_->LinkToComment(linked.id, 12, linked.uploader_id).ok());

    attachvault::attachments::OrphanReaper reaper(config_, store_, storage_);
    EXPECT_EQ(reaper.SweepOnce(), 0);
    auto fetched = store_->GetAttachment(linked.id);
    ASSERT_TRUE(fetched.ok());
    EXPECT_EQ(fetched.value().comment_id, 12);
    EXPECT_TRUE(storage_->Exists(linked.storage_key).value());
}

TEST_F(OrphanReaperTest, SkipsAttachmentsBeingProcessed) {
    auto processing = Seed(AttachmentStatus::kProcessing, 600);

    attachvault::attachments::OrphanReaper reaper(config_, store_, storage_);
    EXPECT_EQ(reaper.SweepOnce(), 0);
    EXPECT_TRUE(store_->GetAttachment(processing.id).ok());
}

TEST_F(OrphanReaperTest, SweepIsBoundedPerRun) {
    config_.max_orphans_per_sweep = 2;
    for (int i = 0; i < 5; ++i) {
        Seed(AttachmentStatus::kReady, 120 + i);
    }

    attachvault::attachments::OrphanReaper reaper(config_, store_, storage_);
    EXPECT_EQ(reaper.SweepOnce(), 2);
    EXPECT_EQ(reaper.SweepOnce(), 2);
    EXPECT_EQ(reaper.SweepOnce(), 1);
    EXPECT_TRUE(storage_->ListKeys().empty());
}

TEST_F(OrphanReaperTest, CutoffSeparatesRowsSecondsApart) {
    const std::chrono::seconds ttl = std::chrono::minutes(config_.orphan_ttl_minutes);
    auto expired = SeedAged(AttachmentStatus::kReady, ttl + std::chrono::seconds(1));
    auto inside = SeedAged(AttachmentStatus::kReady, ttl - std::chrono::seconds(1));

    attachvault::attachments::OrphanReaper reaper(config_, store_, storage_);
    EXPECT_EQ(reaper.SweepOnce(), 1);
    EXPECT_EQ(store_->GetAttachment(expired.id).error().code, ErrorCode::kNotFound);
    EXPECT_TRUE(store_->GetAttachment(inside.id).ok());
    EXPECT_TRUE(storage_->Exists(inside.storage_key).value());
}

TEST_F(OrphanReaperTest, PeriodicSweepRunsOnItsOwnThread) {
    config_.reaper_interval_seconds = 1;
    auto orphan = Seed(AttachmentStatus::kReady, 120);

    attachvault::attachments::OrphanReaper reaper(config_, store_, storage_);
    reaper.Start();
    EXPECT_TRUE(reaper.Running());

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
    while (store_->GetAttachment(orphan.id).ok() &&
           std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    reaper.Stop();
    EXPECT_FALSE(reaper.Running());
    EXPECT_EQ(store_->GetAttachment(orphan.id).error().code, ErrorCode::kNotFound);
    EXPECT_TRUE(storage_->ListKeys().empty());
}

TEST_F(OrphanReaperTest, DestroyingARunningReaperStopsIt) {
    config_.reaper_interval_seconds = 3600;
    {
        attachvault::attachments::OrphanReaper reaper(config_, store_, storage_);
        reaper.Start();
        reaper.Start();
    }
    attachvault::attachments::OrphanReaper idle(config_, store_, storage_);
    idle.Stop();
    SUCCEED();
}
