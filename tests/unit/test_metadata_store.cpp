#include <algorithm>
#include <filesystem>
#include <string>
#include <vector>

#include <gtest/gtest.h>
#include <Poco/UUIDGenerator.h>

#include "attachvault/attachments/attachment_lifecycle.h"
#include "attachvault/core/ids.h"
#include "attachvault/core/time.h"
#include "attachvault/metadata/sqlite_metadata_store.h"

using attachvault::core::ErrorCode;
using attachvault::metadata::Attachment;
using attachvault::metadata::AttachmentStatus;

namespace {

std::filesystem::path MakeTempDbPath() {
    const auto name = "attachvault_test_" + Poco::UUIDGenerator().createOne().toString() + ".db";
    return std::filesystem::temp_directory_path() / name;
}

Attachment MakeAttachment(AttachmentStatus status, int total_chunks, std::int64_t uploader = 7) {
    Attachment attachment;
    attachment.id = attachvault::core::GenerateRandomId();
    attachment.uploader_id = uploader;
    attachment.upload_session = attachvault::core::GenerateRandomId();
    attachment.filename = "photo.jpg";
    attachment.content_type = "image/jpeg";
    attachment.file_size = 300;
    attachment.storage_key = "attachments/" + attachment.id + "/photo.jpg";
    attachment.encrypted_file_key = "wrapped";
    attachment.status = status;
    attachment.total_chunks = total_chunks;
    return attachment;
}

class MetadataStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        db_path_ = MakeTempDbPath();
        store_ = std::make_unique<attachvault::metadata::SqliteMetadataStore>(db_path_.string());
    }

    void TearDown() override {
        store_.reset();
        std::filesystem::remove(db_path_);
    }

    std::filesystem::path db_path_;
    std::unique_ptr<attachvault::metadata::SqliteMetadataStore> store_;
};

}  // namespace

TEST_F(MetadataStoreTest, CreateAndFetchAttachment) {
    auto input = MakeAttachment(AttachmentStatus::kUploading, 3);
    auto created = store_->CreateAttachment(input);
    ASSERT_TRUE(created.ok());
    EXPECT_FALSE(created.value().created_at.empty());
    EXPECT_EQ(created.value().received_chunks, 0);

    auto fetched = store_->GetAttachment(input.id);
    ASSERT_TRUE(fetched.ok());
    EXPECT_EQ(fetched.value().storage_key, input.storage_key);
    EXPECT_EQ(fetched.value().upload_session, input.upload_session);
    EXPECT_EQ(fetched.value().status, AttachmentStatus::kUploading);
    EXPECT_FALSE(fetched.value().comment_id.has_value());
    EXPECT_FALSE(fetched.value().thumbnail_storage_key.has_value());
}

TEST_F(MetadataStoreTest, MissingAttachmentIsNotFound) {
    auto fetched = store_->GetAttachment("does-not-exist");
    ASSERT_FALSE(fetched.ok());
    EXPECT_EQ(fetched.error().code, ErrorCode::kNotFound);
}

TEST_F(MetadataStoreTest, DuplicateStorageKeyIsRejected) {
    auto first = MakeAttachment(AttachmentStatus::kUploading, 1);
    ASSERT_TRUE(store_->CreateAttachment(first).ok());
    auto second = MakeAttachment(AttachmentStatus::kUploading, 1);
    second.storage_key = first.storage_key;

    auto created = store_->CreateAttachment(second);
    ASSERT_FALSE(created.ok());
    EXPECT_EQ(created.error().code, ErrorCode::kAlreadyExists);
}

TEST_F(MetadataStoreTest, RetriedChunksAreCountedOnce) {
    auto input = MakeAttachment(AttachmentStatus::kUploading, 3);
    ASSERT_TRUE(store_->CreateAttachment(input).ok());

    ASSERT_TRUE(store_->RecordChunk(input.id, 0, 100).ok());
    ASSERT_TRUE(store_->RecordChunk(input.id, 0, 100).ok());
    auto after = store_->RecordChunk(input.id, 2, 100);
    ASSERT_TRUE(after.ok());
    EXPECT_EQ(after.value().received_chunks, 2);

    auto out_of_range = store_->RecordChunk(input.id, 3, 100);
    ASSERT_FALSE(out_of_range.ok());
    EXPECT_EQ(out_of_range.error().code, ErrorCode::kOutOfRange);

    auto negative = store_->RecordChunk(input.id, -1, 100);
    ASSERT_FALSE(negative.ok());
    EXPECT_EQ(negative.error().code, ErrorCode::kOutOfRange);

    EXPECT_EQ(store_->RecordChunk("missing", 0, 1).error().code, ErrorCode::kNotFound);
}

TEST_F(MetadataStoreTest, ProcessingRequiresEveryChunk) {
    auto input = MakeAttachment(AttachmentStatus::kUploading, 2);
    ASSERT_TRUE(store_->CreateAttachment(input).ok());
    ASSERT_TRUE(store_->RecordChunk(input.id, 0, 10).ok());

    auto early = store_->BeginProcessing(input.id);
    ASSERT_FALSE(early.ok());
    EXPECT_EQ(early.error().code, ErrorCode::kInvalidState);
    EXPECT_NE(early.error().message.find("1/2"), std::string::npos);

    ASSERT_TRUE(store_->RecordChunk(input.id, 1, 10).ok());
    auto processing = store_->BeginProcessing(input.id);
    ASSERT_TRUE(processing.ok());
    EXPECT_EQ(processing.value().status, AttachmentStatus::kProcessing);
    EXPECT_FALSE(processing.value().upload_session.has_value());

    // Only one caller wins the transition.
    auto again = store_->BeginProcessing(input.id);
    ASSERT_FALSE(again.ok());
    EXPECT_EQ(again.error().code, ErrorCode::kInvalidState);

    auto late_chunk = store_->RecordChunk(input.id, 1, 10);
    ASSERT_FALSE(late_chunk.ok());
    EXPECT_EQ(late_chunk.error().code, ErrorCode::kInvalidState);
}

TEST_F(MetadataStoreTest, TerminalTransitionsAreConditional) {
    auto input = MakeAttachment(AttachmentStatus::kUploading, 1);
    ASSERT_TRUE(store_->CreateAttachment(input).ok());

    EXPECT_EQ(store_->MarkReady(input.id, 10, "abc").error().code, ErrorCode::kInvalidState);
    EXPECT_EQ(store_->MarkQuarantined(input.id).error().code, ErrorCode::kInvalidState);

    ASSERT_TRUE(store_->RecordChunk(input.id, 0, 10).ok());
    ASSERT_TRUE(store_->BeginProcessing(input.id).ok());
    auto ready = store_->MarkReady(input.id, 1234, "deadbeef");
    ASSERT_TRUE(ready.ok());
    EXPECT_EQ(ready.value().status, AttachmentStatus::kReady);
    EXPECT_EQ(ready.value().file_size, 1234u);
    EXPECT_EQ(ready.value().checksum_sha256, "deadbeef");

    EXPECT_EQ(store_->MarkQuarantined(input.id).error().code, ErrorCode::kInvalidState);
}

TEST_F(MetadataStoreTest, LinkIsExclusiveAndOwnerOnly) {
    auto input = MakeAttachment(AttachmentStatus::kReady, 1, 7);
    ASSERT_TRUE(store_->CreateAttachment(input).ok());

    auto foreign = store_->LinkToComment(input.id, 100, 8);
    ASSERT_FALSE(foreign.ok());
    EXPECT_EQ(foreign.error().code, ErrorCode::kNotFound);

    auto linked = store_->LinkToComment(input.id, 100, 7);
    ASSERT_TRUE(linked.ok());
    ASSERT_TRUE(linked.value().comment_id.has_value());
    EXPECT_EQ(*linked.value().comment_id, 100);

    auto relink = store_->LinkToComment(input.id, 200, 7);
    ASSERT_FALSE(relink.ok());
    EXPECT_EQ(relink.error().code, ErrorCode::kInvalidState);
    EXPECT_NE(relink.error().message.find("comment 100"), std::string::npos);
}

TEST_F(MetadataStoreTest, LinkRequiresReady) {
    auto input = MakeAttachment(AttachmentStatus::kUploading, 1);
    ASSERT_TRUE(store_->CreateAttachment(input).ok());

    auto linked = store_->LinkToComment(input.id, 5, input.uploader_id);
    ASSERT_FALSE(linked.ok());
    EXPECT_EQ(linked.error().code, ErrorCode::kInvalidState);
    EXPECT_EQ(store_->LinkToComment("missing", 5, 7).error().code, ErrorCode::kNotFound);
}

TEST_F(MetadataStoreTest, DeleteUnlinkedLeavesLinkedRows) {
    auto unlinked = MakeAttachment(AttachmentStatus::kReady, 1);
    auto linked = MakeAttachment(AttachmentStatus::kReady, 1);
    ASSERT_TRUE(store_->CreateAttachment(unlinked).ok());
    ASSERT_TRUE(store_->CreateAttachment(linked).ok());
    ASSERT_TRUE(store_->LinkToComment(linked.id, 1, linked.uploader_id).ok());

    auto removed = store_->DeleteUnlinked(unlinked.id);
    ASSERT_TRUE(removed.ok());
    EXPECT_TRUE(removed.value());
    EXPECT_EQ(store_->GetAttachment(unlinked.id).error().code, ErrorCode::kNotFound);

    auto kept = store_->DeleteUnlinked(linked.id);
    ASSERT_TRUE(kept.ok());
    EXPECT_FALSE(kept.value());
    EXPECT_TRUE(store_->GetAttachment(linked.id).ok());
}

TEST_F(MetadataStoreTest, OrphanCandidatesFollowPredicate) {
    auto old_ready = MakeAttachment(AttachmentStatus::kReady, 1);
    old_ready.created_at = "2020-01-01T00:00:00Z";
    auto old_uploading = MakeAttachment(AttachmentStatus::kUploading, 2);
    old_uploading.created_at = "2020-01-02T00:00:00Z";
    auto old_processing = MakeAttachment(AttachmentStatus::kProcessing, 1);
    old_processing.created_at = "2020-01-01T00:00:00Z";
    auto old_linked = MakeAttachment(AttachmentStatus::kReady, 1);
    old_linked.created_at = "2020-01-01T00:00:00Z";
    auto fresh = MakeAttachment(AttachmentStatus::kReady, 1);
    fresh.created_at = "2030-01-01T00:00:00Z";

    for (const auto& attachment : {old_ready, old_uploading, old_processing, old_linked, fresh}) {
        ASSERT_TRUE(store_->CreateAttachment(attachment).ok());
    }
    ASSERT_TRUE(store_->LinkToComment(old_linked.id, 9, old_linked.uploader_id).ok());

    const std::string cutoff = "2025-01-01T00:00:00Z";
    auto candidates = store_->ListOrphanCandidates(cutoff, 10);
    ASSERT_TRUE(candidates.ok());
    ASSERT_EQ(candidates.value().size(), 2u);
    EXPECT_EQ(candidates.value()[0].id, old_ready.id);
    EXPECT_EQ(candidates.value()[1].id, old_uploading.id);

    auto limited = store_->ListOrphanCandidates(cutoff, 1);
    ASSERT_TRUE(limited.ok());
    EXPECT_EQ(limited.value().size(), 1u);

    EXPECT_FALSE(store_->DeleteOrphan(old_linked.id, cutoff).value());
    EXPECT_FALSE(store_->DeleteOrphan(old_processing.id, cutoff).value());
    EXPECT_FALSE(store_->DeleteOrphan(fresh.id, cutoff).value());
    EXPECT_TRUE(store_->DeleteOrphan(old_ready.id, cutoff).value());
    EXPECT_FALSE(store_->DeleteOrphan(old_ready.id, cutoff).value());
}

TEST_F(MetadataStoreTest, OrphanQueryAgreesWithLifecyclePredicate) {
    const std::vector<AttachmentStatus> statuses = {
        AttachmentStatus::kUploading, AttachmentStatus::kProcessing, AttachmentStatus::kReady,
        AttachmentStatus::kQuarantined};
    std::vector<Attachment> seeded;
    for (auto status : statuses) {
        auto attachment = MakeAttachment(status, 1);
        attachment.created_at = attachvault::core::Iso8601FromNow(-std::chrono::hours(2));
        ASSERT_TRUE(store_->CreateAttachment(attachment).ok());
        seeded.push_back(attachment);
    }

    const auto cutoff = attachvault::core::Iso8601FromNow(-std::chrono::hours(1));
    auto listed = store_->ListOrphanCandidates(cutoff, 10);
    ASSERT_TRUE(listed.ok());
    for (const auto& attachment : seeded) {
        const bool in_query =
            std::any_of(listed.value().begin(), listed.value().end(),
                        [&attachment](const Attachment& row) { return row.id == attachment.id; });
        EXPECT_EQ(in_query, attachvault::attachments::IsOrphanCandidate(attachment, cutoff))
            << attachvault::metadata::ToString(attachment.status);
    }
    EXPECT_EQ(listed.value().size(), attachvault::metadata::kReaperEligibleStatuses.size());
}

TEST_F(MetadataStoreTest, DeletingAttachmentCascadesChunkRows) {
    auto input = MakeAttachment(AttachmentStatus::kUploading, 2);
    input.created_at = "2020-01-01T00:00:00Z";
    ASSERT_TRUE(store_->CreateAttachment(input).ok());
    ASSERT_TRUE(store_->RecordChunk(input.id, 0, 5).ok());
    ASSERT_TRUE(store_->DeleteOrphan(input.id, "2025-01-01T00:00:00Z").value());

    // Recreating the same id starts from an empty chunk set.
    ASSERT_TRUE(store_->CreateAttachment(input).ok());
    auto recorded = store_->RecordChunk(input.id, 1, 5);
    ASSERT_TRUE(recorded.ok());
    EXPECT_EQ(recorded.value().received_chunks, 1);
}
