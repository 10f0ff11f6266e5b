#include <string>

#include <gtest/gtest.h>

#include "attachvault/attachments/attachment_lifecycle.h"
#include "attachvault/attachments/storage_keys.h"

using attachvault::attachments::CanTransition;
using attachvault::core::ErrorCode;
using attachvault::metadata::Attachment;
using attachvault::metadata::AttachmentStatus;

TEST(AttachmentLifecycle, AllowedTransitions) {
    EXPECT_TRUE(CanTransition(AttachmentStatus::kUploading, AttachmentStatus::kProcessing));
    EXPECT_TRUE(CanTransition(AttachmentStatus::kProcessing, AttachmentStatus::kReady));
    EXPECT_TRUE(CanTransition(AttachmentStatus::kProcessing, AttachmentStatus::kQuarantined));

    EXPECT_FALSE(CanTransition(AttachmentStatus::kUploading, AttachmentStatus::kReady));
    EXPECT_FALSE(CanTransition(AttachmentStatus::kReady, AttachmentStatus::kUploading));
    EXPECT_FALSE(CanTransition(AttachmentStatus::kQuarantined, AttachmentStatus::kReady));
    EXPECT_FALSE(CanTransition(AttachmentStatus::kReady, AttachmentStatus::kQuarantined));

    auto result = attachvault::attachments::CheckTransition(AttachmentStatus::kReady,
                                                            AttachmentStatus::kProcessing);
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().code, ErrorCode::kInvalidState);
    EXPECT_EQ(result.error().message, "cannot transition from ready to processing");
}

TEST(AttachmentLifecycle, StatusNamesRoundTrip) {
    for (auto status : {AttachmentStatus::kUploading, AttachmentStatus::kProcessing,
                        AttachmentStatus::kReady, AttachmentStatus::kQuarantined}) {
        auto parsed = attachvault::metadata::ParseStatus(attachvault::metadata::ToString(status));
        ASSERT_TRUE(parsed.has_value());
        EXPECT_EQ(*parsed, status);
    }
    EXPECT_FALSE(attachvault::metadata::ParseStatus("orphaned").has_value());
}

TEST(AttachmentLifecycle, ChunkAcceptance) {
    Attachment attachment;
    attachment.status = AttachmentStatus::kUploading;
    attachment.total_chunks = 3;

    EXPECT_TRUE(attachvault::attachments::CheckChunkAcceptable(attachment, 0).ok());
    EXPECT_TRUE(attachvault::attachments::CheckChunkAcceptable(attachment, 2).ok());
    EXPECT_EQ(attachvault::attachments::CheckChunkAcceptable(attachment, 3).error().code,
              ErrorCode::kOutOfRange);
    EXPECT_EQ(attachvault::attachments::CheckChunkAcceptable(attachment, -1).error().code,
              ErrorCode::kOutOfRange);

    attachment.status = AttachmentStatus::kProcessing;
    EXPECT_EQ(attachvault::attachments::CheckChunkAcceptable(attachment, 0).error().code,
              ErrorCode::kInvalidState);
}

TEST(AttachmentLifecycle, CompletionGate) {
    Attachment attachment;
    attachment.status = AttachmentStatus::kUploading;
    attachment.total_chunks = 3;
    attachment.received_chunks = 2;

    auto early = attachvault::attachments::CheckReadyToComplete(attachment);
    ASSERT_FALSE(early.ok());
    EXPECT_EQ(early.error().message, "upload incomplete: 2/3 chunks received");

    attachment.received_chunks = 3;
    EXPECT_TRUE(attachvault::attachments::CheckReadyToComplete(attachment).ok());

    attachment.status = AttachmentStatus::kReady;
    EXPECT_EQ(attachvault::attachments::CheckReadyToComplete(attachment).error().code,
              ErrorCode::kInvalidState);
}

TEST(AttachmentLifecycle, OrphanPredicate) {
    Attachment attachment;
    attachment.status = AttachmentStatus::kReady;
    attachment.created_at = "2020-01-01T00:00:00Z";
    const std::string cutoff = "2021-01-01T00:00:00Z";

    EXPECT_TRUE(attachvault::attachments::IsOrphanCandidate(attachment, cutoff));
    EXPECT_FALSE(attachvault::attachments::IsOrphanCandidate(attachment, "2019-01-01T00:00:00Z"));

    attachment.status = AttachmentStatus::kProcessing;
    EXPECT_FALSE(attachvault::attachments::IsOrphanCandidate(attachment, cutoff));

    attachment.status = AttachmentStatus::kQuarantined;
    attachment.comment_id = 4;
    EXPECT_FALSE(attachvault::attachments::IsOrphanCandidate(attachment, cutoff));
}

TEST(StorageKeys, LayoutShardsById) {
    const auto key = attachvault::attachments::BuildStorageKey(
        "abcdef12-3456-7890-abcd-ef1234567890", "photo.jpg");
    EXPECT_EQ(key, "attachments/ab/cd/abcdef12-3456-7890-abcd-ef1234567890/photo.jpg");
    EXPECT_EQ(attachvault::attachments::ChunkKey(key, 7), key + ".chunk_000007");
}

TEST(StorageKeys, LongFilenameLeavesRoomForChunkSuffix) {
    const std::string filename = std::string(251, 'a') + ".jpg";
    const auto key = attachvault::attachments::BuildStorageKey(
        "abcdef12-3456-7890-abcd-ef1234567890", filename);
    const auto segment = key.substr(key.rfind('/') + 1);
    EXPECT_LT(segment.size(), filename.size());
    EXPECT_EQ(segment.substr(segment.size() - 4), ".jpg");

    const auto chunk = attachvault::attachments::ChunkKey(key, 999999);
    EXPECT_LE(chunk.substr(chunk.rfind('/') + 1).size(), 255u);
}

TEST(StorageKeys, OwnedKeysIncludeChunksAndThumbnail) {
    Attachment attachment;
    attachment.storage_key = "attachments/ab/cd/id/f.png";
    attachment.total_chunks = 2;
    attachment.thumbnail_storage_key = "attachments/ab/cd/id/thumb.png";

    const auto keys = attachvault::attachments::OwnedStorageKeys(attachment);
    ASSERT_EQ(keys.size(), 4u);
    EXPECT_EQ(keys[0], attachment.storage_key);
    EXPECT_EQ(keys[1], "attachments/ab/cd/id/f.png.chunk_000000");
    EXPECT_EQ(keys[2], "attachments/ab/cd/id/f.png.chunk_000001");
    EXPECT_EQ(keys[3], "attachments/ab/cd/id/thumb.png");
}
