#include "attachvault/attachments/attachment_lifecycle.h"

namespace attachvault::attachments {

bool IsTerminal(AttachmentStatus status) {
    return status == AttachmentStatus::kReady || status == AttachmentStatus::kQuarantined;
}

bool CanTransition(AttachmentStatus from, AttachmentStatus to) {
    switch (from) {
        case AttachmentStatus::kUploading:
            return to == AttachmentStatus::kProcessing;
        case AttachmentStatus::kProcessing:
            return to == AttachmentStatus::kReady || to == AttachmentStatus::kQuarantined;
        case AttachmentStatus::kReady:
        case AttachmentStatus::kQuarantined:
            return false;
    }
    return false;
}

core::Result<void> CheckTransition(AttachmentStatus from, AttachmentStatus to) {
    if (!CanTransition(from, to)) {
        return core::Fail(core::ErrorCode::kInvalidState,
                          std::string("cannot transition from ") + metadata::ToString(from) +
                              " to " + metadata::ToString(to));
    }
    return core::Ok();
}

core::Result<void> CheckChunkAcceptable(const metadata::Attachment& attachment, int index) {
    if (attachment.status != AttachmentStatus::kUploading) {
        return core::Fail(core::ErrorCode::kInvalidState,
                          std::string("attachment is ") + metadata::ToString(attachment.status) +
                              ", not uploading");
    }
    if (index < 0 || index >= attachment.total_chunks) {
        return core::Fail(core::ErrorCode::kOutOfRange,
                          "chunk index " + std::to_string(index) + " out of range [0, " +
                              std::to_string(attachment.total_chunks) + ")");
    }
    return core::Ok();
}

core::Result<void> CheckReadyToComplete(const metadata::Attachment& attachment) {
    if (attachment.status != AttachmentStatus::kUploading) {
        return core::Fail(core::ErrorCode::kInvalidState,
                          std::string("attachment is ") + metadata::ToString(attachment.status) +
                              ", not uploading");
    }
    if (attachment.received_chunks != attachment.total_chunks) {
        return core::Fail(core::ErrorCode::kInvalidState,
                          "upload incomplete: " + std::to_string(attachment.received_chunks) +
                              "/" + std::to_string(attachment.total_chunks) +
                              " chunks received");
    }
    return core::Ok();
}

bool IsReaperEligible(AttachmentStatus status) {
    for (auto eligible : kReaperEligibleStatuses) {
        if (eligible == status) {
            return true;
        }
    }
    return false;
}

bool IsOrphanCandidate(const metadata::Attachment& attachment, const std::string& cutoff) {
    return !attachment.comment_id && IsReaperEligible(attachment.status) &&
           attachment.created_at < cutoff;
}

}  // namespace attachvault::attachments
