#pragma once

#include <string>

#include "attachvault/core/result.h"
#include "attachvault/metadata/attachment.h"

namespace attachvault::attachments {

using metadata::AttachmentStatus;
using metadata::kReaperEligibleStatuses;

bool IsTerminal(AttachmentStatus status);
bool CanTransition(AttachmentStatus from, AttachmentStatus to);
/// @brief kInvalidState for a disallowed edge, otherwise ok.
core::Result<void> CheckTransition(AttachmentStatus from, AttachmentStatus to);

/// @brief kInvalidState unless uploading; kOutOfRange unless 0 <= index < total_chunks.
core::Result<void> CheckChunkAcceptable(const metadata::Attachment& attachment, int index);
/// @brief kInvalidState unless uploading with every chunk received.
core::Result<void> CheckReadyToComplete(const metadata::Attachment& attachment);

bool IsReaperEligible(AttachmentStatus status);
/// @brief Unlinked, reaper-eligible and created strictly before `cutoff` (ISO8601 UTC).
bool IsOrphanCandidate(const metadata::Attachment& attachment, const std::string& cutoff);

}  // namespace attachvault::attachments
