#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "attachvault/core/error.h"
#include "attachvault/core/result.h"
#include "attachvault/metadata/attachment.h"

namespace attachvault::metadata {

/// @brief Abstract attachment metadata store.
///
/// Every status change is conditional on the current status, so of two
/// concurrent callers at most one observes success.
class AttachmentStore {
public:
    virtual ~AttachmentStore() = default;

    /// @brief Insert a new record. An empty created_at is stamped with the current time.
    virtual core::Result<Attachment> CreateAttachment(const Attachment& attachment) = 0;
    virtual core::Result<Attachment> GetAttachment(const std::string& id) = 0;

    /// @brief Record chunk `index` as received and recount distinct chunks.
    /// Fails with kInvalidState unless the attachment is uploading.
    virtual core::Result<Attachment> RecordChunk(const std::string& id, int index,
                                                 std::uint64_t size_bytes) = 0;

    /// @brief Uploading -> Processing, only when every chunk has been recorded.
    /// Clears the upload session.
    virtual core::Result<Attachment> BeginProcessing(const std::string& id) = 0;
    /// @brief Processing -> Ready with the final plaintext size and checksum.
    virtual core::Result<Attachment> MarkReady(const std::string& id, std::uint64_t file_size,
                                               const std::string& checksum_sha256) = 0;
    /// @brief Processing -> Quarantined.
    virtual core::Result<void> MarkQuarantined(const std::string& id) = 0;

    /// @brief Bind a ready, unlinked attachment owned by uploader_id to a comment.
    virtual core::Result<Attachment> LinkToComment(const std::string& id,
                                                   std::int64_t comment_id,
                                                   std::int64_t uploader_id) = 0;

    /// @brief Delete the row only while it is still unlinked. Returns whether a row was removed.
    virtual core::Result<bool> DeleteUnlinked(const std::string& id) = 0;

    /// @brief Unlinked uploading/ready/quarantined rows created before `cutoff`, oldest first.
    virtual core::Result<std::vector<Attachment>> ListOrphanCandidates(const std::string& cutoff,
                                                                       int limit) = 0;
    /// @brief Delete the row only if it still satisfies the orphan predicate for `cutoff`.
    virtual core::Result<bool> DeleteOrphan(const std::string& id, const std::string& cutoff) = 0;
};

}  // namespace attachvault::metadata
