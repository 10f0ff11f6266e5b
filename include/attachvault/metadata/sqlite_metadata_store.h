#pragma once

#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

#include <Poco/Data/Session.h>

#include "attachvault/metadata/metadata_store.h"

namespace attachvault::metadata {

/// @brief SQLite-backed attachment store. One session guarded by a mutex.
class SqliteMetadataStore : public AttachmentStore {
public:
    explicit SqliteMetadataStore(const std::string& db_path);

    core::Result<Attachment> CreateAttachment(const Attachment& attachment) override;
    core::Result<Attachment> GetAttachment(const std::string& id) override;

    core::Result<Attachment> RecordChunk(const std::string& id, int index,
                                         std::uint64_t size_bytes) override;

    core::Result<Attachment> BeginProcessing(const std::string& id) override;
    core::Result<Attachment> MarkReady(const std::string& id, std::uint64_t file_size,
                                       const std::string& checksum_sha256) override;
    core::Result<void> MarkQuarantined(const std::string& id) override;

    core::Result<Attachment> LinkToComment(const std::string& id, std::int64_t comment_id,
                                           std::int64_t uploader_id) override;
    core::Result<bool> DeleteUnlinked(const std::string& id) override;

    core::Result<std::vector<Attachment>> ListOrphanCandidates(const std::string& cutoff,
                                                               int limit) override;
    core::Result<bool> DeleteOrphan(const std::string& id, const std::string& cutoff) override;

private:
    void InitSchema();
    /// Caller holds mutex_.
    core::Result<Attachment> GetLocked(const std::string& id);

    std::mutex mutex_;
    Poco::Data::Session session_;
};

}  // namespace attachvault::metadata
