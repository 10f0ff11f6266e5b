#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "attachvault/core/config.h"
#include "attachvault/core/result.h"
#include "attachvault/crypto/file_encryptor.h"
#include "attachvault/events/event_sink.h"
#include "attachvault/metadata/metadata_store.h"
#include "attachvault/storage/storage_backend.h"
#include "attachvault/tasks/task_queue.h"
#include "attachvault/validation/file_validator.h"

namespace attachvault::attachments {

/// @brief Declared properties of a chunked upload.
struct ChunkedUploadRequest {
    std::string filename;
    std::string content_type;
    std::uint64_t total_size{0};
    int total_chunks{0};
};

/// @brief Handle returned by Init; the session token correlates later chunk calls.
struct ChunkedUploadSession {
    std::string upload_id;
    std::string upload_session;
    int total_chunks{0};
};

struct ChunkReceipt {
    int chunk_index{0};
    int received_chunks{0};
    int total_chunks{0};
};

/// @brief Verified plaintext of a Ready attachment.
struct DownloadedFile {
    metadata::Attachment attachment;
    std::string data;
};

/// @brief Drives simple and chunked uploads, downloads, deletion and comment linkage.
///
/// Chunks are sealed individually under the attachment's DEK and stored under
/// their own keys. Completion flips Uploading -> Processing exactly once and
/// hands reassembly to the task queue; reassembly verifies chunk order and
/// content, then replaces the chunks with one sealed whole-file object.
class UploadOrchestrator {
public:
    /// @param tasks Reassembly runs inline when null.
    UploadOrchestrator(core::AttachmentsConfig config,
                       std::shared_ptr<metadata::AttachmentStore> store,
                       std::shared_ptr<storage::StorageBackend> storage,
                       std::shared_ptr<const crypto::FileEncryptor> encryptor,
                       std::shared_ptr<const validation::FileValidator> validator,
                       std::shared_ptr<events::AttachmentEventSink> events,
                       std::shared_ptr<tasks::TaskQueue> tasks);
    ~UploadOrchestrator();

    UploadOrchestrator(const UploadOrchestrator&) = delete;
    UploadOrchestrator& operator=(const UploadOrchestrator&) = delete;

    /// @brief Single-request upload, validated synchronously and stored directly as Ready.
    core::Result<metadata::Attachment> SimpleUpload(std::int64_t uploader_id,
                                                    const std::string& filename,
                                                    const std::string& content_type,
                                                    const std::string& data);

    core::Result<ChunkedUploadSession> InitChunkedUpload(std::int64_t uploader_id,
                                                         const ChunkedUploadRequest& request);

    /// @param upload_session When present, must match the token issued at init.
    core::Result<ChunkReceipt> UploadChunk(std::int64_t uploader_id,
                                           const std::string& upload_id, int chunk_index,
                                           const std::string& data,
                                           const std::optional<std::string>& upload_session);

    /// @brief Uploading -> Processing and schedule reassembly. Returns the Processing record.
    core::Result<metadata::Attachment> CompleteUpload(std::int64_t uploader_id,
                                                      const std::string& upload_id);

    /// @brief Reassemble a Processing attachment into Ready or Quarantined.
    void ProcessChunkedUpload(const std::string& attachment_id);

    /// @brief Decrypt and checksum-verify a Ready attachment.
    core::Result<DownloadedFile> Download(const std::string& attachment_id);

    core::Result<metadata::Attachment> GetInfo(const std::string& attachment_id);

    /// @brief Uploader-only removal of an unlinked attachment and its objects.
    core::Result<void> Delete(std::int64_t uploader_id, const std::string& attachment_id);

    core::Result<metadata::Attachment> LinkToComment(const std::string& attachment_id,
                                                     std::int64_t comment_id,
                                                     std::int64_t uploader_id);

private:
    core::Result<metadata::Attachment> GetOwned(std::int64_t uploader_id,
                                                const std::string& attachment_id);
    core::Result<void> Reassemble(const metadata::Attachment& attachment);
    void Quarantine(const metadata::Attachment& attachment, const std::string& reason);
    /// @brief Remove a just-stored chunk whose attachment is gone or already terminal.
    void DiscardStrayChunk(const std::string& upload_id, const std::string& chunk_key);
    void DeleteObjectsQuietly(const std::vector<std::string>& keys);
    void EmitReady(const metadata::Attachment& attachment);

    core::AttachmentsConfig config_;
    std::shared_ptr<metadata::AttachmentStore> store_;
    std::shared_ptr<storage::StorageBackend> storage_;
    std::shared_ptr<const crypto::FileEncryptor> encryptor_;
    std::shared_ptr<const validation::FileValidator> validator_;
    std::shared_ptr<events::AttachmentEventSink> events_;
    std::shared_ptr<tasks::TaskQueue> tasks_;
};

}  // namespace attachvault::attachments
