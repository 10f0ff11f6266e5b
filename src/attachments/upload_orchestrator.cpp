#include "attachvault/attachments/upload_orchestrator.h"

#include <utility>

#include "attachvault/attachments/attachment_lifecycle.h"
#include "attachvault/attachments/storage_keys.h"
#include "attachvault/core/ids.h"
#include "attachvault/core/logger.h"
#include "attachvault/crypto/checksum.h"
#include "attachvault/observability/metrics.h"

namespace attachvault::attachments {

using metadata::Attachment;
using metadata::AttachmentStatus;

UploadOrchestrator::UploadOrchestrator(core::AttachmentsConfig config,
                                       std::shared_ptr<metadata::AttachmentStore> store,
                                       std::shared_ptr<storage::StorageBackend> storage,
                                       std::shared_ptr<const crypto::FileEncryptor> encryptor,
                                       std::shared_ptr<const validation::FileValidator> validator,
                                       std::shared_ptr<events::AttachmentEventSink> events,
                                       std::shared_ptr<tasks::TaskQueue> tasks)
    : config_(std::move(config)),
      store_(std::move(store)),
      storage_(std::move(storage)),
      encryptor_(std::move(encryptor)),
      validator_(std::move(validator)),
      events_(std::move(events)),
      tasks_(std::move(tasks)) {}

UploadOrchestrator::~UploadOrchestrator() {
    // Queued reassembly tasks hold a raw pointer to this orchestrator.
    if (tasks_) {
        tasks_->Drain();
    }
}

core::Result<Attachment> UploadOrchestrator::SimpleUpload(std::int64_t uploader_id,
                                                          const std::string& filename,
                                                          const std::string& content_type,
                                                          const std::string& data) {
    if (data.size() > config_.simple_upload_limit_bytes) {
        return core::Fail(core::ErrorCode::kPayloadTooLarge,
                          "file too large for simple upload (" + std::to_string(data.size()) +
                              " bytes); use chunked upload above " +
                              std::to_string(config_.simple_upload_limit_bytes) + " bytes");
    }

    auto check = validator_->ValidateUpload(data, content_type, filename);
    if (!check.ok) {
        return core::Fail(core::ErrorCode::kValidation, check.error);
    }

    auto file_key = crypto::FileEncryptor::GenerateFileKey();
    if (!file_key.ok()) {
        return file_key.error();
    }
    crypto::ScopedKeyWipe wipe_key(file_key.value());
    auto wrapped = encryptor_->WrapKey(file_key.value());
    if (!wrapped.ok()) {
        return wrapped.error();
    }
    auto sealed = crypto::FileEncryptor::EncryptFile(data, file_key.value());
    if (!sealed.ok()) {
        return sealed.error();
    }

    Attachment attachment;
    attachment.id = core::GenerateRandomId();
    attachment.uploader_id = uploader_id;
    attachment.filename = check.sanitized_filename;
    attachment.content_type = content_type;
    attachment.file_size = data.size();
    attachment.storage_key = BuildStorageKey(attachment.id, attachment.filename);
    attachment.checksum_sha256 = crypto::Sha256Hex(data);
    attachment.encrypted_file_key = wrapped.value();
    attachment.status = AttachmentStatus::kReady;
    attachment.total_chunks = 1;
    attachment.received_chunks = 1;

    auto stored = storage_->Store(attachment.storage_key, sealed.value());
    if (!stored.ok()) {
        return stored.error();
    }
    auto created = store_->CreateAttachment(attachment);
    if (!created.ok()) {
        DeleteObjectsQuietly({attachment.storage_key});
        return created.error();
    }

    core::LogInfo("Simple upload complete: " + attachment.id + " (" + attachment.filename + ", " +
                  std::to_string(attachment.file_size) + " bytes)");
    EmitReady(created.value());
    return created;
}

core::Result<ChunkedUploadSession> UploadOrchestrator::InitChunkedUpload(
    std::int64_t uploader_id, const ChunkedUploadRequest& request) {
    if (request.total_chunks <= 0 || request.total_chunks > config_.max_chunks) {
        return core::Fail(core::ErrorCode::kInvalidArgument,
                          "total_chunks must be between 1 and " +
                              std::to_string(config_.max_chunks));
    }
    if (request.total_size == 0) {
        return core::Fail(core::ErrorCode::kInvalidArgument, "total_size must be positive");
    }
    if (!validator_->ValidateContentType(request.content_type)) {
        return core::Fail(core::ErrorCode::kValidation,
                          "Content type not allowed: " + request.content_type);
    }
    auto size = validator_->ValidateFileSize(request.total_size, request.content_type);
    if (!size.ok) {
        return core::Fail(core::ErrorCode::kValidation, size.reason);
    }

    auto file_key = crypto::FileEncryptor::GenerateFileKey();
    if (!file_key.ok()) {
        return file_key.error();
    }
    crypto::ScopedKeyWipe wipe_key(file_key.value());
    auto wrapped = encryptor_->WrapKey(file_key.value());
    if (!wrapped.ok()) {
        return wrapped.error();
    }

    Attachment attachment;
    attachment.id = core::GenerateRandomId();
    attachment.uploader_id = uploader_id;
    attachment.upload_session = core::GenerateRandomId();
    attachment.filename = validation::FileValidator::SanitizeFilename(request.filename);
    attachment.content_type = request.content_type;
    attachment.file_size = request.total_size;
    attachment.storage_key = BuildStorageKey(attachment.id, attachment.filename);
    attachment.encrypted_file_key = wrapped.value();
    attachment.status = AttachmentStatus::kUploading;
    attachment.total_chunks = request.total_chunks;
    attachment.received_chunks = 0;

    auto created = store_->CreateAttachment(attachment);
    if (!created.ok()) {
        return created.error();
    }

    core::LogInfo("Chunked upload initialized: " + attachment.id + " (" + attachment.filename +
                  ", " + std::to_string(attachment.total_chunks) + " chunks, " +
                  std::to_string(attachment.file_size) + " bytes)");
    return ChunkedUploadSession{attachment.id, *attachment.upload_session,
                                attachment.total_chunks};
}

core::Result<ChunkReceipt> UploadOrchestrator::UploadChunk(
    std::int64_t uploader_id, const std::string& upload_id, int chunk_index,
    const std::string& data, const std::optional<std::string>& upload_session) {
    if (data.empty()) {
        return core::Fail(core::ErrorCode::kInvalidArgument, "empty chunk");
    }
    auto current = GetOwned(uploader_id, upload_id);
    if (!current.ok()) {
        return current.error();
    }
    const auto& attachment = current.value();

    auto acceptable = CheckChunkAcceptable(attachment, chunk_index);
    if (!acceptable.ok()) {
        return acceptable.error();
    }
    if (upload_session && attachment.upload_session != upload_session) {
        return core::Fail(core::ErrorCode::kForbidden, "upload session does not match");
    }

    auto file_key = encryptor_->UnwrapKey(attachment.encrypted_file_key);
    if (!file_key.ok()) {
        return file_key.error();
    }
    crypto::ScopedKeyWipe wipe_key(file_key.value());
    auto sealed = crypto::FileEncryptor::EncryptChunk(data, file_key.value(),
                                                      static_cast<std::uint32_t>(chunk_index));
    if (!sealed.ok()) {
        return sealed.error();
    }
    const auto chunk_key = ChunkKey(attachment.storage_key, chunk_index);
    auto stored = storage_->Store(chunk_key, sealed.value());
    if (!stored.ok()) {
        return stored.error();
    }

    auto recorded = store_->RecordChunk(upload_id, chunk_index, data.size());
    if (!recorded.ok()) {
        DiscardStrayChunk(upload_id, chunk_key);
        return recorded.error();
    }

    core::LogDebug("Chunk " + std::to_string(chunk_index) + " uploaded for " + upload_id + " (" +
                   std::to_string(data.size()) + " bytes)");
    return ChunkReceipt{chunk_index, recorded.value().received_chunks,
                        recorded.value().total_chunks};
}

core::Result<Attachment> UploadOrchestrator::CompleteUpload(std::int64_t uploader_id,
                                                            const std::string& upload_id) {
    auto current = GetOwned(uploader_id, upload_id);
    if (!current.ok()) {
        return current.error();
    }
    auto ready = CheckReadyToComplete(current.value());
    if (!ready.ok()) {
        return ready.error();
    }
    auto transition = CheckTransition(current.value().status, AttachmentStatus::kProcessing);
    if (!transition.ok()) {
        return transition.error();
    }

    // The conditional update picks a single winner among concurrent completions.
    auto processing = store_->BeginProcessing(upload_id);
    if (!processing.ok()) {
        return processing.error();
    }

    if (tasks_) {
        tasks_->Post("reassemble " + upload_id,
                     [this, upload_id]() { ProcessChunkedUpload(upload_id); });
    } else {
        ProcessChunkedUpload(upload_id);
    }
    return processing;
}

void UploadOrchestrator::ProcessChunkedUpload(const std::string& attachment_id) {
    auto current = store_->GetAttachment(attachment_id);
    if (!current.ok()) {
        core::LogError("Attachment " + attachment_id +
                       " not found for processing: " + current.error().message);
        return;
    }
    const auto& attachment = current.value();
    if (attachment.status != AttachmentStatus::kProcessing) {
        core::LogWarning("Skipping reassembly of " + attachment_id + ": status is " +
                         metadata::ToString(attachment.status));
        return;
    }

    auto outcome = Reassemble(attachment);
    if (!outcome.ok()) {
        Quarantine(attachment, outcome.error().message);
    }
}

core::Result<void> UploadOrchestrator::Reassemble(const Attachment& attachment) {
    auto transition = CheckTransition(attachment.status, AttachmentStatus::kReady);
    if (!transition.ok()) {
        return transition.error();
    }
    auto file_key = encryptor_->UnwrapKey(attachment.encrypted_file_key);
    if (!file_key.ok()) {
        return file_key.error();
    }
    crypto::ScopedKeyWipe wipe_key(file_key.value());

    std::string plaintext;
    for (int i = 0; i < attachment.total_chunks; ++i) {
        auto sealed = storage_->Retrieve(ChunkKey(attachment.storage_key, i));
        if (!sealed.ok()) {
            return core::Fail(sealed.error().code,
                              "chunk " + std::to_string(i) + ": " + sealed.error().message);
        }
        auto chunk = crypto::FileEncryptor::DecryptChunk(sealed.value(), file_key.value());
        if (!chunk.ok()) {
            return core::Fail(chunk.error().code,
                              "chunk " + std::to_string(i) + ": " + chunk.error().message);
        }
        if (chunk.value().index != static_cast<std::uint32_t>(i)) {
            return core::Fail(core::ErrorCode::kIntegrity,
                              "chunk ordering mismatch: expected " + std::to_string(i) +
                                  ", got " + std::to_string(chunk.value().index));
        }
        plaintext += chunk.value().data;
    }

    // Judge the bytes actually received, not what init declared.
    if (!validation::FileValidator::ValidateMagicBytes(plaintext, attachment.content_type)) {
        return core::Fail(core::ErrorCode::kValidation,
                          "magic byte validation failed for " + attachment.content_type);
    }
    auto size = validator_->ValidateFileSize(plaintext.size(), attachment.content_type);
    if (!size.ok) {
        return core::Fail(core::ErrorCode::kValidation, size.reason);
    }

    const auto checksum = crypto::Sha256Hex(plaintext);
    auto sealed = crypto::FileEncryptor::EncryptFile(plaintext, file_key.value());
    if (!sealed.ok()) {
        return sealed.error();
    }
    auto stored = storage_->Store(attachment.storage_key, sealed.value());
    if (!stored.ok()) {
        return stored.error();
    }
    DeleteObjectsQuietly(ChunkKeys(attachment));

    auto ready = store_->MarkReady(attachment.id, plaintext.size(), checksum);
    if (!ready.ok()) {
        return ready.error();
    }

    core::LogInfo("Chunked upload processed: " + attachment.id + " (" +
                  std::to_string(plaintext.size()) + " bytes, checksum=" +
                  checksum.substr(0, 16) + "...)");
    EmitReady(ready.value());
    return core::Ok();
}

void UploadOrchestrator::Quarantine(const Attachment& attachment, const std::string& reason) {
    core::LogWarning("Quarantining attachment " + attachment.id + ": " + reason);
    auto transition = CheckTransition(attachment.status, AttachmentStatus::kQuarantined);
    if (!transition.ok()) {
        core::LogError("Cannot quarantine " + attachment.id + ": " + transition.error().message);
        return;
    }
    auto marked = store_->MarkQuarantined(attachment.id);
    if (!marked.ok()) {
        core::LogError("Failed to quarantine " + attachment.id + ": " + marked.error().message);
        return;
    }
    observability::Increment(observability::AttachmentCounter::kUploadsQuarantined);
    DeleteObjectsQuietly(ChunkKeys(attachment));
}

core::Result<DownloadedFile> UploadOrchestrator::Download(const std::string& attachment_id) {
    auto current = store_->GetAttachment(attachment_id);
    if (!current.ok()) {
        return current.error();
    }
    const auto& attachment = current.value();
    if (attachment.status != AttachmentStatus::kReady) {
        return core::Fail(core::ErrorCode::kNotFound, "attachment not found or not ready");
    }

    auto sealed = storage_->Retrieve(attachment.storage_key);
    if (!sealed.ok()) {
        return sealed.error();
    }

    const auto integrity_failure = [&attachment](const core::Error& error) {
        observability::Increment(observability::AttachmentCounter::kIntegrityFailures);
        core::LogError("Integrity failure for " + attachment.id + ": " + error.message);
        return error;
    };

    auto file_key = encryptor_->UnwrapKey(attachment.encrypted_file_key);
    if (!file_key.ok()) {
        return integrity_failure(file_key.error());
    }
    crypto::ScopedKeyWipe wipe_key(file_key.value());
    auto plaintext = crypto::FileEncryptor::DecryptFile(sealed.value(), file_key.value());
    if (!plaintext.ok()) {
        return integrity_failure(plaintext.error());
    }
    const auto checksum = crypto::Sha256Hex(plaintext.value());
    if (checksum != attachment.checksum_sha256) {
        return integrity_failure(core::Error{
            core::ErrorCode::kIntegrity,
            "checksum mismatch: expected " + attachment.checksum_sha256 + ", got " + checksum});
    }
    return DownloadedFile{attachment, std::move(plaintext.value())};
}

core::Result<Attachment> UploadOrchestrator::GetInfo(const std::string& attachment_id) {
    return store_->GetAttachment(attachment_id);
}

core::Result<void> UploadOrchestrator::Delete(std::int64_t uploader_id,
                                              const std::string& attachment_id) {
    auto current = GetOwned(uploader_id, attachment_id);
    if (!current.ok()) {
        return current.error();
    }
    if (current.value().comment_id) {
        return core::Fail(core::ErrorCode::kInvalidState,
                          "cannot delete an attachment linked to a comment");
    }

    auto deleted = store_->DeleteUnlinked(attachment_id);
    if (!deleted.ok()) {
        return deleted.error();
    }
    if (!deleted.value()) {
        // Linked (or removed) between the read and the delete.
        return core::Fail(core::ErrorCode::kInvalidState,
                          "cannot delete an attachment linked to a comment");
    }

    DeleteObjectsQuietly(OwnedStorageKeys(current.value()));
    core::LogInfo("Attachment deleted: " + attachment_id);
    return core::Ok();
}

core::Result<Attachment> UploadOrchestrator::LinkToComment(const std::string& attachment_id,
                                                           std::int64_t comment_id,
                                                           std::int64_t uploader_id) {
    if (comment_id <= 0) {
        return core::Fail(core::ErrorCode::kInvalidArgument, "comment_id must be positive");
    }
    auto linked = store_->LinkToComment(attachment_id, comment_id, uploader_id);
    if (linked.ok()) {
        core::LogInfo("Attachment " + attachment_id + " linked to comment " +
                      std::to_string(comment_id));
    }
    return linked;
}

core::Result<Attachment> UploadOrchestrator::GetOwned(std::int64_t uploader_id,
                                                      const std::string& attachment_id) {
    auto current = store_->GetAttachment(attachment_id);
    if (!current.ok()) {
        return current;
    }
    if (current.value().uploader_id != uploader_id) {
        return core::Fail(core::ErrorCode::kNotFound, "attachment not found");
    }
    return current;
}

void UploadOrchestrator::DiscardStrayChunk(const std::string& upload_id,
                                           const std::string& chunk_key) {
    // A chunk stored after completion or reaping has no row left to account for it.
    auto current = store_->GetAttachment(upload_id);
    if (current.ok() && !IsTerminal(current.value().status)) {
        return;
    }
    if (!current.ok() && current.error().code != core::ErrorCode::kNotFound) {
        core::LogWarning("Could not re-check " + upload_id + " after a rejected chunk: " +
                         current.error().message);
        return;
    }
    DeleteObjectsQuietly({chunk_key});
}

void UploadOrchestrator::DeleteObjectsQuietly(const std::vector<std::string>& keys) {
    for (const auto& key : keys) {
        auto deleted = storage_->Delete(key);
        if (!deleted.ok()) {
            core::LogWarning("Failed to delete object " + key + ": " + deleted.error().message);
        }
    }
}

void UploadOrchestrator::EmitReady(const Attachment& attachment) {
    observability::Increment(observability::AttachmentCounter::kUploadsReady);
    if (!events_) {
        return;
    }
    events_->OnAttachmentReady(events::AttachmentReadyEvent{
        attachment.id, attachment.uploader_id, attachment.filename, attachment.content_type,
        attachment.file_size});
}

}  // namespace attachvault::attachments
