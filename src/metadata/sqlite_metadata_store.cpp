#include "attachvault/metadata/sqlite_metadata_store.h"

#include <Poco/Data/SQLite/Connector.h>
#include <Poco/Data/Statement.h>
#include <Poco/Data/Transaction.h>
#include <Poco/Exception.h>
#include <Poco/Nullable.h>
#include <Poco/Types.h>

#include "attachvault/core/time.h"

namespace {
using namespace Poco::Data::Keywords;

constexpr const char* kSelectColumns =
    "SELECT id, comment_id, uploader_id, upload_session, filename, content_type, file_size, "
    "storage_key, checksum_sha256, encrypted_file_key, thumbnail_storage_key, status, "
    "total_chunks, received_chunks, created_at, updated_at FROM attachments ";

/// @brief WHERE fragment shared by orphan listing and the conditional orphan delete.
std::string OrphanPredicate() {
    std::string statuses;
    for (auto status : attachvault::metadata::kReaperEligibleStatuses) {
        if (!statuses.empty()) {
            statuses += ", ";
        }
        statuses += std::string("'") + attachvault::metadata::ToString(status) + "'";
    }
    return "comment_id IS NULL AND status IN (" + statuses + ") AND created_at < ? ";
}

/// @brief Column buffer in Poco::Data binding types.
struct AttachmentRow {
    std::string id;
    Poco::Nullable<Poco::Int64> comment_id;
    Poco::Int64 uploader_id{0};
    Poco::Nullable<std::string> upload_session;
    std::string filename;
    std::string content_type;
    Poco::UInt64 file_size{0};
    std::string storage_key;
    std::string checksum_sha256;
    std::string encrypted_file_key;
    Poco::Nullable<std::string> thumbnail_storage_key;
    std::string status;
    int total_chunks{0};
    int received_chunks{0};
    std::string created_at;
    std::string updated_at;
};

void BindInto(Poco::Data::Statement& statement, AttachmentRow& row) {
    statement, into(row.id), into(row.comment_id), into(row.uploader_id),
        into(row.upload_session), into(row.filename), into(row.content_type),
        into(row.file_size), into(row.storage_key), into(row.checksum_sha256),
        into(row.encrypted_file_key), into(row.thumbnail_storage_key), into(row.status),
        into(row.total_chunks), into(row.received_chunks), into(row.created_at),
        into(row.updated_at);
}

attachvault::core::Result<attachvault::metadata::Attachment> ToAttachment(
    const AttachmentRow& row) {
    using attachvault::metadata::Attachment;
    auto status = attachvault::metadata::ParseStatus(row.status);
    if (!status) {
        return attachvault::core::Error{attachvault::core::ErrorCode::kDbError,
                                        "unknown attachment status: " + row.status};
    }
    Attachment attachment;
    attachment.id = row.id;
    if (!row.comment_id.isNull()) {
        attachment.comment_id = static_cast<std::int64_t>(row.comment_id.value());
    }
    attachment.uploader_id = static_cast<std::int64_t>(row.uploader_id);
    if (!row.upload_session.isNull()) {
        attachment.upload_session = row.upload_session.value();
    }
    attachment.filename = row.filename;
    attachment.content_type = row.content_type;
    attachment.file_size = static_cast<std::uint64_t>(row.file_size);
    attachment.storage_key = row.storage_key;
    attachment.checksum_sha256 = row.checksum_sha256;
    attachment.encrypted_file_key = row.encrypted_file_key;
    if (!row.thumbnail_storage_key.isNull()) {
        attachment.thumbnail_storage_key = row.thumbnail_storage_key.value();
    }
    attachment.status = *status;
    attachment.total_chunks = row.total_chunks;
    attachment.received_chunks = row.received_chunks;
    attachment.created_at = row.created_at;
    attachment.updated_at = row.updated_at;
    return attachment;
}

attachvault::core::Error DbError(const Poco::Exception& ex) {
    return attachvault::core::Error{attachvault::core::ErrorCode::kDbError, ex.displayText()};
}
}  // namespace

namespace attachvault::metadata {

SqliteMetadataStore::SqliteMetadataStore(const std::string& db_path)
    : session_([](const std::string& path) {
          Poco::Data::SQLite::Connector::registerConnector();
          return Poco::Data::Session("SQLite", path);
      }(db_path)) {
    InitSchema();
}

void SqliteMetadataStore::InitSchema() {
    session_ << "PRAGMA foreign_keys = ON", now;

    // Created on startup; schema evolution is handled outside this service.
    session_ <<
            "CREATE TABLE IF NOT EXISTS attachments ("
            "id TEXT PRIMARY KEY,"
            "comment_id INTEGER,"
            "uploader_id INTEGER NOT NULL,"
            "upload_session TEXT,"
            "filename TEXT NOT NULL,"
            "content_type TEXT NOT NULL,"
            "file_size INTEGER NOT NULL,"
            "storage_key TEXT NOT NULL UNIQUE,"
            "checksum_sha256 TEXT NOT NULL,"
            "encrypted_file_key TEXT NOT NULL,"
            "thumbnail_storage_key TEXT,"
            "status TEXT NOT NULL,"
            "total_chunks INTEGER NOT NULL,"
            "received_chunks INTEGER NOT NULL,"
            "created_at TEXT NOT NULL,"
            "updated_at TEXT NOT NULL"
            ")",
        now;

    session_ <<
            "CREATE TABLE IF NOT EXISTS attachment_chunks ("
            "attachment_id TEXT NOT NULL,"
            "chunk_index INTEGER NOT NULL,"
            "size_bytes INTEGER NOT NULL,"
            "received_at TEXT NOT NULL,"
            "PRIMARY KEY(attachment_id, chunk_index),"
            "FOREIGN KEY(attachment_id) REFERENCES attachments(id) ON DELETE CASCADE"
            ")",
        now;

    session_ <<
            "CREATE INDEX IF NOT EXISTS idx_attachments_orphans "
            "ON attachments(comment_id, status, created_at)",
        now;
    session_ <<
            "CREATE INDEX IF NOT EXISTS idx_attachments_uploader ON attachments(uploader_id)",
        now;
}

core::Result<Attachment> SqliteMetadataStore::CreateAttachment(const Attachment& attachment) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string now_time = core::NowIso8601();
    try {
        AttachmentRow row;
        row.id = attachment.id;
        if (attachment.comment_id) {
            row.comment_id = static_cast<Poco::Int64>(*attachment.comment_id);
        }
        row.uploader_id = static_cast<Poco::Int64>(attachment.uploader_id);
        if (attachment.upload_session) {
            row.upload_session = *attachment.upload_session;
        }
        row.filename = attachment.filename;
        row.content_type = attachment.content_type;
        row.file_size = static_cast<Poco::UInt64>(attachment.file_size);
        row.storage_key = attachment.storage_key;
        row.checksum_sha256 = attachment.checksum_sha256;
        row.encrypted_file_key = attachment.encrypted_file_key;
        if (attachment.thumbnail_storage_key) {
            row.thumbnail_storage_key = *attachment.thumbnail_storage_key;
        }
        row.status = ToString(attachment.status);
        row.total_chunks = attachment.total_chunks;
        row.received_chunks = attachment.received_chunks;
        row.created_at = attachment.created_at.empty() ? now_time : attachment.created_at;
        row.updated_at = now_time;

        session_ <<
                "INSERT INTO attachments(id, comment_id, uploader_id, upload_session, filename, "
                "content_type, file_size, storage_key, checksum_sha256, encrypted_file_key, "
                "thumbnail_storage_key, status, total_chunks, received_chunks, created_at, "
                "updated_at) VALUES(?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)",
            use(row.id), use(row.comment_id), use(row.uploader_id), use(row.upload_session),
            use(row.filename), use(row.content_type), use(row.file_size), use(row.storage_key),
            use(row.checksum_sha256), use(row.encrypted_file_key), use(row.thumbnail_storage_key),
            use(row.status), use(row.total_chunks), use(row.received_chunks),
            use(row.created_at), use(row.updated_at), now;
    } catch (const Poco::Exception& ex) {
        // SQLite uniqueness errors surface here; map them to a conflict-like error.
        return core::Error{core::ErrorCode::kAlreadyExists, ex.displayText()};
    }
    return GetLocked(attachment.id);
}

core::Result<Attachment> SqliteMetadataStore::GetAttachment(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return GetLocked(id);
}

core::Result<Attachment> SqliteMetadataStore::GetLocked(const std::string& id) {
    AttachmentRow row;
    std::string id_value = id;
    try {
        Poco::Data::Statement select(session_);
        select << std::string(kSelectColumns) + "WHERE id = ?", use(id_value);
        BindInto(select, row);
        select.execute();
    } catch (const Poco::Exception& ex) {
        return DbError(ex);
    }

    if (row.id.empty()) {
        return core::Error{core::ErrorCode::kNotFound, "attachment not found"};
    }
    return ToAttachment(row);
}

core::Result<Attachment> SqliteMetadataStore::RecordChunk(const std::string& id, int index,
                                                          std::uint64_t size_bytes) {
    std::lock_guard<std::mutex> lock(mutex_);
    try {
        Poco::Data::Transaction txn(session_);

        std::string id_value = id;
        std::string status;
        int total_chunks = 0;
        Poco::Data::Statement select(session_);
        select << "SELECT status, total_chunks FROM attachments WHERE id = ?", use(id_value),
            into(status), into(total_chunks), now;
        if (status.empty()) {
            return core::Error{core::ErrorCode::kNotFound, "attachment not found"};
        }
        if (status != ToString(AttachmentStatus::kUploading)) {
            return core::Error{core::ErrorCode::kInvalidState,
                               "attachment is " + status + ", not uploading"};
        }
        if (index < 0 || index >= total_chunks) {
            return core::Error{core::ErrorCode::kOutOfRange,
                               "chunk index " + std::to_string(index) + " out of range"};
        }

        std::string now_time = core::NowIso8601();
        int index_value = index;
        Poco::UInt64 size_value = static_cast<Poco::UInt64>(size_bytes);
        session_ <<
                "INSERT INTO attachment_chunks(attachment_id, chunk_index, size_bytes, "
                "received_at) VALUES(?, ?, ?, ?) "
                "ON CONFLICT(attachment_id, chunk_index) DO UPDATE SET "
                "size_bytes=excluded.size_bytes, received_at=excluded.received_at",
            use(id_value), use(index_value), use(size_value), use(now_time), now;

        session_ <<
                "UPDATE attachments SET received_chunks = "
                "(SELECT COUNT(*) FROM attachment_chunks WHERE attachment_id = ?), "
                "updated_at = ? WHERE id = ? AND status = 'uploading'",
            use(id_value), use(now_time), use(id_value), now;

        txn.commit();
    } catch (const Poco::Exception& ex) {
        return DbError(ex);
    }
    return GetLocked(id);
}

core::Result<Attachment> SqliteMetadataStore::BeginProcessing(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t changed = 0;
    try {
        std::string id_value = id;
        std::string now_time = core::NowIso8601();
        Poco::Data::Statement update(session_);
        update << "UPDATE attachments SET status = 'processing', upload_session = NULL, "
                  "updated_at = ? "
                  "WHERE id = ? AND status = 'uploading' AND received_chunks = total_chunks",
            use(now_time), use(id_value);
        changed = update.execute();
    } catch (const Poco::Exception& ex) {
        return DbError(ex);
    }

    if (changed == 0) {
        auto current = GetLocked(id);
        if (!current.ok()) {
            return current.error();
        }
        const auto& attachment = current.value();
        if (attachment.status != AttachmentStatus::kUploading) {
            return core::Error{core::ErrorCode::kInvalidState,
                               std::string("attachment is ") + ToString(attachment.status) +
                                   ", not uploading"};
        }
        return core::Error{core::ErrorCode::kInvalidState,
                           "upload incomplete: " + std::to_string(attachment.received_chunks) +
                               "/" + std::to_string(attachment.total_chunks) +
                               " chunks received"};
    }
    return GetLocked(id);
}

core::Result<Attachment> SqliteMetadataStore::MarkReady(const std::string& id,
                                                        std::uint64_t file_size,
                                                        const std::string& checksum_sha256) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t changed = 0;
    try {
        std::string id_value = id;
        std::string checksum_value = checksum_sha256;
        Poco::UInt64 size_value = static_cast<Poco::UInt64>(file_size);
        std::string now_time = core::NowIso8601();
        Poco::Data::Statement update(session_);
        update << "UPDATE attachments SET status = 'ready', file_size = ?, checksum_sha256 = ?, "
                  "updated_at = ? WHERE id = ? AND status = 'processing'",
            use(size_value), use(checksum_value), use(now_time), use(id_value);
        changed = update.execute();
    } catch (const Poco::Exception& ex) {
        return DbError(ex);
    }
    if (changed == 0) {
        return core::Error{core::ErrorCode::kInvalidState, "attachment is not processing"};
    }
    return GetLocked(id);
}

core::Result<void> SqliteMetadataStore::MarkQuarantined(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t changed = 0;
    try {
        std::string id_value = id;
        std::string now_time = core::NowIso8601();
        Poco::Data::Statement update(session_);
        update << "UPDATE attachments SET status = 'quarantined', updated_at = ? "
                  "WHERE id = ? AND status = 'processing'",
            use(now_time), use(id_value);
        changed = update.execute();
    } catch (const Poco::Exception& ex) {
        return DbError(ex);
    }
    if (changed == 0) {
        return core::Error{core::ErrorCode::kInvalidState, "attachment is not processing"};
    }
    return core::Ok();
}

core::Result<Attachment> SqliteMetadataStore::LinkToComment(const std::string& id,
                                                            std::int64_t comment_id,
                                                            std::int64_t uploader_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t changed = 0;
    try {
        std::string id_value = id;
        Poco::Int64 comment_value = static_cast<Poco::Int64>(comment_id);
        Poco::Int64 uploader_value = static_cast<Poco::Int64>(uploader_id);
        std::string now_time = core::NowIso8601();
        Poco::Data::Statement update(session_);
        update << "UPDATE attachments SET comment_id = ?, updated_at = ? "
                  "WHERE id = ? AND uploader_id = ? AND comment_id IS NULL AND status = 'ready'",
            use(comment_value), use(now_time), use(id_value), use(uploader_value);
        changed = update.execute();
    } catch (const Poco::Exception& ex) {
        return DbError(ex);
    }

    auto current = GetLocked(id);
    if (changed > 0 || !current.ok()) {
        return current;
    }
    const auto& attachment = current.value();
    if (attachment.uploader_id != uploader_id) {
        return core::Error{core::ErrorCode::kNotFound, "attachment not found"};
    }
    if (attachment.comment_id) {
        return core::Error{core::ErrorCode::kInvalidState,
                           "attachment already linked to comment " +
                               std::to_string(*attachment.comment_id)};
    }
    return core::Error{core::ErrorCode::kInvalidState,
                       std::string("attachment is ") + ToString(attachment.status) +
                           ", not ready"};
}

core::Result<bool> SqliteMetadataStore::DeleteUnlinked(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    try {
        std::string id_value = id;
        Poco::Data::Statement del(session_);
        del << "DELETE FROM attachments WHERE id = ? AND comment_id IS NULL", use(id_value);
        return del.execute() > 0;
    } catch (const Poco::Exception& ex) {
        return DbError(ex);
    }
}

core::Result<std::vector<Attachment>> SqliteMetadataStore::ListOrphanCandidates(
    const std::string& cutoff, int limit) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Attachment> attachments;
    AttachmentRow row;

    std::string cutoff_value = cutoff;
    int limit_value = limit;
    try {
        Poco::Data::Statement select(session_);
        select << std::string(kSelectColumns) + "WHERE " + OrphanPredicate() +
                      "ORDER BY created_at ASC LIMIT ?",
            use(cutoff_value), use(limit_value);
        BindInto(select, row);
        select, range(0, 1);

        while (!select.done()) {
            row = {};
            select.execute();
            if (row.id.empty()) {
                continue;
            }
            auto attachment = ToAttachment(row);
            if (!attachment.ok()) {
                return attachment.error();
            }
            attachments.push_back(attachment.value());
        }
    } catch (const Poco::Exception& ex) {
        return DbError(ex);
    }
    return attachments;
}

core::Result<bool> SqliteMetadataStore::DeleteOrphan(const std::string& id,
                                                     const std::string& cutoff) {
    std::lock_guard<std::mutex> lock(mutex_);
    try {
        std::string id_value = id;
        std::string cutoff_value = cutoff;
        Poco::Data::Statement del(session_);
        del << "DELETE FROM attachments WHERE id = ? AND " + OrphanPredicate(),
            use(id_value), use(cutoff_value);
        return del.execute() > 0;
    } catch (const Poco::Exception& ex) {
        return DbError(ex);
    }
}

}  // namespace attachvault::metadata
