#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>

namespace attachvault::metadata {

/// @brief Persisted lifecycle states. "Orphaned" is a query predicate, never a stored value.
enum class AttachmentStatus { kUploading, kProcessing, kReady, kQuarantined };

/// @brief Statuses the orphan reaper may reclaim. Processing rows belong to a reassembly task.
inline constexpr std::array<AttachmentStatus, 3> kReaperEligibleStatuses = {
    AttachmentStatus::kUploading, AttachmentStatus::kReady, AttachmentStatus::kQuarantined};

const char* ToString(AttachmentStatus status);
std::optional<AttachmentStatus> ParseStatus(const std::string& value);

/// @brief Attachment metadata record stored in the DB.
struct Attachment {
    std::string id;
    std::optional<std::int64_t> comment_id;
    std::int64_t uploader_id{0};
    std::optional<std::string> upload_session;
    std::string filename;
    std::string content_type;
    std::uint64_t file_size{0};
    std::string storage_key;
    std::string checksum_sha256;
    std::string encrypted_file_key;
    std::optional<std::string> thumbnail_storage_key;
    AttachmentStatus status{AttachmentStatus::kUploading};
    int total_chunks{1};
    int received_chunks{0};
    std::string created_at;
    std::string updated_at;
};

}  // namespace attachvault::metadata
