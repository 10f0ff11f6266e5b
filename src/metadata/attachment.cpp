#include "attachvault/metadata/attachment.h"

namespace attachvault::metadata {

const char* ToString(AttachmentStatus status) {
    switch (status) {
        case AttachmentStatus::kUploading:
            return "uploading";
        case AttachmentStatus::kProcessing:
            return "processing";
        case AttachmentStatus::kReady:
            return "ready";
        case AttachmentStatus::kQuarantined:
            return "quarantined";
    }
    return "unknown";
}

std::optional<AttachmentStatus> ParseStatus(const std::string& value) {
    if (value == "uploading") {
        return AttachmentStatus::kUploading;
    }
    if (value == "processing") {
        return AttachmentStatus::kProcessing;
    }
    if (value == "ready") {
        return AttachmentStatus::kReady;
    }
    if (value == "quarantined") {
        return AttachmentStatus::kQuarantined;
    }
    return std::nullopt;
}

}  // namespace attachvault::metadata
