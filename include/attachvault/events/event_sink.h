#pragma once

#include <cstdint>
#include <string>

namespace attachvault::events {

/// @brief Emitted once an attachment reaches Ready.
struct AttachmentReadyEvent {
    std::string attachment_id;
    std::int64_t uploader_id{0};
    std::string filename;
    std::string content_type;
    std::uint64_t file_size{0};
};

/// @brief Hook through which the pipeline notifies downstream consumers.
/// Implementations must be safe to call from worker threads.
class AttachmentEventSink {
public:
    virtual ~AttachmentEventSink() = default;
    virtual void OnAttachmentReady(const AttachmentReadyEvent& event) = 0;
};

}  // namespace attachvault::events
