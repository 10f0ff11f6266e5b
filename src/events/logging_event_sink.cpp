#include "attachvault/events/logging_event_sink.h"

#include "attachvault/core/logger.h"

namespace attachvault::events {

void LoggingEventSink::OnAttachmentReady(const AttachmentReadyEvent& event) {
    core::LogEvent("attachment.ready", {{"attachment_id", event.attachment_id},
                                        {"uploader_id", std::to_string(event.uploader_id)},
                                        {"filename", event.filename},
                                        {"content_type", event.content_type},
                                        {"file_size", std::to_string(event.file_size)}});
}

}  // namespace attachvault::events
