#pragma once

#include "attachvault/events/event_sink.h"

namespace attachvault::events {

/// @brief Writes each event as a structured JSON log line.
class LoggingEventSink : public AttachmentEventSink {
public:
    void OnAttachmentReady(const AttachmentReadyEvent& event) override;
};

}  // namespace attachvault::events
