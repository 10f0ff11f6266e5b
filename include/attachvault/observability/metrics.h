#pragma once

#include <cstdint>
#include <string>

namespace attachvault::observability {

/// @brief Pipeline outcomes counted alongside HTTP traffic.
enum class AttachmentCounter {
    kUploadsReady,
    kUploadsQuarantined,
    kIntegrityFailures,
    kOrphansReaped,
};

/// @brief Render Prometheus text exposition for `/metrics`.
std::string RenderMetrics();
/// @brief Record a completed HTTP request.
void RecordRequest(int status_code, long long latency_ms);
void Increment(AttachmentCounter counter, std::uint64_t amount = 1);
std::uint64_t CounterValue(AttachmentCounter counter);

}  // namespace attachvault::observability
