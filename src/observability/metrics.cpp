#include "attachvault/observability/metrics.h"

#include <atomic>
#include <sstream>

namespace attachvault::observability {
namespace {
std::atomic<std::uint64_t> g_total_requests{0};
std::atomic<std::uint64_t> g_requests_2xx{0};
std::atomic<std::uint64_t> g_requests_4xx{0};
std::atomic<std::uint64_t> g_requests_5xx{0};
std::atomic<std::uint64_t> g_latency_ms_total{0};

std::atomic<std::uint64_t> g_uploads_ready{0};
std::atomic<std::uint64_t> g_uploads_quarantined{0};
std::atomic<std::uint64_t> g_integrity_failures{0};
std::atomic<std::uint64_t> g_orphans_reaped{0};

std::atomic<std::uint64_t>& Slot(AttachmentCounter counter) {
    switch (counter) {
        case AttachmentCounter::kUploadsReady:
            return g_uploads_ready;
        case AttachmentCounter::kUploadsQuarantined:
            return g_uploads_quarantined;
        case AttachmentCounter::kIntegrityFailures:
            return g_integrity_failures;
        case AttachmentCounter::kOrphansReaped:
            break;
    }
    return g_orphans_reaped;
}

void WriteMetric(std::ostringstream& out, const char* name, const char* type, const char* help,
                 std::uint64_t value) {
    out << "# HELP attachvault_" << name << ' ' << help << '\n'
        << "# TYPE attachvault_" << name << ' ' << type << '\n'
        << "attachvault_" << name << ' ' << value << '\n';
}
}  // namespace

void RecordRequest(int status_code, long long latency_ms) {
    g_total_requests.fetch_add(1, std::memory_order_relaxed);
    g_latency_ms_total.fetch_add(static_cast<std::uint64_t>(latency_ms),
                                 std::memory_order_relaxed);
    if (status_code >= 200 && status_code < 300) {
        g_requests_2xx.fetch_add(1, std::memory_order_relaxed);
    } else if (status_code >= 400 && status_code < 500) {
        g_requests_4xx.fetch_add(1, std::memory_order_relaxed);
    } else if (status_code >= 500) {
        g_requests_5xx.fetch_add(1, std::memory_order_relaxed);
    }
}

void Increment(AttachmentCounter counter, std::uint64_t amount) {
    Slot(counter).fetch_add(amount, std::memory_order_relaxed);
}

std::uint64_t CounterValue(AttachmentCounter counter) {
    return Slot(counter).load(std::memory_order_relaxed);
}

std::string RenderMetrics() {
    const auto load = [](const std::atomic<std::uint64_t>& value) {
        return value.load(std::memory_order_relaxed);
    };
    std::ostringstream out;
    WriteMetric(out, "up", "gauge", "1 if server is up", 1);
    WriteMetric(out, "http_requests_total", "counter", "Total HTTP requests processed",
                load(g_total_requests));
    WriteMetric(out, "http_requests_2xx", "counter", "Total 2xx responses", load(g_requests_2xx));
    WriteMetric(out, "http_requests_4xx", "counter", "Total 4xx responses", load(g_requests_4xx));
    WriteMetric(out, "http_requests_5xx", "counter", "Total 5xx responses", load(g_requests_5xx));
    WriteMetric(out, "http_request_latency_ms_sum", "counter",
                "Sum of request latencies in ms", load(g_latency_ms_total));
    WriteMetric(out, "attachments_ready_total", "counter", "Attachments that reached ready",
                load(g_uploads_ready));
    WriteMetric(out, "attachments_quarantined_total", "counter",
                "Attachments quarantined after failed reassembly", load(g_uploads_quarantined));
    WriteMetric(out, "attachment_integrity_failures_total", "counter",
                "Downloads rejected by checksum or authentication failure",
                load(g_integrity_failures));
    WriteMetric(out, "orphans_reaped_total", "counter", "Orphaned attachments reclaimed",
                load(g_orphans_reaped));
    return out.str();
}

}  // namespace attachvault::observability
