#include "attachvault/attachments/orphan_reaper.h"

#include <utility>

#include <boost/asio/post.hpp>

#include "attachvault/attachments/attachment_lifecycle.h"
#include "attachvault/attachments/storage_keys.h"
#include "attachvault/core/logger.h"
#include "attachvault/core/time.h"
#include "attachvault/observability/metrics.h"

namespace attachvault::attachments {

OrphanReaper::OrphanReaper(core::AttachmentsConfig config,
                           std::shared_ptr<metadata::AttachmentStore> store,
                           std::shared_ptr<storage::StorageBackend> storage)
    : config_(std::move(config)),
      store_(std::move(store)),
      storage_(std::move(storage)),
      timer_(ioc_) {}

OrphanReaper::~OrphanReaper() {
    Stop();
}

void OrphanReaper::Start() {
    if (running_.exchange(true)) {
        return;
    }
    core::LogInfo("Orphan reaper started (interval=" +
                  std::to_string(config_.reaper_interval_seconds) +
                  "s, ttl=" + std::to_string(config_.orphan_ttl_minutes) + "m)");
    ioc_.restart();
    ScheduleNext();
    thread_ = std::thread([this]() { ioc_.run(); });
}

void OrphanReaper::Stop() {
    running_ = false;
    if (!thread_.joinable()) {
        return;
    }
    boost::asio::post(ioc_, [this]() { timer_.cancel(); });
    thread_.join();
    core::LogInfo("Orphan reaper stopped");
}

void OrphanReaper::ScheduleNext() {
    if (!running_) {
        return;
    }
    timer_.expires_after(std::chrono::seconds(config_.reaper_interval_seconds));
    timer_.async_wait([this](const boost::system::error_code& ec) {
        if (ec || !running_) {
            return;
        }
        SweepOnce();
        ScheduleNext();
    });
}

int OrphanReaper::SweepOnce() {
    std::lock_guard<std::mutex> lock(sweep_mutex_);
    const auto cutoff =
        core::Iso8601FromNow(-std::chrono::minutes(config_.orphan_ttl_minutes));

    auto candidates = store_->ListOrphanCandidates(cutoff, config_.max_orphans_per_sweep);
    if (!candidates.ok()) {
        core::LogError("Orphan sweep failed to list candidates: " +
                       candidates.error().message);
        return 0;
    }

    int reaped = 0;
    for (const auto& attachment : candidates.value()) {
        if (!IsOrphanCandidate(attachment, cutoff)) {
            core::LogWarning("Orphan sweep skipped non-candidate " + attachment.id);
            continue;
        }
        auto deleted = store_->DeleteOrphan(attachment.id, cutoff);
        if (!deleted.ok()) {
            core::LogError("Orphan sweep failed to delete " + attachment.id + ": " +
                           deleted.error().message);
            continue;
        }
        if (!deleted.value()) {
            // Linked or otherwise changed since it was listed.
            continue;
        }
        for (const auto& key : OwnedStorageKeys(attachment)) {
            auto removed = storage_->Delete(key);
            if (!removed.ok()) {
                core::LogWarning("Orphan sweep failed to delete object " + key + ": " +
                                 removed.error().message);
            }
        }
        ++reaped;
        core::LogDebug("Reaped orphaned attachment " + attachment.id + " (status=" +
                       metadata::ToString(attachment.status) + ")");
    }

    if (reaped > 0) {
        observability::Increment(observability::AttachmentCounter::kOrphansReaped,
                                 static_cast<std::uint64_t>(reaped));
        core::LogInfo("Orphan sweep reclaimed " + std::to_string(reaped) + " attachment(s)");
    }
    return reaped;
}

}  // namespace attachvault::attachments
