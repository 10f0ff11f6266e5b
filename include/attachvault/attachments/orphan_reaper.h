#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <thread>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include "attachvault/core/config.h"
#include "attachvault/metadata/metadata_store.h"
#include "attachvault/storage/storage_backend.h"

namespace attachvault::attachments {

/// @brief Periodically reclaims attachments that were never linked to a comment.
///
/// A candidate's row is removed by a conditional delete first; its objects are
/// only touched once that delete wins, so an attachment linked mid-sweep keeps
/// both its row and its bytes.
///
/// Sweeps run on the reaper's own io_context and thread so that blocking
/// database and storage calls never occupy the HTTP io threads.
class OrphanReaper {
public:
    OrphanReaper(core::AttachmentsConfig config,
                 std::shared_ptr<metadata::AttachmentStore> store,
                 std::shared_ptr<storage::StorageBackend> storage);
    ~OrphanReaper();

    OrphanReaper(const OrphanReaper&) = delete;
    OrphanReaper& operator=(const OrphanReaper&) = delete;

    /// @brief Start the sweep thread; sweeps run every reaper_interval_seconds.
    void Start();
    /// @brief Cancel the timer and join the sweep thread. Safe to call more than once.
    void Stop();
    bool Running() const { return running_; }

    /// @brief Run one sweep now. Returns the number of attachments reclaimed.
    int SweepOnce();

private:
    void ScheduleNext();

    core::AttachmentsConfig config_;
    std::shared_ptr<metadata::AttachmentStore> store_;
    std::shared_ptr<storage::StorageBackend> storage_;
    std::mutex sweep_mutex_;
    boost::asio::io_context ioc_;
    boost::asio::steady_timer timer_;
    std::thread thread_;
    std::atomic<bool> running_{false};
};

}  // namespace attachvault::attachments
