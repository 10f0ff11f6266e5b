#pragma once

#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "attachvault/storage/storage_backend.h"

namespace attachvault::storage {

/// @brief In-process storage backend for tests and ephemeral deployments.
class MemoryStorage : public StorageBackend {
public:
    core::Result<void> Store(const std::string& key, const std::string& data) override;
    core::Result<std::string> Retrieve(const std::string& key) const override;
    core::Result<std::unique_ptr<ObjectReader>> Stream(const std::string& key,
                                                       std::size_t chunk_size) const override;
    core::Result<void> Delete(const std::string& key) override;
    core::Result<bool> Exists(const std::string& key) const override;
    core::Result<void> AppendChunk(const std::string& key, const std::string& data) override;

    /// @brief Keys currently stored that start with prefix, in sorted order.
    std::vector<std::string> ListKeys(const std::string& prefix = "") const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::string> objects_;
};

}  // namespace attachvault::storage
