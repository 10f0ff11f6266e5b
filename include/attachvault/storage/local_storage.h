#pragma once

#include <filesystem>
#include <string>

#include "attachvault/storage/storage_backend.h"

namespace attachvault::storage {

/// @brief Local filesystem storage with atomic writes, rooted at one directory.
class LocalStorage : public StorageBackend {
public:
    explicit LocalStorage(const std::string& base_path);

    core::Result<void> Store(const std::string& key, const std::string& data) override;
    core::Result<std::string> Retrieve(const std::string& key) const override;
    core::Result<std::unique_ptr<ObjectReader>> Stream(const std::string& key,
                                                       std::size_t chunk_size) const override;
    core::Result<void> Delete(const std::string& key) override;
    core::Result<bool> Exists(const std::string& key) const override;
    core::Result<void> AppendChunk(const std::string& key, const std::string& data) override;

    const std::filesystem::path& root() const { return root_; }

    /// @brief Map a key to a path under the root, or kPathTraversal if it would escape.
    core::Result<std::filesystem::path> ResolvePath(const std::string& key) const;

private:
    void PruneEmptyParents(std::filesystem::path dir) const;

    std::filesystem::path root_;
    std::filesystem::path staging_;
};

}  // namespace attachvault::storage
