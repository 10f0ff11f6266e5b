#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>

#include "attachvault/core/error.h"
#include "attachvault/core/result.h"

namespace attachvault::storage {

/// @brief Lazy, finite sequence of byte chunks read from one stored object.
class ObjectReader {
public:
    virtual ~ObjectReader() = default;

    /// @brief Next chunk, or std::nullopt once the object is exhausted.
    virtual core::Result<std::optional<std::string>> Next() = 0;
};

/// @brief Byte-addressable key/value object store.
///
/// Keys are relative '/'-separated paths. Every implementation rejects keys that
/// could escape its root with kPathTraversal. Independent keys never corrupt each
/// other, but there is no locking for concurrent writers to the same key: callers
/// serialize access to a given key themselves.
class StorageBackend {
public:
    virtual ~StorageBackend() = default;

    /// @brief Create or replace the object at key.
    virtual core::Result<void> Store(const std::string& key, const std::string& data) = 0;
    /// @brief Whole object contents; kNotFound if absent.
    virtual core::Result<std::string> Retrieve(const std::string& key) const = 0;
    /// @brief Reader yielding chunks of at most chunk_size bytes; kNotFound if absent.
    virtual core::Result<std::unique_ptr<ObjectReader>> Stream(const std::string& key,
                                                               std::size_t chunk_size) const = 0;
    /// @brief Remove the object. Deleting a missing key succeeds.
    virtual core::Result<void> Delete(const std::string& key) = 0;
    virtual core::Result<bool> Exists(const std::string& key) const = 0;
    /// @brief Append to the object at key, creating it when missing.
    virtual core::Result<void> AppendChunk(const std::string& key, const std::string& data) = 0;
};

/// @brief Reject keys that are empty, absolute, contain '\\' or NUL, or have '.'/'..' segments.
core::Result<void> ValidateStorageKey(const std::string& key);

}  // namespace attachvault::storage
