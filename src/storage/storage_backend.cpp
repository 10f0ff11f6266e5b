#include "attachvault/storage/storage_backend.h"

#include <sstream>

namespace attachvault::storage {

core::Result<void> ValidateStorageKey(const std::string& key) {
    if (key.empty() || key.size() > 1024) {
        return core::Fail(core::ErrorCode::kPathTraversal, "invalid storage key length");
    }
    if (key.front() == '/') {
        return core::Fail(core::ErrorCode::kPathTraversal, "absolute storage key: " + key);
    }
    for (char c : key) {
        if (c == '\\' || c == '\0') {
            return core::Fail(core::ErrorCode::kPathTraversal,
                              "illegal character in storage key: " + key);
        }
    }
    std::stringstream ss(key);
    std::string segment;
    while (std::getline(ss, segment, '/')) {
        // Reject instead of normalizing so "a/../b" never silently becomes "b".
        if (segment.empty() || segment == "." || segment == "..") {
            return core::Fail(core::ErrorCode::kPathTraversal,
                              "path traversal detected: " + key);
        }
    }
    if (key.back() == '/') {
        return core::Fail(core::ErrorCode::kPathTraversal, "storage key names a directory: " + key);
    }
    return core::Ok();
}

}  // namespace attachvault::storage
