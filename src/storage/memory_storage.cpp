#include "attachvault/storage/memory_storage.h"

#include <algorithm>

namespace attachvault::storage {

namespace {

// Snapshot-based reader: the object may be replaced while a stream is open.
class StringObjectReader : public ObjectReader {
public:
    StringObjectReader(std::string data, std::size_t chunk_size)
        : data_(std::move(data)), chunk_size_(chunk_size == 0 ? 8192 : chunk_size) {}

    core::Result<std::optional<std::string>> Next() override {
        if (offset_ >= data_.size()) {
            return std::optional<std::string>{};
        }
        const auto length = std::min(chunk_size_, data_.size() - offset_);
        std::optional<std::string> chunk = data_.substr(offset_, length);
        offset_ += length;
        return chunk;
    }

private:
    std::string data_;
    std::size_t chunk_size_;
    std::size_t offset_{0};
};

}  // namespace

core::Result<void> MemoryStorage::Store(const std::string& key, const std::string& data) {
    auto valid = ValidateStorageKey(key);
    if (!valid.ok()) {
        return valid;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    objects_[key] = data;
    return core::Ok();
}

core::Result<std::string> MemoryStorage::Retrieve(const std::string& key) const {
    auto valid = ValidateStorageKey(key);
    if (!valid.ok()) {
        return valid.error();
    }
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = objects_.find(key);
    if (it == objects_.end()) {
        return core::Fail(core::ErrorCode::kNotFound, "object not found: " + key);
    }
    return it->second;
}

core::Result<std::unique_ptr<ObjectReader>> MemoryStorage::Stream(const std::string& key,
                                                                  std::size_t chunk_size) const {
    auto data = Retrieve(key);
    if (!data.ok()) {
        return data.error();
    }
    return std::unique_ptr<ObjectReader>(
        std::make_unique<StringObjectReader>(std::move(data.value()), chunk_size));
}

core::Result<void> MemoryStorage::Delete(const std::string& key) {
    auto valid = ValidateStorageKey(key);
    if (!valid.ok()) {
        return valid;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    objects_.erase(key);
    return core::Ok();
}

core::Result<bool> MemoryStorage::Exists(const std::string& key) const {
    auto valid = ValidateStorageKey(key);
    if (!valid.ok()) {
        return valid.error();
    }
    std::lock_guard<std::mutex> lock(mutex_);
    return objects_.count(key) > 0;
}

core::Result<void> MemoryStorage::AppendChunk(const std::string& key, const std::string& data) {
    auto valid = ValidateStorageKey(key);
    if (!valid.ok()) {
        return valid;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    objects_[key] += data;
    return core::Ok();
}

std::vector<std::string> MemoryStorage::ListKeys(const std::string& prefix) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> keys;
    for (auto it = objects_.lower_bound(prefix); it != objects_.end(); ++it) {
        if (it->first.compare(0, prefix.size(), prefix) != 0) {
            break;
        }
        keys.push_back(it->first);
    }
    return keys;
}

}  // namespace attachvault::storage
