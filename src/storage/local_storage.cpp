#include "attachvault/storage/local_storage.h"

#include <fstream>
#include <iterator>

#include <Poco/UUIDGenerator.h>

#include "attachvault/core/logger.h"

#ifdef _WIN32
#include <windows.h>
#else
#include <fcntl.h>
#include <unistd.h>
#endif

namespace attachvault::storage {

namespace {

constexpr const char* kStagingDir = ".staging";

class FileObjectReader : public ObjectReader {
public:
    FileObjectReader(const std::filesystem::path& path, std::size_t chunk_size)
        : in_(path, std::ios::binary), chunk_size_(chunk_size == 0 ? 8192 : chunk_size) {}

    bool is_open() const { return in_.is_open(); }

    core::Result<std::optional<std::string>> Next() override {
        if (!in_) {
            return std::optional<std::string>{};
        }
        std::string chunk(chunk_size_, '\0');
        in_.read(&chunk[0], static_cast<std::streamsize>(chunk.size()));
        const auto bytes = in_.gcount();
        if (in_.bad()) {
            return core::Fail(core::ErrorCode::kIoError, "failed to read object");
        }
        if (bytes <= 0) {
            return std::optional<std::string>{};
        }
        chunk.resize(static_cast<std::size_t>(bytes));
        return std::optional<std::string>{std::move(chunk)};
    }

private:
    std::ifstream in_;
    std::size_t chunk_size_;
};

bool IsWithin(const std::filesystem::path& root, const std::filesystem::path& candidate) {
    auto root_it = root.begin();
    auto cand_it = candidate.begin();
    for (; root_it != root.end(); ++root_it, ++cand_it) {
        // A trailing empty element appears when root ends with a separator.
        if (root_it->empty()) {
            continue;
        }
        if (cand_it == candidate.end() || *root_it != *cand_it) {
            return false;
        }
    }
    return true;
}

}  // namespace

LocalStorage::LocalStorage(const std::string& base_path) {
    std::filesystem::create_directories(base_path);
    root_ = std::filesystem::weakly_canonical(std::filesystem::absolute(base_path));
    staging_ = root_ / kStagingDir;
    std::filesystem::create_directories(staging_);
    core::LogInfo("LocalStorage initialized at " + root_.string());
}

core::Result<std::filesystem::path> LocalStorage::ResolvePath(const std::string& key) const {
    auto valid = ValidateStorageKey(key);
    if (!valid.ok()) {
        return valid.error();
    }
    if (key.rfind(std::string(kStagingDir) + "/", 0) == 0) {
        return core::Fail(core::ErrorCode::kPathTraversal, "reserved storage prefix: " + key);
    }
    std::error_code ec;
    const auto resolved = std::filesystem::weakly_canonical(root_ / key, ec);
    if (ec) {
        return core::Fail(core::ErrorCode::kIoError, "failed to resolve key: " + ec.message());
    }
    // Symlinks inside the root could still point elsewhere.
    if (!IsWithin(root_, resolved) || resolved == root_) {
        return core::Fail(core::ErrorCode::kPathTraversal, "path traversal detected: " + key);
    }
    return resolved;
}

core::Result<void> LocalStorage::Store(const std::string& key, const std::string& data) {
    auto resolved = ResolvePath(key);
    if (!resolved.ok()) {
        return resolved.error();
    }
    const auto& final_path = resolved.value();

    // Write to a staging file first, then atomically rename into place.
    const auto temp_path =
        (staging_ / Poco::UUIDGenerator().createOne().toString()).string();

#ifdef _WIN32
    {
        std::ofstream out(temp_path, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            return core::Fail(core::ErrorCode::kIoError, "failed to open temp file");
        }
        out.write(data.data(), static_cast<std::streamsize>(data.size()));
        out.flush();
        if (!out) {
            std::filesystem::remove(temp_path);
            return core::Fail(core::ErrorCode::kIoError, "failed to write temp file");
        }
    }
#else
    const int fd = ::open(temp_path.c_str(), O_CREAT | O_WRONLY | O_TRUNC, 0600);
    if (fd < 0) {
        return core::Fail(core::ErrorCode::kIoError, "failed to open temp file");
    }
    std::size_t offset = 0;
    while (offset < data.size()) {
        const ssize_t written = ::write(fd, data.data() + offset, data.size() - offset);
        if (written < 0) {
            ::close(fd);
            std::error_code ignored;
            std::filesystem::remove(temp_path, ignored);
            return core::Fail(core::ErrorCode::kIoError, "failed to write temp file");
        }
        offset += static_cast<std::size_t>(written);
    }
    ::fsync(fd);
    ::close(fd);
#endif

    std::error_code ec;
    std::filesystem::create_directories(final_path.parent_path(), ec);
    if (ec) {
        std::filesystem::remove(temp_path, ec);
        return core::Fail(core::ErrorCode::kIoError, "failed to create object directory");
    }
    std::filesystem::rename(temp_path, final_path, ec);
    if (ec) {
        const auto message = "failed to move object into place: " + ec.message();
        std::filesystem::remove(temp_path, ec);
        return core::Fail(core::ErrorCode::kIoError, message);
    }
    core::LogDebug("Stored " + std::to_string(data.size()) + " bytes at " + key);
    return core::Ok();
}

core::Result<std::string> LocalStorage::Retrieve(const std::string& key) const {
    auto resolved = ResolvePath(key);
    if (!resolved.ok()) {
        return resolved.error();
    }
    std::error_code ec;
    if (!std::filesystem::is_regular_file(resolved.value(), ec)) {
        return core::Fail(core::ErrorCode::kNotFound, "object not found: " + key);
    }
    std::ifstream in(resolved.value(), std::ios::binary);
    if (!in.is_open()) {
        return core::Fail(core::ErrorCode::kIoError, "failed to open object: " + key);
    }
    std::string data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        return core::Fail(core::ErrorCode::kIoError, "failed to read object: " + key);
    }
    return data;
}

core::Result<std::unique_ptr<ObjectReader>> LocalStorage::Stream(const std::string& key,
                                                                 std::size_t chunk_size) const {
    auto resolved = ResolvePath(key);
    if (!resolved.ok()) {
        return resolved.error();
    }
    std::error_code ec;
    if (!std::filesystem::is_regular_file(resolved.value(), ec)) {
        return core::Fail(core::ErrorCode::kNotFound, "object not found: " + key);
    }
    auto reader = std::make_unique<FileObjectReader>(resolved.value(), chunk_size);
    if (!reader->is_open()) {
        return core::Fail(core::ErrorCode::kIoError, "failed to open object: " + key);
    }
    return std::unique_ptr<ObjectReader>(std::move(reader));
}

core::Result<void> LocalStorage::Delete(const std::string& key) {
    auto resolved = ResolvePath(key);
    if (!resolved.ok()) {
        return resolved.error();
    }
    std::error_code ec;
    const bool removed = std::filesystem::remove(resolved.value(), ec);
    if (ec) {
        return core::Fail(core::ErrorCode::kIoError, "failed to delete " + key + ": " + ec.message());
    }
    if (removed) {
        core::LogDebug("Deleted " + key);
        PruneEmptyParents(resolved.value().parent_path());
    }
    return core::Ok();
}

core::Result<bool> LocalStorage::Exists(const std::string& key) const {
    auto resolved = ResolvePath(key);
    if (!resolved.ok()) {
        return resolved.error();
    }
    std::error_code ec;
    return std::filesystem::is_regular_file(resolved.value(), ec);
}

core::Result<void> LocalStorage::AppendChunk(const std::string& key, const std::string& data) {
    auto resolved = ResolvePath(key);
    if (!resolved.ok()) {
        return resolved.error();
    }
    std::error_code ec;
    std::filesystem::create_directories(resolved.value().parent_path(), ec);
    if (ec) {
        return core::Fail(core::ErrorCode::kIoError, "failed to create object directory");
    }
    std::ofstream out(resolved.value(), std::ios::binary | std::ios::app);
    if (!out.is_open()) {
        return core::Fail(core::ErrorCode::kIoError, "failed to open object: " + key);
    }
    out.write(data.data(), static_cast<std::streamsize>(data.size()));
    out.flush();
    if (!out) {
        return core::Fail(core::ErrorCode::kIoError, "failed to append to object: " + key);
    }
    return core::Ok();
}

void LocalStorage::PruneEmptyParents(std::filesystem::path dir) const {
    std::error_code ec;
    while (dir != root_ && IsWithin(root_, dir)) {
        // remove() only succeeds on empty directories.
        if (!std::filesystem::remove(dir, ec) || ec) {
            return;
        }
        dir = dir.parent_path();
    }
}

}  // namespace attachvault::storage
