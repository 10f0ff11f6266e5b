#include "attachvault/attachments/storage_keys.h"

#include <cstddef>
#include <iomanip>
#include <sstream>

namespace attachvault::attachments {

namespace {

// NAME_MAX on common filesystems.
constexpr std::size_t kMaxSegmentBytes = 255;
// ".chunk_" plus the widest int index.
constexpr std::size_t kChunkSuffixReserve = 17;

/// @brief Truncate so that the segment plus any chunk suffix stays within kMaxSegmentBytes.
std::string BoundedSegment(const std::string& filename) {
    constexpr std::size_t limit = kMaxSegmentBytes - kChunkSuffixReserve;
    if (filename.size() <= limit) {
        return filename;
    }
    const auto dot = filename.rfind('.');
    const std::string ext = dot == std::string::npos ? std::string() : filename.substr(dot);
    if (ext.size() >= limit) {
        return filename.substr(0, limit);
    }
    return filename.substr(0, limit - ext.size()) + ext;
}

}  // namespace

std::string BuildStorageKey(const std::string& attachment_id, const std::string& filename) {
    return "attachments/" + attachment_id.substr(0, 2) + "/" + attachment_id.substr(2, 2) + "/" +
           attachment_id + "/" + BoundedSegment(filename);
}

std::string ChunkKey(const std::string& storage_key, int index) {
    std::ostringstream out;
    out << storage_key << ".chunk_" << std::setw(6) << std::setfill('0') << index;
    return out.str();
}

std::vector<std::string> ChunkKeys(const metadata::Attachment& attachment) {
    std::vector<std::string> keys;
    for (int i = 0; i < attachment.total_chunks; ++i) {
        keys.push_back(ChunkKey(attachment.storage_key, i));
    }
    return keys;
}

std::vector<std::string> OwnedStorageKeys(const metadata::Attachment& attachment) {
    std::vector<std::string> keys{attachment.storage_key};
    auto chunks = ChunkKeys(attachment);
    keys.insert(keys.end(), chunks.begin(), chunks.end());
    if (attachment.thumbnail_storage_key) {
        keys.push_back(*attachment.thumbnail_storage_key);
    }
    return keys;
}

}  // namespace attachvault::attachments
