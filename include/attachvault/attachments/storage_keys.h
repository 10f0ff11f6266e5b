#pragma once

#include <string>
#include <vector>

#include "attachvault/metadata/attachment.h"

namespace attachvault::attachments {

/// @brief attachments/{id[0:2]}/{id[2:4]}/{id}/{filename}; filename must already be sanitized.
///
/// Long names are shortened in the key (extension kept) so that chunk keys
/// derived from it still fit one path segment. The stored filename is unchanged.
std::string BuildStorageKey(const std::string& attachment_id, const std::string& filename);
/// @brief {storage_key}.chunk_{index:06d}
std::string ChunkKey(const std::string& storage_key, int index);
/// @brief Chunk keys 0..total_chunks-1 of an attachment.
std::vector<std::string> ChunkKeys(const metadata::Attachment& attachment);
/// @brief Every object an attachment may own: primary, chunks and thumbnail.
std::vector<std::string> OwnedStorageKeys(const metadata::Attachment& attachment);

}  // namespace attachvault::attachments
