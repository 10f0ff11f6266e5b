#pragma once

#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "attachvault/core/config.h"

namespace attachvault::validation {

enum class ContentCategory { kImage, kVideo, kAudio, kDocument };

const char* CategoryName(ContentCategory category);

/// @brief Outcome of a size check; reason is empty when ok.
struct SizeCheck {
    bool ok{false};
    std::string reason;
};

/// @brief Outcome of the full upload pipeline.
struct UploadCheck {
    bool ok{false};
    std::string error;
    std::string sanitized_filename;
};

/// @brief Content-type allowlist, magic-byte signatures, size ceilings and filename hygiene.
class FileValidator {
public:
    static constexpr std::size_t kMaxFilenameBytes = 255;
    static constexpr const char* kDefaultFilename = "unnamed_file";

    /// @brief Default ceilings and every content type with a known category.
    FileValidator();
    /// @brief Custom ceilings and allowlist. An empty allowlist means every known type.
    /// @throws std::invalid_argument if the allowlist names a type with no category.
    FileValidator(const core::SizeLimitsConfig& limits,
                  const std::vector<std::string>& allowed_content_types);

    bool ValidateContentType(const std::string& content_type) const;

    /// @brief True only if data carries a known signature for claimed_type.
    /// Types without a signature entry never validate.
    static bool ValidateMagicBytes(const std::string& data, const std::string& claimed_type);

    SizeCheck ValidateFileSize(std::uint64_t size, const std::string& content_type) const;

    static std::string SanitizeFilename(const std::string& filename);

    /// @brief Allowlist, then size, then magic bytes, then filename sanitization;
    /// stops at the first failure.
    UploadCheck ValidateUpload(const std::string& data, const std::string& claimed_type,
                               const std::string& filename) const;

    static std::optional<ContentCategory> CategoryOf(const std::string& content_type);
    std::uint64_t LimitFor(ContentCategory category) const;

private:
    core::SizeLimitsConfig limits_;
    std::set<std::string> allowed_;
};

}  // namespace attachvault::validation
