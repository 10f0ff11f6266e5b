#include "attachvault/validation/file_validator.h"

#include <cctype>
#include <iomanip>
#include <map>
#include <sstream>
#include <stdexcept>
#include <utility>

#include "attachvault/core/logger.h"

namespace attachvault::validation {

namespace {

struct Signature {
    std::size_t offset;
    std::string bytes;
};

const std::map<std::string, ContentCategory>& Categories() {
    static const std::map<std::string, ContentCategory> categories = {
        {"image/jpeg", ContentCategory::kImage},
        {"image/png", ContentCategory::kImage},
        {"image/webp", ContentCategory::kImage},
        {"image/gif", ContentCategory::kImage},
        {"video/mp4", ContentCategory::kVideo},
        {"video/webm", ContentCategory::kVideo},
        {"video/quicktime", ContentCategory::kVideo},
        {"audio/mpeg", ContentCategory::kAudio},
        {"audio/wav", ContentCategory::kAudio},
        {"audio/ogg", ContentCategory::kAudio},
        {"application/pdf", ContentCategory::kDocument},
    };
    return categories;
}

// Any single matching entry accepts the payload.
const std::map<std::string, std::vector<Signature>>& Signatures() {
    static const std::map<std::string, std::vector<Signature>> signatures = {
        {"image/jpeg", {{0, std::string("\xFF\xD8\xFF", 3)}}},
        {"image/png", {{0, std::string("\x89PNG\r\n\x1A\n", 8)}}},
        {"image/webp", {{0, "RIFF"}, {8, "WEBP"}}},
        {"image/gif", {{0, "GIF87a"}, {0, "GIF89a"}}},
        {"video/mp4", {{4, "ftyp"}}},
        {"video/webm", {{0, std::string("\x1A\x45\xDF\xA3", 4)}}},
        {"video/quicktime", {{4, "ftyp"}}},
        {"audio/mpeg",
         {{0, std::string("\xFF\xFB", 2)},
          {0, std::string("\xFF\xF3", 2)},
          {0, std::string("\xFF\xF2", 2)},
          {0, "ID3"}}},
        {"audio/wav", {{0, "RIFF"}, {8, "WAVE"}}},
        {"audio/ogg", {{0, "OggS"}}},
        {"application/pdf", {{0, "%PDF"}}},
    };
    return signatures;
}

std::string HexPrefix(const std::string& data, std::size_t max_bytes) {
    std::ostringstream out;
    for (std::size_t i = 0; i < data.size() && i < max_bytes; ++i) {
        out << std::hex << std::setw(2) << std::setfill('0')
            << static_cast<int>(static_cast<unsigned char>(data[i]));
    }
    return out.str();
}

std::string FormatMegabytes(double bytes, int precision) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(precision) << bytes / (1024.0 * 1024.0) << "MB";
    return out.str();
}

bool IsKeptFilenameChar(unsigned char c) {
    return std::isalnum(c) || c == '-' || c == '.';
}

}  // namespace

const char* CategoryName(ContentCategory category) {
    switch (category) {
        case ContentCategory::kImage:
            return "image";
        case ContentCategory::kVideo:
            return "video";
        case ContentCategory::kAudio:
            return "audio";
        case ContentCategory::kDocument:
            return "document";
    }
    return "unknown";
}

FileValidator::FileValidator() : FileValidator(core::SizeLimitsConfig{}, {}) {}

FileValidator::FileValidator(const core::SizeLimitsConfig& limits,
                             const std::vector<std::string>& allowed_content_types)
    : limits_(limits) {
    if (allowed_content_types.empty()) {
        for (const auto& entry : Categories()) {
            allowed_.insert(entry.first);
        }
        return;
    }
    for (const auto& type : allowed_content_types) {
        if (!CategoryOf(type)) {
            throw std::invalid_argument("allowed content type has no known category: " + type);
        }
        allowed_.insert(type);
    }
}

bool FileValidator::ValidateContentType(const std::string& content_type) const {
    return allowed_.count(content_type) > 0;
}

bool FileValidator::ValidateMagicBytes(const std::string& data, const std::string& claimed_type) {
    const auto& signatures = Signatures();
    auto it = signatures.find(claimed_type);
    if (it == signatures.end()) {
        core::LogWarning("No magic signature defined for " + claimed_type);
        return false;
    }
    for (const auto& signature : it->second) {
        if (data.size() < signature.offset + signature.bytes.size()) {
            continue;
        }
        if (data.compare(signature.offset, signature.bytes.size(), signature.bytes) == 0) {
            return true;
        }
    }
    core::LogWarning("Magic byte mismatch: claimed " + claimed_type + ", header bytes: " +
                     HexPrefix(data, 16));
    return false;
}

SizeCheck FileValidator::ValidateFileSize(std::uint64_t size,
                                          const std::string& content_type) const {
    auto category = CategoryOf(content_type);
    if (!category) {
        return SizeCheck{false, "Unknown content type: " + content_type};
    }
    const auto limit = LimitFor(*category);
    if (size > limit) {
        return SizeCheck{false, "File size " + FormatMegabytes(static_cast<double>(size), 1) +
                                    " exceeds " + CategoryName(*category) + " limit of " +
                                    FormatMegabytes(static_cast<double>(limit), 0)};
    }
    return SizeCheck{true, ""};
}

std::string FileValidator::SanitizeFilename(const std::string& filename) {
    // Drop directory components from either separator style.
    std::string name = filename;
    const auto slash = name.find_last_of("/\\");
    if (slash != std::string::npos) {
        name = name.substr(slash + 1);
    }

    std::string cleaned;
    cleaned.reserve(name.size());
    for (char ch : name) {
        const auto c = static_cast<unsigned char>(ch);
        const char mapped = IsKeptFilenameChar(c) ? ch : '_';
        if (mapped == '_' && !cleaned.empty() && cleaned.back() == '_') {
            continue;
        }
        cleaned.push_back(mapped);
    }

    const auto first = cleaned.find_first_not_of('.');
    cleaned = first == std::string::npos ? std::string() : cleaned.substr(first);

    if (cleaned.size() > kMaxFilenameBytes) {
        const auto dot = cleaned.rfind('.');
        const std::string ext = dot == std::string::npos ? std::string() : cleaned.substr(dot);
        if (ext.size() < kMaxFilenameBytes) {
            cleaned = cleaned.substr(0, kMaxFilenameBytes - ext.size()) + ext;
        } else {
            cleaned.resize(kMaxFilenameBytes);
        }
    }

    if (cleaned.empty()) {
        cleaned = kDefaultFilename;
    }
    return cleaned;
}

UploadCheck FileValidator::ValidateUpload(const std::string& data, const std::string& claimed_type,
                                          const std::string& filename) const {
    if (!ValidateContentType(claimed_type)) {
        return UploadCheck{false, "Content type not allowed: " + claimed_type, ""};
    }
    auto size = ValidateFileSize(data.size(), claimed_type);
    if (!size.ok) {
        return UploadCheck{false, size.reason, ""};
    }
    if (!ValidateMagicBytes(data, claimed_type)) {
        return UploadCheck{false, "File content does not match claimed content type", ""};
    }
    return UploadCheck{true, "", SanitizeFilename(filename)};
}

std::optional<ContentCategory> FileValidator::CategoryOf(const std::string& content_type) {
    const auto& categories = Categories();
    auto it = categories.find(content_type);
    if (it == categories.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::uint64_t FileValidator::LimitFor(ContentCategory category) const {
    switch (category) {
        case ContentCategory::kImage:
            return limits_.image;
        case ContentCategory::kVideo:
            return limits_.video;
        case ContentCategory::kAudio:
            return limits_.audio;
        case ContentCategory::kDocument:
            return limits_.document;
    }
    return 0;
}

}  // namespace attachvault::validation
