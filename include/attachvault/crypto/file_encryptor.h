#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

#include "attachvault/core/result.h"

namespace attachvault::crypto {

/// @brief Plaintext of one chunk together with the index embedded in its envelope.
struct DecryptedChunk {
    std::uint32_t index{0};
    std::string data;
};

/// @brief Zeroes a raw DEK buffer when it leaves scope.
class ScopedKeyWipe {
public:
    explicit ScopedKeyWipe(std::string& key) : key_(key) {}
    ~ScopedKeyWipe();

    ScopedKeyWipe(const ScopedKeyWipe&) = delete;
    ScopedKeyWipe& operator=(const ScopedKeyWipe&) = delete;

private:
    std::string& key_;
};

/// @brief Envelope encryption for attachment bodies.
///
/// Every file gets its own random 256-bit data encryption key (DEK). Bodies and
/// chunks are sealed with AES-256-GCM under the DEK; the DEK itself is wrapped
/// with AES-256 key wrap (RFC 3394) under the long-lived master key, so the master
/// key only ever touches 32-byte inputs.
///
/// Wire formats:
///   file  = nonce(12) || ciphertext || tag(16)
///   chunk = index(4, little-endian) || nonce(12) || ciphertext || tag(16)
class FileEncryptor {
public:
    static constexpr std::size_t kKeySize = 32;
    static constexpr std::size_t kNonceSize = 12;
    static constexpr std::size_t kTagSize = 16;
    static constexpr std::size_t kChunkIndexSize = 4;

    /// @brief Derive the 256-bit master key as SHA-256 of the configured key material.
    explicit FileEncryptor(const std::string& master_key_material);
    ~FileEncryptor();

    FileEncryptor(const FileEncryptor&) = delete;
    FileEncryptor& operator=(const FileEncryptor&) = delete;

    /// @brief Fresh random DEK (32 raw bytes).
    static core::Result<std::string> GenerateFileKey();

    /// @brief Wrap a DEK under the master key; result is base64 text safe to persist.
    core::Result<std::string> WrapKey(const std::string& file_key) const;
    /// @brief Recover the raw DEK; kIntegrity when the wrapped form was altered or
    /// produced under another master key.
    core::Result<std::string> UnwrapKey(const std::string& wrapped_key) const;

    static core::Result<std::string> EncryptFile(const std::string& data,
                                                 const std::string& file_key);
    /// @brief kIntegrity if the tag does not verify or the input is truncated.
    static core::Result<std::string> DecryptFile(const std::string& encrypted,
                                                 const std::string& file_key);

    static core::Result<std::string> EncryptChunk(const std::string& data,
                                                  const std::string& file_key,
                                                  std::uint32_t chunk_index);
    /// @brief Decrypts one chunk. The embedded index is returned as-is; callers must
    /// compare it with the position they expected.
    static core::Result<DecryptedChunk> DecryptChunk(const std::string& encrypted,
                                                     const std::string& file_key);

private:
    std::array<unsigned char, kKeySize> master_key_{};
};

}  // namespace attachvault::crypto
