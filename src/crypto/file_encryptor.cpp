#include "attachvault/crypto/file_encryptor.h"

#include <algorithm>
#include <memory>
#include <sstream>

#include <Poco/Base64Decoder.h>
#include <Poco/Base64Encoder.h>
#include <Poco/Exception.h>
#include <Poco/SHA2Engine.h>

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/rand.h>

namespace attachvault::crypto {

namespace {

using CipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)>;

// EVP update calls take int lengths; feed large buffers in slices.
constexpr std::size_t kMaxUpdateSlice = 1U << 30;
// RFC 3394 adds one 64-bit integrity block to the wrapped key.
constexpr std::size_t kWrapOverhead = 8;

CipherCtxPtr NewContext() {
    return CipherCtxPtr(EVP_CIPHER_CTX_new(), EVP_CIPHER_CTX_free);
}

const unsigned char* Bytes(const std::string& value) {
    return reinterpret_cast<const unsigned char*>(value.data());
}

unsigned char* MutableBytes(std::string& value) {
    return reinterpret_cast<unsigned char*>(&value[0]);
}

core::Result<void> CheckFileKey(const std::string& file_key) {
    if (file_key.size() != FileEncryptor::kKeySize) {
        return core::Fail(core::ErrorCode::kInvalidArgument,
                          "file key must be " + std::to_string(FileEncryptor::kKeySize) +
                              " bytes");
    }
    return core::Ok();
}

core::Result<std::string> RandomBytes(std::size_t size) {
    std::string out(size, '\0');
    if (RAND_bytes(MutableBytes(out), static_cast<int>(size)) != 1) {
        return core::Fail(core::ErrorCode::kInternal, "random generator failure");
    }
    return out;
}

/// Seal plaintext into nonce || ciphertext || tag.
core::Result<std::string> SealGcm(const std::string& data, const std::string& file_key) {
    auto nonce = RandomBytes(FileEncryptor::kNonceSize);
    if (!nonce.ok()) {
        return nonce.error();
    }

    auto ctx = NewContext();
    if (!ctx ||
        EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN,
                            static_cast<int>(FileEncryptor::kNonceSize), nullptr) != 1 ||
        EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, Bytes(file_key),
                           Bytes(nonce.value())) != 1) {
        return core::Fail(core::ErrorCode::kInternal, "AES-GCM init failed");
    }

    std::string out = nonce.value();
    out.resize(FileEncryptor::kNonceSize + data.size() + FileEncryptor::kTagSize);
    std::size_t written = FileEncryptor::kNonceSize;
    std::size_t offset = 0;
    while (offset < data.size()) {
        const auto slice = std::min(kMaxUpdateSlice, data.size() - offset);
        int out_len = 0;
        if (EVP_EncryptUpdate(ctx.get(), MutableBytes(out) + written, &out_len,
                              Bytes(data) + offset, static_cast<int>(slice)) != 1) {
            return core::Fail(core::ErrorCode::kInternal, "AES-GCM encrypt failed");
        }
        written += static_cast<std::size_t>(out_len);
        offset += slice;
    }
    int final_len = 0;
    if (EVP_EncryptFinal_ex(ctx.get(), MutableBytes(out) + written, &final_len) != 1) {
        return core::Fail(core::ErrorCode::kInternal, "AES-GCM finalize failed");
    }
    written += static_cast<std::size_t>(final_len);
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG,
                            static_cast<int>(FileEncryptor::kTagSize),
                            MutableBytes(out) + written) != 1) {
        return core::Fail(core::ErrorCode::kInternal, "AES-GCM tag extraction failed");
    }
    out.resize(written + FileEncryptor::kTagSize);
    return out;
}

/// Open nonce || ciphertext || tag starting at offset within sealed.
core::Result<std::string> OpenGcm(const std::string& sealed, std::size_t offset,
                                  const std::string& file_key) {
    if (sealed.size() < offset + FileEncryptor::kNonceSize + FileEncryptor::kTagSize) {
        return core::Fail(core::ErrorCode::kIntegrity, "ciphertext truncated");
    }
    const unsigned char* nonce = Bytes(sealed) + offset;
    const unsigned char* body = nonce + FileEncryptor::kNonceSize;
    const std::size_t body_size =
        sealed.size() - offset - FileEncryptor::kNonceSize - FileEncryptor::kTagSize;
    std::string tag = sealed.substr(sealed.size() - FileEncryptor::kTagSize);

    auto ctx = NewContext();
    if (!ctx ||
        EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN,
                            static_cast<int>(FileEncryptor::kNonceSize), nullptr) != 1 ||
        EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, Bytes(file_key), nonce) != 1) {
        return core::Fail(core::ErrorCode::kInternal, "AES-GCM init failed");
    }

    std::string out(body_size, '\0');
    std::size_t written = 0;
    std::size_t consumed = 0;
    while (consumed < body_size) {
        const auto slice = std::min(kMaxUpdateSlice, body_size - consumed);
        int out_len = 0;
        if (EVP_DecryptUpdate(ctx.get(), MutableBytes(out) + written, &out_len, body + consumed,
                              static_cast<int>(slice)) != 1) {
            return core::Fail(core::ErrorCode::kIntegrity, "AES-GCM decrypt failed");
        }
        written += static_cast<std::size_t>(out_len);
        consumed += slice;
    }
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG,
                            static_cast<int>(FileEncryptor::kTagSize), MutableBytes(tag)) != 1) {
        return core::Fail(core::ErrorCode::kInternal, "AES-GCM set tag failed");
    }
    int final_len = 0;
    unsigned char trailer[16];
    if (EVP_DecryptFinal_ex(ctx.get(), trailer, &final_len) != 1) {
        OPENSSL_cleanse(MutableBytes(out), out.size());
        return core::Fail(core::ErrorCode::kIntegrity, "authentication tag mismatch");
    }
    out.resize(written);
    return out;
}

std::string EncodeBase64(const std::string& raw) {
    std::ostringstream out;
    Poco::Base64Encoder encoder(out);
    encoder.rdbuf()->setLineLength(0);
    encoder.write(raw.data(), static_cast<std::streamsize>(raw.size()));
    encoder.close();
    return out.str();
}

std::string DecodeBase64(const std::string& text) {
    std::istringstream in(text);
    Poco::Base64Decoder decoder(in);
    std::string raw;
    char c;
    while (decoder.get(c)) {
        raw.push_back(c);
    }
    return raw;
}

}  // namespace

ScopedKeyWipe::~ScopedKeyWipe() {
    if (!key_.empty()) {
        OPENSSL_cleanse(&key_[0], key_.size());
    }
}

FileEncryptor::FileEncryptor(const std::string& master_key_material) {
    Poco::SHA2Engine256 sha256;
    sha256.update(master_key_material);
    const auto& digest = sha256.digest();
    std::copy(digest.begin(), digest.end(), master_key_.begin());
}

FileEncryptor::~FileEncryptor() {
    OPENSSL_cleanse(master_key_.data(), master_key_.size());
}

core::Result<std::string> FileEncryptor::GenerateFileKey() {
    return RandomBytes(kKeySize);
}

core::Result<std::string> FileEncryptor::WrapKey(const std::string& file_key) const {
    auto checked = CheckFileKey(file_key);
    if (!checked.ok()) {
        return checked.error();
    }

    auto ctx = NewContext();
    if (!ctx) {
        return core::Fail(core::ErrorCode::kInternal, "failed to create cipher context");
    }
    EVP_CIPHER_CTX_set_flags(ctx.get(), EVP_CIPHER_CTX_FLAG_WRAP_ALLOW);
    if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_wrap(), nullptr, master_key_.data(),
                           nullptr) != 1) {
        return core::Fail(core::ErrorCode::kInternal, "key wrap init failed");
    }
    std::string wrapped(file_key.size() + kWrapOverhead, '\0');
    int out_len = 0;
    if (EVP_EncryptUpdate(ctx.get(), MutableBytes(wrapped), &out_len, Bytes(file_key),
                          static_cast<int>(file_key.size())) != 1) {
        return core::Fail(core::ErrorCode::kInternal, "key wrap failed");
    }
    int final_len = 0;
    if (EVP_EncryptFinal_ex(ctx.get(), MutableBytes(wrapped) + out_len, &final_len) != 1) {
        return core::Fail(core::ErrorCode::kInternal, "key wrap finalize failed");
    }
    wrapped.resize(static_cast<std::size_t>(out_len + final_len));
    return EncodeBase64(wrapped);
}

core::Result<std::string> FileEncryptor::UnwrapKey(const std::string& wrapped_key) const {
    std::string wrapped;
    try {
        wrapped = DecodeBase64(wrapped_key);
    } catch (const Poco::Exception& ex) {
        return core::Fail(core::ErrorCode::kIntegrity, "malformed wrapped key: " + ex.displayText());
    }
    if (wrapped.size() != kKeySize + kWrapOverhead) {
        return core::Fail(core::ErrorCode::kIntegrity, "wrapped key has unexpected length");
    }

    auto ctx = NewContext();
    if (!ctx) {
        return core::Fail(core::ErrorCode::kInternal, "failed to create cipher context");
    }
    EVP_CIPHER_CTX_set_flags(ctx.get(), EVP_CIPHER_CTX_FLAG_WRAP_ALLOW);
    if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_wrap(), nullptr, master_key_.data(),
                           nullptr) != 1) {
        return core::Fail(core::ErrorCode::kInternal, "key unwrap init failed");
    }
    std::string file_key(wrapped.size(), '\0');
    int out_len = 0;
    if (EVP_DecryptUpdate(ctx.get(), MutableBytes(file_key), &out_len, Bytes(wrapped),
                          static_cast<int>(wrapped.size())) != 1 ||
        out_len <= 0) {
        return core::Fail(core::ErrorCode::kIntegrity, "key unwrap integrity check failed");
    }
    int final_len = 0;
    if (EVP_DecryptFinal_ex(ctx.get(), MutableBytes(file_key) + out_len, &final_len) != 1) {
        return core::Fail(core::ErrorCode::kIntegrity, "key unwrap integrity check failed");
    }
    file_key.resize(static_cast<std::size_t>(out_len + final_len));
    if (file_key.size() != kKeySize) {
        return core::Fail(core::ErrorCode::kIntegrity, "unwrapped key has unexpected length");
    }
    return file_key;
}

core::Result<std::string> FileEncryptor::EncryptFile(const std::string& data,
                                                     const std::string& file_key) {
    auto checked = CheckFileKey(file_key);
    if (!checked.ok()) {
        return checked.error();
    }
    return SealGcm(data, file_key);
}

core::Result<std::string> FileEncryptor::DecryptFile(const std::string& encrypted,
                                                     const std::string& file_key) {
    auto checked = CheckFileKey(file_key);
    if (!checked.ok()) {
        return checked.error();
    }
    return OpenGcm(encrypted, 0, file_key);
}

core::Result<std::string> FileEncryptor::EncryptChunk(const std::string& data,
                                                      const std::string& file_key,
                                                      std::uint32_t chunk_index) {
    auto checked = CheckFileKey(file_key);
    if (!checked.ok()) {
        return checked.error();
    }
    auto sealed = SealGcm(data, file_key);
    if (!sealed.ok()) {
        return sealed.error();
    }
    std::string out;
    out.reserve(kChunkIndexSize + sealed.value().size());
    for (std::size_t i = 0; i < kChunkIndexSize; ++i) {
        out.push_back(static_cast<char>((chunk_index >> (8 * i)) & 0xFF));
    }
    out += sealed.value();
    return out;
}

core::Result<DecryptedChunk> FileEncryptor::DecryptChunk(const std::string& encrypted,
                                                         const std::string& file_key) {
    auto checked = CheckFileKey(file_key);
    if (!checked.ok()) {
        return checked.error();
    }
    if (encrypted.size() < kChunkIndexSize) {
        return core::Fail(core::ErrorCode::kIntegrity, "chunk header truncated");
    }
    DecryptedChunk chunk;
    for (std::size_t i = 0; i < kChunkIndexSize; ++i) {
        chunk.index |= static_cast<std::uint32_t>(static_cast<unsigned char>(encrypted[i]))
                       << (8 * i);
    }
    auto opened = OpenGcm(encrypted, kChunkIndexSize, file_key);
    if (!opened.ok()) {
        return opened.error();
    }
    chunk.data = std::move(opened.value());
    return chunk;
}

}  // namespace attachvault::crypto
