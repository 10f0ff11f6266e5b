#include <string>

#include <gtest/gtest.h>

#include "attachvault/crypto/checksum.h"
#include "attachvault/crypto/file_encryptor.h"

using attachvault::core::ErrorCode;
using attachvault::crypto::FileEncryptor;

namespace {

std::string NewKey() {
    auto key = FileEncryptor::GenerateFileKey();
    EXPECT_TRUE(key.ok());
    return key.value();
}

}  // namespace

TEST(FileEncryptor, FileRoundTripAddsNonceAndTag) {
    const auto key = NewKey();
    const std::string data(100000, 'z');

    auto sealed = FileEncryptor::EncryptFile(data, key);
    ASSERT_TRUE(sealed.ok());
    EXPECT_EQ(sealed.value().size(),
              data.size() + FileEncryptor::kNonceSize + FileEncryptor::kTagSize);
    EXPECT_EQ(sealed.value().find(std::string(64, 'z')), std::string::npos);

    auto opened = FileEncryptor::DecryptFile(sealed.value(), key);
    ASSERT_TRUE(opened.ok());
    EXPECT_EQ(opened.value(), data);
}

TEST(FileEncryptor, EmptyPayloadRoundTrips) {
    const auto key = NewKey();
    auto sealed = FileEncryptor::EncryptFile("", key);
    ASSERT_TRUE(sealed.ok());
    auto opened = FileEncryptor::DecryptFile(sealed.value(), key);
    ASSERT_TRUE(opened.ok());
    EXPECT_TRUE(opened.value().empty());
}

TEST(FileEncryptor, SameInputEncryptsDifferently) {
    const auto key = NewKey();
    auto first = FileEncryptor::EncryptFile("same", key);
    auto second = FileEncryptor::EncryptFile("same", key);
    ASSERT_TRUE(first.ok());
    ASSERT_TRUE(second.ok());
    EXPECT_NE(first.value(), second.value());
}

TEST(FileEncryptor, TamperedCiphertextFailsIntegrity) {
    const auto key = NewKey();
    auto sealed = FileEncryptor::EncryptFile("payload bytes", key);
    ASSERT_TRUE(sealed.ok());
    auto tampered = sealed.value();
    tampered[FileEncryptor::kNonceSize] ^= 0x01;

    auto opened = FileEncryptor::DecryptFile(tampered, key);
    ASSERT_FALSE(opened.ok());
    EXPECT_EQ(opened.error().code, ErrorCode::kIntegrity);
}

TEST(FileEncryptor, TruncatedCiphertextFailsIntegrity) {
    const auto key = NewKey();
    auto opened = FileEncryptor::DecryptFile(std::string(10, 'x'), key);
    ASSERT_FALSE(opened.ok());
    EXPECT_EQ(opened.error().code, ErrorCode::kIntegrity);
}

TEST(FileEncryptor, WrongFileKeyFailsIntegrity) {
    auto sealed = FileEncryptor::EncryptFile("payload", NewKey());
    ASSERT_TRUE(sealed.ok());
    auto opened = FileEncryptor::DecryptFile(sealed.value(), NewKey());
    ASSERT_FALSE(opened.ok());
    EXPECT_EQ(opened.error().code, ErrorCode::kIntegrity);
}

TEST(FileEncryptor, RejectsShortFileKey) {
    auto sealed = FileEncryptor::EncryptFile("payload", "short");
    ASSERT_FALSE(sealed.ok());
    EXPECT_EQ(sealed.error().code, ErrorCode::kInvalidArgument);
}

TEST(FileEncryptor, WrapUnwrapRoundTrip) {
    FileEncryptor encryptor("master-key-material");
    const auto key = NewKey();

    auto wrapped = encryptor.WrapKey(key);
    ASSERT_TRUE(wrapped.ok());
    EXPECT_EQ(wrapped.value().find('\n'), std::string::npos);
    EXPECT_NE(wrapped.value(), key);

    auto unwrapped = encryptor.UnwrapKey(wrapped.value());
    ASSERT_TRUE(unwrapped.ok());
    EXPECT_EQ(unwrapped.value(), key);
}

TEST(FileEncryptor, ForeignMasterKeyCannotUnwrap) {
    FileEncryptor first("master-one");
    FileEncryptor second("master-two");
    auto wrapped = first.WrapKey(NewKey());
    ASSERT_TRUE(wrapped.ok());

    auto unwrapped = second.UnwrapKey(wrapped.value());
    ASSERT_FALSE(unwrapped.ok());
    EXPECT_EQ(unwrapped.error().code, ErrorCode::kIntegrity);
}

TEST(FileEncryptor, MalformedWrappedKeyFailsIntegrity) {
    FileEncryptor encryptor("master");
    auto unwrapped = encryptor.UnwrapKey("bm90LWEta2V5");
    ASSERT_FALSE(unwrapped.ok());
    EXPECT_EQ(unwrapped.error().code, ErrorCode::kIntegrity);
}

TEST(FileEncryptor, ChunkCarriesItsIndex) {
    const auto key = NewKey();
    auto sealed = FileEncryptor::EncryptChunk("chunk body", key, 258);
    ASSERT_TRUE(sealed.ok());
    EXPECT_EQ(static_cast<unsigned char>(sealed.value()[0]), 2);
    EXPECT_EQ(static_cast<unsigned char>(sealed.value()[1]), 1);

    auto opened = FileEncryptor::DecryptChunk(sealed.value(), key);
    ASSERT_TRUE(opened.ok());
    EXPECT_EQ(opened.value().index, 258u);
    EXPECT_EQ(opened.value().data, "chunk body");
}

TEST(FileEncryptor, TruncatedChunkFailsIntegrity) {
    auto opened = FileEncryptor::DecryptChunk("ab", NewKey());
    ASSERT_FALSE(opened.ok());
    EXPECT_EQ(opened.error().code, ErrorCode::kIntegrity);
}

TEST(FileEncryptor, ScopedKeyWipeZeroesKeyOnExit) {
    std::string key = NewKey();
    ASSERT_EQ(key.size(), FileEncryptor::kKeySize);
    {
        attachvault::crypto::ScopedKeyWipe wipe(key);
    }
    EXPECT_EQ(key, std::string(FileEncryptor::kKeySize, '\0'));
}

TEST(Checksum, Sha256OfKnownInput) {
    EXPECT_EQ(attachvault::crypto::Sha256Hex("abc"),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    EXPECT_EQ(attachvault::crypto::Sha256Hex(""),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}
