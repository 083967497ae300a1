/**
 * @file test_chunk_encryptor.cpp
 * @brief Unit tests for the streaming AES-256-CBC encryptor
 */

#include <gtest/gtest.h>

#include <kcenon/blob_transfer/encryption/chunk_encryptor.h>

#include "../../integration/test_fixtures.h"

namespace kcenon::blob_transfer::test {

class ChunkEncryptorTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto generated = encryption_context::generate();
        ASSERT_TRUE(generated.has_value());
        context_ = generated.value();
    }

    auto decrypt(const byte_buffer& ciphertext) -> result<byte_buffer> {
        auto decryptor = chunk_decryptor::create(context_);
        if (!decryptor) {
            return unexpected(decryptor.error());
        }
        auto body = decryptor.value().update(ciphertext);
        if (!body) {
            return unexpected(body.error());
        }
        auto tail = decryptor.value().finalize();
        if (!tail) {
            return unexpected(tail.error());
        }
        byte_buffer plaintext = std::move(body.value());
        plaintext.insert(plaintext.end(), tail.value().begin(), tail.value().end());
        return plaintext;
    }

    encryption_context context_;
};

TEST_F(ChunkEncryptorTest, GeneratedContextsDiffer) {
    auto other = encryption_context::generate();
    ASSERT_TRUE(other.has_value());

    EXPECT_NE(context_.content_key, other.value().content_key);
}

TEST_F(ChunkEncryptorTest, ChunkedEncryptionRoundTrip) {
    // 10MB in 1MB chunks
    constexpr std::size_t total = 10 * 1024 * 1024;
    constexpr std::size_t piece = 1024 * 1024;
    auto data = make_pattern(total);

    auto encryptor = chunk_encryptor::create(context_);
    ASSERT_TRUE(encryptor.has_value());

    byte_buffer ciphertext;
    for (std::size_t offset = 0; offset < total; offset += piece) {
        auto out = encryptor.value().update(
            std::span<const std::byte>(data.data() + offset, piece));
        ASSERT_TRUE(out.has_value());
        ciphertext.insert(ciphertext.end(), out.value().begin(), out.value().end());
    }
    auto tail = encryptor.value().finalize();
    ASSERT_TRUE(tail.has_value());
    EXPECT_EQ(tail.value().size(), 16u);
    ciphertext.insert(ciphertext.end(), tail.value().begin(), tail.value().end());

    EXPECT_EQ(ciphertext.size(), total + 16);
    EXPECT_EQ(encryptor.value().bytes_emitted(), ciphertext.size());

    auto plaintext = decrypt(ciphertext);
    ASSERT_TRUE(plaintext.has_value());
    EXPECT_EQ(plaintext.value(), data);
}

TEST_F(ChunkEncryptorTest, UnalignedPiecesPadToBlock) {
    auto data = make_pattern(100);
    auto encryptor = chunk_encryptor::create(context_);
    ASSERT_TRUE(encryptor.has_value());

    byte_buffer ciphertext;
    for (std::size_t offset = 0; offset < data.size(); offset += 30) {
        auto count = std::min<std::size_t>(30, data.size() - offset);
        auto out = encryptor.value().update(std::span<const std::byte>(data.data() + offset, count));
        ASSERT_TRUE(out.has_value());
        EXPECT_EQ(out.value().size() % 16, 0u);
        ciphertext.insert(ciphertext.end(), out.value().begin(), out.value().end());
    }
    auto tail = encryptor.value().finalize();
    ASSERT_TRUE(tail.has_value());
    ciphertext.insert(ciphertext.end(), tail.value().begin(), tail.value().end());

    EXPECT_EQ(ciphertext.size(), 112u);

    auto plaintext = decrypt(ciphertext);
    ASSERT_TRUE(plaintext.has_value());
    EXPECT_EQ(plaintext.value(), data);
}

TEST_F(ChunkEncryptorTest, EmptyInputEncryptsToOneBlock) {
    auto encryptor = chunk_encryptor::create(context_);
    ASSERT_TRUE(encryptor.has_value());

    auto tail = encryptor.value().finalize();
    ASSERT_TRUE(tail.has_value());
    EXPECT_EQ(tail.value().size(), 16u);
    EXPECT_TRUE(encryptor.value().is_finalized());
}

TEST_F(ChunkEncryptorTest, DoubleFinalizeFails) {
    auto encryptor = chunk_encryptor::create(context_);
    ASSERT_TRUE(encryptor.has_value());

    ASSERT_TRUE(encryptor.value().finalize().has_value());
    auto again = encryptor.value().finalize();

    ASSERT_FALSE(again.has_value());
    EXPECT_EQ(again.error().code, error_code::encoding_error);
}

TEST_F(ChunkEncryptorTest, UpdateAfterFinalizeFails) {
    auto encryptor = chunk_encryptor::create(context_);
    ASSERT_TRUE(encryptor.has_value());

    ASSERT_TRUE(encryptor.value().finalize().has_value());
    auto data = make_pattern(16);
    auto out = encryptor.value().update(data);

    ASSERT_FALSE(out.has_value());
    EXPECT_EQ(out.error().code, error_code::encoding_error);
}

TEST_F(ChunkEncryptorTest, CorruptedCiphertextIsDetected) {
    auto data = make_pattern(64);
    auto encryptor = chunk_encryptor::create(context_);
    ASSERT_TRUE(encryptor.has_value());

    auto body = encryptor.value().update(data);
    ASSERT_TRUE(body.has_value());
    auto tail = encryptor.value().finalize();
    ASSERT_TRUE(tail.has_value());
    byte_buffer ciphertext = body.value();
    ciphertext.insert(ciphertext.end(), tail.value().begin(), tail.value().end());

    // Corrupt the second to last block so the padding decrypts to garbage
    ciphertext[ciphertext.size() - 17] ^= std::byte{0x5a};
    ciphertext[ciphertext.size() - 18] ^= std::byte{0x01};

    auto plaintext = decrypt(ciphertext);
    if (plaintext.has_value()) {
        // A corrupted block can still decrypt to valid padding by chance
        EXPECT_NE(plaintext.value(), data);
    } else {
        EXPECT_EQ(plaintext.error().code, error_code::encoding_error);
    }
}

}  // namespace kcenon::blob_transfer::test
