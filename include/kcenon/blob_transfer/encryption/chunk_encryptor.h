/**
 * @file chunk_encryptor.h
 * @brief Streaming AES-256-CBC encryption for chunked uploads
 *
 * The encryptor is fed chunk by chunk in source order. Full chunks go
 * through update(); the last chunk goes through update() followed by
 * finalize(), which emits the PKCS7 padded tail. Because CBC keeps state
 * across calls, one encryptor serves exactly one sequential transfer.
 */

#ifndef KCENON_BLOB_TRANSFER_ENCRYPTION_CHUNK_ENCRYPTOR_H
#define KCENON_BLOB_TRANSFER_ENCRYPTION_CHUNK_ENCRYPTOR_H

#include <kcenon/blob_transfer/core/types.h>

#include <array>
#include <cstddef>
#include <memory>
#include <span>

namespace kcenon::blob_transfer {

/**
 * @brief Key material for one encrypted transfer
 */
struct encryption_context {
    /// AES-256 key size in bytes
    static constexpr std::size_t key_size = 32;

    /// CBC initialization vector size in bytes
    static constexpr std::size_t iv_size = 16;

    std::array<std::byte, key_size> content_key{};
    std::array<std::byte, iv_size> iv{};

    /**
     * @brief Create a context with a random key and IV
     * @return Context or error if the random generator fails
     */
    [[nodiscard]] static auto generate() -> result<encryption_context>;
};

/**
 * @brief Sequential AES-256-CBC/PKCS7 encryptor
 *
 * Move-only. update() after finalize() and a second finalize() fail with
 * error_code::encoding_error.
 */
class chunk_encryptor {
public:
    /**
     * @brief Create an encryptor for the given context
     * @param context Key and IV
     * @return Encryptor or error if the cipher cannot be initialized
     */
    [[nodiscard]] static auto create(const encryption_context& context)
        -> result<chunk_encryptor>;

    chunk_encryptor(chunk_encryptor&&) noexcept;
    auto operator=(chunk_encryptor&&) noexcept -> chunk_encryptor&;
    ~chunk_encryptor();

    chunk_encryptor(const chunk_encryptor&) = delete;
    auto operator=(const chunk_encryptor&) -> chunk_encryptor& = delete;

    /**
     * @brief Encrypt the next piece of plaintext
     * @param plaintext Input bytes
     * @return Ciphertext for all complete blocks buffered so far
     */
    [[nodiscard]] auto update(std::span<const std::byte> plaintext) -> result<byte_buffer>;

    /**
     * @brief Flush the padded final block
     * @return Last ciphertext block (always 16 bytes with PKCS7)
     */
    [[nodiscard]] auto finalize() -> result<byte_buffer>;

    [[nodiscard]] auto is_finalized() const noexcept -> bool;

    /**
     * @brief Total ciphertext bytes emitted
     */
    [[nodiscard]] auto bytes_emitted() const noexcept -> uint64_t;

private:
    struct impl;
    explicit chunk_encryptor(std::unique_ptr<impl> p);

    std::unique_ptr<impl> impl_;
};

/**
 * @brief Sequential AES-256-CBC/PKCS7 decryptor
 *
 * Counterpart of chunk_encryptor, used to verify uploaded ciphertext.
 */
class chunk_decryptor {
public:
    [[nodiscard]] static auto create(const encryption_context& context)
        -> result<chunk_decryptor>;

    chunk_decryptor(chunk_decryptor&&) noexcept;
    auto operator=(chunk_decryptor&&) noexcept -> chunk_decryptor&;
    ~chunk_decryptor();

    chunk_decryptor(const chunk_decryptor&) = delete;
    auto operator=(const chunk_decryptor&) -> chunk_decryptor& = delete;

    [[nodiscard]] auto update(std::span<const std::byte> ciphertext) -> result<byte_buffer>;

    /**
     * @brief Verify and strip the padding
     * @return Remaining plaintext or encoding_error on bad padding
     */
    [[nodiscard]] auto finalize() -> result<byte_buffer>;

private:
    struct impl;
    explicit chunk_decryptor(std::unique_ptr<impl> p);

    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::blob_transfer

#endif  // KCENON_BLOB_TRANSFER_ENCRYPTION_CHUNK_ENCRYPTOR_H
