/**
 * @file chunk_encryptor.cpp
 * @brief AES-256-CBC streaming encryptor implementation
 */

#include <kcenon/blob_transfer/encryption/chunk_encryptor.h>

#include <kcenon/blob_transfer/core/logging.h>

#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/rand.h>

#include <array>
#include <climits>
#include <string>

namespace kcenon::blob_transfer {

namespace {

/// AES block size in bytes
constexpr std::size_t aes_block_size = 16;

/**
 * @brief Get OpenSSL error message
 */
auto get_openssl_error() -> std::string {
    unsigned long err = ERR_get_error();
    if (err == 0) {
        return "Unknown OpenSSL error";
    }
    std::array<char, 256> buffer{};
    ERR_error_string_n(err, buffer.data(), buffer.size());
    return std::string(buffer.data());
}

/**
 * @brief RAII wrapper for EVP_CIPHER_CTX
 */
class evp_cipher_ctx_wrapper {
public:
    evp_cipher_ctx_wrapper() : ctx_(EVP_CIPHER_CTX_new()) {}

    ~evp_cipher_ctx_wrapper() {
        if (ctx_) {
            EVP_CIPHER_CTX_free(ctx_);
        }
    }

    evp_cipher_ctx_wrapper(const evp_cipher_ctx_wrapper&) = delete;
    auto operator=(const evp_cipher_ctx_wrapper&) -> evp_cipher_ctx_wrapper& = delete;

    evp_cipher_ctx_wrapper(evp_cipher_ctx_wrapper&& other) noexcept : ctx_(other.ctx_) {
        other.ctx_ = nullptr;
    }

    auto operator=(evp_cipher_ctx_wrapper&& other) noexcept -> evp_cipher_ctx_wrapper& {
        if (this != &other) {
            if (ctx_) {
                EVP_CIPHER_CTX_free(ctx_);
            }
            ctx_ = other.ctx_;
            other.ctx_ = nullptr;
        }
        return *this;
    }

    [[nodiscard]] auto get() const -> EVP_CIPHER_CTX* { return ctx_; }
    [[nodiscard]] explicit operator bool() const { return ctx_ != nullptr; }

private:
    EVP_CIPHER_CTX* ctx_;
};

/**
 * @brief CBC cipher state shared by the encryptor and the decryptor
 */
class cbc_cipher {
public:
    auto initialize(const encryption_context& context, bool encrypting) -> result<void> {
        if (!ctx_) {
            return unexpected(
                error(error_code::internal_error, "Failed to create cipher context"));
        }

        encrypting_ = encrypting;
        if (EVP_CipherInit_ex(ctx_.get(), EVP_aes_256_cbc(), nullptr,
                              reinterpret_cast<const unsigned char*>(context.content_key.data()),
                              reinterpret_cast<const unsigned char*>(context.iv.data()),
                              encrypting ? 1 : 0) != 1) {
            return unexpected(error(error_code::encoding_error,
                                    "Failed to initialize AES-256-CBC: " + get_openssl_error()));
        }

        // PKCS7
        EVP_CIPHER_CTX_set_padding(ctx_.get(), 1);
        return {};
    }

    auto update(std::span<const std::byte> input) -> result<byte_buffer> {
        if (finalized_) {
            return unexpected(error(error_code::encoding_error, "cipher already finalized"));
        }
        if (input.size() > static_cast<std::size_t>(INT_MAX) - aes_block_size) {
            return unexpected(error(error_code::encoding_error, "cipher input too large"));
        }

        byte_buffer output(input.size() + aes_block_size);
        int out_len = 0;
        if (EVP_CipherUpdate(ctx_.get(),
                             reinterpret_cast<unsigned char*>(output.data()), &out_len,
                             reinterpret_cast<const unsigned char*>(input.data()),
                             static_cast<int>(input.size())) != 1) {
            return unexpected(error(error_code::encoding_error,
                                    "Cipher update failed: " + get_openssl_error()));
        }

        output.resize(static_cast<std::size_t>(out_len));
        bytes_emitted_ += output.size();
        return output;
    }

    auto finalize() -> result<byte_buffer> {
        if (finalized_) {
            return unexpected(error(error_code::encoding_error, "cipher already finalized"));
        }
        finalized_ = true;

        byte_buffer output(aes_block_size);
        int out_len = 0;
        if (EVP_CipherFinal_ex(ctx_.get(),
                               reinterpret_cast<unsigned char*>(output.data()), &out_len) != 1) {
            return unexpected(error(error_code::encoding_error,
                                    encrypting_ ? "Cipher finalize failed: " + get_openssl_error()
                                                : "Invalid padding: " + get_openssl_error()));
        }

        output.resize(static_cast<std::size_t>(out_len));
        bytes_emitted_ += output.size();
        return output;
    }

    [[nodiscard]] auto finalized() const noexcept -> bool { return finalized_; }
    [[nodiscard]] auto bytes_emitted() const noexcept -> uint64_t { return bytes_emitted_; }

private:
    evp_cipher_ctx_wrapper ctx_;
    bool encrypting_ = true;
    bool finalized_ = false;
    uint64_t bytes_emitted_ = 0;
};

}  // namespace

// ============================================================================
// encryption_context
// ============================================================================

auto encryption_context::generate() -> result<encryption_context> {
    encryption_context context;
    if (RAND_bytes(reinterpret_cast<unsigned char*>(context.content_key.data()),
                   static_cast<int>(context.content_key.size())) != 1) {
        return unexpected(error(error_code::internal_error,
                                "Failed to generate content key: " + get_openssl_error()));
    }
    if (RAND_bytes(reinterpret_cast<unsigned char*>(context.iv.data()),
                   static_cast<int>(context.iv.size())) != 1) {
        return unexpected(error(error_code::internal_error,
                                "Failed to generate IV: " + get_openssl_error()));
    }
    return context;
}

// ============================================================================
// chunk_encryptor
// ============================================================================

struct chunk_encryptor::impl {
    cbc_cipher cipher;
};

chunk_encryptor::chunk_encryptor(std::unique_ptr<impl> p) : impl_(std::move(p)) {}

chunk_encryptor::chunk_encryptor(chunk_encryptor&&) noexcept = default;
auto chunk_encryptor::operator=(chunk_encryptor&&) noexcept -> chunk_encryptor& = default;
chunk_encryptor::~chunk_encryptor() = default;

auto chunk_encryptor::create(const encryption_context& context) -> result<chunk_encryptor> {
    auto p = std::make_unique<impl>();
    if (auto init = p->cipher.initialize(context, true); !init) {
        BT_LOG_ERROR(log_category::encryption, init.error().message);
        return unexpected(init.error());
    }
    return chunk_encryptor(std::move(p));
}

auto chunk_encryptor::update(std::span<const std::byte> plaintext) -> result<byte_buffer> {
    return impl_->cipher.update(plaintext);
}

auto chunk_encryptor::finalize() -> result<byte_buffer> {
    return impl_->cipher.finalize();
}

auto chunk_encryptor::is_finalized() const noexcept -> bool {
    return impl_->cipher.finalized();
}

auto chunk_encryptor::bytes_emitted() const noexcept -> uint64_t {
    return impl_->cipher.bytes_emitted();
}

// ============================================================================
// chunk_decryptor
// ============================================================================

struct chunk_decryptor::impl {
    cbc_cipher cipher;
};

chunk_decryptor::chunk_decryptor(std::unique_ptr<impl> p) : impl_(std::move(p)) {}

chunk_decryptor::chunk_decryptor(chunk_decryptor&&) noexcept = default;
auto chunk_decryptor::operator=(chunk_decryptor&&) noexcept -> chunk_decryptor& = default;
chunk_decryptor::~chunk_decryptor() = default;

auto chunk_decryptor::create(const encryption_context& context) -> result<chunk_decryptor> {
    auto p = std::make_unique<impl>();
    if (auto init = p->cipher.initialize(context, false); !init) {
        return unexpected(init.error());
    }
    return chunk_decryptor(std::move(p));
}

auto chunk_decryptor::update(std::span<const std::byte> ciphertext) -> result<byte_buffer> {
    return impl_->cipher.update(ciphertext);
}

auto chunk_decryptor::finalize() -> result<byte_buffer> {
    return impl_->cipher.finalize();
}

}  // namespace kcenon::blob_transfer
