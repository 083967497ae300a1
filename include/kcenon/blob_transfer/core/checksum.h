/**
 * @file checksum.h
 * @brief Content digests and base64 encoding for upload requests
 */

#ifndef KCENON_BLOB_TRANSFER_CORE_CHECKSUM_H
#define KCENON_BLOB_TRANSFER_CORE_CHECKSUM_H

#include <kcenon/blob_transfer/core/types.h>

#include <array>
#include <cstddef>
#include <span>
#include <string>
#include <string_view>

namespace kcenon::blob_transfer {

/**
 * @brief Checksum utilities for transactional content validation
 *
 * Provides static methods for:
 * - MD5 digest of a chunk payload (OpenSSL EVP)
 * - Base64 encoding used for digests and block ids
 */
class checksum {
public:
    /**
     * @brief Calculate the MD5 digest of data
     * @param data Input data span
     * @return 16-byte digest or error
     */
    [[nodiscard]] static auto md5(std::span<const std::byte> data)
        -> result<std::array<std::byte, 16>>;

    /**
     * @brief Calculate the base64 encoded MD5 digest of data
     * @param data Input data span
     * @return Base64 string (24 characters) or error
     */
    [[nodiscard]] static auto md5_base64(std::span<const std::byte> data) -> result<std::string>;

    /**
     * @brief Encode bytes as standard base64 with padding
     */
    [[nodiscard]] static auto base64_encode(std::span<const std::byte> data) -> std::string;

    /**
     * @brief Encode a string's bytes as base64
     */
    [[nodiscard]] static auto base64_encode(std::string_view data) -> std::string;

    /**
     * @brief Decode standard base64, skipping invalid characters
     */
    [[nodiscard]] static auto base64_decode(std::string_view encoded) -> byte_buffer;
};

}  // namespace kcenon::blob_transfer

#endif  // KCENON_BLOB_TRANSFER_CORE_CHECKSUM_H
