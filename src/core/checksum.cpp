/**
 * @file checksum.cpp
 * @brief Implementation of content digests and base64 encoding
 */

#include <kcenon/blob_transfer/core/checksum.h>

#include <openssl/err.h>
#include <openssl/evp.h>

#include <memory>

namespace kcenon::blob_transfer {

namespace {

constexpr const char* BASE64_CHARS =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

constexpr int BASE64_DECODE_TABLE[256] = {
    -1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,
    -1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,
    -1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,62,-1,-1,-1,63,
    52,53,54,55,56,57,58,59,60,61,-1,-1,-1,-1,-1,-1,
    -1, 0, 1, 2, 3, 4, 5, 6, 7, 8, 9,10,11,12,13,14,
    15,16,17,18,19,20,21,22,23,24,25,-1,-1,-1,-1,-1,
    -1,26,27,28,29,30,31,32,33,34,35,36,37,38,39,40,
    41,42,43,44,45,46,47,48,49,50,51,-1,-1,-1,-1,-1,
    -1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,
    -1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,
    -1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,
    -1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,
    -1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,
    -1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,
    -1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,
    -1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1
};

struct evp_md_ctx_deleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

using evp_md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, evp_md_ctx_deleter>;

}  // namespace

auto checksum::md5(std::span<const std::byte> data) -> result<std::array<std::byte, 16>> {
    evp_md_ctx_ptr ctx(EVP_MD_CTX_new());
    if (!ctx) {
        return unexpected(error{error_code::internal_error, "Failed to create digest context"});
    }

    std::array<std::byte, 16> digest{};
    unsigned int digest_len = 0;
    if (EVP_DigestInit_ex(ctx.get(), EVP_md5(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), reinterpret_cast<unsigned char*>(digest.data()),
                           &digest_len) != 1) {
        ERR_clear_error();
        return unexpected(error{error_code::encoding_error, "MD5 digest failed"});
    }

    if (digest_len != digest.size()) {
        return unexpected(error{error_code::internal_error, "unexpected MD5 digest length"});
    }
    return digest;
}

auto checksum::md5_base64(std::span<const std::byte> data) -> result<std::string> {
    auto digest = md5(data);
    if (!digest) {
        return unexpected(digest.error());
    }
    return base64_encode(std::span<const std::byte>(digest.value()));
}

auto checksum::base64_encode(std::span<const std::byte> data) -> std::string {
    std::string result;
    result.reserve(((data.size() + 2) / 3) * 4);

    for (std::size_t i = 0; i < data.size(); i += 3) {
        uint32_t n = static_cast<uint32_t>(data[i]) << 16;
        if (i + 1 < data.size()) n |= static_cast<uint32_t>(data[i + 1]) << 8;
        if (i + 2 < data.size()) n |= static_cast<uint32_t>(data[i + 2]);

        result += BASE64_CHARS[(n >> 18) & 0x3F];
        result += BASE64_CHARS[(n >> 12) & 0x3F];
        result += (i + 1 < data.size()) ? BASE64_CHARS[(n >> 6) & 0x3F] : '=';
        result += (i + 2 < data.size()) ? BASE64_CHARS[n & 0x3F] : '=';
    }

    return result;
}

auto checksum::base64_encode(std::string_view data) -> std::string {
    return base64_encode(std::as_bytes(std::span<const char>(data.data(), data.size())));
}

auto checksum::base64_decode(std::string_view encoded) -> byte_buffer {
    byte_buffer result;
    result.reserve((encoded.size() / 4) * 3);

    int bits = 0;
    int bit_count = 0;

    for (char c : encoded) {
        if (c == '=') break;
        int val = BASE64_DECODE_TABLE[static_cast<unsigned char>(c)];
        if (val < 0) continue;

        bits = ((bits << 6) | val) & 0xFFFFFF;
        bit_count += 6;

        if (bit_count >= 8) {
            bit_count -= 8;
            result.push_back(static_cast<std::byte>((bits >> bit_count) & 0xFF));
        }
    }

    return result;
}

}  // namespace kcenon::blob_transfer
