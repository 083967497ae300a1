/**
 * @file transfer_spec.h
 * @brief Immutable description of one chunked upload
 */

#ifndef KCENON_BLOB_TRANSFER_CORE_TRANSFER_SPEC_H
#define KCENON_BLOB_TRANSFER_CORE_TRANSFER_SPEC_H

#include <kcenon/blob_transfer/core/types.h>
#include <kcenon/blob_transfer/encryption/chunk_encryptor.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace kcenon::blob_transfer {

/**
 * @brief Parameters of a single transfer
 *
 * Built once, validated, then handed to the coordinator which never
 * modifies it.
 */
struct transfer_spec {
    /// Default chunk size (4MB)
    static constexpr uint32_t default_chunk_size = 4 * 1024 * 1024;

    /// Largest block the service accepts (100MB)
    static constexpr uint32_t max_chunk_size = 100 * 1024 * 1024;

    /// Page blob writes must be aligned to this many bytes
    static constexpr uint32_t page_alignment = 512;

    /// Default read-ahead buffer of a shared sub-stream (4MB)
    static constexpr std::size_t default_buffer_capacity = 4 * 1024 * 1024;

    static constexpr uint32_t default_max_retries = 5;

    using seconds = std::chrono::duration<double>;

    std::optional<uint64_t> source_length;
    uint32_t chunk_size = default_chunk_size;
    blob_kind kind = blob_kind::block;
    uint32_t parallelism = 1;
    bool validate_content = false;
    std::optional<std::string> lease_id;
    uint32_t max_retries = default_max_retries;
    seconds retry_wait{1.0};
    std::optional<encryption_context> encryption;

    /// Append blobs: reject appends that would grow the blob past this size
    std::optional<uint64_t> max_size_condition;

    /// Page blobs: ETag the first write must match
    std::optional<std::string> if_match;

    /// Block blobs of known length at or below this are sent in one request
    std::optional<uint64_t> single_put_threshold;

    std::size_t buffer_capacity = default_buffer_capacity;

    /**
     * @brief Validate the combination of parameters
     * @return Success if valid, precondition_violation otherwise
     */
    [[nodiscard]] auto validate() const -> result<void> {
        if (chunk_size == 0) {
            return unexpected(error{error_code::precondition_violation,
                                    "chunk size must be greater than zero"});
        }
        if (chunk_size > max_chunk_size) {
            return unexpected(error{
                error_code::precondition_violation,
                "chunk size too large (maximum: " + std::to_string(max_chunk_size) + ")"});
        }
        if (parallelism == 0) {
            return unexpected(error{error_code::precondition_violation,
                                    "parallelism must be at least 1"});
        }
        if (buffer_capacity == 0) {
            return unexpected(error{error_code::invalid_argument,
                                    "buffer capacity must be greater than zero"});
        }

        if (single_put_threshold && *single_put_threshold > max_chunk_size) {
            return unexpected(error{
                error_code::precondition_violation,
                "single put threshold too large (maximum: " + std::to_string(max_chunk_size) +
                    ")"});
        }

        if (kind == blob_kind::page) {
            if (!source_length) {
                return unexpected(error{error_code::precondition_violation,
                                        "page blob uploads require a known source length"});
            }
            if (chunk_size % page_alignment != 0) {
                return unexpected(error{error_code::precondition_violation,
                                        "page blob chunk size must be a multiple of 512"});
            }
            if (source_length && *source_length % page_alignment != 0) {
                return unexpected(error{error_code::precondition_violation,
                                        "page blob length must be a multiple of 512"});
            }
            if (encryption) {
                return unexpected(error{error_code::precondition_violation,
                                        "page blobs cannot be encrypted"});
            }
        }

        if (kind == blob_kind::append && parallelism > 1) {
            return unexpected(error{error_code::precondition_violation,
                                    "append blobs require parallelism of 1"});
        }

        if (encryption && parallelism > 1) {
            return unexpected(error{error_code::precondition_violation,
                                    "encrypted uploads require parallelism of 1"});
        }

        return {};
    }

    /**
     * @brief Number of chunks for a known length (before encryption)
     */
    [[nodiscard]] auto calculate_chunk_count(uint64_t length) const -> uint64_t {
        if (length == 0 || chunk_size == 0) return 0;
        return (length + chunk_size - 1) / chunk_size;
    }

    /**
     * @brief Whether the transfer should use a single put_blob call
     *
     * Never true for an empty source, which is not uploaded at all.
     */
    [[nodiscard]] auto use_single_put() const -> bool {
        return kind == blob_kind::block && source_length && single_put_threshold &&
               *source_length > 0 && *source_length <= *single_put_threshold;
    }

    class builder;
};

/**
 * @brief Fluent builder for transfer_spec
 *
 * @code
 * auto spec = transfer_spec::builder()
 *     .with_kind(blob_kind::block)
 *     .with_source_length(data.size())
 *     .with_chunk_size(4 * 1024 * 1024)
 *     .with_parallelism(4)
 *     .build();
 * @endcode
 */
class transfer_spec::builder {
public:
    builder() = default;

    auto with_kind(blob_kind kind) -> builder& {
        spec_.kind = kind;
        return *this;
    }

    auto with_source_length(uint64_t length) -> builder& {
        spec_.source_length = length;
        return *this;
    }

    auto with_chunk_size(uint32_t size) -> builder& {
        spec_.chunk_size = size;
        return *this;
    }

    auto with_parallelism(uint32_t parallelism) -> builder& {
        spec_.parallelism = parallelism;
        return *this;
    }

    auto with_content_validation(bool enable = true) -> builder& {
        spec_.validate_content = enable;
        return *this;
    }

    auto with_lease(std::string lease_id) -> builder& {
        spec_.lease_id = std::move(lease_id);
        return *this;
    }

    auto with_retry_policy(uint32_t max_retries, transfer_spec::seconds wait) -> builder& {
        spec_.max_retries = max_retries;
        spec_.retry_wait = wait;
        return *this;
    }

    auto with_encryption(encryption_context context) -> builder& {
        spec_.encryption = context;
        return *this;
    }

    auto with_max_size_condition(uint64_t max_size) -> builder& {
        spec_.max_size_condition = max_size;
        return *this;
    }

    auto with_if_match(std::string etag) -> builder& {
        spec_.if_match = std::move(etag);
        return *this;
    }

    auto with_single_put_threshold(uint64_t threshold) -> builder& {
        spec_.single_put_threshold = threshold;
        return *this;
    }

    auto with_buffer_capacity(std::size_t capacity) -> builder& {
        spec_.buffer_capacity = capacity;
        return *this;
    }

    /**
     * @brief Validate and return the spec
     * @return Spec or the first validation error
     */
    [[nodiscard]] auto build() const -> result<transfer_spec> {
        if (auto valid = spec_.validate(); !valid) {
            return unexpected(valid.error());
        }
        return spec_;
    }

private:
    transfer_spec spec_;
};

}  // namespace kcenon::blob_transfer

#endif  // KCENON_BLOB_TRANSFER_CORE_TRANSFER_SPEC_H
