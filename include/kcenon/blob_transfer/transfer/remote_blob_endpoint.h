/**
 * @file remote_blob_endpoint.h
 * @brief Narrow request/response interface to the storage service
 *
 * The transfer engine never builds HTTP requests itself. Each call below
 * corresponds to one service operation; the implementation owns URL
 * building, headers, authentication and response parsing. Implementations
 * report failures with error_code::transient_transport_error for anything
 * worth retrying and error_code::condition_not_satisfied for a failed
 * precondition (ETag, append position, max size).
 */

#ifndef KCENON_BLOB_TRANSFER_TRANSFER_REMOTE_BLOB_ENDPOINT_H
#define KCENON_BLOB_TRANSFER_TRANSFER_REMOTE_BLOB_ENDPOINT_H

#include <kcenon/blob_transfer/core/types.h>

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace kcenon::blob_transfer {

/**
 * @brief Stage one block of a block blob
 */
struct put_block_request {
    std::string block_id;
    std::span<const std::byte> data;
    std::optional<std::string> content_md5;
    std::optional<std::string> lease_id;
};

/**
 * @brief Commit staged blocks in the given order
 */
struct put_block_list_request {
    std::vector<std::string> block_ids;
    std::optional<std::string> lease_id;
};

/**
 * @brief Write one 512-aligned page range
 */
struct update_page_request {
    uint64_t range_start = 0;
    uint64_t range_end = 0;  ///< Inclusive
    std::span<const std::byte> data;
    std::optional<std::string> if_match;
    std::optional<std::string> content_md5;
    std::optional<std::string> lease_id;
};

/**
 * @brief Append one block to an append blob
 */
struct append_block_request {
    std::span<const std::byte> data;
    std::optional<uint64_t> append_position;
    std::optional<uint64_t> max_size;
    std::optional<std::string> content_md5;
    std::optional<std::string> lease_id;
};

/**
 * @brief Upload a whole block blob in one request
 */
struct put_blob_request {
    std::span<const std::byte> data;
    std::optional<std::string> content_md5;
    std::optional<std::string> lease_id;
};

struct block_list_response {
    std::string etag;
    std::string last_modified;
};

struct page_write_response {
    std::string etag;
    std::string last_modified;
};

struct append_block_response {
    uint64_t append_offset = 0;  ///< Offset at which the block was written
    std::string etag;
    std::string last_modified;
};

/**
 * @brief Storage service operations used by the transfer engine
 *
 * Called concurrently from pool workers during parallel uploads;
 * implementations must be thread-safe.
 */
class remote_blob_endpoint {
public:
    virtual ~remote_blob_endpoint() = default;

    [[nodiscard]] virtual auto put_block(const put_block_request& request) -> result<void> = 0;

    [[nodiscard]] virtual auto put_block_list(const put_block_list_request& request)
        -> result<block_list_response> = 0;

    [[nodiscard]] virtual auto update_page(const update_page_request& request)
        -> result<page_write_response> = 0;

    [[nodiscard]] virtual auto append_block(const append_block_request& request)
        -> result<append_block_response> = 0;

    [[nodiscard]] virtual auto put_blob(const put_blob_request& request)
        -> result<block_list_response> = 0;
};

}  // namespace kcenon::blob_transfer

#endif  // KCENON_BLOB_TRANSFER_TRANSFER_REMOTE_BLOB_ENDPOINT_H
