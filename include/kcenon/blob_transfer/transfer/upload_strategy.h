/**
 * @file upload_strategy.h
 * @brief Per-blob-kind upload and commit rules
 *
 * - block: chunks are staged as blocks with deterministic ids and committed
 *   afterwards by a single block list in offset order.
 * - page: chunks are written as 512-byte aligned page ranges; an ETag
 *   precondition is chained between writes when uploading sequentially.
 * - append: chunks are appended one after another; every append after the
 *   first asserts the offset at which it must land.
 */

#ifndef KCENON_BLOB_TRANSFER_TRANSFER_UPLOAD_STRATEGY_H
#define KCENON_BLOB_TRANSFER_TRANSFER_UPLOAD_STRATEGY_H

#include <kcenon/blob_transfer/core/chunk_types.h>
#include <kcenon/blob_transfer/core/transfer_spec.h>
#include <kcenon/blob_transfer/core/types.h>
#include <kcenon/blob_transfer/transfer/remote_blob_endpoint.h>

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace kcenon::blob_transfer {

/**
 * @brief Outcome of finalizing a transfer
 */
struct commit_outcome {
    std::string etag;
    std::string last_modified;
};

/**
 * @brief Block id for the block starting at offset
 *
 * Base64 of the offset as 32 zero-padded decimal digits, so every id of a
 * blob has the same length and a retried block reuses its id.
 */
[[nodiscard]] auto block_id_for_offset(uint64_t offset) -> std::string;

/**
 * @brief Stages block blob chunks with put_block
 */
class block_blob_uploader {
public:
    block_blob_uploader(remote_blob_endpoint& endpoint, const transfer_spec& spec);

    [[nodiscard]] auto upload(const chunk& c) -> result<commit_token>;

    /**
     * @brief Commit the staged blocks
     * @param tokens Tokens sorted by ascending offset
     */
    [[nodiscard]] auto commit(const std::vector<ordered_commit_token>& tokens)
        -> result<commit_outcome>;

private:
    remote_blob_endpoint* endpoint_;
    std::optional<std::string> lease_id_;
    bool validate_content_;
};

/**
 * @brief Writes page blob chunks with update_page
 *
 * In parallel mode the if_match precondition is not sent at all, since
 * writes complete in no particular order and there is no previous ETag to
 * chain. upload() then mutates no state and may be called concurrently.
 */
class page_blob_uploader {
public:
    page_blob_uploader(remote_blob_endpoint& endpoint, const transfer_spec& spec, bool parallel);

    [[nodiscard]] auto upload(const chunk& c) -> result<commit_token>;

    [[nodiscard]] auto commit(const std::vector<ordered_commit_token>& tokens)
        -> result<commit_outcome>;

    /**
     * @brief ETag the next sequential write must match
     */
    [[nodiscard]] auto current_if_match() const -> const std::optional<std::string>& {
        return if_match_;
    }

private:
    remote_blob_endpoint* endpoint_;
    std::optional<std::string> lease_id_;
    bool validate_content_;
    bool chain_etag_;
    std::optional<std::string> if_match_;
};

/**
 * @brief Appends chunks with append_block; sequential only
 */
class append_blob_uploader {
public:
    append_blob_uploader(remote_blob_endpoint& endpoint, const transfer_spec& spec);

    [[nodiscard]] auto upload(const chunk& c) -> result<commit_token>;

    [[nodiscard]] auto commit(const std::vector<ordered_commit_token>& tokens)
        -> result<commit_outcome>;

    /**
     * @brief Offset the next append must land at, unset before the first append
     */
    [[nodiscard]] auto next_position() const -> std::optional<uint64_t> { return next_position_; }

private:
    remote_blob_endpoint* endpoint_;
    std::optional<std::string> lease_id_;
    bool validate_content_;
    std::optional<uint64_t> max_size_;
    std::optional<uint64_t> next_position_;
};

using upload_strategy = std::variant<block_blob_uploader, page_blob_uploader, append_blob_uploader>;

/**
 * @brief Create the uploader for spec.kind
 * @param spec Validated transfer spec
 * @param endpoint Service endpoint; must outlive the strategy
 * @param parallel Whether chunks will be uploaded concurrently
 */
[[nodiscard]] auto make_upload_strategy(const transfer_spec& spec,
                                        remote_blob_endpoint& endpoint,
                                        bool parallel) -> upload_strategy;

/**
 * @brief Upload one chunk with the active uploader
 */
[[nodiscard]] auto upload(upload_strategy& strategy, const chunk& c) -> result<commit_token>;

/**
 * @brief Finalize the transfer with the active uploader
 */
[[nodiscard]] auto commit(upload_strategy& strategy,
                          const std::vector<ordered_commit_token>& tokens)
    -> result<commit_outcome>;

}  // namespace kcenon::blob_transfer

#endif  // KCENON_BLOB_TRANSFER_TRANSFER_UPLOAD_STRATEGY_H
