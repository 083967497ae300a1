/**
 * @file chunk_types.h
 * @brief Chunk and commit token structures for blob_transfer
 *
 * A chunk is the unit of upload: one contiguous slice of the byte source,
 * possibly encrypted. Every successful chunk upload yields a commit token
 * that is later needed to finalize or chain the transfer.
 */

#ifndef KCENON_BLOB_TRANSFER_CORE_CHUNK_TYPES_H
#define KCENON_BLOB_TRANSFER_CORE_CHUNK_TYPES_H

#include <kcenon/blob_transfer/core/types.h>

#include <cstdint>
#include <string>
#include <variant>

namespace kcenon::blob_transfer {

/**
 * @brief One slice of the source, ready to upload
 */
struct chunk {
    uint64_t index = 0;    ///< Ordinal position in the sequence
    uint64_t offset = 0;   ///< Byte offset of the payload in the uploaded stream
    byte_buffer payload;
    bool is_final = false;

    chunk() = default;

    chunk(uint64_t idx, uint64_t off, byte_buffer data, bool final_chunk)
        : index(idx), offset(off), payload(std::move(data)), is_final(final_chunk) {}

    [[nodiscard]] auto size() const noexcept -> std::size_t { return payload.size(); }
};

/**
 * @brief Block id returned by a staged block
 */
struct block_id_token {
    std::string block_id;

    [[nodiscard]] auto operator==(const block_id_token&) const -> bool = default;
};

/**
 * @brief Result of a page range write
 */
struct page_commit_token {
    std::string etag;
    std::string last_modified;

    [[nodiscard]] auto operator==(const page_commit_token&) const -> bool = default;
};

/**
 * @brief Result of an append; carries the offset the next append must match
 */
struct append_commit_token {
    uint64_t next_offset = 0;
    std::string etag;
    std::string last_modified;

    [[nodiscard]] auto operator==(const append_commit_token&) const -> bool = default;
};

using commit_token = std::variant<block_id_token, page_commit_token, append_commit_token>;

/**
 * @brief Commit token paired with the offset of the chunk that produced it
 */
struct ordered_commit_token {
    uint64_t offset = 0;
    commit_token token;
};

}  // namespace kcenon::blob_transfer

#endif  // KCENON_BLOB_TRANSFER_CORE_CHUNK_TYPES_H
