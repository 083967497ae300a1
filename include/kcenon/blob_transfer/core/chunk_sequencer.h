/**
 * @file chunk_sequencer.h
 * @brief Lazy splitting of a source stream into upload chunks
 */

#ifndef KCENON_BLOB_TRANSFER_CORE_CHUNK_SEQUENCER_H
#define KCENON_BLOB_TRANSFER_CORE_CHUNK_SEQUENCER_H

#include <kcenon/blob_transfer/core/chunk_types.h>
#include <kcenon/blob_transfer/core/source_stream.h>
#include <kcenon/blob_transfer/core/types.h>
#include <kcenon/blob_transfer/encryption/chunk_encryptor.h>

#include <cstdint>
#include <optional>

namespace kcenon::blob_transfer {

/**
 * @brief Produces (offset, payload) chunks from a source stream
 *
 * Each chunk is read until chunk_size bytes are accumulated or the source
 * reports end of stream. With an encryptor, full chunks are passed through
 * update() and the last chunk through update() and finalize(); offsets then
 * advance by the ciphertext length. The sequence is single-pass.
 *
 * When the total length is unknown, one raw chunk is read ahead so the last
 * chunk can be flagged.
 */
class chunk_sequencer {
public:
    /**
     * @brief Construct a sequencer
     * @param source Stream to read; must outlive the sequencer
     * @param chunk_size Plaintext bytes per chunk (> 0)
     * @param total_length Bytes to read from source, if known
     * @param encryptor Optional encryptor, finalized by the last chunk
     * @param base_offset Offset reported for the first chunk
     */
    chunk_sequencer(source_stream& source,
                    uint32_t chunk_size,
                    std::optional<uint64_t> total_length = std::nullopt,
                    chunk_encryptor* encryptor = nullptr,
                    uint64_t base_offset = 0);

    chunk_sequencer(const chunk_sequencer&) = delete;
    auto operator=(const chunk_sequencer&) -> chunk_sequencer& = delete;

    /**
     * @brief Check if another chunk (or a pending error) is available
     *
     * Reads ahead from the source, hence non-const.
     */
    [[nodiscard]] auto has_next() -> bool;

    /**
     * @brief Get next chunk
     * @return Next chunk, source_read_error / encoding_error on failure,
     *         invalid_state once the sequence is exhausted
     */
    [[nodiscard]] auto next() -> result<chunk>;

    /**
     * @brief Number of chunks handed out so far
     */
    [[nodiscard]] auto chunks_emitted() const noexcept -> uint64_t { return emitted_; }

    /**
     * @brief Plaintext bytes consumed from the source so far
     */
    [[nodiscard]] auto bytes_consumed() const noexcept -> uint64_t { return consumed_; }

private:
    void prime();
    [[nodiscard]] auto read_block() -> result<byte_buffer>;
    [[nodiscard]] auto encode(byte_buffer raw, bool final_chunk) -> result<byte_buffer>;

    source_stream& source_;
    uint32_t chunk_size_;
    std::optional<uint64_t> total_length_;
    chunk_encryptor* encryptor_;

    uint64_t next_offset_;
    uint64_t next_index_ = 0;
    uint64_t consumed_ = 0;
    uint64_t emitted_ = 0;

    std::optional<byte_buffer> lookahead_;
    std::optional<chunk> pending_;
    std::optional<error> pending_error_;
    bool finished_ = false;
    bool finalized_ = false;
};

}  // namespace kcenon::blob_transfer

#endif  // KCENON_BLOB_TRANSFER_CORE_CHUNK_SEQUENCER_H
