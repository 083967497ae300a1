/**
 * @file shared_sub_stream.h
 * @brief Bounded, buffered window over a source stream shared by workers
 */

#ifndef KCENON_BLOB_TRANSFER_CORE_SHARED_SUB_STREAM_H
#define KCENON_BLOB_TRANSFER_CORE_SHARED_SUB_STREAM_H

#include <kcenon/blob_transfer/core/source_stream.h>
#include <kcenon/blob_transfer/core/transfer_spec.h>
#include <kcenon/blob_transfer/core/types.h>

#include <cstdint>
#include <mutex>
#include <span>

namespace kcenon::blob_transfer {

/**
 * @brief Reference point for relative seeks
 */
enum class seek_origin : uint8_t {
    begin,
    current,
    end,
};

/**
 * @brief Read-only view of [region_start, region_start + region_length)
 *
 * Several sub-streams may wrap the same source, which need not be
 * thread-safe. Every access to the source happens under the shared mutex;
 * reads and seeks that stay inside the sub-stream's own read-ahead buffer
 * do not touch the mutex at all. A single sub-stream is used by one thread.
 */
class shared_sub_stream : public source_stream {
public:
    /**
     * @brief Construct a window over a shared source
     * @param source Shared source; must outlive the sub-stream
     * @param source_lock Mutex guarding every access to source
     * @param region_start Absolute offset of the window in source
     * @param region_length Length of the window in bytes
     * @param buffer_capacity Read-ahead buffer size
     */
    shared_sub_stream(source_stream& source,
                      std::mutex& source_lock,
                      uint64_t region_start,
                      uint64_t region_length,
                      std::size_t buffer_capacity = transfer_spec::default_buffer_capacity);

    shared_sub_stream(const shared_sub_stream&) = delete;
    auto operator=(const shared_sub_stream&) -> shared_sub_stream& = delete;

    /**
     * @brief Read up to buffer.size() bytes without crossing the region end
     * @return Bytes read, 0 at the region end
     */
    [[nodiscard]] auto read(std::span<std::byte> buffer) -> result<std::size_t> override;

    /**
     * @brief Move to an absolute position within the region
     *
     * Positions past the region end clamp to the region end.
     */
    [[nodiscard]] auto seek(uint64_t position) -> result<void> override;

    /**
     * @brief Move relative to an origin
     * @return invalid_argument if the target would be negative
     */
    [[nodiscard]] auto seek(int64_t offset, seek_origin origin) -> result<void>;

    /**
     * @brief Position within the region
     */
    [[nodiscard]] auto tell() const -> result<uint64_t> override { return position_; }

    [[nodiscard]] auto position() const noexcept -> uint64_t { return position_; }

    [[nodiscard]] auto region_start() const noexcept -> uint64_t { return region_start_; }
    [[nodiscard]] auto size() const noexcept -> uint64_t { return region_length_; }

    /**
     * @brief How many times the shared mutex was taken
     */
    [[nodiscard]] auto lock_acquisitions() const noexcept -> uint64_t {
        return lock_acquisitions_;
    }

private:
    [[nodiscard]] auto buffer_contains(uint64_t position) const noexcept -> bool;
    [[nodiscard]] auto refill_locked() -> result<void>;

    source_stream& source_;
    std::mutex& source_lock_;
    uint64_t region_start_;
    uint64_t region_length_;
    std::size_t buffer_capacity_;

    byte_buffer buffer_;
    uint64_t buffer_start_ = 0;  ///< Region-relative offset of buffer_[0]
    uint64_t position_ = 0;      ///< Region-relative read position
    uint64_t lock_acquisitions_ = 0;
};

}  // namespace kcenon::blob_transfer

#endif  // KCENON_BLOB_TRANSFER_CORE_SHARED_SUB_STREAM_H
