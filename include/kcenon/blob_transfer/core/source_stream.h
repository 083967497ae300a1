/**
 * @file source_stream.h
 * @brief Byte source abstraction consumed by the transfer engine
 */

#ifndef KCENON_BLOB_TRANSFER_CORE_SOURCE_STREAM_H
#define KCENON_BLOB_TRANSFER_CORE_SOURCE_STREAM_H

#include <kcenon/blob_transfer/core/types.h>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <span>

namespace kcenon::blob_transfer {

/**
 * @brief Readable byte stream
 *
 * Implementations need not be thread-safe. seek() and tell() are only
 * required when the stream is shared by parallel workers.
 */
class source_stream {
public:
    virtual ~source_stream() = default;

    /**
     * @brief Read up to buffer.size() bytes
     * @return Number of bytes read, 0 at end of stream
     */
    [[nodiscard]] virtual auto read(std::span<std::byte> buffer) -> result<std::size_t> = 0;

    /**
     * @brief Reposition to an absolute offset
     */
    [[nodiscard]] virtual auto seek(uint64_t position) -> result<void> = 0;

    /**
     * @brief Current absolute offset
     */
    [[nodiscard]] virtual auto tell() const -> result<uint64_t> = 0;
};

/**
 * @brief Stream over a caller-owned contiguous buffer
 */
class memory_source_stream : public source_stream {
public:
    explicit memory_source_stream(std::span<const std::byte> data);

    [[nodiscard]] auto read(std::span<std::byte> buffer) -> result<std::size_t> override;
    [[nodiscard]] auto seek(uint64_t position) -> result<void> override;
    [[nodiscard]] auto tell() const -> result<uint64_t> override;

    [[nodiscard]] auto size() const noexcept -> uint64_t { return data_.size(); }

private:
    std::span<const std::byte> data_;
    uint64_t position_ = 0;
};

/**
 * @brief Stream over a local file
 */
class file_source_stream : public source_stream {
public:
    /**
     * @brief Open a file for reading
     * @param path Path to the file
     * @return Stream or error
     */
    [[nodiscard]] static auto open(const std::filesystem::path& path)
        -> result<file_source_stream>;

    file_source_stream(file_source_stream&&) noexcept = default;
    auto operator=(file_source_stream&&) noexcept -> file_source_stream& = default;

    file_source_stream(const file_source_stream&) = delete;
    auto operator=(const file_source_stream&) -> file_source_stream& = delete;

    [[nodiscard]] auto read(std::span<std::byte> buffer) -> result<std::size_t> override;
    [[nodiscard]] auto seek(uint64_t position) -> result<void> override;
    [[nodiscard]] auto tell() const -> result<uint64_t> override;

    /**
     * @brief File size at open time
     */
    [[nodiscard]] auto size() const noexcept -> uint64_t { return size_; }

private:
    file_source_stream(std::ifstream file, uint64_t size);

    mutable std::ifstream file_;
    uint64_t size_;
};

}  // namespace kcenon::blob_transfer

#endif  // KCENON_BLOB_TRANSFER_CORE_SOURCE_STREAM_H
