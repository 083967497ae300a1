/**
 * @file types.h
 * @brief Core type definitions for blob_transfer
 */

#ifndef KCENON_BLOB_TRANSFER_CORE_TYPES_H
#define KCENON_BLOB_TRANSFER_CORE_TYPES_H

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace kcenon::blob_transfer {

/**
 * @brief Error codes for chunked blob transfer operations
 */
enum class error_code {
    success = 0,

    // Precondition errors (-300 to -319)
    precondition_violation = -300,
    invalid_argument = -301,
    invalid_state = -302,

    // Transport errors (-320 to -339)
    transient_transport_error = -320,
    retries_exhausted = -321,
    condition_not_satisfied = -322,

    // Encoding errors (-340 to -359)
    encoding_error = -340,

    // Source stream errors (-360 to -379)
    source_read_error = -360,
    source_seek_error = -361,

    // Control errors (-380 to -399)
    transfer_cancelled = -380,
    internal_error = -381,
};

/**
 * @brief Convert error code to string
 */
[[nodiscard]] constexpr auto to_string(error_code code) -> const char* {
    switch (code) {
        case error_code::success:
            return "success";
        case error_code::precondition_violation:
            return "precondition violation";
        case error_code::invalid_argument:
            return "invalid argument";
        case error_code::invalid_state:
            return "invalid state";
        case error_code::transient_transport_error:
            return "transient transport error";
        case error_code::retries_exhausted:
            return "retries exhausted";
        case error_code::condition_not_satisfied:
            return "condition not satisfied";
        case error_code::encoding_error:
            return "encoding error";
        case error_code::source_read_error:
            return "source read error";
        case error_code::source_seek_error:
            return "source seek error";
        case error_code::transfer_cancelled:
            return "transfer cancelled";
        case error_code::internal_error:
            return "internal error";
        default:
            return "unknown error";
    }
}

/**
 * @brief Only transport failures that may succeed on a second attempt
 */
[[nodiscard]] constexpr auto is_retryable(error_code code) noexcept -> bool {
    return code == error_code::transient_transport_error;
}

/**
 * @brief Error type with code, message and the offset of the failing chunk
 */
struct error {
    error_code code;
    std::string message;
    std::optional<uint64_t> chunk_offset;

    error() : code(error_code::success) {}
    explicit error(error_code c) : code(c), message(to_string(c)) {}
    error(error_code c, std::string msg) : code(c), message(std::move(msg)) {}
    error(error_code c, std::string msg, uint64_t offset)
        : code(c), message(std::move(msg)), chunk_offset(offset) {}

    [[nodiscard]] explicit operator bool() const noexcept {
        return code != error_code::success;
    }
};

/**
 * @brief Wrapper for unexpected error (used with result<T>)
 */
struct unexpected {
    error err;

    explicit unexpected(error e) : err(std::move(e)) {}
};

/**
 * @brief Result type for operations that can fail
 *
 * Contains either a value of type T or an error, in the manner of
 * std::expected (C++23).
 */
template <typename T>
class result {
public:
    result() : value_(std::nullopt), error_{} {}

    result(T value) : value_(std::move(value)), error_{} {}

    result(unexpected u) : value_(std::nullopt), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return value_.has_value(); }
    [[nodiscard]] explicit operator bool() const noexcept { return value_.has_value(); }

    [[nodiscard]] auto value() & -> T& { return *value_; }
    [[nodiscard]] auto value() const& -> const T& { return *value_; }
    [[nodiscard]] auto value() && -> T&& { return std::move(*value_); }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    std::optional<T> value_;
    struct error error_;
};

/**
 * @brief Specialization of result for void return type
 */
template <>
class result<void> {
public:
    result() : has_value_(true) {}

    result(unexpected u) : has_value_(false), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return has_value_; }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value_; }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    bool has_value_;
    struct error error_;
};

/**
 * @brief Storage object kinds with different write semantics
 */
enum class blob_kind : uint8_t {
    block,   ///< Independent blocks committed by an explicit block list
    page,    ///< 512-byte aligned, overwritable pages
    append,  ///< Append-only sequential writes
};

[[nodiscard]] constexpr auto to_string(blob_kind kind) -> std::string_view {
    switch (kind) {
        case blob_kind::block:
            return "block";
        case blob_kind::page:
            return "page";
        case blob_kind::append:
            return "append";
        default:
            return "unknown";
    }
}

/**
 * @brief Owned byte buffer
 */
using byte_buffer = std::vector<std::byte>;

}  // namespace kcenon::blob_transfer

#endif  // KCENON_BLOB_TRANSFER_CORE_TYPES_H
