/**
 * @file shared_sub_stream.cpp
 * @brief Implementation of the shared, buffered region reader
 */

#include <kcenon/blob_transfer/core/shared_sub_stream.h>

#include <kcenon/blob_transfer/core/logging.h>

#include <algorithm>
#include <cstring>
#include <limits>

namespace kcenon::blob_transfer {

shared_sub_stream::shared_sub_stream(source_stream& source,
                                     std::mutex& source_lock,
                                     uint64_t region_start,
                                     uint64_t region_length,
                                     std::size_t buffer_capacity)
    : source_(source),
      source_lock_(source_lock),
      region_start_(region_start),
      region_length_(region_length),
      buffer_capacity_(std::max<std::size_t>(buffer_capacity, 1)) {}

auto shared_sub_stream::buffer_contains(uint64_t position) const noexcept -> bool {
    return position >= buffer_start_ && position < buffer_start_ + buffer_.size();
}

auto shared_sub_stream::read(std::span<std::byte> buffer) -> result<std::size_t> {
    if (position_ >= region_length_ || buffer.empty()) {
        return std::size_t{0};
    }

    auto wanted = static_cast<std::size_t>(
        std::min<uint64_t>(buffer.size(), region_length_ - position_));
    std::size_t copied = 0;

    // Serve what the current buffer already holds
    if (buffer_contains(position_)) {
        auto in_buffer = static_cast<std::size_t>(buffer_start_ + buffer_.size() - position_);
        auto count = std::min(wanted, in_buffer);
        std::memcpy(buffer.data(), buffer_.data() + (position_ - buffer_start_), count);
        position_ += count;
        copied += count;
    }

    if (copied == wanted) {
        return copied;
    }

    std::lock_guard<std::mutex> lock(source_lock_);
    ++lock_acquisitions_;

    while (copied < wanted) {
        if (auto refilled = refill_locked(); !refilled) {
            return unexpected(refilled.error());
        }
        if (buffer_.empty()) {
            // Source ended before the region did
            break;
        }

        auto count = std::min(wanted - copied, buffer_.size());
        std::memcpy(buffer.data() + copied, buffer_.data(), count);
        position_ += count;
        copied += count;
    }

    return copied;
}

auto shared_sub_stream::refill_locked() -> result<void> {
    auto absolute = region_start_ + position_;
    if (auto sought = source_.seek(absolute); !sought) {
        BT_LOG_ERROR(log_category::substream,
                     "source seek failed at " + std::to_string(absolute));
        return unexpected(error{error_code::source_seek_error, sought.error().message});
    }

    auto target = static_cast<std::size_t>(
        std::min<uint64_t>(buffer_capacity_, region_length_ - position_));
    buffer_.resize(target);
    buffer_start_ = position_;

    std::size_t filled = 0;
    while (filled < target) {
        auto got = source_.read(std::span<std::byte>(buffer_.data() + filled, target - filled));
        if (!got) {
            buffer_.clear();
            BT_LOG_ERROR(log_category::substream,
                         "source read failed at " + std::to_string(absolute + filled));
            return unexpected(error{error_code::source_read_error, got.error().message});
        }
        if (got.value() == 0) {
            break;
        }
        filled += got.value();
    }

    buffer_.resize(filled);
    return {};
}

auto shared_sub_stream::seek(uint64_t position) -> result<void> {
    auto target = std::min(position, region_length_);

    if (buffer_contains(target)) {
        position_ = target;
        return {};
    }

    std::lock_guard<std::mutex> lock(source_lock_);
    ++lock_acquisitions_;

    if (auto sought = source_.seek(region_start_ + target); !sought) {
        return unexpected(error{error_code::source_seek_error, sought.error().message});
    }

    buffer_.clear();
    buffer_start_ = target;
    position_ = target;
    return {};
}

auto shared_sub_stream::seek(int64_t offset, seek_origin origin) -> result<void> {
    uint64_t base = 0;
    switch (origin) {
        case seek_origin::begin:
            base = 0;
            break;
        case seek_origin::current:
            base = position_;
            break;
        case seek_origin::end:
            base = region_length_;
            break;
        default:
            return unexpected(error{error_code::invalid_argument, "unsupported seek origin"});
    }

    if (offset < 0) {
        auto magnitude = static_cast<uint64_t>(-(offset + 1)) + 1;
        if (magnitude > base) {
            return unexpected(error{error_code::invalid_argument,
                                    "seek before start of region"});
        }
        return seek(base - magnitude);
    }

    auto forward = static_cast<uint64_t>(offset);
    if (forward > std::numeric_limits<uint64_t>::max() - base) {
        return seek(region_length_);
    }
    return seek(base + forward);
}

}  // namespace kcenon::blob_transfer
