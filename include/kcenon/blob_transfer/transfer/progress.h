/**
 * @file progress.h
 * @brief Progress reporting for chunked uploads
 */

#ifndef KCENON_BLOB_TRANSFER_TRANSFER_PROGRESS_H
#define KCENON_BLOB_TRANSFER_TRANSFER_PROGRESS_H

#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>

namespace kcenon::blob_transfer {

/**
 * @brief Snapshot handed to the progress callback
 */
struct transfer_progress {
    uint64_t bytes_completed = 0;
    std::optional<uint64_t> total_bytes;

    /**
     * @brief Completion percentage, if the total is known and non-zero
     */
    [[nodiscard]] auto percentage() const -> std::optional<double> {
        if (!total_bytes || *total_bytes == 0) {
            return std::nullopt;
        }
        return static_cast<double>(bytes_completed) / static_cast<double>(*total_bytes) * 100.0;
    }
};

using progress_callback = std::function<void(const transfer_progress&)>;

/**
 * @brief Thread-safe accumulator that forwards each update to a callback
 *
 * The callback runs while the tracker's lock is held, so reports arrive
 * in increasing order even when chunks complete on several workers.
 */
class progress_tracker {
public:
    progress_tracker(std::optional<uint64_t> total_bytes, progress_callback callback)
        : total_bytes_(total_bytes), callback_(std::move(callback)) {}

    /**
     * @brief Emit the initial (0, total) report
     */
    void start() {
        std::lock_guard<std::mutex> lock(mutex_);
        notify_locked();
    }

    /**
     * @brief Record a completed chunk
     */
    void advance(uint64_t bytes) {
        std::lock_guard<std::mutex> lock(mutex_);
        bytes_completed_ += bytes;
        notify_locked();
    }

    [[nodiscard]] auto bytes_completed() const -> uint64_t {
        std::lock_guard<std::mutex> lock(mutex_);
        return bytes_completed_;
    }

    [[nodiscard]] auto snapshot() const -> transfer_progress {
        std::lock_guard<std::mutex> lock(mutex_);
        return transfer_progress{bytes_completed_, total_bytes_};
    }

private:
    void notify_locked() {
        if (callback_) {
            callback_(transfer_progress{bytes_completed_, total_bytes_});
        }
    }

    std::optional<uint64_t> total_bytes_;
    progress_callback callback_;
    uint64_t bytes_completed_ = 0;
    mutable std::mutex mutex_;
};

}  // namespace kcenon::blob_transfer

#endif  // KCENON_BLOB_TRANSFER_TRANSFER_PROGRESS_H
