/**
 * @file retry.h
 * @brief Fixed-interval retry of transient transport failures
 */

#ifndef KCENON_BLOB_TRANSFER_TRANSFER_RETRY_H
#define KCENON_BLOB_TRANSFER_TRANSFER_RETRY_H

#include <kcenon/blob_transfer/core/logging.h>
#include <kcenon/blob_transfer/core/types.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>
#include <thread>

namespace kcenon::blob_transfer {

/**
 * @brief Retry configuration
 */
struct retry_policy {
    /// Retries after the first attempt
    uint32_t max_retries = 5;

    /// Pause before every retry
    std::chrono::duration<double> retry_wait{1.0};
};

/**
 * @brief Execute an operation, retrying transient failures
 *
 * Only errors for which is_retryable() holds are retried; every other
 * error is returned immediately. When the retry budget runs out the last
 * error is converted to error_code::retries_exhausted. Sleeps only the
 * calling thread.
 *
 * @param operation Callable returning result<T>
 * @param policy Retry configuration
 * @param retry_counter Incremented once per retry, may be shared by workers
 * @return Result of the last attempt
 */
template <typename Operation>
[[nodiscard]] auto upload_with_retry(Operation&& operation,
                                     const retry_policy& policy,
                                     std::atomic<uint64_t>* retry_counter = nullptr)
    -> decltype(operation()) {
    uint32_t attempt = 0;

    while (true) {
        ++attempt;
        auto outcome = operation();

        if (outcome.has_value()) {
            return outcome;
        }

        const auto& err = outcome.error();
        if (!is_retryable(err.code)) {
            return outcome;
        }

        if (attempt > policy.max_retries) {
            transfer_log_context ctx;
            ctx.attempt = attempt;
            ctx.chunk_offset = err.chunk_offset;
            ctx.error_message = err.message;
            BT_LOG_ERROR_CTX(log_category::coordinator, "retries exhausted", ctx);

            auto message = "gave up after " + std::to_string(attempt) + " attempts: " + err.message;
            if (err.chunk_offset) {
                return unexpected(error{error_code::retries_exhausted, message, *err.chunk_offset});
            }
            return unexpected(error{error_code::retries_exhausted, message});
        }

        if (retry_counter) {
            retry_counter->fetch_add(1, std::memory_order_relaxed);
        }

        transfer_log_context ctx;
        ctx.attempt = attempt;
        ctx.chunk_offset = err.chunk_offset;
        ctx.error_message = err.message;
        BT_LOG_WARN_CTX(log_category::coordinator, "transient failure, retrying", ctx);

        std::this_thread::sleep_for(policy.retry_wait);
    }
}

}  // namespace kcenon::blob_transfer

#endif  // KCENON_BLOB_TRANSFER_TRANSFER_RETRY_H
