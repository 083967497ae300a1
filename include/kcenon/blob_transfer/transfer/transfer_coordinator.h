/**
 * @file transfer_coordinator.h
 * @brief Drives one chunked upload from source stream to committed blob
 */

#ifndef KCENON_BLOB_TRANSFER_TRANSFER_TRANSFER_COORDINATOR_H
#define KCENON_BLOB_TRANSFER_TRANSFER_TRANSFER_COORDINATOR_H

#include <kcenon/blob_transfer/adapters/thread_pool_adapter.h>
#include <kcenon/blob_transfer/core/chunk_types.h>
#include <kcenon/blob_transfer/core/source_stream.h>
#include <kcenon/blob_transfer/core/transfer_spec.h>
#include <kcenon/blob_transfer/core/types.h>
#include <kcenon/blob_transfer/transfer/progress.h>
#include <kcenon/blob_transfer/transfer/remote_blob_endpoint.h>

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace kcenon::blob_transfer {

/**
 * @brief Coordinator lifecycle
 */
enum class transfer_state : uint8_t {
    idle,
    splitting,
    sequential_dispatch,
    parallel_dispatch,
    committing,
    done,
    failed,
};

[[nodiscard]] constexpr auto to_string(transfer_state state) -> const char* {
    switch (state) {
        case transfer_state::idle:
            return "idle";
        case transfer_state::splitting:
            return "splitting";
        case transfer_state::sequential_dispatch:
            return "sequential_dispatch";
        case transfer_state::parallel_dispatch:
            return "parallel_dispatch";
        case transfer_state::committing:
            return "committing";
        case transfer_state::done:
            return "done";
        case transfer_state::failed:
            return "failed";
        default:
            return "unknown";
    }
}

/**
 * @brief Outcome of a successful transfer
 */
struct transfer_result {
    std::vector<ordered_commit_token> tokens;  ///< Ascending by offset
    uint64_t bytes_sent = 0;
    uint64_t chunk_count = 0;
    uint64_t retry_count = 0;
    std::string etag;
    std::string last_modified;
};

/**
 * @brief Runs one upload: validate, split, dispatch, retry, commit
 *
 * A coordinator is single-use. run() may be called once; later calls fail
 * with error_code::invalid_state. cancel() may be called from any thread,
 * including from inside the progress callback; it stops new chunks from
 * being dispatched while uploads already in flight complete.
 *
 * @code
 * transfer_coordinator coordinator(spec, endpoint);
 * coordinator.on_progress([](const transfer_progress& p) { ... });
 * auto result = coordinator.run(source);
 * @endcode
 */
class transfer_coordinator {
public:
    using state_callback = std::function<void(transfer_state from, transfer_state to)>;

    /**
     * @brief Construct a coordinator
     * @param spec Transfer parameters, validated by run()
     * @param endpoint Storage service; must outlive the coordinator
     * @param pool Worker pool for parallel dispatch; created on demand if null
     */
    transfer_coordinator(transfer_spec spec,
                         remote_blob_endpoint& endpoint,
                         std::shared_ptr<adapters::upload_pool_interface> pool = nullptr);

    ~transfer_coordinator();

    transfer_coordinator(const transfer_coordinator&) = delete;
    auto operator=(const transfer_coordinator&) -> transfer_coordinator& = delete;

    /**
     * @brief Register progress callback
     *
     * Called once with bytes_completed = 0 before the first chunk and once
     * after every successful chunk.
     */
    void on_progress(progress_callback callback);

    /**
     * @brief Register state change callback
     */
    void on_state_change(state_callback callback);

    /**
     * @brief Upload the source
     * @param source Stream positioned at the first byte to upload. Parallel
     *               uploads seek it; it must support seek() then.
     * @return Commit tokens and metadata, or the error that stopped the transfer
     */
    [[nodiscard]] auto run(source_stream& source) -> result<transfer_result>;

    /**
     * @brief Stop dispatching further chunks
     */
    void cancel();

    [[nodiscard]] auto is_cancelled() const -> bool;

    [[nodiscard]] auto state() const -> transfer_state;

    [[nodiscard]] auto spec() const -> const transfer_spec&;

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::blob_transfer

#endif  // KCENON_BLOB_TRANSFER_TRANSFER_TRANSFER_COORDINATOR_H
