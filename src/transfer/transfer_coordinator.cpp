/**
 * @file transfer_coordinator.cpp
 * @brief Implementation of the upload state machine
 */

#include <kcenon/blob_transfer/transfer/transfer_coordinator.h>

#include <kcenon/blob_transfer/core/checksum.h>
#include <kcenon/blob_transfer/core/chunk_sequencer.h>
#include <kcenon/blob_transfer/core/logging.h>
#include <kcenon/blob_transfer/core/shared_sub_stream.h>
#include <kcenon/blob_transfer/encryption/chunk_encryptor.h>
#include <kcenon/blob_transfer/transfer/retry.h>
#include <kcenon/blob_transfer/transfer/upload_strategy.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <future>
#include <mutex>
#include <optional>

namespace kcenon::blob_transfer {

namespace {

/// AES block size; encrypted payloads are padded up to a multiple of it
constexpr uint64_t cipher_block_size = 16;

auto encrypted_length(uint64_t plaintext_length) -> uint64_t {
    return (plaintext_length / cipher_block_size + 1) * cipher_block_size;
}

auto cancelled_error() -> error {
    return error{error_code::transfer_cancelled, "transfer cancelled"};
}

auto truncated_source_error(uint64_t consumed) -> error {
    return error{error_code::source_read_error, "source ended before declared length", consumed};
}

}  // namespace

struct transfer_coordinator::impl {
    transfer_spec spec;
    remote_blob_endpoint& endpoint;
    std::shared_ptr<adapters::upload_pool_interface> pool;

    progress_callback progress_cb;
    state_callback state_cb;
    std::mutex callback_mutex;

    std::atomic<transfer_state> current_state{transfer_state::idle};
    std::atomic<bool> started{false};
    std::atomic<bool> cancelled{false};
    std::atomic<uint64_t> retry_count{0};

    impl(transfer_spec s,
         remote_blob_endpoint& ep,
         std::shared_ptr<adapters::upload_pool_interface> p)
        : spec(std::move(s)), endpoint(ep), pool(std::move(p)) {}

    void transition(transfer_state to) {
        auto from = current_state.exchange(to);

        BT_LOG_DEBUG(log_category::coordinator,
                     std::string("state ") + to_string(from) + " -> " + to_string(to));

        state_callback cb;
        {
            std::lock_guard<std::mutex> lock(callback_mutex);
            cb = state_cb;
        }
        if (cb) {
            cb(from, to);
        }
    }

    auto fail(error err) -> result<transfer_result> {
        transfer_log_context ctx;
        ctx.blob_kind = std::string(to_string(spec.kind));
        ctx.chunk_offset = err.chunk_offset;
        ctx.error_message = err.message;
        BT_LOG_ERROR_CTX(log_category::coordinator,
                         std::string("transfer failed: ") + to_string(err.code), ctx);

        transition(transfer_state::failed);
        return unexpected(std::move(err));
    }

    [[nodiscard]] auto make_retry_policy() const -> retry_policy {
        return retry_policy{spec.max_retries, spec.retry_wait};
    }

    [[nodiscard]] auto progress_total() const -> std::optional<uint64_t> {
        if (!spec.source_length) {
            return std::nullopt;
        }
        return spec.encryption ? encrypted_length(*spec.source_length) : *spec.source_length;
    }

    auto make_progress_callback() -> progress_callback {
        std::lock_guard<std::mutex> lock(callback_mutex);
        return progress_cb;
    }

    auto log_chunk(const chunk& c) -> void {
        transfer_log_context ctx;
        ctx.blob_kind = std::string(to_string(spec.kind));
        ctx.chunk_index = c.index;
        ctx.chunk_offset = c.offset;
        ctx.chunk_bytes = c.size();
        BT_LOG_DEBUG_CTX(log_category::coordinator, "chunk uploaded", ctx);
    }

    auto run_single_put(source_stream& source,
                        chunk_encryptor* encryptor,
                        progress_tracker& progress,
                        transfer_result& outcome) -> result<void>;

    auto run_sequential(source_stream& source,
                        chunk_encryptor* encryptor,
                        upload_strategy& strategy,
                        progress_tracker& progress,
                        transfer_result& outcome) -> result<void>;

    auto run_parallel(source_stream& source,
                      upload_strategy& strategy,
                      progress_tracker& progress,
                      transfer_result& outcome) -> result<void>;

    auto run_commit(upload_strategy& strategy, transfer_result& outcome) -> result<void>;
};

transfer_coordinator::transfer_coordinator(transfer_spec spec,
                                           remote_blob_endpoint& endpoint,
                                           std::shared_ptr<adapters::upload_pool_interface> pool)
    : impl_(std::make_unique<impl>(std::move(spec), endpoint, std::move(pool))) {}

transfer_coordinator::~transfer_coordinator() = default;

void transfer_coordinator::on_progress(progress_callback callback) {
    std::lock_guard<std::mutex> lock(impl_->callback_mutex);
    impl_->progress_cb = std::move(callback);
}

void transfer_coordinator::on_state_change(state_callback callback) {
    std::lock_guard<std::mutex> lock(impl_->callback_mutex);
    impl_->state_cb = std::move(callback);
}

void transfer_coordinator::cancel() {
    if (!impl_->cancelled.exchange(true)) {
        BT_LOG_INFO(log_category::coordinator, "cancellation requested");
    }
}

auto transfer_coordinator::is_cancelled() const -> bool {
    return impl_->cancelled.load();
}

auto transfer_coordinator::state() const -> transfer_state {
    return impl_->current_state.load();
}

auto transfer_coordinator::spec() const -> const transfer_spec& {
    return impl_->spec;
}

auto transfer_coordinator::run(source_stream& source) -> result<transfer_result> {
    if (impl_->started.exchange(true)) {
        return unexpected(error{error_code::invalid_state,
                                std::string("coordinator already used, state: ") +
                                    to_string(impl_->current_state.load())});
    }
    impl_->transition(transfer_state::splitting);

    const auto& spec = impl_->spec;
    if (auto valid = spec.validate(); !valid) {
        return impl_->fail(valid.error());
    }

    std::optional<chunk_encryptor> encryptor;
    if (spec.encryption) {
        auto created = chunk_encryptor::create(*spec.encryption);
        if (!created) {
            return impl_->fail(created.error());
        }
        encryptor.emplace(std::move(created.value()));
    }
    chunk_encryptor* encryptor_ptr = encryptor ? &*encryptor : nullptr;

    bool parallel = spec.parallelism > 1;
    if (parallel && !spec.source_length) {
        BT_LOG_WARN(log_category::coordinator,
                    "source length unknown, falling back to sequential upload");
        parallel = false;
    }

    transfer_log_context ctx;
    ctx.blob_kind = std::string(to_string(spec.kind));
    ctx.total_bytes = spec.source_length;
    ctx.chunk_bytes = spec.chunk_size;
    ctx.parallelism = parallel ? spec.parallelism : 1;
    BT_LOG_INFO_CTX(log_category::coordinator, "transfer started", ctx);

    auto started_at = std::chrono::steady_clock::now();

    progress_tracker progress(impl_->progress_total(), impl_->make_progress_callback());
    progress.start();

    transfer_result outcome;

    if (spec.use_single_put()) {
        impl_->transition(transfer_state::sequential_dispatch);
        if (auto sent = impl_->run_single_put(source, encryptor_ptr, progress, outcome); !sent) {
            return impl_->fail(sent.error());
        }
        impl_->transition(transfer_state::committing);
    } else {
        auto strategy = make_upload_strategy(spec, impl_->endpoint, parallel);

        result<void> dispatched;
        if (parallel) {
            impl_->transition(transfer_state::parallel_dispatch);
            dispatched = impl_->run_parallel(source, strategy, progress, outcome);
        } else {
            impl_->transition(transfer_state::sequential_dispatch);
            dispatched = impl_->run_sequential(source, encryptor_ptr, strategy, progress, outcome);
        }
        if (!dispatched) {
            return impl_->fail(dispatched.error());
        }

        std::sort(outcome.tokens.begin(), outcome.tokens.end(),
                  [](const ordered_commit_token& a, const ordered_commit_token& b) {
                      return a.offset < b.offset;
                  });

        impl_->transition(transfer_state::committing);
        if (auto committed = impl_->run_commit(strategy, outcome); !committed) {
            return impl_->fail(committed.error());
        }
    }

    outcome.retry_count = impl_->retry_count.load();
    impl_->transition(transfer_state::done);

    ctx.bytes_completed = outcome.bytes_sent;
    ctx.duration_ms = static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started_at)
            .count());
    BT_LOG_INFO_CTX(log_category::coordinator, "transfer completed", ctx);

    return outcome;
}

auto transfer_coordinator::impl::run_single_put(source_stream& source,
                                                chunk_encryptor* encryptor,
                                                progress_tracker& progress,
                                                transfer_result& outcome) -> result<void> {
    // Whole source as one chunk, plus a padding-only tail when encrypting
    chunk_sequencer sequencer(source, static_cast<uint32_t>(*spec.source_length),
                              spec.source_length, encryptor);
    byte_buffer payload;
    while (sequencer.has_next()) {
        auto next = sequencer.next();
        if (!next) {
            return unexpected(next.error());
        }
        payload.insert(payload.end(), next.value().payload.begin(), next.value().payload.end());
    }

    if (sequencer.bytes_consumed() < *spec.source_length) {
        return unexpected(truncated_source_error(sequencer.bytes_consumed()));
    }

    if (cancelled.load()) {
        return unexpected(cancelled_error());
    }

    put_blob_request request;
    request.data = std::span<const std::byte>(payload);
    request.lease_id = spec.lease_id;
    if (spec.validate_content) {
        auto md5 = checksum::md5_base64(request.data);
        if (!md5) {
            return unexpected(md5.error());
        }
        request.content_md5 = std::move(md5.value());
    }

    auto put = upload_with_retry(
        [this, &request]() -> result<block_list_response> {
            auto response = endpoint.put_blob(request);
            if (!response) {
                return unexpected(error{response.error().code, response.error().message, 0});
            }
            return response;
        },
        make_retry_policy(), &retry_count);
    if (!put) {
        return unexpected(put.error());
    }

    outcome.bytes_sent = payload.size();
    outcome.chunk_count = 1;
    outcome.etag = std::move(put.value().etag);
    outcome.last_modified = std::move(put.value().last_modified);
    progress.advance(payload.size());
    return {};
}

auto transfer_coordinator::impl::run_sequential(source_stream& source,
                                                chunk_encryptor* encryptor,
                                                upload_strategy& strategy,
                                                progress_tracker& progress,
                                                transfer_result& outcome) -> result<void> {
    chunk_sequencer sequencer(source, spec.chunk_size, spec.source_length, encryptor);
    auto policy = make_retry_policy();

    while (sequencer.has_next()) {
        if (cancelled.load()) {
            return unexpected(cancelled_error());
        }

        auto next = sequencer.next();
        if (!next) {
            return unexpected(next.error());
        }
        const chunk& c = next.value();

        // A short final chunk must not be written when the source came up short
        if (c.is_final && spec.source_length &&
            sequencer.bytes_consumed() < *spec.source_length) {
            return unexpected(truncated_source_error(sequencer.bytes_consumed()));
        }

        auto token = upload_with_retry([&strategy, &c]() { return upload(strategy, c); },
                                       policy, &retry_count);
        if (!token) {
            return unexpected(token.error());
        }
        log_chunk(c);

        outcome.tokens.push_back(ordered_commit_token{c.offset, std::move(token.value())});
        outcome.bytes_sent += c.size();
        ++outcome.chunk_count;
        progress.advance(c.size());
    }

    if (spec.source_length && sequencer.bytes_consumed() < *spec.source_length) {
        return unexpected(truncated_source_error(sequencer.bytes_consumed()));
    }

    return {};
}

auto transfer_coordinator::impl::run_parallel(source_stream& source,
                                              upload_strategy& strategy,
                                              progress_tracker& progress,
                                              transfer_result& outcome) -> result<void> {
    const uint64_t total = *spec.source_length;
    const uint64_t chunk_size = spec.chunk_size;
    const uint64_t range_count = spec.calculate_chunk_count(total);
    if (range_count == 0) {
        return {};
    }

    // Regions are relative to where the caller left the stream
    auto start = source.tell();
    if (!start) {
        return unexpected(error{error_code::source_seek_error, start.error().message});
    }
    const uint64_t stream_start = start.value();

    auto policy = make_retry_policy();

    std::mutex source_lock;
    std::atomic<uint64_t> next_range{0};
    std::atomic<bool> aborted{false};

    std::mutex outcome_mutex;
    std::optional<error> first_error;

    auto record_error = [&](error err) {
        std::lock_guard<std::mutex> lock(outcome_mutex);
        if (!first_error) {
            first_error = std::move(err);
        }
        aborted.store(true);
    };

    // Each worker pulls the next unclaimed range until none are left
    auto worker = [&]() {
        while (!aborted.load() && !cancelled.load()) {
            auto index = next_range.fetch_add(1);
            if (index >= range_count) {
                return;
            }

            const uint64_t offset = index * chunk_size;
            const uint64_t length = std::min(chunk_size, total - offset);

            shared_sub_stream region(source, source_lock, stream_start + offset, length,
                                     spec.buffer_capacity);
            chunk_sequencer sequencer(region, static_cast<uint32_t>(length), length, nullptr,
                                      offset);
            if (!sequencer.has_next()) {
                record_error(truncated_source_error(offset));
                return;
            }

            auto next = sequencer.next();
            if (!next) {
                record_error(next.error());
                return;
            }
            chunk c = std::move(next.value());
            if (c.size() < length) {
                record_error(truncated_source_error(offset + c.size()));
                return;
            }
            c.index = index;

            auto token = upload_with_retry([&strategy, &c]() { return upload(strategy, c); },
                                           policy, &retry_count);
            if (!token) {
                record_error(token.error());
                return;
            }
            log_chunk(c);

            {
                std::lock_guard<std::mutex> lock(outcome_mutex);
                outcome.tokens.push_back(ordered_commit_token{c.offset, std::move(token.value())});
                outcome.bytes_sent += c.size();
                ++outcome.chunk_count;
            }
            progress.advance(c.size());
        }
    };

    auto active_pool = pool ? pool : adapters::upload_pool_factory::create(spec.parallelism);
    auto worker_count = std::min<uint64_t>(spec.parallelism, range_count);

    BT_LOG_DEBUG(log_category::coordinator,
                 "dispatching " + std::to_string(range_count) + " ranges to " +
                     std::to_string(worker_count) + " workers");

    std::vector<std::future<void>> workers;
    workers.reserve(static_cast<std::size_t>(worker_count));
    for (uint64_t i = 0; i < worker_count; ++i) {
        workers.push_back(active_pool->submit(worker));
    }

    // Every worker references this frame; let all of them finish before rethrowing
    for (auto& w : workers) {
        w.wait();
    }
    for (auto& w : workers) {
        w.get();
    }

    if (first_error) {
        return unexpected(std::move(*first_error));
    }
    if (cancelled.load()) {
        return unexpected(cancelled_error());
    }
    return {};
}

auto transfer_coordinator::impl::run_commit(upload_strategy& strategy, transfer_result& outcome)
    -> result<void> {
    // Nothing was staged for an empty source, so there is nothing to commit
    if (outcome.tokens.empty()) {
        return {};
    }

    if (cancelled.load()) {
        return unexpected(cancelled_error());
    }

    auto committed = upload_with_retry(
        [&strategy, &outcome]() { return commit(strategy, outcome.tokens); },
        make_retry_policy(), &retry_count);
    if (!committed) {
        return unexpected(committed.error());
    }

    outcome.etag = std::move(committed.value().etag);
    outcome.last_modified = std::move(committed.value().last_modified);

    if (spec.kind == blob_kind::block) {
        BT_LOG_DEBUG(log_category::coordinator,
                     "committed block list of " + std::to_string(outcome.tokens.size()) +
                         " blocks");
    }
    return {};
}

}  // namespace kcenon::blob_transfer
