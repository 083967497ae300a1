// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file thread_pool_adapter.h
 * @brief Worker pool adapter for parallel chunk uploads
 *
 * This adapter provides a unified pool interface for the transfer engine,
 * supporting both thread_system integration and a standalone fallback.
 *
 * Features:
 * - Seamless integration with thread_system when available
 * - Fallback to std::async when thread_system is unavailable
 * - Pending task accounting for tests and diagnostics
 */

#pragma once

#include <atomic>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <string>

#include "../config/feature_flags.h"

#if KCENON_WITH_THREAD_SYSTEM
#include <kcenon/thread/core/thread_pool.h>
#endif

namespace kcenon::blob_transfer::adapters {

/**
 * @brief Interface for the pool that runs upload workers
 *
 * The coordinator bounds concurrency itself by submitting exactly
 * `parallelism` long-running worker tasks, so implementations only need
 * to run each submitted task on some thread.
 */
class upload_pool_interface {
public:
    virtual ~upload_pool_interface() = default;

    /**
     * @brief Submit a task for execution
     * @param task The task to execute
     * @return Future for the task completion
     */
    virtual std::future<void> submit(std::function<void()> task) = 0;

    /**
     * @brief Get the number of worker threads
     * @return Worker thread count
     */
    [[nodiscard]] virtual size_t worker_count() const = 0;

    /**
     * @brief Check if the pool is running
     * @return true if the pool is active
     */
    [[nodiscard]] virtual bool is_running() const = 0;

    /**
     * @brief Get number of submitted tasks that have not finished
     * @return Pending task count
     */
    [[nodiscard]] virtual size_t pending_tasks() const = 0;
};

#if KCENON_WITH_THREAD_SYSTEM

/**
 * @brief Adapter that wraps thread_system::thread_pool for uploads
 *
 * @note Thread-safe: All public methods are safe to call from multiple threads.
 */
class thread_system_upload_pool : public upload_pool_interface {
public:
    /**
     * @brief Construct with an existing thread_pool
     * @param pool Shared pointer to thread_system's thread_pool
     * @param pool_name Name for identification in logs
     * @param worker_count Number of workers in the pool (for reporting)
     */
    explicit thread_system_upload_pool(
        std::shared_ptr<kcenon::thread::thread_pool> pool,
        const std::string& pool_name = "blob_upload_pool",
        size_t worker_count = 0);

    ~thread_system_upload_pool() override;

    // Non-copyable
    thread_system_upload_pool(const thread_system_upload_pool&) = delete;
    thread_system_upload_pool& operator=(const thread_system_upload_pool&) = delete;

    // Movable
    thread_system_upload_pool(thread_system_upload_pool&&) noexcept;
    thread_system_upload_pool& operator=(thread_system_upload_pool&&) noexcept;

    /**
     * @brief Factory method to create a started pool
     * @param worker_count Number of worker threads (0 = auto-detect from hardware)
     * @param pool_name Name for identification
     * @return Shared pointer to the adapter
     */
    [[nodiscard]] static std::shared_ptr<thread_system_upload_pool> create_default(
        size_t worker_count = 0,
        const std::string& pool_name = "blob_upload_pool");

    std::future<void> submit(std::function<void()> task) override;

    [[nodiscard]] size_t worker_count() const override;
    [[nodiscard]] bool is_running() const override;
    [[nodiscard]] size_t pending_tasks() const override;

    /**
     * @brief Get the underlying thread_pool
     */
    [[nodiscard]] std::shared_ptr<kcenon::thread::thread_pool> underlying_pool() const;

private:
    struct impl;
    std::unique_ptr<impl> pimpl_;
};

#endif  // KCENON_WITH_THREAD_SYSTEM

/**
 * @brief Fallback implementation using std::async
 *
 * Every submitted task gets its own thread. worker_count() reports the
 * configured worker count.
 */
class async_upload_pool : public upload_pool_interface {
public:
    explicit async_upload_pool(size_t worker_count = 0);
    ~async_upload_pool() override;

    // Non-copyable
    async_upload_pool(const async_upload_pool&) = delete;
    async_upload_pool& operator=(const async_upload_pool&) = delete;

    std::future<void> submit(std::function<void()> task) override;

    [[nodiscard]] size_t worker_count() const override;
    [[nodiscard]] bool is_running() const override;
    [[nodiscard]] size_t pending_tasks() const override;

private:
    struct impl;
    std::unique_ptr<impl> pimpl_;
};

/**
 * @brief Factory for creating the appropriate pool
 *
 * Selects thread_system_upload_pool when KCENON_WITH_THREAD_SYSTEM is set,
 * async_upload_pool otherwise.
 */
class upload_pool_factory {
public:
    /**
     * @brief Create the best available pool
     * @param worker_count Number of worker threads (0 = auto-detect)
     * @param pool_name Name for identification
     * @return Shared pointer to the pool
     */
    [[nodiscard]] static std::shared_ptr<upload_pool_interface> create(
        size_t worker_count = 0,
        const std::string& pool_name = "blob_upload_pool");

    /**
     * @brief Check if thread_system is available
     */
    [[nodiscard]] static constexpr bool has_thread_system() noexcept {
#if KCENON_WITH_THREAD_SYSTEM
        return true;
#else
        return false;
#endif
    }
};

}  // namespace kcenon::blob_transfer::adapters
