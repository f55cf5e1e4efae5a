// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file thread_pool_adapter.h
 * @brief Worker pool adapter for block and chunk tasks
 *
 * Upload and download lanes run on a worker pool. The pool is backed by
 * thread_system when it is linked and by std::async otherwise.
 *
 * Features:
 * - Stage-based task tracking ("stage_block", "download_chunk")
 * - Per-transfer pools sized to the requested parallelism
 * - Shared pools injected through transfer_manager::builder
 */

#pragma once

#include <atomic>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "../config/feature_flags.h"

#if KCENON_WITH_THREAD_SYSTEM
#include <kcenon/thread/core/thread_pool.h>
#endif

namespace kcenon::blob_transfer::adapters {

/**
 * @brief Interface of the pool that executes transfer lanes
 */
class worker_pool_interface {
public:
    virtual ~worker_pool_interface() = default;

    /**
     * @brief Submit a task for execution
     * @return Future that completes (or rethrows) with the task
     */
    virtual std::future<void> submit(std::function<void()> task) = 0;

    /**
     * @brief Submit a task counted under a stage name
     *
     * Execution is identical to submit(); pending_tasks(stage_name) reports
     * tasks of that stage that have not finished yet.
     */
    virtual std::future<void> submit_to_stage(std::function<void()> task,
                                              const std::string& stage_name) = 0;

    [[nodiscard]] virtual size_t worker_count() const = 0;

    [[nodiscard]] virtual bool is_running() const = 0;

    [[nodiscard]] virtual size_t pending_tasks() const = 0;

    [[nodiscard]] virtual size_t pending_tasks(const std::string& stage_name) const = 0;

    /**
     * @brief Stop accepting work and release the workers
     * @param wait_for_completion Drain queued tasks before stopping
     */
    virtual void stop(bool wait_for_completion = true) = 0;
};

#if KCENON_WITH_THREAD_SYSTEM

/**
 * @brief Adapter over thread_system's thread_pool
 *
 * @note Thread-safe: All public methods are safe to call from multiple threads.
 */
class thread_system_pool_adapter : public worker_pool_interface {
public:
    /**
     * @param pool Started thread_pool
     * @param pool_name Name used in logs
     * @param worker_count Number of workers in the pool (for reporting)
     * @param owns_pool Stop the pool when the adapter is destroyed
     */
    explicit thread_system_pool_adapter(std::shared_ptr<kcenon::thread::thread_pool> pool,
                                        const std::string& pool_name = "blob_transfer_pool",
                                        size_t worker_count = 0,
                                        bool owns_pool = false);

    ~thread_system_pool_adapter() override;

    thread_system_pool_adapter(const thread_system_pool_adapter&) = delete;
    thread_system_pool_adapter& operator=(const thread_system_pool_adapter&) = delete;

    thread_system_pool_adapter(thread_system_pool_adapter&&) noexcept;
    thread_system_pool_adapter& operator=(thread_system_pool_adapter&&) noexcept;

    /**
     * @brief Create and start a pool owned by the adapter
     * @param worker_count Number of worker threads (0 = hardware concurrency)
     */
    [[nodiscard]] static std::shared_ptr<thread_system_pool_adapter> create_default(
        size_t worker_count = 0,
        const std::string& pool_name = "blob_transfer_pool");

    std::future<void> submit(std::function<void()> task) override;
    std::future<void> submit_to_stage(std::function<void()> task,
                                      const std::string& stage_name) override;

    [[nodiscard]] size_t worker_count() const override;
    [[nodiscard]] bool is_running() const override;
    [[nodiscard]] size_t pending_tasks() const override;
    [[nodiscard]] size_t pending_tasks(const std::string& stage_name) const override;
    void stop(bool wait_for_completion = true) override;

    [[nodiscard]] std::shared_ptr<kcenon::thread::thread_pool> underlying_pool() const;

    [[nodiscard]] std::string pool_name() const;

private:
    struct impl;
    std::unique_ptr<impl> pimpl_;
};

#endif  // KCENON_WITH_THREAD_SYSTEM

/**
 * @brief Fallback pool using std::async
 *
 * Every submitted task gets its own thread, so the number of concurrent
 * tasks equals the number of lanes the caller submits. worker_count()
 * reports the configured lane count.
 */
class async_worker_pool : public worker_pool_interface {
public:
    explicit async_worker_pool(size_t worker_count = 0);
    ~async_worker_pool() override;

    async_worker_pool(const async_worker_pool&) = delete;
    async_worker_pool& operator=(const async_worker_pool&) = delete;

    std::future<void> submit(std::function<void()> task) override;
    std::future<void> submit_to_stage(std::function<void()> task,
                                      const std::string& stage_name) override;

    [[nodiscard]] size_t worker_count() const override;
    [[nodiscard]] bool is_running() const override;
    [[nodiscard]] size_t pending_tasks() const override;
    [[nodiscard]] size_t pending_tasks(const std::string& stage_name) const override;
    void stop(bool wait_for_completion = true) override;

private:
    struct impl;
    std::unique_ptr<impl> pimpl_;
};

/**
 * @brief Creates the best available pool
 *
 * 1. thread_system_pool_adapter (when KCENON_WITH_THREAD_SYSTEM)
 * 2. async_worker_pool (fallback)
 */
class worker_pool_factory {
public:
    /**
     * @param worker_count Number of worker threads (0 = hardware concurrency)
     * @param pool_name Name used in logs
     */
    [[nodiscard]] static std::shared_ptr<worker_pool_interface> create(
        size_t worker_count = 0,
        const std::string& pool_name = "blob_transfer_pool");

    [[nodiscard]] static constexpr bool has_thread_system() noexcept {
#if KCENON_WITH_THREAD_SYSTEM
        return true;
#else
        return false;
#endif
    }
};

}  // namespace kcenon::blob_transfer::adapters
