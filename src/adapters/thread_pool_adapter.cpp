// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file thread_pool_adapter.cpp
 * @brief Worker pool adapter implementation
 */

#include "kcenon/blob_transfer/adapters/thread_pool_adapter.h"

#include <stdexcept>
#include <thread>

#if KCENON_WITH_THREAD_SYSTEM
// Suppress deprecation warnings from thread_system headers
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wdeprecated-declarations"
#include <kcenon/thread/core/job.h>
#include <kcenon/thread/core/job_queue.h>
#include <kcenon/thread/core/thread_worker.h>
#pragma clang diagnostic pop
#endif

namespace kcenon::blob_transfer::adapters {

namespace {

class stage_tracker {
public:
    void increment(const std::string& stage_name) {
        std::lock_guard<std::mutex> lock(mutex_);
        ++counts_[stage_name];
    }

    void decrement(const std::string& stage_name) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = counts_.find(stage_name);
        if (it != counts_.end() && it->second > 0) {
            --it->second;
        }
    }

    [[nodiscard]] size_t count(const std::string& stage_name) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = counts_.find(stage_name);
        return it != counts_.end() ? it->second : 0;
    }

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, size_t> counts_;
};

auto resolve_worker_count(size_t requested) -> size_t {
    if (requested > 0) {
        return requested;
    }
    auto hw = std::thread::hardware_concurrency();
    return hw > 0 ? hw : 4;
}

}  // namespace

// ============================================================================
// thread_system_pool_adapter
// ============================================================================

#if KCENON_WITH_THREAD_SYSTEM

class function_job : public kcenon::thread::job {
public:
    explicit function_job(std::function<void()> func, const std::string& name = "blob_task")
        : job(name), func_(std::move(func)) {}

    [[nodiscard]] auto do_work() -> common::VoidResult override {
        if (func_) {
            func_();
        }
        return common::ok();
    }

private:
    std::function<void()> func_;
};

struct thread_system_pool_adapter::impl {
    std::shared_ptr<kcenon::thread::thread_pool> pool;
    std::string pool_name;
    size_t worker_count{0};
    bool owns_pool{false};
    std::atomic<bool> stopped{false};
    stage_tracker tracker;

    auto enqueue(std::function<void()> body, const char* job_name) -> std::future<void> {
        auto promise = std::make_shared<std::promise<void>>();
        auto future = promise->get_future();

        auto wrapped = [body = std::move(body), promise]() {
            try {
                body();
                promise->set_value();
            } catch (...) {
                promise->set_exception(std::current_exception());
            }
        };

        auto job = std::make_unique<function_job>(std::move(wrapped), job_name);
        auto enqueued = pool->enqueue(std::move(job));
        if (!enqueued.is_ok()) {
            promise->set_exception(std::make_exception_ptr(
                std::runtime_error(pool_name + ": failed to enqueue " + job_name)));
        }
        return future;
    }

    void shutdown(bool wait_for_completion) {
        bool expected = false;
        if (!stopped.compare_exchange_strong(expected, true)) {
            return;
        }
        if (pool && owns_pool) {
            pool->stop(!wait_for_completion);
        }
    }
};

thread_system_pool_adapter::thread_system_pool_adapter(
    std::shared_ptr<kcenon::thread::thread_pool> pool,
    const std::string& pool_name,
    size_t worker_count,
    bool owns_pool)
    : pimpl_(std::make_unique<impl>()) {
    pimpl_->pool = std::move(pool);
    pimpl_->pool_name = pool_name;
    pimpl_->worker_count = worker_count;
    pimpl_->owns_pool = owns_pool;
}

thread_system_pool_adapter::~thread_system_pool_adapter() {
    if (pimpl_) {
        pimpl_->shutdown(true);
    }
}

thread_system_pool_adapter::thread_system_pool_adapter(thread_system_pool_adapter&&) noexcept =
    default;

thread_system_pool_adapter& thread_system_pool_adapter::operator=(
    thread_system_pool_adapter&&) noexcept = default;

std::shared_ptr<thread_system_pool_adapter> thread_system_pool_adapter::create_default(
    size_t worker_count, const std::string& pool_name) {
    worker_count = resolve_worker_count(worker_count);

    auto pool = std::make_shared<kcenon::thread::thread_pool>(pool_name);
    for (size_t i = 0; i < worker_count; ++i) {
        auto worker = std::make_unique<kcenon::thread::thread_worker>();
        worker->set_job_queue(pool->get_job_queue());
        pool->enqueue(std::move(worker));
    }
    pool->start();

    return std::make_shared<thread_system_pool_adapter>(std::move(pool), pool_name, worker_count,
                                                        true);
}

std::future<void> thread_system_pool_adapter::submit(std::function<void()> task) {
    return pimpl_->enqueue(std::move(task), "blob_task");
}

std::future<void> thread_system_pool_adapter::submit_to_stage(std::function<void()> task,
                                                              const std::string& stage_name) {
    pimpl_->tracker.increment(stage_name);

    // The adapter outlives its tasks: stop() drains the pool first
    auto* tracker = &pimpl_->tracker;
    auto staged = [task = std::move(task), tracker, stage = stage_name]() {
        try {
            task();
        } catch (...) {
            tracker->decrement(stage);
            throw;
        }
        tracker->decrement(stage);
    };

    return pimpl_->enqueue(std::move(staged), "blob_stage_task");
}

size_t thread_system_pool_adapter::worker_count() const {
    return pimpl_->worker_count;
}

bool thread_system_pool_adapter::is_running() const {
    return pimpl_->pool != nullptr && !pimpl_->stopped.load();
}

size_t thread_system_pool_adapter::pending_tasks() const {
    if (pimpl_->pool) {
        auto queue = pimpl_->pool->get_job_queue();
        return queue ? queue->size() : 0;
    }
    return 0;
}

size_t thread_system_pool_adapter::pending_tasks(const std::string& stage_name) const {
    return pimpl_->tracker.count(stage_name);
}

void thread_system_pool_adapter::stop(bool wait_for_completion) {
    pimpl_->shutdown(wait_for_completion);
}

std::shared_ptr<kcenon::thread::thread_pool> thread_system_pool_adapter::underlying_pool() const {
    return pimpl_->pool;
}

std::string thread_system_pool_adapter::pool_name() const {
    return pimpl_->pool_name;
}

#endif  // KCENON_WITH_THREAD_SYSTEM

// ============================================================================
// async_worker_pool
// ============================================================================

struct async_worker_pool::impl {
    size_t worker_count{0};
    std::atomic<size_t> active_tasks{0};
    std::atomic<bool> running{true};
    stage_tracker tracker;
};

async_worker_pool::async_worker_pool(size_t worker_count) : pimpl_(std::make_unique<impl>()) {
    pimpl_->worker_count = resolve_worker_count(worker_count);
}

async_worker_pool::~async_worker_pool() = default;

std::future<void> async_worker_pool::submit(std::function<void()> task) {
    if (!pimpl_->running.load()) {
        std::promise<void> rejected;
        rejected.set_exception(
            std::make_exception_ptr(std::runtime_error("worker pool is stopped")));
        return rejected.get_future();
    }

    pimpl_->active_tasks.fetch_add(1, std::memory_order_relaxed);

    auto* pimpl = pimpl_.get();
    return std::async(std::launch::async, [pimpl, task = std::move(task)]() {
        try {
            task();
        } catch (...) {
            pimpl->active_tasks.fetch_sub(1, std::memory_order_relaxed);
            throw;
        }
        pimpl->active_tasks.fetch_sub(1, std::memory_order_relaxed);
    });
}

std::future<void> async_worker_pool::submit_to_stage(std::function<void()> task,
                                                     const std::string& stage_name) {
    if (!pimpl_->running.load()) {
        return submit(std::move(task));
    }
    pimpl_->tracker.increment(stage_name);

    auto* pimpl = pimpl_.get();
    return submit([pimpl, task = std::move(task), stage = stage_name]() {
        try {
            task();
        } catch (...) {
            pimpl->tracker.decrement(stage);
            throw;
        }
        pimpl->tracker.decrement(stage);
    });
}

size_t async_worker_pool::worker_count() const {
    return pimpl_->worker_count;
}

bool async_worker_pool::is_running() const {
    return pimpl_->running.load();
}

size_t async_worker_pool::pending_tasks() const {
    return pimpl_->active_tasks.load(std::memory_order_relaxed);
}

size_t async_worker_pool::pending_tasks(const std::string& stage_name) const {
    return pimpl_->tracker.count(stage_name);
}

void async_worker_pool::stop([[maybe_unused]] bool wait_for_completion) {
    // std::async futures join on destruction, so running tasks always finish
    pimpl_->running.store(false);
}

// ============================================================================
// worker_pool_factory
// ============================================================================

std::shared_ptr<worker_pool_interface> worker_pool_factory::create(size_t worker_count,
                                                                   const std::string& pool_name) {
#if KCENON_WITH_THREAD_SYSTEM
    return thread_system_pool_adapter::create_default(worker_count, pool_name);
#else
    (void)pool_name;
    return std::make_shared<async_worker_pool>(worker_count);
#endif
}

}  // namespace kcenon::blob_transfer::adapters
