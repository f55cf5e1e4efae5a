/**
 * @file parallel_dispatcher.h
 * @brief Bounded parallel execution of per-block and per-chunk tasks
 */

#ifndef KCENON_BLOB_TRANSFER_TRANSFER_PARALLEL_DISPATCHER_H
#define KCENON_BLOB_TRANSFER_TRANSFER_PARALLEL_DISPATCHER_H

#include <kcenon/blob_transfer/adapters/thread_pool_adapter.h>
#include <kcenon/blob_transfer/core/transfer_options.h>
#include <kcenon/blob_transfer/core/types.h>

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace kcenon::blob_transfer {

/**
 * @brief Cancellation flag shared by the tasks of one transfer
 */
class cancellation_flag {
public:
    void cancel() noexcept { cancelled_.store(true, std::memory_order_release); }

    [[nodiscard]] auto is_cancelled() const noexcept -> bool {
        return cancelled_.load(std::memory_order_acquire);
    }

private:
    std::atomic<bool> cancelled_{false};
};

/**
 * @brief Thread-safe progress accumulator
 *
 * The running total is updated under a lock; the callback runs outside it,
 * so concurrent lanes may report their totals out of order.
 */
class progress_reporter {
public:
    progress_reporter(uint64_t total, progress_callback callback)
        : total_(total), callback_(std::move(callback)) {}

    void add(uint64_t bytes) {
        uint64_t transferred = 0;
        {
            std::lock_guard lock(mutex_);
            transferred_ += bytes;
            transferred = transferred_;
        }
        if (callback_) {
            callback_(transferred, total_);
        }
    }

    [[nodiscard]] auto transferred() const -> uint64_t {
        std::lock_guard lock(mutex_);
        return transferred_;
    }

    [[nodiscard]] auto total() const -> uint64_t { return total_; }

private:
    uint64_t total_;
    uint64_t transferred_ = 0;
    progress_callback callback_;
    mutable std::mutex mutex_;
};

/**
 * @brief Runs task_count indexed tasks on at most parallelism lanes
 *
 * Each lane pulls the next index until none are left or the transfer is
 * cancelled. The first failing task records its error and cancels the
 * transfer; run() then returns that error once every lane has stopped.
 * Exceptions escaping a task are reported as internal_error.
 *
 * A dispatcher serves one transfer; its flag is never reset.
 */
class parallel_dispatcher {
public:
    using task_function = std::function<result<void>(uint64_t index, const cancellation_flag&)>;

    explicit parallel_dispatcher(std::shared_ptr<adapters::worker_pool_interface> pool);

    /**
     * @param task_count Number of tasks (indices 0 .. task_count - 1)
     * @param parallelism Maximum number of concurrently running tasks
     * @param task Task body
     * @param stage_name Stage the lanes are counted under
     */
    [[nodiscard]] auto run(uint64_t task_count,
                           int parallelism,
                           const task_function& task,
                           const std::string& stage_name) -> result<void>;

    /**
     * @brief Flag shared by every task this dispatcher ran
     */
    [[nodiscard]] auto flag() const -> const cancellation_flag& { return flag_; }

private:
    void record_failure(error failure);

    std::shared_ptr<adapters::worker_pool_interface> pool_;
    cancellation_flag flag_;
    std::mutex failure_mutex_;
    std::optional<error> first_failure_;
};

}  // namespace kcenon::blob_transfer

#endif  // KCENON_BLOB_TRANSFER_TRANSFER_PARALLEL_DISPATCHER_H
