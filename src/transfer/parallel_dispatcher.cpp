/**
 * @file parallel_dispatcher.cpp
 * @brief Implementation of parallel_dispatcher
 */

#include <kcenon/blob_transfer/transfer/parallel_dispatcher.h>

#include <kcenon/blob_transfer/core/logging.h>

#include <algorithm>
#include <exception>
#include <future>
#include <vector>

namespace kcenon::blob_transfer {

parallel_dispatcher::parallel_dispatcher(std::shared_ptr<adapters::worker_pool_interface> pool)
    : pool_(std::move(pool)) {}

void parallel_dispatcher::record_failure(error failure) {
    std::lock_guard lock(failure_mutex_);
    if (!first_failure_) {
        first_failure_ = std::move(failure);
    }
    flag_.cancel();
}

auto parallel_dispatcher::run(uint64_t task_count,
                              int parallelism,
                              const task_function& task,
                              const std::string& stage_name) -> result<void> {
    if (parallelism < 1) {
        return unexpected{error{error_code::invalid_parallelism,
                                "parallelism must be at least 1"}};
    }
    if (!pool_) {
        return unexpected{error{error_code::not_initialized, "no worker pool"}};
    }
    if (task_count == 0) {
        return {};
    }

    auto lanes = static_cast<uint64_t>(parallelism) < task_count
                     ? static_cast<uint64_t>(parallelism)
                     : task_count;
    std::atomic<uint64_t> next_index{0};

    auto lane = [this, &next_index, &task, task_count]() {
        while (!flag_.is_cancelled()) {
            auto index = next_index.fetch_add(1, std::memory_order_relaxed);
            if (index >= task_count) {
                return;
            }

            result<void> outcome;
            try {
                outcome = task(index, flag_);
            } catch (const std::exception& e) {
                outcome = unexpected{error{error_code::internal_error,
                                           std::string("task threw: ") + e.what()}};
            }

            if (!outcome) {
                record_failure(outcome.error());
                return;
            }
        }
    };

    std::vector<std::future<void>> futures;
    futures.reserve(static_cast<std::size_t>(lanes));
    for (uint64_t i = 0; i < lanes; ++i) {
        try {
            futures.push_back(pool_->submit_to_stage(lane, stage_name));
        } catch (const std::exception& e) {
            record_failure(error{error_code::internal_error,
                                 stage_name + ": cannot start lane: " + e.what()});
            break;
        }
    }

    BT_LOG_DEBUG(log_category::dispatch,
                 stage_name + ": " + std::to_string(task_count) + " tasks on " +
                     std::to_string(lanes) + " lanes");

    for (auto& future : futures) {
        try {
            future.get();
        } catch (const std::exception& e) {
            record_failure(error{error_code::internal_error,
                                 stage_name + " lane failed: " + e.what()});
        } catch (...) {
            record_failure(error{error_code::internal_error,
                                 stage_name + " lane failed with a non-standard exception"});
        }
    }

    std::lock_guard lock(failure_mutex_);
    if (first_failure_) {
        return unexpected{*first_failure_};
    }
    return {};
}

}  // namespace kcenon::blob_transfer
