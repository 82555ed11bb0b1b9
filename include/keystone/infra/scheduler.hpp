/*
 * AEVUMDB COMMUNITY LICENSE
 * Version 1.0, February 2026
 *
 * Copyright (c) 2026 Ananda Firmansyah.
 * Official Organization: AevumDB (https://github.com/aevumdb)
 *
 * This source code is licensed under the AevumDB Community License.
 * You may not use this file except in compliance with the License.
 */

/**
 * @file scheduler.hpp
 * @brief Worker pool and the task/future contract for asynchronous operations.
 *
 * @details
 * Every asynchronous Keystone operation (identifier assignment, eager counter
 * verification) is handed to a `Scheduler` and observed through a `std::future`.
 * Operations that never touch the store are still routed through the pool so that
 * callers see one uniform suspend-and-resume contract.
 */

#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <type_traits>
#include <vector>

namespace keystone::infra {

/**
 * @class Scheduler
 * @brief A thread-safe worker pool for executing tasks asynchronously.
 *
 * @details
 * The Scheduler maintains a fixed cohort of worker threads and a FIFO task queue.
 *
 * **Concurrency Model:**
 * - **Producers:** Any thread can `enqueue()` or `submit()` a task.
 * - **Consumers:** Worker threads sleep on a condition variable until work is available.
 * - **Shutdown:** The destructor drains the queue before joining the workers, so every
 *   future obtained from `submit()` becomes ready.
 */
class Scheduler {
  public:
    /**
     * @brief Initializes the thread pool and spawns worker threads.
     *
     * @param threads The number of worker threads to spawn. A value of 0 (which
     * `hardware_concurrency()` may report) is raised to 1.
     */
    explicit Scheduler(size_t threads = std::thread::hardware_concurrency());

    /**
     * @brief Drains pending tasks and joins every worker.
     *
     * @note Blocking.
     */
    ~Scheduler();

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    /**
     * @brief Submits a fire-and-forget task.
     *
     * @param task The unit of work. An exception escaping it terminates the process;
     * use `submit()` to capture exceptions in a future.
     */
    void enqueue(std::function<void()> task);

    /**
     * @brief Schedules `fn` on the next free worker and returns its result as a future.
     *
     * Exceptions thrown by `fn` are captured and rethrown from `std::future::get()`.
     *
     * @code
     * std::future<std::string> id = scheduler.submit([] { return UuidGenerator::generate(); });
     * @endcode
     */
    template <typename F> auto submit(F&& fn) -> std::future<std::invoke_result_t<std::decay_t<F>>>
    {
        using Result = std::invoke_result_t<std::decay_t<F>>;

        // std::function requires copyable targets; packaged_task is move-only.
        auto task = std::make_shared<std::packaged_task<Result()>>(std::forward<F>(fn));
        std::future<Result> result = task->get_future();
        enqueue([task]() { (*task)(); });
        return result;
    }

    /// @brief Number of worker threads owned by this pool.
    size_t size() const
    {
        return workers_.size();
    }

  private:
    /// @brief The container of active worker threads managed by this pool.
    std::vector<std::thread> workers_;

    /// @brief A FIFO queue storing pending tasks waiting for a worker.
    std::queue<std::function<void()>> tasks_;

    /// @brief Synchronization primitive protecting access to the `tasks_` queue.
    std::mutex queue_mutex_;

    /// @brief Signaling mechanism used to wake up workers or notify shutdown.
    std::condition_variable condition_;

    /// @brief Atomic flag controlling the lifecycle of the event loops.
    std::atomic<bool> stop_;
};

} // namespace keystone::infra
