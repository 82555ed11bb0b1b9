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
 * @file scheduler.cpp
 * @brief Implementation of the worker pool backing Keystone's futures.
 */

#include "keystone/infra/scheduler.hpp"

#include <stdexcept>

namespace keystone::infra {

/**
 * @brief Constructs the scheduler and initializes the worker cohort.
 *
 * @details
 * Each worker loops: wait for a task or shutdown, pop under the lock, run outside it.
 * A worker exits only once shutdown is requested and the queue is empty, so tasks
 * queued before destruction still complete and their futures resolve.
 */
Scheduler::Scheduler(size_t threads) : stop_(false)
{
    if (threads == 0) {
        threads = 1;
    }

    for (size_t i = 0; i < threads; ++i) {
        workers_.emplace_back([this] {
            while (true) {
                std::function<void()> task;

                {
                    std::unique_lock<std::mutex> lock(this->queue_mutex_);

                    this->condition_.wait(lock,
                                          [this] { return this->stop_ || !this->tasks_.empty(); });

                    if (this->stop_ && this->tasks_.empty()) {
                        return;
                    }

                    task = std::move(this->tasks_.front());
                    this->tasks_.pop();
                }

                if (task) {
                    task();
                }
            }
        });
    }
}

Scheduler::~Scheduler()
{
    {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        stop_ = true;
    }

    condition_.notify_all();

    for (std::thread& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

/**
 * @brief Dispatches a new task to the worker pool.
 *
 * @throws std::runtime_error If the pool is already shutting down; a task accepted then
 * might never run and its future would never resolve.
 */
void Scheduler::enqueue(std::function<void()> task)
{
    {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        if (stop_) {
            throw std::runtime_error("Scheduler: enqueue on a stopped pool");
        }
        tasks_.emplace(std::move(task));
    }

    condition_.notify_one();
}

} // namespace keystone::infra
