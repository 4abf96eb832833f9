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
 * @brief Implementation of the worker pool.
 */

#include "idforge/infra/scheduler.hpp"

#include "idforge/infra/logger.hpp"

#include <string>

namespace idforge::infra {

namespace {

size_t resolve_thread_count(size_t requested)
{
    if (requested > 0) {
        return requested;
    }
    size_t hw = std::thread::hardware_concurrency();
    return hw > 0 ? hw : 2;
}

} // namespace

Scheduler::Scheduler(size_t threads) : stop_(false)
{
    const size_t count = resolve_thread_count(threads);
    workers_.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        workers_.emplace_back(&Scheduler::run_worker, this);
    }

    Logger::log(LogLevel::DEBUG, "Scheduler: " + std::to_string(count) + " workers online.");
}

void Scheduler::run_worker()
{
    for (;;) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            condition_.wait(lock, [this] { return stop_ || !tasks_.empty(); });

            // A stopped worker exits only once the queue is drained.
            if (tasks_.empty()) {
                return;
            }
            task = std::move(tasks_.front());
            tasks_.pop();
        }
        task();
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
 * Appends the callable to the shared queue and wakes a single worker.
 */
void Scheduler::enqueue(std::function<void()> task)
{
    {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        tasks_.emplace(std::move(task));
    }

    condition_.notify_one();
}

} // namespace idforge::infra
