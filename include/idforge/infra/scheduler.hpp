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
 * @brief Thread pool used to run batch generation chunks.
 *
 * @details
 * This header defines the `Scheduler` class, a fixed-size implementation of the
 * Producer-Consumer pattern. The batch engine creates one scheduler at
 * construction and reuses it for every batch call, so no threads are spawned or
 * joined on the request path.
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
#include <utility>
#include <vector>

namespace idforge::infra {

/**
 * @class Scheduler
 * @brief Fixed-size worker pool with future-returning submission.
 *
 * @details
 * Workers pull from a single FIFO queue. Any thread may `enqueue()` or
 * `submit()`; idle workers block on the condition variable.
 */
class Scheduler {
  public:
    /**
     * @brief Initializes the thread pool and spawns worker threads.
     *
     * @param threads The number of worker threads to spawn. A value of 0 selects
     * `std::thread::hardware_concurrency()`, falling back to 2 when that is unknown.
     */
    explicit Scheduler(size_t threads = 0);

    /**
     * @brief Destructor. Initiates a graceful shutdown of the pool.
     *
     * Sets the stop flag, wakes every worker and joins them. Tasks already queued
     * are drained before the workers exit.
     */
    ~Scheduler();

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    /**
     * @brief Submits a fire-and-forget task.
     *
     * @warning An exception escaping @p task terminates the process. Use `submit()`
     * when the task can fail.
     */
    void enqueue(std::function<void()> task);

    /**
     * @brief Submits a task and returns a future for its result.
     *
     * Exceptions thrown by @p fn are captured in the returned future and rethrown
     * by `std::future::get()`.
     *
     * @code
     * auto f = scheduler.submit([] { return 42; });
     * int v = f.get();
     * @endcode
     */
    template <typename F> auto submit(F&& fn) -> std::future<std::invoke_result_t<F>>
    {
        using R = std::invoke_result_t<F>;
        // std::function needs a copyable callable, hence the shared_ptr.
        auto task = std::make_shared<std::packaged_task<R()>>(std::forward<F>(fn));
        std::future<R> result = task->get_future();
        enqueue([task]() { (*task)(); });
        return result;
    }

    /// @brief Number of worker threads owned by the pool.
    size_t size() const { return workers_.size(); }

  private:
    /// @brief Worker body: pops and runs tasks until stopped and drained.
    void run_worker();

    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;

    /// @brief Guards `tasks_`; `condition_` is signalled on push and on shutdown.
    std::mutex queue_mutex_;
    std::condition_variable condition_;

    std::atomic<bool> stop_;
};

} // namespace idforge::infra
