/**
 * @file worker_pool.hpp
 * @brief Fixed-size worker pool fed by a work channel, reporting on a results channel
 *
 * @date 2025
 */

#pragma once

#include "patchbench/core/instance.hpp"

#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

namespace patchbench {
namespace core {

/**
 * @class Channel
 * @brief Unbounded multi-producer multi-consumer FIFO
 *
 * Pop() blocks until an item arrives or the channel is closed and drained.
 */
template <typename T>
class Channel {
public:
    Channel() = default;

    Channel(const Channel&) = delete;
    Channel& operator=(const Channel&) = delete;

    /**
     * @return false if the channel is closed
     */
    bool Push(T item) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) {
                return false;
            }
            items_.push_back(std::move(item));
        }
        available_.notify_one();
        return true;
    }

    /**
     * @return Next item, or nullopt once closed and empty
     */
    std::optional<T> Pop() {
        std::unique_lock<std::mutex> lock(mutex_);
        available_.wait(lock, [this] { return !items_.empty() || closed_; });

        if (items_.empty()) {
            return std::nullopt;
        }

        T item = std::move(items_.front());
        items_.pop_front();
        return item;
    }

    void Close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        available_.notify_all();
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable available_;
    std::deque<T> items_;
    bool closed_{false};
};

/// Runs one instance on a worker; must not throw for the pool to stay exact
using InstanceProcessor = std::function<InstanceResult(const InstanceSpec&, std::size_t worker_id)>;

/**
 * @class WorkerPool
 * @brief N workers, one instance per worker at a time
 *
 * Specs are taken from the work channel in submission order. Every submitted
 * spec produces exactly one result on the results channel, even when the
 * processor throws. The results channel closes after Close() once every
 * worker has drained the queue.
 *
 * **Usage Example**:
 * @code
 * WorkerPool pool(4);
 * pool.Start([&](const InstanceSpec& spec, std::size_t) { return orchestrator.RunInstance(spec); });
 * for (const auto& spec : specs) pool.Submit(spec);
 * pool.Close();
 * while (auto result = pool.NextResult()) {
 *     reporter.Add(*result);
 * }
 * @endcode
 */
class WorkerPool {
public:
    explicit WorkerPool(std::size_t workers);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    bool Start(InstanceProcessor processor);

    /**
     * @return false if the pool is not running or already closed
     */
    bool Submit(InstanceSpec spec);

    /**
     * @brief No more submissions; workers exit after the queue drains
     */
    void Close();

    /**
     * @brief Block for the next completed result; nullopt when all are delivered
     */
    std::optional<InstanceResult> NextResult();

    /**
     * @brief Close and join all workers
     */
    void Join();

    std::size_t WorkerCount() const { return workers_; }
    std::size_t BusyCount() const { return busy_.load(); }
    std::size_t PeakBusyCount() const { return peak_busy_.load(); }

private:
    void WorkerLoop(std::size_t worker_id);

    std::size_t workers_;
    InstanceProcessor processor_;

    Channel<InstanceSpec> work_;
    Channel<InstanceResult> results_;

    std::atomic<bool> running_{false};
    std::atomic<std::size_t> live_workers_{0};
    std::atomic<std::size_t> busy_{0};
    std::atomic<std::size_t> peak_busy_{0};

    std::vector<std::thread> threads_;
};

} // namespace core
} // namespace patchbench
