/**
 * @file worker_pool.cpp
 * @brief Worker pool implementation
 *
 * @date 2025
 */

#include "patchbench/core/worker_pool.hpp"

#include <spdlog/spdlog.h>

namespace patchbench {
namespace core {

WorkerPool::WorkerPool(std::size_t workers)
    : workers_(workers == 0 ? 1 : workers) {
    spdlog::debug("Worker pool created with {} workers", workers_);
}

WorkerPool::~WorkerPool() {
    Join();
}

bool WorkerPool::Start(InstanceProcessor processor) {
    if (running_.load()) {
        spdlog::warn("Worker pool already running");
        return false;
    }

    if (!processor) {
        spdlog::error("Invalid instance processor provided");
        return false;
    }

    processor_ = std::move(processor);
    running_.store(true);
    live_workers_.store(workers_);

    try {
        threads_.reserve(workers_);
        for (std::size_t i = 0; i < workers_; ++i) {
            threads_.emplace_back(&WorkerPool::WorkerLoop, this, i);
        }
    }
    catch (const std::system_error& e) {
        spdlog::error("Failed to start worker threads: {}", e.what());
        // Workers that never started will not close the results channel
        live_workers_.fetch_sub(workers_ - threads_.size());
        if (threads_.empty()) {
            running_.store(false);
            results_.Close();
            return false;
        }
    }

    spdlog::info("Worker pool started with {} worker thread(s)", threads_.size());
    return true;
}

bool WorkerPool::Submit(InstanceSpec spec) {
    if (!running_.load()) {
        spdlog::error("Cannot submit {} to a stopped pool", spec.instance_id);
        return false;
    }

    std::string id = spec.instance_id;
    if (!work_.Push(std::move(spec))) {
        spdlog::error("Cannot submit {} to a closed pool", id);
        return false;
    }

    spdlog::debug("Instance queued: {}", id);
    return true;
}

void WorkerPool::Close() {
    work_.Close();
}

std::optional<InstanceResult> WorkerPool::NextResult() {
    return results_.Pop();
}

void WorkerPool::Join() {
    work_.Close();

    for (auto& thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    threads_.clear();
    running_.store(false);
}

void WorkerPool::WorkerLoop(std::size_t worker_id) {
    spdlog::debug("Worker-{} started", worker_id);

    while (auto spec = work_.Pop()) {
        std::size_t now = ++busy_;
        std::size_t peak = peak_busy_.load();
        while (now > peak && !peak_busy_.compare_exchange_weak(peak, now)) {
        }

        spdlog::debug("Worker-{} claimed {}", worker_id, spec->instance_id);

        InstanceResult result;
        try {
            result = processor_(*spec, worker_id);
        }
        catch (const std::exception& e) {
            spdlog::error("Worker-{} processing error for {}: {}", worker_id, spec->instance_id, e.what());
            result.instance_id = spec->instance_id;
            result.status = InstanceStatus::SANDBOX_ERROR;
            result.failure = MakeFailure(Stage::REPORT, FailureKind::INTERNAL_ERROR, e.what());
        }

        --busy_;
        results_.Push(std::move(result));
    }

    spdlog::debug("Worker-{} stopped", worker_id);

    if (--live_workers_ == 0) {
        results_.Close();
    }
}

} // namespace core
} // namespace patchbench
