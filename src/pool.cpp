/*
 * wfsnap - Workflow Snapshot Renderer
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "wfsnap/pool.hpp"
#include "wfsnap/logger.hpp"
#include <algorithm>

namespace wfsnap {

WorkerPool::WorkerPool(int workers) noexcept : workers_(std::max(1, workers)) {
    LOG_DEBUG("Pool created with " + std::to_string(workers_) + " workers");
}

WorkerPool::~WorkerPool() {
    for (auto& thread : workerThreads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
}

std::size_t WorkerPool::effectiveWorkers(std::size_t jobs) const noexcept {
    return std::min(static_cast<std::size_t>(workers_), jobs);
}

bool WorkerPool::run(JobQueue& queue, Processor& processor, const ResultSink& sink,
                     const CancelToken& cancel, WorkerSlots* slots) {
    if (running_.exchange(true)) {
        LOG_WARN("Pool already running");
        return false;
    }

    context_ = RunContext{&queue, &processor, &sink, &cancel, slots};
    exhaustedSignalled_.store(false);

    const std::size_t count = effectiveWorkers(queue.size());
    if (count == 0) {
        signalExhausted();
        running_.store(false);
        LOG_DEBUG("Pool has no jobs to run");
        return true;
    }

    try {
        workerThreads_.reserve(count);
        for (std::size_t i = 0; i < count; ++i) {
            workerThreads_.emplace_back(&WorkerPool::workerLoop, this, static_cast<int>(i));
        }
        LOG_INFO("Pool started with " + std::to_string(count) + " worker thread(s)");
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to start worker thread " + std::to_string(workerThreads_.size()) +
                  ": " + std::string(e.what()));
        if (workerThreads_.empty()) {
            // No executor could start; drain on the calling thread instead
            LOG_WARN("Falling back to sequential processing on the calling thread");
            workerLoop(0);
        }
    }

    for (auto& thread : workerThreads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    workerThreads_.clear();

    running_.store(false);
    LOG_DEBUG("Pool drained (" + std::to_string(queue.taken()) + "/" +
              std::to_string(queue.size()) + " jobs taken)");
    return true;
}

void WorkerPool::signalExhausted() {
    if (!exhaustedSignalled_.exchange(true) && exhaustedHook_) {
        try {
            exhaustedHook_();
        } catch (const std::exception& e) {
            LOG_ERROR("Queue exhausted hook failed: " + std::string(e.what()));
        }
    }
}

void WorkerPool::workerLoop(int workerId) {
    setThreadName(workerThreadName(workerId));
    LOG_DEBUG(workerThreadName(workerId) + " thread started");

    const RunContext ctx = context_;
    const auto slot = static_cast<std::size_t>(workerId);

    while (!ctx.cancel->cancelled()) {
        std::optional<Job> job = ctx.queue->take();
        if (!job) {
            signalExhausted();
            break;
        }
        if (ctx.queue->exhausted()) {
            signalExhausted();
        }

        LOG_INFO(workerThreadName(workerId) + " claimed job: " + job->id);
        if (ctx.slots) {
            ctx.slots->markRendering(slot, job->id, Clock::now());
        }

        JobResult result = ctx.processor->process(*job, workerId, *ctx.cancel);

        if (ctx.slots) {
            ctx.slots->markCompleted(slot, job->id, result.status);
        }

        try {
            (*ctx.sink)(result);
        } catch (const std::exception& e) {
            LOG_ERROR(workerThreadName(workerId) + " could not deliver result for " + job->id +
                      ": " + std::string(e.what()));
        }
    }

    if (ctx.cancel->cancelled()) {
        LOG_DEBUG(workerThreadName(workerId) + " stopping on cancellation");
    }
    if (ctx.slots) {
        ctx.slots->markIdle(slot);
    }
    LOG_DEBUG(workerThreadName(workerId) + " stopped");
}

}
