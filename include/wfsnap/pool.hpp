/*
 * wfsnap - Workflow Snapshot Renderer
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <functional>
#include <thread>
#include <vector>

#include "wfsnap/job_queue.hpp"
#include "wfsnap/processor.hpp"
#include "wfsnap/render_client.hpp"
#include "wfsnap/types.hpp"
#include "wfsnap/worker_slots.hpp"

namespace wfsnap {

using ResultSink = std::function<void(const JobResult&)>;

// Fixed set of executors draining one JobQueue. run() blocks until every
// executor has stopped; each taken job yields exactly one result on the sink.
class WorkerPool {
public:
    explicit WorkerPool(int workers) noexcept;
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;
    WorkerPool(WorkerPool&&) = delete;
    WorkerPool& operator=(WorkerPool&&) = delete;

    // Called once, from the first executor that finds the queue empty.
    void onQueueExhausted(std::function<void()> hook) { exhaustedHook_ = std::move(hook); }

    bool run(JobQueue& queue, Processor& processor, const ResultSink& sink,
             const CancelToken& cancel, WorkerSlots* slots = nullptr);

    [[nodiscard]] bool isRunning() const noexcept { return running_.load(); }
    [[nodiscard]] int workerCount() const noexcept { return workers_; }
    [[nodiscard]] std::size_t effectiveWorkers(std::size_t jobs) const noexcept;

private:
    struct RunContext {
        JobQueue* queue = nullptr;
        Processor* processor = nullptr;
        const ResultSink* sink = nullptr;
        const CancelToken* cancel = nullptr;
        WorkerSlots* slots = nullptr;
    };

    void workerLoop(int workerId);
    void signalExhausted();

    int workers_;
    std::function<void()> exhaustedHook_;

    std::atomic<bool> running_{false};
    std::atomic<bool> exhaustedSignalled_{false};
    RunContext context_;

    std::vector<std::thread> workerThreads_;
};

}
