/*
 * wfsnap - Workflow Snapshot Renderer
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "wfsnap/aggregator.hpp"
#include "wfsnap/config.hpp"
#include "wfsnap/job_queue.hpp"
#include "wfsnap/render_client.hpp"
#include "wfsnap/reporter.hpp"
#include "wfsnap/scanner.hpp"
#include "wfsnap/worker_slots.hpp"

namespace wfsnap {

enum class RunState : std::uint8_t { Idle, Running, Draining, Finalized };

enum class RunError : std::uint8_t { None, AlreadyFinalized, ReportIoError };

[[nodiscard]] const char* toString(RunState state) noexcept;

struct RunOutcome {
    bool ok = false;
    RunStats stats;
    RunError error = RunError::None;
    std::string message;
    std::filesystem::path reportPath;
    std::size_t skipped = 0;

    explicit operator bool() const noexcept { return ok; }
};

// Drives one batch: queue, pool, aggregation and the final report.
// Single-use; state only moves forward Idle -> Running -> Draining -> Finalized.
class Orchestrator final {
public:
    Orchestrator(RunOptions options, std::shared_ptr<RenderClient> client);
    ~Orchestrator();

    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;
    Orchestrator(Orchestrator&&) = delete;
    Orchestrator& operator=(Orchestrator&&) = delete;

    // Blocks until every taken job has a result and the report is written.
    [[nodiscard]] RunOutcome run(const std::vector<WorkflowFile>& discovered);

    // Safe from any thread, including a signal-watching one.
    void cancel() noexcept;

    // Observes every state transition; set before run().
    void onStateChange(std::function<void(RunState)> listener);

    [[nodiscard]] RunState state() const noexcept { return state_.load(); }
    [[nodiscard]] RunStats snapshot() const;
    [[nodiscard]] std::vector<WorkerSlotState> workerStates() const { return slots_.readAll(); }
    [[nodiscard]] const RunOptions& options() const noexcept { return options_; }
    [[nodiscard]] QueueLayout layout() const;

private:
    void advance(RunState from, RunState to);
    [[nodiscard]] std::vector<WorkflowFile> skipCompleted(const std::vector<WorkflowFile>& discovered,
                                                          const QueueLayout& layout,
                                                          StatusReporter& reporter,
                                                          std::size_t& skipped) const;

    RunOptions options_;
    std::shared_ptr<RenderClient> client_;

    std::atomic<RunState> state_{RunState::Idle};
    std::atomic<bool> used_{false};
    CancelToken cancel_;
    WorkerSlots slots_;

    mutable std::mutex aggregatorMutex_;
    std::shared_ptr<ResultAggregator> aggregator_;

    std::mutex listenerMutex_;
    std::function<void(RunState)> listener_;
};

}
