/*
 * wfsnap - Workflow Snapshot Renderer
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "wfsnap/orchestrator.hpp"
#include "wfsnap/logger.hpp"
#include "wfsnap/pool.hpp"
#include "wfsnap/processor.hpp"
#include <algorithm>
#include <optional>
#include <unordered_map>

namespace wfsnap {

const char* toString(RunState state) noexcept {
    switch (state) {
        case RunState::Idle: return "Idle";
        case RunState::Running: return "Running";
        case RunState::Draining: return "Draining";
        case RunState::Finalized: return "Finalized";
    }
    return "Unknown";
}

Orchestrator::Orchestrator(RunOptions options, std::shared_ptr<RenderClient> client)
    : options_(std::move(options)),
      client_(std::move(client)),
      slots_(static_cast<std::size_t>(std::max(1, options_.workers))) {
    LOG_DEBUG("Orchestrator created - input: " + options_.inputFolder.string() +
              ", output: " + options_.outputRoot().string() +
              ", workers: " + std::to_string(options_.workers));
}

Orchestrator::~Orchestrator() {
    cancel_.cancel();
}

void Orchestrator::onStateChange(std::function<void(RunState)> listener) {
    std::lock_guard<std::mutex> lock(listenerMutex_);
    listener_ = std::move(listener);
}

QueueLayout Orchestrator::layout() const {
    QueueLayout layout;
    layout.inputRoot = options_.inputFolder;
    layout.mode = (options_.inPlace || !options_.outputFolder) ? OutputMode::InPlace : OutputMode::OutputFolder;
    layout.outputRoot = options_.outputRoot();
    return layout;
}

void Orchestrator::cancel() noexcept {
    if (!cancel_.cancelled()) {
        cancel_.cancel();
        LOG_INFO("Cancellation requested; stopping after in-flight jobs are abandoned");
    }
}

RunStats Orchestrator::snapshot() const {
    std::shared_ptr<ResultAggregator> aggregator;
    {
        std::lock_guard<std::mutex> lock(aggregatorMutex_);
        aggregator = aggregator_;
    }
    if (!aggregator) {
        return RunStats{};
    }
    return aggregator->snapshot();
}

void Orchestrator::advance(RunState from, RunState to) {
    RunState expected = from;
    if (!state_.compare_exchange_strong(expected, to)) {
        return;
    }
    LOG_DEBUG(std::string("Run state ") + toString(from) + " -> " + toString(to));

    std::lock_guard<std::mutex> lock(listenerMutex_);
    if (listener_) {
        listener_(to);
    }
}

RunOutcome Orchestrator::run(const std::vector<WorkflowFile>& discovered) {
    RunOutcome outcome;
    outcome.reportPath = options_.reportPath();

    if (used_.exchange(true)) {
        LOG_WARN("Orchestrator already ran; refusing to start again");
        outcome.error = RunError::AlreadyFinalized;
        outcome.message = "this run has already been started";
        outcome.stats = snapshot();
        return outcome;
    }

    setThreadName("Main");

    const QueueLayout queueLayout = layout();
    const ReportSettings settings{options_.render, options_.workers, options_.retries};
    StatusReporter reporter(outcome.reportPath, options_.inputFolder,
                            queueLayout.mode == OutputMode::InPlace ? "in-place" : "output-folder",
                            settings);

    const auto pending = skipCompleted(discovered, queueLayout, reporter, outcome.skipped);
    JobQueue queue(pending, queueLayout, std::make_shared<const RenderConfig>(options_.render));

    WorkerPool pool(options_.workers);
    auto aggregator = std::make_shared<ResultAggregator>(queue.size(), pool.effectiveWorkers(queue.size()));
    {
        std::lock_guard<std::mutex> lock(aggregatorMutex_);
        aggregator_ = aggregator;
    }

    LOG_INFO("Rendering " + std::to_string(queue.size()) + " workflow(s) with " +
             std::to_string(pool.effectiveWorkers(queue.size())) + " worker(s)");
    if (outcome.skipped > 0) {
        LOG_INFO("Skipping " + std::to_string(outcome.skipped) + " workflow(s) completed by a previous run");
    }

    advance(RunState::Idle, RunState::Running);

    Processor processor(client_, ProcessorOptions{options_.retries});
    pool.onQueueExhausted([this]() { advance(RunState::Running, RunState::Draining); });

    const ResultSink sink = [&aggregator](const JobResult& result) {
        if (!aggregator->record(result)) {
            LOG_WARN("Result for " + result.jobId + " was not counted");
        }
    };

    if (!pool.run(queue, processor, sink, cancel_, &slots_)) {
        LOG_ERROR("Worker pool refused to run");
    }

    if (!processor.drain()) {
        LOG_ERROR("Render calls outlived the run; their helpers may still be running");
    }

    if (cancel_.cancelled()) {
        aggregator->markCancelled();
    }
    aggregator->close();
    advance(RunState::Running, RunState::Draining);

    outcome.stats = aggregator->snapshot();
    const StatusReport report = reporter.build(outcome.stats, aggregator->history(), Clock::now());

    std::string error;
    const bool written = reporter.finalize(report, error);
    advance(RunState::Draining, RunState::Finalized);

    if (!written) {
        outcome.error = RunError::ReportIoError;
        outcome.message = "failed to write status report: " + error;
        return outcome;
    }

    LOG_INFO("Run finished: " + std::to_string(outcome.stats.succeeded) + " succeeded, " +
             std::to_string(outcome.stats.failed) + " failed, " +
             std::to_string(outcome.stats.remaining) + " not processed");
    outcome.ok = true;
    return outcome;
}

std::vector<WorkflowFile> Orchestrator::skipCompleted(const std::vector<WorkflowFile>& discovered,
                                                      const QueueLayout& layout,
                                                      StatusReporter& reporter,
                                                      std::size_t& skipped) const {
    skipped = 0;
    if (options_.force) {
        return discovered;
    }

    auto previous = StatusReporter::loadPrevious(reporter.reportPath());
    if (!previous) {
        return discovered;
    }

    std::unordered_map<std::string, ReportEntry> completed;
    for (const auto* entries : {&previous->jobs, &previous->skipped}) {
        for (const auto& entry : *entries) {
            if (entry.status != JobStatus::Failed) {
                completed[entry.sourcePath] = entry;
            }
        }
    }

    std::vector<WorkflowFile> pending;
    std::vector<ReportEntry> carried;
    pending.reserve(discovered.size());

    for (const auto& file : discovered) {
        std::string key = file.relativePath.empty()
                              ? file.path.lexically_relative(options_.inputFolder).generic_string()
                              : file.relativePath.generic_string();
        auto it = completed.find(key);
        std::error_code ec;
        if (it != completed.end() &&
            std::filesystem::exists(JobQueue::resolveOutputPath(file.path, layout), ec)) {
            LOG_DEBUG("Already rendered, skipping: " + key);
            carried.push_back(it->second);
            continue;
        }
        pending.push_back(file);
    }

    skipped = carried.size();
    std::optional<Clock::time_point> firstStarted;
    if (previous->startedAt != Clock::time_point{}) {
        firstStarted = previous->startedAt;
    }
    reporter.carry(std::move(carried), firstStarted);
    return pending;
}

}
