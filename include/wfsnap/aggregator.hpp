/*
 * wfsnap - Workflow Snapshot Renderer
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <deque>
#include <mutex>
#include <unordered_set>
#include <vector>

#include "wfsnap/types.hpp"

namespace wfsnap {

struct RunStats {
    std::size_t total = 0;
    std::size_t succeeded = 0;   // includes replaced
    std::size_t failed = 0;
    std::size_t replaced = 0;
    std::size_t remaining = 0;
    Clock::time_point startedAt;

    double elapsedSeconds = 0.0;
    double averageDurationMs = 0.0;
    double etaSeconds = 0.0;
    double throughputPerMinute = 0.0;
    std::size_t activeWorkers = 0;

    bool complete = false;
    bool cancelled = false;

    [[nodiscard]] std::size_t completed() const noexcept { return succeeded + failed; }
};

// Sole owner of the run's counters and per-job history. Every update and every
// snapshot happens under one lock, so readers never see a half-applied result.
class ResultAggregator {
public:
    static constexpr std::size_t kEtaWindow = 10;

    ResultAggregator(std::size_t totalJobs, std::size_t poolSize,
                     Clock::time_point startedAt = Clock::now());

    ResultAggregator(const ResultAggregator&) = delete;
    ResultAggregator& operator=(const ResultAggregator&) = delete;

    // Rejects results for an already-counted job id or past the job total.
    bool record(const JobResult& result);
    void markCancelled() noexcept;
    // Freezes the stats of a run that ends with jobs still remaining (cancellation).
    void close() noexcept;

    [[nodiscard]] RunStats snapshot() const;
    // Per-job results ordered by queue position.
    [[nodiscard]] std::vector<JobResult> history() const;
    [[nodiscard]] std::size_t total() const noexcept { return total_; }

private:
    const std::size_t total_;
    const std::size_t poolSize_;

    mutable std::mutex mutex_;
    RunStats stats_;
    std::deque<std::int64_t> window_;
    std::vector<JobResult> history_;
    std::unordered_set<JobId> seen_;
    bool closed_ = false;
    std::chrono::steady_clock::time_point steadyStart_;
    std::chrono::steady_clock::time_point steadyFinish_;

    void deriveLocked(RunStats& out) const;
};

}
