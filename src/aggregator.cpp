/*
 * wfsnap - Workflow Snapshot Renderer
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "wfsnap/aggregator.hpp"
#include "wfsnap/logger.hpp"
#include <algorithm>
#include <numeric>

namespace wfsnap {

ResultAggregator::ResultAggregator(std::size_t totalJobs, std::size_t poolSize,
                                   Clock::time_point startedAt)
    : total_(totalJobs),
      poolSize_(std::max<std::size_t>(1, poolSize)),
      steadyStart_(std::chrono::steady_clock::now()) {
    stats_.total = totalJobs;
    stats_.remaining = totalJobs;
    stats_.startedAt = startedAt;
    stats_.complete = (totalJobs == 0);
    steadyFinish_ = steadyStart_;
    history_.reserve(totalJobs);
}

bool ResultAggregator::record(const JobResult& result) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (stats_.remaining == 0 || closed_) {
        LOG_ERROR("Result for " + result.jobId + " arrived after the run closed; ignoring");
        return false;
    }
    if (!seen_.insert(result.jobId).second) {
        LOG_ERROR("Duplicate result for job " + result.jobId + "; ignoring");
        return false;
    }

    --stats_.remaining;
    switch (result.status) {
        case JobStatus::Replaced:
            ++stats_.replaced;
            ++stats_.succeeded;
            break;
        case JobStatus::Success:
            ++stats_.succeeded;
            break;
        case JobStatus::Failed:
            ++stats_.failed;
            break;
    }

    history_.push_back(result);
    window_.push_back(std::max<std::int64_t>(0, result.durationMs));
    if (window_.size() > kEtaWindow) {
        window_.pop_front();
    }

    if (stats_.remaining == 0) {
        stats_.complete = true;
        steadyFinish_ = std::chrono::steady_clock::now();
        LOG_DEBUG("All " + std::to_string(total_) + " results recorded");
    }

    LOG_TRACE("Recorded " + result.jobId + " (" + toString(result.status) + "), remaining " +
              std::to_string(stats_.remaining));
    return true;
}

void ResultAggregator::markCancelled() noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    stats_.cancelled = true;
}

void ResultAggregator::close() noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!closed_ && !stats_.complete) {
        steadyFinish_ = std::chrono::steady_clock::now();
    }
    closed_ = true;
}

RunStats ResultAggregator::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    RunStats out = stats_;
    deriveLocked(out);
    return out;
}

std::vector<JobResult> ResultAggregator::history() const {
    std::vector<JobResult> copy;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        copy = history_;
    }
    std::sort(copy.begin(), copy.end(), [](const JobResult& a, const JobResult& b) {
        return a.index < b.index;
    });
    return copy;
}

void ResultAggregator::deriveLocked(RunStats& out) const {
    auto end = (out.complete || closed_) ? steadyFinish_ : std::chrono::steady_clock::now();
    out.elapsedSeconds = std::chrono::duration<double>(end - steadyStart_).count();

    if (!window_.empty()) {
        auto sum = std::accumulate(window_.begin(), window_.end(), std::int64_t{0});
        out.averageDurationMs = static_cast<double>(sum) / static_cast<double>(window_.size());
    }

    out.activeWorkers = std::min(poolSize_, out.remaining);
    if (out.activeWorkers > 0 && !window_.empty()) {
        out.etaSeconds = out.averageDurationMs / 1000.0 * static_cast<double>(out.remaining) /
                         static_cast<double>(out.activeWorkers);
    } else {
        out.etaSeconds = 0.0;
    }

    const double minutes = out.elapsedSeconds / 60.0;
    out.throughputPerMinute = minutes > 0.0 ? static_cast<double>(out.completed()) / minutes : 0.0;
}

}
