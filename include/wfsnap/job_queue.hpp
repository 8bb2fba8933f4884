/*
 * wfsnap - Workflow Snapshot Renderer
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

#include "wfsnap/scanner.hpp"
#include "wfsnap/types.hpp"

namespace wfsnap {

enum class OutputMode : std::uint8_t { InPlace, OutputFolder };

struct QueueLayout {
    std::filesystem::path inputRoot;
    OutputMode mode = OutputMode::InPlace;
    std::filesystem::path outputRoot;
};

// Ordered, immutable set of jobs. take() hands each job out exactly once, in
// construction order, and returns nullopt immediately once exhausted.
class JobQueue {
public:
    explicit JobQueue(std::vector<Job> jobs) noexcept;
    JobQueue(const std::vector<WorkflowFile>& files, const QueueLayout& layout,
             std::shared_ptr<const RenderConfig> config);

    JobQueue(const JobQueue&) = delete;
    JobQueue& operator=(const JobQueue&) = delete;
    JobQueue(JobQueue&&) = delete;
    JobQueue& operator=(JobQueue&&) = delete;

    [[nodiscard]] std::optional<Job> take();

    [[nodiscard]] std::size_t size() const noexcept { return jobs_.size(); }
    [[nodiscard]] bool empty() const noexcept { return jobs_.empty(); }
    [[nodiscard]] std::size_t taken() const;
    [[nodiscard]] bool exhausted() const;
    [[nodiscard]] const std::vector<Job>& jobs() const noexcept { return jobs_; }

    [[nodiscard]] static std::filesystem::path resolveOutputPath(const std::filesystem::path& source,
                                                                 const QueueLayout& layout);

private:
    const std::vector<Job> jobs_;

    mutable std::mutex mutex_;
    std::size_t next_ = 0;

    [[nodiscard]] static std::vector<Job> buildJobs(const std::vector<WorkflowFile>& files,
                                                    const QueueLayout& layout,
                                                    const std::shared_ptr<const RenderConfig>& config);
};

}
