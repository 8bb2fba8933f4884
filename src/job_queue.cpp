/*
 * wfsnap - Workflow Snapshot Renderer
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "wfsnap/job_queue.hpp"
#include "wfsnap/logger.hpp"

namespace wfsnap {

JobQueue::JobQueue(std::vector<Job> jobs) noexcept
    : jobs_(std::move(jobs)) {
    LOG_DEBUG("JobQueue created with " + std::to_string(jobs_.size()) + " jobs");
}

JobQueue::JobQueue(const std::vector<WorkflowFile>& files, const QueueLayout& layout,
                   std::shared_ptr<const RenderConfig> config)
    : JobQueue(buildJobs(files, layout, config)) {
}

std::optional<Job> JobQueue::take() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (next_ >= jobs_.size()) {
        return std::nullopt;
    }
    const Job& job = jobs_[next_++];
    LOG_TRACE("Job taken: " + job.id + " (" + std::to_string(next_) + "/" +
              std::to_string(jobs_.size()) + ")");
    return job;
}

std::size_t JobQueue::taken() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return next_;
}

bool JobQueue::exhausted() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return next_ >= jobs_.size();
}

std::filesystem::path JobQueue::resolveOutputPath(const std::filesystem::path& source,
                                                  const QueueLayout& layout) {
    const std::string filename = Scanner::safeFilename(source.stem().string()) + ".png";

    if (layout.mode == OutputMode::InPlace) {
        return source.parent_path() / filename;
    }

    // Keep the source's folder structure so equal stems in different folders don't collide
    auto relativeParent = source.parent_path().lexically_relative(layout.inputRoot);
    if (relativeParent.empty() || relativeParent == "." || *relativeParent.begin() == "..") {
        return layout.outputRoot / filename;
    }
    return layout.outputRoot / relativeParent / filename;
}

std::vector<Job> JobQueue::buildJobs(const std::vector<WorkflowFile>& files,
                                     const QueueLayout& layout,
                                     const std::shared_ptr<const RenderConfig>& config) {
    std::vector<Job> jobs;
    jobs.reserve(files.size());

    for (const auto& file : files) {
        Job job;
        job.index = jobs.size();
        job.sourcePath = file.path;
        job.id = file.relativePath.empty() ? file.path.filename().generic_string()
                                           : file.relativePath.generic_string();
        job.outputPath = resolveOutputPath(file.path, layout);
        job.config = config;
        jobs.push_back(std::move(job));
    }
    return jobs;
}

}
