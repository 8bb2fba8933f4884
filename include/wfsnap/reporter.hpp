/*
 * wfsnap - Workflow Snapshot Renderer
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "wfsnap/aggregator.hpp"
#include "wfsnap/types.hpp"
#include "wfsnap/worker_slots.hpp"

namespace wfsnap {

struct ReportEntry {
    std::string sourcePath;
    std::string outputPath;
    JobStatus status = JobStatus::Failed;
    std::optional<Failure> error;
    std::int64_t durationMs = 0;
};

struct ReportSettings {
    RenderConfig render;
    int workers = 1;
    int retries = 0;
};

struct StatusReport {
    Clock::time_point startedAt;
    Clock::time_point finishedAt;
    std::string mode;
    std::string inputFolder;
    bool cancelled = false;
    RunStats summary;
    ReportSettings settings;
    std::vector<ReportEntry> jobs;
    std::vector<ReportEntry> skipped;
};

[[nodiscard]] std::string serializeReport(const StatusReport& report);
[[nodiscard]] std::optional<StatusReport> parseReport(const std::string& text);

class StatusReporter {
public:
    StatusReporter(std::filesystem::path reportPath,
                   std::filesystem::path inputRoot,
                   std::string mode,
                   ReportSettings settings);

    StatusReporter(const StatusReporter&) = delete;
    StatusReporter& operator=(const StatusReporter&) = delete;

    // Entries carried over from a previous run and the earliest known start.
    void carry(std::vector<ReportEntry> skipped, std::optional<Clock::time_point> firstStartedAt);

    [[nodiscard]] ReportEntry entryFor(const JobResult& result) const;
    [[nodiscard]] StatusReport build(const RunStats& stats,
                                     const std::vector<JobResult>& history,
                                     Clock::time_point finishedAt) const;

    // Writes the report through a temp file and rename. Serialized with itself;
    // writing the same report twice produces the same file.
    bool finalize(const StatusReport& report, std::string& error);

    [[nodiscard]] const std::filesystem::path& reportPath() const noexcept { return reportPath_; }

    [[nodiscard]] static std::optional<StatusReport> loadPrevious(const std::filesystem::path& path);

    [[nodiscard]] static std::string formatDuration(double seconds);
    [[nodiscard]] static std::string progressLine(const RunStats& stats);
    [[nodiscard]] static std::string workerLine(std::size_t slot, const WorkerSlotState& state,
                                                Clock::time_point now);
    [[nodiscard]] static std::string summaryText(const RunStats& stats);

private:
    std::filesystem::path reportPath_;
    std::filesystem::path inputRoot_;
    std::filesystem::path outputBase_;
    std::string mode_;
    ReportSettings settings_;

    std::vector<ReportEntry> skipped_;
    std::optional<Clock::time_point> firstStartedAt_;

    std::mutex writeMutex_;

    [[nodiscard]] static std::string relativeTo(const std::filesystem::path& path,
                                                const std::filesystem::path& base);
};

}
