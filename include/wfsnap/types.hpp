/*
 * wfsnap - Workflow Snapshot Renderer
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace wfsnap {

// Stable job identifier: source path relative to the input folder.
using JobId = std::string;

using Clock = std::chrono::system_clock;

enum class JobStatus : std::uint8_t { Success, Failed, Replaced };

enum class FailureKind : std::uint8_t {
    None = 0,
    BackendUnreachable,
    Timeout,
    InvalidInput,
    RenderError,
    IoError,
    Cancelled
};

struct Failure {
    FailureKind kind = FailureKind::None;
    std::string message;
};

struct RenderConfig {
    int width = 1920;
    int height = 1080;
    bool darkMode = false;
    int timeoutSeconds = 120;
    int waitSeconds = 60;
};

struct Job {
    JobId id;
    std::size_t index = 0;
    std::filesystem::path sourcePath;
    std::filesystem::path outputPath;
    std::shared_ptr<const RenderConfig> config;
};

struct JobResult {
    JobId jobId;
    std::size_t index = 0;
    std::filesystem::path sourcePath;
    std::filesystem::path outputPath;
    JobStatus status = JobStatus::Failed;
    Clock::time_point startedAt;
    Clock::time_point finishedAt;
    std::int64_t durationMs = 0;
    std::optional<Failure> error;
    int attempts = 0;
    int workerId = -1;

    [[nodiscard]] bool succeeded() const noexcept { return status != JobStatus::Failed; }
};

[[nodiscard]] const char* toString(JobStatus status) noexcept;
[[nodiscard]] const char* toString(FailureKind kind) noexcept;
[[nodiscard]] std::optional<JobStatus> parseJobStatus(const std::string& text) noexcept;
[[nodiscard]] FailureKind parseFailureKind(const std::string& text) noexcept;

// ISO-8601 UTC with milliseconds, e.g. 2025-01-01T12:00:00.000Z
[[nodiscard]] std::string formatTimestamp(Clock::time_point tp);
[[nodiscard]] std::optional<Clock::time_point> parseTimestamp(const std::string& text);

} // namespace wfsnap
