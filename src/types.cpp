/*
 * wfsnap - Workflow Snapshot Renderer
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "wfsnap/types.hpp"
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace wfsnap {

const char* toString(JobStatus status) noexcept {
    switch (status) {
        case JobStatus::Success:  return "success";
        case JobStatus::Failed:   return "failed";
        case JobStatus::Replaced: return "replaced";
    }
    return "failed";
}

const char* toString(FailureKind kind) noexcept {
    switch (kind) {
        case FailureKind::None:               return "None";
        case FailureKind::BackendUnreachable: return "BackendUnreachable";
        case FailureKind::Timeout:            return "Timeout";
        case FailureKind::InvalidInput:       return "InvalidInput";
        case FailureKind::RenderError:        return "RenderError";
        case FailureKind::IoError:            return "IOError";
        case FailureKind::Cancelled:          return "Cancelled";
    }
    return "RenderError";
}

std::optional<JobStatus> parseJobStatus(const std::string& text) noexcept {
    if (text == "success") return JobStatus::Success;
    if (text == "failed") return JobStatus::Failed;
    if (text == "replaced") return JobStatus::Replaced;
    return std::nullopt;
}

FailureKind parseFailureKind(const std::string& text) noexcept {
    if (text == "BackendUnreachable") return FailureKind::BackendUnreachable;
    if (text == "Timeout") return FailureKind::Timeout;
    if (text == "InvalidInput") return FailureKind::InvalidInput;
    if (text == "IOError") return FailureKind::IoError;
    if (text == "Cancelled") return FailureKind::Cancelled;
    if (text == "None") return FailureKind::None;
    return FailureKind::RenderError;
}

std::string formatTimestamp(Clock::time_point tp) {
    auto time = Clock::to_time_t(tp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()) % 1000;
    if (ms.count() < 0) {
        ms += std::chrono::milliseconds(1000);
        --time;
    }

    std::tm utc{};
    gmtime_r(&time, &utc);

    std::ostringstream ss;
    ss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S");
    ss << "." << std::setfill('0') << std::setw(3) << ms.count() << "Z";
    return ss.str();
}

std::optional<Clock::time_point> parseTimestamp(const std::string& text) {
    std::tm utc{};
    int millis = 0;
    std::istringstream ss(text);
    ss >> std::get_time(&utc, "%Y-%m-%dT%H:%M:%S");
    if (ss.fail()) {
        return std::nullopt;
    }
    if (ss.peek() == '.') {
        ss.get();
        ss >> millis;
        if (ss.fail()) {
            return std::nullopt;
        }
    }

    auto seconds = timegm(&utc);
    if (seconds == static_cast<std::time_t>(-1)) {
        return std::nullopt;
    }
    return Clock::from_time_t(seconds) + std::chrono::milliseconds(millis);
}

} // namespace wfsnap
