/*
 * wfsnap - Workflow Snapshot Renderer
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "wfsnap/reporter.hpp"
#include "wfsnap/logger.hpp"
#include <cmath>
#include <fstream>
#include <iomanip>
#include <iterator>
#include <sstream>
#include <nlohmann/json.hpp>

namespace wfsnap {

using json = nlohmann::ordered_json;

namespace {

json entryToJson(const ReportEntry& entry) {
    json j;
    j["sourcePath"] = entry.sourcePath;
    j["outputPath"] = entry.outputPath;
    j["status"] = toString(entry.status);
    if (entry.error) {
        j["error"] = {
            {"kind", toString(entry.error->kind)},
            {"message", entry.error->message},
        };
    }
    j["durationMs"] = entry.durationMs;
    return j;
}

ReportEntry entryFromJson(const json& j) {
    ReportEntry entry;
    entry.sourcePath = j.value("sourcePath", "");
    entry.outputPath = j.value("outputPath", "");
    entry.status = parseJobStatus(j.value("status", "failed")).value_or(JobStatus::Failed);
    entry.durationMs = j.value("durationMs", std::int64_t{0});
    if (j.contains("error") && j["error"].is_object()) {
        const json& e = j["error"];
        entry.error = Failure{parseFailureKind(e.value("kind", "RenderError")), e.value("message", "")};
    }
    return entry;
}

double roundTo(double value, int places) {
    const double scale = std::pow(10.0, places);
    return std::round(value * scale) / scale;
}

}

std::string serializeReport(const StatusReport& report) {
    json j;
    j["startedAt"] = formatTimestamp(report.startedAt);
    j["finishedAt"] = formatTimestamp(report.finishedAt);
    j["mode"] = report.mode;
    j["inputFolder"] = report.inputFolder;
    j["cancelled"] = report.cancelled;

    j["summary"] = {
        {"total", report.summary.total},
        {"succeeded", report.summary.succeeded},
        {"failed", report.summary.failed},
        {"replaced", report.summary.replaced},
        {"remaining", report.summary.remaining},
        {"skipped", report.skipped.size()},
        {"elapsedSeconds", roundTo(report.summary.elapsedSeconds, 3)},
        {"throughputPerMinute", roundTo(report.summary.throughputPerMinute, 2)},
    };

    j["settings"] = {
        {"width", report.settings.render.width},
        {"height", report.settings.render.height},
        {"darkMode", report.settings.render.darkMode},
        {"timeoutSeconds", report.settings.render.timeoutSeconds},
        {"waitSeconds", report.settings.render.waitSeconds},
        {"workers", report.settings.workers},
        {"retries", report.settings.retries},
    };

    j["jobs"] = json::array();
    for (const auto& entry : report.jobs) {
        j["jobs"].push_back(entryToJson(entry));
    }
    j["skipped"] = json::array();
    for (const auto& entry : report.skipped) {
        j["skipped"].push_back(entryToJson(entry));
    }

    // Helper stderr and file names are arbitrary bytes; invalid UTF-8 becomes U+FFFD
    return j.dump(2, ' ', false, json::error_handler_t::replace) + "\n";
}

std::optional<StatusReport> parseReport(const std::string& text) {
    json j = json::parse(text, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return std::nullopt;
    }

    try {
        StatusReport report;
        auto started = parseTimestamp(j.value("startedAt", ""));
        auto finished = parseTimestamp(j.value("finishedAt", ""));
        if (started) report.startedAt = *started;
        if (finished) report.finishedAt = *finished;
        report.mode = j.value("mode", "");
        report.inputFolder = j.value("inputFolder", "");
        report.cancelled = j.value("cancelled", false);

        if (j.contains("summary") && j["summary"].is_object()) {
            const json& s = j["summary"];
            report.summary.total = s.value("total", std::size_t{0});
            report.summary.succeeded = s.value("succeeded", std::size_t{0});
            report.summary.failed = s.value("failed", std::size_t{0});
            report.summary.replaced = s.value("replaced", std::size_t{0});
            report.summary.remaining = s.value("remaining", std::size_t{0});
            report.summary.elapsedSeconds = s.value("elapsedSeconds", 0.0);
            report.summary.throughputPerMinute = s.value("throughputPerMinute", 0.0);
        }
        report.summary.startedAt = report.startedAt;

        if (j.contains("settings") && j["settings"].is_object()) {
            const json& s = j["settings"];
            report.settings.render.width = s.value("width", report.settings.render.width);
            report.settings.render.height = s.value("height", report.settings.render.height);
            report.settings.render.darkMode = s.value("darkMode", report.settings.render.darkMode);
            report.settings.render.timeoutSeconds = s.value("timeoutSeconds", report.settings.render.timeoutSeconds);
            report.settings.render.waitSeconds = s.value("waitSeconds", report.settings.render.waitSeconds);
            report.settings.workers = s.value("workers", report.settings.workers);
            report.settings.retries = s.value("retries", report.settings.retries);
        }

        auto readEntries = [&j](const char* key, std::vector<ReportEntry>& target) {
            if (!j.contains(key) || !j[key].is_array()) {
                return;
            }
            for (const auto& item : j[key]) {
                if (item.is_object()) {
                    target.push_back(entryFromJson(item));
                }
            }
        };
        readEntries("jobs", report.jobs);
        readEntries("skipped", report.skipped);
        return report;
    } catch (const json::exception& e) {
        LOG_WARN("Malformed status report: " + std::string(e.what()));
        return std::nullopt;
    }
}

StatusReporter::StatusReporter(std::filesystem::path reportPath,
                               std::filesystem::path inputRoot,
                               std::string mode,
                               ReportSettings settings)
    : reportPath_(std::move(reportPath)),
      inputRoot_(std::move(inputRoot)),
      outputBase_(reportPath_.parent_path()),
      mode_(std::move(mode)),
      settings_(settings) {
    LOG_DEBUG("StatusReporter writing to " + reportPath_.string());
}

void StatusReporter::carry(std::vector<ReportEntry> skipped, std::optional<Clock::time_point> firstStartedAt) {
    skipped_ = std::move(skipped);
    firstStartedAt_ = firstStartedAt;
}

ReportEntry StatusReporter::entryFor(const JobResult& result) const {
    ReportEntry entry;
    entry.sourcePath = relativeTo(result.sourcePath, inputRoot_);
    entry.outputPath = relativeTo(result.outputPath, outputBase_);
    entry.status = result.status;
    entry.error = result.error;
    entry.durationMs = result.durationMs;
    return entry;
}

StatusReport StatusReporter::build(const RunStats& stats,
                                   const std::vector<JobResult>& history,
                                   Clock::time_point finishedAt) const {
    StatusReport report;
    report.startedAt = stats.startedAt;
    if (firstStartedAt_ && *firstStartedAt_ < report.startedAt) {
        report.startedAt = *firstStartedAt_;
    }
    report.finishedAt = finishedAt;
    report.mode = mode_;
    std::error_code ec;
    auto absoluteInput = std::filesystem::absolute(inputRoot_, ec);
    report.inputFolder = (ec ? inputRoot_ : absoluteInput).lexically_normal().generic_string();
    report.cancelled = stats.cancelled;
    report.summary = stats;
    report.settings = settings_;

    report.jobs.reserve(history.size());
    for (const auto& result : history) {
        report.jobs.push_back(entryFor(result));
    }
    report.skipped = skipped_;
    return report;
}

bool StatusReporter::finalize(const StatusReport& report, std::string& error) {
    std::lock_guard<std::mutex> lock(writeMutex_);

    try {
        const std::string content = serializeReport(report);

        std::error_code ec;
        auto parent = reportPath_.parent_path();
        if (!parent.empty()) {
            std::filesystem::create_directories(parent, ec);
            if (ec) {
                error = "cannot create " + parent.string() + ": " + ec.message();
                LOG_ERROR("Status report not written: " + error);
                return false;
            }
        }

        auto tempPath = reportPath_;
        tempPath += ".tmp";
        {
            std::ofstream file(tempPath, std::ios::binary | std::ios::trunc);
            if (!file) {
                error = "cannot open " + tempPath.string() + " for writing";
                LOG_ERROR("Status report not written: " + error);
                return false;
            }
            file << content;
            file.flush();
            if (!file.good()) {
                file.close();
                std::filesystem::remove(tempPath, ec);
                error = "short write to " + tempPath.string();
                LOG_ERROR("Status report not written: " + error);
                return false;
            }
        }

        std::filesystem::rename(tempPath, reportPath_, ec);
        if (ec) {
            std::error_code ignored;
            std::filesystem::remove(tempPath, ignored);
            error = "cannot publish " + reportPath_.string() + ": " + ec.message();
            LOG_ERROR("Status report not written: " + error);
            return false;
        }

        LOG_INFO("Status report written to: " + reportPath_.string());
        return true;
    } catch (const std::exception& e) {
        error = e.what();
        LOG_ERROR("Status report not written: " + error);
        return false;
    }
}

std::optional<StatusReport> StatusReporter::loadPrevious(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return std::nullopt;
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        LOG_WARN("Failed to open existing state " + path.string());
        return std::nullopt;
    }
    std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());

    auto report = parseReport(content);
    if (!report) {
        LOG_WARN("Ignoring unreadable existing state " + path.string());
        return std::nullopt;
    }
    LOG_INFO("Loaded existing state from " + path.string());
    return report;
}

std::string StatusReporter::formatDuration(double seconds) {
    if (!(seconds > 0.0)) {
        return "0s";
    }
    auto total = static_cast<long long>(seconds + 0.5);
    long long hours = total / 3600;
    long long minutes = (total % 3600) / 60;
    long long secs = total % 60;

    std::ostringstream ss;
    if (hours > 0) {
        ss << hours << "h " << minutes << "m " << secs << "s";
    } else if (minutes > 0) {
        ss << minutes << "m " << secs << "s";
    } else {
        ss << secs << "s";
    }
    return ss.str();
}

std::string StatusReporter::progressLine(const RunStats& stats) {
    std::ostringstream ss;
    ss << "[" << stats.completed() << "/" << stats.total << "]";
    ss << "  ok " << stats.succeeded;
    ss << "  failed " << stats.failed;
    if (stats.replaced > 0) {
        ss << "  replaced " << stats.replaced;
    }
    ss << "  elapsed " << formatDuration(stats.elapsedSeconds);
    if (stats.complete) {
        ss << "  ETA complete";
    } else if (stats.completed() == 0) {
        ss << "  ETA calculating...";
    } else {
        ss << "  ETA " << formatDuration(stats.etaSeconds);
    }
    if (stats.throughputPerMinute > 0.0) {
        ss << "  " << std::fixed << std::setprecision(1) << stats.throughputPerMinute << "/min";
    }
    return ss.str();
}

std::string StatusReporter::workerLine(std::size_t slot, const WorkerSlotState& state,
                                       Clock::time_point now) {
    std::ostringstream ss;
    ss << "Worker-" << slot << "  " << toString(state.phase);
    switch (state.phase) {
        case SlotPhase::Idle:
            break;
        case SlotPhase::Rendering: {
            double seconds = std::chrono::duration<double>(now - state.startedAt).count();
            ss << "  " << state.jobId << "  " << formatDuration(seconds);
            break;
        }
        case SlotPhase::Completed:
            ss << "  " << state.jobId << "  " << toString(state.status);
            break;
    }
    return ss.str();
}

std::string StatusReporter::summaryText(const RunStats& stats) {
    std::ostringstream ss;
    ss << "Success: " << stats.succeeded << "\n";
    ss << "Failed: " << stats.failed << "\n";
    if (stats.replaced > 0) {
        ss << "Replaced: " << stats.replaced << "\n";
    }
    if (stats.remaining > 0) {
        ss << "Not processed: " << stats.remaining << "\n";
    }
    ss << "Time: " << formatDuration(stats.elapsedSeconds) << "\n";
    if (stats.throughputPerMinute > 0.0) {
        ss << "Throughput: " << std::fixed << std::setprecision(1) << stats.throughputPerMinute
           << " workflows/min\n";
    }
    return ss.str();
}

std::string StatusReporter::relativeTo(const std::filesystem::path& path,
                                       const std::filesystem::path& base) {
    if (path.empty()) {
        return "";
    }
    auto relative = path.lexically_relative(base);
    if (relative.empty() || *relative.begin() == "..") {
        return path.lexically_normal().generic_string();
    }
    return relative.generic_string();
}

}
