/*
 * wfsnap - Workflow Snapshot Renderer
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "wfsnap/processor.hpp"
#include "wfsnap/logger.hpp"
#include <algorithm>
#include <condition_variable>
#include <fstream>
#include <future>
#include <mutex>
#include <system_error>
#include <thread>

namespace wfsnap {

namespace {

constexpr auto kPollInterval = std::chrono::milliseconds(50);

void fail(JobResult& result, FailureKind kind, std::string message) {
    result.status = JobStatus::Failed;
    result.error = Failure{kind, std::move(message)};
}

}

// Counts render calls still running. Shared with the call threads so an
// abandoned call can report back after its job has moved on.
struct Processor::CallTracker {
    std::mutex mutex;
    std::condition_variable done;
    int active = 0;

    void begin() {
        std::lock_guard<std::mutex> lock(mutex);
        ++active;
    }
    void end() {
        std::lock_guard<std::mutex> lock(mutex);
        --active;
        done.notify_all();
    }
};

Processor::Processor(std::shared_ptr<RenderClient> client, ProcessorOptions options)
    : client_(std::move(client)), options_(options), calls_(std::make_shared<CallTracker>()) {
    if (options_.retries < 0) {
        options_.retries = 0;
    }
    LOG_DEBUG("Processor created (retries: " + std::to_string(options_.retries) + ")");
}

Processor::~Processor() {
    drain();
}

bool Processor::drain() {
    std::unique_lock<std::mutex> lock(calls_->mutex);
    if (calls_->active == 0) {
        return true;
    }
    LOG_DEBUG("Waiting for " + std::to_string(calls_->active) + " abandoned render call(s)");
    if (calls_->done.wait_for(lock, options_.drainLimit, [this]() { return calls_->active == 0; })) {
        return true;
    }
    LOG_WARN(std::to_string(calls_->active) + " render call(s) still running after " +
             std::to_string(options_.drainLimit.count()) + " ms");
    return false;
}

int Processor::callsInFlight() const {
    std::lock_guard<std::mutex> lock(calls_->mutex);
    return calls_->active;
}

JobResult Processor::process(const Job& job, int workerId, const CancelToken& cancel) noexcept {
    JobResult result;
    result.jobId = job.id;
    result.index = job.index;
    result.sourcePath = job.sourcePath;
    result.outputPath = job.outputPath;
    result.workerId = workerId;
    result.startedAt = Clock::now();
    const auto steadyStart = std::chrono::steady_clock::now();

    try {
        if (!client_) {
            fail(result, FailureKind::BackendUnreachable, "No render client available");
        } else if (!job.config) {
            fail(result, FailureKind::InvalidInput, "Job has no render configuration");
        } else {
            RenderResult rendered;
            for (;;) {
                ++result.attempts;
                rendered = renderWithTimeout(job, cancel);

                if (rendered.ok || rendered.failure.kind != FailureKind::BackendUnreachable ||
                    result.attempts > options_.retries) {
                    break;
                }
                LOG_WARN("Backend unreachable for " + job.id + ", retrying (" +
                         std::to_string(result.attempts) + "/" + std::to_string(options_.retries) + ")");
                if (!pauseBeforeRetry(cancel)) {
                    rendered = RenderResult::failed(FailureKind::Cancelled, "run cancelled");
                    break;
                }
            }

            if (!rendered.ok) {
                fail(result, rendered.failure.kind, rendered.failure.message);
            } else if (rendered.image.empty()) {
                fail(result, FailureKind::RenderError, "renderer returned no image data");
            } else {
                bool replaced = false;
                if (auto ioFailure = writeOutput(job.outputPath, rendered.image, workerId, replaced)) {
                    fail(result, ioFailure->kind, ioFailure->message);
                } else {
                    result.status = replaced ? JobStatus::Replaced : JobStatus::Success;
                    if (replaced) {
                        LOG_DEBUG("Replaced existing image: " + job.outputPath.string());
                    }
                }
            }
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Exception processing job " + job.id + ": " + std::string(e.what()));
        fail(result, FailureKind::RenderError, "Internal processing error: " + std::string(e.what()));
    } catch (...) {
        LOG_ERROR("Unknown exception processing job: " + job.id);
        fail(result, FailureKind::RenderError, "Unknown internal processing error");
    }

    result.finishedAt = Clock::now();
    result.durationMs = std::max<std::int64_t>(0,
        std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - steadyStart).count());

    if (result.status == JobStatus::Failed) {
        LOG_WARN("Job failed: " + job.id + " - " + toString(result.error->kind) + ": " + result.error->message);
    } else {
        LOG_INFO("Job completed: " + job.id + " -> " + job.outputPath.filename().string() + " (" +
                 std::to_string(result.durationMs) + " ms)");
    }
    return result;
}

RenderResult Processor::renderWithTimeout(const Job& job, const CancelToken& cancel) {
    if (cancel.cancelled()) {
        return RenderResult::failed(FailureKind::Cancelled, "run cancelled");
    }

    CancelToken callToken = cancel.child();
    auto promise = std::make_shared<std::promise<RenderResult>>();
    auto future = promise->get_future();

    // The call thread owns copies of everything it touches so it can outlive this frame.
    std::shared_ptr<RenderClient> client = client_;
    std::shared_ptr<const RenderConfig> config = job.config;
    std::filesystem::path source = job.sourcePath;
    std::string jobId = job.id;
    std::shared_ptr<CallTracker> calls = calls_;

    calls->begin();
    try {
        std::thread([client, config, source, jobId, callToken, promise, calls]() {
            setThreadName("Render-" + jobId);
            try {
                promise->set_value(client->render(source, *config, callToken));
            } catch (const std::exception& e) {
                promise->set_value(RenderResult::failed(FailureKind::RenderError, e.what()));
            } catch (...) {
                promise->set_value(RenderResult::failed(FailureKind::RenderError, "unknown renderer exception"));
            }
            calls->end();
        }).detach();
    } catch (const std::system_error& e) {
        calls->end();
        LOG_ERROR("Cannot start render thread for " + job.id + ": " + e.what());
        return RenderResult::failed(FailureKind::RenderError, "cannot start render call: " + std::string(e.what()));
    }

    const auto budget = std::chrono::seconds(job.config->timeoutSeconds);
    const auto deadline = std::chrono::steady_clock::now() + budget;

    for (;;) {
        auto now = std::chrono::steady_clock::now();
        auto slice = std::min<std::chrono::steady_clock::duration>(kPollInterval, deadline - now);
        if (slice > std::chrono::steady_clock::duration::zero() &&
            future.wait_for(slice) == std::future_status::ready) {
            return future.get();
        }
        if (future.wait_for(std::chrono::seconds(0)) == std::future_status::ready) {
            return future.get();
        }
        if (cancel.cancelled()) {
            callToken.cancel();
            return RenderResult::failed(FailureKind::Cancelled, "run cancelled");
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            callToken.cancel();
            LOG_WARN("Render of " + job.id + " exceeded " + std::to_string(job.config->timeoutSeconds) +
                     "s, abandoning call");
            return RenderResult::failed(FailureKind::Timeout,
                "render exceeded " + std::to_string(job.config->timeoutSeconds) + "s");
        }
    }
}

bool Processor::pauseBeforeRetry(const CancelToken& cancel) const {
    const auto until = std::chrono::steady_clock::now() + options_.retryDelay;
    while (std::chrono::steady_clock::now() < until) {
        if (cancel.cancelled()) {
            return false;
        }
        std::this_thread::sleep_for(kPollInterval);
    }
    return !cancel.cancelled();
}

std::optional<Failure> Processor::writeOutput(const std::filesystem::path& outputPath,
                                              const std::string& image,
                                              int workerId,
                                              bool& replaced) const noexcept {
    try {
        std::error_code ec;
        replaced = std::filesystem::exists(outputPath, ec);

        auto parent = outputPath.parent_path();
        if (!parent.empty()) {
            std::filesystem::create_directories(parent, ec);
            if (ec) {
                return Failure{FailureKind::IoError, "cannot create " + parent.string() + ": " + ec.message()};
            }
        }

        // Write to a per-worker temp file first, then publish with one rename
        auto tempPath = outputPath;
        tempPath += ".w" + std::to_string(workerId) + ".tmp";
        {
            std::ofstream file(tempPath, std::ios::binary | std::ios::trunc);
            if (!file) {
                return Failure{FailureKind::IoError, "cannot open " + tempPath.string() + " for writing"};
            }
            file.write(image.data(), static_cast<std::streamsize>(image.size()));
            file.flush();
            if (!file.good()) {
                file.close();
                std::filesystem::remove(tempPath, ec);
                return Failure{FailureKind::IoError, "short write to " + tempPath.string()};
            }
        }

        std::filesystem::rename(tempPath, outputPath, ec);
        if (ec) {
            std::error_code ignored;
            std::filesystem::remove(tempPath, ignored);
            return Failure{FailureKind::IoError, "cannot publish " + outputPath.string() + ": " + ec.message()};
        }
        return std::nullopt;
    } catch (const std::exception& e) {
        return Failure{FailureKind::IoError, "write failed for " + outputPath.string() + ": " + e.what()};
    }
}

}
