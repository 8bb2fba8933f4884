/*
 * wfsnap - Workflow Snapshot Renderer
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

#include "wfsnap/render_client.hpp"
#include "wfsnap/types.hpp"

namespace wfsnap {

struct ProcessorOptions {
    // Extra attempts after a BackendUnreachable failure. Other failures are final.
    int retries = 0;
    std::chrono::milliseconds retryDelay{2000};
    // How long drain() waits for abandoned calls. Covers the helper's SIGTERM grace.
    std::chrono::milliseconds drainLimit{5000};
};

// Executes one Job end to end and always produces a JobResult.
class Processor {
public:
    explicit Processor(std::shared_ptr<RenderClient> client, ProcessorOptions options = {});
    ~Processor();

    Processor(const Processor&) = delete;
    Processor& operator=(const Processor&) = delete;
    Processor(Processor&&) = delete;
    Processor& operator=(Processor&&) = delete;

    [[nodiscard]] JobResult process(const Job& job, int workerId, const CancelToken& cancel) noexcept;

    // Waits until every render call started by this processor has returned,
    // abandoned ones included. Returns false if some are still running after
    // options().drainLimit.
    bool drain();
    [[nodiscard]] int callsInFlight() const;

    [[nodiscard]] const ProcessorOptions& options() const noexcept { return options_; }

private:
    struct CallTracker;

    std::shared_ptr<RenderClient> client_;
    ProcessorOptions options_;
    std::shared_ptr<CallTracker> calls_;

    // Runs the client call on its own thread so the budget holds even when the
    // client ignores it. A call that overruns is abandoned and cancelled;
    // drain() waits for it.
    [[nodiscard]] RenderResult renderWithTimeout(const Job& job, const CancelToken& cancel);
    [[nodiscard]] bool pauseBeforeRetry(const CancelToken& cancel) const;
    [[nodiscard]] std::optional<Failure> writeOutput(const std::filesystem::path& outputPath,
                                                     const std::string& image,
                                                     int workerId,
                                                     bool& replaced) const noexcept;
};

}
