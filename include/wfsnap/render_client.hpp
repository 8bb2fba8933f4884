/*
 * wfsnap - Workflow Snapshot Renderer
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "wfsnap/types.hpp"

namespace wfsnap {

// Shared cancellation flag. Copies observe the same state; a child is also
// cancelled when its parent is.
class CancelToken {
public:
    CancelToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() noexcept { flag_->store(true); }
    [[nodiscard]] bool cancelled() const noexcept {
        return flag_->load() || (parent_ && parent_->load());
    }
    [[nodiscard]] CancelToken child() const {
        CancelToken token;
        token.parent_ = flag_;
        return token;
    }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
    std::shared_ptr<std::atomic<bool>> parent_;
};

struct RenderResult {
    bool ok = false;
    std::string image;
    Failure failure;

    explicit operator bool() const noexcept { return ok; }

    [[nodiscard]] static RenderResult success(std::string bytes) {
        RenderResult r;
        r.ok = true;
        r.image = std::move(bytes);
        return r;
    }
    [[nodiscard]] static RenderResult failed(FailureKind kind, std::string message) {
        RenderResult r;
        r.failure = Failure{kind, std::move(message)};
        return r;
    }
};

// Turns one workflow file into image bytes. Called concurrently from every
// worker; implementations serialize internally if their backend needs it.
class RenderClient {
public:
    virtual ~RenderClient() = default;

    [[nodiscard]] virtual RenderResult render(const std::filesystem::path& source,
                                              const RenderConfig& config,
                                              const CancelToken& cancel) = 0;
};

// Runs an external render helper per job:
//   <command...> --source <file> --width W --height H --wait S [--dark] [--server URL]
// The helper writes PNG bytes to stdout. Exit codes: 0 ok, 2 invalid input,
// 3 backend unreachable, 4 timeout, anything else a render error.
class CommandRenderClient final : public RenderClient {
public:
    explicit CommandRenderClient(std::string command, std::string serverUrl = "");

    [[nodiscard]] RenderResult render(const std::filesystem::path& source,
                                      const RenderConfig& config,
                                      const CancelToken& cancel) override;

    [[nodiscard]] std::vector<std::string> buildArgs(const std::filesystem::path& source,
                                                     const RenderConfig& config) const;
    [[nodiscard]] static RenderResult mapExitCode(int exitCode, const std::string& diagnostics);

private:
    std::vector<std::string> command_;
    std::string serverUrl_;
};

}
