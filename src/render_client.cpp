/*
 * wfsnap - Workflow Snapshot Renderer
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "wfsnap/render_client.hpp"
#include "wfsnap/logger.hpp"
#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <sstream>

#include <fcntl.h>
#include <poll.h>
#include <spawn.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

extern "C" {
extern char** environ; // NOLINT
}

namespace wfsnap {

namespace {

constexpr std::size_t kMaxDiagnostics = 4096;
constexpr int kExitInvalidInput = 2;
constexpr int kExitBackendUnreachable = 3;
constexpr int kExitTimeout = 4;
constexpr int kExitNotFound = 127;

// Owns one pipe end; closes on destruction.
class Fd {
public:
    Fd() = default;
    explicit Fd(int fd) : fd_(fd) {}
    ~Fd() { reset(); }

    Fd(const Fd&) = delete;
    Fd& operator=(const Fd&) = delete;
    Fd(Fd&& other) noexcept : fd_(other.fd_) { other.fd_ = -1; }
    Fd& operator=(Fd&& other) noexcept {
        if (this != &other) {
            reset();
            fd_ = other.fd_;
            other.fd_ = -1;
        }
        return *this;
    }

    [[nodiscard]] int get() const noexcept { return fd_; }
    [[nodiscard]] bool valid() const noexcept { return fd_ >= 0; }
    void reset() noexcept {
        if (fd_ >= 0) {
            ::close(fd_);
            fd_ = -1;
        }
    }

private:
    int fd_ = -1;
};

bool makePipe(Fd& readEnd, Fd& writeEnd) {
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) == -1) {
        return false;
    }
    readEnd = Fd(fds[0]);
    writeEnd = Fd(fds[1]);
    return true;
}

std::string lastLine(const std::string& text) {
    auto end = text.find_last_not_of(" \t\r\n");
    if (end == std::string::npos) {
        return "";
    }
    auto start = text.find_last_of('\n', end);
    start = (start == std::string::npos) ? 0 : start + 1;
    return text.substr(start, end - start + 1);
}

std::vector<std::string> splitCommand(const std::string& command) {
    std::vector<std::string> parts;
    std::istringstream ss(command);
    std::string part;
    while (ss >> part) {
        parts.push_back(part);
    }
    return parts;
}

int exitCodeFromStatus(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

int reap(pid_t pid) {
    int status = 0;
    while (::waitpid(pid, &status, 0) == -1) {
        if (errno != EINTR) {
            LOG_ERROR("waitpid() failed: " + std::string(std::strerror(errno)));
            return -1;
        }
    }
    return exitCodeFromStatus(status);
}

// SIGTERM, then SIGKILL once the grace period runs out.
void stopChild(pid_t pid) {
    ::kill(pid, SIGTERM);
    for (int i = 0; i < 20; ++i) {
        int status = 0;
        pid_t done = ::waitpid(pid, &status, WNOHANG);
        if (done == pid || (done == -1 && errno != EINTR)) {
            return;
        }
        ::usleep(100 * 1000);
    }
    LOG_WARN("Renderer pid " + std::to_string(pid) + " ignored SIGTERM, killing");
    ::kill(pid, SIGKILL);
    (void)reap(pid);
}

}

CommandRenderClient::CommandRenderClient(std::string command, std::string serverUrl)
    : command_(splitCommand(command)), serverUrl_(std::move(serverUrl)) {
    LOG_DEBUG("CommandRenderClient created: " + command);
}

std::vector<std::string> CommandRenderClient::buildArgs(const std::filesystem::path& source,
                                                        const RenderConfig& config) const {
    std::vector<std::string> args = command_;
    args.insert(args.end(), {
        "--source", source.string(),
        "--width", std::to_string(config.width),
        "--height", std::to_string(config.height),
        "--wait", std::to_string(config.waitSeconds),
    });
    if (config.darkMode) {
        args.emplace_back("--dark");
    }
    if (!serverUrl_.empty()) {
        args.emplace_back("--server");
        args.push_back(serverUrl_);
    }
    return args;
}

RenderResult CommandRenderClient::mapExitCode(int exitCode, const std::string& diagnostics) {
    const std::string detail = lastLine(diagnostics);
    auto withDetail = [&detail](const std::string& base) {
        return detail.empty() ? base : base + ": " + detail;
    };

    switch (exitCode) {
        case 0:
            return RenderResult::success("");
        case kExitInvalidInput:
            return RenderResult::failed(FailureKind::InvalidInput, withDetail("renderer rejected input"));
        case kExitBackendUnreachable:
            return RenderResult::failed(FailureKind::BackendUnreachable, withDetail("render backend unreachable"));
        case kExitTimeout:
            return RenderResult::failed(FailureKind::Timeout, withDetail("renderer timed out"));
        case kExitNotFound:
            return RenderResult::failed(FailureKind::BackendUnreachable, withDetail("render command not found"));
        default:
            break;
    }
    if (exitCode > 128) {
        return RenderResult::failed(FailureKind::RenderError,
                                    withDetail("renderer killed by signal " + std::to_string(exitCode - 128)));
    }
    return RenderResult::failed(FailureKind::RenderError,
                                withDetail("renderer exited with code " + std::to_string(exitCode)));
}

RenderResult CommandRenderClient::render(const std::filesystem::path& source,
                                         const RenderConfig& config,
                                         const CancelToken& cancel) {
    if (command_.empty()) {
        return RenderResult::failed(FailureKind::BackendUnreachable, "no render command configured");
    }

    Fd outRead, outWrite, errRead, errWrite;
    if (!makePipe(outRead, outWrite) || !makePipe(errRead, errWrite)) {
        return RenderResult::failed(FailureKind::BackendUnreachable,
                                    "pipe() failed: " + std::string(std::strerror(errno)));
    }

    auto args = buildArgs(source, config);
    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (auto& arg : args) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);

    posix_spawn_file_actions_t actions;
    int err = posix_spawn_file_actions_init(&actions);
    if (err != 0) {
        return RenderResult::failed(FailureKind::BackendUnreachable,
                                    "posix_spawn_file_actions_init failed: " + std::string(std::strerror(err)));
    }
    posix_spawn_file_actions_addopen(&actions, STDIN_FILENO, "/dev/null", O_RDONLY, 0);
    posix_spawn_file_actions_adddup2(&actions, outWrite.get(), STDOUT_FILENO);
    posix_spawn_file_actions_adddup2(&actions, errWrite.get(), STDERR_FILENO);

    pid_t pid = -1;
    err = posix_spawnp(&pid, argv[0], &actions, nullptr, argv.data(), environ);
    posix_spawn_file_actions_destroy(&actions);

    if (err != 0) {
        LOG_ERROR("posix_spawnp failed for " + args.front() + ": " + std::strerror(err));
        return RenderResult::failed(FailureKind::BackendUnreachable,
                                    "cannot start " + args.front() + ": " + std::strerror(err));
    }
    LOG_DEBUG("Spawned renderer pid " + std::to_string(pid) + " for " + source.filename().string());

    outWrite.reset();
    errWrite.reset();

    std::string image;
    std::string diagnostics;
    std::array<char, 65536> buffer{};

    while (outRead.valid() || errRead.valid()) {
        if (cancel.cancelled()) {
            LOG_DEBUG("Cancelling renderer pid " + std::to_string(pid));
            stopChild(pid);
            return RenderResult::failed(FailureKind::Cancelled, "render abandoned");
        }

        std::array<pollfd, 2> fds{};
        nfds_t count = 0;
        Fd* owners[2] = {nullptr, nullptr};
        for (Fd* fd : {&outRead, &errRead}) {
            if (fd->valid()) {
                fds[count].fd = fd->get();
                fds[count].events = POLLIN;
                owners[count] = fd;
                ++count;
            }
        }

        int ready = ::poll(fds.data(), count, 100);
        if (ready == -1) {
            if (errno == EINTR) {
                continue;
            }
            LOG_ERROR("poll() failed: " + std::string(std::strerror(errno)));
            stopChild(pid);
            return RenderResult::failed(FailureKind::RenderError, "lost renderer output");
        }

        for (nfds_t i = 0; i < count; ++i) {
            if ((fds[i].revents & (POLLIN | POLLHUP | POLLERR)) == 0) {
                continue;
            }
            ssize_t n = ::read(fds[i].fd, buffer.data(), buffer.size());
            if (n > 0) {
                if (owners[i] == &outRead) {
                    image.append(buffer.data(), static_cast<std::size_t>(n));
                } else {
                    diagnostics.append(buffer.data(), static_cast<std::size_t>(n));
                    if (diagnostics.size() > kMaxDiagnostics) {
                        diagnostics.erase(0, diagnostics.size() - kMaxDiagnostics);
                    }
                }
            } else if (n == 0 || errno != EINTR) {
                owners[i]->reset();
            }
        }
    }

    int exitCode = reap(pid);
    LOG_DEBUG("Renderer pid " + std::to_string(pid) + " exited with " + std::to_string(exitCode));

    RenderResult result = mapExitCode(exitCode, diagnostics);
    if (result.ok) {
        result.image = std::move(image);
    }
    return result;
}

}
