/*
 * wfsnap - Workflow Snapshot Renderer
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "wfsnap/config.hpp"
#include "wfsnap/job_queue.hpp"
#include "wfsnap/logger.hpp"
#include "wfsnap/orchestrator.hpp"
#include "wfsnap/pool.hpp"
#include "wfsnap/processor.hpp"
#include "wfsnap/render_client.hpp"
#include "wfsnap/reporter.hpp"
#include "wfsnap/scanner.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include <unistd.h>

using namespace wfsnap;

constexpr const char* VERSION = "0.1.0";

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitCancelled = 130;

// Async-signal-safe: only set flag, no complex operations
static volatile sig_atomic_t g_cancel_requested = 0;

void signalHandler(int signal) {
    (void)signal;
    g_cancel_requested = 1;
}

void printUsage(const char* progName) {
    std::cout << "wfsnap Workflow Snapshot Renderer v" << VERSION << "\n\n";
    std::cout << "Usage: " << progName << " scan <input> [--no-recursive]\n";
    std::cout << "       " << progName << " generate <input> [output] [options]\n";
    std::cout << "       " << progName << " preview <file.json> [-o out.png] [options]\n";
    std::cout << "       " << progName << " --help | --version\n\n";
    std::cout << "Arguments:\n";
    std::cout << "  input         Folder containing workflow JSON files\n";
    std::cout << "  output        Folder for rendered images (omit with --in-place)\n\n";
    std::cout << "Options:\n";
    std::cout << "  --in-place          Write each image next to its workflow\n";
    std::cout << "  --force             Re-render workflows finished by a previous run\n";
    std::cout << "  --no-recursive      Only look at the top level of the input folder\n";
    std::cout << "  --width <n>         Viewport width (default 1920)\n";
    std::cout << "  --height <n>        Viewport height (default 1080)\n";
    std::cout << "  --square            Use a 2560x2560 viewport\n";
    std::cout << "  --dark-mode         Render with the dark theme\n";
    std::cout << "  --timeout <s>       Per-workflow time budget (default 120)\n";
    std::cout << "  --wait-time <s>     Time the renderer waits for the canvas (default 60)\n";
    std::cout << "  --workers <n>       Parallel renders (default 1, max CPU count)\n";
    std::cout << "  --retries <n>       Retries when the backend is unreachable (default 0)\n";
    std::cout << "  --render-cmd <cmd>  Render helper command (default " << kDefaultRenderCommand << ")\n";
    std::cout << "  --server <url>      Backend URL passed to the render helper\n";
    std::cout << "  -o <path>           Preview output image\n";
    std::cout << "  -v, --verbose       Debug logging\n";
    std::cout << "  -h, --help          Show this help message\n";
    std::cout << "  --version           Show version\n\n";
    std::cout << "Environment Variables:\n";
    std::cout << "  WFSNAP_LOG_LEVEL    Log level (ERROR, WARN, INFO, DEBUG, TRACE)\n";
    std::cout << "  WFSNAP_WORKERS      Default worker count\n";
    std::cout << "  WFSNAP_RETRIES      Default retry count\n";
    std::cout << "  WFSNAP_TIMEOUT      Default per-workflow timeout in seconds\n";
    std::cout << "  WFSNAP_WAIT         Default canvas wait in seconds\n";
    std::cout << "  WFSNAP_RENDER_CMD   Render helper command\n";
    std::cout << "  WFSNAP_SERVER_URL   Backend URL\n\n";
    std::cout << "Examples:\n";
    std::cout << "  " << progName << " scan ./workflows\n";
    std::cout << "  " << progName << " generate ./workflows ./images --workers 4\n";
    std::cout << "  " << progName << " generate ./workflows --in-place --dark-mode\n";
    std::cout << "  " << progName << " preview ./workflows/billing.json -o billing.png\n";
}

std::optional<int> parseIntArg(const std::string& flag, const std::string& value) {
    try {
        std::size_t consumed = 0;
        int parsed = std::stoi(value, &consumed);
        if (consumed == value.size()) {
            return parsed;
        }
    } catch (const std::exception&) {
        // reported below
    }
    std::cerr << "Error: Invalid value for " << flag << ": " << value << "\n";
    return std::nullopt;
}

// Parses the flags shared by generate and preview. Returns false on a usage error.
bool parseOptions(int argc, char* argv[], int first, RunOptions& options,
                  std::vector<std::string>& positional, std::optional<std::filesystem::path>* previewOut) {
    for (int i = first; i < argc; ++i) {
        std::string arg = argv[i];
        auto needValue = [&]() -> const char* {
            if (i + 1 >= argc) {
                std::cerr << "Error: " << arg << " requires a value\n";
                return nullptr;
            }
            return argv[++i];
        };
        auto intValue = [&](int& target) -> bool {
            const char* value = needValue();
            if (!value) return false;
            auto parsed = parseIntArg(arg, value);
            if (!parsed) return false;
            target = *parsed;
            return true;
        };

        if (arg == "--in-place") {
            options.inPlace = true;
        } else if (arg == "--force") {
            options.force = true;
        } else if (arg == "--no-recursive") {
            options.recursive = false;
        } else if (arg == "--square") {
            options.square = true;
        } else if (arg == "--dark-mode") {
            options.render.darkMode = true;
        } else if (arg == "-v" || arg == "--verbose") {
            Logger::setLevel(LogLevel::DEBUG);
        } else if (arg == "--width") {
            if (!intValue(options.render.width)) return false;
        } else if (arg == "--height") {
            if (!intValue(options.render.height)) return false;
        } else if (arg == "--timeout") {
            if (!intValue(options.render.timeoutSeconds)) return false;
        } else if (arg == "--wait-time") {
            if (!intValue(options.render.waitSeconds)) return false;
        } else if (arg == "--workers" || arg == "-w") {
            if (!intValue(options.workers)) return false;
        } else if (arg == "--retries") {
            if (!intValue(options.retries)) return false;
        } else if (arg == "--render-cmd") {
            const char* value = needValue();
            if (!value) return false;
            options.renderCommand = value;
        } else if (arg == "--server") {
            const char* value = needValue();
            if (!value) return false;
            options.serverUrl = value;
        } else if (arg == "-o" && previewOut) {
            const char* value = needValue();
            if (!value) return false;
            *previewOut = std::filesystem::path(value);
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Error: Unknown option: " << arg << "\n";
            return false;
        } else {
            positional.push_back(arg);
        }
    }
    return true;
}

void printScanSummary(const std::vector<WorkflowFile>& files) {
    const ScanSummary summary = Scanner::summarize(files);

    std::cout << "\n";
    std::cout << "  \033[1mwfsnap\033[0m " << VERSION << "  \033[90mscan\033[0m\n";
    std::cout << "  \033[90m─────────────────────────────────────────────────────────────────\033[0m\n\n";

    for (const auto& file : files) {
        if (file.valid) {
            std::cout << "    \033[32m✓\033[0m " << file.relativePath.generic_string()
                      << "  \033[90m" << file.name << " · " << file.nodeCount << " nodes\033[0m\n";
        } else {
            std::cout << "    \033[31m✗\033[0m " << file.relativePath.generic_string()
                      << "  \033[31m" << file.error << "\033[0m\n";
        }
    }

    std::cout << "\n";
    std::cout << "    Files       " << summary.totalFiles << "\n";
    std::cout << "    Valid       " << summary.validWorkflows << "\n";
    std::cout << "    Invalid     " << summary.invalidWorkflows << "\n";
    std::cout << "    Nodes       " << summary.totalNodes << "\n";
    std::cout << "    Node types  " << summary.nodeTypes.size() << "\n\n";
}

int runScan(int argc, char* argv[]) {
    std::optional<std::filesystem::path> input;
    bool recursive = true;
    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--no-recursive") {
            recursive = false;
        } else if (arg == "-v" || arg == "--verbose") {
            Logger::setLevel(LogLevel::DEBUG);
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Error: Unknown option: " << arg << "\n";
            return kExitFailure;
        } else if (!input) {
            input = std::filesystem::path(arg);
        } else {
            std::cerr << "Error: Unexpected argument: " << arg << "\n";
            return kExitFailure;
        }
    }
    if (!input) {
        std::cerr << "Error: scan requires an input folder\n";
        return kExitFailure;
    }

    Scanner scanner(*input, recursive);
    scanner.ignore(kDefaultReportName);
    if (!scanner.folderExists()) {
        std::cerr << "Error: Input folder not found: " << input->string() << "\n";
        return kExitFailure;
    }

    auto files = scanner.scan();
    printScanSummary(files);
    return Scanner::summarize(files).invalidWorkflows > 0 ? kExitFailure : kExitOk;
}

// Redraws the progress block until the run finalizes; forwards signals as cancellation.
void watchProgress(Orchestrator& orchestrator, const std::atomic<bool>& finished) {
    const bool tty = ::isatty(STDOUT_FILENO) != 0;
    const bool showWorkers = orchestrator.options().workers > 1;
    std::size_t drawnLines = 0;
    std::size_t lastCompleted = static_cast<std::size_t>(-1);

    while (!finished.load()) {
        if (g_cancel_requested && orchestrator.state() != RunState::Finalized) {
            orchestrator.cancel();
        }

        const RunState state = orchestrator.state();
        if (state == RunState::Running || state == RunState::Draining) {
            const RunStats stats = orchestrator.snapshot();
            if (tty) {
                if (drawnLines > 0) {
                    std::cout << "\033[" << drawnLines << "A";
                }
                drawnLines = 0;
                std::cout << "\033[2K  " << StatusReporter::progressLine(stats) << "\n";
                ++drawnLines;
                if (showWorkers) {
                    const auto now = Clock::now();
                    const auto workers = orchestrator.workerStates();
                    for (std::size_t i = 0; i < workers.size(); ++i) {
                        std::cout << "\033[2K    \033[90m" << StatusReporter::workerLine(i, workers[i], now)
                                  << "\033[0m\n";
                        ++drawnLines;
                    }
                }
                std::cout << std::flush;
            } else if (stats.completed() != lastCompleted) {
                lastCompleted = stats.completed();
                std::cout << StatusReporter::progressLine(stats) << "\n" << std::flush;
            }
        }

        std::this_thread::sleep_for(std::chrono::milliseconds(500));
    }
}

int runGenerate(int argc, char* argv[]) {
    RunOptions options = optionsFromEnv();
    std::vector<std::string> positional;
    if (!parseOptions(argc, argv, 2, options, positional, nullptr)) {
        return kExitFailure;
    }
    if (positional.empty() || positional.size() > 2) {
        std::cerr << "Error: generate takes <input> [output]\n";
        return kExitFailure;
    }
    options.inputFolder = positional[0];
    if (positional.size() == 2) {
        options.outputFolder = std::filesystem::path(positional[1]);
    }

    for (const auto& warning : normalize(options, std::thread::hardware_concurrency())) {
        std::cerr << "\033[33mWarning:\033[0m " << warning << "\n";
    }
    auto problems = validate(options);
    if (!problems.empty()) {
        for (const auto& problem : problems) {
            std::cerr << "Error: " << problem << "\n";
        }
        return kExitFailure;
    }

    Scanner scanner(options.inputFolder, options.recursive);
    scanner.ignore(options.reportName);
    if (!scanner.folderExists()) {
        std::cerr << "Error: Input folder not found: " << options.inputFolder.string() << "\n";
        return kExitFailure;
    }

    const auto files = scanner.scan();
    for (const auto& file : files) {
        if (!file.valid) {
            std::cerr << "\033[33mSkipping\033[0m " << file.relativePath.generic_string() << ": "
                      << file.error << "\n";
        }
    }
    const auto valid = Scanner::validOnly(files);

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    auto client = std::make_shared<CommandRenderClient>(options.renderCommand, options.serverUrl);
    Orchestrator orchestrator(options, client);

    std::cout << "\n";
    std::cout << "  \033[1mwfsnap\033[0m " << VERSION << "  \033[90mgenerate\033[0m\n";
    std::cout << "  \033[90m─────────────────────────────────────────────────────────────────\033[0m\n\n";
    std::cout << "    Input      " << options.inputFolder.string() << "\n";
    std::cout << "    Output     " << (options.inPlace ? std::string("in place") : options.outputRoot().string()) << "\n";
    std::cout << "    Workflows  " << valid.size() << "\n";
    std::cout << "    Viewport   " << options.render.width << "x" << options.render.height
              << (options.render.darkMode ? " dark" : "") << "\n";
    std::cout << "    Workers    " << options.workers << "\n\n";

    std::atomic<bool> finished{false};
    std::thread display(watchProgress, std::ref(orchestrator), std::cref(finished));

    RunOutcome outcome;
    try {
        outcome = orchestrator.run(valid);
    } catch (const std::exception& e) {
        LOG_ERROR("Run aborted: " + std::string(e.what()));
        outcome.message = e.what();
    }
    finished.store(true);
    display.join();

    std::cout << "\n" << StatusReporter::progressLine(outcome.stats) << "\n\n";
    std::cout << StatusReporter::summaryText(outcome.stats);
    if (outcome.skipped > 0) {
        std::cout << "Skipped (already rendered): " << outcome.skipped << "\n";
    }

    if (!outcome) {
        std::cerr << "\033[31mError:\033[0m " << outcome.message << "\n";
        return kExitFailure;
    }
    std::cout << "Report: " << outcome.reportPath.string() << "\n";

    if (outcome.stats.cancelled || g_cancel_requested) {
        std::cout << "\033[33mCancelled\033[0m; run again to resume\n";
        return kExitCancelled;
    }
    return outcome.stats.failed > 0 ? kExitFailure : kExitOk;
}

int runPreview(int argc, char* argv[]) {
    RunOptions options = optionsFromEnv();
    std::vector<std::string> positional;
    std::optional<std::filesystem::path> out;
    if (!parseOptions(argc, argv, 2, options, positional, &out)) {
        return kExitFailure;
    }
    if (positional.size() != 1) {
        std::cerr << "Error: preview takes exactly one workflow file\n";
        return kExitFailure;
    }
    const std::filesystem::path source = positional[0];
    options.inputFolder = source.parent_path().empty() ? std::filesystem::path(".") : source.parent_path();
    options.inPlace = true;
    options.outputFolder.reset();

    for (const auto& warning : normalize(options, std::thread::hardware_concurrency())) {
        std::cerr << "\033[33mWarning:\033[0m " << warning << "\n";
    }
    auto problems = validate(options);
    if (!problems.empty()) {
        for (const auto& problem : problems) {
            std::cerr << "Error: " << problem << "\n";
        }
        return kExitFailure;
    }

    Scanner scanner(options.inputFolder, false);
    const WorkflowFile file = scanner.inspect(source);
    if (!file.valid) {
        std::cerr << "Error: " << source.string() << ": " << file.error << "\n";
        return kExitFailure;
    }

    Job job;
    job.id = source.filename().generic_string();
    job.sourcePath = source;
    job.outputPath = out ? *out
                         : JobQueue::resolveOutputPath(source, QueueLayout{source.parent_path(), OutputMode::InPlace, {}});
    job.config = std::make_shared<const RenderConfig>(options.render);

    std::vector<Job> jobs;
    jobs.push_back(job);
    JobQueue queue(std::move(jobs));

    Processor processor(std::make_shared<CommandRenderClient>(options.renderCommand, options.serverUrl),
                        ProcessorOptions{options.retries});
    WorkerPool pool(1);
    CancelToken cancel;

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    std::optional<JobResult> result;
    std::atomic<bool> finished{false};
    std::thread watcher([&]() {
        while (!finished.load()) {
            if (g_cancel_requested) {
                cancel.cancel();
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    });

    std::cout << "Rendering " << file.name << " (" << file.nodeCount << " nodes)...\n" << std::flush;
    if (!pool.run(queue, processor, [&result](const JobResult& r) { result = r; }, cancel)) {
        LOG_ERROR("Worker pool refused to run");
    }
    if (!processor.drain()) {
        LOG_ERROR("Render helper did not stop");
    }
    finished.store(true);
    watcher.join();

    if (!result) {
        std::cerr << "Error: preview did not produce a result\n";
        return g_cancel_requested ? kExitCancelled : kExitFailure;
    }
    if (!result->succeeded()) {
        std::cerr << "\033[31mFailed\033[0m " << toString(result->error->kind) << ": "
                  << result->error->message << "\n";
        return result->error->kind == FailureKind::Cancelled ? kExitCancelled : kExitFailure;
    }

    std::cout << "\033[32mSaved\033[0m " << result->outputPath.string() << "  \033[90m"
              << StatusReporter::formatDuration(static_cast<double>(result->durationMs) / 1000.0) << "\033[0m\n";
    return kExitOk;
}

int main(int argc, char* argv[]) {
    // Default to WARN so progress output stays readable; WFSNAP_LOG_LEVEL overrides
    if (!std::getenv("WFSNAP_LOG_LEVEL"))
        Logger::setLevel(LogLevel::WARN);

    setThreadName("Main");

    if (argc < 2) {
        printUsage(argv[0]);
        return kExitFailure;
    }

    const std::string command = argv[1];
    if (command == "-h" || command == "--help") {
        printUsage(argv[0]);
        return kExitOk;
    }
    if (command == "--version") {
        std::cout << VERSION << "\n";
        return kExitOk;
    }

    try {
        if (command == "scan") {
            return runScan(argc, argv);
        }
        if (command == "generate") {
            return runGenerate(argc, argv);
        }
        if (command == "preview") {
            return runPreview(argc, argv);
        }
    } catch (const std::exception& e) {
        LOG_ERROR("wfsnap error: " + std::string(e.what()));
        std::cerr << "Error: " << e.what() << "\n";
        return kExitFailure;
    }

    std::cerr << "Error: Unknown command: " << command << "\n\n";
    printUsage(argv[0]);
    return kExitFailure;
}
