/*
 * wfsnap - Workflow Snapshot Renderer
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <atomic>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <mutex>
#include <thread>
#include <vector>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "test_utils.hpp"
#include "wfsnap/orchestrator.hpp"

#include <signal.h>
#include <sys/types.h>

using namespace wfsnap;
using namespace std::chrono_literals;
using nlohmann::json;
using wfsnap::test::ScriptedRenderClient;
using wfsnap::test::TempDirTest;
using wfsnap::test::failWith;
using wfsnap::test::slow;

class OrchestratorTest : public TempDirTest {
protected:
    RunOptions outputFolderOptions(int workers) {
        RunOptions options;
        options.inputFolder = root_ / "in";
        options.outputFolder = root_ / "out";
        options.workers = workers;
        options.render.timeoutSeconds = 5;
        return options;
    }

    RunOptions inPlaceOptions(int workers) {
        RunOptions options = outputFolderOptions(workers);
        options.inPlace = true;
        options.outputFolder.reset();
        return options;
    }

    json readReport(const RunOutcome& outcome) {
        return json::parse(test::readFile(outcome.reportPath));
    }

    std::shared_ptr<ScriptedRenderClient> client_ = std::make_shared<ScriptedRenderClient>(2ms);
};

TEST_F(OrchestratorTest, FiveJobsTwoWorkersWithTwoFailures) {
    auto files = makeWorkflows("in", 5);
    client_->script("wf-01.json", failWith(FailureKind::RenderError, "canvas crashed"));
    client_->script("wf-03.json", failWith(FailureKind::RenderError, "canvas crashed"));

    Orchestrator orchestrator(outputFolderOptions(2), client_);
    auto outcome = orchestrator.run(files);

    ASSERT_TRUE(outcome) << outcome.message;
    EXPECT_EQ(outcome.stats.total, 5u);
    EXPECT_EQ(outcome.stats.succeeded, 3u);
    EXPECT_EQ(outcome.stats.failed, 2u);
    EXPECT_EQ(outcome.stats.remaining, 0u);
    EXPECT_TRUE(outcome.stats.complete);
    EXPECT_EQ(orchestrator.state(), RunState::Finalized);

    json doc = readReport(outcome);
    ASSERT_EQ(doc["jobs"].size(), 5u);
    for (std::size_t i = 0; i < 5; ++i) {
        const bool failing = (i == 1 || i == 3);
        EXPECT_EQ(doc["jobs"][i]["status"], failing ? "failed" : "success") << i;
        EXPECT_EQ(doc["jobs"][i].contains("error"), failing) << i;
    }
    EXPECT_EQ(doc["jobs"][1]["error"]["kind"], "RenderError");
    EXPECT_EQ(outcome.reportPath, root_ / "out" / "wfsnap-job.json");
}

TEST_F(OrchestratorTest, CountsDoNotDependOnWorkerCount) {
    for (int workers : {1, 2, 6}) {
        SCOPED_TRACE("workers=" + std::to_string(workers));
        std::filesystem::remove_all(root_);
        auto files = makeWorkflows("in", 6);
        client_->script("wf-04.json", failWith(FailureKind::InvalidInput));

        Orchestrator orchestrator(outputFolderOptions(workers), client_);
        auto outcome = orchestrator.run(files);
        ASSERT_TRUE(outcome);
        EXPECT_EQ(outcome.stats.succeeded, 5u);
        EXPECT_EQ(outcome.stats.failed, 1u);
        EXPECT_EQ(readReport(outcome)["jobs"].size(), 6u);
    }
}

TEST_F(OrchestratorTest, InPlaceExistingOutputIsReplaced) {
    auto files = makeWorkflows("in", 4);
    writeFile("in/wf-02.png", "previous render");

    Orchestrator orchestrator(inPlaceOptions(2), client_);
    auto outcome = orchestrator.run(files);

    ASSERT_TRUE(outcome);
    EXPECT_EQ(outcome.stats.replaced, 1u);
    EXPECT_EQ(outcome.stats.succeeded, 4u);
    EXPECT_EQ(test::readFile(root_ / "in" / "wf-02.png"), "PNG:wf-02.json");

    json doc = readReport(outcome);
    EXPECT_EQ(doc["mode"], "in-place");
    EXPECT_EQ(doc["jobs"][2]["status"], "replaced");
    EXPECT_EQ(doc["jobs"][2]["outputPath"], "wf-02.png");
    EXPECT_EQ(outcome.reportPath, root_ / "in" / "wfsnap-job.json");
}

TEST_F(OrchestratorTest, OutputFolderMirrorsSourceFolders) {
    writeWorkflow("in/sales/sync.json");
    writeWorkflow("in/support/sync.json");
    Scanner scanner(root_ / "in");
    auto files = Scanner::validOnly(scanner.scan());

    Orchestrator orchestrator(outputFolderOptions(2), client_);
    auto outcome = orchestrator.run(files);

    ASSERT_TRUE(outcome);
    EXPECT_EQ(test::readFile(root_ / "out" / "sales" / "sync.png"), "PNG:sync.json");
    EXPECT_TRUE(std::filesystem::exists(root_ / "out" / "support" / "sync.png"));
    EXPECT_EQ(readReport(outcome)["jobs"][0]["sourcePath"], "sales/sync.json");
}

TEST_F(OrchestratorTest, TimeoutFailsOnlyTheSlowJob) {
    auto files = makeWorkflows("in", 3);
    client_->script("wf-01.json", slow(30s));
    RunOptions options = outputFolderOptions(2);
    options.render.timeoutSeconds = 1;

    Orchestrator orchestrator(options, client_);
    auto started = std::chrono::steady_clock::now();
    auto outcome = orchestrator.run(files);

    ASSERT_TRUE(outcome);
    EXPECT_LT(std::chrono::steady_clock::now() - started, 10s);
    EXPECT_EQ(outcome.stats.failed, 1u);
    EXPECT_EQ(readReport(outcome)["jobs"][1]["error"]["kind"], "Timeout");
}

TEST_F(OrchestratorTest, InvalidUtf8FailureTextKeepsReport) {
    auto files = makeWorkflows("in", 3);
    client_->script("wf-01.json", failWith(FailureKind::RenderError, "renderer said: caf\xe9"));

    Orchestrator orchestrator(outputFolderOptions(2), client_);
    auto outcome = orchestrator.run(files);

    ASSERT_TRUE(outcome) << outcome.message;
    EXPECT_EQ(outcome.error, RunError::None);
    ASSERT_TRUE(std::filesystem::exists(outcome.reportPath));

    json doc = readReport(outcome);
    EXPECT_EQ(doc["summary"]["failed"], 1);
    EXPECT_EQ(doc["jobs"][1]["status"], "failed");
    EXPECT_EQ(doc["jobs"][1]["error"]["kind"], "RenderError");
}

TEST_F(OrchestratorTest, HelperIgnoringTermIsKilledBeforeRunReturns) {
    auto files = makeWorkflows("in", 1);
    const auto pidFile = root_ / "helper.pid";
    auto helper = writeFile("helper.sh", "#!/bin/sh\necho $$ > '" + pidFile.string() +
                                         "'\ntrap '' TERM\nexec sleep 30\n");
    std::filesystem::permissions(helper, std::filesystem::perms::owner_all,
                                 std::filesystem::perm_options::replace);

    RunOptions options = outputFolderOptions(1);
    options.render.timeoutSeconds = 1;
    Orchestrator orchestrator(options, std::make_shared<CommandRenderClient>(helper.string()));

    auto started = std::chrono::steady_clock::now();
    auto outcome = orchestrator.run(files);

    ASSERT_TRUE(outcome) << outcome.message;
    EXPECT_LT(std::chrono::steady_clock::now() - started, 10s);
    EXPECT_EQ(readReport(outcome)["jobs"][0]["error"]["kind"], "Timeout");

    const std::string pidText = test::readFile(pidFile);
    ASSERT_FALSE(pidText.empty());
    const pid_t pid = static_cast<pid_t>(std::stol(pidText));
    const int rc = ::kill(pid, 0);
    const int err = errno;
    EXPECT_EQ(rc, -1);
    EXPECT_EQ(err, ESRCH);
}

TEST_F(OrchestratorTest, ZeroJobsWalksEveryStateAndWritesReport) {
    std::filesystem::create_directories(root_ / "in");
    Orchestrator orchestrator(outputFolderOptions(3), client_);

    std::mutex mutex;
    std::vector<RunState> seen;
    orchestrator.onStateChange([&](RunState state) {
        std::lock_guard<std::mutex> lock(mutex);
        seen.push_back(state);
    });
    EXPECT_EQ(orchestrator.state(), RunState::Idle);

    auto outcome = orchestrator.run({});
    ASSERT_TRUE(outcome);
    EXPECT_EQ(seen, (std::vector<RunState>{RunState::Running, RunState::Draining, RunState::Finalized}));
    EXPECT_EQ(outcome.stats.total, 0u);
    EXPECT_TRUE(outcome.stats.complete);

    json doc = readReport(outcome);
    EXPECT_EQ(doc["summary"]["total"], 0);
    EXPECT_TRUE(doc["jobs"].empty());
}

TEST_F(OrchestratorTest, StatesMoveForwardWithoutSkipping) {
    auto files = makeWorkflows("in", 5);
    Orchestrator orchestrator(outputFolderOptions(2), client_);

    std::mutex mutex;
    std::vector<RunState> seen;
    orchestrator.onStateChange([&](RunState state) {
        std::lock_guard<std::mutex> lock(mutex);
        seen.push_back(state);
    });

    ASSERT_TRUE(orchestrator.run(files));
    EXPECT_EQ(seen, (std::vector<RunState>{RunState::Running, RunState::Draining, RunState::Finalized}));
}

TEST_F(OrchestratorTest, SecondRunIsRejected) {
    auto files = makeWorkflows("in", 2);
    Orchestrator orchestrator(outputFolderOptions(1), client_);
    ASSERT_TRUE(orchestrator.run(files));

    auto again = orchestrator.run(files);
    EXPECT_FALSE(again);
    EXPECT_EQ(again.error, RunError::AlreadyFinalized);
    EXPECT_EQ(again.stats.total, 2u);
    EXPECT_EQ(client_->calls(), 2);
}

TEST_F(OrchestratorTest, ReportWriteFailureIsRunLevelError) {
    std::filesystem::create_directories(root_ / "in");
    writeFile("blocked", "a file where the output folder should be");
    RunOptions options = outputFolderOptions(1);
    options.outputFolder = root_ / "blocked";

    Orchestrator orchestrator(options, client_);
    auto outcome = orchestrator.run({});
    EXPECT_FALSE(outcome);
    EXPECT_EQ(outcome.error, RunError::ReportIoError);
    EXPECT_FALSE(outcome.message.empty());
    EXPECT_EQ(orchestrator.state(), RunState::Finalized);
}

TEST_F(OrchestratorTest, CancellationKeepsFinishedResultsAndMarksReport) {
    auto files = makeWorkflows("in", 6);
    auto slowClient = std::make_shared<ScriptedRenderClient>(400ms);
    Orchestrator orchestrator(outputFolderOptions(1), slowClient);

    std::thread canceller([&orchestrator]() {
        while (orchestrator.snapshot().completed() < 1) {
            std::this_thread::sleep_for(10ms);
        }
        orchestrator.cancel();
    });
    auto outcome = orchestrator.run(files);
    canceller.join();

    ASSERT_TRUE(outcome);
    EXPECT_TRUE(outcome.stats.cancelled);
    EXPECT_FALSE(outcome.stats.complete);
    EXPECT_GE(outcome.stats.succeeded, 1u);
    EXPECT_GT(outcome.stats.remaining, 0u);
    EXPECT_EQ(outcome.stats.succeeded + outcome.stats.failed, outcome.stats.total - outcome.stats.remaining);

    json doc = readReport(outcome);
    EXPECT_TRUE(doc["cancelled"].get<bool>());
    EXPECT_EQ(doc["summary"]["remaining"], outcome.stats.remaining);
    for (const auto& job : doc["jobs"]) {
        if (job["status"] == "failed") {
            EXPECT_EQ(job["error"]["kind"], "Cancelled");
        }
    }
}

TEST_F(OrchestratorTest, ResumeSkipsWorkflowsRenderedBefore) {
    auto files = makeWorkflows("in", 3);
    client_->script("wf-01.json", failWith(FailureKind::BackendUnreachable, "connection refused"));

    std::string firstStartedAt;
    {
        Orchestrator first(outputFolderOptions(1), client_);
        auto outcome = first.run(files);
        ASSERT_TRUE(outcome);
        EXPECT_EQ(outcome.stats.failed, 1u);
        firstStartedAt = readReport(outcome)["startedAt"].get<std::string>();
    }

    auto healthy = std::make_shared<ScriptedRenderClient>();
    Orchestrator second(outputFolderOptions(1), healthy);
    auto outcome = second.run(files);

    ASSERT_TRUE(outcome);
    EXPECT_EQ(outcome.skipped, 2u);
    EXPECT_EQ(outcome.stats.total, 1u);
    EXPECT_EQ(outcome.stats.succeeded, 1u);
    EXPECT_EQ(healthy->calls(), 1);
    EXPECT_EQ(healthy->attemptsFor("wf-01.json"), 1);

    json doc = readReport(outcome);
    EXPECT_EQ(doc["skipped"].size(), 2u);
    EXPECT_EQ(doc["startedAt"], firstStartedAt);
}

TEST_F(OrchestratorTest, ForceRerendersEverything) {
    auto files = makeWorkflows("in", 3);
    {
        Orchestrator first(outputFolderOptions(1), client_);
        ASSERT_TRUE(first.run(files));
    }

    RunOptions options = outputFolderOptions(1);
    options.force = true;
    auto again = std::make_shared<ScriptedRenderClient>();
    Orchestrator second(options, again);
    auto outcome = second.run(files);

    ASSERT_TRUE(outcome);
    EXPECT_EQ(outcome.skipped, 0u);
    EXPECT_EQ(outcome.stats.total, 3u);
    EXPECT_EQ(outcome.stats.replaced, 3u);
    EXPECT_EQ(again->calls(), 3);
}

TEST_F(OrchestratorTest, LiveQueriesStayConsistentDuringRun) {
    auto files = makeWorkflows("in", 20);
    Orchestrator orchestrator(outputFolderOptions(4), client_);

    std::atomic<bool> finished{false};
    std::atomic<int> violations{0};
    std::thread watcher([&]() {
        while (!finished.load()) {
            auto stats = orchestrator.snapshot();
            if (stats.succeeded + stats.failed != stats.total - stats.remaining) {
                ++violations;
            }
            if (orchestrator.workerStates().size() != 4u) {
                ++violations;
            }
            std::this_thread::sleep_for(1ms);
        }
    });

    auto outcome = orchestrator.run(files);
    finished.store(true);
    watcher.join();

    ASSERT_TRUE(outcome);
    EXPECT_EQ(violations.load(), 0);
    EXPECT_EQ(outcome.stats.succeeded, 20u);
    EXPECT_LE(client_->peakConcurrency(), 4);
}
