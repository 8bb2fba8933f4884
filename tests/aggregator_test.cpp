/*
 * wfsnap - Workflow Snapshot Renderer
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <atomic>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "wfsnap/aggregator.hpp"

using namespace wfsnap;

namespace {

JobResult makeResult(std::size_t index, JobStatus status, std::int64_t durationMs = 1000) {
    JobResult r;
    r.index = index;
    r.jobId = "job-" + std::to_string(index);
    r.status = status;
    r.durationMs = durationMs;
    if (status == JobStatus::Failed) {
        r.error = Failure{FailureKind::RenderError, "boom"};
    }
    return r;
}

}

TEST(ResultAggregator, StartsWithAllJobsRemaining) {
    ResultAggregator aggregator(5, 2);
    auto stats = aggregator.snapshot();
    EXPECT_EQ(stats.total, 5u);
    EXPECT_EQ(stats.remaining, 5u);
    EXPECT_EQ(stats.completed(), 0u);
    EXPECT_FALSE(stats.complete);
    EXPECT_DOUBLE_EQ(stats.etaSeconds, 0.0);
}

TEST(ResultAggregator, ZeroJobRunIsCompleteImmediately) {
    ResultAggregator aggregator(0, 4);
    auto stats = aggregator.snapshot();
    EXPECT_TRUE(stats.complete);
    EXPECT_EQ(stats.remaining, 0u);
    EXPECT_FALSE(aggregator.record(makeResult(0, JobStatus::Success)));
}

TEST(ResultAggregator, CountsStatusesAndReplacedAsSuccess) {
    ResultAggregator aggregator(4, 2);
    EXPECT_TRUE(aggregator.record(makeResult(0, JobStatus::Success)));
    EXPECT_TRUE(aggregator.record(makeResult(1, JobStatus::Failed)));
    EXPECT_TRUE(aggregator.record(makeResult(2, JobStatus::Replaced)));

    auto stats = aggregator.snapshot();
    EXPECT_EQ(stats.succeeded, 2u);
    EXPECT_EQ(stats.failed, 1u);
    EXPECT_EQ(stats.replaced, 1u);
    EXPECT_EQ(stats.remaining, 1u);
    EXPECT_EQ(stats.succeeded + stats.failed, stats.total - stats.remaining);
    EXPECT_FALSE(stats.complete);

    EXPECT_TRUE(aggregator.record(makeResult(3, JobStatus::Success)));
    EXPECT_TRUE(aggregator.snapshot().complete);
}

TEST(ResultAggregator, RejectsDuplicatesAndResultsPastTotal) {
    ResultAggregator aggregator(2, 1);
    EXPECT_TRUE(aggregator.record(makeResult(0, JobStatus::Success)));
    EXPECT_FALSE(aggregator.record(makeResult(0, JobStatus::Failed)));
    EXPECT_TRUE(aggregator.record(makeResult(1, JobStatus::Success)));
    EXPECT_FALSE(aggregator.record(makeResult(2, JobStatus::Success)));

    auto stats = aggregator.snapshot();
    EXPECT_EQ(stats.succeeded, 2u);
    EXPECT_EQ(stats.failed, 0u);
    EXPECT_EQ(aggregator.history().size(), 2u);
}

TEST(ResultAggregator, EtaUsesMovingAverageAndActiveWorkers) {
    ResultAggregator aggregator(10, 4);
    aggregator.record(makeResult(0, JobStatus::Success, 2000));
    aggregator.record(makeResult(1, JobStatus::Success, 4000));

    auto stats = aggregator.snapshot();
    EXPECT_DOUBLE_EQ(stats.averageDurationMs, 3000.0);
    EXPECT_EQ(stats.activeWorkers, 4u);
    EXPECT_DOUBLE_EQ(stats.etaSeconds, 3.0 * 8 / 4);
}

TEST(ResultAggregator, ActiveWorkersShrinkWithRemainingJobs) {
    ResultAggregator aggregator(3, 8);
    aggregator.record(makeResult(0, JobStatus::Success, 1000));
    auto stats = aggregator.snapshot();
    EXPECT_EQ(stats.activeWorkers, 2u);
    EXPECT_DOUBLE_EQ(stats.etaSeconds, 1.0);
}

TEST(ResultAggregator, MovingAverageKeepsLastTenSamples) {
    ResultAggregator aggregator(20, 1);
    for (std::size_t i = 0; i < 10; ++i) {
        aggregator.record(makeResult(i, JobStatus::Success, 10000));
    }
    for (std::size_t i = 10; i < 20; ++i) {
        aggregator.record(makeResult(i, JobStatus::Success, 1000));
    }
    EXPECT_DOUBLE_EQ(aggregator.snapshot().averageDurationMs, 1000.0);
}

TEST(ResultAggregator, HistoryIsOrderedByQueuePosition) {
    ResultAggregator aggregator(3, 3);
    aggregator.record(makeResult(2, JobStatus::Success));
    aggregator.record(makeResult(0, JobStatus::Failed));
    aggregator.record(makeResult(1, JobStatus::Success));

    auto history = aggregator.history();
    ASSERT_EQ(history.size(), 3u);
    for (std::size_t i = 0; i < 3; ++i) {
        EXPECT_EQ(history[i].index, i);
    }
}

TEST(ResultAggregator, StatsFreezeOnceComplete) {
    ResultAggregator aggregator(1, 1);
    aggregator.record(makeResult(0, JobStatus::Success));
    auto first = aggregator.snapshot();
    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    auto second = aggregator.snapshot();
    EXPECT_DOUBLE_EQ(first.elapsedSeconds, second.elapsedSeconds);
    EXPECT_DOUBLE_EQ(first.throughputPerMinute, second.throughputPerMinute);
}

TEST(ResultAggregator, CloseRejectsLateResultsAndKeepsRemaining) {
    ResultAggregator aggregator(3, 1);
    aggregator.record(makeResult(0, JobStatus::Success));
    aggregator.markCancelled();
    aggregator.close();

    EXPECT_FALSE(aggregator.record(makeResult(1, JobStatus::Success)));
    auto stats = aggregator.snapshot();
    EXPECT_TRUE(stats.cancelled);
    EXPECT_FALSE(stats.complete);
    EXPECT_EQ(stats.remaining, 2u);
}

TEST(ResultAggregator, ConcurrentReadersNeverSeeTornState) {
    constexpr std::size_t kJobs = 2000;
    ResultAggregator aggregator(kJobs, 4);
    std::atomic<bool> done{false};
    std::atomic<int> violations{0};

    std::vector<std::thread> readers;
    for (int r = 0; r < 4; ++r) {
        readers.emplace_back([&]() {
            std::size_t lastCompleted = 0;
            while (!done.load()) {
                auto s = aggregator.snapshot();
                if (s.succeeded + s.failed != s.total - s.remaining || s.replaced > s.succeeded ||
                    s.completed() < lastCompleted) {
                    ++violations;
                }
                lastCompleted = s.completed();
            }
        });
    }

    std::vector<std::thread> writers;
    for (std::size_t w = 0; w < 4; ++w) {
        writers.emplace_back([&, w]() {
            for (std::size_t i = w; i < kJobs; i += 4) {
                auto status = (i % 7 == 0) ? JobStatus::Failed
                            : (i % 5 == 0) ? JobStatus::Replaced
                                           : JobStatus::Success;
                aggregator.record(makeResult(i, status, static_cast<std::int64_t>(i % 50)));
            }
        });
    }
    for (auto& t : writers) t.join();
    done.store(true);
    for (auto& t : readers) t.join();

    EXPECT_EQ(violations.load(), 0);
    auto stats = aggregator.snapshot();
    EXPECT_TRUE(stats.complete);
    EXPECT_EQ(stats.succeeded + stats.failed, kJobs);
}
