#include <gtest/gtest.h>
#include "code_sentinel/schedule/progress_tracker.hpp"
#include "test_helpers.hpp"
#include <stdexcept>

using namespace code_sentinel;
using schedule::ProgressSnapshot;
using schedule::ProgressTracker;
using test_support::makeFinding;
using test_support::makeOutcome;

TEST(ProgressTrackerTest, StartsWithEveryAnalyzerListed) {
    ProgressTracker tracker(4, {"security", "performance"}, {});
    auto snapshot = tracker.snapshot();

    EXPECT_EQ(snapshot.total_tasks, 4u);
    EXPECT_EQ(snapshot.settledTasks(), 0u);
    EXPECT_EQ(snapshot.per_analyzer_stats.size(), 2u);
    EXPECT_EQ(snapshot.per_analyzer_stats.at("security").files_processed, 0u);
    EXPECT_FALSE(snapshot.cancelled);
}

TEST(ProgressTrackerTest, CountsEachStatus) {
    ProgressTracker tracker(3, {"security"}, {});

    tracker.taskStarted();
    tracker.taskStarted();
    tracker.taskStarted();
    EXPECT_EQ(tracker.snapshot().in_flight_tasks, 3u);

    tracker.taskSettled(makeOutcome("security", "a.py", {
        makeFinding("one", common::Severity::HIGH, "a.py", 1),
        makeFinding("two", common::Severity::LOW, "a.py", 2)
    }));
    tracker.taskSettled(makeOutcome("security", "b.py", {}, common::OutcomeStatus::FAILED));
    tracker.taskSettled(makeOutcome("security", "c.py", {}, common::OutcomeStatus::TIMED_OUT));

    auto snapshot = tracker.snapshot();
    EXPECT_EQ(snapshot.completed_tasks, 1u);
    EXPECT_EQ(snapshot.failed_tasks, 1u);
    EXPECT_EQ(snapshot.timed_out_tasks, 1u);
    EXPECT_EQ(snapshot.settledTasks(), 3u);
    EXPECT_EQ(snapshot.findings_so_far, 2u);
    EXPECT_EQ(snapshot.in_flight_tasks, 0u);
    EXPECT_EQ(snapshot.peak_in_flight_tasks, 3u);

    const auto& stats = snapshot.per_analyzer_stats.at("security");
    EXPECT_EQ(stats.files_processed, 1u);
    EXPECT_EQ(stats.findings_found, 2u);
    EXPECT_EQ(stats.failures, 1u);
    EXPECT_EQ(stats.timeouts, 1u);
}

TEST(ProgressTrackerTest, ObserversSeeNonDecreasingCounts) {
    std::vector<size_t> settled;
    ProgressTracker tracker(3, {"x"}, {[&](const ProgressSnapshot& snapshot) {
        settled.push_back(snapshot.settledTasks());
    }});

    for (int i = 0; i < 3; ++i) {
        tracker.taskStarted();
        tracker.taskSettled(makeOutcome("x", "f" + std::to_string(i) + ".py", {}));
    }

    EXPECT_EQ(settled, (std::vector<size_t>{1, 2, 3}));
}

TEST(ProgressTrackerTest, ThrowingObserverDoesNotStopOthers) {
    size_t calls = 0;
    ProgressTracker tracker(1, {"x"}, {
        [](const ProgressSnapshot&) { throw std::runtime_error("observer broke"); },
        [&](const ProgressSnapshot&) { ++calls; }
    });

    tracker.taskStarted();
    EXPECT_NO_THROW(tracker.taskSettled(makeOutcome("x", "a.py", {})));
    EXPECT_EQ(calls, 1u);
    EXPECT_EQ(tracker.snapshot().completed_tasks, 1u);
}

TEST(ProgressTrackerTest, ObserverThrowingNonStandardTypeIsContained) {
    size_t calls = 0;
    ProgressTracker tracker(1, {"x"}, {
        [](const ProgressSnapshot&) { throw 42; },
        [&](const ProgressSnapshot&) { ++calls; }
    });

    tracker.taskStarted();
    EXPECT_NO_THROW(tracker.taskSettled(makeOutcome("x", "a.py", {})));
    EXPECT_EQ(calls, 1u);
    EXPECT_EQ(tracker.snapshot().in_flight_tasks, 0u);
}

TEST(ProgressTrackerTest, AbandonedTasksLeaveCountersAlone) {
    ProgressTracker tracker(2, {"x"}, {});
    tracker.taskStarted();
    tracker.taskAbandoned();
    tracker.markCancelled();

    auto snapshot = tracker.snapshot();
    EXPECT_EQ(snapshot.in_flight_tasks, 0u);
    EXPECT_EQ(snapshot.settledTasks(), 0u);
    EXPECT_TRUE(snapshot.cancelled);
}
