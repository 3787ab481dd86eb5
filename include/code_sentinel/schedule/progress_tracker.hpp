#pragma once

#include "../common/types.hpp"
#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace code_sentinel {
namespace schedule {

struct AnalyzerProgress {
    // Completed tasks only, as in the report's per-analyzer stats.
    size_t files_processed = 0;
    size_t findings_found = 0;
    size_t failures = 0;
    size_t timeouts = 0;
};

struct ProgressSnapshot {
    size_t total_tasks = 0;
    size_t completed_tasks = 0;
    size_t failed_tasks = 0;
    size_t timed_out_tasks = 0;
    size_t findings_so_far = 0;
    std::chrono::milliseconds elapsed{0};
    std::map<std::string, AnalyzerProgress> per_analyzer_stats;
    size_t in_flight_tasks = 0;
    size_t peak_in_flight_tasks = 0;
    bool cancelled = false;

    size_t settledTasks() const { return completed_tasks + failed_tasks + timed_out_tasks; }
};

using ProgressObserver = std::function<void(const ProgressSnapshot&)>;

// Shared state of one run. Every mutation and the observer notification that
// follows it happen under one lock, so observers see non-decreasing counters.
// Observers get a copy and must not call back into the tracker. They also hold
// up every settling task while they run, so they should return quickly.
class ProgressTracker {
public:
    ProgressTracker(size_t total_tasks,
                    const std::vector<std::string>& analyzer_ids,
                    std::vector<ProgressObserver> observers);

    ProgressTracker(const ProgressTracker&) = delete;
    ProgressTracker& operator=(const ProgressTracker&) = delete;

    void taskStarted();
    void taskSettled(const common::Outcome& outcome);

    // In-flight task dropped because the run was cancelled.
    void taskAbandoned();

    void markCancelled();

    ProgressSnapshot snapshot() const;

private:
    using Clock = std::chrono::steady_clock;

    ProgressSnapshot state_;
    std::vector<ProgressObserver> observers_;
    Clock::time_point start_time_;
    mutable std::mutex mutex_;

    void refreshElapsed();
    void notifyObservers();
};

}}
