#include "code_sentinel/schedule/progress_tracker.hpp"
#include "code_sentinel/common/logger.hpp"
#include <algorithm>

namespace code_sentinel {
namespace schedule {

ProgressTracker::ProgressTracker(size_t total_tasks,
                                 const std::vector<std::string>& analyzer_ids,
                                 std::vector<ProgressObserver> observers)
    : observers_(std::move(observers)), start_time_(Clock::now()) {
    state_.total_tasks = total_tasks;
    for (const auto& id : analyzer_ids) {
        state_.per_analyzer_stats[id];
    }
}

void ProgressTracker::taskStarted() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++state_.in_flight_tasks;
    state_.peak_in_flight_tasks = std::max(state_.peak_in_flight_tasks, state_.in_flight_tasks);
}

void ProgressTracker::taskSettled(const common::Outcome& outcome) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto& stats = state_.per_analyzer_stats[outcome.analyzer_id];

    switch (outcome.status) {
        case common::OutcomeStatus::COMPLETED:
            state_.completed_tasks++;
            stats.files_processed++;
            state_.findings_so_far += outcome.findings.size();
            stats.findings_found += outcome.findings.size();
            break;
        case common::OutcomeStatus::FAILED:
            state_.failed_tasks++;
            stats.failures++;
            break;
        case common::OutcomeStatus::TIMED_OUT:
            state_.timed_out_tasks++;
            stats.timeouts++;
            break;
    }

    if (state_.in_flight_tasks > 0) {
        --state_.in_flight_tasks;
    }
    refreshElapsed();
    notifyObservers();
}

void ProgressTracker::taskAbandoned() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_.in_flight_tasks > 0) {
        --state_.in_flight_tasks;
    }
}

void ProgressTracker::markCancelled() {
    std::lock_guard<std::mutex> lock(mutex_);
    state_.cancelled = true;
}

ProgressSnapshot ProgressTracker::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    ProgressSnapshot copy = state_;
    copy.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start_time_);
    return copy;
}

void ProgressTracker::refreshElapsed() {
    state_.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start_time_);
}

void ProgressTracker::notifyObservers() {
    if (observers_.empty()) {
        return;
    }

    const ProgressSnapshot copy = state_;
    for (size_t i = 0; i < observers_.size(); ++i) {
        try {
            observers_[i](copy);
        } catch (const std::exception& e) {
            common::Logger::instance().warn("[Progress] Observer failed | index={} | error={}", i, e.what());
        } catch (...) {
            common::Logger::instance().warn("[Progress] Observer failed | index={} | error=unknown exception", i);
        }
    }
}

}}
