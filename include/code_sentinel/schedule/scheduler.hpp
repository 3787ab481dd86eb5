#pragma once

#include "../analyzer/analyzer.hpp"
#include "../common/types.hpp"
#include "progress_tracker.hpp"
#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace code_sentinel {
namespace schedule {

struct Task {
    size_t index;
    const common::SourceFile* file;
    std::shared_ptr<analyzer::Analyzer> analyzer;
};

struct ScheduleResult {
    // Task order, not completion order. Tasks abandoned on cancellation are absent.
    std::vector<common::Outcome> outcomes;
    bool cancelled = false;
    ProgressSnapshot progress;
    std::chrono::milliseconds elapsed{0};
};

class Scheduler {
public:
    explicit Scheduler(std::vector<std::shared_ptr<analyzer::Analyzer>> analyzers);

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    // Catalog order, then analyzer id order. Analyzers outside
    // config.enabled_analyzers, files they cannot analyze, and paths matching
    // a skip pattern produce no task.
    static std::vector<Task> buildTasks(const common::FileCatalog& catalog,
                                        const common::AnalysisConfig& config,
                                        const std::vector<std::shared_ptr<analyzer::Analyzer>>& analyzers);

    ScheduleResult run(const common::FileCatalog& catalog,
                       const common::AnalysisConfig& config,
                       std::vector<ProgressObserver> observers = {});

    // Safe from any thread, including observers. Queued tasks are dropped and
    // running tasks stop at their next checkpoint.
    void cancel();
    bool cancelRequested() const;

    const std::vector<std::shared_ptr<analyzer::Analyzer>>& analyzers() const { return analyzers_; }

private:
    std::vector<std::shared_ptr<analyzer::Analyzer>> analyzers_;
    std::atomic<bool> cancel_requested_{false};

    std::optional<common::Outcome> runTask(const Task& task,
                                           const common::AnalysisConfig& config,
                                           const analyzer::EscalationOptions& escalation) const;
};

}}
