#pragma once

#include "../analyzer/analyzer_registry.hpp"
#include "../common/config.hpp"
#include "../common/types.hpp"
#include "../report/report.hpp"
#include "../schedule/scheduler.hpp"
#include <atomic>
#include <memory>
#include <mutex>
#include <vector>

namespace code_sentinel {
namespace core {

struct EngineResult {
    report::Report report;
    schedule::ScheduleResult schedule;
};

class AnalysisEngine {
public:
    AnalysisEngine();
    AnalysisEngine(analyzer::AnalyzerRegistry registry, common::ScoringConfig scoring);

    AnalysisEngine(const AnalysisEngine&) = delete;
    AnalysisEngine& operator=(const AnalysisEngine&) = delete;

    void addObserver(schedule::ProgressObserver observer);

    // Throws ConfigurationError before any task is scheduled when the
    // catalog or analyzer set is empty, an analyzer id is unknown, or a
    // limit is out of range.
    report::Report analyze(const common::FileCatalog& catalog, const common::AnalysisConfig& config);
    EngineResult run(const common::FileCatalog& catalog, const common::AnalysisConfig& config);

    // Uses the given analyzers instead of the registry; ids in
    // config.enabled_analyzers must still name one of them.
    EngineResult run(const common::FileCatalog& catalog,
                     const common::AnalysisConfig& config,
                     std::vector<std::shared_ptr<analyzer::Analyzer>> analyzers);

    // No-op when no run is active.
    void cancel();

    void validate(const common::FileCatalog& catalog, const common::AnalysisConfig& config) const;

    const analyzer::AnalyzerRegistry& registry() const { return registry_; }

private:
    analyzer::AnalyzerRegistry registry_;
    common::ScoringConfig scoring_;
    std::vector<schedule::ProgressObserver> observers_;

    std::mutex active_mutex_;
    schedule::Scheduler* active_ = nullptr;
    std::atomic<bool> cancel_pending_{false};

    static void validateLimits(const common::FileCatalog& catalog, const common::AnalysisConfig& config);
};

}}
