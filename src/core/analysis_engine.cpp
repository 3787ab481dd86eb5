#include "code_sentinel/core/analysis_engine.hpp"
#include "code_sentinel/common/constants.hpp"
#include "code_sentinel/common/logger.hpp"
#include "code_sentinel/core/errors.hpp"
#include "code_sentinel/report/aggregator.hpp"

namespace code_sentinel {
namespace core {

namespace {

ConfigurationError configError(CoreErrorCode code, const std::string& message,
                               std::map<std::string, std::string> details = {}) {
    ErrorContext context{"Engine", std::move(details)};
    common::Logger::instance().error("[Engine] Rejected | code={} | {} | {}",
                                     CoreErrorCodeHelper::toString(code), message,
                                     context.format());
    return ConfigurationError(code, message, context);
}

// Clears the engine's active scheduler pointer when a run leaves scope.
class ActiveRun {
public:
    ActiveRun(std::mutex& mutex, schedule::Scheduler*& slot, schedule::Scheduler* scheduler)
        : mutex_(mutex), slot_(slot) {
        std::lock_guard<std::mutex> lock(mutex_);
        slot_ = scheduler;
    }

    ~ActiveRun() {
        std::lock_guard<std::mutex> lock(mutex_);
        slot_ = nullptr;
    }

private:
    std::mutex& mutex_;
    schedule::Scheduler*& slot_;
};

}

AnalysisEngine::AnalysisEngine()
    : AnalysisEngine(analyzer::AnalyzerRegistry::withBuiltins(), common::Config::createDefaultScoring()) {}

AnalysisEngine::AnalysisEngine(analyzer::AnalyzerRegistry registry, common::ScoringConfig scoring)
    : registry_(std::move(registry)), scoring_(std::move(scoring)) {}

void AnalysisEngine::addObserver(schedule::ProgressObserver observer) {
    observers_.push_back(std::move(observer));
}

void AnalysisEngine::validateLimits(const common::FileCatalog& catalog, const common::AnalysisConfig& config) {
    if (catalog.empty()) {
        throw configError(CoreErrorCode::CONFIG_EMPTY_CATALOG, "File catalog is empty");
    }
    if (config.enabled_analyzers.empty()) {
        throw configError(CoreErrorCode::CONFIG_NO_ANALYZERS, "No analyzers enabled");
    }
    if (config.max_concurrent_tasks < 1 || config.max_concurrent_tasks > constants::limits::MAX_CONCURRENT_TASKS) {
        throw configError(CoreErrorCode::CONFIG_INVALID_VALUE, "max_concurrent_tasks out of range",
                          {{"value", std::to_string(config.max_concurrent_tasks)}});
    }
    if (config.per_task_timeout.count() <= 0) {
        throw configError(CoreErrorCode::CONFIG_INVALID_VALUE, "per_task_timeout must be positive",
                          {{"value_ms", std::to_string(config.per_task_timeout.count())}});
    }
    if (!(config.deep_tier_sample_rate >= 0.0 && config.deep_tier_sample_rate <= 1.0)) {
        throw configError(CoreErrorCode::CONFIG_INVALID_VALUE, "deep_tier_sample_rate must be within [0, 1]",
                          {{"value", std::to_string(config.deep_tier_sample_rate)}});
    }
}

void AnalysisEngine::validate(const common::FileCatalog& catalog, const common::AnalysisConfig& config) const {
    validateLimits(catalog, config);
    for (const auto& id : config.enabled_analyzers) {
        if (!registry_.contains(id)) {
            throw configError(CoreErrorCode::CONFIG_UNKNOWN_ANALYZER, "Unknown analyzer '" + id + "'",
                              {{"analyzer", id}});
        }
    }
}

report::Report AnalysisEngine::analyze(const common::FileCatalog& catalog, const common::AnalysisConfig& config) {
    return run(catalog, config).report;
}

EngineResult AnalysisEngine::run(const common::FileCatalog& catalog, const common::AnalysisConfig& config) {
    validate(catalog, config);
    return run(catalog, config, registry_.createAll(config.enabled_analyzers, config.use_deep_tier));
}

EngineResult AnalysisEngine::run(const common::FileCatalog& catalog,
                                 const common::AnalysisConfig& config,
                                 std::vector<std::shared_ptr<analyzer::Analyzer>> analyzers) {
    validateLimits(catalog, config);

    std::set<std::string> available;
    for (const auto& candidate : analyzers) {
        available.insert(candidate->id());
    }
    for (const auto& id : config.enabled_analyzers) {
        if (!available.count(id)) {
            throw configError(CoreErrorCode::CONFIG_UNKNOWN_ANALYZER, "Unknown analyzer '" + id + "'",
                              {{"analyzer", id}});
        }
    }

    common::Logger::instance().info("[Engine] Analysis started | files={} | analyzers={} | deep_tier={}",
                                    catalog.size(), config.enabled_analyzers.size(), config.use_deep_tier);

    schedule::Scheduler scheduler(std::move(analyzers));
    cancel_pending_.store(false);

    auto observers = observers_;
    // A cancel that lands before the scheduler resets its flag is re-applied
    // on the next settled task.
    observers.push_back([this, &scheduler](const schedule::ProgressSnapshot&) {
        if (cancel_pending_.load() && !scheduler.cancelRequested()) {
            scheduler.cancel();
        }
    });

    EngineResult result;
    {
        ActiveRun active(active_mutex_, active_, &scheduler);
        result.schedule = scheduler.run(catalog, config, std::move(observers));
    }

    report::RunContext context;
    context.analyzer_ids.assign(config.enabled_analyzers.begin(), config.enabled_analyzers.end());
    context.total_duration = result.schedule.elapsed;
    context.cancelled = result.schedule.cancelled;

    report::ResultAggregator aggregator(scoring_);
    result.report = aggregator.aggregate(result.schedule.outcomes, context);

    common::Logger::instance().info("[Engine] Analysis finished | status={} | issues={} | score={} | grade={}",
                                    common::to_string(result.report.status), result.report.total_issues,
                                    result.report.summary.overall_score, result.report.summary.grade);
    return result;
}

void AnalysisEngine::cancel() {
    std::lock_guard<std::mutex> lock(active_mutex_);
    if (!active_) {
        return;
    }
    cancel_pending_.store(true);
    active_->cancel();
}

}}
