#include "code_sentinel/schedule/scheduler.hpp"
#include "code_sentinel/schedule/slot_gate.hpp"
#include "code_sentinel/schedule/task_token.hpp"
#include "code_sentinel/analyzer/random_source.hpp"
#include "code_sentinel/common/glob_matcher.hpp"
#include "code_sentinel/common/logger.hpp"
#include "code_sentinel/core/errors.hpp"
#include <tbb/parallel_for.h>
#include <tbb/task_arena.h>
#include <algorithm>

namespace code_sentinel {
namespace schedule {

namespace {

using Clock = std::chrono::steady_clock;

std::chrono::milliseconds millisSince(Clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);
}

common::Outcome makeFailure(const Task& task, common::OutcomeStatus status,
                            core::CoreErrorCode code, const std::string& message) {
    common::Outcome outcome;
    outcome.analyzer_id = task.analyzer->id();
    outcome.file_path = task.file->path;
    outcome.status = status;
    outcome.error_code = code;
    outcome.error_message = message;
    return outcome;
}

}

Scheduler::Scheduler(std::vector<std::shared_ptr<analyzer::Analyzer>> analyzers)
    : analyzers_(std::move(analyzers)) {
    std::sort(analyzers_.begin(), analyzers_.end(),
              [](const std::shared_ptr<analyzer::Analyzer>& a, const std::shared_ptr<analyzer::Analyzer>& b) {
                  return a->id() < b->id();
              });
}

std::vector<Task> Scheduler::buildTasks(const common::FileCatalog& catalog,
                                        const common::AnalysisConfig& config,
                                        const std::vector<std::shared_ptr<analyzer::Analyzer>>& analyzers) {
    common::GlobMatcher skip(config.skip_patterns);

    std::vector<std::shared_ptr<analyzer::Analyzer>> enabled;
    for (const auto& candidate : analyzers) {
        if (config.enabled_analyzers.count(candidate->id())) {
            enabled.push_back(candidate);
        }
    }
    std::sort(enabled.begin(), enabled.end(),
              [](const std::shared_ptr<analyzer::Analyzer>& a, const std::shared_ptr<analyzer::Analyzer>& b) {
                  return a->id() < b->id();
              });

    std::vector<Task> tasks;
    size_t skipped_files = 0;

    for (const auto& file : catalog) {
        if (skip.matches(file.path)) {
            ++skipped_files;
            common::Logger::instance().debug("[Scheduler] File skipped by pattern | path={}", file.path);
            continue;
        }
        for (const auto& candidate : enabled) {
            if (candidate->canAnalyze(file)) {
                tasks.push_back(Task{tasks.size(), &file, candidate});
            }
        }
    }

    common::Logger::instance().debug("[Scheduler] Tasks built | files={} | analyzers={} | tasks={} | skipped={}",
                                     catalog.size(), enabled.size(), tasks.size(), skipped_files);
    return tasks;
}

ScheduleResult Scheduler::run(const common::FileCatalog& catalog,
                              const common::AnalysisConfig& config,
                              std::vector<ProgressObserver> observers) {
    auto start = Clock::now();
    cancel_requested_.store(false, std::memory_order_release);

    auto tasks = buildTasks(catalog, config, analyzers_);

    std::vector<std::string> analyzer_ids(config.enabled_analyzers.begin(), config.enabled_analyzers.end());
    ProgressTracker tracker(tasks.size(), analyzer_ids, std::move(observers));

    analyzer::EscalationOptions escalation;
    escalation.use_deep_tier = config.use_deep_tier;
    escalation.sample_rate = config.deep_tier_sample_rate;

    size_t workers = std::max<size_t>(1, std::min<size_t>(static_cast<size_t>(std::max(config.max_concurrent_tasks, 1)),
                                                          tasks.size()));

    common::Logger::instance().info("[Scheduler] Run started | tasks={} | max_concurrent={} | timeout_ms={} | deep_tier={}",
                                    tasks.size(), config.max_concurrent_tasks,
                                    config.per_task_timeout.count(), config.use_deep_tier);

    std::vector<std::optional<common::Outcome>> slots(tasks.size());

    if (!tasks.empty()) {
        SlotGate gate(workers);
        std::atomic<size_t> next_task{0};

        tbb::task_arena arena(static_cast<int>(workers));
        arena.execute([&] {
            tbb::parallel_for(size_t(0), workers, [&](size_t) {
                while (true) {
                    size_t index = next_task.fetch_add(1);
                    if (index >= tasks.size()) {
                        return;
                    }
                    if (cancelRequested()) {
                        continue;
                    }

                    SlotLease lease = gate.acquire();
                    if (cancelRequested()) {
                        continue;
                    }

                    tracker.taskStarted();
                    auto outcome = runTask(tasks[index], config, escalation);
                    if (!outcome) {
                        tracker.taskAbandoned();
                        continue;
                    }
                    tracker.taskSettled(*outcome);
                    slots[index] = std::move(outcome);
                }
            });
        });

        common::Logger::instance().debug("[Scheduler] Slot usage | capacity={} | peak={}", gate.capacity(), gate.peak());
    }

    ScheduleResult result;
    result.cancelled = cancelRequested();
    if (result.cancelled) {
        tracker.markCancelled();
    }

    for (auto& slot : slots) {
        if (slot) {
            result.outcomes.push_back(std::move(*slot));
        }
    }
    result.progress = tracker.snapshot();
    result.elapsed = millisSince(start);

    common::Logger::instance().info("[Scheduler] Run finished | settled={} | completed={} | failed={} | timed_out={} | cancelled={} | duration_ms={}",
                                    result.outcomes.size(), result.progress.completed_tasks,
                                    result.progress.failed_tasks, result.progress.timed_out_tasks,
                                    result.cancelled, common::formatDuration(result.elapsed));
    return result;
}

std::optional<common::Outcome> Scheduler::runTask(const Task& task,
                                                  const common::AnalysisConfig& config,
                                                  const analyzer::EscalationOptions& escalation) const {
    const auto& file = *task.file;
    const auto& worker = *task.analyzer;

    auto start = Clock::now();
    auto deadline = start + config.per_task_timeout;
    TaskToken token(deadline, &cancel_requested_);
    analyzer::SeededRandomSource random(config.random_seed, file.path, worker.id());
    analyzer::AnalysisContext context{token, escalation, random};

    common::Outcome outcome;

    try {
        auto output = worker.analyze(file, context);

        if (Clock::now() > deadline) {
            // Finished, but too late: the result is discarded like any other overrun.
            outcome = makeFailure(task, common::OutcomeStatus::TIMED_OUT, core::CoreErrorCode::TASK_TIMEOUT,
                                  "Task finished after its deadline");
        } else {
            outcome.analyzer_id = worker.id();
            outcome.file_path = file.path;
            outcome.status = common::OutcomeStatus::COMPLETED;
            outcome.findings = std::move(output.findings);
            outcome.metrics = std::move(output.metrics);
        }
    } catch (const core::TaskCancelled&) {
        common::Logger::instance().debug("[Scheduler] Task abandoned | analyzer={} | file={}", worker.id(), file.path);
        return std::nullopt;
    } catch (const core::TaskTimeout& e) {
        outcome = makeFailure(task, common::OutcomeStatus::TIMED_OUT, e.code(), e.what());
    } catch (const core::AnalysisError& e) {
        outcome = makeFailure(task, common::OutcomeStatus::FAILED, e.code(), e.what());
    } catch (const std::exception& e) {
        outcome = makeFailure(task, common::OutcomeStatus::FAILED,
                              core::CoreErrorCode::ANALYZER_EXECUTION_FAILED, e.what());
    } catch (...) {
        outcome = makeFailure(task, common::OutcomeStatus::FAILED,
                              core::CoreErrorCode::ANALYZER_EXECUTION_FAILED, "unknown exception");
    }

    outcome.execution_time = millisSince(start);

    if (outcome.status == common::OutcomeStatus::TIMED_OUT) {
        common::Logger::instance().warn("[Scheduler] Task timed out | analyzer={} | file={} | code={} | timeout_ms={}",
                                        worker.id(), file.path,
                                        core::CoreErrorCodeHelper::toString(core::CoreErrorCode::TASK_TIMEOUT),
                                        config.per_task_timeout.count());
    } else if (outcome.status == common::OutcomeStatus::FAILED) {
        common::Logger::instance().warn("[Scheduler] Task failed | analyzer={} | file={} | code={} | error={}",
                                        worker.id(), file.path,
                                        core::CoreErrorCodeHelper::toString(*outcome.error_code),
                                        outcome.error_message.value_or(""));
    } else {
        common::Logger::instance().debug("[Scheduler] Task completed | analyzer={} | file={} | findings={} | duration_ms={}",
                                         worker.id(), file.path, outcome.findings.size(),
                                         common::formatDuration(outcome.execution_time));
    }
    return outcome;
}

void Scheduler::cancel() {
    if (!cancel_requested_.exchange(true, std::memory_order_acq_rel)) {
        common::Logger::instance().info("[Scheduler] Cancellation requested");
    }
}

bool Scheduler::cancelRequested() const {
    return cancel_requested_.load(std::memory_order_acquire);
}

}}
