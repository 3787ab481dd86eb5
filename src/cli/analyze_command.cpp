#include "analyze_command.hpp"
#include "code_sentinel/catalog/catalog_loader.hpp"
#include "code_sentinel/common/config.hpp"
#include "code_sentinel/common/constants.hpp"
#include "code_sentinel/common/logger.hpp"
#include "code_sentinel/common/progress_bar.hpp"
#include "code_sentinel/core/analysis_engine.hpp"
#include "code_sentinel/core/errors.hpp"
#include "code_sentinel/format/console_formatter.hpp"
#include "code_sentinel/format/json_formatter.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <mutex>

namespace code_sentinel {
namespace cli {

AnalyzeCommand::AnalyzeCommand() = default;

void AnalyzeCommand::setup(CLI::App* subcommand) {
    subcommand_ = subcommand;

    subcommand->add_option("target", target_path_, "Catalog JSON file or directory to analyze")
               ->required()
               ->check(CLI::ExistingPath);

    agents_option_ = subcommand->add_option("-a,--agents", agents_,
                                            "Analyzers to run (default: analysis.enabled_agents)")
                               ->delimiter(',');

    concurrency_option_ = subcommand->add_option("-j,--max-concurrent", max_concurrent_,
                                                 "Maximum tasks in flight")
                                    ->check(CLI::Range(1, constants::limits::MAX_CONCURRENT_TASKS));

    timeout_option_ = subcommand->add_option("-t,--timeout", timeout_seconds_,
                                             "Per-task timeout in seconds")
                                ->check(CLI::Range(1, constants::limits::MAX_TIMEOUT_PER_FILE_SECONDS));

    subcommand->add_flag("--deep", deep_, "Enable the deep inspection tier");

    sample_rate_option_ = subcommand->add_option("--sample-rate", sample_rate_,
                                                 "Deep tier sampling probability for ordinary files")
                                    ->check(CLI::Range(0.0, 1.0));

    skip_option_ = subcommand->add_option("--skip", skip_patterns_,
                                          "Glob patterns to exclude (replaces analysis.skip_patterns)");

    seed_option_ = subcommand->add_option("--seed", seed_, "Random seed for deep tier sampling");

    subcommand->add_flag("--json", json_output_, "Write the report as JSON");
    subcommand->add_option("-o,--output", output_path_, "Write the report to a file instead of stdout");
    subcommand->add_flag("-p,--no-progress", no_progress_, "Disable the progress bar");

    subcommand->add_option("--fail-on", fail_on_,
                           "Exit with 2 when an issue at or above this severity remains")
               ->check(CLI::IsMember({"critical", "high", "medium", "low", "info"}, CLI::ignore_case));

    markCalledOnParse();
}

common::AnalysisConfig AnalyzeCommand::buildConfig() const {
    auto config = common::Config::instance().toAnalysisConfig();

    if (agents_option_->count() > 0) {
        config.enabled_analyzers = std::set<std::string>(agents_.begin(), agents_.end());
    }
    if (concurrency_option_->count() > 0) {
        config.max_concurrent_tasks = max_concurrent_;
    }
    if (timeout_option_->count() > 0) {
        config.per_task_timeout = std::chrono::seconds(timeout_seconds_);
    }
    if (deep_) {
        config.use_deep_tier = true;
    }
    if (sample_rate_option_->count() > 0) {
        config.deep_tier_sample_rate = sample_rate_;
    }
    if (skip_option_->count() > 0) {
        config.skip_patterns = skip_patterns_;
    }
    if (seed_option_->count() > 0) {
        config.random_seed = seed_;
    }
    return config;
}

common::FileCatalog AnalyzeCommand::loadCatalog(const common::AnalysisConfig& config) const {
    if (std::filesystem::is_directory(target_path_)) {
        catalog::CollectOptions options;
        options.max_file_size = constants::limits::DEFAULT_MAX_FILE_SIZE_KB * 1024;
        options.skip_patterns = config.skip_patterns;
        return catalog::CatalogLoader::collectDirectory(target_path_, options);
    }
    return catalog::CatalogLoader::loadCatalogFile(target_path_);
}

bool AnalyzeCommand::meetsThreshold(const report::Report& report, common::Severity threshold) {
    for (const auto& issue : report.issues) {
        if (issue.finding.severity && !common::isMoreSevere(threshold, *issue.finding.severity)) {
            return true;
        }
    }
    return false;
}

void AnalyzeCommand::reportError(const core::AnalysisError& e) const {
    std::cerr << "Error: " << e.what() << " (" << e.codeString() << ")" << std::endl;
    common::Logger::instance().error("[Analyze] Run aborted | family={} | code={} | {}",
                                     core::to_string(core::CoreErrorCodeHelper::family(e.code())),
                                     e.codeString(), e.context().format());
}

int AnalyzeCommand::writeReport(const report::Report& report) const {
    std::ofstream file;
    if (!output_path_.empty()) {
        file.open(output_path_);
        if (!file) {
            std::cerr << "Error: Cannot write " << output_path_ << std::endl;
            common::Logger::instance().error("[Analyze] Output open failed | path={}", output_path_);
            return EXIT_ERROR;
        }
    }
    std::ostream& out = output_path_.empty() ? std::cout : file;

    if (json_output_) {
        out << format::JsonFormatter::format(report).dump(2) << std::endl;
    } else {
        format::ConsoleFormatter formatter(output_path_.empty());
        formatter.format(report, out);
    }

    if (!output_path_.empty()) {
        std::cerr << "Report written to " << output_path_ << std::endl;
    }
    return EXIT_OK;
}

int AnalyzeCommand::execute() {
    common::AnalysisConfig config;
    common::FileCatalog files;

    try {
        config = buildConfig();
        files = loadCatalog(config);
    } catch (const core::CatalogError& e) {
        reportError(e);
        return EXIT_ERROR;
    }

    core::AnalysisEngine engine;

    bool show_progress = !no_progress_ && isStderrTerminal();
    common::ProgressBarRenderer progress("Analyzing", true);
    std::mutex progress_mutex;
    if (show_progress) {
        engine.addObserver([&](const schedule::ProgressSnapshot& snapshot) {
            std::lock_guard<std::mutex> lock(progress_mutex);
            progress.update(snapshot.settledTasks(), snapshot.total_tasks,
                            snapshot.failed_tasks + snapshot.timed_out_tasks, snapshot.findings_so_far);
            if (progress.renderDue()) {
                progress.render(std::cerr);
            }
        });
    }

    core::EngineResult result;
    try {
        result = engine.run(files, config);
    } catch (const core::ConfigurationError& e) {
        progress.clear(std::cerr);
        reportError(e);
        if (e.code() == core::CoreErrorCode::CONFIG_UNKNOWN_ANALYZER) {
            std::cerr << "Run 'code-sentinel agents' to list available analyzers" << std::endl;
        }
        return EXIT_ERROR;
    }

    if (show_progress) {
        progress.complete();
        progress.render(std::cerr);
    }

    int written = writeReport(result.report);
    if (written != EXIT_OK) {
        return written;
    }

    if (result.report.status == common::ReportStatus::FAILED) {
        return EXIT_ERROR;
    }

    if (!fail_on_.empty()) {
        auto threshold = common::parseSeverity(fail_on_);
        if (threshold && meetsThreshold(result.report, *threshold)) {
            common::Logger::instance().info("[Analyze] Threshold met | fail_on={}", fail_on_);
            return EXIT_THRESHOLD;
        }
    }
    return EXIT_OK;
}

}}
