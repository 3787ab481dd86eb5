#pragma once

#include "main_command.hpp"
#include "code_sentinel/common/types.hpp"
#include "code_sentinel/core/errors.hpp"
#include "code_sentinel/report/report.hpp"
#include <CLI/CLI.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace code_sentinel {
namespace cli {

class AnalyzeCommand : public MainCommand {
public:
    static constexpr int EXIT_OK = 0;
    static constexpr int EXIT_ERROR = 1;
    static constexpr int EXIT_THRESHOLD = 2;

    AnalyzeCommand();

    void setup(CLI::App* subcommand) override;
    int execute() override;

    // True when any surviving issue is at least as severe as threshold.
    static bool meetsThreshold(const report::Report& report, common::Severity threshold);

private:
    std::string target_path_;
    std::vector<std::string> agents_;
    int max_concurrent_ = 0;
    int timeout_seconds_ = 0;
    bool deep_ = false;
    double sample_rate_ = 0.0;
    std::vector<std::string> skip_patterns_;
    uint64_t seed_ = 0;
    bool json_output_ = false;
    std::string output_path_;
    bool no_progress_ = false;
    std::string fail_on_;

    CLI::Option* agents_option_ = nullptr;
    CLI::Option* concurrency_option_ = nullptr;
    CLI::Option* timeout_option_ = nullptr;
    CLI::Option* sample_rate_option_ = nullptr;
    CLI::Option* skip_option_ = nullptr;
    CLI::Option* seed_option_ = nullptr;

    common::FileCatalog loadCatalog(const common::AnalysisConfig& config) const;
    common::AnalysisConfig buildConfig() const;
    int writeReport(const report::Report& report) const;
    void reportError(const core::AnalysisError& e) const;
};

}}
