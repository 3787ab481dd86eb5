#pragma once

#include "../common/types.hpp"
#include <chrono>
#include <map>
#include <string>
#include <vector>

namespace code_sentinel {
namespace report {

// A finding that survived deduplication.
struct ReportIssue {
    common::Finding finding;
    // Sorted analyzer ids whose findings collapsed into this one.
    std::vector<std::string> detected_by;
};

struct AnalyzerStats {
    size_t files_processed = 0;
    size_t findings_contributed = 0;
    size_t failures = 0;
    size_t timeouts = 0;
    std::chrono::milliseconds total_execution_time{0};
};

struct AgentSummary {
    size_t files = 0;
    size_t issues = 0;
};

struct ProblemFile {
    std::string file;
    size_t issues = 0;
    common::Severity highest_severity = common::Severity::INFO;
};

struct Summary {
    int overall_score = 100;
    std::string grade;
    std::map<common::Severity, size_t> by_severity;
    std::map<std::string, size_t> by_category;
    std::map<std::string, AgentSummary> by_agent;
    std::vector<std::string> recommendations;
    size_t total_issues = 0;
    std::vector<ProblemFile> top_problematic_files;
    size_t dropped_findings = 0;
    // True when the run was cancelled before every task settled.
    bool partial = false;
};

struct Timing {
    std::chrono::milliseconds total_duration{0};
    // Sum over all tasks; exceeds total_duration when tasks overlap.
    std::chrono::milliseconds task_time{0};
};

// Views hold indices into issues.
struct Report {
    common::ReportStatus status = common::ReportStatus::FAILED;
    size_t files_analyzed = 0;
    size_t total_issues = 0;
    std::vector<ReportIssue> issues;
    std::map<common::Severity, std::vector<size_t>> issues_by_severity;
    std::map<std::string, std::vector<size_t>> issues_by_category;
    std::map<std::string, std::vector<size_t>> issues_by_file;
    Summary summary;
    std::map<std::string, AnalyzerStats> per_analyzer_stats;
    Timing timing;
};

// Inputs that do not come from outcomes.
struct RunContext {
    std::vector<std::string> analyzer_ids;
    std::chrono::milliseconds total_duration{0};
    bool cancelled = false;
};

}}
