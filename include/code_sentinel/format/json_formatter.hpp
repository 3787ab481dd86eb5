#pragma once

#include "../report/report.hpp"
#include "../analyzer/analyzer.hpp"
#include <nlohmann/json.hpp>
#include <vector>

namespace code_sentinel {
namespace format {

// Top-level field names are consumed by downstream tools; keep them stable.
class JsonFormatter {
public:
    static nlohmann::json format(const report::Report& report);

    static nlohmann::json formatIssue(const report::ReportIssue& issue);
    static nlohmann::json formatAnalyzers(const std::vector<analyzer::AnalyzerInfo>& analyzers);

private:
    static nlohmann::json formatSummary(const report::Summary& summary);
    static nlohmann::json formatAnalyzerStats(const report::AnalyzerStats& stats);
    static nlohmann::json formatIssueGroup(const report::Report& report, const std::vector<size_t>& indices);
};

}}
