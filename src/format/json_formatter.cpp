#include "code_sentinel/format/json_formatter.hpp"

namespace code_sentinel {
namespace format {

namespace {

double toSeconds(std::chrono::milliseconds ms) {
    return static_cast<double>(ms.count()) / 1000.0;
}

}

nlohmann::json JsonFormatter::format(const report::Report& report) {
    nlohmann::json json;

    json["status"] = common::to_string(report.status);
    json["files_analyzed"] = report.files_analyzed;
    json["total_issues"] = report.total_issues;

    nlohmann::json issues = nlohmann::json::array();
    for (const auto& issue : report.issues) {
        issues.push_back(formatIssue(issue));
    }
    json["issues"] = issues;

    nlohmann::json by_severity = nlohmann::json::object();
    for (const auto& [severity, indices] : report.issues_by_severity) {
        by_severity[common::to_string(severity)] = formatIssueGroup(report, indices);
    }
    json["issues_by_severity"] = by_severity;

    nlohmann::json by_category = nlohmann::json::object();
    for (const auto& [category, indices] : report.issues_by_category) {
        by_category[category] = formatIssueGroup(report, indices);
    }
    json["issues_by_category"] = by_category;

    nlohmann::json by_file = nlohmann::json::object();
    for (const auto& [file, indices] : report.issues_by_file) {
        by_file[file] = formatIssueGroup(report, indices);
    }
    json["issues_by_file"] = by_file;

    json["summary"] = formatSummary(report.summary);

    nlohmann::json stats = nlohmann::json::object();
    for (const auto& [analyzer_id, analyzer_stats] : report.per_analyzer_stats) {
        stats[analyzer_id] = formatAnalyzerStats(analyzer_stats);
    }
    json["per_analyzer_stats"] = stats;

    nlohmann::json timing;
    timing["total_duration"] = toSeconds(report.timing.total_duration);
    timing["task_time"] = toSeconds(report.timing.task_time);
    json["timing"] = timing;

    return json;
}

nlohmann::json JsonFormatter::formatIssue(const report::ReportIssue& issue) {
    const auto& finding = issue.finding;
    nlohmann::json json;

    json["title"] = finding.title;
    json["description"] = finding.description;
    json["severity"] = finding.severity ? common::to_string(*finding.severity) : "";
    json["category"] = finding.category;
    json["file_path"] = finding.file_path;

    if (finding.line) {
        json["line"] = *finding.line;
    } else {
        json["line"] = nullptr;
    }
    if (finding.column) {
        json["column"] = *finding.column;
    } else {
        json["column"] = nullptr;
    }

    json["confidence"] = finding.confidence;
    json["suggestion"] = finding.suggestion;
    json["rule_id"] = finding.rule_id;
    json["references"] = finding.references;
    json["detected_by"] = issue.detected_by;

    if (!finding.code_snippet.empty()) {
        json["code_snippet"] = finding.code_snippet;
    }
    return json;
}

nlohmann::json JsonFormatter::formatIssueGroup(const report::Report& report, const std::vector<size_t>& indices) {
    nlohmann::json group = nlohmann::json::array();
    for (size_t index : indices) {
        group.push_back(formatIssue(report.issues.at(index)));
    }
    return group;
}

nlohmann::json JsonFormatter::formatSummary(const report::Summary& summary) {
    nlohmann::json json;
    json["overall_score"] = summary.overall_score;
    json["grade"] = summary.grade;

    nlohmann::json by_severity = nlohmann::json::object();
    for (const auto& [severity, count] : summary.by_severity) {
        by_severity[common::to_string(severity)] = count;
    }
    json["by_severity"] = by_severity;

    nlohmann::json by_category = nlohmann::json::object();
    for (const auto& [category, count] : summary.by_category) {
        by_category[category] = count;
    }
    json["by_category"] = by_category;

    nlohmann::json by_agent = nlohmann::json::object();
    for (const auto& [agent, stats] : summary.by_agent) {
        by_agent[agent] = {{"files", stats.files}, {"issues", stats.issues}};
    }
    json["by_agent"] = by_agent;

    json["recommendations"] = summary.recommendations;
    json["total_issues"] = summary.total_issues;

    nlohmann::json top_files = nlohmann::json::array();
    for (const auto& file : summary.top_problematic_files) {
        top_files.push_back({
            {"file", file.file},
            {"issues", file.issues},
            {"highest_severity", common::to_string(file.highest_severity)}
        });
    }
    json["top_problematic_files"] = top_files;
    json["dropped_findings"] = summary.dropped_findings;
    json["partial"] = summary.partial;
    return json;
}

nlohmann::json JsonFormatter::formatAnalyzerStats(const report::AnalyzerStats& stats) {
    nlohmann::json json;
    json["files_processed"] = stats.files_processed;
    json["findings_contributed"] = stats.findings_contributed;
    json["failures"] = stats.failures;
    json["timeouts"] = stats.timeouts;
    json["total_execution_time"] = toSeconds(stats.total_execution_time);
    return json;
}

nlohmann::json JsonFormatter::formatAnalyzers(const std::vector<analyzer::AnalyzerInfo>& analyzers) {
    nlohmann::json json = nlohmann::json::array();
    for (const auto& info : analyzers) {
        json.push_back({
            {"id", info.id},
            {"version", info.version},
            {"description", info.description},
            {"supported_languages", info.supported_languages},
            {"has_deep_inspector", info.has_deep_inspector}
        });
    }
    return json;
}

}}
