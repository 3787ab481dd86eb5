#include "code_sentinel/report/aggregator.hpp"
#include "code_sentinel/analyzer/text_utils.hpp"
#include "code_sentinel/common/constants.hpp"
#include "code_sentinel/common/logger.hpp"
#include "code_sentinel/core/error_codes.hpp"
#include <algorithm>
#include <map>
#include <set>

namespace code_sentinel {
namespace report {

namespace {

std::string categoryOf(const common::Finding& finding) {
    return finding.category.empty() ? std::string(constants::scoring::DEFAULT_CATEGORY) : finding.category;
}

// Empty string when the finding is well formed.
std::string malformedReason(const common::Finding& finding) {
    if (!finding.severity) return "missing severity";
    if (finding.title.empty()) return "missing title";
    if (finding.file_path.empty()) return "missing file path";
    if (!(finding.confidence >= 0.0 && finding.confidence <= 1.0)) return "confidence out of range";
    return "";
}

bool outcomeBefore(const common::Outcome* a, const common::Outcome* b) {
    if (a->file_path != b->file_path) return a->file_path < b->file_path;
    if (a->analyzer_id != b->analyzer_id) return a->analyzer_id < b->analyzer_id;
    return static_cast<int>(a->status) < static_cast<int>(b->status);
}

bool issueBefore(const ReportIssue& a, const ReportIssue& b) {
    const auto& fa = a.finding;
    const auto& fb = b.finding;
    if (*fa.severity != *fb.severity) return common::isMoreSevere(*fa.severity, *fb.severity);
    if (fa.file_path != fb.file_path) return fa.file_path < fb.file_path;
    int la = fa.line.value_or(0);
    int lb = fb.line.value_or(0);
    if (la != lb) return la < lb;
    if (fa.title != fb.title) return fa.title < fb.title;
    if (fa.category != fb.category) return fa.category < fb.category;
    return fa.rule_id < fb.rule_id;
}

std::string categoryMessage(const std::string& category, size_t count) {
    std::string n = std::to_string(count);
    if (category == "security") {
        return "Security: resolve " + n + " security issue(s) to protect the application";
    }
    if (category == "dependency") {
        return "Dependencies: pin, update or replace " + n + " risky dependency declaration(s)";
    }
    if (category == "code_quality") {
        return "Code quality: refactor to address " + n + " maintainability issue(s)";
    }
    if (category == "performance") {
        return "Performance: optimize " + n + " slow pattern(s) before they reach production load";
    }
    if (category == "best_practices") {
        return "Best practices: clean up " + n + " error-handling and hygiene issue(s)";
    }
    return "Review " + n + " " + category + " issue(s)";
}

}

ResultAggregator::ResultAggregator(common::ScoringConfig scoring) : scoring_(std::move(scoring)) {}

DedupKey ResultAggregator::dedupKey(const common::Finding& finding) {
    long bucket = -1;
    if (finding.line) {
        long line = *finding.line;
        long size = constants::scoring::DEDUP_LINE_BUCKET;
        bucket = line >= 0 ? line / size : -((-line + size - 1) / size);
    }
    return DedupKey{analyzer::text::toLower(finding.title), finding.file_path, categoryOf(finding), bucket};
}

Report ResultAggregator::aggregate(const std::vector<common::Outcome>& outcomes, const RunContext& context) const {
    Report report;

    std::vector<const common::Outcome*> ordered;
    ordered.reserve(outcomes.size());
    for (const auto& outcome : outcomes) {
        ordered.push_back(&outcome);
    }
    std::stable_sort(ordered.begin(), ordered.end(), outcomeBefore);

    for (const auto& id : context.analyzer_ids) {
        report.per_analyzer_stats[id];
    }

    std::set<std::string> analyzed_files;
    bool any_completed = false;

    for (const auto* outcome : ordered) {
        auto& stats = report.per_analyzer_stats[outcome->analyzer_id];
        auto& agent = report.summary.by_agent[outcome->analyzer_id];
        stats.total_execution_time += outcome->execution_time;
        report.timing.task_time += outcome->execution_time;
        agent.files++;

        switch (outcome->status) {
            case common::OutcomeStatus::COMPLETED:
                any_completed = true;
                analyzed_files.insert(outcome->file_path);
                stats.files_processed++;
                break;
            case common::OutcomeStatus::FAILED:
                stats.failures++;
                break;
            case common::OutcomeStatus::TIMED_OUT:
                stats.timeouts++;
                break;
        }
    }

    size_t dropped = 0;
    report.issues = deduplicate(ordered, dropped);

    // Raw contribution, counted before deduplication.
    for (const auto* outcome : ordered) {
        if (outcome->status != common::OutcomeStatus::COMPLETED) continue;
        size_t valid = 0;
        for (const auto& finding : outcome->findings) {
            if (malformedReason(finding).empty()) ++valid;
        }
        report.per_analyzer_stats[outcome->analyzer_id].findings_contributed += valid;
        report.summary.by_agent[outcome->analyzer_id].issues += valid;
    }

    for (size_t i = 0; i < report.issues.size(); ++i) {
        const auto& finding = report.issues[i].finding;
        report.issues_by_severity[*finding.severity].push_back(i);
        report.issues_by_category[finding.category].push_back(i);
        report.issues_by_file[finding.file_path].push_back(i);
    }

    report.status = any_completed ? common::ReportStatus::COMPLETED : common::ReportStatus::FAILED;
    report.files_analyzed = analyzed_files.size();
    report.total_issues = report.issues.size();

    auto& summary = report.summary;
    for (auto severity : common::allSeverities()) {
        auto it = report.issues_by_severity.find(severity);
        summary.by_severity[severity] = it != report.issues_by_severity.end() ? it->second.size() : 0;
    }
    for (const auto& [category, indices] : report.issues_by_category) {
        summary.by_category[category] = indices.size();
    }
    summary.total_issues = report.total_issues;
    summary.overall_score = score(report.issues);
    summary.grade = grade(summary.overall_score);
    summary.dropped_findings = dropped;
    summary.partial = context.cancelled;
    summary.recommendations = recommendations(summary);
    summary.top_problematic_files = topFiles(report.issues);

    report.timing.total_duration = context.total_duration;

    common::Logger::instance().info("[Aggregator] Report built | status={} | issues={} | score={} | grade={} | dropped={}",
                                    common::to_string(report.status), report.total_issues,
                                    summary.overall_score, summary.grade, dropped);
    return report;
}

std::vector<ReportIssue> ResultAggregator::deduplicate(const std::vector<const common::Outcome*>& outcomes,
                                                       size_t& dropped) const {
    struct Group {
        common::Finding representative;
        double max_confidence = 0.0;
        std::vector<std::string> references;
        std::set<std::string> seen_references;
        std::set<std::string> detected_by;
    };

    std::map<DedupKey, Group> groups;
    dropped = 0;
    size_t raw = 0;

    for (const auto* outcome : outcomes) {
        if (outcome->status != common::OutcomeStatus::COMPLETED) continue;

        for (const auto& finding : outcome->findings) {
            std::string reason = malformedReason(finding);
            if (!reason.empty()) {
                ++dropped;
                common::Logger::instance().warn("[Aggregator] Finding dropped | code={} | analyzer={} | file={} | reason={}",
                                                core::CoreErrorCodeHelper::toString(core::CoreErrorCode::FINDING_MALFORMED),
                                                outcome->analyzer_id, outcome->file_path, reason);
                continue;
            }
            ++raw;

            common::Finding candidate = finding;
            candidate.category = categoryOf(finding);

            auto key = dedupKey(candidate);
            auto it = groups.find(key);
            if (it == groups.end()) {
                Group group;
                group.representative = candidate;
                group.max_confidence = candidate.confidence;
                it = groups.emplace(key, std::move(group)).first;
            } else {
                auto& current = it->second.representative;
                bool replace = common::isMoreSevere(*candidate.severity, *current.severity) ||
                               (*candidate.severity == *current.severity && candidate.confidence > current.confidence);
                if (replace) {
                    current = candidate;
                }
                it->second.max_confidence = std::max(it->second.max_confidence, candidate.confidence);
            }

            auto& group = it->second;
            for (const auto& reference : candidate.references) {
                if (group.seen_references.insert(reference).second) {
                    group.references.push_back(reference);
                }
            }
            group.detected_by.insert(outcome->analyzer_id);
        }
    }

    std::vector<ReportIssue> issues;
    issues.reserve(groups.size());
    for (auto& entry : groups) {
        auto& group = entry.second;
        ReportIssue issue;
        issue.finding = std::move(group.representative);
        issue.finding.confidence = group.max_confidence;
        issue.finding.references = std::move(group.references);
        issue.detected_by.assign(group.detected_by.begin(), group.detected_by.end());
        issues.push_back(std::move(issue));
    }
    std::sort(issues.begin(), issues.end(), issueBefore);

    common::Logger::instance().debug("[Aggregator] Deduplicated | raw={} | unique={} | dropped={}",
                                     raw, issues.size(), dropped);
    return issues;
}

int ResultAggregator::score(const std::vector<ReportIssue>& issues) const {
    long total = constants::scoring::BASE_SCORE;
    for (const auto& issue : issues) {
        total -= scoring_.penaltyFor(*issue.finding.severity);
        if (total <= 0) {
            return 0;
        }
    }
    return static_cast<int>(std::min<long>(total, constants::scoring::BASE_SCORE));
}

std::string ResultAggregator::grade(int score) const {
    for (const auto& threshold : scoring_.grade_thresholds) {
        if (score >= threshold.min_score) {
            return threshold.grade;
        }
    }
    return scoring_.failing_grade;
}

std::vector<std::string> ResultAggregator::recommendations(const Summary& summary) const {
    std::vector<std::string> messages;

    size_t critical = summary.by_severity.at(common::Severity::CRITICAL);
    size_t high = summary.by_severity.at(common::Severity::HIGH);

    if (critical > 0) {
        messages.push_back("URGENT: Fix " + std::to_string(critical) +
                           " critical issue(s) immediately, they pose serious security or stability risks");
    }
    if (high > 0) {
        messages.push_back("HIGH PRIORITY: Address " + std::to_string(high) + " high-severity issue(s) soon");
    }

    std::vector<std::pair<std::string, size_t>> categories;
    for (const auto& [category, count] : summary.by_category) {
        if (count > scoring_.thresholdFor(category)) {
            categories.emplace_back(category, count);
        }
    }
    std::stable_sort(categories.begin(), categories.end(),
                     [](const auto& a, const auto& b) { return a.second > b.second; });
    for (const auto& [category, count] : categories) {
        messages.push_back(categoryMessage(category, count));
    }

    if (messages.size() > scoring_.max_recommendations) {
        messages.resize(scoring_.max_recommendations);
    }
    if (messages.empty()) {
        messages.push_back("No major issues found, keep up the good work");
    }
    return messages;
}

std::vector<ProblemFile> ResultAggregator::topFiles(const std::vector<ReportIssue>& issues) const {
    std::map<std::string, ProblemFile> files;
    for (const auto& issue : issues) {
        auto& entry = files[issue.finding.file_path];
        if (entry.issues == 0) {
            entry.file = issue.finding.file_path;
            entry.highest_severity = *issue.finding.severity;
        } else if (common::isMoreSevere(*issue.finding.severity, entry.highest_severity)) {
            entry.highest_severity = *issue.finding.severity;
        }
        entry.issues++;
    }

    std::vector<ProblemFile> ranked;
    for (auto& entry : files) {
        ranked.push_back(std::move(entry.second));
    }
    std::stable_sort(ranked.begin(), ranked.end(), [](const ProblemFile& a, const ProblemFile& b) {
        if (a.issues != b.issues) return a.issues > b.issues;
        return common::isMoreSevere(a.highest_severity, b.highest_severity);
    });
    if (ranked.size() > scoring_.top_files_limit) {
        ranked.resize(scoring_.top_files_limit);
    }
    return ranked;
}

}}
