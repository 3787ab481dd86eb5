#include <gtest/gtest.h>
#include "code_sentinel/report/aggregator.hpp"
#include "code_sentinel/common/config.hpp"
#include "code_sentinel/format/json_formatter.hpp"
#include "test_helpers.hpp"
#include <algorithm>

using namespace code_sentinel;
using common::Severity;
using report::ResultAggregator;
using report::RunContext;
using test_support::makeFinding;
using test_support::makeOutcome;

namespace {

RunContext contextFor(std::vector<std::string> ids, bool cancelled = false) {
    RunContext context;
    context.analyzer_ids = std::move(ids);
    context.total_duration = std::chrono::milliseconds(1200);
    context.cancelled = cancelled;
    return context;
}

std::vector<std::string> issueSignature(const report::Report& report) {
    std::vector<std::string> signature;
    for (const auto& issue : report.issues) {
        const auto& f = issue.finding;
        std::string entry = f.title + "|" + common::to_string(*f.severity) + "|" + f.file_path + "|" +
                            std::to_string(f.line.value_or(0)) + "|" + std::to_string(f.confidence);
        for (const auto& id : issue.detected_by) {
            entry += "|" + id;
        }
        signature.push_back(entry);
    }
    return signature;
}

}

class AggregatorTest : public ::testing::Test {
protected:
    ResultAggregator aggregator{common::Config::createDefaultScoring()};
};

TEST_F(AggregatorTest, MergesNearbyDuplicatesAcrossAnalyzers) {
    auto sql = makeFinding("SQL Injection", Severity::CRITICAL, "app.py", 10, "security", 0.8);
    sql.references = {"https://cwe.mitre.org/data/definitions/89.html"};
    auto echo = makeFinding("sql injection", Severity::MEDIUM, "app.py", 12, "security", 0.95);
    echo.references = {"https://owasp.org/Top10/A03_2021-Injection/",
                       "https://cwe.mitre.org/data/definitions/89.html"};

    std::vector<common::Outcome> outcomes = {
        makeOutcome("security", "app.py", {sql}),
        makeOutcome("best_practices", "app.py", {echo})
    };

    auto report = aggregator.aggregate(outcomes, contextFor({"security", "best_practices"}));

    ASSERT_EQ(report.issues.size(), 1u);
    const auto& issue = report.issues[0];
    EXPECT_EQ(*issue.finding.severity, Severity::CRITICAL);
    EXPECT_EQ(issue.finding.title, "SQL Injection");
    EXPECT_EQ(issue.finding.line, 10);
    EXPECT_DOUBLE_EQ(issue.finding.confidence, 0.95);
    EXPECT_EQ(issue.finding.references.size(), 2u);
    EXPECT_EQ(issue.detected_by, (std::vector<std::string>{"best_practices", "security"}));

    EXPECT_EQ(report.summary.overall_score, 85);
    EXPECT_EQ(report.summary.grade, "B");
    EXPECT_EQ(report.per_analyzer_stats.at("security").findings_contributed, 1u);
    EXPECT_EQ(report.per_analyzer_stats.at("best_practices").findings_contributed, 1u);
    EXPECT_EQ(report.summary.by_agent.at("security").issues, 1u);
}

TEST_F(AggregatorTest, KeepsDistantLinesAndOtherFilesApart) {
    std::vector<common::Outcome> outcomes = {
        makeOutcome("security", "app.py", {
            makeFinding("Weak cryptography", Severity::MEDIUM, "app.py", 5),
            makeFinding("Weak cryptography", Severity::MEDIUM, "app.py", 25)
        }),
        makeOutcome("security", "lib.py", {
            makeFinding("Weak cryptography", Severity::MEDIUM, "lib.py", 5)
        })
    };

    auto report = aggregator.aggregate(outcomes, contextFor({"security"}));

    EXPECT_EQ(report.total_issues, 3u);
    EXPECT_EQ(report.files_analyzed, 2u);
    EXPECT_EQ(report.issues_by_file.at("app.py").size(), 2u);
    EXPECT_EQ(report.summary.overall_score, 88);
    EXPECT_EQ(report.summary.grade, "B+");
}

TEST_F(AggregatorTest, DedupKeyBuckets) {
    auto base = makeFinding("Title", Severity::LOW, "a.py", 19);
    EXPECT_EQ(std::get<3>(ResultAggregator::dedupKey(base)), 1);

    base.line = std::nullopt;
    EXPECT_EQ(std::get<3>(ResultAggregator::dedupKey(base)), -1);

    base.category.clear();
    EXPECT_EQ(std::get<2>(ResultAggregator::dedupKey(base)), "general");
}

TEST_F(AggregatorTest, IssuesAreOrderedBySeverityThenLocation) {
    std::vector<common::Outcome> outcomes = {
        makeOutcome("x", "b.py", {
            makeFinding("Low one", Severity::LOW, "b.py", 1),
            makeFinding("High in b", Severity::HIGH, "b.py", 40)
        }),
        makeOutcome("x", "a.py", {
            makeFinding("High in a late", Severity::HIGH, "a.py", 90),
            makeFinding("High in a early", Severity::HIGH, "a.py", 3)
        })
    };

    auto report = aggregator.aggregate(outcomes, contextFor({"x"}));

    ASSERT_EQ(report.issues.size(), 4u);
    EXPECT_EQ(report.issues[0].finding.title, "High in a early");
    EXPECT_EQ(report.issues[1].finding.title, "High in a late");
    EXPECT_EQ(report.issues[2].finding.title, "High in b");
    EXPECT_EQ(report.issues[3].finding.title, "Low one");
    EXPECT_EQ(report.issues_by_severity.at(Severity::HIGH), (std::vector<size_t>{0, 1, 2}));
}

TEST_F(AggregatorTest, ScoreClampsAtZero) {
    std::vector<common::Finding> findings;
    for (int i = 0; i < 8; ++i) {
        findings.push_back(makeFinding("Critical " + std::to_string(i), Severity::CRITICAL, "bad.py", i * 20 + 1));
    }

    auto report = aggregator.aggregate({makeOutcome("security", "bad.py", findings)}, contextFor({"security"}));

    EXPECT_EQ(report.summary.overall_score, 0);
    EXPECT_EQ(report.summary.grade, "F");
    EXPECT_EQ(report.summary.by_severity.at(Severity::CRITICAL), 8u);
}

TEST_F(AggregatorTest, GradeCutoffs) {
    EXPECT_EQ(aggregator.grade(100), "A+");
    EXPECT_EQ(aggregator.grade(97), "A+");
    EXPECT_EQ(aggregator.grade(96), "A");
    EXPECT_EQ(aggregator.grade(90), "A-");
    EXPECT_EQ(aggregator.grade(83), "B");
    EXPECT_EQ(aggregator.grade(70), "C-");
    EXPECT_EQ(aggregator.grade(60), "D");
    EXPECT_EQ(aggregator.grade(59), "F");
}

TEST_F(AggregatorTest, RecommendationsLeadWithSeverity) {
    std::vector<common::Outcome> outcomes = {
        makeOutcome("security", "api.py", {
            makeFinding("Command injection", Severity::CRITICAL, "api.py", 4),
            makeFinding("Hardcoded API key", Severity::HIGH, "api.py", 30),
            makeFinding("Hardcoded password", Severity::HIGH, "api.py", 50)
        }),
        makeOutcome("performance", "api.py", {
            makeFinding("Query inside loop", Severity::MEDIUM, "api.py", 70, "performance")
        })
    };

    auto report = aggregator.aggregate(outcomes, contextFor({"security", "performance"}));
    const auto& recs = report.summary.recommendations;

    ASSERT_EQ(recs.size(), 4u);
    EXPECT_EQ(recs[0], "URGENT: Fix 1 critical issue(s) immediately, they pose serious security or stability risks");
    EXPECT_EQ(recs[1], "HIGH PRIORITY: Address 2 high-severity issue(s) soon");
    EXPECT_EQ(recs[2], "Security: resolve 3 security issue(s) to protect the application");
    EXPECT_EQ(recs[3].rfind("Performance: ", 0), 0u);
}

TEST_F(AggregatorTest, CodeQualityNeedsMoreThanFiveIssues) {
    std::vector<common::Finding> findings;
    for (int i = 0; i < 5; ++i) {
        findings.push_back(makeFinding("Long line " + std::to_string(i), Severity::LOW, "m.py", i * 20 + 1, "code_quality"));
    }

    auto quiet = aggregator.aggregate({makeOutcome("code_quality", "m.py", findings)}, contextFor({"code_quality"}));
    EXPECT_EQ(quiet.summary.recommendations,
              (std::vector<std::string>{"No major issues found, keep up the good work"}));

    findings.push_back(makeFinding("Long line 5", Severity::LOW, "m.py", 200, "code_quality"));
    auto noisy = aggregator.aggregate({makeOutcome("code_quality", "m.py", findings)}, contextFor({"code_quality"}));
    ASSERT_EQ(noisy.summary.recommendations.size(), 1u);
    EXPECT_EQ(noisy.summary.recommendations[0], "Code quality: refactor to address 6 maintainability issue(s)");
}

TEST_F(AggregatorTest, EmptyRunIsAllClear) {
    auto report = aggregator.aggregate({makeOutcome("security", "ok.py", {})}, contextFor({"security"}));

    EXPECT_EQ(report.status, common::ReportStatus::COMPLETED);
    EXPECT_EQ(report.summary.overall_score, 100);
    EXPECT_EQ(report.summary.grade, "A+");
    EXPECT_EQ(report.summary.recommendations.size(), 1u);
    EXPECT_TRUE(report.summary.top_problematic_files.empty());
}

TEST_F(AggregatorTest, OrderAndRepetitionDoNotMatter) {
    std::vector<common::Outcome> outcomes = {
        makeOutcome("security", "a.py", {
            makeFinding("Secret", Severity::HIGH, "a.py", 3, "security", 0.7),
            makeFinding("Eval", Severity::CRITICAL, "a.py", 44)
        }),
        makeOutcome("best_practices", "a.py", {
            makeFinding("secret", Severity::HIGH, "a.py", 5, "security", 0.9)
        }),
        makeOutcome("performance", "b.py", {
            makeFinding("Nested loop", Severity::HIGH, "b.py", 9, "performance")
        }),
        makeOutcome("security", "c.py", {}, common::OutcomeStatus::FAILED)
    };
    auto context = contextFor({"security", "best_practices", "performance"});

    auto first = aggregator.aggregate(outcomes, context);
    auto again = aggregator.aggregate(outcomes, context);

    auto shuffled = outcomes;
    std::reverse(shuffled.begin(), shuffled.end());
    std::swap(shuffled[0], shuffled[2]);
    auto reordered = aggregator.aggregate(shuffled, context);

    std::string rendered = format::JsonFormatter::format(first).dump();
    EXPECT_EQ(rendered, format::JsonFormatter::format(again).dump());
    EXPECT_EQ(rendered, format::JsonFormatter::format(reordered).dump());

    EXPECT_EQ(issueSignature(first), issueSignature(again));
    EXPECT_EQ(issueSignature(first), issueSignature(reordered));
    EXPECT_EQ(first.summary.overall_score, reordered.summary.overall_score);
    EXPECT_EQ(first.summary.recommendations, reordered.summary.recommendations);
    EXPECT_EQ(first.total_issues, 3u);
}

TEST_F(AggregatorTest, MalformedFindingsAreDroppedAndCounted) {
    auto no_severity = makeFinding("No severity", Severity::LOW, "a.py", 1);
    no_severity.severity = std::nullopt;
    auto no_title = makeFinding("", Severity::LOW, "a.py", 2);
    auto bad_confidence = makeFinding("Overconfident", Severity::LOW, "a.py", 3, "security", 1.5);
    auto fine = makeFinding("Fine", Severity::LOW, "a.py", 4, "");

    auto report = aggregator.aggregate({makeOutcome("x", "a.py", {no_severity, no_title, bad_confidence, fine})},
                                       contextFor({"x"}));

    EXPECT_EQ(report.summary.dropped_findings, 3u);
    ASSERT_EQ(report.issues.size(), 1u);
    EXPECT_EQ(report.issues[0].finding.category, "general");
    EXPECT_EQ(report.per_analyzer_stats.at("x").findings_contributed, 1u);
}

TEST_F(AggregatorTest, FailedAndTimedOutOutcomesOnlyFeedStatistics) {
    auto failed = makeOutcome("security", "a.py",
                              {makeFinding("Ignored", Severity::CRITICAL, "a.py", 1)},
                              common::OutcomeStatus::FAILED);
    auto timed_out = makeOutcome("performance", "a.py", {}, common::OutcomeStatus::TIMED_OUT);

    auto report = aggregator.aggregate({failed, timed_out}, contextFor({"security", "performance", "dependency"}));

    EXPECT_EQ(report.status, common::ReportStatus::FAILED);
    EXPECT_EQ(report.files_analyzed, 0u);
    EXPECT_EQ(report.total_issues, 0u);
    EXPECT_EQ(report.per_analyzer_stats.at("security").failures, 1u);
    EXPECT_EQ(report.per_analyzer_stats.at("performance").timeouts, 1u);
    EXPECT_EQ(report.per_analyzer_stats.at("dependency").files_processed, 0u);
    EXPECT_EQ(report.summary.by_agent.at("security").files, 1u);
    EXPECT_EQ(report.timing.task_time, std::chrono::milliseconds(10));
    EXPECT_EQ(report.timing.total_duration, std::chrono::milliseconds(1200));
}

TEST_F(AggregatorTest, NoOutcomesMeansFailedReport) {
    auto report = aggregator.aggregate({}, contextFor({"security"}));
    EXPECT_EQ(report.status, common::ReportStatus::FAILED);
    EXPECT_EQ(report.summary.overall_score, 100);
}

TEST_F(AggregatorTest, CancelledRunIsPartial) {
    auto report = aggregator.aggregate({makeOutcome("x", "a.py", {})}, contextFor({"x"}, true));
    EXPECT_TRUE(report.summary.partial);
}

TEST_F(AggregatorTest, TopFilesRankByIssueCountThenSeverity) {
    std::vector<common::Outcome> outcomes = {
        makeOutcome("x", "many.py", {
            makeFinding("One", Severity::LOW, "many.py", 1),
            makeFinding("Two", Severity::LOW, "many.py", 20),
            makeFinding("Three", Severity::MEDIUM, "many.py", 40)
        }),
        makeOutcome("x", "worst.py", {makeFinding("Boom", Severity::CRITICAL, "worst.py", 1)}),
        makeOutcome("x", "meh.py", {makeFinding("Meh", Severity::LOW, "meh.py", 1)})
    };

    auto report = aggregator.aggregate(outcomes, contextFor({"x"}));
    const auto& top = report.summary.top_problematic_files;

    ASSERT_EQ(top.size(), 3u);
    EXPECT_EQ(top[0].file, "many.py");
    EXPECT_EQ(top[0].issues, 3u);
    EXPECT_EQ(top[0].highest_severity, Severity::MEDIUM);
    EXPECT_EQ(top[1].file, "worst.py");
    EXPECT_EQ(top[2].file, "meh.py");
}
