#include <gtest/gtest.h>
#include "code_sentinel/analyzer/performance_analyzer.hpp"
#include "code_sentinel/analyzer/text_utils.hpp"
#include "test_helpers.hpp"

using namespace code_sentinel;
using analyzer::PerformanceAnalyzer;
using test_support::countRule;
using test_support::findRule;
using test_support::makeFile;
using test_support::runFirstTier;

TEST(PerformanceAnalyzerTest, LoopDepthFromIndentation) {
    auto lines = analyzer::text::splitLines(
        "for a in xs:\n"
        "    for b in ys:\n"
        "        total += a * b\n"
        "print(total)");

    EXPECT_EQ(PerformanceAnalyzer::loopDepths(lines), (std::vector<size_t>{0, 1, 2, 0}));
}

TEST(PerformanceAnalyzerTest, LoopDepthWithBraces) {
    auto lines = analyzer::text::splitLines(
        "for (let i = 0; i < n; i++) {\n"
        "  for (let j = 0; j < n; j++) {\n"
        "    sum += i * j;\n"
        "  }\n"
        "}");

    EXPECT_EQ(PerformanceAnalyzer::loopDepths(lines), (std::vector<size_t>{0, 1, 2, 2, 1}));

    PerformanceAnalyzer analyzer;
    auto findings = runFirstTier(analyzer, makeFile("grid.js",
        "for (let i = 0; i < n; i++) {\n"
        "  for (let j = 0; j < n; j++) {\n"
        "    sum += i * j;\n"
        "  }\n"
        "}\n", "javascript")).findings;
    ASSERT_EQ(findings.size(), 1u);
    EXPECT_EQ(findings[0].rule_id, "PERF001");
    EXPECT_EQ(findings[0].line, 2);
    EXPECT_EQ(findings[0].severity, common::Severity::HIGH);
}

TEST(PerformanceAnalyzerTest, NestedLoopSeverityGrowsWithDepth) {
    PerformanceAnalyzer analyzer;
    auto output = runFirstTier(analyzer, makeFile("cube.py",
        "for a in xs:\n"
        "    for b in ys:\n"
        "        for c in zs:\n"
        "            pass\n"));

    ASSERT_EQ(countRule(output.findings, "PERF001"), 2u);
    EXPECT_EQ(output.findings[0].severity, common::Severity::HIGH);
    EXPECT_EQ(output.findings[0].line, 2);
    EXPECT_EQ(output.findings[1].severity, common::Severity::CRITICAL);
    EXPECT_EQ(output.findings[1].line, 3);
    EXPECT_DOUBLE_EQ(output.metrics.at("nested_loops"), 2.0);
    EXPECT_DOUBLE_EQ(output.metrics.at("max_loop_depth"), 3.0);
}

TEST(PerformanceAnalyzerTest, WorkInsideLoops) {
    PerformanceAnalyzer analyzer;
    auto findings = runFirstTier(analyzer, makeFile("report.py",
        "for user in users:\n"
        "    orders = db.query(user.id)\n"
        "    out += \"row\"\n"
        "    pattern = re.compile(r'\\d+')\n"
        "    fh = open(user.path)\n")).findings;

    auto* query = findRule(findings, "PERF002");
    ASSERT_NE(query, nullptr);
    EXPECT_EQ(query->severity, common::Severity::CRITICAL);
    EXPECT_DOUBLE_EQ(query->confidence, 0.8);
    EXPECT_EQ(query->line, 2);

    EXPECT_EQ(countRule(findings, "PERF003"), 1u);
    EXPECT_EQ(countRule(findings, "PERF004"), 1u);
    EXPECT_EQ(countRule(findings, "PERF007"), 1u);
    EXPECT_EQ(findings.size(), 4u);
}

TEST(PerformanceAnalyzerTest, SameCallsOutsideLoopsAreFine) {
    PerformanceAnalyzer analyzer;
    auto findings = runFirstTier(analyzer, makeFile("setup.py",
        "orders = db.query(user_id)\n"
        "pattern = re.compile(r'\\d+')\n"
        "fh = open(path)\n")).findings;

    EXPECT_TRUE(findings.empty());
}

TEST(PerformanceAnalyzerTest, QueryAndRegexShapes) {
    PerformanceAnalyzer analyzer;
    auto findings = runFirstTier(analyzer, makeFile("queries.py",
        "rows = db.execute(\"SELECT * FROM users\")\n"
        "rx = re.compile(\"(.*)+x\")\n"
        "if code in [200, 201, 202, 204]:\n"
        "    ok = True\n")).findings;

    EXPECT_EQ(countRule(findings, "PERF006"), 1u);
    EXPECT_EQ(countRule(findings, "PERF005"), 1u);
    auto* membership = findRule(findings, "PERF008");
    ASSERT_NE(membership, nullptr);
    EXPECT_EQ(membership->line, 3);
    EXPECT_EQ(countRule(findings, "PERF002"), 0u);
}

TEST(PerformanceAnalyzerTest, ListMembershipOnlyForPython) {
    PerformanceAnalyzer analyzer;
    auto findings = runFirstTier(analyzer, makeFile("check.rb",
        "ok = code in [200, 201, 202, 204]\n", "ruby")).findings;
    EXPECT_EQ(countRule(findings, "PERF008"), 0u);
}
