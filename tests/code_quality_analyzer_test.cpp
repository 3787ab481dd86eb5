#include <gtest/gtest.h>
#include "code_sentinel/analyzer/code_quality_analyzer.hpp"
#include "code_sentinel/analyzer/text_utils.hpp"
#include "test_helpers.hpp"

using namespace code_sentinel;
using analyzer::CodeQualityAnalyzer;
using analyzer::CodeQualityThresholds;
using test_support::countRule;
using test_support::findRule;
using test_support::makeFile;
using test_support::runFirstTier;

namespace {

std::string pythonFunction(const std::string& name, size_t body_lines, const std::string& params = "") {
    std::string content = "def " + name + "(" + params + "):\n";
    for (size_t i = 0; i < body_lines; ++i) {
        content += "    step_" + std::to_string(i) + " = " + std::to_string(i) + "\n";
    }
    return content;
}

std::string branchyFunction(int branches) {
    std::string content = "def decide(x):\n";
    for (int i = 0; i < branches; ++i) {
        content += "    if x == " + std::to_string(i) + ": return " + std::to_string(i) + "\n";
    }
    return content;
}

}

TEST(CodeQualityAnalyzerTest, FindsPythonFunctions) {
    auto lines = analyzer::text::splitLines("def foo(a, b):\n    x = 1\n    return x\n\ndef bar():\n    pass\n");
    auto spans = CodeQualityAnalyzer::findFunctions(lines, "python");

    ASSERT_EQ(spans.size(), 2u);
    EXPECT_EQ(spans[0].name, "foo");
    EXPECT_EQ(spans[0].start_line, 0u);
    EXPECT_EQ(spans[0].end_line, 2u);
    EXPECT_EQ(spans[0].parameter_count, 2u);
    EXPECT_EQ(spans[1].name, "bar");
    EXPECT_EQ(spans[1].length(), 2u);
    EXPECT_EQ(spans[1].parameter_count, 0u);
}

TEST(CodeQualityAnalyzerTest, FindsBraceDelimitedFunctions) {
    auto lines = analyzer::text::splitLines(
        "function render(items) {\n"
        "  if (items.length) {\n"
        "    return items.map(x => x);\n"
        "  }\n"
        "  return [];\n"
        "}\n"
        "const add = (a, b) => {\n"
        "  return a + b;\n"
        "};\n");
    auto spans = CodeQualityAnalyzer::findFunctions(lines, "javascript");

    ASSERT_EQ(spans.size(), 2u);
    EXPECT_EQ(spans[0].name, "render");
    EXPECT_EQ(spans[0].end_line, 5u);
    EXPECT_EQ(spans[1].name, "add");
    EXPECT_EQ(spans[1].start_line, 6u);
    EXPECT_EQ(spans[1].end_line, 8u);
}

TEST(CodeQualityAnalyzerTest, ComplexityCountsBranches) {
    auto lines = analyzer::text::splitLines(branchyFunction(3));
    auto spans = CodeQualityAnalyzer::findFunctions(lines, "python");
    ASSERT_EQ(spans.size(), 1u);
    EXPECT_EQ(CodeQualityAnalyzer::functionComplexity(lines, spans[0], "python"), 4);

    auto js = analyzer::text::splitLines("function f(a, b) {\n  if (a && b || !a) { return 1; }\n  return 0;\n}\n");
    auto js_spans = CodeQualityAnalyzer::findFunctions(js, "javascript");
    ASSERT_EQ(js_spans.size(), 1u);
    EXPECT_EQ(CodeQualityAnalyzer::functionComplexity(js, js_spans[0], "javascript"), 4);
}

TEST(CodeQualityAnalyzerTest, LongFunction) {
    CodeQualityAnalyzer analyzer;
    auto findings = runFirstTier(analyzer, makeFile("long.py", pythonFunction("process", 60))).findings;

    auto* finding = findRule(findings, "CQ001");
    ASSERT_NE(finding, nullptr);
    EXPECT_EQ(finding->title, "Long function: process");
    EXPECT_EQ(finding->severity, common::Severity::MEDIUM);
    EXPECT_EQ(finding->line, 1);
    EXPECT_EQ(finding->category, "code_quality");

    auto very_long = runFirstTier(analyzer, makeFile("long.py", pythonFunction("process", 120))).findings;
    auto* high = findRule(very_long, "CQ001");
    ASSERT_NE(high, nullptr);
    EXPECT_EQ(high->severity, common::Severity::HIGH);
}

TEST(CodeQualityAnalyzerTest, ComplexFunction) {
    CodeQualityAnalyzer analyzer;

    auto high = runFirstTier(analyzer, makeFile("rules.py", branchyFunction(21))).findings;
    auto* finding = findRule(high, "CQ002");
    ASSERT_NE(finding, nullptr);
    EXPECT_EQ(finding->severity, common::Severity::HIGH);

    auto critical = runFirstTier(analyzer, makeFile("rules.py", branchyFunction(31))).findings;
    auto* worst = findRule(critical, "CQ002");
    ASSERT_NE(worst, nullptr);
    EXPECT_EQ(worst->severity, common::Severity::CRITICAL);

    auto simple = runFirstTier(analyzer, makeFile("rules.py", branchyFunction(5))).findings;
    EXPECT_EQ(countRule(simple, "CQ002"), 0u);
}

TEST(CodeQualityAnalyzerTest, LongParameterList) {
    CodeQualityAnalyzer analyzer;
    auto findings = runFirstTier(analyzer, makeFile("api.py", pythonFunction("build", 2, "self, a, b, c, d, e, f"))).findings;

    auto* finding = findRule(findings, "CQ007");
    ASSERT_NE(finding, nullptr);
    EXPECT_EQ(finding->title, "Long parameter list: build");

    auto fine = runFirstTier(analyzer, makeFile("api.py", pythonFunction("build", 2, "self, a, b, c, d, e"))).findings;
    EXPECT_EQ(countRule(fine, "CQ007"), 0u);
}

TEST(CodeQualityAnalyzerTest, LineLevelChecks) {
    CodeQualityAnalyzer analyzer;
    std::string content =
        "# TODO: remove the legacy branch\n"
        "if False:\n"
        "    legacy = 1\n" +
        std::string("message = \"") + std::string(130, 'x') + "\"\n" +
        std::string(28, ' ') + "deeply_nested = True\n";

    auto output = runFirstTier(analyzer, makeFile("misc.py", content));
    const auto& findings = output.findings;

    auto* marker = findRule(findings, "CQ004");
    ASSERT_NE(marker, nullptr);
    EXPECT_EQ(marker->title, "Unresolved TODO marker");
    EXPECT_EQ(marker->severity, common::Severity::INFO);

    auto* dead = findRule(findings, "CQ008");
    ASSERT_NE(dead, nullptr);
    EXPECT_EQ(dead->line, 2);

    auto* long_line = findRule(findings, "CQ003");
    ASSERT_NE(long_line, nullptr);
    EXPECT_EQ(long_line->line, 4);
    EXPECT_DOUBLE_EQ(output.metrics.at("long_lines"), 1.0);

    auto* nesting = findRule(findings, "CQ006");
    ASSERT_NE(nesting, nullptr);
    EXPECT_EQ(nesting->line, 5);
}

TEST(CodeQualityAnalyzerTest, DuplicatedBlocks) {
    CodeQualityAnalyzer analyzer;
    std::string block =
        "total = compute(a)\n"
        "total += offset\n"
        "result.append(total)\n"
        "log.info(total)\n"
        "cache[key] = total\n"
        "counter += 1\n";
    std::string content = block + "separator_line = 0\n" + block;

    auto output = runFirstTier(analyzer, makeFile("dup.py", content));

    ASSERT_EQ(countRule(output.findings, "CQ005"), 1u);
    EXPECT_EQ(findRule(output.findings, "CQ005")->line, 8);
    EXPECT_DOUBLE_EQ(output.metrics.at("duplicate_blocks"), 1.0);
}

TEST(CodeQualityAnalyzerTest, CustomThresholds) {
    CodeQualityThresholds thresholds;
    thresholds.max_function_lines = 5;
    CodeQualityAnalyzer strict(thresholds);

    auto findings = runFirstTier(strict, makeFile("short.py", pythonFunction("tidy", 8))).findings;
    EXPECT_EQ(countRule(findings, "CQ001"), 1u);
}

TEST(CodeQualityAnalyzerTest, SkipsManifests) {
    CodeQualityAnalyzer analyzer;
    EXPECT_FALSE(analyzer.canAnalyze(makeFile("package.json", "{}", "json")));
    EXPECT_TRUE(analyzer.canAnalyze(makeFile("lib.rs", "", "rust")));
}
