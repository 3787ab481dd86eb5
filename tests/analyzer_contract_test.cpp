#include <gtest/gtest.h>
#include "code_sentinel/analyzer/analyzer.hpp"
#include "code_sentinel/analyzer/analyzer_registry.hpp"
#include "code_sentinel/core/errors.hpp"
#include "code_sentinel/schedule/task_token.hpp"
#include "test_helpers.hpp"
#include <stdexcept>

using namespace code_sentinel;
using test_support::StubAnalyzer;
using test_support::StubInspector;
using test_support::makeFile;

namespace {

class AnalyzerContractTest : public ::testing::Test {
protected:
    schedule::TaskToken token = schedule::TaskToken::unbounded();
    analyzer::EscalationOptions escalation;
    analyzer::FixedRandomSource random{0.99};

    void SetUp() override {
        escalation.use_deep_tier = true;
    }

    analyzer::AnalysisContext context() {
        return analyzer::AnalysisContext{token, escalation, random};
    }

    // One critical and one low finding, so the deep tier always runs.
    static std::shared_ptr<StubAnalyzer> criticalAnalyzer() {
        return std::make_shared<StubAnalyzer>("stub", [](const common::SourceFile& file, const schedule::TaskToken&) {
            return std::vector<common::Finding>{
                test_support::makeFinding("Command injection risk", common::Severity::CRITICAL, file.path, 2),
                test_support::makeFinding("Debug output", common::Severity::LOW, file.path, 5, "best_practices")
            };
        });
    }
};

}

TEST_F(AnalyzerContractTest, CanAnalyzeMatchesLanguageOrFileName) {
    StubAnalyzer any("any", [](const common::SourceFile&, const schedule::TaskToken&) {
        return std::vector<common::Finding>{};
    });
    EXPECT_TRUE(any.canAnalyze(makeFile("whatever.bin", "", "")));

    StubAnalyzer scoped("scoped", [](const common::SourceFile&, const schedule::TaskToken&) {
        return std::vector<common::Finding>{};
    }, {"python", "requirements.txt"});
    EXPECT_TRUE(scoped.canAnalyze(makeFile("app.py", "", "Python")));
    EXPECT_TRUE(scoped.canAnalyze(makeFile("deps/requirements.txt", "", "")));
    EXPECT_FALSE(scoped.canAnalyze(makeFile("main.go", "", "go")));
}

TEST_F(AnalyzerContractTest, BinaryContentIsMalformedInput) {
    StubAnalyzer stub("stub", [](const common::SourceFile&, const schedule::TaskToken&) {
        return std::vector<common::Finding>{};
    });
    std::string content("abc\0def", 7);

    try {
        stub.analyze(makeFile("blob.py", content), context());
        FAIL() << "expected AnalyzerError";
    } catch (const core::AnalyzerError& e) {
        EXPECT_EQ(e.code(), core::CoreErrorCode::ANALYZER_MALFORMED_INPUT);
    }
    EXPECT_EQ(stub.calls(), 0u);
}

TEST_F(AnalyzerContractTest, FirstTierFillsPathAndMetrics) {
    escalation.use_deep_tier = false;
    StubAnalyzer stub("stub", [](const common::SourceFile&, const schedule::TaskToken&) {
        auto finding = test_support::makeFinding("Unpinned", common::Severity::MEDIUM, "", 1, "dependency");
        return std::vector<common::Finding>{finding};
    });

    auto output = stub.analyze(makeFile("requirements.txt", "flask\nrequests\n"), context());

    ASSERT_EQ(output.findings.size(), 1u);
    EXPECT_EQ(output.findings[0].file_path, "requirements.txt");
    EXPECT_FALSE(output.deep_tier_used);
    EXPECT_EQ(output.escalation_reason, analyzer::EscalationReason::DEEP_TIER_DISABLED);
    EXPECT_DOUBLE_EQ(output.metrics.at("lines"), 3.0);
    EXPECT_DOUBLE_EQ(output.metrics.at("tier1_findings"), 1.0);
    EXPECT_DOUBLE_EQ(output.metrics.at("score"), 9.5);
}

TEST_F(AnalyzerContractTest, EscalationWithoutInspectorKeepsFirstTier) {
    auto stub = criticalAnalyzer();

    auto output = stub->analyze(makeFile("app.py", "x = 1\n"), context());

    EXPECT_EQ(output.findings.size(), 2u);
    EXPECT_FALSE(output.deep_tier_used);
    EXPECT_EQ(output.escalation_reason, analyzer::EscalationReason::CRITICAL_VERIFICATION);
    EXPECT_DOUBLE_EQ(output.metrics.at("deep_tier_unavailable"), 1.0);
}

TEST_F(AnalyzerContractTest, DeepTierMergesVerdicts) {
    auto stub = criticalAnalyzer();
    auto inspector = std::make_shared<StubInspector>([](const common::SourceFile& file,
                                                        const std::vector<common::Finding>& tier1,
                                                        const schedule::TaskToken&) {
        EXPECT_EQ(tier1.size(), 2u);
        analyzer::DeepInspection inspection;
        inspection.confirmed.insert(0);
        inspection.false_positives.insert(1);
        inspection.findings.push_back(
            test_support::makeFinding("Tainted SQL", common::Severity::HIGH, file.path, 9, "security", 0.9));
        inspection.findings.push_back(
            test_support::makeFinding("Maybe tainted", common::Severity::HIGH, "", 12, "security", 0.5));
        return inspection;
    });
    stub->setDeepInspector(inspector);

    auto output = stub->analyze(makeFile("app.py", "x = 1\n"), context());

    EXPECT_EQ(inspector->calls(), 1u);
    EXPECT_TRUE(output.deep_tier_used);
    ASSERT_EQ(output.findings.size(), 2u);
    EXPECT_EQ(output.findings[0].title, "Command injection risk");
    EXPECT_EQ(output.findings[1].title, "Tainted SQL");
    EXPECT_DOUBLE_EQ(output.metrics.at("deep_tier_confirmed"), 1.0);
    EXPECT_DOUBLE_EQ(output.metrics.at("deep_tier_false_positives"), 1.0);
    EXPECT_DOUBLE_EQ(output.metrics.at("deep_tier_findings"), 1.0);
    EXPECT_DOUBLE_EQ(output.metrics.at("deep_tier_discarded"), 1.0);
    EXPECT_DOUBLE_EQ(output.metrics.at("tier1_findings"), 2.0);
}

TEST_F(AnalyzerContractTest, DeepTierFailureFallsBackToFirstTier) {
    auto stub = criticalAnalyzer();
    stub->setDeepInspector(std::make_shared<StubInspector>([](const common::SourceFile&,
                                                              const std::vector<common::Finding>&,
                                                              const schedule::TaskToken&) -> analyzer::DeepInspection {
        throw std::runtime_error("inspector offline");
    }));

    auto output = stub->analyze(makeFile("app.py", "x = 1\n"), context());

    EXPECT_FALSE(output.deep_tier_used);
    EXPECT_EQ(output.findings.size(), 2u);
    EXPECT_DOUBLE_EQ(output.metrics.at("deep_tier_failed"), 1.0);
}

TEST_F(AnalyzerContractTest, DeepTierTimeoutPropagates) {
    auto stub = criticalAnalyzer();
    stub->setDeepInspector(std::make_shared<StubInspector>([](const common::SourceFile&,
                                                              const std::vector<common::Finding>&,
                                                              const schedule::TaskToken&) -> analyzer::DeepInspection {
        throw core::TaskTimeout("deep tier too slow");
    }));

    EXPECT_THROW(stub->analyze(makeFile("app.py", "x = 1\n"), context()), core::TaskTimeout);
}

TEST_F(AnalyzerContractTest, ExpiredTokenStopsBeforeRules) {
    auto stub = criticalAnalyzer();
    auto expired = schedule::TaskToken::withTimeout(std::chrono::milliseconds(0));
    analyzer::AnalysisContext late{expired, escalation, random};

    EXPECT_THROW(stub->analyze(makeFile("app.py", "x = 1\n"), late), core::TaskTimeout);
    EXPECT_EQ(stub->calls(), 0u);
}

TEST_F(AnalyzerContractTest, CancelledTokenRaisesCancellation) {
    auto stub = criticalAnalyzer();
    std::atomic<bool> cancelled{true};
    schedule::TaskToken cancelling(schedule::TaskToken::Clock::now() + std::chrono::seconds(10), &cancelled);
    analyzer::AnalysisContext ctx{cancelling, escalation, random};

    EXPECT_THROW(stub->analyze(makeFile("app.py", "x = 1\n"), ctx), core::TaskCancelled);
}

TEST_F(AnalyzerContractTest, ScoreScale) {
    EXPECT_DOUBLE_EQ(analyzer::Analyzer::scoreFindings({}), 10.0);

    std::vector<common::Finding> one = {
        test_support::makeFinding("a", common::Severity::CRITICAL, "f", 1)
    };
    EXPECT_DOUBLE_EQ(analyzer::Analyzer::scoreFindings(one), 9.0);

    std::vector<common::Finding> many(12, one[0]);
    EXPECT_DOUBLE_EQ(analyzer::Analyzer::scoreFindings(many), 0.0);
}

TEST(AnalyzerRegistryTest, BuiltinsAndDeepTier) {
    auto registry = analyzer::AnalyzerRegistry::withBuiltins();

    auto ids = registry.knownIds();
    EXPECT_EQ(ids, (std::vector<std::string>{"best_practices", "code_quality", "dependency", "performance", "security"}));

    auto plain = registry.create("security");
    EXPECT_FALSE(plain->info().has_deep_inspector);
    auto deep = registry.create("security", true);
    EXPECT_TRUE(deep->info().has_deep_inspector);

    EXPECT_THROW(registry.create("style"), core::ConfigurationError);

    auto infos = registry.describeAll();
    ASSERT_EQ(infos.size(), 5u);
    EXPECT_EQ(infos[0].id, "best_practices");
    EXPECT_FALSE(infos[0].description.empty());
}
