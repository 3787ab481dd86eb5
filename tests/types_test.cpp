#include <gtest/gtest.h>
#include "code_sentinel/common/config.hpp"
#include "code_sentinel/common/constants.hpp"
#include "code_sentinel/common/types.hpp"
#include "code_sentinel/core/errors.hpp"

using namespace code_sentinel;

TEST(SeverityTest, OrderingPutsCriticalFirst) {
    EXPECT_TRUE(common::isMoreSevere(common::Severity::CRITICAL, common::Severity::HIGH));
    EXPECT_TRUE(common::isMoreSevere(common::Severity::LOW, common::Severity::INFO));
    EXPECT_FALSE(common::isMoreSevere(common::Severity::MEDIUM, common::Severity::MEDIUM));
    EXPECT_FALSE(common::isMoreSevere(common::Severity::INFO, common::Severity::CRITICAL));

    const auto& all = common::allSeverities();
    ASSERT_EQ(all.size(), 5u);
    EXPECT_EQ(all.front(), common::Severity::CRITICAL);
    EXPECT_EQ(all.back(), common::Severity::INFO);
}

TEST(SeverityTest, ParsesCaseInsensitively) {
    EXPECT_EQ(common::parseSeverity("HIGH"), common::Severity::HIGH);
    EXPECT_EQ(common::parseSeverity("Critical"), common::Severity::CRITICAL);
    EXPECT_EQ(common::parseSeverity("info"), common::Severity::INFO);
    EXPECT_FALSE(common::parseSeverity("severe").has_value());
    EXPECT_FALSE(common::parseSeverity("").has_value());
}

TEST(SeverityTest, StringNamesAreLowercase) {
    EXPECT_EQ(common::to_string(common::Severity::MEDIUM), "medium");
    EXPECT_EQ(common::to_string(common::OutcomeStatus::TIMED_OUT), "timed_out");
    EXPECT_EQ(common::to_string(common::ReportStatus::FAILED), "failed");
}

TEST(AnalysisConfigTest, DefaultsEnableAllBuiltinAnalyzers) {
    auto config = common::makeDefaultAnalysisConfig();

    EXPECT_EQ(config.max_concurrent_tasks, 10);
    EXPECT_EQ(config.per_task_timeout, std::chrono::milliseconds(30000));
    EXPECT_FALSE(config.use_deep_tier);
    EXPECT_DOUBLE_EQ(config.deep_tier_sample_rate, 0.2);
    EXPECT_EQ(config.enabled_analyzers.size(), 5u);
    EXPECT_TRUE(config.enabled_analyzers.count("security"));
    EXPECT_TRUE(config.enabled_analyzers.count("best_practices"));
    EXPECT_FALSE(config.skip_patterns.empty());
}

TEST(ScoringConfigTest, DefaultPenaltiesAndGrades) {
    auto scoring = common::Config::createDefaultScoring();

    EXPECT_EQ(scoring.penaltyFor(common::Severity::CRITICAL), 15);
    EXPECT_EQ(scoring.penaltyFor(common::Severity::HIGH), 8);
    EXPECT_EQ(scoring.penaltyFor(common::Severity::MEDIUM), 4);
    EXPECT_EQ(scoring.penaltyFor(common::Severity::LOW), 1);
    EXPECT_EQ(scoring.penaltyFor(common::Severity::INFO), 0);

    ASSERT_FALSE(scoring.grade_thresholds.empty());
    EXPECT_EQ(scoring.grade_thresholds.front().grade, "A+");
    EXPECT_EQ(scoring.grade_thresholds.front().min_score, 97);
    EXPECT_EQ(scoring.failing_grade, "F");

    EXPECT_EQ(scoring.thresholdFor("code_quality"), 5u);
    EXPECT_EQ(scoring.thresholdFor("security"), 0u);
}

TEST(ErrorCodeTest, CodesHaveStableNames) {
    core::ConfigurationError error(core::CoreErrorCode::CONFIG_UNKNOWN_ANALYZER, "Unknown analyzer 'x'");
    EXPECT_STREQ(error.codeString(), "CONFIG_UNKNOWN_ANALYZER");
    EXPECT_EQ(error.code(), core::CoreErrorCode::CONFIG_UNKNOWN_ANALYZER);
    EXPECT_STREQ(error.what(), "Unknown analyzer 'x'");

    core::TaskTimeout timeout("late");
    EXPECT_EQ(timeout.code(), core::CoreErrorCode::TASK_TIMEOUT);
    EXPECT_STREQ(core::CoreErrorCodeHelper::toString(core::CoreErrorCode::FINDING_MALFORMED), "FINDING_MALFORMED");
}

TEST(ErrorCodeTest, FamiliesFollowTheHundredsDigit) {
    using core::CoreErrorCode;
    using core::CoreErrorCodeHelper;
    using core::ErrorFamily;

    EXPECT_EQ(CoreErrorCodeHelper::family(CoreErrorCode::CONFIG_INVALID_VALUE), ErrorFamily::CONFIGURATION);
    EXPECT_EQ(CoreErrorCodeHelper::family(CoreErrorCode::ANALYZER_DEEP_TIER_FAILED), ErrorFamily::ANALYZER);
    EXPECT_EQ(CoreErrorCodeHelper::family(CoreErrorCode::TASK_CANCELLED), ErrorFamily::TASK);
    EXPECT_EQ(CoreErrorCodeHelper::family(CoreErrorCode::FINDING_MALFORMED), ErrorFamily::AGGREGATION);
    EXPECT_EQ(CoreErrorCodeHelper::family(CoreErrorCode::CATALOG_READ_FAILED), ErrorFamily::CATALOG);
    EXPECT_STREQ(core::to_string(ErrorFamily::CATALOG), "catalog");

    auto unlisted = static_cast<CoreErrorCode>(999);
    EXPECT_STREQ(CoreErrorCodeHelper::toString(unlisted), "UNKNOWN");
    EXPECT_STREQ(CoreErrorCodeHelper::getMessage(unlisted), "Unknown error");
    EXPECT_EQ(CoreErrorCodeHelper::family(unlisted), ErrorFamily::UNKNOWN);
}

TEST(ErrorCodeTest, ContextRendersComponentThenSortedDetails) {
    core::ErrorContext context{"CatalogLoader", {{"path", "a.json"}, {"byte", "12"}}};
    EXPECT_EQ(context.format(), "component=CatalogLoader | byte=12 | path=a.json");
    EXPECT_TRUE(core::ErrorContext{}.empty());

    core::CatalogError error(core::CoreErrorCode::CATALOG_PARSE_FAILED, "bad", context);
    EXPECT_EQ(error.context().details.at("path"), "a.json");
}
