#include "code_sentinel/config/validator.hpp"
#include "code_sentinel/common/constants.hpp"
#include "code_sentinel/common/glob_matcher.hpp"
#include "code_sentinel/common/logger.hpp"
#include <filesystem>

namespace code_sentinel {
namespace config {

ConfigValidator::ConfigValidator(std::set<std::string> known_analyzers)
    : known_analyzers_(std::move(known_analyzers)) {}

ValidationResult ConfigValidator::validate(const common::GlobalConfig& config) const {
    ValidationResult result;

    common::Logger::instance().debug("[Validator] Starting validation");

    if (!config.log_file.empty() &&
        !canCreateDirectory(std::filesystem::path(config.log_file).parent_path().string())) {
        result.errors.push_back("log_file: Cannot create parent directory");
        result.is_valid = false;
    }

    if (config.logging.rotation_size_mb < 1) {
        result.errors.push_back("logging.rotation_size_mb: Must be >= 1");
        result.is_valid = false;
    }

    if (config.logging.max_files < 1) {
        result.errors.push_back("logging.max_files: Must be >= 1");
        result.is_valid = false;
    }

    validateAnalysis(config.analysis, result);
    validateScoring(config.scoring, result);

    if (result.is_valid) {
        common::Logger::instance().info("[Validator] Passed | warnings={}", result.warnings.size());
    } else {
        common::Logger::instance().error("[Validator] Failed | errors={}", result.errors.size());
    }

    return result;
}

void ConfigValidator::validateAnalysis(const common::AnalysisSettings& analysis, ValidationResult& result) const {
    using namespace constants::limits;

    if (analysis.max_concurrent_files < 1 || analysis.max_concurrent_files > MAX_CONCURRENT_TASKS) {
        result.errors.push_back("analysis.max_concurrent_files: Must be between 1-" +
                                std::to_string(MAX_CONCURRENT_TASKS));
        result.is_valid = false;
    } else if (analysis.max_concurrent_files > 64) {
        result.warnings.push_back("analysis.max_concurrent_files: Very high value, tasks beyond the CPU count only queue");
    }

    if (analysis.timeout_per_file < 1 || analysis.timeout_per_file > MAX_TIMEOUT_PER_FILE_SECONDS) {
        result.errors.push_back("analysis.timeout_per_file: Must be between 1-" +
                                std::to_string(MAX_TIMEOUT_PER_FILE_SECONDS) + " seconds");
        result.is_valid = false;
    }

    if (!(analysis.llm_sample_rate >= 0.0 && analysis.llm_sample_rate <= 1.0)) {
        result.errors.push_back("analysis.llm_sample_rate: Must be between 0.0-1.0");
        result.is_valid = false;
    }

    if (analysis.enabled_agents.empty()) {
        result.errors.push_back("analysis.enabled_agents: At least one analyzer must be enabled");
        result.is_valid = false;
    }

    if (!known_analyzers_.empty()) {
        for (const auto& agent : analysis.enabled_agents) {
            if (!known_analyzers_.count(agent)) {
                result.warnings.push_back("analysis.enabled_agents: Unknown analyzer '" + agent +
                                          "', the run will be rejected");
            }
        }
    }

    common::GlobMatcher matcher(analysis.skip_patterns);
    for (const auto& rejected : matcher.rejectedPatterns()) {
        result.errors.push_back("analysis.skip_patterns: Invalid pattern '" + rejected + "'");
        result.is_valid = false;
    }
}

void ConfigValidator::validateScoring(const common::ScoringConfig& scoring, ValidationResult& result) const {
    for (const auto& [severity, penalty] : scoring.penalties) {
        if (penalty < 0) {
            result.errors.push_back("scoring.penalty_" + common::to_string(severity) + ": Must be >= 0");
            result.is_valid = false;
        }
    }

    if (scoring.penaltyFor(common::Severity::CRITICAL) < scoring.penaltyFor(common::Severity::HIGH) ||
        scoring.penaltyFor(common::Severity::HIGH) < scoring.penaltyFor(common::Severity::MEDIUM) ||
        scoring.penaltyFor(common::Severity::MEDIUM) < scoring.penaltyFor(common::Severity::LOW) ||
        scoring.penaltyFor(common::Severity::LOW) < scoring.penaltyFor(common::Severity::INFO)) {
        result.warnings.push_back("scoring: Penalties are not ordered by severity");
    }

    if (scoring.grade_thresholds.empty()) {
        result.errors.push_back("scoring.grade_cutoffs: At least one grade is required");
        result.is_valid = false;
    }

    for (size_t i = 0; i < scoring.grade_thresholds.size(); ++i) {
        const auto& threshold = scoring.grade_thresholds[i];
        if (threshold.min_score < 0 || threshold.min_score > constants::scoring::BASE_SCORE) {
            result.errors.push_back("scoring.grade_cutoffs." + threshold.grade + ": Must be between 0-100");
            result.is_valid = false;
        }
        if (i > 0 && threshold.min_score >= scoring.grade_thresholds[i - 1].min_score) {
            result.errors.push_back("scoring.grade_cutoffs: Cutoffs must be strictly descending");
            result.is_valid = false;
        }
    }

    if (scoring.failing_grade.empty()) {
        result.errors.push_back("scoring.failing_grade: Must not be empty");
        result.is_valid = false;
    }

    if (scoring.max_recommendations < 1) {
        result.errors.push_back("scoring.max_recommendations: Must be >= 1");
        result.is_valid = false;
    }
}

ValidationResult ConfigValidator::validateFile(const std::string& path) const {
    ValidationResult result;

    if (!std::filesystem::exists(path)) {
        result.errors.push_back("Configuration file does not exist");
        result.is_valid = false;
        common::Logger::instance().error("[Validator] File not found | path={}", path);
        return result;
    }

    try {
        auto& config = common::Config::instance();
        if (!config.load(path)) {
            result.errors.push_back("Failed to parse configuration file");
            result.is_valid = false;
            common::Logger::instance().error("[Validator] Parse failed | path={}", path);
            return result;
        }

        return validate(config.global());
    } catch (const std::exception& e) {
        result.errors.push_back(std::string("Exception: ") + e.what());
        result.is_valid = false;
        common::Logger::instance().error("[Validator] Exception | path={} | error={}", path, e.what());
        return result;
    }
}

bool ConfigValidator::canCreateDirectory(const std::string& path) {
    std::error_code ec;
    std::filesystem::path p(path);
    if (p.empty()) return true;

    if (std::filesystem::exists(p, ec)) {
        return std::filesystem::is_directory(p, ec);
    }

    auto parent = p.parent_path();
    if (parent.empty() || parent == p) return true;

    if (std::filesystem::exists(parent, ec)) {
        auto perms = std::filesystem::status(parent, ec).permissions();
        return !ec && (perms & std::filesystem::perms::owner_write) != std::filesystem::perms::none;
    }

    return canCreateDirectory(parent.string());
}

}}
