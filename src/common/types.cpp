#include "code_sentinel/common/types.hpp"
#include "code_sentinel/common/constants.hpp"
#include <algorithm>
#include <cctype>

namespace code_sentinel {
namespace common {

AnalysisConfig makeDefaultAnalysisConfig() {
    using namespace constants::config_defaults;

    AnalysisConfig config;
    config.max_concurrent_tasks = MAX_CONCURRENT_FILES;
    config.per_task_timeout = std::chrono::seconds(TIMEOUT_PER_FILE);
    for (const auto& id : constants::analyzers::getDefaultEnabled()) {
        config.enabled_analyzers.insert(id);
    }
    config.use_deep_tier = USE_LLM;
    config.deep_tier_sample_rate = LLM_SAMPLE_RATE;
    config.skip_patterns = constants::skip_patterns::getDefaults();
    config.random_seed = RANDOM_SEED;
    return config;
}

std::string to_string(Severity severity) {
    switch (severity) {
        case Severity::CRITICAL: return "critical";
        case Severity::HIGH: return "high";
        case Severity::MEDIUM: return "medium";
        case Severity::LOW: return "low";
        case Severity::INFO: return "info";
        default: return "unknown";
    }
}

std::string to_string(OutcomeStatus status) {
    switch (status) {
        case OutcomeStatus::COMPLETED: return "completed";
        case OutcomeStatus::FAILED: return "failed";
        case OutcomeStatus::TIMED_OUT: return "timed_out";
        default: return "unknown";
    }
}

std::string to_string(ReportStatus status) {
    switch (status) {
        case ReportStatus::COMPLETED: return "completed";
        case ReportStatus::FAILED: return "failed";
        default: return "unknown";
    }
}

std::optional<Severity> parseSeverity(const std::string& value) {
    std::string lower = value;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (lower == "critical") return Severity::CRITICAL;
    if (lower == "high") return Severity::HIGH;
    if (lower == "medium") return Severity::MEDIUM;
    if (lower == "low") return Severity::LOW;
    if (lower == "info") return Severity::INFO;
    return std::nullopt;
}

const std::vector<Severity>& allSeverities() {
    static const std::vector<Severity> severities = {
        Severity::CRITICAL, Severity::HIGH, Severity::MEDIUM, Severity::LOW, Severity::INFO
    };
    return severities;
}

}}
