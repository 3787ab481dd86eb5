#include "code_sentinel/analyzer/escalation_policy.hpp"
#include "code_sentinel/analyzer/text_utils.hpp"
#include <algorithm>

namespace code_sentinel {
namespace analyzer {

EscalationDecision EscalationPolicy::decide(const common::SourceFile& file,
                                            const std::vector<common::Finding>& tier1_findings,
                                            const EscalationOptions& options,
                                            RandomSource& random) {
    if (!options.use_deep_tier) {
        return {false, EscalationReason::DEEP_TIER_DISABLED};
    }

    bool has_critical = std::any_of(tier1_findings.begin(), tier1_findings.end(),
        [](const common::Finding& f) {
            return f.severity && *f.severity == common::Severity::CRITICAL;
        });
    if (has_critical) {
        return {true, EscalationReason::CRITICAL_VERIFICATION};
    }

    if (countLines(file.content) < options.min_lines) {
        return {false, EscalationReason::BELOW_MIN_SIZE};
    }

    if (isConfigurationFile(file)) {
        return {false, EscalationReason::CONFIGURATION_FILE};
    }

    if (estimateComplexity(file.content) > options.complexity_threshold) {
        return {true, EscalationReason::HIGH_COMPLEXITY};
    }

    if (random.nextUnit() < options.sample_rate) {
        return {true, EscalationReason::SAMPLED};
    }
    return {false, EscalationReason::NOT_SAMPLED};
}

bool EscalationPolicy::isConfigurationFile(const common::SourceFile& file) {
    std::string path = text::toLower(file.path);
    for (const char* ext : constants::escalation::CONFIG_EXTENSIONS) {
        if (text::endsWith(path, ext)) {
            return true;
        }
    }

    std::string language = text::toLower(file.language);
    for (const char* tag : constants::escalation::CONFIG_LANGUAGES) {
        if (language == tag) {
            return true;
        }
    }
    return false;
}

int EscalationPolicy::estimateComplexity(const std::string& content) {
    int complexity = 0;
    for (const char* keyword : constants::escalation::COMPLEXITY_KEYWORDS) {
        complexity += static_cast<int>(text::countWord(content, keyword));
    }
    return complexity;
}

size_t EscalationPolicy::countLines(const std::string& content) {
    return static_cast<size_t>(std::count(content.begin(), content.end(), '\n')) + 1;
}

std::string to_string(EscalationReason reason) {
    switch (reason) {
        case EscalationReason::DEEP_TIER_DISABLED: return "deep_tier_disabled";
        case EscalationReason::CRITICAL_VERIFICATION: return "critical_verification";
        case EscalationReason::BELOW_MIN_SIZE: return "below_min_size";
        case EscalationReason::CONFIGURATION_FILE: return "configuration_file";
        case EscalationReason::HIGH_COMPLEXITY: return "high_complexity";
        case EscalationReason::SAMPLED: return "sampled";
        case EscalationReason::NOT_SAMPLED: return "not_sampled";
    }
    return "unknown";
}

}}
