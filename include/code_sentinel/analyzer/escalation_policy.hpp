#pragma once

#include "../common/types.hpp"
#include "../common/constants.hpp"
#include "random_source.hpp"
#include <string>
#include <vector>

namespace code_sentinel {
namespace analyzer {

enum class EscalationReason {
    DEEP_TIER_DISABLED,
    CRITICAL_VERIFICATION,
    BELOW_MIN_SIZE,
    CONFIGURATION_FILE,
    HIGH_COMPLEXITY,
    SAMPLED,
    NOT_SAMPLED
};

struct EscalationOptions {
    bool use_deep_tier = false;
    double sample_rate = constants::escalation::DEFAULT_SAMPLE_RATE;
    size_t min_lines = constants::escalation::MIN_LINES;
    int complexity_threshold = constants::escalation::COMPLEXITY_THRESHOLD;
};

struct EscalationDecision {
    bool escalate;
    EscalationReason reason;
};

// Stateless. Rules are evaluated in order and the first match wins:
// critical tier-1 finding, small or configuration file, complexity, sampling.
class EscalationPolicy {
public:
    static EscalationDecision decide(const common::SourceFile& file,
                                     const std::vector<common::Finding>& tier1_findings,
                                     const EscalationOptions& options,
                                     RandomSource& random);

    static bool isConfigurationFile(const common::SourceFile& file);
    static int estimateComplexity(const std::string& content);
    static size_t countLines(const std::string& content);
};

std::string to_string(EscalationReason reason);

}}
