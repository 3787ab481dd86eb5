#pragma once

#include "../common/types.hpp"
#include "../schedule/task_token.hpp"
#include "escalation_policy.hpp"
#include "deep_inspector.hpp"
#include "random_source.hpp"
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace code_sentinel {
namespace analyzer {

struct AnalysisContext {
    const schedule::TaskToken& token;
    const EscalationOptions& escalation;
    RandomSource& random;
};

struct AnalyzerOutput {
    std::vector<common::Finding> findings;
    std::map<std::string, double> metrics;
    bool deep_tier_used = false;
    EscalationReason escalation_reason = EscalationReason::DEEP_TIER_DISABLED;
};

struct AnalyzerInfo {
    std::string id;
    std::string version;
    std::string description;
    std::vector<std::string> supported_languages;
    bool has_deep_inspector = false;
};

struct RuleSpec {
    std::string rule_id;
    std::string title;
    common::Severity severity;
    std::string category;
    std::string description;
    std::string suggestion;
    std::vector<std::string> references;
};

class Analyzer {
public:
    virtual ~Analyzer() = default;

    virtual std::string id() const = 0;
    virtual std::string version() const { return "1.0.0"; }
    virtual std::string description() const = 0;

    // Language tags, manifest file names, or "*" for everything.
    virtual std::vector<std::string> supportedLanguages() const = 0;

    bool canAnalyze(const common::SourceFile& file) const;

    // Throws AnalyzerError when the file cannot be analyzed, and TaskTimeout or
    // TaskCancelled from token checkpoints.
    AnalyzerOutput analyze(const common::SourceFile& file, const AnalysisContext& context) const;

    void setDeepInspector(std::shared_ptr<DeepInspector> inspector) { deep_inspector_ = std::move(inspector); }
    const std::shared_ptr<DeepInspector>& deepInspector() const { return deep_inspector_; }

    AnalyzerInfo info() const;

    // On the 0-10 scale reported per outcome.
    static double scoreFindings(const std::vector<common::Finding>& findings);

protected:
    struct Tier1Result {
        std::vector<common::Finding> findings;
        std::map<std::string, double> metrics;
    };

    virtual Tier1Result runRules(const common::SourceFile& file, const schedule::TaskToken& token) const = 0;

    common::Finding makeFinding(const RuleSpec& rule,
                                const common::SourceFile& file,
                                int line,
                                const std::string& snippet,
                                double confidence = 1.0) const;

private:
    std::shared_ptr<DeepInspector> deep_inspector_;

    void mergeDeepInspection(const common::SourceFile& file,
                             const std::vector<common::Finding>& tier1,
                             const DeepInspection& inspection,
                             AnalyzerOutput& output) const;
};

}}
