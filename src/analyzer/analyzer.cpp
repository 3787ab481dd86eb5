#include "code_sentinel/analyzer/analyzer.hpp"
#include "code_sentinel/analyzer/text_utils.hpp"
#include "code_sentinel/common/constants.hpp"
#include "code_sentinel/common/logger.hpp"
#include "code_sentinel/core/errors.hpp"
#include <algorithm>

namespace code_sentinel {
namespace analyzer {

bool Analyzer::canAnalyze(const common::SourceFile& file) const {
    std::string language = text::toLower(file.language);
    std::string name = text::toLower(text::basename(file.path));

    for (const auto& supported : supportedLanguages()) {
        if (supported == constants::analyzers::ALL_LANGUAGES) {
            return true;
        }
        std::string tag = text::toLower(supported);
        if (!language.empty() && tag == language) {
            return true;
        }
        if (tag == name) {
            return true;
        }
    }
    return false;
}

AnalyzerOutput Analyzer::analyze(const common::SourceFile& file, const AnalysisContext& context) const {
    const auto& token = context.token;
    token.checkpoint();

    if (file.content.find('\0') != std::string::npos) {
        throw core::AnalyzerError(core::CoreErrorCode::ANALYZER_MALFORMED_INPUT,
                                  "Binary content in " + file.path);
    }

    Tier1Result tier1 = runRules(file, token);
    for (auto& finding : tier1.findings) {
        if (finding.file_path.empty()) {
            finding.file_path = file.path;
        }
    }

    AnalyzerOutput output;
    output.metrics = std::move(tier1.metrics);
    output.metrics["lines"] = static_cast<double>(EscalationPolicy::countLines(file.content));
    output.metrics["tier1_findings"] = static_cast<double>(tier1.findings.size());
    output.metrics["skipped_long_lines"] = static_cast<double>(text::countUnscannableLines(file.content));

    auto decision = EscalationPolicy::decide(file, tier1.findings, context.escalation, context.random);
    output.escalation_reason = decision.reason;

    if (decision.escalate && !deep_inspector_) {
        common::Logger::instance().debug("[Analyzer] Escalation skipped, no deep inspector | analyzer={} | file={}",
                                         id(), file.path);
        output.metrics["deep_tier_unavailable"] = 1.0;
        decision.escalate = false;
    }

    if (!decision.escalate) {
        output.findings = std::move(tier1.findings);
        output.metrics["score"] = scoreFindings(output.findings);
        return output;
    }

    common::Logger::instance().debug("[Analyzer] Escalating | analyzer={} | file={} | reason={}",
                                     id(), file.path, to_string(decision.reason));
    token.checkpoint();

    try {
        DeepInspection inspection = deep_inspector_->inspect(file, tier1.findings, token);
        mergeDeepInspection(file, tier1.findings, inspection, output);
        output.deep_tier_used = true;
        output.metrics["deep_tier_used"] = 1.0;
    } catch (const core::TaskTimeout&) {
        throw;
    } catch (const core::TaskCancelled&) {
        throw;
    } catch (const std::exception& e) {
        common::Logger::instance().warn("[Analyzer] Deep tier failed, keeping tier-1 result | analyzer={} | file={} | code={} | error={}",
                                        id(), file.path,
                                        core::CoreErrorCodeHelper::toString(core::CoreErrorCode::ANALYZER_DEEP_TIER_FAILED),
                                        e.what());
        output.findings = std::move(tier1.findings);
        output.metrics["deep_tier_failed"] = 1.0;
    }

    output.metrics["score"] = scoreFindings(output.findings);
    return output;
}

void Analyzer::mergeDeepInspection(const common::SourceFile& file,
                                   const std::vector<common::Finding>& tier1,
                                   const DeepInspection& inspection,
                                   AnalyzerOutput& output) const {
    size_t removed = 0;
    for (size_t i = 0; i < tier1.size(); ++i) {
        if (inspection.false_positives.count(i)) {
            ++removed;
            continue;
        }
        output.findings.push_back(tier1[i]);
    }

    size_t accepted = 0;
    size_t discarded = 0;
    for (const auto& finding : inspection.findings) {
        if (finding.confidence < constants::escalation::MIN_DEEP_CONFIDENCE) {
            ++discarded;
            continue;
        }
        common::Finding merged = finding;
        if (merged.file_path.empty()) {
            merged.file_path = file.path;
        }
        output.findings.push_back(std::move(merged));
        ++accepted;
    }

    output.metrics["deep_tier_confirmed"] = static_cast<double>(inspection.confirmed.size());
    output.metrics["deep_tier_false_positives"] = static_cast<double>(removed);
    output.metrics["deep_tier_findings"] = static_cast<double>(accepted);
    output.metrics["deep_tier_discarded"] = static_cast<double>(discarded);
}

AnalyzerInfo Analyzer::info() const {
    AnalyzerInfo result;
    result.id = id();
    result.version = version();
    result.description = description();
    result.supported_languages = supportedLanguages();
    result.has_deep_inspector = deep_inspector_ != nullptr;
    return result;
}

double Analyzer::scoreFindings(const std::vector<common::Finding>& findings) {
    double penalty = 0.0;
    for (const auto& finding : findings) {
        if (!finding.severity) continue;
        switch (*finding.severity) {
            case common::Severity::CRITICAL: penalty += 2.0; break;
            case common::Severity::HIGH: penalty += 1.5; break;
            case common::Severity::MEDIUM: penalty += 1.0; break;
            case common::Severity::LOW: penalty += 0.5; break;
            case common::Severity::INFO: penalty += 0.1; break;
        }
    }
    return std::max(0.0, 10.0 - penalty * 0.5);
}

common::Finding Analyzer::makeFinding(const RuleSpec& rule,
                                      const common::SourceFile& file,
                                      int line,
                                      const std::string& snippet,
                                      double confidence) const {
    common::Finding finding;
    finding.title = rule.title;
    finding.description = rule.description;
    finding.severity = rule.severity;
    finding.category = rule.category;
    finding.file_path = file.path;
    if (line > 0) {
        finding.line = line;
    }
    finding.confidence = confidence;
    finding.suggestion = rule.suggestion;
    finding.rule_id = rule.rule_id;
    finding.references = rule.references;
    finding.code_snippet = text::truncate(text::trim(snippet), 200);
    return finding;
}

}}
