#include "code_sentinel/analyzer/context_inspector.hpp"
#include "code_sentinel/analyzer/security_analyzer.hpp"
#include "code_sentinel/analyzer/text_utils.hpp"
#include <map>
#include <regex>

namespace code_sentinel {
namespace analyzer {

namespace {

constexpr size_t CHECKPOINT_INTERVAL = 128;

struct Sink {
    std::string rule_id;
    std::string title;
    std::string kind;
    int cwe;
    std::regex pattern;
};

const std::vector<Sink>& sinks() {
    static const std::vector<Sink> all = {
        {"SEC301", "Untrusted input reaches shell command", "command", 78,
         std::regex(R"re(os\.system\s*\(|subprocess\.\w+\s*\(|child_process\.exec|\bexec(Sync)?\s*\(|Runtime\.getRuntime\(\)\.exec|shell_exec\s*\(|\bsystem\s*\()re")},
        {"SEC302", "Untrusted input reaches SQL statement", "sql", 89,
         std::regex(R"re(\.(execute|executemany|query|raw)\s*\()re")},
        {"SEC303", "Untrusted input reaches dynamic evaluation", "eval", 95,
         std::regex(R"re(\beval\s*\(|new\s+Function\s*\(|\bexec\s*\(\s*compile)re")}
    };
    return all;
}

// Assignment whose right-hand side reads a request, argv, env or stdin value.
const std::regex& taintSource() {
    static const std::regex pattern(
        R"re(^\s*(const\s+|let\s+|var\s+|\$)?(\w+)\s*(:\s*\w+\s*)?=\s*.*\b(request\.(args|form|values|json|data|GET|POST|params|query|body|cookies|headers)|req\.(body|query|params|headers|cookies)|\$_(GET|POST|REQUEST|COOKIE)|sys\.argv|process\.argv|os\.environ|os\.getenv|process\.env|getenv\s*\(|input\s*\(|getParameter\s*\())re");
    return pattern;
}

bool containsIdentifier(const std::string& line, const std::string& identifier) {
    return text::countWord(line, identifier) > 0;
}

std::string cweReference(int cwe) {
    return "https://cwe.mitre.org/data/definitions/" + std::to_string(cwe) + ".html";
}

}

bool ContextInspector::isTestPath(const std::string& path) {
    std::string lower = text::toLower(path);
    std::string name = text::basename(lower);
    static const std::vector<std::string> markers = {
        "/test/", "/tests/", "/__tests__/", "/spec/", "/fixtures/", "/fixture/", "/testdata/", "/mocks/"
    };
    for (const auto& marker : markers) {
        if (lower.find(marker) != std::string::npos) return true;
        // Relative paths may start with the directory itself.
        if (text::startsWith(lower, marker.substr(1))) return true;
    }
    return text::startsWith(name, "test_") || lower.find("_test.") != std::string::npos ||
           lower.find(".test.") != std::string::npos || lower.find(".spec.") != std::string::npos;
}

double ContextInspector::taintConfidence(int distance) {
    if (distance <= 15) return 0.9;
    if (distance <= 50) return 0.75;
    return 0.5;
}

DeepInspection ContextInspector::inspect(const common::SourceFile& file,
                                         const std::vector<common::Finding>& tier1_findings,
                                         const schedule::TaskToken& token) const {
    DeepInspection inspection;
    auto lines = text::splitLines(file.content);

    for (size_t i = 0; i < tier1_findings.size(); ++i) {
        if (i % CHECKPOINT_INTERVAL == 0) {
            token.checkpoint();
        }
        if (isFalsePositive(file, lines, tier1_findings[i])) {
            inspection.false_positives.insert(i);
        } else {
            inspection.confirmed.insert(i);
        }
    }

    inspection.findings = traceTaint(file, lines, token);
    return inspection;
}

bool ContextInspector::isFalsePositive(const common::SourceFile& file,
                                       const std::vector<std::string>& lines,
                                       const common::Finding& finding) const {
    if (finding.line && *finding.line >= 1 && static_cast<size_t>(*finding.line) <= lines.size()) {
        const auto& line = lines[static_cast<size_t>(*finding.line - 1)];
        if (text::isCommentLine(line)) {
            return true;
        }

        // Secret rules report the matched value; re-check it against its full line.
        if (text::startsWith(finding.title, "Hardcoded ")) {
            auto separator = line.find_first_of("=:");
            if (separator != std::string::npos) {
                std::string value = text::trim(line.substr(separator + 1));
                while (!value.empty() && (value.back() == ',' || value.back() == ';')) {
                    value.pop_back();
                }
                if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'')) {
                    value = value.substr(1, value.size() - 2);
                }
                if (SecurityAnalyzer::isPlaceholderValue(value)) {
                    return true;
                }
            }
        }
    }

    bool critical = finding.severity && *finding.severity == common::Severity::CRITICAL;
    return !critical && isTestPath(file.path);
}

std::vector<common::Finding> ContextInspector::traceTaint(const common::SourceFile& file,
                                                         const std::vector<std::string>& lines,
                                                         const schedule::TaskToken& token) const {
    std::vector<common::Finding> findings;
    // Variable name to the line that assigned untrusted input to it.
    std::map<std::string, size_t> tainted;

    for (size_t i = 0; i < lines.size(); ++i) {
        if (i % CHECKPOINT_INTERVAL == 0) {
            token.checkpoint();
        }
        const auto& line = lines[i];
        if (!text::scannable(line) || text::isCommentLine(line)) continue;

        std::smatch match;
        if (std::regex_search(line, match, taintSource())) {
            tainted[match[2].str()] = i;
            continue;
        }

        for (const auto& sink : sinks()) {
            if (!std::regex_search(line, sink.pattern)) continue;

            for (const auto& entry : tainted) {
                if (!containsIdentifier(line, entry.first)) continue;

                int distance = static_cast<int>(i - entry.second);
                common::Finding finding;
                finding.title = sink.title;
                finding.description = "'" + entry.first + "' is read from untrusted input on line " +
                                      std::to_string(entry.second + 1) + " and reaches a " + sink.kind + " sink";
                finding.severity = common::Severity::HIGH;
                finding.category = "security";
                finding.file_path = file.path;
                finding.line = static_cast<int>(i + 1);
                finding.confidence = taintConfidence(distance);
                finding.suggestion = "Validate or escape the value before use, or pass it as a bound parameter";
                finding.rule_id = sink.rule_id;
                finding.references = {cweReference(sink.cwe)};
                finding.code_snippet = text::truncate(text::trim(line), 200);
                findings.push_back(std::move(finding));
                break;
            }
        }
    }
    return findings;
}

}}
