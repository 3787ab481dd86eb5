#include "code_sentinel/analyzer/code_quality_analyzer.hpp"
#include "code_sentinel/analyzer/text_utils.hpp"
#include "code_sentinel/common/constants.hpp"
#include <algorithm>
#include <map>
#include <regex>
#include <set>

namespace code_sentinel {
namespace analyzer {

namespace {

constexpr const char* CATEGORY = "code_quality";

struct FunctionPattern {
    std::regex pattern;
    size_t name_group;
    bool indentation_scoped;
};

const std::vector<FunctionPattern>& patternsFor(const std::string& language) {
    static const std::map<std::string, std::vector<FunctionPattern>> patterns = [] {
        std::map<std::string, std::vector<FunctionPattern>> p;
        p["python"] = {
            {std::regex(R"re(^\s*(async\s+)?def\s+(\w+)\s*\()re"), 2, true}
        };
        std::vector<FunctionPattern> js = {
            {std::regex(R"re(^\s*(export\s+)?(default\s+)?(async\s+)?function\s*\*?\s*(\w+)\s*\()re"), 4, false},
            {std::regex(R"re(^\s*(export\s+)?(const|let|var)\s+(\w+)\s*=\s*(async\s*)?(\([^)]*\)|\w+)\s*=>)re"), 3, false}
        };
        p["javascript"] = js;
        p["typescript"] = js;
        std::vector<FunctionPattern> jvm = {
            {std::regex(R"re(^\s*((public|private|protected|internal|static|final|abstract|override|virtual|async|synchronized)\s+)*[\w<>\[\],?]+\s+(\w+)\s*\([^;]*$)re"), 3, false}
        };
        p["java"] = jvm;
        p["csharp"] = jvm;
        p["kotlin"] = {
            {std::regex(R"re(^\s*((public|private|protected|internal|override|suspend)\s+)*fun\s+(\w+)\s*\()re"), 3, false}
        };
        p["go"] = {
            {std::regex(R"re(^\s*func\s+(\([^)]*\)\s*)?(\w+)\s*\()re"), 2, false}
        };
        p["rust"] = {
            {std::regex(R"re(^\s*(pub(\([^)]*\))?\s+)?(async\s+)?fn\s+(\w+))re"), 4, false}
        };
        std::vector<FunctionPattern> c_like = {
            {std::regex(R"re(^[A-Za-z_][\w:*&<>,\s]*\s[*&]*(\w+(::\w+)*)\s*\([^;]*$)re"), 1, false}
        };
        p["c"] = c_like;
        p["cpp"] = c_like;
        p["php"] = {
            {std::regex(R"re(^\s*((public|private|protected|static)\s+)*function\s+(\w+)\s*\()re"), 3, false}
        };
        p["ruby"] = {
            {std::regex(R"re(^\s*def\s+(self\.)?(\w+[?!]?))re"), 2, true}
        };
        return p;
    }();

    static const std::vector<FunctionPattern> none;
    auto it = patterns.find(language);
    return it != patterns.end() ? it->second : none;
}

bool isControlKeyword(const std::string& name) {
    static const std::set<std::string> keywords = {
        "if", "for", "while", "switch", "catch", "return", "new", "else", "sizeof", "do"
    };
    return keywords.count(name) > 0;
}

size_t countParameters(const std::string& line) {
    auto open = line.find('(');
    auto close = line.find(')', open == std::string::npos ? 0 : open);
    if (open == std::string::npos || close == std::string::npos) {
        return 0;
    }
    std::string params = text::trim(line.substr(open + 1, close - open - 1));
    if (params.empty() || params == "void") {
        return 0;
    }

    size_t count = 0;
    size_t start = 0;
    while (start <= params.size()) {
        size_t comma = params.find(',', start);
        std::string param = text::trim(params.substr(start, comma == std::string::npos ? std::string::npos : comma - start));
        if (!param.empty() && param != "self" && param != "cls" && param != "this" && param != "*") {
            ++count;
        }
        if (comma == std::string::npos) break;
        start = comma + 1;
    }
    return count;
}

size_t findIndentedEnd(const std::vector<std::string>& lines, size_t start) {
    size_t base = text::indentWidth(lines[start]);
    size_t end = start;
    for (size_t i = start + 1; i < lines.size(); ++i) {
        std::string trimmed = text::trim(lines[i]);
        if (trimmed.empty() || text::isCommentLine(lines[i])) {
            continue;
        }
        if (text::indentWidth(lines[i]) <= base) {
            break;
        }
        end = i;
    }
    return end;
}

// Returns start when no body brace shows up within a few lines (a declaration).
size_t findBraceEnd(const std::vector<std::string>& lines, size_t start) {
    int depth = 0;
    bool opened = false;
    for (size_t i = start; i < lines.size(); ++i) {
        for (char c : lines[i]) {
            if (c == '{') {
                ++depth;
                opened = true;
            } else if (c == '}') {
                --depth;
            }
        }
        if (opened && depth <= 0) {
            return i;
        }
        if (!opened && i - start >= 3) {
            return start;
        }
    }
    return opened ? lines.size() - 1 : start;
}

RuleSpec qualityRule(const std::string& rule_id, const std::string& title, common::Severity severity,
                     const std::string& description, const std::string& suggestion) {
    return RuleSpec{rule_id, title, severity, CATEGORY, description, suggestion, {}};
}

}

std::string CodeQualityAnalyzer::id() const {
    return constants::analyzers::CODE_QUALITY;
}

std::string CodeQualityAnalyzer::description() const {
    return "Function length and complexity, duplication, nesting and maintainability markers";
}

std::vector<std::string> CodeQualityAnalyzer::supportedLanguages() const {
    return {"python", "javascript", "typescript", "java", "csharp", "kotlin", "go", "rust",
            "c", "cpp", "php", "ruby"};
}

std::vector<FunctionSpan> CodeQualityAnalyzer::findFunctions(const std::vector<std::string>& lines,
                                                              const std::string& language) {
    std::vector<FunctionSpan> spans;
    const auto& patterns = patternsFor(text::toLower(language));

    for (size_t i = 0; i < lines.size(); ++i) {
        if (!text::scannable(lines[i])) continue;
        for (const auto& candidate : patterns) {
            std::smatch match;
            if (!std::regex_search(lines[i], match, candidate.pattern)) {
                continue;
            }
            std::string name = match[candidate.name_group].str();
            if (name.empty() || isControlKeyword(name)) {
                continue;
            }

            FunctionSpan span;
            span.name = name;
            span.start_line = i;
            span.end_line = candidate.indentation_scoped ? findIndentedEnd(lines, i) : findBraceEnd(lines, i);
            span.parameter_count = countParameters(lines[i]);
            if (!candidate.indentation_scoped && span.end_line == i &&
                lines[i].find('{') == std::string::npos) {
                break;
            }
            spans.push_back(span);
            break;
        }
    }
    return spans;
}

int CodeQualityAnalyzer::functionComplexity(const std::vector<std::string>& lines,
                                            const FunctionSpan& span,
                                            const std::string& language) {
    static const std::vector<std::string> python_words = {"if", "elif", "for", "while", "and", "or", "except", "with"};
    static const std::vector<std::string> brace_words = {"if", "for", "while", "case", "catch"};
    static const std::vector<std::string> operators = {"&&", "||"};

    bool python = text::toLower(language) == "python";
    const auto& words = python ? python_words : brace_words;

    int complexity = 1;
    for (size_t i = span.start_line; i <= span.end_line && i < lines.size(); ++i) {
        if (text::isCommentLine(lines[i])) continue;
        for (const auto& word : words) {
            complexity += static_cast<int>(text::countWord(lines[i], word));
        }
        if (!python) {
            for (const auto& op : operators) {
                for (size_t pos = lines[i].find(op); pos != std::string::npos; pos = lines[i].find(op, pos + 2)) {
                    ++complexity;
                }
            }
        }
    }
    return complexity;
}

Analyzer::Tier1Result CodeQualityAnalyzer::runRules(const common::SourceFile& file,
                                                    const schedule::TaskToken& token) const {
    Tier1Result result;
    auto lines = text::splitLines(file.content);

    checkFunctions(file, lines, result);
    token.checkpoint();
    checkLineLevel(file, lines, result);
    token.checkpoint();
    checkDuplication(file, lines, token, result);

    return result;
}

void CodeQualityAnalyzer::checkFunctions(const common::SourceFile& file, const std::vector<std::string>& lines,
                                         Tier1Result& result) const {
    auto functions = findFunctions(lines, file.language);

    size_t longest = 0;
    int most_complex = 0;

    for (const auto& fn : functions) {
        int line = static_cast<int>(fn.start_line + 1);
        longest = std::max(longest, fn.length());

        if (fn.length() > thresholds_.max_function_lines) {
            auto severity = fn.length() > thresholds_.max_function_lines * 2
                ? common::Severity::HIGH : common::Severity::MEDIUM;
            result.findings.push_back(makeFinding(
                qualityRule("CQ001", "Long function: " + fn.name, severity,
                            "'" + fn.name + "' spans " + std::to_string(fn.length()) + " lines",
                            "Split the function into smaller units with a single responsibility"),
                file, line, lines[fn.start_line]));
        }

        int complexity = functionComplexity(lines, fn, file.language);
        most_complex = std::max(most_complex, complexity);
        if (complexity > thresholds_.complexity_high) {
            auto severity = complexity > thresholds_.complexity_critical
                ? common::Severity::CRITICAL : common::Severity::HIGH;
            result.findings.push_back(makeFinding(
                qualityRule("CQ002", "High cyclomatic complexity: " + fn.name, severity,
                            "'" + fn.name + "' has an estimated complexity of " + std::to_string(complexity),
                            "Extract branches into helpers or replace conditionals with lookup tables"),
                file, line, lines[fn.start_line]));
        }

        if (fn.parameter_count > thresholds_.max_parameters) {
            result.findings.push_back(makeFinding(
                qualityRule("CQ007", "Long parameter list: " + fn.name, common::Severity::MEDIUM,
                            "'" + fn.name + "' takes " + std::to_string(fn.parameter_count) + " parameters",
                            "Group related parameters into a struct or options object"),
                file, line, lines[fn.start_line]));
        }
    }

    result.metrics["functions"] = static_cast<double>(functions.size());
    result.metrics["max_function_length"] = static_cast<double>(longest);
    result.metrics["max_complexity"] = static_cast<double>(most_complex);
}

void CodeQualityAnalyzer::checkLineLevel(const common::SourceFile& file, const std::vector<std::string>& lines,
                                         Tier1Result& result) const {
    static const std::regex marker(R"re(\b(TODO|FIXME|HACK|XXX)\b)re");
    static const std::regex dead_branch(R"re(\bif\s*\(?\s*(false|False|0|None|null)\s*\)?\s*[:{]?\s*$)re");
    static const RuleSpec marker_rule = qualityRule(
        "CQ004", "Unresolved work marker", common::Severity::INFO,
        "TODO/FIXME style marker left in code", "Resolve the marker or track it in the issue tracker");
    static const RuleSpec dead_rule = qualityRule(
        "CQ008", "Unreachable branch", common::Severity::MEDIUM,
        "Condition is constant false so the branch never runs", "Delete the dead branch");

    size_t long_lines = 0;
    int first_long_line = 0;
    size_t nesting_unit = text::toLower(file.language) == "python" ? 4 : 2;
    bool nesting_reported = false;

    for (size_t i = 0; i < lines.size(); ++i) {
        const auto& line = lines[i];
        int line_number = static_cast<int>(i + 1);

        if (line.size() > thresholds_.max_line_length) {
            if (long_lines == 0) first_long_line = line_number;
            ++long_lines;
        }

        std::smatch match;
        if (text::scannable(line)) {
            if (std::regex_search(line, match, marker)) {
                RuleSpec rule = marker_rule;
                rule.title = "Unresolved " + match[1].str() + " marker";
                result.findings.push_back(makeFinding(rule, file, line_number, line));
            }
            if (std::regex_search(line, dead_branch)) {
                result.findings.push_back(makeFinding(dead_rule, file, line_number, line));
            }
        }

        if (!nesting_reported && !text::trim(line).empty() && !text::isCommentLine(line) &&
            text::indentWidth(line) / nesting_unit > thresholds_.max_nesting_depth + 1) {
            result.findings.push_back(makeFinding(
                qualityRule("CQ006", "Deep nesting", common::Severity::MEDIUM,
                            "Code is nested more than " + std::to_string(thresholds_.max_nesting_depth) + " levels deep",
                            "Use guard clauses and early returns to flatten the structure"),
                file, line_number, line));
            nesting_reported = true;
        }
    }

    if (long_lines > 0) {
        result.findings.push_back(makeFinding(
            qualityRule("CQ003", "Long lines", common::Severity::INFO,
                        std::to_string(long_lines) + " lines exceed " +
                            std::to_string(thresholds_.max_line_length) + " characters",
                        "Wrap long expressions or run a formatter"),
            file, first_long_line, lines[static_cast<size_t>(first_long_line - 1)]));
    }
    result.metrics["long_lines"] = static_cast<double>(long_lines);
}

void CodeQualityAnalyzer::checkDuplication(const common::SourceFile& file, const std::vector<std::string>& lines,
                                           const schedule::TaskToken& token, Tier1Result& result) const {
    const size_t window = thresholds_.duplicate_window;

    // Significant lines only, remembering where they came from.
    std::vector<std::string> normalized;
    std::vector<size_t> origin;
    for (size_t i = 0; i < lines.size(); ++i) {
        std::string trimmed = text::trim(lines[i]);
        if (trimmed.size() < 4 || text::isCommentLine(lines[i]) || trimmed == "}" || trimmed == "};") {
            continue;
        }
        normalized.push_back(trimmed);
        origin.push_back(i);
    }
    if (normalized.size() < window * 2) {
        result.metrics["duplicate_blocks"] = 0.0;
        return;
    }

    std::map<std::string, size_t> first_seen;
    size_t duplicates = 0;
    size_t skip_until = 0;

    for (size_t i = 0; i + window <= normalized.size(); ++i) {
        if (i % 512 == 0) {
            token.checkpoint();
        }
        std::string key;
        for (size_t k = 0; k < window; ++k) {
            key += normalized[i + k];
            key += '\n';
        }

        auto [it, inserted] = first_seen.emplace(key, i);
        if (inserted || i < skip_until || i < it->second + window) {
            continue;
        }

        int line = static_cast<int>(origin[i] + 1);
        int original_line = static_cast<int>(origin[it->second] + 1);
        result.findings.push_back(makeFinding(
            qualityRule("CQ005", "Duplicated code block", common::Severity::MEDIUM,
                        std::to_string(window) + "+ lines repeat the block at line " + std::to_string(original_line),
                        "Extract the shared logic into a function"),
            file, line, lines[origin[i]]));
        ++duplicates;
        skip_until = i + window;
    }
    result.metrics["duplicate_blocks"] = static_cast<double>(duplicates);
}

}}
