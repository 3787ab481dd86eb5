#include "code_sentinel/analyzer/best_practices_analyzer.hpp"
#include "code_sentinel/analyzer/context_inspector.hpp"
#include "code_sentinel/analyzer/text_utils.hpp"
#include "code_sentinel/common/constants.hpp"
#include <regex>

namespace code_sentinel {
namespace analyzer {

namespace {

constexpr const char* CATEGORY = "best_practices";

RuleSpec practiceRule(const std::string& rule_id, const std::string& title, common::Severity severity,
                      const std::string& description, const std::string& suggestion) {
    return RuleSpec{rule_id, title, severity, CATEGORY, description, suggestion, {}};
}

// Next line that is neither blank nor a comment, or lines.size().
size_t nextCodeLine(const std::vector<std::string>& lines, size_t from) {
    for (size_t i = from; i < lines.size(); ++i) {
        if (!text::trim(lines[i]).empty() && !text::isCommentLine(lines[i])) {
            return i;
        }
    }
    return lines.size();
}

}

std::string BestPracticesAnalyzer::id() const {
    return constants::analyzers::BEST_PRACTICES;
}

std::string BestPracticesAnalyzer::description() const {
    return "Exception handling, mutable defaults, leftover debug output and global state";
}

std::vector<std::string> BestPracticesAnalyzer::supportedLanguages() const {
    return {"python", "javascript", "typescript", "java", "csharp", "kotlin", "php", "ruby", "go"};
}

Analyzer::Tier1Result BestPracticesAnalyzer::runRules(const common::SourceFile& file,
                                                      const schedule::TaskToken& token) const {
    Tier1Result result;
    auto lines = text::splitLines(file.content);

    if (text::toLower(file.language) == "python") {
        checkPython(file, lines, result);
    } else {
        checkBraceLanguage(file, lines, result);
    }
    token.checkpoint();

    if (!ContextInspector::isTestPath(file.path)) {
        checkDebugOutput(file, lines, result);
    }
    return result;
}

void BestPracticesAnalyzer::checkPython(const common::SourceFile& file, const std::vector<std::string>& lines,
                                        Tier1Result& result) const {
    static const std::regex bare_except(R"re(^\s*except\s*:)re");
    static const std::regex broad_except(R"re(^\s*except\s+(Exception|BaseException)(\s+as\s+\w+)?\s*:)re");
    static const std::regex any_except(R"re(^\s*except\b)re");
    static const std::regex mutable_default(R"re(def\s+\w+\s*\([^)]*=\s*(\[\]|\{\}|list\(\)|dict\(\)|set\(\)))re");
    static const std::regex global_statement(R"re(^\s*global\s+\w+)re");
    static const std::regex star_import(R"re(^\s*from\s+\S+\s+import\s+\*)re");
    static const std::regex unmanaged_open(R"re(^\s*\w+\s*=\s*open\s*\()re");

    static const RuleSpec bare = practiceRule(
        "BP001", "Bare except clause", common::Severity::HIGH,
        "Catches every exception including SystemExit and KeyboardInterrupt",
        "Catch the specific exceptions the block can handle");
    static const RuleSpec swallowed = practiceRule(
        "BP002", "Exception silently swallowed", common::Severity::MEDIUM,
        "Handler discards the error without logging or re-raising",
        "Log the exception or handle it explicitly");
    static const RuleSpec broad = practiceRule(
        "BP003", "Broad exception handler", common::Severity::MEDIUM,
        "Catching Exception hides unrelated failures",
        "Catch narrower exception types where possible");
    static const RuleSpec mutable_arg = practiceRule(
        "BP004", "Mutable default argument", common::Severity::HIGH,
        "Default value is shared between calls",
        "Default to None and create the container inside the function");
    static const RuleSpec global_state = practiceRule(
        "BP005", "Global mutable state", common::Severity::MEDIUM,
        "Function rebinds module-level state with a global statement",
        "Pass state explicitly or encapsulate it in a class");
    static const RuleSpec wildcard = practiceRule(
        "BP006", "Wildcard import", common::Severity::MEDIUM,
        "import * pollutes the namespace and hides where names come from",
        "Import the names you use explicitly");
    static const RuleSpec no_context = practiceRule(
        "BP007", "File opened without context manager", common::Severity::MEDIUM,
        "File handle may leak if an exception occurs before close()",
        "Use 'with open(...) as f:'");

    for (size_t i = 0; i < lines.size(); ++i) {
        const auto& line = lines[i];
        if (!text::scannable(line) || text::isCommentLine(line)) continue;
        int line_number = static_cast<int>(i + 1);

        bool is_bare = std::regex_search(line, bare_except);
        if (is_bare) {
            result.findings.push_back(makeFinding(bare, file, line_number, line));
        } else if (std::regex_search(line, broad_except)) {
            result.findings.push_back(makeFinding(broad, file, line_number, line));
        }

        if (std::regex_search(line, any_except)) {
            size_t next = nextCodeLine(lines, i + 1);
            if (next < lines.size() && text::trim(lines[next]) == "pass") {
                result.findings.push_back(makeFinding(swallowed, file, line_number, line));
            }
        }

        if (std::regex_search(line, mutable_default)) {
            result.findings.push_back(makeFinding(mutable_arg, file, line_number, line));
        }
        if (std::regex_search(line, global_statement)) {
            result.findings.push_back(makeFinding(global_state, file, line_number, line));
        }
        if (std::regex_search(line, star_import)) {
            result.findings.push_back(makeFinding(wildcard, file, line_number, line));
        }
        if (std::regex_search(line, unmanaged_open)) {
            result.findings.push_back(makeFinding(no_context, file, line_number, line, 0.7));
        }
    }
}

void BestPracticesAnalyzer::checkBraceLanguage(const common::SourceFile& file, const std::vector<std::string>& lines,
                                               Tier1Result& result) const {
    static const std::regex catch_open(R"re(\bcatch\s*(\([^)]*\))?\s*\{\s*(\}\s*)?$)re");
    static const std::regex inline_empty_catch(R"re(\bcatch\s*(\([^)]*\))?\s*\{\s*\})re");
    static const std::regex catch_all(R"re(\bcatch\s*\(\s*(Exception|Throwable|\.\.\.)(\s+\w+)?\s*\))re");
    static const std::regex var_declaration(R"re(^\s*var\s+\w+)re");
    static const std::regex window_global(R"re(\bwindow\.\w+\s*=[^=])re");

    static const RuleSpec empty_catch = practiceRule(
        "BP002", "Exception silently swallowed", common::Severity::MEDIUM,
        "Empty catch block discards the error",
        "Log the error or handle it explicitly");
    static const RuleSpec broad = practiceRule(
        "BP003", "Broad exception handler", common::Severity::MEDIUM,
        "Catch-all handler hides unrelated failures",
        "Catch narrower exception types where possible");
    static const RuleSpec global_state = practiceRule(
        "BP005", "Global mutable state", common::Severity::MEDIUM,
        "Value attached to the global object",
        "Keep state in a module or pass it explicitly");
    static const RuleSpec var_usage = practiceRule(
        "BP008", "Function-scoped var declaration", common::Severity::LOW,
        "var is hoisted and function scoped",
        "Use const or let");

    std::string language = text::toLower(file.language);
    bool javascript = language == "javascript" || language == "typescript";

    for (size_t i = 0; i < lines.size(); ++i) {
        const auto& line = lines[i];
        if (!text::scannable(line) || text::isCommentLine(line)) continue;
        int line_number = static_cast<int>(i + 1);

        if (std::regex_search(line, inline_empty_catch)) {
            result.findings.push_back(makeFinding(empty_catch, file, line_number, line));
        } else if (std::regex_search(line, catch_open)) {
            size_t next = nextCodeLine(lines, i + 1);
            if (next < lines.size() && text::startsWith(text::trim(lines[next]), "}")) {
                result.findings.push_back(makeFinding(empty_catch, file, line_number, line));
            }
        }

        if (std::regex_search(line, catch_all)) {
            result.findings.push_back(makeFinding(broad, file, line_number, line));
        }

        if (javascript) {
            if (std::regex_search(line, var_declaration)) {
                result.findings.push_back(makeFinding(var_usage, file, line_number, line));
            }
            if (std::regex_search(line, window_global)) {
                result.findings.push_back(makeFinding(global_state, file, line_number, line));
            }
        }
    }
}

void BestPracticesAnalyzer::checkDebugOutput(const common::SourceFile& file, const std::vector<std::string>& lines,
                                             Tier1Result& result) const {
    static const std::regex python_debug(R"re(^\s*(print\s*\(|pprint\s*\(|breakpoint\s*\(\)|import\s+pdb|pdb\.set_trace\s*\())re");
    static const std::regex script_debug(R"re(\bconsole\.(log|debug|trace)\s*\(|^\s*debugger\s*;?\s*$)re");
    static const std::regex jvm_debug(R"re(System\.(out|err)\.print(ln)?\s*\(|\.printStackTrace\s*\(\s*\))re");
    static const std::regex other_debug(R"re(\b(var_dump|print_r|dd)\s*\(|^\s*(p|pp|puts)\s+\w|\bfmt\.Print(ln|f)?\s*\()re");

    static const RuleSpec debug_output = practiceRule(
        "BP009", "Leftover debug output", common::Severity::LOW,
        "Debug print or breakpoint left in code",
        "Use the project logger or remove the statement");

    std::string language = text::toLower(file.language);
    const std::regex* pattern = &other_debug;
    if (language == "python") {
        pattern = &python_debug;
    } else if (language == "javascript" || language == "typescript") {
        pattern = &script_debug;
    } else if (language == "java" || language == "kotlin" || language == "csharp") {
        pattern = &jvm_debug;
    }

    size_t count = 0;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (!text::scannable(lines[i]) || text::isCommentLine(lines[i])) continue;
        if (std::regex_search(lines[i], *pattern)) {
            result.findings.push_back(makeFinding(debug_output, file, static_cast<int>(i + 1), lines[i]));
            ++count;
        }
    }
    result.metrics["debug_statements"] = static_cast<double>(count);
}

}}
