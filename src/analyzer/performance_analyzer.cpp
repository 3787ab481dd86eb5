#include "code_sentinel/analyzer/performance_analyzer.hpp"
#include "code_sentinel/analyzer/text_utils.hpp"
#include "code_sentinel/common/constants.hpp"
#include <algorithm>
#include <regex>

namespace code_sentinel {
namespace analyzer {

namespace {

constexpr size_t CHECKPOINT_INTERVAL = 256;
constexpr const char* CATEGORY = "performance";

const std::regex& loopHeader() {
    static const std::regex pattern(R"re(^\s*(\}\s*)?(for|while|foreach)\b|\.forEach\s*\(|^\s*loop\s*\{)re");
    return pattern;
}

bool isLoopHeader(const std::string& line) {
    return text::scannable(line) && std::regex_search(line, loopHeader());
}

RuleSpec performanceRule(const std::string& rule_id, const std::string& title, common::Severity severity,
                         const std::string& description, const std::string& suggestion) {
    return RuleSpec{rule_id, title, severity, CATEGORY, description, suggestion, {}};
}

bool isBlank(const std::string& line) {
    return text::trim(line).empty();
}

}

std::string PerformanceAnalyzer::id() const {
    return constants::analyzers::PERFORMANCE;
}

std::string PerformanceAnalyzer::description() const {
    return "Nested loops, queries and allocations inside loops, unbounded queries";
}

std::vector<std::string> PerformanceAnalyzer::supportedLanguages() const {
    return {"python", "javascript", "typescript", "java", "csharp", "kotlin", "go", "rust",
            "c", "cpp", "php", "ruby"};
}

std::vector<size_t> PerformanceAnalyzer::loopDepths(const std::vector<std::string>& lines) {
    std::vector<size_t> depths(lines.size(), 0);
    std::vector<size_t> open_loops;

    for (size_t i = 0; i < lines.size(); ++i) {
        if (isBlank(lines[i])) {
            depths[i] = open_loops.size();
            continue;
        }
        size_t indent = text::indentWidth(lines[i]);
        std::string trimmed = text::trim(lines[i]);

        while (!open_loops.empty() && open_loops.back() >= indent) {
            // A closing brace at the loop's own indentation still belongs to it.
            if (open_loops.back() == indent && text::startsWith(trimmed, "}") &&
                !isLoopHeader(lines[i])) {
                break;
            }
            open_loops.pop_back();
        }
        depths[i] = open_loops.size();

        if (text::startsWith(trimmed, "}") && !open_loops.empty() && open_loops.back() == indent) {
            open_loops.pop_back();
            continue;
        }
        if (!text::isCommentLine(lines[i]) && isLoopHeader(lines[i])) {
            open_loops.push_back(indent);
        }
    }
    return depths;
}

Analyzer::Tier1Result PerformanceAnalyzer::runRules(const common::SourceFile& file,
                                                    const schedule::TaskToken& token) const {
    static const std::regex query_call(R"re(\.(query|execute|executemany|find|fetchone|fetchall)\s*\()re");
    static const std::regex string_append(R"re(\w+\s*\+=\s*(["'`]|f["']|str\(|String\.valueOf|to_string))re");
    static const std::regex regex_compile(R"re(re\.compile\s*\(|new\s+RegExp\s*\(|Pattern\.compile\s*\(|regexp\.MustCompile\s*\(|std::regex\s+\w+\s*\(|Regex::new\s*\()re");
    static const std::regex backtracking(R"re(\(\.\*\)[+*]|\(\.\+\)[+*])re");
    static const std::regex select_star(R"re(SELECT\s+\*\s+FROM)re", std::regex::icase);
    static const std::regex file_open(R"re(\bopen\s*\(|new\s+File(Reader|InputStream)?\s*\(|fopen\s*\(|os\.Open\s*\(|File::open\s*\()re");
    static const std::regex list_membership(R"re(\bin\s+\[[^\]]*,[^\]]*,[^\]]*,[^\]]*\])re");

    static const RuleSpec nested_loop = performanceRule(
        "PERF001", "Nested loops", common::Severity::HIGH,
        "Loop nested inside another loop, quadratic complexity",
        "Evaluate whether a hash map, set or precomputed index removes the inner loop");
    static const RuleSpec deeply_nested_loop = performanceRule(
        "PERF001", "Nested loops", common::Severity::CRITICAL,
        "Loops nested three or more levels deep, cubic complexity or worse",
        "Restructure the algorithm or use more efficient data structures");
    static const RuleSpec query_in_loop = performanceRule(
        "PERF002", "Query inside loop", common::Severity::CRITICAL,
        "Database or remote query issued once per iteration (N+1 pattern)",
        "Batch the lookups, use a join, or eager-load the related records");
    static const RuleSpec concat_in_loop = performanceRule(
        "PERF003", "String concatenation in loop", common::Severity::HIGH,
        "Repeated string concatenation copies the accumulated value each iteration",
        "Collect parts and join once, or use a string builder");
    static const RuleSpec regex_in_loop = performanceRule(
        "PERF004", "Regex compiled inside loop", common::Severity::MEDIUM,
        "Regular expression is recompiled on every iteration",
        "Compile the pattern once outside the loop");
    static const RuleSpec slow_regex = performanceRule(
        "PERF005", "Catastrophic backtracking risk", common::Severity::MEDIUM,
        "Nested quantifiers can make matching time exponential",
        "Simplify the pattern or use possessive or non-greedy quantifiers");
    static const RuleSpec select_all = performanceRule(
        "PERF006", "SELECT * query", common::Severity::MEDIUM,
        "Query fetches every column",
        "Select only the columns the caller needs");
    static const RuleSpec open_in_loop = performanceRule(
        "PERF007", "File opened inside loop", common::Severity::HIGH,
        "File handle opened on every iteration",
        "Open the file once outside the loop or batch the operations");
    static const RuleSpec list_lookup = performanceRule(
        "PERF008", "Membership test against list literal", common::Severity::MEDIUM,
        "Linear scan on each membership test",
        "Use a set for membership checks");

    Tier1Result result;
    auto lines = text::splitLines(file.content);
    auto depths = loopDepths(lines);
    bool python = text::toLower(file.language) == "python";

    size_t nested_loops = 0;
    size_t max_depth = 0;

    for (size_t i = 0; i < lines.size(); ++i) {
        if (i % CHECKPOINT_INTERVAL == 0) {
            token.checkpoint();
        }
        const auto& line = lines[i];
        if (isBlank(line) || !text::scannable(line) || text::isCommentLine(line)) {
            continue;
        }
        int line_number = static_cast<int>(i + 1);
        size_t depth = depths[i];
        bool in_loop = depth > 0;
        bool is_loop = isLoopHeader(line);

        if (is_loop) {
            max_depth = std::max(max_depth, depth + 1);
            if (depth >= 2) {
                result.findings.push_back(makeFinding(deeply_nested_loop, file, line_number, line));
                ++nested_loops;
            } else if (depth == 1) {
                result.findings.push_back(makeFinding(nested_loop, file, line_number, line));
                ++nested_loops;
            }
        }

        if (in_loop && !is_loop) {
            if (std::regex_search(line, query_call)) {
                result.findings.push_back(makeFinding(query_in_loop, file, line_number, line, 0.8));
            }
            if (std::regex_search(line, string_append)) {
                result.findings.push_back(makeFinding(concat_in_loop, file, line_number, line));
            }
            if (std::regex_search(line, regex_compile)) {
                result.findings.push_back(makeFinding(regex_in_loop, file, line_number, line));
            }
            if (std::regex_search(line, file_open)) {
                result.findings.push_back(makeFinding(open_in_loop, file, line_number, line));
            }
        }

        if (std::regex_search(line, regex_compile) && std::regex_search(line, backtracking)) {
            result.findings.push_back(makeFinding(slow_regex, file, line_number, line));
        }
        if (std::regex_search(line, select_star)) {
            result.findings.push_back(makeFinding(select_all, file, line_number, line));
        }
        if (python && std::regex_search(line, list_membership)) {
            result.findings.push_back(makeFinding(list_lookup, file, line_number, line));
        }
    }

    result.metrics["nested_loops"] = static_cast<double>(nested_loops);
    result.metrics["max_loop_depth"] = static_cast<double>(max_depth);
    return result;
}

}}
