#pragma once

#include "analyzer.hpp"
#include <string>
#include <vector>

namespace code_sentinel {
namespace analyzer {

struct FunctionSpan {
    std::string name;
    // 0-based, inclusive.
    size_t start_line = 0;
    size_t end_line = 0;
    size_t parameter_count = 0;

    size_t length() const { return end_line - start_line + 1; }
};

struct CodeQualityThresholds {
    size_t max_function_lines = 50;
    int complexity_high = 20;
    int complexity_critical = 30;
    size_t max_line_length = 120;
    size_t max_parameters = 5;
    size_t max_nesting_depth = 5;
    size_t duplicate_window = 6;
};

class CodeQualityAnalyzer : public Analyzer {
public:
    CodeQualityAnalyzer() = default;
    explicit CodeQualityAnalyzer(CodeQualityThresholds thresholds) : thresholds_(thresholds) {}

    std::string id() const override;
    std::string description() const override;
    std::vector<std::string> supportedLanguages() const override;

    static std::vector<FunctionSpan> findFunctions(const std::vector<std::string>& lines,
                                                   const std::string& language);
    static int functionComplexity(const std::vector<std::string>& lines,
                                  const FunctionSpan& span,
                                  const std::string& language);

protected:
    Tier1Result runRules(const common::SourceFile& file, const schedule::TaskToken& token) const override;

private:
    CodeQualityThresholds thresholds_;

    void checkFunctions(const common::SourceFile& file, const std::vector<std::string>& lines,
                        Tier1Result& result) const;
    void checkLineLevel(const common::SourceFile& file, const std::vector<std::string>& lines,
                        Tier1Result& result) const;
    void checkDuplication(const common::SourceFile& file, const std::vector<std::string>& lines,
                          const schedule::TaskToken& token, Tier1Result& result) const;
};

}}
