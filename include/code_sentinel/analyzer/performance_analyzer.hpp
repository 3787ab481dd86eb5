#pragma once

#include "analyzer.hpp"
#include <string>
#include <vector>

namespace code_sentinel {
namespace analyzer {

class PerformanceAnalyzer : public Analyzer {
public:
    std::string id() const override;
    std::string description() const override;
    std::vector<std::string> supportedLanguages() const override;

    // Loop depth per line, from indentation: 0 outside any loop, 1 for a
    // line inside one loop body, and so on. Loop headers count the loops
    // enclosing them, not themselves.
    static std::vector<size_t> loopDepths(const std::vector<std::string>& lines);

protected:
    Tier1Result runRules(const common::SourceFile& file, const schedule::TaskToken& token) const override;
};

}}
