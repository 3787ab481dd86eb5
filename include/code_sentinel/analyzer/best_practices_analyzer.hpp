#pragma once

#include "analyzer.hpp"
#include <string>
#include <vector>

namespace code_sentinel {
namespace analyzer {

class BestPracticesAnalyzer : public Analyzer {
public:
    std::string id() const override;
    std::string description() const override;
    std::vector<std::string> supportedLanguages() const override;

protected:
    Tier1Result runRules(const common::SourceFile& file, const schedule::TaskToken& token) const override;

private:
    void checkPython(const common::SourceFile& file, const std::vector<std::string>& lines,
                     Tier1Result& result) const;
    void checkBraceLanguage(const common::SourceFile& file, const std::vector<std::string>& lines,
                            Tier1Result& result) const;
    void checkDebugOutput(const common::SourceFile& file, const std::vector<std::string>& lines,
                          Tier1Result& result) const;
};

}}
