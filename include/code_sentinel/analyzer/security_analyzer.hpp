#pragma once

#include "analyzer.hpp"
#include <regex>

namespace code_sentinel {
namespace analyzer {

class SecurityAnalyzer : public Analyzer {
public:
    SecurityAnalyzer();

    std::string id() const override;
    std::string version() const override { return "1.2.0"; }
    std::string description() const override;
    std::vector<std::string> supportedLanguages() const override;

    static bool isPlaceholderValue(const std::string& value);

protected:
    Tier1Result runRules(const common::SourceFile& file, const schedule::TaskToken& token) const override;

private:
    struct SecretPattern {
        RuleSpec rule;
        std::regex pattern;
        // Capture group holding the secret value; 0 for the whole match.
        size_t value_group;
    };

    struct VulnerabilityPattern {
        RuleSpec rule;
        std::vector<std::regex> patterns;
    };

    std::vector<SecretPattern> secret_patterns_;
    std::vector<VulnerabilityPattern> vulnerability_patterns_;

    void scanDockerfile(const common::SourceFile& file,
                        const std::vector<std::string>& lines,
                        std::vector<common::Finding>& findings) const;
};

}}
