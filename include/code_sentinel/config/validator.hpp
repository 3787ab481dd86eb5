#pragma once

#include "../common/config.hpp"
#include <set>
#include <string>
#include <vector>

namespace code_sentinel {
namespace config {

struct ValidationResult {
    bool is_valid = true;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;
};

class ConfigValidator {
public:
    // Empty known_analyzers skips the analyzer id check.
    explicit ConfigValidator(std::set<std::string> known_analyzers = {});

    ValidationResult validate(const common::GlobalConfig& config) const;
    ValidationResult validateFile(const std::string& path) const;

    static bool canCreateDirectory(const std::string& path);

private:
    std::set<std::string> known_analyzers_;

    void validateAnalysis(const common::AnalysisSettings& analysis, ValidationResult& result) const;
    void validateScoring(const common::ScoringConfig& scoring, ValidationResult& result) const;
};

}}
