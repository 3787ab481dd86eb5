#pragma once

#include "analyzer.hpp"
#include <string>
#include <vector>

namespace code_sentinel {
namespace analyzer {

struct DeclaredDependency {
    std::string name;
    std::string version;
    // VCS or URL source, empty for registry packages.
    std::string source;
    int line = 0;
};

class DependencyAnalyzer : public Analyzer {
public:
    std::string id() const override;
    std::string version() const override { return "1.1.0"; }
    std::string description() const override;
    std::vector<std::string> supportedLanguages() const override;

    // Throws AnalyzerError(ANALYZER_MALFORMED_INPUT) when the manifest cannot be parsed.
    static std::vector<DeclaredDependency> parseManifest(const common::SourceFile& file);

protected:
    Tier1Result runRules(const common::SourceFile& file, const schedule::TaskToken& token) const override;

private:
    static std::vector<DeclaredDependency> parseRequirements(const std::string& content);
    static std::vector<DeclaredDependency> parseNpmStyle(const std::string& content, bool composer);
    static std::vector<DeclaredDependency> parseTomlManifest(const common::SourceFile& file, const std::string& kind);
    static std::vector<DeclaredDependency> parseGoMod(const std::string& content);
    static std::vector<DeclaredDependency> parseGemfile(const std::string& content);
    static std::vector<DeclaredDependency> parsePom(const std::string& content);

    void checkInsecureIndexes(const common::SourceFile& file, std::vector<common::Finding>& findings) const;
};

}}
