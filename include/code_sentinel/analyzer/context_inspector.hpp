#pragma once

#include "deep_inspector.hpp"
#include <string>
#include <vector>

namespace code_sentinel {
namespace analyzer {

// Re-reads the file around each tier-1 finding to weed out matches in
// comments, placeholder secrets and test fixtures, then traces untrusted
// input into dangerous sinks further down the file.
class ContextInspector : public DeepInspector {
public:
    std::string name() const override { return "context"; }

    DeepInspection inspect(const common::SourceFile& file,
                           const std::vector<common::Finding>& tier1_findings,
                           const schedule::TaskToken& token) const override;

    static bool isTestPath(const std::string& path);

    // 0.9 within 15 lines of the source, 0.75 within 50, 0.5 beyond.
    static double taintConfidence(int distance);

private:
    bool isFalsePositive(const common::SourceFile& file,
                         const std::vector<std::string>& lines,
                         const common::Finding& finding) const;

    std::vector<common::Finding> traceTaint(const common::SourceFile& file,
                                            const std::vector<std::string>& lines,
                                            const schedule::TaskToken& token) const;
};

}}
