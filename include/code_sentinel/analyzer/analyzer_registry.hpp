#pragma once

#include "analyzer.hpp"
#include <functional>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace code_sentinel {
namespace analyzer {

using AnalyzerFactory = std::function<std::shared_ptr<Analyzer>()>;

class AnalyzerRegistry {
public:
    // Registry pre-populated with the built-in analyzers.
    static AnalyzerRegistry withBuiltins();

    void add(const std::string& id, AnalyzerFactory factory);

    bool contains(const std::string& id) const;

    // Throws ConfigurationError for an unknown id.
    std::shared_ptr<Analyzer> create(const std::string& id, bool with_deep_tier = false) const;

    // Created in id order so task construction is stable.
    std::vector<std::shared_ptr<Analyzer>> createAll(const std::set<std::string>& ids,
                                                     bool with_deep_tier = false) const;

    std::vector<std::string> knownIds() const;
    std::vector<AnalyzerInfo> describeAll() const;

private:
    std::map<std::string, AnalyzerFactory> factories_;
};

}}
