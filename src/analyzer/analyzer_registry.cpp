#include "code_sentinel/analyzer/analyzer_registry.hpp"
#include "code_sentinel/analyzer/best_practices_analyzer.hpp"
#include "code_sentinel/analyzer/code_quality_analyzer.hpp"
#include "code_sentinel/analyzer/context_inspector.hpp"
#include "code_sentinel/analyzer/dependency_analyzer.hpp"
#include "code_sentinel/analyzer/performance_analyzer.hpp"
#include "code_sentinel/analyzer/security_analyzer.hpp"
#include "code_sentinel/common/constants.hpp"
#include "code_sentinel/common/logger.hpp"
#include "code_sentinel/core/errors.hpp"

namespace code_sentinel {
namespace analyzer {

AnalyzerRegistry AnalyzerRegistry::withBuiltins() {
    AnalyzerRegistry registry;
    registry.add(constants::analyzers::SECURITY, [] { return std::make_shared<SecurityAnalyzer>(); });
    registry.add(constants::analyzers::DEPENDENCY, [] { return std::make_shared<DependencyAnalyzer>(); });
    registry.add(constants::analyzers::CODE_QUALITY, [] { return std::make_shared<CodeQualityAnalyzer>(); });
    registry.add(constants::analyzers::PERFORMANCE, [] { return std::make_shared<PerformanceAnalyzer>(); });
    registry.add(constants::analyzers::BEST_PRACTICES, [] { return std::make_shared<BestPracticesAnalyzer>(); });
    return registry;
}

void AnalyzerRegistry::add(const std::string& id, AnalyzerFactory factory) {
    factories_[id] = std::move(factory);
}

bool AnalyzerRegistry::contains(const std::string& id) const {
    return factories_.count(id) > 0;
}

std::shared_ptr<Analyzer> AnalyzerRegistry::create(const std::string& id, bool with_deep_tier) const {
    auto it = factories_.find(id);
    if (it == factories_.end()) {
        core::ErrorContext context;
        context.component = "AnalyzerRegistry";
        context.details["analyzer"] = id;
        throw core::ConfigurationError(core::CoreErrorCode::CONFIG_UNKNOWN_ANALYZER,
                                       "Unknown analyzer: " + id, context);
    }

    auto analyzer = it->second();
    if (with_deep_tier && !analyzer->deepInspector()) {
        analyzer->setDeepInspector(std::make_shared<ContextInspector>());
    }
    return analyzer;
}

std::vector<std::shared_ptr<Analyzer>> AnalyzerRegistry::createAll(const std::set<std::string>& ids,
                                                                   bool with_deep_tier) const {
    std::vector<std::shared_ptr<Analyzer>> analyzers;
    analyzers.reserve(ids.size());
    for (const auto& id : ids) {
        analyzers.push_back(create(id, with_deep_tier));
    }
    common::Logger::instance().debug("[AnalyzerRegistry] Created analyzers | count={} | deep_tier={}",
                                     analyzers.size(), with_deep_tier);
    return analyzers;
}

std::vector<std::string> AnalyzerRegistry::knownIds() const {
    std::vector<std::string> ids;
    for (const auto& entry : factories_) {
        ids.push_back(entry.first);
    }
    return ids;
}

std::vector<AnalyzerInfo> AnalyzerRegistry::describeAll() const {
    std::vector<AnalyzerInfo> infos;
    for (const auto& entry : factories_) {
        infos.push_back(entry.second()->info());
    }
    return infos;
}

}}
