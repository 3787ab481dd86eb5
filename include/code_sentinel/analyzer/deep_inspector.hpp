#pragma once

#include "../common/types.hpp"
#include "../schedule/task_token.hpp"
#include <set>
#include <string>
#include <vector>

namespace code_sentinel {
namespace analyzer {

// Indices refer to positions in the tier-1 finding list passed to inspect().
struct DeepInspection {
    std::set<size_t> confirmed;
    std::set<size_t> false_positives;
    std::vector<common::Finding> findings;
};

// Expensive second tier. Implementations may block; they must call
// token.checkpoint() often enough for the deadline to take effect.
class DeepInspector {
public:
    virtual ~DeepInspector() = default;

    virtual std::string name() const = 0;

    virtual DeepInspection inspect(const common::SourceFile& file,
                                   const std::vector<common::Finding>& tier1_findings,
                                   const schedule::TaskToken& token) const = 0;
};

}}
