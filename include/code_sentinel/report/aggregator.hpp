#pragma once

#include "report.hpp"
#include "../common/config.hpp"
#include <string>
#include <tuple>
#include <vector>

namespace code_sentinel {
namespace report {

// (lowercase title, file path, category, line bucket). Findings without a
// line share bucket -1.
using DedupKey = std::tuple<std::string, std::string, std::string, long>;

class ResultAggregator {
public:
    explicit ResultAggregator(common::ScoringConfig scoring);

    // Depends only on the multiset of outcomes: input order and repeated
    // calls do not change the result.
    Report aggregate(const std::vector<common::Outcome>& outcomes, const RunContext& context) const;

    static DedupKey dedupKey(const common::Finding& finding);

    int score(const std::vector<ReportIssue>& issues) const;
    std::string grade(int score) const;

    const common::ScoringConfig& scoring() const { return scoring_; }

private:
    common::ScoringConfig scoring_;

    std::vector<ReportIssue> deduplicate(const std::vector<const common::Outcome*>& outcomes,
                                         size_t& dropped) const;
    std::vector<std::string> recommendations(const Summary& summary) const;
    std::vector<ProblemFile> topFiles(const std::vector<ReportIssue>& issues) const;
};

}}
