#pragma once

#include <string>
#include <vector>
#include <regex>

namespace code_sentinel {
namespace common {

// Shell-style patterns: '*' spans any characters including '/', '?' one
// character, [...] a character class. A path matches when the whole path or
// any suffix starting after a '/' matches.
class GlobMatcher {
public:
    explicit GlobMatcher(const std::vector<std::string>& patterns);

    bool matches(const std::string& path) const;

    size_t patternCount() const { return compiled_.size(); }
    const std::vector<std::string>& rejectedPatterns() const { return rejected_; }

    static std::string toRegex(const std::string& glob);

private:
    std::vector<std::regex> compiled_;
    std::vector<std::string> rejected_;
};

}}
