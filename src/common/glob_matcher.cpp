#include "code_sentinel/common/glob_matcher.hpp"
#include "code_sentinel/common/logger.hpp"

namespace code_sentinel {
namespace common {

GlobMatcher::GlobMatcher(const std::vector<std::string>& patterns) {
    for (const auto& pattern : patterns) {
        if (pattern.empty()) {
            continue;
        }
        try {
            compiled_.emplace_back(toRegex(pattern), std::regex::ECMAScript | std::regex::optimize);
        } catch (const std::regex_error& e) {
            rejected_.push_back(pattern);
            Logger::instance().warn("[Glob] Invalid pattern | pattern={} | error={}", pattern, e.what());
        }
    }
}

std::string GlobMatcher::toRegex(const std::string& glob) {
    std::string result;
    result.reserve(glob.size() * 2);

    for (size_t i = 0; i < glob.size(); ++i) {
        char c = glob[i];
        switch (c) {
            case '*':
                result += ".*";
                break;
            case '?':
                result += ".";
                break;
            case '[': {
                size_t close = glob.find(']', i + 1);
                if (close == std::string::npos) {
                    result += "\\[";
                    break;
                }
                std::string body = glob.substr(i + 1, close - i - 1);
                if (!body.empty() && body[0] == '!') {
                    body[0] = '^';
                }
                result += "[" + body + "]";
                i = close;
                break;
            }
            case '.': case '+': case '(': case ')': case '{': case '}':
            case '^': case '$': case '|': case '\\': case ']':
                result += '\\';
                result += c;
                break;
            default:
                result += c;
        }
    }
    return result;
}

bool GlobMatcher::matches(const std::string& path) const {
    if (compiled_.empty() || path.empty()) {
        return false;
    }

    std::vector<std::string> candidates{path};
    for (size_t pos = path.find('/'); pos != std::string::npos; pos = path.find('/', pos + 1)) {
        if (pos + 1 < path.size()) {
            candidates.push_back(path.substr(pos + 1));
        }
    }

    for (const auto& regex : compiled_) {
        for (const auto& candidate : candidates) {
            if (std::regex_match(candidate, regex)) {
                return true;
            }
        }
    }
    return false;
}

}}
