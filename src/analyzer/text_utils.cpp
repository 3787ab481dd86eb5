#include "code_sentinel/analyzer/text_utils.hpp"
#include "code_sentinel/common/constants.hpp"
#include <algorithm>
#include <cctype>

namespace code_sentinel {
namespace analyzer {
namespace text {

namespace {

bool isIdentifierChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

}

std::string toLower(const std::string& value) {
    std::string result = value;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

std::string trim(const std::string& value) {
    auto first = value.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    auto last = value.find_last_not_of(" \t\r\n");
    return value.substr(first, last - first + 1);
}

bool startsWith(const std::string& value, const std::string& prefix) {
    return value.size() >= prefix.size() &&
           value.compare(0, prefix.size(), prefix) == 0;
}

bool endsWith(const std::string& value, const std::string& suffix) {
    return value.size() >= suffix.size() &&
           value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string basename(const std::string& path) {
    auto pos = path.find_last_of("/\\");
    return pos == std::string::npos ? path : path.substr(pos + 1);
}

std::vector<std::string> splitLines(const std::string& content) {
    std::vector<std::string> lines;
    size_t start = 0;
    while (start <= content.size()) {
        size_t end = content.find('\n', start);
        if (end == std::string::npos) {
            lines.push_back(content.substr(start));
            break;
        }
        std::string line = content.substr(start, end - start);
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        lines.push_back(line);
        start = end + 1;
    }
    return lines;
}

size_t countWord(const std::string& content, const std::string& word) {
    if (word.empty()) {
        return 0;
    }

    size_t count = 0;
    size_t pos = content.find(word);
    while (pos != std::string::npos) {
        bool left_ok = pos == 0 || !isIdentifierChar(content[pos - 1]);
        size_t after = pos + word.size();
        bool right_ok = after >= content.size() || !isIdentifierChar(content[after]);
        if (left_ok && right_ok) {
            ++count;
        }
        pos = content.find(word, pos + 1);
    }
    return count;
}

int lineOfOffset(const std::string& content, size_t offset) {
    offset = std::min(offset, content.size());
    return static_cast<int>(std::count(content.begin(), content.begin() + offset, '\n')) + 1;
}

bool scannable(const std::string& line) {
    return line.size() <= constants::limits::MAX_SCANNED_LINE_LENGTH;
}

size_t countUnscannableLines(const std::string& content) {
    size_t count = 0;
    size_t start = 0;
    while (start < content.size()) {
        size_t end = content.find('\n', start);
        if (end == std::string::npos) {
            end = content.size();
        }
        if (end - start > constants::limits::MAX_SCANNED_LINE_LENGTH) {
            ++count;
        }
        start = end + 1;
    }
    return count;
}

size_t indentWidth(const std::string& line) {
    size_t width = 0;
    for (char c : line) {
        if (c == ' ') {
            width += 1;
        } else if (c == '\t') {
            width += 4;
        } else {
            break;
        }
    }
    return width;
}

bool isCommentLine(const std::string& line) {
    std::string trimmed = trim(line);
    return startsWith(trimmed, "#") || startsWith(trimmed, "//") ||
           startsWith(trimmed, "/*") || trimmed == "*" || startsWith(trimmed, "* ") ||
           startsWith(trimmed, "--");
}

std::string truncate(const std::string& value, size_t max_length) {
    if (value.size() <= max_length) {
        return value;
    }
    return value.substr(0, max_length) + "...";
}

}}}
