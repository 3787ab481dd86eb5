#pragma once

#include <string>
#include <vector>

namespace code_sentinel {
namespace analyzer {
namespace text {

std::string toLower(const std::string& value);
std::string trim(const std::string& value);
bool startsWith(const std::string& value, const std::string& prefix);
bool endsWith(const std::string& value, const std::string& suffix);
std::string basename(const std::string& path);

std::vector<std::string> splitLines(const std::string& content);

// Occurrences of word not adjacent to identifier characters.
size_t countWord(const std::string& content, const std::string& word);

// 1-based line containing the byte at offset.
int lineOfOffset(const std::string& content, size_t offset);

// False for lines too long to hand to std::regex.
bool scannable(const std::string& line);
size_t countUnscannableLines(const std::string& content);

size_t indentWidth(const std::string& line);
bool isCommentLine(const std::string& line);
std::string truncate(const std::string& value, size_t max_length);

}}}
