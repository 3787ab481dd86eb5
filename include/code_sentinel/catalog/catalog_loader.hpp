#pragma once

#include "../common/types.hpp"
#include <cstddef>
#include <string>
#include <vector>

namespace code_sentinel {
namespace catalog {

struct CollectOptions {
    bool recursive = true;
    int max_recursion_depth = 32;
    size_t max_file_size = 1024 * 1024;
    std::vector<std::string> skip_patterns;
};

struct CollectSummary {
    size_t total_files_found = 0;
    size_t collected_files = 0;
    size_t skipped_by_pattern = 0;
    size_t skipped_too_large = 0;
    size_t skipped_binary = 0;
    size_t skipped_empty = 0;
    size_t unreadable_files = 0;
};

class CatalogLoader {
public:
    // Accepts either a JSON array of {path, content, language} objects or an
    // object with a "files" array of the same. Missing languages are detected.
    static common::FileCatalog loadCatalogFile(const std::string& path);
    static common::FileCatalog parseCatalog(const std::string& json_text, const std::string& origin = "<memory>");

    // Paths in the result are relative to root and sorted.
    static common::FileCatalog collectDirectory(const std::string& root,
                                                const CollectOptions& options,
                                                CollectSummary* summary = nullptr);

    // Empty when the file type is unknown.
    static std::string detectLanguage(const std::string& path);

    static bool looksBinary(const std::string& content);
};

}}
