#include "code_sentinel/catalog/catalog_loader.hpp"
#include "code_sentinel/common/glob_matcher.hpp"
#include "code_sentinel/common/logger.hpp"
#include "code_sentinel/core/errors.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <functional>
#include <map>
#include <sstream>

namespace code_sentinel {
namespace catalog {

namespace {

const std::map<std::string, std::string>& extensionMap() {
    static const std::map<std::string, std::string> map = {
        {".py", "python"}, {".pyw", "python"}, {".pyx", "python"},
        {".js", "javascript"}, {".jsx", "javascript"}, {".mjs", "javascript"}, {".cjs", "javascript"},
        {".ts", "typescript"}, {".tsx", "typescript"},
        {".java", "java"}, {".kt", "kotlin"}, {".kts", "kotlin"}, {".scala", "scala"},
        {".c", "c"}, {".h", "c"},
        {".cpp", "cpp"}, {".cc", "cpp"}, {".cxx", "cpp"}, {".hpp", "cpp"}, {".hxx", "cpp"},
        {".c++", "cpp"}, {".h++", "cpp"},
        {".cs", "csharp"}, {".go", "go"}, {".rs", "rust"},
        {".rb", "ruby"}, {".rake", "ruby"},
        {".php", "php"}, {".phtml", "php"},
        {".swift", "swift"}, {".m", "objective-c"}, {".mm", "objective-c"},
        {".sh", "shell"}, {".bash", "shell"}, {".zsh", "shell"},
        {".ps1", "powershell"}, {".psm1", "powershell"},
        {".sql", "sql"},
        {".html", "html"}, {".htm", "html"}, {".css", "css"}, {".scss", "scss"},
        {".sass", "sass"}, {".less", "less"},
        {".vue", "vue"}, {".svelte", "svelte"}, {".dart", "dart"}, {".r", "r"}, {".lua", "lua"},
        {".pl", "perl"}, {".pm", "perl"}, {".perl", "perl"},
        {".hs", "haskell"}, {".lhs", "haskell"}, {".ex", "elixir"}, {".exs", "elixir"},
        {".clj", "clojure"}, {".cljs", "clojure"}, {".cljc", "clojure"}, {".elm", "elm"},
        {".erl", "erlang"}, {".hrl", "erlang"},
        {".fs", "fsharp"}, {".fsx", "fsharp"}, {".fsi", "fsharp"},
        {".ml", "ocaml"}, {".mli", "ocaml"}, {".nim", "nim"}, {".zig", "zig"},
        {".yaml", "yaml"}, {".yml", "yaml"}, {".json", "json"}, {".xml", "xml"},
        {".md", "markdown"}, {".markdown", "markdown"},
        {".toml", "toml"}, {".ini", "ini"}, {".cfg", "ini"}, {".conf", "conf"},
        {".env", "dotenv"}
    };
    return map;
}

const std::map<std::string, std::string>& filenameMap() {
    static const std::map<std::string, std::string> map = {
        {"Dockerfile", "dockerfile"}, {"Makefile", "makefile"},
        {"Rakefile", "ruby"}, {"Gemfile", "ruby"}, {"Vagrantfile", "ruby"},
        {"CMakeLists.txt", "cmake"},
        {".bashrc", "shell"}, {".zshrc", "shell"}, {".bash_profile", "shell"},
        {".env", "dotenv"},
        {"requirements.txt", "requirements"}, {"Pipfile", "toml"}, {"go.mod", "go"}
    };
    return map;
}

std::string readWholeFile(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        core::ErrorContext context{"CatalogLoader", {{"path", path.string()}}};
        throw core::CatalogError(core::CoreErrorCode::CATALOG_READ_FAILED,
                                 "Cannot open " + path.string(), context);
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

common::SourceFile parseEntry(const nlohmann::json& entry, size_t index, const std::string& origin) {
    if (!entry.is_object()) {
        throw core::CatalogError(core::CoreErrorCode::CATALOG_PARSE_FAILED,
                                 origin + ": entry " + std::to_string(index) + " is not an object");
    }
    if (!entry.contains("path") || !entry["path"].is_string() || entry["path"].get<std::string>().empty()) {
        throw core::CatalogError(core::CoreErrorCode::CATALOG_PARSE_FAILED,
                                 origin + ": entry " + std::to_string(index) + " has no path");
    }
    if (!entry.contains("content") || !entry["content"].is_string()) {
        throw core::CatalogError(core::CoreErrorCode::CATALOG_PARSE_FAILED,
                                 origin + ": entry " + std::to_string(index) + " has no string content");
    }

    common::SourceFile file;
    file.path = entry["path"].get<std::string>();
    file.content = entry["content"].get<std::string>();
    if (entry.contains("language") && !entry["language"].is_null()) {
        if (!entry["language"].is_string()) {
            throw core::CatalogError(core::CoreErrorCode::CATALOG_PARSE_FAILED,
                                     origin + ": entry " + std::to_string(index) + " has a non-string language");
        }
        file.language = entry["language"].get<std::string>();
    }
    if (file.language.empty()) {
        file.language = CatalogLoader::detectLanguage(file.path);
    }
    return file;
}

}

common::FileCatalog CatalogLoader::parseCatalog(const std::string& json_text, const std::string& origin) {
    nlohmann::json root;
    try {
        root = nlohmann::json::parse(json_text);
    } catch (const nlohmann::json::parse_error& e) {
        core::ErrorContext context{"CatalogLoader", {{"origin", origin}, {"byte", std::to_string(e.byte)}}};
        throw core::CatalogError(core::CoreErrorCode::CATALOG_PARSE_FAILED,
                                 origin + ": " + e.what(), context);
    }

    const nlohmann::json* entries = &root;
    if (root.is_object()) {
        auto it = root.find("files");
        if (it == root.end() || !it->is_array()) {
            throw core::CatalogError(core::CoreErrorCode::CATALOG_PARSE_FAILED,
                                     origin + ": expected an array or an object with a \"files\" array");
        }
        entries = &(*it);
    } else if (!root.is_array()) {
        throw core::CatalogError(core::CoreErrorCode::CATALOG_PARSE_FAILED,
                                 origin + ": expected an array or an object with a \"files\" array");
    }

    common::FileCatalog catalog;
    catalog.reserve(entries->size());
    for (size_t i = 0; i < entries->size(); ++i) {
        catalog.push_back(parseEntry((*entries)[i], i, origin));
    }

    common::Logger::instance().debug("[CatalogLoader] Parsed | origin={} | files={}", origin, catalog.size());
    return catalog;
}

common::FileCatalog CatalogLoader::loadCatalogFile(const std::string& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        core::ErrorContext context{"CatalogLoader", {{"path", path}}};
        throw core::CatalogError(core::CoreErrorCode::CATALOG_NOT_FOUND,
                                 "Catalog file not found: " + path, context);
    }
    return parseCatalog(readWholeFile(path), path);
}

common::FileCatalog CatalogLoader::collectDirectory(const std::string& root,
                                                    const CollectOptions& options,
                                                    CollectSummary* summary) {
    std::error_code ec;
    std::filesystem::path base(root);
    if (!std::filesystem::is_directory(base, ec)) {
        core::ErrorContext context{"CatalogLoader", {{"path", root}}};
        throw core::CatalogError(core::CoreErrorCode::CATALOG_NOT_FOUND,
                                 "Directory not found: " + root, context);
    }

    CollectSummary local;
    CollectSummary& counts = summary ? *summary : local;
    common::GlobMatcher skip(options.skip_patterns);

    std::vector<std::filesystem::path> paths;
    std::function<void(const std::filesystem::path&, int)> collect_recursive;
    collect_recursive = [&](const std::filesystem::path& dir, int depth) {
        if (depth > options.max_recursion_depth) {
            common::Logger::instance().warn("[CatalogLoader] Depth exceeded | path={}", dir.string());
            return;
        }

        std::error_code iter_ec;
        for (auto it = std::filesystem::directory_iterator(dir, iter_ec);
             it != std::filesystem::directory_iterator();
             it.increment(iter_ec)) {
            if (iter_ec) {
                counts.unreadable_files++;
                iter_ec.clear();
                continue;
            }

            std::error_code entry_ec;
            if (std::filesystem::is_symlink(it->path(), entry_ec)) {
                continue;
            }

            std::string relative = std::filesystem::relative(it->path(), base, entry_ec).generic_string();
            if (entry_ec) {
                relative = it->path().generic_string();
            }

            if (std::filesystem::is_directory(it->path(), entry_ec)) {
                if (!options.recursive) continue;
                if (skip.matches(relative + "/")) {
                    common::Logger::instance().debug("[CatalogLoader] Directory skipped | path={}", relative);
                    continue;
                }
                collect_recursive(it->path(), depth + 1);
            } else if (std::filesystem::is_regular_file(it->path(), entry_ec)) {
                counts.total_files_found++;
                if (skip.matches(relative)) {
                    counts.skipped_by_pattern++;
                    continue;
                }

                auto file_size = std::filesystem::file_size(it->path(), entry_ec);
                if (entry_ec) {
                    counts.unreadable_files++;
                    continue;
                }
                if (file_size == 0) {
                    counts.skipped_empty++;
                    continue;
                }
                if (file_size > options.max_file_size) {
                    counts.skipped_too_large++;
                    common::Logger::instance().debug("[CatalogLoader] File too large | path={} | size={}",
                                                     relative, file_size);
                    continue;
                }
                paths.push_back(it->path());
            }
        }
    };

    collect_recursive(base, 0);
    std::sort(paths.begin(), paths.end());

    common::FileCatalog catalog;
    for (const auto& path : paths) {
        std::string content;
        try {
            content = readWholeFile(path);
        } catch (const core::CatalogError& e) {
            counts.unreadable_files++;
            common::Logger::instance().warn("[CatalogLoader] Read failed | path={} | error={}",
                                            path.string(), e.what());
            continue;
        }

        if (looksBinary(content)) {
            counts.skipped_binary++;
            continue;
        }

        std::string relative = std::filesystem::relative(path, base, ec).generic_string();
        if (ec) {
            relative = path.generic_string();
            ec.clear();
        }

        common::SourceFile file;
        file.language = detectLanguage(relative);
        file.path = std::move(relative);
        file.content = std::move(content);
        catalog.push_back(std::move(file));
    }

    counts.collected_files = catalog.size();
    common::Logger::instance().info("[CatalogLoader] Collected | root={} | found={} | collected={} | skipped={}",
                                    root, counts.total_files_found, counts.collected_files,
                                    counts.skipped_by_pattern + counts.skipped_too_large +
                                        counts.skipped_binary + counts.skipped_empty);
    return catalog;
}

std::string CatalogLoader::detectLanguage(const std::string& path) {
    std::filesystem::path p(path);
    std::string filename = p.filename().string();

    const auto& names = filenameMap();
    auto by_name = names.find(filename);
    if (by_name != names.end()) {
        return by_name->second;
    }
    if (filename.rfind(".env.", 0) == 0) {
        return "dotenv";
    }

    std::string extension = p.extension().string();
    std::transform(extension.begin(), extension.end(), extension.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    const auto& extensions = extensionMap();
    auto by_ext = extensions.find(extension);
    if (by_ext != extensions.end()) {
        return by_ext->second;
    }
    return "";
}

bool CatalogLoader::looksBinary(const std::string& content) {
    size_t sniff_length = std::min<size_t>(content.size(), 8192);
    return content.find('\0') < sniff_length;
}

}}
