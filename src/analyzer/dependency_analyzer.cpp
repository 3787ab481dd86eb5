#include "code_sentinel/analyzer/dependency_analyzer.hpp"
#include "code_sentinel/analyzer/text_utils.hpp"
#include "code_sentinel/common/constants.hpp"
#include "code_sentinel/core/errors.hpp"
#include <nlohmann/json.hpp>
#include <toml.hpp>
#include <algorithm>
#include <map>
#include <regex>
#include <set>
#include <sstream>

namespace code_sentinel {
namespace analyzer {

namespace {

constexpr const char* CATEGORY = "dependency";
constexpr size_t LARGE_DEPENDENCY_SET = 50;

const std::map<std::string, std::string>& problematicPackages() {
    static const std::map<std::string, std::string> packages = {
        {"pycrypto", "unmaintained since 2013; use pycryptodome"},
        {"gpgme", "known licensing and maintenance problems"},
        {"natives", "relies on Node internals and breaks on upgrades"},
        {"event-stream", "shipped a compromised release"},
        {"request", "deprecated upstream"},
        {"node-uuid", "renamed to uuid"},
        {"flatmap-stream", "shipped a compromised release"}
    };
    return packages;
}

RuleSpec packageRule(const std::string& rule_id, const std::string& title, common::Severity severity,
                     const std::string& description, const std::string& suggestion) {
    return RuleSpec{rule_id, title, severity, CATEGORY, description, suggestion, {}};
}

bool isUnpinned(const std::string& version) {
    std::string v = text::toLower(text::trim(version));
    return v.empty() || v == "*" || v == "latest" || v == "release" || v == "x";
}

bool isUrlSource(const std::string& value) {
    std::string v = text::toLower(value);
    return text::startsWith(v, "git+") || text::startsWith(v, "git@") ||
           text::startsWith(v, "git:") || text::startsWith(v, "github:") ||
           text::startsWith(v, "file:") || v.find("://") != std::string::npos;
}

int locateLine(const std::string& content, const std::string& needle) {
    auto pos = content.find(needle);
    return pos == std::string::npos ? 0 : text::lineOfOffset(content, pos);
}

DeclaredDependency parseRequirementSpec(const std::string& spec) {
    static const std::regex requirement(R"re(^([A-Za-z0-9_.\-]+)(\[[^\]]*\])?\s*(===|==|>=|<=|~=|!=|>|<)?\s*([^;\s]*))re");

    DeclaredDependency dep;
    auto at = spec.find(" @ ");
    if (at != std::string::npos) {
        dep.name = text::trim(spec.substr(0, at));
        dep.source = text::trim(spec.substr(at + 3));
        return dep;
    }

    std::smatch match;
    if (text::scannable(spec) && std::regex_search(spec, match, requirement)) {
        dep.name = match[1].str();
        dep.version = match[3].matched ? match[3].str() + match[4].str() : "";
    }
    return dep;
}

std::vector<DeclaredDependency> fromTomlTable(const toml::value& table, const std::string& content,
                                              const std::set<std::string>& skip) {
    std::vector<DeclaredDependency> deps;
    if (!table.is_table()) {
        return deps;
    }
    for (const auto& [name, value] : table.as_table()) {
        if (skip.count(name)) continue;

        DeclaredDependency dep;
        dep.name = name;
        if (value.is_string()) {
            dep.version = toml::get<std::string>(value);
        } else if (value.is_table()) {
            if (value.contains("version")) {
                dep.version = toml::find<std::string>(value, "version");
            }
            if (value.contains("git")) {
                dep.source = toml::find<std::string>(value, "git");
            } else if (value.contains("url")) {
                dep.source = toml::find<std::string>(value, "url");
            } else if (value.contains("path")) {
                dep.source = "path:" + toml::find<std::string>(value, "path");
            }
        }
        auto pos = content.find("\n" + name);
        dep.line = pos == std::string::npos ? 0 : text::lineOfOffset(content, pos + 1);
        deps.push_back(dep);
    }
    return deps;
}

}

std::string DependencyAnalyzer::id() const {
    return constants::analyzers::DEPENDENCY;
}

std::string DependencyAnalyzer::description() const {
    return "Dependency manifests: unpinned versions, URL sources, insecure indexes, risky packages";
}

std::vector<std::string> DependencyAnalyzer::supportedLanguages() const {
    return {
        "requirements.txt", "package.json", "pyproject.toml", "pipfile", "go.mod",
        "cargo.toml", "gemfile", "composer.json", "pom.xml"
    };
}

std::vector<DeclaredDependency> DependencyAnalyzer::parseManifest(const common::SourceFile& file) {
    std::string name = text::toLower(text::basename(file.path));

    if (name == "requirements.txt") return parseRequirements(file.content);
    if (name == "package.json") return parseNpmStyle(file.content, false);
    if (name == "composer.json") return parseNpmStyle(file.content, true);
    if (name == "cargo.toml") return parseTomlManifest(file, "cargo");
    if (name == "pyproject.toml") return parseTomlManifest(file, "pyproject");
    if (name == "pipfile") return parseTomlManifest(file, "pipfile");
    if (name == "go.mod") return parseGoMod(file.content);
    if (name == "gemfile") return parseGemfile(file.content);
    if (name == "pom.xml") return parsePom(file.content);

    throw core::AnalyzerError(core::CoreErrorCode::ANALYZER_MALFORMED_INPUT,
                              "Not a recognised manifest: " + file.path);
}

std::vector<DeclaredDependency> DependencyAnalyzer::parseRequirements(const std::string& content) {
    std::vector<DeclaredDependency> deps;
    auto lines = text::splitLines(content);

    for (size_t i = 0; i < lines.size(); ++i) {
        std::string line = lines[i];
        auto comment = line.find(" #");
        if (comment != std::string::npos) {
            line = line.substr(0, comment);
        }
        line = text::trim(line);
        if (line.empty() || line[0] == '#') continue;

        DeclaredDependency dep;
        if (text::startsWith(line, "-e ") || text::startsWith(line, "--editable ")) {
            dep.source = text::trim(line.substr(line.find(' ') + 1));
            auto egg = dep.source.find("#egg=");
            dep.name = egg != std::string::npos ? dep.source.substr(egg + 5) : dep.source;
        } else if (line[0] == '-') {
            continue;
        } else if (isUrlSource(line)) {
            dep.source = line;
            auto egg = line.find("#egg=");
            dep.name = egg != std::string::npos ? line.substr(egg + 5) : line;
        } else {
            dep = parseRequirementSpec(line);
            if (dep.name.empty()) continue;
        }
        dep.line = static_cast<int>(i + 1);
        deps.push_back(dep);
    }
    return deps;
}

std::vector<DeclaredDependency> DependencyAnalyzer::parseNpmStyle(const std::string& content, bool composer) {
    nlohmann::json manifest;
    try {
        manifest = nlohmann::json::parse(content);
    } catch (const nlohmann::json::parse_error& e) {
        throw core::AnalyzerError(core::CoreErrorCode::ANALYZER_MALFORMED_INPUT,
                                  std::string("Manifest is not valid JSON: ") + e.what());
    }
    if (!manifest.is_object()) {
        throw core::AnalyzerError(core::CoreErrorCode::ANALYZER_MALFORMED_INPUT,
                                  "Manifest root must be an object");
    }

    static const std::vector<std::string> npm_sections = {
        "dependencies", "devDependencies", "peerDependencies", "optionalDependencies"
    };
    static const std::vector<std::string> composer_sections = {"require", "require-dev"};

    std::vector<DeclaredDependency> deps;
    for (const auto& section : composer ? composer_sections : npm_sections) {
        if (!manifest.contains(section) || !manifest[section].is_object()) continue;

        for (const auto& [name, value] : manifest[section].items()) {
            if (composer && (name == "php" || text::startsWith(name, "ext-"))) continue;

            DeclaredDependency dep;
            dep.name = name;
            std::string spec = value.is_string() ? value.get<std::string>() : "";
            if (isUrlSource(spec)) {
                dep.source = spec;
            } else {
                dep.version = spec;
            }
            dep.line = locateLine(content, "\"" + name + "\"");
            deps.push_back(dep);
        }
    }
    return deps;
}

std::vector<DeclaredDependency> DependencyAnalyzer::parseTomlManifest(const common::SourceFile& file,
                                                                      const std::string& kind) {
    toml::value data;
    try {
        std::istringstream stream(file.content);
        data = toml::parse(stream, file.path);
    } catch (const std::exception& e) {
        throw core::AnalyzerError(core::CoreErrorCode::ANALYZER_MALFORMED_INPUT,
                                  std::string("Manifest is not valid TOML: ") + e.what());
    }

    std::vector<DeclaredDependency> deps;
    auto append = [&deps](std::vector<DeclaredDependency> more) {
        deps.insert(deps.end(), more.begin(), more.end());
    };

    if (kind == "cargo") {
        for (const char* section : {"dependencies", "dev-dependencies", "build-dependencies"}) {
            if (data.contains(section)) {
                append(fromTomlTable(data.at(section), file.content, {}));
            }
        }
    } else if (kind == "pipfile") {
        for (const char* section : {"packages", "dev-packages"}) {
            if (data.contains(section)) {
                append(fromTomlTable(data.at(section), file.content, {}));
            }
        }
    } else {
        if (data.contains("project") && data.at("project").contains("dependencies")) {
            for (const auto& item : toml::find<std::vector<std::string>>(data.at("project"), "dependencies")) {
                DeclaredDependency dep = parseRequirementSpec(item);
                if (dep.name.empty()) continue;
                dep.line = locateLine(file.content, item);
                deps.push_back(dep);
            }
        }
        if (data.contains("tool") && data.at("tool").contains("poetry") &&
            data.at("tool").at("poetry").contains("dependencies")) {
            append(fromTomlTable(data.at("tool").at("poetry").at("dependencies"), file.content, {"python"}));
        }
    }

    std::sort(deps.begin(), deps.end(), [](const DeclaredDependency& a, const DeclaredDependency& b) {
        return a.line != b.line ? a.line < b.line : a.name < b.name;
    });
    return deps;
}

std::vector<DeclaredDependency> DependencyAnalyzer::parseGoMod(const std::string& content) {
    std::vector<DeclaredDependency> deps;
    auto lines = text::splitLines(content);
    bool in_require = false;

    for (size_t i = 0; i < lines.size(); ++i) {
        std::string line = text::trim(lines[i]);
        auto comment = line.find("//");
        if (comment != std::string::npos) {
            line = text::trim(line.substr(0, comment));
        }
        if (line.empty()) continue;

        if (text::startsWith(line, "require (")) {
            in_require = true;
            continue;
        }
        if (in_require && line == ")") {
            in_require = false;
            continue;
        }

        std::string spec;
        if (in_require) {
            spec = line;
        } else if (text::startsWith(line, "require ")) {
            spec = text::trim(line.substr(8));
        } else {
            continue;
        }

        std::istringstream parts(spec);
        DeclaredDependency dep;
        parts >> dep.name >> dep.version;
        dep.line = static_cast<int>(i + 1);
        deps.push_back(dep);
    }
    return deps;
}

std::vector<DeclaredDependency> DependencyAnalyzer::parseGemfile(const std::string& content) {
    static const std::regex gem(R"re(^\s*gem\s+["']([^"']+)["']\s*(,\s*["']([^"']+)["'])?(.*)$)re");
    static const std::regex git_option(R"re((git|github|path)\s*:\s*["']([^"']+)["'])re");

    std::vector<DeclaredDependency> deps;
    auto lines = text::splitLines(content);
    for (size_t i = 0; i < lines.size(); ++i) {
        std::smatch match;
        if (!text::scannable(lines[i]) || !std::regex_search(lines[i], match, gem)) continue;

        DeclaredDependency dep;
        dep.name = match[1].str();
        dep.version = match[3].matched ? match[3].str() : "";
        std::string rest = match[4].str();
        std::smatch option;
        if (std::regex_search(rest, option, git_option)) {
            dep.source = option[2].str();
        }
        dep.line = static_cast<int>(i + 1);
        deps.push_back(dep);
    }
    return deps;
}

std::vector<DeclaredDependency> DependencyAnalyzer::parsePom(const std::string& content) {
    static const std::string open_tag = "<dependency>";
    static const std::string close_tag = "</dependency>";
    static const std::regex artifact(R"re(<artifactId>\s*([^<\s]+)\s*</artifactId>)re");
    static const std::regex version(R"re(<version>\s*([^<\s]+)\s*</version>)re");

    std::vector<DeclaredDependency> deps;
    size_t pos = content.find(open_tag);
    while (pos != std::string::npos) {
        size_t body = pos + open_tag.size();
        size_t end = content.find(close_tag, body);
        if (end == std::string::npos) {
            break;
        }
        std::string block = content.substr(body, end - body);
        size_t next = content.find(open_tag, end + close_tag.size());

        std::smatch match;
        if (!text::scannable(block) || !std::regex_search(block, match, artifact)) {
            pos = next;
            continue;
        }

        DeclaredDependency dep;
        dep.name = match[1].str();
        // Missing versions are managed by a parent POM.
        dep.version = std::regex_search(block, match, version) ? match[1].str() : "managed";
        dep.line = text::lineOfOffset(content, pos);
        deps.push_back(dep);
        pos = next;
    }
    return deps;
}

Analyzer::Tier1Result DependencyAnalyzer::runRules(const common::SourceFile& file,
                                                   const schedule::TaskToken& token) const {
    Tier1Result result;
    auto deps = parseManifest(file);
    token.checkpoint();

    bool javascript = text::toLower(text::basename(file.path)) == "package.json";

    for (const auto& dep : deps) {
        if (!dep.source.empty()) {
            result.findings.push_back(makeFinding(
                packageRule("DEP002", "Dependency from URL source: " + dep.name, common::Severity::MEDIUM,
                            "'" + dep.name + "' is fetched from " + dep.source + " instead of a registry",
                            "Publish the package to a registry or pin the source to an immutable commit"),
                file, dep.line, dep.source));
        } else if (isUnpinned(dep.version)) {
            result.findings.push_back(makeFinding(
                packageRule("DEP001", "Unpinned dependency version: " + dep.name, common::Severity::MEDIUM,
                            "'" + dep.name + "' has no fixed version, builds are not reproducible",
                            "Pin an exact version or commit a lock file"),
                file, dep.line, dep.name));
        } else if (javascript && (text::startsWith(dep.version, "^0.") || text::startsWith(dep.version, "~0."))) {
            result.findings.push_back(makeFinding(
                packageRule("DEP005", "Pre-1.0 version range: " + dep.name, common::Severity::LOW,
                            "'" + dep.name + "' floats within a 0.x range (" + dep.version + ")",
                            "Pin pre-1.0 packages exactly; minor releases may break APIs"),
                file, dep.line, dep.name + ": " + dep.version));
        }

        auto risky = problematicPackages().find(text::toLower(dep.name));
        if (risky != problematicPackages().end()) {
            result.findings.push_back(makeFinding(
                packageRule("DEP003", "Deprecated or compromised package: " + dep.name, common::Severity::MEDIUM,
                            "'" + dep.name + "' is " + risky->second,
                            "Replace the package with a maintained alternative"),
                file, dep.line, dep.name));
        }
    }

    if (deps.size() > LARGE_DEPENDENCY_SET) {
        result.findings.push_back(makeFinding(
            packageRule("DEP006", "Large dependency set", common::Severity::LOW,
                        std::to_string(deps.size()) + " dependencies declared in one manifest",
                        "Remove unused packages and split optional features into extras"),
            file, 0, ""));
    }

    checkInsecureIndexes(file, result.findings);

    result.metrics["dependencies"] = static_cast<double>(deps.size());
    return result;
}

void DependencyAnalyzer::checkInsecureIndexes(const common::SourceFile& file,
                                              std::vector<common::Finding>& findings) const {
    static const std::regex insecure(
        R"re((--(extra-)?index-url\s+http://|^\s*source\s+["']http://|"registry"\s*:\s*"http://|url\s*=\s*["']http://))re");
    static const RuleSpec rule = packageRule(
        "DEP004", "Package index over plain HTTP", common::Severity::HIGH,
        "Packages are downloaded without transport security",
        "Switch the index URL to HTTPS");

    auto lines = text::splitLines(file.content);
    for (size_t i = 0; i < lines.size(); ++i) {
        if (text::scannable(lines[i]) && std::regex_search(lines[i], insecure)) {
            findings.push_back(makeFinding(rule, file, static_cast<int>(i + 1), lines[i]));
        }
    }
}

}}
