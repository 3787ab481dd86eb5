#include "code_sentinel/analyzer/security_analyzer.hpp"
#include "code_sentinel/analyzer/text_utils.hpp"
#include "code_sentinel/common/constants.hpp"
#include <algorithm>
#include <cctype>

namespace code_sentinel {
namespace analyzer {

namespace {

constexpr size_t CHECKPOINT_INTERVAL = 256;
constexpr const char* CATEGORY = "security";

const auto ICASE = std::regex::ECMAScript | std::regex::icase | std::regex::optimize;
const auto EXACT = std::regex::ECMAScript | std::regex::optimize;

std::string cweReference(int cwe) {
    return "https://cwe.mitre.org/data/definitions/" + std::to_string(cwe) + ".html";
}

RuleSpec secretRule(const std::string& rule_id, const std::string& kind, common::Severity severity) {
    return RuleSpec{
        rule_id,
        "Hardcoded " + kind,
        severity,
        CATEGORY,
        "Potential " + kind + " committed to source",
        "Move the value to an environment variable or a secrets manager and rotate it",
        {cweReference(798)}
    };
}

RuleSpec vulnerabilityRule(const std::string& rule_id, const std::string& title, common::Severity severity,
                           const std::string& description, const std::string& suggestion, int cwe) {
    return RuleSpec{rule_id, title, severity, CATEGORY, description, suggestion, {cweReference(cwe)}};
}

}

SecurityAnalyzer::SecurityAnalyzer() {
    using common::Severity;

    secret_patterns_ = {
        {secretRule("SEC001", "API key", Severity::HIGH),
         std::regex(R"re((api[_-]?key|apikey)\s*[=:]\s*["']?([a-zA-Z0-9_-]{20,})["']?)re", ICASE), 2},
        {secretRule("SEC002", "secret key", Severity::HIGH),
         std::regex(R"re((secret[_-]?key|secretkey)\s*[=:]\s*["']?([a-zA-Z0-9_-]{20,})["']?)re", ICASE), 2},
        {secretRule("SEC003", "password", Severity::HIGH),
         std::regex(R"re((password|passwd|pwd)\s*[=:]\s*["']?([^"'\s]{8,})["']?)re", ICASE), 2},
        {secretRule("SEC004", "access token", Severity::HIGH),
         std::regex(R"re((auth[_-]?token|access[_-]?token|token)\s*[=:]\s*["']?([a-zA-Z0-9_.-]{20,})["']?)re", ICASE), 2},
        {secretRule("SEC005", "private key", Severity::CRITICAL),
         std::regex(R"re(-----BEGIN\s+(RSA\s+|EC\s+|OPENSSH\s+|DSA\s+)?PRIVATE\s+KEY-----)re", EXACT), 0},
        {secretRule("SEC006", "AWS access key", Severity::HIGH),
         std::regex(R"re(AKIA[0-9A-Z]{16})re", EXACT), 0},
        {secretRule("SEC007", "AWS secret key", Severity::CRITICAL),
         std::regex(R"re(aws[_-]?secret[_-]?access[_-]?key.*[=:]\s*["']?([a-zA-Z0-9/+=]{40})["']?)re", ICASE), 1},
        {secretRule("SEC008", "GitHub token", Severity::HIGH),
         std::regex(R"re(ghp_[a-zA-Z0-9]{36})re", EXACT), 0},
        {secretRule("SEC009", "JWT", Severity::HIGH),
         std::regex(R"re(eyJ[a-zA-Z0-9_-]*\.eyJ[a-zA-Z0-9_-]*\.[a-zA-Z0-9_-]*)re", EXACT), 0},
        {secretRule("SEC010", "database URL with credentials", Severity::HIGH),
         std::regex(R"re((database[_-]?url|db[_-]?url)\s*[=:]\s*["']?((postgres(ql)?|mysql|mongodb)://[^"'\s]+))re", ICASE), 2}
    };

    vulnerability_patterns_ = {
        {vulnerabilityRule("SEC101", "SQL injection risk", Severity::HIGH,
                           "SQL statement assembled from string concatenation or formatting",
                           "Use parameterized queries or prepared statements", 89),
         {std::regex(R"re(execute\s*\(\s*["'].*["']\s*\+)re", ICASE),
          std::regex(R"re(execute\s*\(\s*f["'])re", ICASE),
          std::regex(R"re(execute\s*\(\s*["'][^"']*%s[^"']*["']\s*%)re", ICASE),
          std::regex(R"re(query\s*=\s*["'][^"']*["']\s*\+)re", ICASE),
          std::regex(R"re(\b(select|insert|update|delete)\b.*\bwhere\b.*["']\s*\+)re", ICASE)}},
        {vulnerabilityRule("SEC102", "Cross-site scripting risk", Severity::HIGH,
                           "Markup built from concatenated, possibly untrusted input",
                           "Escape output or use textContent and framework templating", 79),
         {std::regex(R"re(innerHTML\s*=\s*[^;]*\+)re", EXACT),
          std::regex(R"re(document\.write\s*\([^)]*\+)re", EXACT),
          std::regex(R"re(\beval\s*\([^)]*\+)re", EXACT),
          std::regex(R"re(dangerouslySetInnerHTML)re", EXACT)}},
        {vulnerabilityRule("SEC103", "Command injection risk", Severity::CRITICAL,
                           "Shell command built from concatenated input",
                           "Pass arguments as a list and never route user input through a shell", 78),
         {std::regex(R"re(os\.system\s*\([^)]*\+)re", EXACT),
          std::regex(R"re(subprocess\.(call|run|Popen|check_output)\s*\([^)]*\+)re", EXACT),
          std::regex(R"re(subprocess\.(call|run|Popen|check_output)\s*\(.*shell\s*=\s*True)re", EXACT),
          std::regex(R"re(\bexec\s*\([^)]*\+)re", EXACT),
          std::regex(R"re(shell_exec\s*\([^)]*\$)re", EXACT),
          std::regex(R"re(child_process\.exec(Sync)?\s*\([^)]*\+)re", EXACT),
          std::regex(R"re(Runtime\.getRuntime\(\)\.exec\s*\([^)]*\+)re", EXACT)}},
        {vulnerabilityRule("SEC104", "Path traversal risk", Severity::HIGH,
                           "File path derived from request input or relative traversal",
                           "Normalize the path and verify it stays inside an allowed directory", 22),
         {std::regex(R"re(open\s*\([^)]*\+[^)]*\.\./)re", EXACT),
          std::regex(R"re(file_get_contents\s*\(\s*\$_(GET|POST|REQUEST))re", EXACT),
          std::regex(R"re(readFile(Sync)?\s*\([^)]*\+)re", EXACT)}},
        {vulnerabilityRule("SEC105", "Insecure deserialization", Severity::HIGH,
                           "Deserializing data with a loader that can execute code",
                           "Use safe loaders such as yaml.safe_load or a schema-validated format", 502),
         {std::regex(R"re(pickle\.loads?\s*\()re", EXACT),
          std::regex(R"re(yaml\.load\s*\(\s*[^,)]*\))re", EXACT),
          std::regex(R"re(unserialize\s*\(\s*\$_)re", EXACT),
          std::regex(R"re(new\s+ObjectInputStream\s*\()re", EXACT)}},
        {vulnerabilityRule("SEC106", "Weak cryptography", Severity::MEDIUM,
                           "Broken hash or cipher algorithm in use",
                           "Use SHA-256 or stronger hashes and AES-GCM or ChaCha20 ciphers", 327),
         {std::regex(R"re(hashlib\.(md5|sha1)\s*\()re", EXACT),
          std::regex(R"re(createHash\s*\(\s*["'](md5|sha1)["'])re", ICASE),
          std::regex(R"re(MessageDigest\.getInstance\s*\(\s*"(MD5|SHA-?1)")re", ICASE),
          std::regex(R"re(\b(DES|RC4)\b)re", EXACT)}}
    };
}

std::string SecurityAnalyzer::id() const {
    return constants::analyzers::SECURITY;
}

std::string SecurityAnalyzer::description() const {
    return "Hardcoded secrets and common injection, deserialization and crypto weaknesses";
}

std::vector<std::string> SecurityAnalyzer::supportedLanguages() const {
    return {
        "python", "javascript", "typescript", "java", "php", "ruby", "go", "csharp",
        "cpp", "c", "kotlin", "shell",
        "json", "yaml", "xml", "toml", "ini", "properties", "dotenv", "config",
        "dockerfile", ".env"
    };
}

bool SecurityAnalyzer::isPlaceholderValue(const std::string& value) {
    static const std::vector<std::string> placeholders = {
        "your_", "your-", "changeme", "change_me", "replace_me", "example", "dummy",
        "test", "placeholder", "xxx", "yyy", "zzz", "123456", "<", "${", "{{", "%("
    };
    static const std::vector<std::string> empty_values = {
        "\"\"", "''", "[]", "{}", "null", "none", "undefined"
    };

    std::string trimmed = text::trim(value);
    if (trimmed.size() < 8) {
        return true;
    }

    std::string lower = text::toLower(trimmed);
    for (const auto& empty : empty_values) {
        if (lower == empty) return true;
    }
    for (const auto& placeholder : placeholders) {
        if (lower.find(placeholder) != std::string::npos) return true;
    }
    return false;
}

Analyzer::Tier1Result SecurityAnalyzer::runRules(const common::SourceFile& file,
                                                 const schedule::TaskToken& token) const {
    Tier1Result result;
    auto lines = text::splitLines(file.content);

    size_t secrets = 0;
    size_t vulnerabilities = 0;

    for (size_t i = 0; i < lines.size(); ++i) {
        if (i % CHECKPOINT_INTERVAL == 0) {
            token.checkpoint();
        }
        const auto& line = lines[i];
        if (!text::scannable(line)) continue;
        int line_number = static_cast<int>(i + 1);

        for (const auto& secret : secret_patterns_) {
            std::smatch match;
            if (!std::regex_search(line, match, secret.pattern)) {
                continue;
            }
            std::string value = secret.value_group < match.size()
                ? match[secret.value_group].str()
                : match[0].str();
            if (isPlaceholderValue(value)) {
                continue;
            }
            result.findings.push_back(makeFinding(secret.rule, file, line_number, line, 0.9));
            ++secrets;
        }

        for (const auto& vulnerability : vulnerability_patterns_) {
            for (const auto& pattern : vulnerability.patterns) {
                if (std::regex_search(line, pattern)) {
                    result.findings.push_back(makeFinding(vulnerability.rule, file, line_number, line, 0.8));
                    ++vulnerabilities;
                    break;
                }
            }
        }
    }

    if (text::startsWith(text::toLower(text::basename(file.path)), "dockerfile") ||
        text::toLower(file.language) == "dockerfile") {
        scanDockerfile(file, lines, result.findings);
    }

    result.metrics["secrets_found"] = static_cast<double>(secrets);
    result.metrics["vulnerabilities_found"] = static_cast<double>(vulnerabilities);
    return result;
}

void SecurityAnalyzer::scanDockerfile(const common::SourceFile& file,
                                      const std::vector<std::string>& lines,
                                      std::vector<common::Finding>& findings) const {
    static const RuleSpec root_user = vulnerabilityRule(
        "SEC201", "Container runs as root", common::Severity::HIGH,
        "Image switches to the root user or uid 0",
        "Create an unprivileged user and switch to it with USER", 250);
    static const RuleSpec add_instruction = vulnerabilityRule(
        "SEC202", "ADD used for local files", common::Severity::LOW,
        "ADD can fetch remote URLs and unpack archives implicitly",
        "Use COPY for local files", 693);

    for (size_t i = 0; i < lines.size(); ++i) {
        std::string upper = text::trim(lines[i]);
        std::transform(upper.begin(), upper.end(), upper.begin(),
                       [](unsigned char c) { return std::toupper(c); });
        int line_number = static_cast<int>(i + 1);

        if (text::startsWith(upper, "USER ROOT") || upper.find("UID=0") != std::string::npos) {
            findings.push_back(makeFinding(root_user, file, line_number, lines[i]));
        }
        if (text::startsWith(upper, "ADD ") && !text::startsWith(upper, "ADD --")) {
            findings.push_back(makeFinding(add_instruction, file, line_number, lines[i]));
        }
    }
}

}}
