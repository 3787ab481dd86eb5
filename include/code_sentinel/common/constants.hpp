#pragma once

#include <string>
#include <vector>
#include <array>
#include <algorithm>
#include <cstdint>

namespace code_sentinel {
namespace constants {

namespace version {
    constexpr const char* CLI_VERSION = "1.0.0";

    inline std::string getFullVersion() {
        return std::string("code-sentinel v") + CLI_VERSION;
    }
}

namespace system {
    constexpr const char* APPLICATION_NAME = "code-sentinel";
    constexpr const char* LOGGER_NAME = "code-sentinel";
    constexpr const char* CONFIG_ENV_VAR = "CODE_SENTINEL_CONFIG";
    constexpr const char* LOCAL_CONFIG_FILE = "code-sentinel.toml";
    constexpr const char* SYSTEM_CONFIG_FILE = "/etc/code-sentinel/config.toml";
}

namespace analyzers {
    constexpr const char* SECURITY = "security";
    constexpr const char* DEPENDENCY = "dependency";
    constexpr const char* CODE_QUALITY = "code_quality";
    constexpr const char* PERFORMANCE = "performance";
    constexpr const char* BEST_PRACTICES = "best_practices";

    constexpr std::array<const char*, 5> DEFAULT_ENABLED = {
        SECURITY, DEPENDENCY, CODE_QUALITY, PERFORMANCE, BEST_PRACTICES
    };

    inline std::vector<std::string> getDefaultEnabled() {
        return std::vector<std::string>(DEFAULT_ENABLED.begin(), DEFAULT_ENABLED.end());
    }

    constexpr const char* ALL_LANGUAGES = "*";
}

namespace limits {
    constexpr int DEFAULT_MAX_CONCURRENT_TASKS = 10;
    constexpr int MAX_CONCURRENT_TASKS = 256;
    constexpr int DEFAULT_TIMEOUT_PER_FILE_SECONDS = 30;
    constexpr int MAX_TIMEOUT_PER_FILE_SECONDS = 3600;
    constexpr size_t DEFAULT_MAX_FILE_SIZE_KB = 1024;
    // std::regex recurses per character; longer lines are not pattern-matched.
    constexpr size_t MAX_SCANNED_LINE_LENGTH = 4096;

    constexpr size_t DEFAULT_LOG_ROTATION_SIZE_MB = 50;
    constexpr size_t DEFAULT_LOG_MAX_FILES = 3;
}

namespace escalation {
    constexpr double DEFAULT_SAMPLE_RATE = 0.2;
    constexpr size_t MIN_LINES = 20;
    constexpr int COMPLEXITY_THRESHOLD = 15;
    constexpr double MIN_DEEP_CONFIDENCE = 0.7;
    constexpr uint64_t DEFAULT_RANDOM_SEED = 0x5EED;

    constexpr std::array<const char*, 10> COMPLEXITY_KEYWORDS = {
        "if", "else", "elif", "for", "while", "try", "except", "catch", "switch", "case"
    };

    constexpr std::array<const char*, 9> CONFIG_EXTENSIONS = {
        ".json", ".yaml", ".yml", ".xml", ".toml", ".ini", ".cfg", ".conf", ".env"
    };

    constexpr std::array<const char*, 8> CONFIG_LANGUAGES = {
        "json", "yaml", "xml", "toml", "ini", "properties", "dotenv", "config"
    };
}

namespace scoring {
    constexpr int BASE_SCORE = 100;

    constexpr int PENALTY_CRITICAL = 15;
    constexpr int PENALTY_HIGH = 8;
    constexpr int PENALTY_MEDIUM = 4;
    constexpr int PENALTY_LOW = 1;
    constexpr int PENALTY_INFO = 0;

    struct GradeCutoff {
        int min_score;
        const char* grade;
    };

    constexpr std::array<GradeCutoff, 11> GRADE_CUTOFFS = {{
        {97, "A+"}, {93, "A"}, {90, "A-"},
        {87, "B+"}, {83, "B"}, {80, "B-"},
        {77, "C+"}, {73, "C"}, {70, "C-"},
        {67, "D+"}, {60, "D"}
    }};
    constexpr const char* FAILING_GRADE = "F";

    constexpr int DEDUP_LINE_BUCKET = 10;
    constexpr size_t DEFAULT_CATEGORY_THRESHOLD = 0;
    constexpr size_t CODE_QUALITY_CATEGORY_THRESHOLD = 5;
    constexpr size_t MAX_RECOMMENDATIONS = 10;
    constexpr size_t TOP_FILES_LIMIT = 10;
    constexpr const char* DEFAULT_CATEGORY = "general";
}

namespace skip_patterns {
    constexpr std::array<const char*, 11> DEFAULTS = {
        "*.min.js", "*.map", "node_modules/*", "__pycache__/*", ".git/*",
        "*.pyc", "venv/*", "env/*", ".venv/*", "dist/*", "build/*"
    };

    inline std::vector<std::string> getDefaults() {
        return std::vector<std::string>(DEFAULTS.begin(), DEFAULTS.end());
    }
}

namespace config_defaults {
    constexpr int MAX_CONCURRENT_FILES = limits::DEFAULT_MAX_CONCURRENT_TASKS;
    constexpr int TIMEOUT_PER_FILE = limits::DEFAULT_TIMEOUT_PER_FILE_SECONDS;
    constexpr bool USE_LLM = false;
    constexpr double LLM_SAMPLE_RATE = escalation::DEFAULT_SAMPLE_RATE;
    constexpr uint64_t RANDOM_SEED = escalation::DEFAULT_RANDOM_SEED;

    constexpr size_t LOG_ROTATION_SIZE_MB = limits::DEFAULT_LOG_ROTATION_SIZE_MB;
    constexpr size_t LOG_MAX_FILES = limits::DEFAULT_LOG_MAX_FILES;
}

}
}
