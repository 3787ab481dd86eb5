#pragma once

#include "types.hpp"
#include <string>
#include <vector>
#include <map>
#include <optional>
#include <cstdint>

namespace code_sentinel {
namespace common {

enum class LogLevel {
    ERROR = 0,
    WARN = 1,
    INFO = 2,
    DEBUG = 3
};

enum class LogFormat {
    TEXT,
    JSON
};

struct LoggingConfig {
    size_t rotation_size_mb;
    size_t max_files;
    LogFormat format;
};

// Mirrors the [analysis] table; key names are shared with external callers.
struct AnalysisSettings {
    std::vector<std::string> enabled_agents;
    int max_concurrent_files;
    int timeout_per_file;
    bool use_llm;
    double llm_sample_rate;
    std::vector<std::string> skip_patterns;
    uint64_t random_seed;
};

struct GradeThreshold {
    int min_score;
    std::string grade;
};

struct ScoringConfig {
    std::map<Severity, int> penalties;
    // Descending by min_score; anything below the last entry gets failing_grade.
    std::vector<GradeThreshold> grade_thresholds;
    std::string failing_grade;
    size_t category_threshold;
    std::map<std::string, size_t> category_thresholds;
    size_t max_recommendations;
    size_t top_files_limit;

    int penaltyFor(Severity severity) const;
    size_t thresholdFor(const std::string& category) const;
};

struct GlobalConfig {
    std::string log_file;
    LogLevel log_level;
    LoggingConfig logging;
    AnalysisSettings analysis;
    ScoringConfig scoring;
};

class Config {
public:
    static Config& instance();

    bool load(const std::string& config_file = "");
    bool save(const std::string& config_file = "");
    bool exists() const;
    void reset();

    const GlobalConfig& global() const { return global_; }
    GlobalConfig& global() { return global_; }

    void setValue(const std::string& key, const std::string& value);
    std::optional<std::string> getValue(const std::string& key) const;
    static std::vector<std::string> knownKeys();

    std::string getConfigPath() const;

    AnalysisConfig toAnalysisConfig() const;

    static GlobalConfig createDefaultConfig();
    static ScoringConfig createDefaultScoring();

private:
    Config();
    GlobalConfig global_;
    std::string current_config_path_;

    std::optional<std::string> findBestConfig() const;
    bool tryLoadTomlFile(const std::string& path, const std::string& description);
};

std::string to_string(LogLevel level);
std::optional<LogLevel> parseLogLevel(const std::string& value);

}}
