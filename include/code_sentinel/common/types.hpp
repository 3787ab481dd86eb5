#pragma once

#include <string>
#include <vector>
#include <map>
#include <set>
#include <chrono>
#include <optional>
#include <cstdint>

namespace code_sentinel {

namespace core {
enum class CoreErrorCode;
}

namespace common {

// Lower value is more severe.
enum class Severity {
    CRITICAL = 0,
    HIGH = 1,
    MEDIUM = 2,
    LOW = 3,
    INFO = 4
};

enum class OutcomeStatus {
    COMPLETED,
    FAILED,
    TIMED_OUT
};

enum class ReportStatus {
    COMPLETED,
    FAILED
};

struct Finding {
    std::string title;
    std::string description;
    // Empty only for findings that never got a severity; the aggregator drops those.
    std::optional<Severity> severity;
    std::string category;
    std::string file_path;
    std::optional<int> line;
    std::optional<int> column;
    double confidence = 1.0;
    std::string suggestion;
    std::string rule_id;
    std::vector<std::string> references;
    std::string code_snippet;
};

struct Outcome {
    std::string analyzer_id;
    std::string file_path;
    std::vector<Finding> findings;
    std::map<std::string, double> metrics;
    OutcomeStatus status = OutcomeStatus::COMPLETED;
    std::optional<std::string> error_message;
    std::optional<core::CoreErrorCode> error_code;
    std::chrono::milliseconds execution_time{0};
};

struct SourceFile {
    std::string path;
    std::string content;
    std::string language;
};

using FileCatalog = std::vector<SourceFile>;

struct AnalysisConfig {
    int max_concurrent_tasks = 10;
    std::chrono::milliseconds per_task_timeout{30000};
    std::set<std::string> enabled_analyzers;
    bool use_deep_tier = false;
    double deep_tier_sample_rate = 0.2;
    std::vector<std::string> skip_patterns;
    uint64_t random_seed = 0x5EED;
};

AnalysisConfig makeDefaultAnalysisConfig();

inline bool isMoreSevere(Severity lhs, Severity rhs) {
    return static_cast<int>(lhs) < static_cast<int>(rhs);
}

std::string to_string(Severity severity);
std::string to_string(OutcomeStatus status);
std::string to_string(ReportStatus status);

std::optional<Severity> parseSeverity(const std::string& value);

const std::vector<Severity>& allSeverities();

}}
