#include "code_sentinel/common/config.hpp"
#include "code_sentinel/common/constants.hpp"
#include "code_sentinel/common/paths.hpp"
#include "code_sentinel/common/logger.hpp"
#include <toml.hpp>
#include <fstream>
#include <sstream>
#include <algorithm>
#include <stdexcept>
#include <cstdlib>
#include <filesystem>
#include <unistd.h>

namespace code_sentinel {
namespace common {

namespace {

std::vector<std::string> splitList(const std::string& value) {
    std::vector<std::string> items;
    std::stringstream ss(value);
    std::string item;
    while (std::getline(ss, item, ',')) {
        item.erase(0, item.find_first_not_of(" \t"));
        auto last = item.find_last_not_of(" \t");
        if (last == std::string::npos) continue;
        item.erase(last + 1);
        items.push_back(item);
    }
    return items;
}

std::string joinList(const std::vector<std::string>& items) {
    std::string result;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) result += ",";
        result += items[i];
    }
    return result;
}

bool parseBool(const std::string& value) {
    return value == "true" || value == "1" || value == "yes";
}

double readNumber(const toml::value& section, const std::string& key) {
    const auto& v = toml::find(section, key);
    if (v.is_integer()) {
        return static_cast<double>(v.as_integer());
    }
    return toml::get<double>(v);
}

toml::array toArray(const std::vector<std::string>& items) {
    toml::array arr;
    for (const auto& item : items) {
        arr.emplace_back(item);
    }
    return arr;
}

const std::vector<std::pair<std::string, Severity>>& penaltyKeys() {
    static const std::vector<std::pair<std::string, Severity>> keys = {
        {"penalty_critical", Severity::CRITICAL},
        {"penalty_high", Severity::HIGH},
        {"penalty_medium", Severity::MEDIUM},
        {"penalty_low", Severity::LOW},
        {"penalty_info", Severity::INFO}
    };
    return keys;
}

}

int ScoringConfig::penaltyFor(Severity severity) const {
    auto it = penalties.find(severity);
    return it != penalties.end() ? it->second : 0;
}

size_t ScoringConfig::thresholdFor(const std::string& category) const {
    auto it = category_thresholds.find(category);
    return it != category_thresholds.end() ? it->second : category_threshold;
}

std::string to_string(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARN: return "WARN";
        case LogLevel::ERROR: return "ERROR";
    }
    return "INFO";
}

std::optional<LogLevel> parseLogLevel(const std::string& value) {
    std::string upper = value;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return std::toupper(c); });
    if (upper == "DEBUG") return LogLevel::DEBUG;
    if (upper == "INFO") return LogLevel::INFO;
    if (upper == "WARN" || upper == "WARNING") return LogLevel::WARN;
    if (upper == "ERROR") return LogLevel::ERROR;
    return std::nullopt;
}

Config& Config::instance() {
    static Config instance;
    return instance;
}

Config::Config() {
    global_ = createDefaultConfig();
}

ScoringConfig Config::createDefaultScoring() {
    using namespace constants::scoring;

    ScoringConfig scoring;
    scoring.penalties = {
        {Severity::CRITICAL, PENALTY_CRITICAL},
        {Severity::HIGH, PENALTY_HIGH},
        {Severity::MEDIUM, PENALTY_MEDIUM},
        {Severity::LOW, PENALTY_LOW},
        {Severity::INFO, PENALTY_INFO}
    };
    for (const auto& cutoff : GRADE_CUTOFFS) {
        scoring.grade_thresholds.push_back({cutoff.min_score, cutoff.grade});
    }
    scoring.failing_grade = FAILING_GRADE;
    scoring.category_threshold = DEFAULT_CATEGORY_THRESHOLD;
    scoring.category_thresholds[constants::analyzers::CODE_QUALITY] = CODE_QUALITY_CATEGORY_THRESHOLD;
    scoring.max_recommendations = MAX_RECOMMENDATIONS;
    scoring.top_files_limit = TOP_FILES_LIMIT;
    return scoring;
}

GlobalConfig Config::createDefaultConfig() {
    using namespace constants::config_defaults;

    GlobalConfig config;

    config.log_level = LogLevel::INFO;
    config.log_file = "";

    config.logging.rotation_size_mb = LOG_ROTATION_SIZE_MB;
    config.logging.max_files = LOG_MAX_FILES;
    config.logging.format = LogFormat::TEXT;

    config.analysis.enabled_agents = constants::analyzers::getDefaultEnabled();
    config.analysis.max_concurrent_files = MAX_CONCURRENT_FILES;
    config.analysis.timeout_per_file = TIMEOUT_PER_FILE;
    config.analysis.use_llm = USE_LLM;
    config.analysis.llm_sample_rate = LLM_SAMPLE_RATE;
    config.analysis.skip_patterns = constants::skip_patterns::getDefaults();
    config.analysis.random_seed = RANDOM_SEED;

    config.scoring = createDefaultScoring();

    return config;
}

void Config::reset() {
    global_ = createDefaultConfig();
    current_config_path_.clear();
}

std::optional<std::string> Config::findBestConfig() const {
    auto paths = PathManager::instance().getConfigSearchPaths();

    for (const auto& path : paths) {
        if (std::filesystem::exists(path) && access(path.c_str(), R_OK) == 0) {
            return path;
        }
    }

    return std::nullopt;
}

bool Config::load(const std::string& config_file) {
    try {
        global_ = createDefaultConfig();
        global_.log_file = PathManager::instance().getDefaultLogFile();

        if (!config_file.empty()) {
            current_config_path_ = config_file;
            if (!tryLoadTomlFile(config_file, "explicit config")) {
                Logger::instance().error("[Config] Explicit config unusable | path={}", config_file);
                return false;
            }
            return true;
        }

        auto best = findBestConfig();
        if (!best) {
            current_config_path_.clear();
            Logger::instance().debug("[Config] No config file found, using defaults");
            return true;
        }

        current_config_path_ = *best;
        if (!tryLoadTomlFile(*best, "main config")) {
            return false;
        }

        return true;
    } catch (const std::exception& e) {
        Logger::instance().error("[Config] Parse failed | error={}", e.what());
        return false;
    }
}

bool Config::tryLoadTomlFile(const std::string& path, const std::string& description) {
    if (!std::filesystem::exists(path)) {
        Logger::instance().debug("[Config] {} not found | path={}", description, path);
        return false;
    }

    if (access(path.c_str(), R_OK) != 0) {
        Logger::instance().debug("[Config] {} not readable | path={}", description, path);
        return false;
    }

    try {
        auto data = toml::parse(path);

        if (data.contains("global")) {
            auto global_section = data.at("global");

            if (global_section.contains("log_file")) {
                global_.log_file = toml::find<std::string>(global_section, "log_file");
            }
            if (global_section.contains("log_level")) {
                auto level = parseLogLevel(toml::find<std::string>(global_section, "log_level"));
                if (level) {
                    global_.log_level = *level;
                }
            }
        }

        if (data.contains("logging")) {
            auto logging_section = data.at("logging");

            if (logging_section.contains("rotation_size_mb")) {
                global_.logging.rotation_size_mb = toml::find<size_t>(logging_section, "rotation_size_mb");
            }
            if (logging_section.contains("max_files")) {
                global_.logging.max_files = toml::find<size_t>(logging_section, "max_files");
            }
            if (logging_section.contains("format")) {
                std::string format_str = toml::find<std::string>(logging_section, "format");
                global_.logging.format = format_str == "json" ? LogFormat::JSON : LogFormat::TEXT;
            }
        }

        if (data.contains("analysis")) {
            auto analysis_section = data.at("analysis");
            auto& analysis = global_.analysis;

            if (analysis_section.contains("enabled_agents")) {
                analysis.enabled_agents =
                    toml::find<std::vector<std::string>>(analysis_section, "enabled_agents");
            }
            if (analysis_section.contains("max_concurrent_files")) {
                analysis.max_concurrent_files = toml::find<int>(analysis_section, "max_concurrent_files");
            }
            if (analysis_section.contains("timeout_per_file")) {
                analysis.timeout_per_file = toml::find<int>(analysis_section, "timeout_per_file");
            }
            if (analysis_section.contains("use_llm")) {
                analysis.use_llm = toml::find<bool>(analysis_section, "use_llm");
            }
            if (analysis_section.contains("llm_sample_rate")) {
                analysis.llm_sample_rate = readNumber(analysis_section, "llm_sample_rate");
            }
            if (analysis_section.contains("skip_patterns")) {
                analysis.skip_patterns =
                    toml::find<std::vector<std::string>>(analysis_section, "skip_patterns");
            }
            if (analysis_section.contains("random_seed")) {
                analysis.random_seed = static_cast<uint64_t>(
                    toml::find<std::int64_t>(analysis_section, "random_seed"));
            }
        }

        if (data.contains("scoring")) {
            auto scoring_section = data.at("scoring");
            auto& scoring = global_.scoring;

            for (const auto& [key, severity] : penaltyKeys()) {
                if (scoring_section.contains(key)) {
                    scoring.penalties[severity] = toml::find<int>(scoring_section, key);
                }
            }
            if (scoring_section.contains("category_threshold")) {
                scoring.category_threshold = toml::find<size_t>(scoring_section, "category_threshold");
            }
            if (scoring_section.contains("max_recommendations")) {
                scoring.max_recommendations = toml::find<size_t>(scoring_section, "max_recommendations");
            }
            if (scoring_section.contains("top_files_limit")) {
                scoring.top_files_limit = toml::find<size_t>(scoring_section, "top_files_limit");
            }
            if (scoring_section.contains("category_thresholds")) {
                for (const auto& [category, value] : toml::find(scoring_section, "category_thresholds").as_table()) {
                    scoring.category_thresholds[category] = static_cast<size_t>(value.as_integer());
                }
            }
            if (scoring_section.contains("grade_cutoffs")) {
                std::vector<GradeThreshold> thresholds;
                for (const auto& [grade, value] : toml::find(scoring_section, "grade_cutoffs").as_table()) {
                    thresholds.push_back({static_cast<int>(value.as_integer()), grade});
                }
                std::sort(thresholds.begin(), thresholds.end(),
                          [](const GradeThreshold& a, const GradeThreshold& b) {
                              return a.min_score > b.min_score;
                          });
                scoring.grade_thresholds = thresholds;
            }
        }

        Logger::instance().info("[Config] {} loaded | path={}", description, path);
        return true;
    } catch (const std::exception& e) {
        Logger::instance().error("[Config] {} parse failed | path={} | error={}",
                                 description, path, e.what());
        return false;
    }
}

bool Config::save(const std::string& config_file) {
    try {
        std::string effective_config_file = config_file;
        if (effective_config_file.empty()) {
            effective_config_file = current_config_path_.empty()
                ? PathManager::instance().getUserConfigFile()
                : current_config_path_;
        }
        if (effective_config_file.empty()) {
            Logger::instance().error("[Config] No writable config location");
            return false;
        }

        const auto& analysis = global_.analysis;
        const auto& scoring = global_.scoring;

        toml::table scoring_table{
            {"category_threshold", scoring.category_threshold},
            {"max_recommendations", scoring.max_recommendations},
            {"top_files_limit", scoring.top_files_limit}
        };
        for (const auto& [key, severity] : penaltyKeys()) {
            scoring_table[key] = scoring.penaltyFor(severity);
        }
        toml::table category_table;
        for (const auto& [category, threshold] : scoring.category_thresholds) {
            category_table[category] = threshold;
        }
        scoring_table["category_thresholds"] = category_table;
        toml::table grade_table;
        for (const auto& threshold : scoring.grade_thresholds) {
            grade_table[threshold.grade] = threshold.min_score;
        }
        scoring_table["grade_cutoffs"] = grade_table;

        toml::value data = toml::table{
            {"global", toml::table{
                {"log_file", global_.log_file},
                {"log_level", to_string(global_.log_level)}
            }},
            {"logging", toml::table{
                {"rotation_size_mb", global_.logging.rotation_size_mb},
                {"max_files", global_.logging.max_files},
                {"format", global_.logging.format == LogFormat::JSON ? "json" : "text"}
            }},
            {"analysis", toml::table{
                {"enabled_agents", toArray(analysis.enabled_agents)},
                {"max_concurrent_files", analysis.max_concurrent_files},
                {"timeout_per_file", analysis.timeout_per_file},
                {"use_llm", analysis.use_llm},
                {"llm_sample_rate", analysis.llm_sample_rate},
                {"skip_patterns", toArray(analysis.skip_patterns)},
                {"random_seed", static_cast<std::int64_t>(analysis.random_seed)}
            }},
            {"scoring", scoring_table}
        };

        std::filesystem::path parent = std::filesystem::path(effective_config_file).parent_path();
        if (!parent.empty() && !std::filesystem::exists(parent)) {
            std::filesystem::create_directories(parent);
        }

        std::ofstream file(effective_config_file);
        if (!file) {
            Logger::instance().error("[Config] File open failed | path={}", effective_config_file);
            return false;
        }

        file << toml::format(data);
        file.close();

        current_config_path_ = effective_config_file;

        Logger::instance().info("[Config] Saved | path={}", effective_config_file);
        return true;
    } catch (const std::exception& e) {
        Logger::instance().error("[Config] Save failed | error={}", e.what());
        return false;
    }
}

bool Config::exists() const {
    if (!current_config_path_.empty()) {
        return std::filesystem::exists(current_config_path_);
    }
    return findBestConfig().has_value();
}

std::vector<std::string> Config::knownKeys() {
    return {
        "log_level", "log_file",
        "logging.rotation_size_mb", "logging.max_files", "logging.format",
        "analysis.enabled_agents", "analysis.max_concurrent_files", "analysis.timeout_per_file",
        "analysis.use_llm", "analysis.llm_sample_rate", "analysis.skip_patterns",
        "analysis.random_seed",
        "scoring.penalty_critical", "scoring.penalty_high", "scoring.penalty_medium",
        "scoring.penalty_low", "scoring.penalty_info", "scoring.category_threshold",
        "scoring.max_recommendations", "scoring.top_files_limit"
    };
}

void Config::setValue(const std::string& key, const std::string& value) {
    auto& analysis = global_.analysis;
    auto& scoring = global_.scoring;

    if (key == "log_file") global_.log_file = value;
    else if (key == "log_level") {
        auto level = parseLogLevel(value);
        if (!level) {
            throw std::invalid_argument("Invalid log level: " + value);
        }
        global_.log_level = *level;
    }
    else if (key == "logging.rotation_size_mb") global_.logging.rotation_size_mb = std::stoull(value);
    else if (key == "logging.max_files") global_.logging.max_files = std::stoull(value);
    else if (key == "logging.format") {
        global_.logging.format = (value == "json") ? LogFormat::JSON : LogFormat::TEXT;
    }
    else if (key == "analysis.enabled_agents") analysis.enabled_agents = splitList(value);
    else if (key == "analysis.max_concurrent_files") analysis.max_concurrent_files = std::stoi(value);
    else if (key == "analysis.timeout_per_file") analysis.timeout_per_file = std::stoi(value);
    else if (key == "analysis.use_llm") analysis.use_llm = parseBool(value);
    else if (key == "analysis.llm_sample_rate") analysis.llm_sample_rate = std::stod(value);
    else if (key == "analysis.skip_patterns") analysis.skip_patterns = splitList(value);
    else if (key == "analysis.random_seed") analysis.random_seed = std::stoull(value);
    else if (key == "scoring.penalty_critical") scoring.penalties[Severity::CRITICAL] = std::stoi(value);
    else if (key == "scoring.penalty_high") scoring.penalties[Severity::HIGH] = std::stoi(value);
    else if (key == "scoring.penalty_medium") scoring.penalties[Severity::MEDIUM] = std::stoi(value);
    else if (key == "scoring.penalty_low") scoring.penalties[Severity::LOW] = std::stoi(value);
    else if (key == "scoring.penalty_info") scoring.penalties[Severity::INFO] = std::stoi(value);
    else if (key == "scoring.category_threshold") scoring.category_threshold = std::stoull(value);
    else if (key == "scoring.max_recommendations") scoring.max_recommendations = std::stoull(value);
    else if (key == "scoring.top_files_limit") scoring.top_files_limit = std::stoull(value);
    else {
        throw std::invalid_argument("Unknown configuration key: " + key);
    }
}

std::optional<std::string> Config::getValue(const std::string& key) const {
    const auto& analysis = global_.analysis;
    const auto& scoring = global_.scoring;

    if (key == "log_file") return global_.log_file;
    else if (key == "log_level") return to_string(global_.log_level);
    else if (key == "logging.rotation_size_mb") return std::to_string(global_.logging.rotation_size_mb);
    else if (key == "logging.max_files") return std::to_string(global_.logging.max_files);
    else if (key == "logging.format") return global_.logging.format == LogFormat::JSON ? "json" : "text";
    else if (key == "analysis.enabled_agents") return joinList(analysis.enabled_agents);
    else if (key == "analysis.max_concurrent_files") return std::to_string(analysis.max_concurrent_files);
    else if (key == "analysis.timeout_per_file") return std::to_string(analysis.timeout_per_file);
    else if (key == "analysis.use_llm") return analysis.use_llm ? "true" : "false";
    else if (key == "analysis.llm_sample_rate") return fmt::format("{}", analysis.llm_sample_rate);
    else if (key == "analysis.skip_patterns") return joinList(analysis.skip_patterns);
    else if (key == "analysis.random_seed") return std::to_string(analysis.random_seed);
    else if (key == "scoring.penalty_critical") return std::to_string(scoring.penaltyFor(Severity::CRITICAL));
    else if (key == "scoring.penalty_high") return std::to_string(scoring.penaltyFor(Severity::HIGH));
    else if (key == "scoring.penalty_medium") return std::to_string(scoring.penaltyFor(Severity::MEDIUM));
    else if (key == "scoring.penalty_low") return std::to_string(scoring.penaltyFor(Severity::LOW));
    else if (key == "scoring.penalty_info") return std::to_string(scoring.penaltyFor(Severity::INFO));
    else if (key == "scoring.category_threshold") return std::to_string(scoring.category_threshold);
    else if (key == "scoring.max_recommendations") return std::to_string(scoring.max_recommendations);
    else if (key == "scoring.top_files_limit") return std::to_string(scoring.top_files_limit);

    return std::nullopt;
}

std::string Config::getConfigPath() const {
    if (!current_config_path_.empty()) {
        return current_config_path_;
    }
    return PathManager::instance().getUserConfigFile();
}

AnalysisConfig Config::toAnalysisConfig() const {
    const auto& analysis = global_.analysis;

    AnalysisConfig config;
    config.max_concurrent_tasks = analysis.max_concurrent_files;
    config.per_task_timeout = std::chrono::seconds(analysis.timeout_per_file);
    config.enabled_analyzers = std::set<std::string>(analysis.enabled_agents.begin(),
                                                     analysis.enabled_agents.end());
    config.use_deep_tier = analysis.use_llm;
    config.deep_tier_sample_rate = analysis.llm_sample_rate;
    config.skip_patterns = analysis.skip_patterns;
    config.random_seed = analysis.random_seed;
    return config;
}

}}
