#include "config_command.hpp"
#include "code_sentinel/analyzer/analyzer_registry.hpp"
#include "code_sentinel/common/config.hpp"
#include "code_sentinel/common/logger.hpp"
#include "code_sentinel/common/paths.hpp"
#include "code_sentinel/config/validator.hpp"
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <set>

namespace code_sentinel {
namespace cli {

namespace {

std::set<std::string> knownAnalyzerIds() {
    auto ids = analyzer::AnalyzerRegistry::withBuiltins().knownIds();
    return std::set<std::string>(ids.begin(), ids.end());
}

}

ConfigCommand::ConfigCommand() = default;

void ConfigCommand::setup(CLI::App* subcommand) {
    subcommand_ = subcommand;

    init_cmd_ = subcommand->add_subcommand("init", "Write a configuration file with current values");
    init_cmd_->add_option("-o,--output", init_path_, "Destination (default: user config file)");
    init_cmd_->add_flag("-f,--force", init_force_, "Overwrite an existing file");
    init_cmd_->callback([this]() { was_called_ = true; });

    set_cmd_ = subcommand->add_subcommand("set", "Set configuration value");
    set_cmd_->add_option("key", set_key_, "Configuration key")->required();
    set_cmd_->add_option("value", set_value_, "Configuration value")->required();
    set_cmd_->callback([this]() { was_called_ = true; });

    get_cmd_ = subcommand->add_subcommand("get", "Get configuration value");
    get_cmd_->add_option("key", get_key_, "Configuration key (optional)");
    get_cmd_->callback([this]() { was_called_ = true; });

    show_cmd_ = subcommand->add_subcommand("show", "Show effective configuration");
    show_cmd_->callback([this]() { was_called_ = true; });

    validate_cmd_ = subcommand->add_subcommand("validate", "Validate configuration");
    validate_cmd_->add_option("path", validate_path_, "Configuration file (default: active file)");
    validate_cmd_->callback([this]() { was_called_ = true; });
}

int ConfigCommand::execute() {
    if (init_cmd_->parsed()) {
        return executeInit();
    } else if (set_cmd_->parsed()) {
        return executeSet();
    } else if (get_cmd_->parsed()) {
        return executeGet();
    } else if (show_cmd_->parsed()) {
        return executeShow();
    } else if (validate_cmd_->parsed()) {
        return executeValidate();
    }

    std::cout << subcommand_->help() << std::endl;
    return 0;
}

int ConfigCommand::executeInit() {
    std::string path = init_path_.empty() ? common::PathManager::instance().getUserConfigFile() : init_path_;

    if (std::filesystem::exists(path) && !init_force_) {
        std::cerr << "Configuration file already exists: " << path << "\n";
        std::cerr << "Use --force to overwrite.\n";
        return 1;
    }

    if (!config::ConfigValidator::canCreateDirectory(std::filesystem::path(path).parent_path().string())) {
        std::cerr << "\033[31mError: Permission denied\033[0m\n\n";
        std::cerr << "Cannot create configuration directory for " << path << "\n";
        return 1;
    }

    if (!common::Config::instance().save(path)) {
        std::cerr << "Failed to write configuration file: " << path << "\n";
        return 1;
    }

    std::cout << "Configuration written to " << path << "\n";
    return 0;
}

int ConfigCommand::executeSet() {
    auto& config = common::Config::instance();

    try {
        config.setValue(set_key_, set_value_);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        std::cerr << "Known keys:\n";
        for (const auto& key : common::Config::knownKeys()) {
            std::cerr << "  " << key << "\n";
        }
        return 1;
    }

    config::ConfigValidator validator(knownAnalyzerIds());
    auto result = validator.validate(config.global());
    if (!result.is_valid) {
        for (const auto& error : result.errors) {
            std::cerr << "  ERROR: " << error << "\n";
        }
        std::cerr << "Value rejected, configuration not saved.\n";
        return 1;
    }

    if (!config.save()) {
        std::cerr << "Failed to save configuration: " << config.getConfigPath() << "\n";
        return 1;
    }

    std::cout << set_key_ << " = " << *config.getValue(set_key_) << "\n";
    return 0;
}

int ConfigCommand::executeGet() {
    const auto& config = common::Config::instance();

    if (get_key_.empty()) {
        for (const auto& key : common::Config::knownKeys()) {
            std::cout << std::left << std::setw(30) << key << " = " << config.getValue(key).value_or("") << "\n";
        }
        return 0;
    }

    auto value = config.getValue(get_key_);
    if (!value) {
        std::cerr << "Unknown configuration key: " << get_key_ << "\n";
        return 1;
    }
    std::cout << *value << "\n";
    return 0;
}

int ConfigCommand::executeShow() {
    const auto& config = common::Config::instance();

    if (config.exists()) {
        std::cout << "Configuration file: " << config.getConfigPath() << "\n\n";
    } else {
        std::cout << "Configuration file: (none, using built-in defaults)\n\n";
    }

    std::string section;
    for (const auto& key : common::Config::knownKeys()) {
        auto dot = key.find('.');
        std::string current = dot == std::string::npos ? "global" : key.substr(0, dot);
        if (current != section) {
            if (!section.empty()) std::cout << "\n";
            std::cout << "[" << current << "]\n";
            section = current;
        }
        std::string name = dot == std::string::npos ? key : key.substr(dot + 1);
        std::cout << "  " << std::left << std::setw(24) << name << config.getValue(key).value_or("") << "\n";
    }

    const auto& scoring = config.global().scoring;
    std::cout << "\n[scoring.grade_cutoffs]\n";
    for (const auto& threshold : scoring.grade_thresholds) {
        std::cout << "  " << std::left << std::setw(24) << threshold.grade << threshold.min_score << "\n";
    }
    std::cout << "  " << std::left << std::setw(24) << scoring.failing_grade << "below\n";
    return 0;
}

int ConfigCommand::executeValidate() {
    std::string config_path = validate_path_.empty() ? common::Config::instance().getConfigPath() : validate_path_;

    std::cout << "Validating: " << config_path << "\n\n";

    config::ConfigValidator validator(knownAnalyzerIds());
    auto result = validator.validateFile(config_path);

    for (const auto& error : result.errors) {
        std::cout << "  ERROR: " << error << "\n";
    }

    for (const auto& warning : result.warnings) {
        std::cout << "  WARNING: " << warning << "\n";
    }

    std::cout << "\nErrors: " << result.errors.size()
              << "  Warnings: " << result.warnings.size() << "\n";

    if (result.is_valid) {
        std::cout << "\nConfiguration is valid.\n";
        return 0;
    }

    std::cout << "\nConfiguration has errors.\n";
    return 1;
}

}}
