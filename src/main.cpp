#include <CLI/CLI.hpp>
#include <iostream>
#include <memory>
#include <string>

#include "code_sentinel/common/config.hpp"
#include "code_sentinel/common/constants.hpp"
#include "code_sentinel/common/logger.hpp"
#include "cli/main_command.hpp"
#include "cli/agents_command.hpp"
#include "cli/analyze_command.hpp"
#include "cli/config_command.hpp"

namespace {

// Options are parsed after setup, so the config path and log level are
// looked up in argv first; config and logging must exist before CLI11 runs.
std::string find_option_value(int argc, char** argv, const std::string& long_name, const std::string& short_name) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == long_name || (!short_name.empty() && arg == short_name)) && i + 1 < argc) {
            return argv[i + 1];
        }
        std::string prefix = long_name + "=";
        if (arg.rfind(prefix, 0) == 0) {
            return arg.substr(prefix.size());
        }
    }
    return "";
}

}

int main(int argc, char** argv) {
    using namespace code_sentinel;

    try {
        CLI::App app{"Multi-analyzer static code analysis", constants::system::APPLICATION_NAME};
        app.set_version_flag("--version,-v", constants::version::getFullVersion());
        app.require_subcommand(0, 1);

        std::string config_file;
        std::string log_level;
        app.add_option("-c,--config", config_file, "Configuration file path");
        app.add_option("--log-level", log_level, "Log level: error, warn, info, debug")
           ->check(CLI::IsMember({"error", "warn", "info", "debug"}, CLI::ignore_case));

        auto& config = common::Config::instance();
        std::string early_config = find_option_value(argc, argv, "--config", "-c");
        if (!config.load(early_config)) {
            std::cerr << "Error: Configuration file unusable: "
                      << (early_config.empty() ? config.getConfigPath() : early_config) << std::endl;
            if (early_config.empty()) {
                std::cerr << "Run: code-sentinel config validate" << std::endl;
            }
            return 1;
        }

        auto level = config.global().log_level;
        std::string early_level = find_option_value(argc, argv, "--log-level", "");
        if (auto parsed = common::parseLogLevel(early_level)) {
            level = *parsed;
        }

        const auto& log_file = config.global().log_file;
        if (!log_file.empty()) {
            common::Logger::instance().initialize(
                common::LogMode::FILE_ONLY,
                log_file,
                level,
                config.global().logging
            );
        } else {
            common::Logger::instance().initialize(
                common::LogMode::CONSOLE_ONLY,
                "",
                early_level.empty() ? common::LogLevel::WARN : level,
                config.global().logging
            );
        }

        auto analyze_cmd = std::make_unique<cli::AnalyzeCommand>();
        auto agents_cmd = std::make_unique<cli::AgentsCommand>();
        auto config_cmd = std::make_unique<cli::ConfigCommand>();

        analyze_cmd->setup(app.add_subcommand("analyze", "Analyze a file catalog or directory"));
        agents_cmd->setup(app.add_subcommand("agents", "List available analyzers"));
        config_cmd->setup(app.add_subcommand("config", "Manage configuration"));

        CLI11_PARSE(app, argc, argv);

        int exit_code = 0;
        if (analyze_cmd->wasCalled()) {
            exit_code = analyze_cmd->execute();
        } else if (agents_cmd->wasCalled()) {
            exit_code = agents_cmd->execute();
        } else if (config_cmd->wasCalled()) {
            exit_code = config_cmd->execute();
        } else {
            std::cout << app.help() << std::endl;
        }

        common::Logger::instance().flush();
        return exit_code;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
