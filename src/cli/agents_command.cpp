#include "agents_command.hpp"
#include "code_sentinel/analyzer/analyzer_registry.hpp"
#include "code_sentinel/format/console_formatter.hpp"
#include "code_sentinel/format/json_formatter.hpp"
#include <iostream>

namespace code_sentinel {
namespace cli {

AgentsCommand::AgentsCommand() = default;

void AgentsCommand::setup(CLI::App* subcommand) {
    subcommand_ = subcommand;
    subcommand->add_flag("--json", json_output_, "List analyzers as JSON");
    markCalledOnParse();
}

int AgentsCommand::execute() {
    auto analyzers = analyzer::AnalyzerRegistry::withBuiltins().describeAll();

    if (json_output_) {
        std::cout << format::JsonFormatter::formatAnalyzers(analyzers).dump(2) << std::endl;
        return 0;
    }

    format::ConsoleFormatter formatter;
    formatter.formatAnalyzers(analyzers, std::cout);
    return 0;
}

}}
