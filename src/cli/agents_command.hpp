#pragma once

#include "main_command.hpp"
#include <CLI/CLI.hpp>

namespace code_sentinel {
namespace cli {

class AgentsCommand : public MainCommand {
public:
    AgentsCommand();

    void setup(CLI::App* subcommand) override;
    int execute() override;

private:
    bool json_output_ = false;
};

}}
