#include "main_command.hpp"
#include <unistd.h>

namespace code_sentinel {
namespace cli {

MainCommand::MainCommand() = default;
MainCommand::~MainCommand() = default;

void MainCommand::markCalledOnParse() {
    subcommand_->callback([this]() { was_called_ = true; });
}

bool MainCommand::isStdoutTerminal() {
    return isatty(STDOUT_FILENO);
}

bool MainCommand::isStderrTerminal() {
    return isatty(STDERR_FILENO);
}

}}
