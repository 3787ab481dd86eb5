#pragma once

#include "main_command.hpp"
#include <CLI/CLI.hpp>
#include <string>

namespace code_sentinel {
namespace cli {

class ConfigCommand : public MainCommand {
public:
    ConfigCommand();

    void setup(CLI::App* subcommand) override;
    int execute() override;

private:
    CLI::App* init_cmd_ = nullptr;
    std::string init_path_;
    bool init_force_ = false;

    CLI::App* set_cmd_ = nullptr;
    std::string set_key_;
    std::string set_value_;

    CLI::App* get_cmd_ = nullptr;
    std::string get_key_;

    CLI::App* show_cmd_ = nullptr;

    CLI::App* validate_cmd_ = nullptr;
    std::string validate_path_;

    int executeInit();
    int executeSet();
    int executeGet();
    int executeShow();
    int executeValidate();
};

}}
