#pragma once

#include "base_cli.hpp"
#include <string>

// Forward declarations for command registration
void register_connection_commands(BaseCLI& cli);
void register_shell_commands(BaseCLI& cli);

// Print a CommandResult the way a terminal would show it.
void print_command_result(const CommandResult& result);

// Run `command` on the active connection and print the result.
void run_remote(BaseCLI& cli, const std::string& command);

class SshDeskCLI : public BaseCLI {
public:
    SshDeskCLI();

    // REPL; connects first when connect_args is non-empty.
    void run_repl(const std::string& connect_args = "");

    // One REPL line: a REPL command, or remote input for the active connection.
    void handle_line(const std::string& line);

private:
    void register_all_commands();
};
