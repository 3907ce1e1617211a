#include "sshdesk_cli.hpp"
#include "theme.hpp"
#include <core/config.hpp>
#include <core/utils.hpp>
#include <iostream>
#include <sstream>
#include <cstdlib>
#include <readline/readline.h>
#include <readline/history.h>

SshDeskCLI::SshDeskCLI() : BaseCLI() {
    register_all_commands();
}

void SshDeskCLI::register_all_commands() {
    add_command("help", [this](BaseCLI&, const std::string&) {
        this->print_help();
    }, "Show this help message");

    add_command("quit", [](BaseCLI& cli, const std::string&) {
        cli.quit_requested = true;
    }, "Disconnect everything and exit");

    add_command("exit", [](BaseCLI& cli, const std::string&) {
        cli.quit_requested = true;
    }, "Disconnect everything and exit");

    add_command("clear", [](BaseCLI&, const std::string&) {
        std::cout << "\033[2J\033[H" << std::flush;
    }, "Clear the screen");

    register_connection_commands(*this);
    register_shell_commands(*this);
}

void SshDeskCLI::handle_line(const std::string& raw_line) {
    std::string line = trimmed(raw_line);
    if (line.empty()) return;

    if (line[0] == '!') {
        if (!require_connection()) return;
        run_remote(*this, trimmed(line.substr(1)));
        return;
    }

    std::istringstream iss(line);
    std::string command;
    iss >> command;

    std::string args;
    std::getline(iss, args);
    if (!args.empty() && args[0] == ' ') {
        args = args.substr(1);
    }

    if (has_command(command)) {
        execute_command(command, args);
        return;
    }

    if (active_id.empty()) {
        std::cout << theme::fail("Unknown command: " + command);
        std::cout << theme::step("Type 'help' for available commands, or 'connect user@host'.");
        return;
    }

    run_remote(*this, line);
}

void SshDeskCLI::run_repl(const std::string& connect_args) {
    std::cout << theme::banner();

    if (!connect_args.empty()) {
        execute_command("connect", connect_args);
    } else {
        std::cout << theme::step("Type 'connect user@host' to start, 'help' for commands.");
    }

    std::string line;
    while (!quit_requested) {
        std::string prompt = get_prompt_string();
        char* raw = readline(prompt.c_str());
        if (!raw) {
            std::cout << "\n";
            break;  // EOF / Ctrl-D
        }

        line = raw;
        free(raw);

        if (trimmed(line).empty()) {
            continue;
        }

        add_history(line.c_str());
        handle_line(line);
    }

    // Cleanup
    std::cout << theme::dim("    Disconnecting...") << "\n";
    active_id.clear();
    registry->clear();
}
