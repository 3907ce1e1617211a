#include <iostream>
#include <string>
#include "cli/sshdesk_cli.hpp"
#include "cli/theme.hpp"
#include <core/config.hpp>
#include <core/constants.hpp>

void print_usage() {
    std::cout << theme::banner();
    std::cout << theme::section("Usage");
    std::cout << theme::color::BLUE << "    sshdesk"
              << theme::color::RESET << theme::color::DIM
              << "                         Enter the REPL" << theme::color::RESET << "\n";
    std::cout << theme::color::BLUE << "    sshdesk connect "
              << theme::color::RESET << theme::color::YELLOW << "<target>"
              << theme::color::RESET << theme::color::DIM
              << "        Connect, then enter the REPL" << theme::color::RESET << "\n";
    std::cout << theme::color::BLUE << "    sshdesk init"
              << theme::color::RESET << theme::color::DIM
              << "                    Write a default config.yaml" << theme::color::RESET << "\n";
    std::cout << "\n";
    std::cout << theme::color::DIM
              << "    target: user@host[:port] | profile  [-p port] [-i key] [--passphrase]\n\n"
              << "    sshdesk --version               Show version\n"
              << "    sshdesk --help                  Show this help"
              << theme::color::RESET << "\n\n";
}

int main(int argc, char** argv) {
    try {
        if (argc >= 2) {
            std::string cmd = argv[1];

            if (cmd == "--version") {
                std::cout << theme::color::TEAL << theme::color::BOLD << "sshdesk"
                          << theme::color::RESET << theme::color::DIM
                          << " version " << SSHDESK_VERSION << theme::color::RESET << "\n";
                return 0;
            } else if (cmd == "--help") {
                print_usage();
                return 0;
            } else if (cmd == "init") {
                if (global_config_exists()) {
                    std::cout << theme::info("Config already exists: " + get_global_config_path().string());
                    return 0;
                }
                auto created = create_default_global_config();
                if (created.is_err()) {
                    std::cout << theme::fail(created.error);
                    return 1;
                }
                std::cout << theme::ok("Wrote " + get_global_config_path().string());
                return 0;
            } else if (cmd != "connect") {
                std::cout << theme::fail("Unknown command: " + cmd);
                print_usage();
                return 1;
            }
        }

        std::string connect_args;
        for (int i = 2; i < argc; ++i) {
            if (!connect_args.empty()) connect_args += " ";
            connect_args += argv[i];
        }
        if (argc >= 2 && connect_args.empty()) {
            std::cout << theme::fail("Missing connection target.");
            std::cout << theme::step("Usage: sshdesk connect <user@host[:port]|profile>");
            return 1;
        }

        SshDeskCLI cli;
        cli.run_repl(connect_args);
        return 0;
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
        return 1;
    }
}
