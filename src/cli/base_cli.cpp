#include "base_cli.hpp"
#include "theme.hpp"
#include <core/log.hpp>
#include <ssh/connection_factory.hpp>
#include <iostream>
#include <vector>
#include <fmt/format.h>

BaseCLI::BaseCLI() {
    auto config_result = Config::load();
    if (config_result.is_ok()) {
        config = config_result.value;
    } else {
        std::cout << theme::warn(config_result.error + " (using defaults)");
    }
    if (!config.log_path().empty()) {
        set_sshdesk_log_path(config.log_path());
    }

    registry = std::make_unique<ConnectionRegistry>(config.registry());
    service = std::make_unique<SshDeskService>(*registry, open_ssh_transport,
                                               config.session(), config.quoting());
}

void BaseCLI::add_command(const std::string& name,
                         CommandHandler handler,
                         const std::string& help) {
    commands_[name] = {handler, help};
}

bool BaseCLI::has_command(const std::string& name) const {
    return commands_.count(name) > 0;
}

bool BaseCLI::require_connection() {
    if (active_id.empty()) {
        std::cout << theme::fail("Not connected.");
        std::cout << theme::step("Use 'connect user@host' first.");
        return false;
    }
    return true;
}

void BaseCLI::execute_command(const std::string& command, const std::string& args) {
    auto it = commands_.find(command);
    if (it == commands_.end()) {
        std::cout << theme::fail("Unknown command: " + command);
        std::cout << theme::step("Type 'help' for available commands.");
        return;
    }

    try {
        it->second.first(*this, args);
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
    }
}

void BaseCLI::print_help() const {
    std::vector<std::pair<std::string, std::vector<std::string>>> categories = {
        {"Connection", {"connect", "use", "connections", "disconnect", "status"}},
        {"Shell",      {"exec", "pwd"}},
        {"General",    {"help", "clear", "quit", "exit"}},
    };

    for (const auto& [cat_name, cmd_names] : categories) {
        std::cout << "\n" << theme::color::TEAL << theme::color::BOLD
                  << "  " << cat_name << theme::color::RESET << "\n";

        for (const auto& name : cmd_names) {
            auto it = commands_.find(name);
            if (it != commands_.end()) {
                std::cout << theme::color::BLUE
                          << fmt::format("    {:<14}", name)
                          << theme::color::RESET
                          << theme::color::DIM
                          << it->second.second
                          << theme::color::RESET << "\n";
            }
        }
    }
    std::cout << "\n" << theme::dim("    Any other line runs on the active connection; prefix with '!' to force it.")
              << "\n\n";
}

std::string BaseCLI::get_prompt_string() const {
    // Readline uses \001 and \002 to wrap non-printing chars so it can
    // compute the visible prompt width correctly for cursor positioning.
    auto rl_esc = [](const std::string& code) {
        return std::string("\001") + code + std::string("\002");
    };

    if (active_id.empty()) {
        return rl_esc(theme::color::TEAL) + "sshdesk"
             + rl_esc(theme::color::RESET) + "> ";
    }

    auto dir = service->get_directory(active_id);
    return rl_esc(theme::color::GREEN) + active_id
         + rl_esc(theme::color::RESET) + ":"
         + rl_esc(theme::color::BLUE) + (dir.is_ok() ? dir.value : "?")
         + rl_esc(theme::color::RESET) + "$ ";
}
