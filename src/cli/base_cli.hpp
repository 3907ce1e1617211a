#pragma once

#include <string>
#include <map>
#include <memory>
#include <functional>
#include <optional>
#include <core/config.hpp>
#include <managers/connection_registry.hpp>
#include <managers/sshdesk_service.hpp>

class BaseCLI {
public:
    BaseCLI();
    virtual ~BaseCLI() = default;

    using CommandHandler = std::function<void(BaseCLI&, const std::string&)>;

    void add_command(const std::string& name,
                    CommandHandler handler,
                    const std::string& help);
    bool has_command(const std::string& name) const;

    // True (and prints nothing) if a connection is selected.
    bool require_connection();

    void execute_command(const std::string& command, const std::string& args = "");
    void print_help() const;

    // Public state
    Config config;
    std::unique_ptr<ConnectionRegistry> registry;
    std::unique_ptr<SshDeskService> service;
    std::string active_id;          // connection plain input goes to
    bool quit_requested = false;

    // Returns the prompt string for readline
    std::string get_prompt_string() const;

protected:
    std::map<std::string, std::pair<CommandHandler, std::string>> commands_;
};
