#include "../base_cli.hpp"
#include "../target.hpp"
#include "../theme.hpp"
#include <iostream>
#include <fmt/format.h>
#include <core/config.hpp>
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/terminal.hpp>

static void do_connect(BaseCLI& cli, const std::string& arg) {
    auto parsed = parse_connect_args(arg, cli.config);
    if (parsed.is_err()) {
        std::cout << theme::fail(parsed.error);
        return;
    }
    ConnectTarget target = parsed.value;

    if ((target.needs_password || target.ask_passphrase) && !platform::stdin_is_tty()) {
        std::cout << theme::warn("stdin is not a terminal; reading the secret from it");
    }
    if (target.needs_password) {
        std::string password;
        if (!platform::read_secret(fmt::format("    Password for {}@{}: ",
                                               target.config.username, target.config.host),
                                   password)) {
            std::cout << theme::fail("No password entered.");
            return;
        }
        target.config.password = password;
    }
    if (target.ask_passphrase) {
        std::string passphrase;
        if (!platform::read_secret("    Key passphrase: ", passphrase)) {
            std::cout << theme::fail("No passphrase entered.");
            return;
        }
        target.config.passphrase = passphrase;
    }

    std::cout << theme::step(fmt::format("Connecting to {}:{}...",
                                         target.config.host, target.config.port));
    auto response = cli.service->connect(target.config, [](const std::string& msg) {
        std::cout << theme::dim("    " + msg) << "\n";
    });

    if (!response.success) {
        std::cout << theme::fail(response.message);
        return;
    }

    cli.active_id = *response.connection_id;
    std::cout << theme::ok(response.message);
    std::cout << theme::kv("Connection", cli.active_id);
}

static void do_use(BaseCLI& cli, const std::string& arg) {
    std::string id = trimmed(arg);
    if (id.empty()) {
        std::cout << "Usage: use <connection-id>\n";
        return;
    }
    auto dir = cli.service->get_directory(id);
    if (dir.is_err()) {
        std::cout << theme::fail(dir.error);
        return;
    }
    cli.active_id = id;
    std::cout << theme::ok(fmt::format("Using {} ({})", id, dir.value));
}

static void do_connections(BaseCLI& cli, const std::string&) {
    auto ids = cli.service->list_connections();
    std::cout << theme::section("Connections");
    if (ids.empty()) {
        std::cout << theme::dim("    No active connections") << "\n\n";
        return;
    }
    for (const auto& id : ids) {
        auto dir = cli.service->get_directory(id);
        std::string marker = (id == cli.active_id) ? theme::green("* ") : "  ";
        std::cout << "  " << marker << theme::blue(fmt::format("{:<32}", id))
                  << theme::dim(dir.is_ok() ? dir.value : "?") << "\n";
    }
    std::cout << "\n";
}

static void do_disconnect(BaseCLI& cli, const std::string& arg) {
    std::string id = trimmed(arg);
    if (id.empty()) id = cli.active_id;
    if (id.empty()) {
        std::cout << theme::fail("Not connected.");
        return;
    }

    if (!cli.service->disconnect(id)) {
        std::cout << theme::fail(MSG_NOT_FOUND);
        return;
    }
    if (id == cli.active_id) cli.active_id.clear();
    std::cout << theme::ok("Disconnected " + id);
}

static void do_status(BaseCLI& cli, const std::string&) {
    std::cout << theme::section("Status");

    if (global_config_exists()) {
        std::cout << theme::kv("Config", get_global_config_path().string());
    } else {
        std::cout << theme::kv("Config", "defaults (no config file)");
    }

    const auto& session = cli.config.session();
    const auto& registry = cli.config.registry();
    std::cout << theme::kv("Locking", registry.locking == LockingMode::Global
                                          ? "global" : "per_connection");
    std::cout << theme::kv("Duplicates", registry.duplicate_ids == DuplicateIdPolicy::Unique
                                             ? "unique" : "replace");
    std::cout << theme::kv("Quoting", cli.config.quoting() == QuotingMode::Posix
                                          ? "posix" : "literal");
    std::cout << theme::kv("Timeout", session.command_timeout > 0
                                          ? fmt::format("{}s", session.command_timeout)
                                          : "none");

    std::cout << theme::kv("Log", sshdesk_log_path());
    std::cout << theme::kv("Sessions", std::to_string(cli.service->list_connections().size()));
    if (!cli.active_id.empty()) {
        auto dir = cli.service->get_directory(cli.active_id);
        std::cout << theme::kv("Active", cli.active_id);
        std::cout << theme::kv("Directory", dir.is_ok() ? dir.value : dir.error);
    } else {
        std::cout << theme::kv("Active", "none");
    }

    std::cout << "\n";
}

void register_connection_commands(BaseCLI& cli) {
    cli.add_command("connect", do_connect, "Connect: <user@host[:port]|profile> [-p port] [-i key] [--passphrase]");
    cli.add_command("use", do_use, "Switch the active connection");
    cli.add_command("connections", do_connections, "List open connections");
    cli.add_command("disconnect", do_disconnect, "Close a connection (default: active)");
    cli.add_command("status", do_status, "Show configuration and connection status");
}
