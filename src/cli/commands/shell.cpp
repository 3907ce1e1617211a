#include "../sshdesk_cli.hpp"
#include "../theme.hpp"
#include <iostream>
#include <fmt/format.h>
#include <shell/command_rewriter.hpp>

void print_command_result(const CommandResult& result) {
    std::cout << result.stdout_data;
    if (!result.stdout_data.empty() && result.stdout_data.back() != '\n') {
        std::cout << "\n";
    }
    if (!result.stderr_data.empty()) {
        std::cout << theme::red(result.stderr_data);
        if (result.stderr_data.back() != '\n') std::cout << "\n";
    }
    if (result.timed_out) {
        std::cout << theme::warn("Command timed out; the remote process may still be running.");
    } else if (!result.success) {
        std::cout << theme::dim(fmt::format("    exit {}", result.exit_status)) << "\n";
    }
    std::cout << std::flush;
}

void run_remote(BaseCLI& cli, const std::string& command) {
    if (command.empty()) return;

    auto result = cli.service->execute(cli.active_id, command);
    if (result.is_err()) {
        std::cout << theme::fail(result.error);
        return;
    }
    print_command_result(result.value);

    // Literal quoting wraps the tracked directory in '...' unescaped.
    const auto& dir = result.value.current_directory;
    if (cli.config.quoting() == QuotingMode::Literal && is_directory_change(command)
        && result.value.success && has_shell_metacharacters(dir)) {
        std::cout << theme::warn(fmt::format(
            "'{}' contains shell metacharacters; set commands.quoting: posix to escape it", dir));
    }
}

static void do_exec(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_connection()) return;
    if (arg.empty()) {
        std::cout << "Usage: exec <command>\n";
        return;
    }
    run_remote(cli, arg);
}

static void do_pwd(BaseCLI& cli, const std::string&) {
    if (!cli.require_connection()) return;
    auto dir = cli.service->get_directory(cli.active_id);
    if (dir.is_err()) {
        std::cout << theme::fail(dir.error);
        return;
    }
    std::cout << dir.value << "\n";
}

void register_shell_commands(BaseCLI& cli) {
    cli.add_command("exec", do_exec, "Run a command on the active connection");
    cli.add_command("pwd", do_pwd, "Show the tracked directory (no round trip)");
}
