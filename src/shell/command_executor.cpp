#include "command_executor.hpp"
#include "command_rewriter.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>

CommandExecutor::CommandExecutor(ExecutorOptions options)
    : options_(std::move(options)) {}

CommandResult CommandExecutor::execute(ShellSession& session,
                                       const std::string& raw_command) const {
    const bool is_cd = is_directory_change(raw_command);
    const std::string before = session.current_directory();
    const std::string full_command = rewrite_command(raw_command, before, options_.quoting);

    ExecOptions exec_options;
    exec_options.request_pty = true;
    exec_options.terminal = options_.terminal;
    exec_options.timeout_secs = options_.timeout_secs;

    CommandResult result;
    result.current_directory = before;

    if (!session.is_active()) {
        result.stderr_data = "Command execution failed: Session is closed";
        return result;
    }

    auto outcome = session.transport().exec(full_command, exec_options);
    if (outcome.is_err()) {
        sshdesk_log(fmt::format("execute: '{}' not dispatched ({}): {}", full_command,
                                error_kind_name(outcome.kind), outcome.error));
        result.stderr_data = "Command execution failed: " + outcome.error;
        result.exit_status = EXIT_NOT_DISPATCHED;
        result.success = false;
        result.timed_out = (outcome.kind == ErrorKind::Timeout);
        return result;
    }

    const SSHResult& r = outcome.value;
    sshdesk_log_ssh("execute", full_command, r);

    result.exit_status = r.exit_code;
    result.success = (r.exit_code == 0);
    result.stderr_data = r.stderr_data;

    if (is_cd && r.exit_code == 0) {
        // stdout is the pwd we appended, not output the user asked for
        std::string directory = trimmed(r.stdout_data);
        session.set_current_directory(directory);
        result.current_directory = directory;
        return result;
    }

    result.stdout_data = r.stdout_data;
    return result;
}
