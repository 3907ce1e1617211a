#pragma once

#include <string>
#include <core/types.hpp>
#include "shell_session.hpp"

struct ExecutorOptions {
    std::string terminal = "xterm";
    int timeout_secs = 0;                       // 0 = no timeout
    QuotingMode quoting = QuotingMode::Literal;
};

// Runs one command against a ShellSession as if the remote shell had kept
// its working directory between commands.
//
// A cd is sent as "cd <arg> && pwd"; on exit 0 the printed directory becomes
// the session's directory and stdout is cleared. Anything else runs behind a
// "cd '<dir>' &&" prefix. Remote failures and transport trouble both come
// back inside the CommandResult; the session stays usable either way.
//
// Not thread-safe per session: callers serialize commands on one session
// (ConnectionRegistry does).
class CommandExecutor {
public:
    explicit CommandExecutor(ExecutorOptions options = {});

    CommandResult execute(ShellSession& session, const std::string& raw_command) const;

    const ExecutorOptions& options() const { return options_; }

private:
    ExecutorOptions options_;
};
