#pragma once

#include <string>
#include <core/types.hpp>

struct ExecOptions {
    bool request_pty = false;
    std::string terminal = "xterm";   // PTY type, no explicit dimensions
    int timeout_secs = 0;             // 0 = block until the channel closes
};

// One authenticated SSH connection that can run commands, each on a fresh
// exec channel. ShellSession owns exactly one of these.
//
// exec() reports transport trouble (channel open/exec/read failures,
// timeouts) as an error; a remote command that ran and exited non-zero is a
// successful Result carrying that exit code.
class Transport {
public:
    virtual ~Transport() = default;

    virtual Result<SSHResult> exec(const std::string& command,
                                   const ExecOptions& options) = 0;
    virtual void close() = 0;
    virtual bool is_active() const = 0;
};
