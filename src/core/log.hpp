#pragma once

#include <string>
#include <core/types.hpp>

// Debug log: <tmp>/sshdesk_debug.log unless config.yaml sets log.path.
std::string sshdesk_log_path();
void set_sshdesk_log_path(const std::string& path);

// Append a timestamped line. Safe to call from any thread.
void sshdesk_log(const std::string& msg);

// Log one remote command and what came back (output truncated).
void sshdesk_log_ssh(const std::string& label, const std::string& cmd,
                     const SSHResult& r);
