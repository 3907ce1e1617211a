#pragma once

#include <string>
#include <vector>
#include <core/types.hpp>
#include <ssh/connection_factory.hpp>
#include <shell/command_executor.hpp>
#include "connection_registry.hpp"

// Headless service facade: the five operations any frontend drives.
// The registry is injected and outlives the service; nothing here is global.
class SshDeskService {
public:
    SshDeskService(ConnectionRegistry& registry,
                   TransportFactory factory,
                   SessionSettings session = {},
                   QuotingMode quoting = QuotingMode::Literal);

    // ── Connection lifecycle ──────────────────────────────────

    // Validate, connect, authenticate, probe the starting directory and
    // register. Never fails at the boundary: every problem comes back as
    // success=false with a message, and nothing is registered.
    ConnectResponse connect(const ConnectionConfig& config, StatusCallback cb = nullptr);

    // True if the id existed and was removed.
    bool disconnect(const std::string& connection_id);

    std::vector<std::string> list_connections() const;

    // ── Shell operations ──────────────────────────────────────

    // Errors: NotFound, LockUnavailable. A remote command that fails, or
    // cannot be dispatched, is a successful Result with success=false.
    Result<CommandResult> execute(const std::string& connection_id, const std::string& command);

    // Errors: NotFound
    Result<std::string> get_directory(const std::string& connection_id) const;

    // ── State queries ─────────────────────────────────────────

    const SessionSettings& session_settings() const { return session_; }
    const CommandExecutor& executor() const { return executor_; }

private:
    ConnectionRegistry& registry_;
    TransportFactory factory_;
    SessionSettings session_;
    CommandExecutor executor_;
};
