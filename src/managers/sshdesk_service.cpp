#include "sshdesk_service.hpp"
#include <core/connection_id.hpp>
#include <core/constants.hpp>
#include <core/log.hpp>
#include <fmt/format.h>

static ExecutorOptions executor_options(const SessionSettings& session, QuotingMode quoting) {
    ExecutorOptions options;
    options.terminal = session.terminal;
    options.timeout_secs = session.command_timeout;
    options.quoting = quoting;
    return options;
}

SshDeskService::SshDeskService(ConnectionRegistry& registry,
                               TransportFactory factory,
                               SessionSettings session,
                               QuotingMode quoting)
    : registry_(registry),
      factory_(std::move(factory)),
      session_(session),
      executor_(executor_options(session, quoting)) {}

// ── Connection lifecycle ──────────────────────────────────────

ConnectResponse SshDeskService::connect(const ConnectionConfig& config, StatusCallback cb) {
    ConnectResponse response;

    auto valid = validate_connection_config(config);
    if (valid.is_err()) {
        response.message = valid.error;
        return response;
    }

    if (cb) cb(fmt::format("Connecting to {}:{}...", config.host, config.port));

    auto transport = factory_(config, session_);
    if (transport.is_err()) {
        if (transport.kind == ErrorKind::Auth) {
            response.message = "Authentication failed: " + transport.error;
        } else {
            response.message = "Failed to create SSH connection: " + transport.error;
        }
        return response;
    }

    if (cb) cb("Authenticated, reading working directory...");

    auto session = std::make_unique<ShellSession>(std::move(transport.value));
    auto probe = session->probe_directory(session_.command_timeout);
    if (probe.is_err()) {
        response.message = "Authentication failed: " + probe.error;
        return response;
    }

    std::string id = make_connection_id(config.username, config.host, config.port);
    id = registry_.insert(id, std::move(session));

    sshdesk_log(fmt::format("connect: {} ready", id));
    response.success = true;
    response.message = MSG_CONNECTED;
    response.connection_id = id;
    return response;
}

bool SshDeskService::disconnect(const std::string& connection_id) {
    return registry_.remove(connection_id);
}

std::vector<std::string> SshDeskService::list_connections() const {
    return registry_.list_ids();
}

// ── Shell operations ──────────────────────────────────────────

Result<CommandResult> SshDeskService::execute(const std::string& connection_id,
                                              const std::string& command) {
    return registry_.with_session(connection_id, [&](ShellSession& session) {
        return executor_.execute(session, command);
    });
}

Result<std::string> SshDeskService::get_directory(const std::string& connection_id) const {
    return registry_.get_directory(connection_id);
}
