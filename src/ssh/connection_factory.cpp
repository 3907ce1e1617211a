#include "connection_factory.hpp"
#include "session.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <fmt/format.h>

Result<void> validate_connection_config(const ConnectionConfig& config) {
    if (config.host.empty()) {
        return Result<void>::Err(ErrorKind::Config, "Host is required");
    }
    if (config.username.empty()) {
        return Result<void>::Err(ErrorKind::Config, "Username is required");
    }
    if (config.port == 0) {
        return Result<void>::Err(ErrorKind::Config, "Port must be between 1 and 65535");
    }

    bool has_password = config.password.has_value();
    bool has_key = config.private_key_path.has_value() && !config.private_key_path->empty();
    if (!has_password && !has_key) {
        return Result<void>::Err(ErrorKind::Config, MSG_NO_AUTH_METHOD);
    }
    if (has_password && has_key) {
        return Result<void>::Err(ErrorKind::Config,
                                 "Both password and private_key_path provided; choose one");
    }
    return Result<void>::Ok();
}

Result<std::unique_ptr<Transport>> open_ssh_transport(const ConnectionConfig& config,
                                                      const SessionSettings& settings) {
    using R = Result<std::unique_ptr<Transport>>;

    auto opened = SshSession::open(config.host, config.port, settings);
    if (opened.is_err()) {
        sshdesk_log(fmt::format("open_ssh_transport: {} {}:{} failed ({}): {}",
                                config.username, config.host, config.port,
                                error_kind_name(opened.kind), opened.error));
        return R::Err(opened.kind, opened.error);
    }

    std::unique_ptr<SshSession> session = std::move(opened.value);

    Result<void> auth = config.password
        ? session->authenticate_password(config.username, *config.password)
        : session->authenticate_key(config.username, *config.private_key_path, config.passphrase);

    if (auth.is_err()) {
        sshdesk_log(fmt::format("open_ssh_transport: auth rejected for {}@{}: {}",
                                config.username, session->get_target(), auth.error));
        session->close();
        return R::Err(ErrorKind::Auth, auth.error);
    }

    return R::Ok(std::move(session));
}
