#include "shell_session.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>

ShellSession::ShellSession(std::unique_ptr<Transport> transport)
    : transport_(std::move(transport)) {}

ShellSession::~ShellSession() {
    close();
}

Result<void> ShellSession::probe_directory(int timeout_secs) {
    ExecOptions options;
    options.timeout_secs = timeout_secs;

    auto result = transport_->exec(DIRECTORY_PROBE_COMMAND, options);
    if (result.is_err()) {
        return Result<void>::Err(result.kind, "Failed to read initial directory: " + result.error);
    }
    sshdesk_log_ssh("probe", DIRECTORY_PROBE_COMMAND, result.value);

    if (result.value.failed()) {
        return Result<void>::Err(ErrorKind::Auth,
                                 fmt::format("Failed to read initial directory (pwd exited {})",
                                             result.value.exit_code));
    }

    set_current_directory(trimmed(result.value.stdout_data));
    return Result<void>::Ok();
}

std::string ShellSession::current_directory() const {
    std::lock_guard<std::mutex> lock(dir_mutex_);
    return current_directory_;
}

void ShellSession::set_current_directory(const std::string& directory) {
    std::lock_guard<std::mutex> lock(dir_mutex_);
    current_directory_ = directory;
}

void ShellSession::close() {
    if (transport_) transport_->close();
}

bool ShellSession::is_active() const {
    return transport_ && transport_->is_active();
}
