#include "session.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <libssh2.h>
#include <fmt/format.h>
#include <algorithm>
#include <chrono>
#include <mutex>
#include <thread>

namespace {

// Optional deadline. A zero budget means "no deadline".
struct Deadline {
    bool enabled = false;
    std::chrono::steady_clock::time_point at;

    static Deadline after_seconds(int secs) {
        Deadline d;
        if (secs > 0) {
            d.enabled = true;
            d.at = std::chrono::steady_clock::now() + std::chrono::seconds(secs);
        }
        return d;
    }

    bool expired() const {
        return enabled && std::chrono::steady_clock::now() >= at;
    }

    // How long the next socket wait may take.
    int slice_ms() const {
        if (!enabled) return SOCKET_WAIT_SLICE_MS;
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            at - std::chrono::steady_clock::now()).count();
        if (left <= 0) return 0;
        return static_cast<int>(std::min<long long>(left, SOCKET_WAIT_SLICE_MS));
    }
};

std::once_flag g_libssh2_init;
int g_libssh2_init_rc = 0;

} // namespace

// ── Lifecycle ──────────────────────────────────────────────────

SshSession::SshSession(LIBSSH2_SESSION* session, socket_t sock, std::string target)
    : session_(session), sock_(sock), active_(true), target_str_(std::move(target)) {
}

SshSession::~SshSession() {
    close();
}

Result<std::unique_ptr<SshSession>> SshSession::open(const std::string& host, uint16_t port,
                                                     const SessionSettings& settings) {
    using R = Result<std::unique_ptr<SshSession>>;

    std::call_once(g_libssh2_init, [] { g_libssh2_init_rc = libssh2_init(0); });
    if (g_libssh2_init_rc != 0) {
        return R::Err(ErrorKind::Handshake, "Failed to initialize libssh2");
    }

    std::string address;
    std::string error;
    if (!platform::resolve_ipv4(host, address, error)) {
        return R::Err(ErrorKind::Resolve, error);
    }

    socket_t sock = platform::connect_tcp(address, port, settings.connect_timeout * 1000, error);
    if (sock == SSHDESK_INVALID_SOCKET) {
        return R::Err(ErrorKind::Connect, error);
    }
    platform::enable_tcp_keepalive(sock);

    LIBSSH2_SESSION* raw = libssh2_session_init();
    if (!raw) {
        platform::close_socket(sock);
        return R::Err(ErrorKind::Handshake, "Failed to create SSH session");
    }
    libssh2_session_set_blocking(raw, 0);

    // From here the session owns the socket and cleans up on every path.
    std::unique_ptr<SshSession> session(
        new SshSession(raw, sock, fmt::format("{}:{}", host, port)));

    auto deadline = Deadline::after_seconds(settings.connect_timeout);
    int rc;
    while ((rc = libssh2_session_handshake(raw, sock)) == LIBSSH2_ERROR_EAGAIN) {
        if (deadline.expired()) {
            return R::Err(ErrorKind::Handshake, "SSH handshake timed out");
        }
        session->wait_socket(deadline.slice_ms());
    }
    if (rc != 0) {
        return R::Err(ErrorKind::Handshake, "SSH handshake failed: " + session->last_error());
    }

    if (settings.keepalive_interval > 0) {
        libssh2_keepalive_config(raw, 1, static_cast<unsigned>(settings.keepalive_interval));
    }

    sshdesk_log(fmt::format("SshSession: handshake complete with {} ({})",
                            session->get_target(), address));
    return R::Ok(std::move(session));
}

void SshSession::close() {
    std::lock_guard<std::mutex> lock(io_mutex_);
    active_ = false;

    if (session_) {
        int rc;
        auto deadline = Deadline::after_seconds(5);
        while ((rc = libssh2_session_disconnect(session_, "Normal disconnection")) ==
               LIBSSH2_ERROR_EAGAIN) {
            if (deadline.expired()) break;
            wait_socket(deadline.slice_ms());
        }
        libssh2_session_free(session_);
        session_ = nullptr;
    }

    if (sock_ != SSHDESK_INVALID_SOCKET) {
        platform::close_socket(sock_);
        sock_ = SSHDESK_INVALID_SOCKET;
    }
}

bool SshSession::is_active() const {
    std::lock_guard<std::mutex> lock(io_mutex_);
    return active_ && session_ != nullptr;
}

// ── Authentication ─────────────────────────────────────────────

Result<void> SshSession::authenticate_password(const std::string& user,
                                               const std::string& password) {
    std::lock_guard<std::mutex> lock(io_mutex_);
    if (!session_) return Result<void>::Err(ErrorKind::Auth, "Session is closed");

    int rc;
    while ((rc = libssh2_userauth_password(session_, user.c_str(), password.c_str())) ==
           LIBSSH2_ERROR_EAGAIN) {
        wait_socket(SOCKET_WAIT_SLICE_MS);
    }
    if (rc != 0) {
        return Result<void>::Err(ErrorKind::Auth,
                                 "Password authentication failed: " + last_error());
    }

    sshdesk_log(fmt::format("SshSession: password auth ok for {}@{}", user, target_str_));
    return Result<void>::Ok();
}

Result<void> SshSession::authenticate_key(const std::string& user, const std::string& key_path,
                                          const std::optional<std::string>& passphrase) {
    std::lock_guard<std::mutex> lock(io_mutex_);
    if (!session_) return Result<void>::Err(ErrorKind::Auth, "Session is closed");

    const char* pass = passphrase ? passphrase->c_str() : nullptr;
    int rc;
    while ((rc = libssh2_userauth_publickey_fromfile(session_, user.c_str(), nullptr,
                                                     key_path.c_str(), pass)) ==
           LIBSSH2_ERROR_EAGAIN) {
        wait_socket(SOCKET_WAIT_SLICE_MS);
    }
    if (rc != 0) {
        return Result<void>::Err(ErrorKind::Auth,
                                 "Key authentication failed: " + last_error());
    }

    sshdesk_log(fmt::format("SshSession: key auth ok for {}@{} ({})", user, target_str_, key_path));
    return Result<void>::Ok();
}

// ── Command execution ──────────────────────────────────────────

Result<SSHResult> SshSession::exec(const std::string& command, const ExecOptions& options) {
    using R = Result<SSHResult>;
    std::lock_guard<std::mutex> lock(io_mutex_);
    if (!session_ || !active_) {
        return R::Err(ErrorKind::Channel, "Session is closed");
    }

    // Keepalives only go out when asked for, so piggyback on each command.
    if (sock_ != SSHDESK_INVALID_SOCKET) {
        int seconds_to_next = 0;
        int ka = libssh2_keepalive_send(session_, &seconds_to_next);
        int revents = platform::poll_socket(sock_, POLLIN, 0);
        if ((ka != 0 && ka != LIBSSH2_ERROR_EAGAIN) || (revents & (POLLERR | POLLHUP | POLLNVAL))) {
            active_ = false;
            return R::Err(ErrorKind::Channel, "Connection lost: " + last_error());
        }
    }

    auto deadline = Deadline::after_seconds(options.timeout_secs);
    auto timeout_error = [&]() {
        return R::Err(ErrorKind::Timeout,
                      fmt::format("Command timed out after {}s", options.timeout_secs));
    };

    LIBSSH2_CHANNEL* ch = nullptr;
    while ((ch = libssh2_channel_open_session(session_)) == nullptr) {
        if (libssh2_session_last_errno(session_) != LIBSSH2_ERROR_EAGAIN) {
            return R::Err(ErrorKind::Channel, "Failed to open channel: " + last_error());
        }
        if (deadline.expired()) return timeout_error();
        wait_socket(deadline.slice_ms());
    }

    int rc;
    if (options.request_pty) {
        while ((rc = libssh2_channel_request_pty(ch, options.terminal.c_str())) ==
               LIBSSH2_ERROR_EAGAIN) {
            if (deadline.expired()) { free_channel(ch); return timeout_error(); }
            wait_socket(deadline.slice_ms());
        }
        if (rc != 0) {
            std::string err = "Failed to request PTY: " + last_error();
            free_channel(ch);
            return R::Err(ErrorKind::Channel, err);
        }
    }

    while ((rc = libssh2_channel_exec(ch, command.c_str())) == LIBSSH2_ERROR_EAGAIN) {
        if (deadline.expired()) { free_channel(ch); return timeout_error(); }
        wait_socket(deadline.slice_ms());
    }
    if (rc != 0) {
        std::string err = "Failed to exec command on channel: " + last_error();
        free_channel(ch);
        return R::Err(ErrorKind::Channel, err);
    }

    // Drain stdout and stderr together so neither window stalls the other.
    std::string out;
    std::string err;
    char buf[SSH_READ_BUF_SIZE];
    for (;;) {
        ssize_t n = libssh2_channel_read(ch, buf, sizeof(buf));
        if (n > 0) {
            out.append(buf, static_cast<size_t>(n));
            continue;
        }
        if (n < 0 && n != LIBSSH2_ERROR_EAGAIN) {
            std::string msg = "SSH channel read error: " + last_error();
            free_channel(ch);
            return R::Err(ErrorKind::Channel, msg);
        }

        ssize_t e = libssh2_channel_read_stderr(ch, buf, sizeof(buf));
        if (e > 0) {
            err.append(buf, static_cast<size_t>(e));
            continue;
        }
        if (e < 0 && e != LIBSSH2_ERROR_EAGAIN) {
            std::string msg = "SSH channel read error: " + last_error();
            free_channel(ch);
            return R::Err(ErrorKind::Channel, msg);
        }

        if (libssh2_channel_eof(ch)) break;
        if (deadline.expired()) { free_channel(ch); return timeout_error(); }
        wait_socket(deadline.slice_ms());
    }

    while ((rc = libssh2_channel_close(ch)) == LIBSSH2_ERROR_EAGAIN) {
        wait_socket(SOCKET_WAIT_SLICE_MS);
    }
    if (rc == 0) {
        while ((rc = libssh2_channel_wait_closed(ch)) == LIBSSH2_ERROR_EAGAIN) {
            wait_socket(SOCKET_WAIT_SLICE_MS);
        }
    }
    if (rc != 0) {
        std::string msg = "Failed to close channel: " + last_error();
        libssh2_channel_free(ch);
        return R::Err(ErrorKind::Channel, msg);
    }

    int exit_status = libssh2_channel_get_exit_status(ch);
    while (libssh2_channel_free(ch) == LIBSSH2_ERROR_EAGAIN) {
        wait_socket(SOCKET_WAIT_SLICE_MS);
    }

    return R::Ok(SSHResult{exit_status, out, err});
}

// ── Internal ───────────────────────────────────────────────────

std::string SshSession::last_error() const {
    if (!session_) return "no session";
    char* msg = nullptr;
    int len = 0;
    libssh2_session_last_error(session_, &msg, &len, 0);
    if (!msg || len <= 0) return "unknown error";
    return std::string(msg, static_cast<size_t>(len));
}

void SshSession::wait_socket(int timeout_ms) {
    if (!session_ || sock_ == SSHDESK_INVALID_SOCKET) return;

    short events = 0;
    int dir = libssh2_session_block_directions(session_);
    if (dir & LIBSSH2_SESSION_BLOCK_INBOUND) events |= POLLIN;
    if (dir & LIBSSH2_SESSION_BLOCK_OUTBOUND) events |= POLLOUT;

    if (events == 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(std::min(timeout_ms, 10)));
        return;
    }
    platform::poll_socket(sock_, events, timeout_ms);
}

void SshSession::free_channel(LIBSSH2_CHANNEL* channel) {
    int rc;
    auto deadline = Deadline::after_seconds(5);
    while ((rc = libssh2_channel_close(channel)) == LIBSSH2_ERROR_EAGAIN) {
        if (deadline.expired()) break;
        wait_socket(deadline.slice_ms());
    }
    while ((rc = libssh2_channel_free(channel)) == LIBSSH2_ERROR_EAGAIN) {
        if (deadline.expired()) break;
        wait_socket(deadline.slice_ms());
    }
}
