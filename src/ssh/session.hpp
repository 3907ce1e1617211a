#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <core/types.hpp>
#include <platform/socket_util.hpp>
#include "transport.hpp"

// libssh2 forward declarations
typedef struct _LIBSSH2_SESSION LIBSSH2_SESSION;
typedef struct _LIBSSH2_CHANNEL LIBSSH2_CHANNEL;

// A single libssh2 session over one TCP socket. The socket is non-blocking;
// every libssh2 call is retried on EAGAIN after waiting for the direction
// libssh2 is blocked on.
class SshSession : public Transport {
public:
    // Resolve host to IPv4, connect, and run the SSH handshake.
    // Errors: Resolve, Connect, Handshake.
    static Result<std::unique_ptr<SshSession>> open(const std::string& host, uint16_t port,
                                                    const SessionSettings& settings);

    ~SshSession() override;

    SshSession(const SshSession&) = delete;
    SshSession& operator=(const SshSession&) = delete;

    // Errors: Auth
    Result<void> authenticate_password(const std::string& user, const std::string& password);
    Result<void> authenticate_key(const std::string& user, const std::string& key_path,
                                  const std::optional<std::string>& passphrase);

    Result<SSHResult> exec(const std::string& command, const ExecOptions& options) override;
    void close() override;
    bool is_active() const override;

    const std::string& get_target() const { return target_str_; }

private:
    SshSession(LIBSSH2_SESSION* session, socket_t sock, std::string target);

    std::string last_error() const;

    // Block until the socket is ready in the direction libssh2 is waiting
    // on, or timeout_ms passes.
    void wait_socket(int timeout_ms);

    // Close and free a channel, retrying through EAGAIN.
    void free_channel(LIBSSH2_CHANNEL* channel);

    LIBSSH2_SESSION* session_;
    socket_t sock_;
    bool active_;
    std::string target_str_;
    mutable std::mutex io_mutex_;
};
