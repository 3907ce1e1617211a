#pragma once

#include <string>
#include <optional>
#include <vector>
#include <map>
#include <functional>
#include <cstdint>

// What went wrong, for callers that need to tell failures apart.
enum class ErrorKind {
    None,
    Config,           // bad or incomplete ConnectionConfig / config file
    Resolve,          // host did not resolve to an IPv4 address
    Connect,          // TCP connect failed or timed out
    Handshake,        // SSH negotiation failed
    Auth,             // credentials rejected, or the initial pwd probe failed
    NotFound,         // no connection registered under that id
    LockUnavailable,  // connection busy past registry.lock_wait_ms
    Channel,          // exec channel could not be opened / read
    Timeout,          // opt-in command timeout fired
};

const char* error_kind_name(ErrorKind kind);

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;
    ErrorKind kind = ErrorKind::None;

    static Result<T> Ok(T val) {
        return {true, std::move(val), "", ErrorKind::None};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, err, ErrorKind::Config};
    }

    static Result<T> Err(ErrorKind kind, const std::string& err) {
        return {false, T{}, err, kind};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;
    ErrorKind kind = ErrorKind::None;

    static Result<void> Ok() {
        return {true, "", ErrorKind::None};
    }

    static Result<void> Err(const std::string& err) {
        return {false, err, ErrorKind::Config};
    }

    static Result<void> Err(ErrorKind kind, const std::string& err) {
        return {false, err, kind};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Raw outcome of one exec channel
struct SSHResult {
    int exit_code;
    std::string stdout_data;
    std::string stderr_data;

    bool success() const { return exit_code == 0; }
    bool failed() const { return exit_code != 0; }
};

// Exit status reserved for "the command never reached the remote side".
constexpr int EXIT_NOT_DISPATCHED = -1;

// What the caller asked to connect to. Exactly one of password /
// private_key_path must be set.
struct ConnectionConfig {
    std::string host;
    uint16_t port = 22;
    std::string username;
    std::optional<std::string> password;
    std::optional<std::string> private_key_path;
    std::optional<std::string> passphrase;
};

struct ConnectResponse {
    bool success = false;
    std::string message;
    std::optional<std::string> connection_id;
};

// Result of one directory-aware command.
struct CommandResult {
    std::string stdout_data;
    std::string stderr_data;
    int exit_status = EXIT_NOT_DISPATCHED;
    bool success = false;
    std::string current_directory;   // tracked directory after the command ran
    bool timed_out = false;
};

// ── Settings (parsed from config.yaml) ──────────────────────

enum class LockingMode {
    PerConnection,   // commands on different connections run in parallel
    Global,          // one command at a time across every connection
};

enum class DuplicateIdPolicy {
    Replace,   // close the old session, register the new one under the same id
    Unique,    // keep both; the newer one gets a "#N" suffix
};

enum class QuotingMode {
    Literal,   // cd '<dir>' && cmd, directory inserted as-is
    Posix,     // single quotes inside the directory are escaped
};

struct SessionSettings {
    std::string terminal = "xterm";
    int command_timeout = 0;        // seconds, 0 = wait forever
    int connect_timeout = 30;       // seconds
    int keepalive_interval = 30;    // seconds, 0 = disabled
};

struct RegistrySettings {
    LockingMode locking = LockingMode::PerConnection;
    DuplicateIdPolicy duplicate_ids = DuplicateIdPolicy::Replace;
    int lock_wait_ms = 0;           // 0 = wait forever
};

// A saved connection target. Passwords are never stored.
struct HostProfile {
    std::string name;
    std::string host;
    uint16_t port = 22;
    std::string user;
    std::optional<std::string> key_path;
};

// Status callback for operations
using StatusCallback = std::function<void(const std::string&)>;
