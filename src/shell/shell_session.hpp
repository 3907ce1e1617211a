#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <core/types.hpp>
#include <ssh/transport.hpp>

// An authenticated transport plus the working directory we pretend the
// remote shell is sitting in.
//
// The directory starts empty and is filled by probe_directory() right after
// authentication. After that only CommandExecutor changes it, and only when
// a cd succeeds. Reads take a short internal lock so directory queries never
// wait behind a running command.
class ShellSession {
public:
    explicit ShellSession(std::unique_ptr<Transport> transport);
    ~ShellSession();

    ShellSession(const ShellSession&) = delete;
    ShellSession& operator=(const ShellSession&) = delete;

    // Run `pwd` on a fresh channel and store the trimmed output.
    // Errors: Channel, Timeout, Auth (pwd exited non-zero)
    Result<void> probe_directory(int timeout_secs = 0);

    std::string current_directory() const;
    void set_current_directory(const std::string& directory);

    Transport& transport() { return *transport_; }

    void close();
    bool is_active() const;

private:
    std::unique_ptr<Transport> transport_;
    std::string current_directory_;
    mutable std::mutex dir_mutex_;
};
