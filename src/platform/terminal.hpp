#pragma once

#include <string>

namespace platform {

// RAII guard that turns off terminal echo while typing a secret.
// Destructor restores the saved mode.
struct NoEchoGuard {
    NoEchoGuard();
    ~NoEchoGuard();

    NoEchoGuard(const NoEchoGuard&) = delete;
    NoEchoGuard& operator=(const NoEchoGuard&) = delete;

private:
#ifdef _WIN32
    unsigned long old_mode_ = 0;
#else
    struct Impl;
    Impl* impl_ = nullptr;
#endif
};

// True when stdin is an interactive terminal.
bool stdin_is_tty();

// Print prompt, read one line with echo off. Returns false on EOF.
bool read_secret(const std::string& prompt, std::string& out);

} // namespace platform
