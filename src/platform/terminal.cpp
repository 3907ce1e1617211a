#include "terminal.hpp"
#include <iostream>

#ifdef _WIN32
#  define WIN32_LEAN_AND_MEAN
#  include <windows.h>
#  include <io.h>
#else
#  include <termios.h>
#  include <unistd.h>
#endif

namespace platform {

// ── NoEchoGuard ──────────────────────────────────────────────

#ifdef _WIN32

NoEchoGuard::NoEchoGuard() {
    HANDLE h = GetStdHandle(STD_INPUT_HANDLE);
    GetConsoleMode(h, &old_mode_);
    SetConsoleMode(h, old_mode_ & ~ENABLE_ECHO_INPUT);
}

NoEchoGuard::~NoEchoGuard() {
    SetConsoleMode(GetStdHandle(STD_INPUT_HANDLE), old_mode_);
}

bool stdin_is_tty() {
    return _isatty(_fileno(stdin)) != 0;
}

#else // Unix

struct NoEchoGuard::Impl {
    struct termios old_term;
    bool saved = false;
};

NoEchoGuard::NoEchoGuard() : impl_(new Impl) {
    if (tcgetattr(STDIN_FILENO, &impl_->old_term) != 0) return;
    impl_->saved = true;
    struct termios quiet = impl_->old_term;
    quiet.c_lflag &= ~ECHO;
    tcsetattr(STDIN_FILENO, TCSAFLUSH, &quiet);
}

NoEchoGuard::~NoEchoGuard() {
    if (impl_) {
        if (impl_->saved) tcsetattr(STDIN_FILENO, TCSAFLUSH, &impl_->old_term);
        delete impl_;
    }
}

bool stdin_is_tty() {
    return isatty(STDIN_FILENO) != 0;
}

#endif

bool read_secret(const std::string& prompt, std::string& out) {
    std::cout << prompt << std::flush;
    bool ok;
    {
        NoEchoGuard guard;
        ok = static_cast<bool>(std::getline(std::cin, out));
    }
    std::cout << "\n";
    return ok;
}

} // namespace platform
