#include "platform.hpp"
#include <cstdlib>
#include <system_error>

#ifndef _WIN32
#  include <pwd.h>
#  include <unistd.h>
#endif

namespace fs = std::filesystem;

namespace platform {

fs::path home_dir() {
#ifdef _WIN32
    const char* home = std::getenv("USERPROFILE");
    if (!home || !*home) home = std::getenv("HOME");
    if (home && *home) return fs::path(home);
#else
    const char* home = std::getenv("HOME");
    if (home && *home) return fs::path(home);

    // Daemons and some sudo setups run without HOME.
    if (const struct passwd* pw = getpwuid(getuid())) {
        if (pw->pw_dir && *pw->pw_dir) return fs::path(pw->pw_dir);
    }
#endif
    return temp_dir();
}

fs::path temp_dir() {
    std::error_code ec;
    fs::path dir = fs::temp_directory_path(ec);
    if (ec) return fs::path(".");
    return dir;
}

} // namespace platform
