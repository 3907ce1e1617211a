#pragma once

#include <filesystem>

namespace platform {

// The user's home directory: $HOME (%USERPROFILE% on Windows), then the
// password database entry, then the temp directory as a last resort.
// ~/ in config paths and ~/.sshdesk both resolve against this.
std::filesystem::path home_dir();

// Where the debug log goes unless config.yaml says otherwise.
std::filesystem::path temp_dir();

} // namespace platform
