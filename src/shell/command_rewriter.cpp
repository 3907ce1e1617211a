#include "command_rewriter.hpp"
#include <core/utils.hpp>
#include <fmt/format.h>

bool is_directory_change(const std::string& raw_command) {
    std::string cmd = trimmed(raw_command);
    return cmd == "cd" || cmd.rfind("cd ", 0) == 0;
}

std::string directory_change_argument(const std::string& raw_command) {
    std::string cmd = trimmed(raw_command);
    if (cmd.size() <= 2) return "";
    return trimmed(cmd.substr(2));
}

std::string quote_directory(const std::string& directory, QuotingMode mode) {
    if (mode == QuotingMode::Literal) {
        return "'" + directory + "'";
    }

    std::string quoted = "'";
    for (char c : directory) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

std::string rewrite_command(const std::string& raw_command,
                            const std::string& current_directory,
                            QuotingMode mode) {
    if (is_directory_change(raw_command)) {
        return fmt::format("cd {} && pwd", directory_change_argument(raw_command));
    }
    if (current_directory.empty()) {
        return raw_command;
    }
    return fmt::format("cd {} && {}", quote_directory(current_directory, mode), raw_command);
}

bool has_shell_metacharacters(const std::string& s) {
    if (s.find_first_of("'\";&|`\n") != std::string::npos) return true;
    return s.find("$(") != std::string::npos;
}
