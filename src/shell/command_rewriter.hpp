#pragma once

#include <string>
#include <core/types.hpp>

// Rewrite rules that fake a persistent working directory on top of exec
// channels, each of which starts in the remote login directory.
//
//   "cd <arg>"  -> "cd <arg> && pwd"               (arg verbatim)
//   "<cmd>"     -> "cd '<dir>' && <cmd>"           (dir = tracked directory)
//   "<cmd>"     -> "<cmd>"                         (nothing tracked yet)

// True if the trimmed command is exactly "cd" or starts with "cd ".
bool is_directory_change(const std::string& raw_command);

// The trimmed text after "cd" ("" for a bare "cd").
std::string directory_change_argument(const std::string& raw_command);

// Single-quote a directory for the prefix. Literal mode wraps it as-is;
// Posix mode escapes embedded quotes as '\''.
std::string quote_directory(const std::string& directory, QuotingMode mode);

// The command line actually sent to the remote side.
std::string rewrite_command(const std::string& raw_command,
                            const std::string& current_directory,
                            QuotingMode mode);

// True if s contains characters that can break out of, or chain onto, the
// rewritten command line (quotes, ;, &, |, backticks, $(, newlines).
bool has_shell_metacharacters(const std::string& s);
