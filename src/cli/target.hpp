#pragma once

#include <string>
#include <vector>
#include <core/config.hpp>
#include <core/types.hpp>

// What `connect` was asked for, before any secret has been prompted.
struct ConnectTarget {
    ConnectionConfig config;
    bool needs_password = false;     // no key: prompt for a password
    bool ask_passphrase = false;     // key given with --passphrase
};

// Parse `connect` arguments:
//   <user@host[:port] | profile> [-p port] [-i key_path] [--passphrase]
// A profile name from config.yaml supplies host, port, user and key.
// Errors: Config
Result<ConnectTarget> parse_connect_args(const std::string& args, const Config& config);

std::vector<std::string> split_args(const std::string& args);
