#pragma once

#include <functional>
#include <memory>
#include <core/types.hpp>
#include "transport.hpp"

// Checks a ConnectionConfig before any network activity: host and username
// present, and exactly one of password / private_key_path.
// Errors: Config
Result<void> validate_connection_config(const ConnectionConfig& config);

// Builds an authenticated Transport for a validated config. The service
// takes one of these so tests can hand out fake transports.
using TransportFactory = std::function<Result<std::unique_ptr<Transport>>(
    const ConnectionConfig&, const SessionSettings&)>;

// The real factory: libssh2 connect + handshake + password or key auth.
// Errors: Resolve, Connect, Handshake, Auth
Result<std::unique_ptr<Transport>> open_ssh_transport(const ConnectionConfig& config,
                                                      const SessionSettings& settings);
