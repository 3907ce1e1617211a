#pragma once

#include <cstdint>
#include <functional>
#include <string>

// Connection identifiers are "username@host:port". Callers treat them as
// opaque handles and never parse them.
std::string make_connection_id(const std::string& username,
                               const std::string& host, uint16_t port);

// First free variant of base_id: base_id itself, then "base_id#2",
// "base_id#3", ... `taken` reports whether an id is already live.
std::string make_unique_connection_id(const std::string& base_id,
                                      const std::function<bool(const std::string&)>& taken);
