#include "connection_id.hpp"
#include <fmt/format.h>

std::string make_connection_id(const std::string& username,
                               const std::string& host, uint16_t port) {
    return fmt::format("{}@{}:{}", username, host, port);
}

std::string make_unique_connection_id(const std::string& base_id,
                                      const std::function<bool(const std::string&)>& taken) {
    if (!taken(base_id)) return base_id;
    for (int n = 2;; ++n) {
        std::string candidate = fmt::format("{}#{}", base_id, n);
        if (!taken(candidate)) return candidate;
    }
}
