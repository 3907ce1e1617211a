#include "target.hpp"
#include <core/utils.hpp>
#include <sstream>

std::vector<std::string> split_args(const std::string& args) {
    std::vector<std::string> out;
    std::istringstream iss(args);
    std::string word;
    while (iss >> word) out.push_back(word);
    return out;
}

static bool parse_port(const std::string& s, uint16_t& port) {
    int value = safe_stoi(s, -1);
    if (value <= 0 || value > 65535) return false;
    port = static_cast<uint16_t>(value);
    return true;
}

Result<ConnectTarget> parse_connect_args(const std::string& args, const Config& config) {
    using R = Result<ConnectTarget>;
    auto words = split_args(args);
    if (words.empty()) {
        return R::Err(ErrorKind::Config, "Usage: connect <user@host[:port]|profile> [-p port] [-i key] [--passphrase]");
    }

    ConnectTarget target;
    ConnectionConfig& cc = target.config;
    const std::string& word = words[0];

    if (auto profile = config.find_host(word)) {
        cc.host = profile->host;
        cc.port = profile->port;
        cc.username = profile->user;
        if (profile->key_path) cc.private_key_path = profile->key_path;
    } else {
        std::string rest = word;
        auto at = rest.find('@');
        if (at != std::string::npos) {
            cc.username = rest.substr(0, at);
            rest = rest.substr(at + 1);
        }
        auto colon = rest.rfind(':');
        if (colon != std::string::npos) {
            if (!parse_port(rest.substr(colon + 1), cc.port)) {
                return R::Err(ErrorKind::Config, "Invalid port in '" + word + "'");
            }
            rest = rest.substr(0, colon);
        }
        cc.host = rest;
    }

    for (size_t i = 1; i < words.size(); ++i) {
        const std::string& w = words[i];
        if ((w == "-p" || w == "--port") && i + 1 < words.size()) {
            if (!parse_port(words[++i], cc.port)) {
                return R::Err(ErrorKind::Config, "Invalid port '" + words[i] + "'");
            }
        } else if ((w == "-i" || w == "--key") && i + 1 < words.size()) {
            cc.private_key_path = expand_home(words[++i]);
        } else if (w == "--passphrase") {
            target.ask_passphrase = true;
        } else {
            return R::Err(ErrorKind::Config, "Unknown option '" + w + "'");
        }
    }

    if (cc.host.empty()) {
        return R::Err(ErrorKind::Config, "Missing host in '" + word + "'");
    }
    if (cc.username.empty()) {
        return R::Err(ErrorKind::Config, "Missing user in '" + word + "' (use user@host)");
    }

    target.needs_password = !cc.private_key_path.has_value();
    return R::Ok(target);
}
