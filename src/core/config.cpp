#include "config.hpp"
#include "constants.hpp"
#include "utils.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fstream>
#include <cstdlib>

namespace fs = std::filesystem;

class ConfigBuilder {
public:
    static Result<Config> from_yaml(const YAML::Node& root);
};

bool global_config_exists() {
    return fs::exists(get_global_config_path());
}

fs::path get_global_config_dir() {
    return platform::home_dir() / ".sshdesk";
}

fs::path get_global_config_path() {
    const char* override_path = std::getenv("SSHDESK_CONFIG");
    if (override_path && *override_path) {
        return fs::path(override_path);
    }
    return get_global_config_dir() / "config.yaml";
}

Result<void> create_default_global_config() {
    fs::path config_path = get_global_config_path();

    // Don't overwrite existing config
    if (fs::exists(config_path)) {
        return Result<void>::Ok();
    }

    const char* default_config = R"(# sshdesk configuration

session:
  terminal: "xterm"          # PTY type requested for every command
  command_timeout: 0         # seconds; 0 waits for the remote command forever
  connect_timeout: 30        # seconds for TCP connect
  keepalive_interval: 30     # seconds; 0 disables SSH keepalives

registry:
  locking: "per_connection"  # or "global": one command at a time overall
  duplicate_ids: "replace"   # or "unique": keep both, suffix the newer id
  lock_wait_ms: 0            # 0 waits for a busy connection forever

commands:
  quoting: "literal"         # or "posix": escape quotes in the tracked directory

log:
  path: ""                   # empty = <tmp>/sshdesk_debug.log

# Saved targets for `connect <name>`. Passwords are prompted, never stored.
hosts: {}
#  web:
#    host: "web.example.com"
#    port: 22
#    user: "deploy"
#    key: "~/.ssh/id_ed25519"
)";

    try {
        fs::create_directories(config_path.parent_path());
        std::ofstream out(config_path);
        if (!out) {
            return Result<void>::Err("Failed to create config file at " + config_path.string());
        }
        out << default_config;
        out.close();
        return Result<void>::Ok();
    } catch (const std::exception& e) {
        return Result<void>::Err("Failed to write config file: " + std::string(e.what()));
    }
}

static SessionSettings parse_session_settings(const YAML::Node& node) {
    SessionSettings s;
    s.terminal = node["terminal"].as<std::string>(DEFAULT_TERMINAL_TYPE);
    s.command_timeout = node["command_timeout"].as<int>(0);
    s.connect_timeout = node["connect_timeout"].as<int>(DEFAULT_CONNECT_TIMEOUT_SECS);
    s.keepalive_interval = node["keepalive_interval"].as<int>(DEFAULT_KEEPALIVE_SECS);

    if (s.terminal.empty()) s.terminal = DEFAULT_TERMINAL_TYPE;
    if (s.command_timeout < 0) s.command_timeout = 0;
    if (s.connect_timeout <= 0) s.connect_timeout = DEFAULT_CONNECT_TIMEOUT_SECS;
    if (s.keepalive_interval < 0) s.keepalive_interval = 0;
    return s;
}

static Result<RegistrySettings> parse_registry_settings(const YAML::Node& node) {
    RegistrySettings r;

    std::string locking = node["locking"].as<std::string>("per_connection");
    if (locking == "per_connection") {
        r.locking = LockingMode::PerConnection;
    } else if (locking == "global") {
        r.locking = LockingMode::Global;
    } else {
        return Result<RegistrySettings>::Err("registry.locking must be 'per_connection' or 'global', got '" + locking + "'");
    }

    std::string dup = node["duplicate_ids"].as<std::string>("replace");
    if (dup == "replace") {
        r.duplicate_ids = DuplicateIdPolicy::Replace;
    } else if (dup == "unique") {
        r.duplicate_ids = DuplicateIdPolicy::Unique;
    } else {
        return Result<RegistrySettings>::Err("registry.duplicate_ids must be 'replace' or 'unique', got '" + dup + "'");
    }

    r.lock_wait_ms = node["lock_wait_ms"].as<int>(0);
    if (r.lock_wait_ms < 0) r.lock_wait_ms = 0;
    return Result<RegistrySettings>::Ok(r);
}

static Result<QuotingMode> parse_quoting(const YAML::Node& node) {
    std::string q = node["quoting"].as<std::string>("literal");
    if (q == "literal") return Result<QuotingMode>::Ok(QuotingMode::Literal);
    if (q == "posix") return Result<QuotingMode>::Ok(QuotingMode::Posix);
    return Result<QuotingMode>::Err("commands.quoting must be 'literal' or 'posix', got '" + q + "'");
}

static Result<std::vector<HostProfile>> parse_hosts(const YAML::Node& node) {
    using R = Result<std::vector<HostProfile>>;
    std::vector<HostProfile> hosts;
    if (!node || !node.IsMap()) return R::Ok(hosts);

    for (const auto& kv : node) {
        HostProfile h;
        h.name = kv.first.as<std::string>();
        if (kv.second.IsScalar()) {
            // Bare string shorthand: `web: web.example.com`
            h.host = kv.second.as<std::string>("");
        } else if (kv.second.IsMap()) {
            const auto& hnode = kv.second;
            h.host = hnode["host"].as<std::string>("");
            int port = hnode["port"].as<int>(22);
            if (port < 1 || port > 65535) {
                return R::Err(ErrorKind::Config, "hosts." + h.name
                              + ".port must be between 1 and 65535, got " + std::to_string(port));
            }
            h.port = static_cast<uint16_t>(port);
            h.user = hnode["user"].as<std::string>("");
            // accept "key" or "private_key_path"
            if (hnode["key"]) {
                h.key_path = expand_home(hnode["key"].as<std::string>());
            } else if (hnode["private_key_path"]) {
                h.key_path = expand_home(hnode["private_key_path"].as<std::string>());
            }
        }
        if (h.host.empty()) h.host = h.name;
        hosts.push_back(h);
    }
    return R::Ok(hosts);
}

Result<Config> ConfigBuilder::from_yaml(const YAML::Node& root) {
    Config config;

    config.session_ = parse_session_settings(root["session"] ? root["session"] : YAML::Node());

    auto registry = parse_registry_settings(root["registry"] ? root["registry"] : YAML::Node());
    if (registry.is_err()) return Result<Config>::Err(ErrorKind::Config, registry.error);
    config.registry_ = registry.value;

    auto quoting = parse_quoting(root["commands"] ? root["commands"] : YAML::Node());
    if (quoting.is_err()) return Result<Config>::Err(ErrorKind::Config, quoting.error);
    config.quoting_ = quoting.value;

    if (root["log"] && root["log"].IsMap()) {
        config.log_path_ = expand_home(root["log"]["path"].as<std::string>(""));
    }

    auto hosts = parse_hosts(root["hosts"]);
    if (hosts.is_err()) return Result<Config>::Err(ErrorKind::Config, hosts.error);
    config.hosts_ = hosts.value;
    return Result<Config>::Ok(config);
}

Result<Config> Config::load_file(const fs::path& path) {
    if (!fs::exists(path)) {
        return Result<Config>::Err(ErrorKind::Config, "Config not found at " + path.string());
    }

    try {
        YAML::Node root = YAML::LoadFile(path.string());
        return ConfigBuilder::from_yaml(root);
    } catch (const std::exception& e) {
        return Result<Config>::Err(ErrorKind::Config, std::string("Failed to parse config: ") + e.what());
    }
}

Result<Config> Config::load() {
    if (!global_config_exists()) {
        return Result<Config>::Ok(Config{});
    }
    return load_file(get_global_config_path());
}

std::optional<HostProfile> Config::find_host(const std::string& name) const {
    for (const auto& h : hosts_) {
        if (h.name == name) return h;
    }
    return std::nullopt;
}
