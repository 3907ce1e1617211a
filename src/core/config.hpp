#pragma once

#include <string>
#include <optional>
#include <vector>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

class Config {
public:
    // Load ~/.sshdesk/config.yaml (or $SSHDESK_CONFIG). A missing file
    // yields the defaults.
    static Result<Config> load();

    // Load a specific file. A missing file is an error here.
    static Result<Config> load_file(const fs::path& path);

    // Accessors
    const SessionSettings& session() const { return session_; }
    const RegistrySettings& registry() const { return registry_; }
    QuotingMode quoting() const { return quoting_; }
    const std::string& log_path() const { return log_path_; }
    const std::vector<HostProfile>& hosts() const { return hosts_; }

    std::optional<HostProfile> find_host(const std::string& name) const;

public:
    Config() = default;

private:
    SessionSettings session_;
    RegistrySettings registry_;
    QuotingMode quoting_ = QuotingMode::Literal;
    std::string log_path_;
    std::vector<HostProfile> hosts_;

    friend class ConfigBuilder;
};

// Helper to check if the config exists
bool global_config_exists();

// Get paths
fs::path get_global_config_dir();
fs::path get_global_config_path();

// Create default global config
Result<void> create_default_global_config();
