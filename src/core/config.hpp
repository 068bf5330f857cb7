#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

class Config {
public:
    // Load ~/.ec2ctl/config.yaml. A missing file yields the built-in defaults.
    static Result<Config> load();

    // Load a specific config file (must exist)
    static Result<Config> load_file(const fs::path& path);

    // Parse config from YAML text (used by load_file and tests)
    static Result<Config> parse(const std::string& yaml_text);

    // Accessors
    const AwsConfig& aws() const { return aws_; }
    const RefreshConfig& refresh() const { return refresh_; }
    const PolicyConfig& policy() const { return policy_; }

    // Regions enabled at startup. Empty = every listed region.
    const std::vector<std::string>& regions() const { return regions_; }

    const fs::path& source() const { return source_; }

public:
    Config() = default;

private:
    AwsConfig aws_;
    RefreshConfig refresh_;
    PolicyConfig policy_;
    std::vector<std::string> regions_;
    fs::path source_;
};

bool config_exists();

// Get paths
fs::path get_app_dir();
fs::path get_config_path();
fs::path get_state_path();

// Create default config (no-op if one exists)
Result<void> create_default_config();
