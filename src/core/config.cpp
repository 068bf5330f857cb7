#include "config.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <fstream>
#include <algorithm>

namespace fs = std::filesystem;

bool config_exists() {
    return fs::exists(get_config_path());
}

fs::path get_app_dir() {
    return platform::home_dir() / APP_DIR_NAME;
}

fs::path get_config_path() {
    return get_app_dir() / CONFIG_FILE_NAME;
}

fs::path get_state_path() {
    return get_app_dir() / STATE_FILE_NAME;
}

Result<void> create_default_config() {
    fs::path config_path = get_config_path();

    // Don't overwrite existing config
    if (fs::exists(config_path)) {
        return Result<void>::Ok();
    }

    std::error_code ec;
    fs::create_directories(config_path.parent_path(), ec);
    if (ec) {
        return Result<void>::Err(ErrorKind::Config,
            fmt::format("Failed to create {}: {}", config_path.parent_path().string(), ec.message()));
    }

    const char* default_config = R"(# ec2ctl configuration
# Credentials are resolved by the aws CLI (environment, ~/.aws, SSO, ...).

aws:
  cli: "aws"                  # aws executable
  profile: ""                 # named profile, empty = default chain
  default_region: "us-east-1" # region used for describe-regions

refresh:
  interval_secs: 30           # periodic scan interval
  stale_ttl_secs: 60          # snapshot age before a region shows as stale
  fetch_timeout_secs: 10      # per-region budget (all pages)
  workers: 4                  # concurrent region fetches
  page_size: 100
  auto_refresh: true

policy:
  optimistic_expiry_ticks: 2  # scans before an unconfirmed start/stop hint is dropped
  reboot_expiry_ticks: 1
  reboot_health_wait_ticks: 10  # keep "rebooting" while status checks initialize
  eviction_misses: 3          # consecutive absences before an instance is forgotten

# Optional: only scan these regions (empty = all)
regions: []
)";

    std::ofstream out(config_path);
    if (!out) {
        return Result<void>::Err(ErrorKind::Config,
                                 "Failed to create config file at " + config_path.string());
    }
    out << default_config;
    return Result<void>::Ok();
}

static AwsConfig parse_aws_config(const YAML::Node& node) {
    AwsConfig aws;
    aws.cli = node["cli"].as<std::string>("aws");
    aws.profile = node["profile"].as<std::string>("");
    aws.default_region = node["default_region"].as<std::string>("us-east-1");
    if (aws.cli.empty()) aws.cli = "aws";
    return aws;
}

static RefreshConfig parse_refresh_config(const YAML::Node& node) {
    RefreshConfig r;
    r.interval_secs = node["interval_secs"].as<int>(REFRESH_INTERVAL_SECS);
    r.stale_ttl_secs = node["stale_ttl_secs"].as<int>(STALE_TTL_SECS);
    r.fetch_timeout_secs = node["fetch_timeout_secs"].as<int>(FETCH_TIMEOUT_SECS);
    r.workers = node["workers"].as<int>(FETCH_WORKERS);
    r.page_size = node["page_size"].as<int>(DESCRIBE_PAGE_SIZE);
    r.auto_refresh = node["auto_refresh"].as<bool>(true);

    // Clamp nonsense values rather than failing the whole load
    r.interval_secs = std::max(1, r.interval_secs);
    r.stale_ttl_secs = std::max(1, r.stale_ttl_secs);
    r.fetch_timeout_secs = std::max(1, r.fetch_timeout_secs);
    r.workers = std::clamp(r.workers, 1, 32);
    r.page_size = std::clamp(r.page_size, 5, 1000);
    return r;
}

static PolicyConfig parse_policy_config(const YAML::Node& node) {
    PolicyConfig p;
    p.optimistic_expiry_ticks = std::max(1, node["optimistic_expiry_ticks"].as<int>(OPTIMISTIC_EXPIRY_TICKS));
    p.reboot_expiry_ticks = std::max(1, node["reboot_expiry_ticks"].as<int>(REBOOT_EXPIRY_TICKS));
    p.reboot_health_wait_ticks = std::max(p.reboot_expiry_ticks,
        node["reboot_health_wait_ticks"].as<int>(REBOOT_HEALTH_WAIT_TICKS));
    p.eviction_misses = std::max(1, node["eviction_misses"].as<int>(EVICTION_MISS_THRESHOLD));
    return p;
}

Result<Config> Config::parse(const std::string& yaml_text) {
    try {
        YAML::Node root = YAML::Load(yaml_text);
        if (root && !root.IsNull() && !root.IsMap()) {
            return Result<Config>::Err(ErrorKind::Config, "Config root must be a mapping");
        }

        Config config;
        config.aws_ = parse_aws_config(root["aws"] ? root["aws"] : YAML::Node());
        config.refresh_ = parse_refresh_config(root["refresh"] ? root["refresh"] : YAML::Node());
        config.policy_ = parse_policy_config(root["policy"] ? root["policy"] : YAML::Node());

        // regions: accept a list or a single scalar
        if (root["regions"]) {
            if (root["regions"].IsSequence()) {
                config.regions_ = root["regions"].as<std::vector<std::string>>(std::vector<std::string>());
            } else if (root["regions"].IsScalar()) {
                config.regions_.push_back(root["regions"].as<std::string>());
            }
        }

        return Result<Config>::Ok(config);
    } catch (const std::exception& e) {
        return Result<Config>::Err(ErrorKind::Config, std::string("Failed to parse config: ") + e.what());
    }
}

Result<Config> Config::load_file(const fs::path& path) {
    std::ifstream in(path);
    if (!in) {
        return Result<Config>::Err(ErrorKind::Config, "Config not found at " + path.string());
    }
    std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());

    auto result = parse(text);
    if (result.is_ok()) {
        result.value.source_ = path;
    } else {
        result.error = fmt::format("{} ({})", result.error, path.string());
    }
    return result;
}

Result<Config> Config::load() {
    if (!config_exists()) {
        return Result<Config>::Ok(Config{});
    }
    return load_file(get_config_path());
}
