#include "preflight.hpp"
#include <core/config.hpp>
#include <core/log.hpp>
#include <platform/process.hpp>
#include <fmt/format.h>

std::vector<PreflightIssue> check_config() {
    std::vector<PreflightIssue> issues;

    if (!config_exists()) {
        issues.push_back({
            "No config at " + get_config_path().string() + ", using defaults",
            "Run 'ec2ctl setup' to write one",
            true
        });
        return issues;
    }

    auto result = Config::load();
    if (result.is_err()) {
        issues.push_back({"Failed to parse config: " + result.error, "Check YAML syntax"});
    }
    return issues;
}

std::vector<PreflightIssue> check_aws_cli(const AwsConfig& aws) {
    std::vector<PreflightIssue> issues;

    auto r = platform::run_captured(aws.cli, {"--version"}, 5000);
    ec2ctl_log_cmd("preflight", aws.cli + " --version", r);
    if (r.failed()) {
        issues.push_back({
            fmt::format("'{}' not runnable ({})", aws.cli,
                        r.timed_out ? "timed out" : r.get_output().substr(0, 120)),
            "Install the AWS CLI v2 or set aws.cli in " + get_config_path().string()
        });
    }
    return issues;
}

std::vector<PreflightIssue> run_preflight_checks() {
    auto issues = check_config();
    for (const auto& i : issues) {
        if (!i.is_hint) return issues;
    }

    AwsConfig aws;
    auto cfg = Config::load();
    if (cfg.is_ok()) aws = cfg.value.aws();

    auto cli_issues = check_aws_cli(aws);
    issues.insert(issues.end(), cli_issues.begin(), cli_issues.end());
    return issues;
}
