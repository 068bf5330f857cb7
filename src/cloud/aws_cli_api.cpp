#include "aws_cli_api.hpp"
#include "aws_json.hpp"
#include <core/log.hpp>
#include <platform/process.hpp>
#include <fmt/format.h>
#include <algorithm>

AwsCliApi::AwsCliApi(const AwsConfig& aws, int page_size)
    : aws_(aws), page_size_(page_size) {}

std::vector<std::string> AwsCliApi::base_args(const std::string& verb,
                                              const std::string& region) const {
    std::vector<std::string> args = {"ec2", verb, "--output", "json",
                                     "--region", region.empty() ? aws_.default_region : region};
    if (!aws_.profile.empty()) {
        args.push_back("--profile");
        args.push_back(aws_.profile);
    }
    return args;
}

CommandResult AwsCliApi::invoke(const std::string& label,
                                const std::vector<std::string>& args,
                                std::chrono::milliseconds timeout) const {
    std::string cmdline = aws_.cli;
    for (const auto& a : args) cmdline += " " + a;

    // A spent budget still gets a minimal attempt rather than "wait forever"
    int timeout_ms = std::max<int>(1, static_cast<int>(timeout.count()));
    auto r = platform::run_captured(aws_.cli, args, timeout_ms);
    ec2ctl_log_cmd(label, cmdline, r);
    return r;
}

Result<std::vector<std::string>> AwsCliApi::list_regions(std::chrono::milliseconds timeout) {
    auto r = invoke("regions", base_args("describe-regions", ""), timeout);
    if (r.timed_out) {
        return Result<std::vector<std::string>>::Err(ErrorKind::Timeout,
            fmt::format("describe-regions timed out after {}ms", timeout.count()));
    }
    if (r.failed()) {
        return Result<std::vector<std::string>>::Err(classify_aws_error(r.stderr_data, false),
                                                     aws_error_message(r.stderr_data));
    }
    return decode_regions(r.stdout_data);
}

Result<InstancePage> AwsCliApi::describe_instances(const std::string& region,
                                                   const std::string& page_token,
                                                   std::chrono::milliseconds timeout) {
    auto args = base_args("describe-instances", region);
    // Drive pagination ourselves so one call = one page
    args.push_back("--no-paginate");
    args.push_back("--max-results");
    args.push_back(std::to_string(page_size_));
    if (!page_token.empty()) {
        args.push_back("--next-token");
        args.push_back(page_token);
    }

    auto r = invoke("describe:" + region, args, timeout);
    if (r.timed_out) {
        return Result<InstancePage>::Err(ErrorKind::Timeout,
            fmt::format("describe-instances in {} timed out after {}ms", region, timeout.count()));
    }
    if (r.failed()) {
        return Result<InstancePage>::Err(classify_aws_error(r.stderr_data, false),
                                         aws_error_message(r.stderr_data));
    }
    return decode_instance_page(region, r.stdout_data);
}

Result<InstanceHealth> AwsCliApi::describe_instance_status(const std::string& region,
                                                           const std::string& id,
                                                           std::chrono::milliseconds timeout) {
    auto args = base_args("describe-instance-status", region);
    args.push_back("--instance-ids");
    args.push_back(id);
    args.push_back("--include-all-instances");

    auto r = invoke("status:" + region, args, timeout);
    if (r.timed_out) {
        return Result<InstanceHealth>::Err(ErrorKind::Timeout,
            fmt::format("describe-instance-status {} timed out after {}ms", id, timeout.count()));
    }
    if (r.failed()) {
        return Result<InstanceHealth>::Err(classify_aws_error(r.stderr_data, false),
                                           aws_error_message(r.stderr_data));
    }
    return decode_instance_status(r.stdout_data);
}

Result<void> AwsCliApi::control(const std::string& verb, const std::string& region,
                                const std::string& id, std::chrono::milliseconds timeout) {
    auto args = base_args(verb, region);
    args.push_back("--instance-ids");
    args.push_back(id);

    auto r = invoke(verb, args, timeout);
    if (r.timed_out) {
        return Result<void>::Err(ErrorKind::Timeout,
            fmt::format("{} {} timed out after {}ms", verb, id, timeout.count()));
    }
    if (r.failed()) {
        return Result<void>::Err(classify_aws_error(r.stderr_data, true),
                                 aws_error_message(r.stderr_data));
    }
    return Result<void>::Ok();
}

Result<void> AwsCliApi::start_instance(const std::string& region, const std::string& id,
                                       std::chrono::milliseconds timeout) {
    return control("start-instances", region, id, timeout);
}

Result<void> AwsCliApi::stop_instance(const std::string& region, const std::string& id,
                                      std::chrono::milliseconds timeout) {
    return control("stop-instances", region, id, timeout);
}

Result<void> AwsCliApi::reboot_instance(const std::string& region, const std::string& id,
                                        std::chrono::milliseconds timeout) {
    return control("reboot-instances", region, id, timeout);
}
