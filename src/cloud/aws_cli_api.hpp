#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <core/types.hpp>
#include "compute_api.hpp"

// ComputeApi backed by the `aws` command-line client. Each call spawns
// `aws ec2 <verb> --output json --region R [--profile P] ...` and decodes
// stdout. Credential resolution is left entirely to the CLI.
class AwsCliApi : public ComputeApi {
public:
    AwsCliApi(const AwsConfig& aws, int page_size);

    Result<std::vector<std::string>> list_regions(std::chrono::milliseconds timeout) override;
    Result<InstancePage> describe_instances(const std::string& region,
                                            const std::string& page_token,
                                            std::chrono::milliseconds timeout) override;
    Result<InstanceHealth> describe_instance_status(const std::string& region,
                                                    const std::string& id,
                                                    std::chrono::milliseconds timeout) override;
    Result<void> start_instance(const std::string& region, const std::string& id,
                                std::chrono::milliseconds timeout) override;
    Result<void> stop_instance(const std::string& region, const std::string& id,
                               std::chrono::milliseconds timeout) override;
    Result<void> reboot_instance(const std::string& region, const std::string& id,
                                 std::chrono::milliseconds timeout) override;

private:
    AwsConfig aws_;
    int page_size_;

    std::vector<std::string> base_args(const std::string& verb, const std::string& region) const;
    CommandResult invoke(const std::string& label, const std::vector<std::string>& args,
                         std::chrono::milliseconds timeout) const;
    Result<void> control(const std::string& verb, const std::string& region,
                         const std::string& id, std::chrono::milliseconds timeout);
};
