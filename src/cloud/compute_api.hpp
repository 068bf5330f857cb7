#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <core/types.hpp>
#include "instance.hpp"

// One page of a describe-instances response.
struct InstancePage {
    std::vector<Instance> instances;
    std::string next_token;     // empty on the last page
};

// Contract with the remote compute-management service. Every call blocks
// until the remote answers or `timeout` elapses. Failures carry an
// ErrorKind: Auth, Network, Timeout, Action or Parse.
class ComputeApi {
public:
    virtual ~ComputeApi() = default;

    // Region codes available to the account, in provider order.
    virtual Result<std::vector<std::string>> list_regions(std::chrono::milliseconds timeout) = 0;

    // One page of instances. `page_token` is empty for the first page.
    virtual Result<InstancePage> describe_instances(const std::string& region,
                                                    const std::string& page_token,
                                                    std::chrono::milliseconds timeout) = 0;

    // Status checks of one instance. An instance without status data
    // reports "unknown" everywhere.
    virtual Result<InstanceHealth> describe_instance_status(const std::string& region,
                                                            const std::string& id,
                                                            std::chrono::milliseconds timeout) = 0;

    // Request acceptance only; the state change is observed by later describes.
    virtual Result<void> start_instance(const std::string& region, const std::string& id,
                                        std::chrono::milliseconds timeout) = 0;
    virtual Result<void> stop_instance(const std::string& region, const std::string& id,
                                       std::chrono::milliseconds timeout) = 0;
    virtual Result<void> reboot_instance(const std::string& region, const std::string& id,
                                         std::chrono::milliseconds timeout) = 0;
};
