#include "aws_json.hpp"
#include <core/utils.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <map>

static std::string scalar_or(const YAML::Node& node, const std::string& fallback) {
    if (!node || !node.IsScalar()) return fallback;
    return node.as<std::string>(fallback);
}

Result<std::vector<std::string>> decode_regions(const std::string& json) {
    try {
        YAML::Node root = YAML::Load(json);
        if (!root["Regions"] || !root["Regions"].IsSequence()) {
            return Result<std::vector<std::string>>::Err(ErrorKind::Parse,
                "describe-regions response has no Regions list");
        }

        std::vector<std::string> codes;
        for (const auto& r : root["Regions"]) {
            std::string code = scalar_or(r["RegionName"], "");
            if (!code.empty()) codes.push_back(code);
        }
        return Result<std::vector<std::string>>::Ok(codes);
    } catch (const std::exception& e) {
        return Result<std::vector<std::string>>::Err(ErrorKind::Parse,
            std::string("Failed to decode describe-regions: ") + e.what());
    }
}

static Instance decode_instance(const std::string& region, const YAML::Node& node) {
    Instance inst;
    inst.id = scalar_or(node["InstanceId"], "");
    inst.region = region;
    inst.instance_type = scalar_or(node["InstanceType"], "");
    inst.public_ip = scalar_or(node["PublicIpAddress"], "");
    inst.private_ip = scalar_or(node["PrivateIpAddress"], "");
    inst.launch_time = scalar_or(node["LaunchTime"], "");

    if (node["State"] && node["State"].IsMap()) {
        inst.state = parse_state(scalar_or(node["State"]["Name"], ""));
    }

    if (node["Tags"] && node["Tags"].IsSequence()) {
        for (const auto& tag : node["Tags"]) {
            if (scalar_or(tag["Key"], "") == "Name") {
                inst.name = scalar_or(tag["Value"], "");
                break;
            }
        }
    }
    if (inst.name.empty()) inst.name = inst.id;
    return inst;
}

Result<InstancePage> decode_instance_page(const std::string& region, const std::string& json) {
    try {
        YAML::Node root = YAML::Load(json);
        if (!root || !root.IsMap()) {
            return Result<InstancePage>::Err(ErrorKind::Parse,
                "describe-instances response is not an object");
        }

        InstancePage page;
        if (root["Reservations"] && root["Reservations"].IsSequence()) {
            for (const auto& reservation : root["Reservations"]) {
                if (!reservation["Instances"] || !reservation["Instances"].IsSequence()) continue;
                for (const auto& node : reservation["Instances"]) {
                    Instance inst = decode_instance(region, node);
                    if (!inst.id.empty()) page.instances.push_back(std::move(inst));
                }
            }
        }
        page.next_token = scalar_or(root["NextToken"], "");
        return Result<InstancePage>::Ok(page);
    } catch (const std::exception& e) {
        return Result<InstancePage>::Err(ErrorKind::Parse,
            fmt::format("Failed to decode describe-instances for {}: {}", region, e.what()));
    }
}

Result<InstanceHealth> decode_instance_status(const std::string& json) {
    try {
        YAML::Node root = YAML::Load(json);
        if (!root || !root.IsMap()) {
            return Result<InstanceHealth>::Err(ErrorKind::Parse,
                "describe-instance-status response is not an object");
        }

        InstanceHealth health;
        const auto& statuses = root["InstanceStatuses"];
        if (statuses && statuses.IsSequence() && statuses.size() > 0) {
            const auto& s = statuses[0];
            if (s["InstanceState"] && s["InstanceState"].IsMap())
                health.instance_state = scalar_or(s["InstanceState"]["Name"], "unknown");
            if (s["SystemStatus"] && s["SystemStatus"].IsMap())
                health.system_status = scalar_or(s["SystemStatus"]["Status"], "unknown");
            if (s["InstanceStatus"] && s["InstanceStatus"].IsMap())
                health.instance_status = scalar_or(s["InstanceStatus"]["Status"], "unknown");
        }
        return Result<InstanceHealth>::Ok(health);
    } catch (const std::exception& e) {
        return Result<InstanceHealth>::Err(ErrorKind::Parse,
            std::string("Failed to decode describe-instance-status: ") + e.what());
    }
}

ErrorKind classify_aws_error(const std::string& stderr_text, bool control_call) {
    static const char* auth_markers[] = {
        "Unable to locate credentials",
        "AuthFailure",
        "InvalidClientTokenId",
        "ExpiredToken",
        "RequestExpired",
        "SignatureDoesNotMatch",
        "The config profile",
        "Error loading SSO Token",
    };
    for (const char* m : auth_markers) {
        if (stderr_text.find(m) != std::string::npos) return ErrorKind::Auth;
    }

    static const char* network_markers[] = {
        "Could not connect to the endpoint URL",
        "Connect timeout on endpoint URL",
        "Read timeout on endpoint URL",
        "Connection was closed",
        "Max retries exceeded",
    };
    for (const char* m : network_markers) {
        if (stderr_text.find(m) != std::string::npos) return ErrorKind::Network;
    }

    // UnauthorizedOperation, IncorrectInstanceState, InvalidInstanceID.NotFound, ...
    if (control_call) return ErrorKind::Action;
    return ErrorKind::Network;
}

std::string aws_error_message(const std::string& stderr_text) {
    // "An error occurred (Code) when calling the Op operation: Message"
    std::string text = stderr_text;
    trim(text);
    auto open = text.find("An error occurred (");
    if (open != std::string::npos) {
        auto close = text.find(')', open);
        auto colon = text.find(": ", close == std::string::npos ? open : close);
        if (close != std::string::npos && colon != std::string::npos) {
            std::string code = text.substr(open + 19, close - open - 19);
            std::string msg = text.substr(colon + 2);
            trim(msg);
            return code + ": " + msg;
        }
    }
    // Keep the last non-empty line; the aws CLI prints usage noise before it
    auto nl = text.find_last_of('\n');
    if (nl != std::string::npos) text = text.substr(nl + 1);
    trim(text);
    return text.empty() ? "unknown error" : text;
}

std::string region_display_name(const std::string& code) {
    static const std::map<std::string, std::string> names = {
        {"us-east-1",      "US East (N. Virginia)"},
        {"us-east-2",      "US East (Ohio)"},
        {"us-west-1",      "US West (N. California)"},
        {"us-west-2",      "US West (Oregon)"},
        {"af-south-1",     "Africa (Cape Town)"},
        {"ap-east-1",      "Asia Pacific (Hong Kong)"},
        {"ap-south-1",     "Asia Pacific (Mumbai)"},
        {"ap-south-2",     "Asia Pacific (Hyderabad)"},
        {"ap-northeast-1", "Asia Pacific (Tokyo)"},
        {"ap-northeast-2", "Asia Pacific (Seoul)"},
        {"ap-northeast-3", "Asia Pacific (Osaka)"},
        {"ap-southeast-1", "Asia Pacific (Singapore)"},
        {"ap-southeast-2", "Asia Pacific (Sydney)"},
        {"ap-southeast-3", "Asia Pacific (Jakarta)"},
        {"ca-central-1",   "Canada (Central)"},
        {"eu-central-1",   "Europe (Frankfurt)"},
        {"eu-central-2",   "Europe (Zurich)"},
        {"eu-west-1",      "Europe (Ireland)"},
        {"eu-west-2",      "Europe (London)"},
        {"eu-west-3",      "Europe (Paris)"},
        {"eu-north-1",     "Europe (Stockholm)"},
        {"eu-south-1",     "Europe (Milan)"},
        {"me-south-1",     "Middle East (Bahrain)"},
        {"me-central-1",   "Middle East (UAE)"},
        {"sa-east-1",      "South America (Sao Paulo)"},
    };
    auto it = names.find(code);
    return it == names.end() ? code : it->second;
}
