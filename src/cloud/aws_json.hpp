#pragma once

#include <string>
#include <vector>
#include <core/types.hpp>
#include "compute_api.hpp"

// Decoders for `aws ec2 ... --output json` responses. JSON is a subset of
// YAML 1.2, so yaml-cpp reads these documents directly.

// describe-regions -> region codes in response order
Result<std::vector<std::string>> decode_regions(const std::string& json);

// describe-instances (one page) -> instances tagged with `region`.
// Name comes from the "Name" tag, defaulting to the instance id.
Result<InstancePage> decode_instance_page(const std::string& region, const std::string& json);

// describe-instance-status for a single id. An empty InstanceStatuses list
// (status checks not yet published) decodes to an all-"unknown" health.
Result<InstanceHealth> decode_instance_status(const std::string& json);

// Map aws CLI stderr to an error category. Credential failures are Auth
// regardless of the call; permission and state refusals are Action for
// control calls; connectivity failures are Network.
ErrorKind classify_aws_error(const std::string& stderr_text, bool control_call);

// Short human-readable message from aws CLI stderr, e.g.
// "IncorrectInstanceState: The instance 'i-1' is not in a state from which it can be started."
std::string aws_error_message(const std::string& stderr_text);

// Human-readable region name ("us-east-1" -> "US East (N. Virginia)").
// Unknown codes return the code unchanged.
std::string region_display_name(const std::string& code);
