#pragma once

#include <string>
#include <optional>
#include <chrono>
#include <core/types.hpp>
#include <cloud/compute_api.hpp>
#include "state_cache.hpp"

// Sends start/stop/reboot requests and installs the optimistic overlay once
// the remote has accepted. Illegal transitions are refused locally, without
// a remote call. Nothing is retried.
class ActionDispatcher {
public:
    ActionDispatcher(ComputeApi& api, StateCache& cache, const PolicyConfig& policy,
                     int timeout_secs = ACTION_TIMEOUT_SECS);

    // Ok = accepted by the remote. Errors: Rejected (local), Action (remote
    // refused or failed), Auth (credentials).
    Result<void> request_action(const std::string& region, const std::string& id,
                                InstanceAction action);

    // Reason the action is illegal from `state`, or nullopt if allowed.
    static std::optional<std::string> rejection_reason(InstanceState state, InstanceAction action);

    // State shown while the action is in flight.
    static InstanceState overlay_target(InstanceAction action);

private:
    ComputeApi& api_;
    StateCache& cache_;
    PolicyConfig policy_;
    std::chrono::milliseconds timeout_;

    Result<void> send(const std::string& region, const std::string& id, InstanceAction action);
};
