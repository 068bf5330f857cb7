#include "action_dispatcher.hpp"
#include <core/log.hpp>
#include <fmt/format.h>

ActionDispatcher::ActionDispatcher(ComputeApi& api, StateCache& cache,
                                   const PolicyConfig& policy, int timeout_secs)
    : api_(api), cache_(cache), policy_(policy), timeout_(std::chrono::seconds(timeout_secs)) {}

std::optional<std::string> ActionDispatcher::rejection_reason(InstanceState state,
                                                              InstanceAction action) {
    switch (state) {
        case InstanceState::Terminated:   return std::string("instance is terminated");
        case InstanceState::ShuttingDown: return std::string("instance is shutting down");
        case InstanceState::Unknown:      return std::string("instance state is unknown");
        default: break;
    }

    switch (action) {
        case InstanceAction::Start:
            if (state == InstanceState::Stopped) return std::nullopt;
            if (state == InstanceState::Running) return std::string("already running");
            if (state == InstanceState::Pending) return std::string("already starting");
            return std::string("instance is stopping");

        case InstanceAction::Stop:
            if (state == InstanceState::Running || state == InstanceState::Pending) return std::nullopt;
            if (state == InstanceState::Stopped) return std::string("already stopped");
            return std::string("already stopping");

        case InstanceAction::Reboot:
            if (state == InstanceState::Running) return std::nullopt;
            return std::string("instance is not running");
    }
    return std::string("unsupported action");
}

InstanceState ActionDispatcher::overlay_target(InstanceAction action) {
    switch (action) {
        case InstanceAction::Start:  return InstanceState::Pending;
        case InstanceAction::Stop:   return InstanceState::Stopping;
        case InstanceAction::Reboot: return InstanceState::Running;
    }
    return InstanceState::Unknown;
}

Result<void> ActionDispatcher::send(const std::string& region, const std::string& id,
                                    InstanceAction action) {
    switch (action) {
        case InstanceAction::Start:  return api_.start_instance(region, id, timeout_);
        case InstanceAction::Stop:   return api_.stop_instance(region, id, timeout_);
        case InstanceAction::Reboot: return api_.reboot_instance(region, id, timeout_);
    }
    return Result<void>::Err(ErrorKind::Rejected, "unsupported action");
}

Result<void> ActionDispatcher::request_action(const std::string& region, const std::string& id,
                                              InstanceAction action) {
    const char* verb = action_name(action);

    auto cached = cache_.find(region, id);
    if (!cached) {
        ec2ctl_log(fmt::format("action: {} {}/{} rejected: unknown instance", verb, region, id));
        return Result<void>::Err(ErrorKind::Rejected, "unknown instance " + id + " in " + region);
    }

    if (auto reason = rejection_reason(cached->state, action)) {
        ec2ctl_log(fmt::format("action: {} {}/{} rejected: {}", verb, region, id, *reason));
        return Result<void>::Err(ErrorKind::Rejected, *reason);
    }

    auto sent = send(region, id, action);
    if (sent.is_err()) {
        ec2ctl_log(fmt::format("action: {} {}/{} failed ({}): {}", verb, region, id,
                               error_kind_name(sent.kind), sent.error));
        if (sent.kind == ErrorKind::Auth) return sent;
        return Result<void>::Err(ErrorKind::Action, sent.error);
    }

    int expiry = action == InstanceAction::Reboot ? policy_.reboot_expiry_ticks
                                                  : policy_.optimistic_expiry_ticks;
    int health_wait = action == InstanceAction::Reboot ? policy_.reboot_health_wait_ticks : 0;
    if (!cache_.apply_optimistic(region, id, action, overlay_target(action), expiry, health_wait)) {
        // Evicted between validation and acceptance; the next scan shows the outcome
        ec2ctl_log(fmt::format("action: {} {}/{} accepted, instance no longer cached", verb, region, id));
        return Result<void>::Ok();
    }

    ec2ctl_log(fmt::format("action: {} {}/{} accepted (expires after {} ticks)",
                           verb, region, id, expiry));
    return Result<void>::Ok();
}
