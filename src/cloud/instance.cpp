#include "instance.hpp"

const char* state_name(InstanceState state) {
    switch (state) {
        case InstanceState::Pending:      return "pending";
        case InstanceState::Running:      return "running";
        case InstanceState::Stopping:     return "stopping";
        case InstanceState::Stopped:      return "stopped";
        case InstanceState::ShuttingDown: return "shutting-down";
        case InstanceState::Terminated:   return "terminated";
        case InstanceState::Unknown:      return "unknown";
    }
    return "unknown";
}

InstanceState parse_state(const std::string& name) {
    if (name == "pending")       return InstanceState::Pending;
    if (name == "running")       return InstanceState::Running;
    if (name == "stopping")      return InstanceState::Stopping;
    if (name == "stopped")       return InstanceState::Stopped;
    if (name == "shutting-down") return InstanceState::ShuttingDown;
    if (name == "terminated")    return InstanceState::Terminated;
    return InstanceState::Unknown;
}

const char* action_name(InstanceAction action) {
    switch (action) {
        case InstanceAction::Start:  return "start";
        case InstanceAction::Stop:   return "stop";
        case InstanceAction::Reboot: return "reboot";
    }
    return "?";
}

std::string display_state(const Instance& inst) {
    if (inst.optimistic) {
        if (inst.optimistic->action == InstanceAction::Reboot) return "rebooting";
        return state_name(inst.optimistic->target_state);
    }
    return state_name(inst.state);
}
