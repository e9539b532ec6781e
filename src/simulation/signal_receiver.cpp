/// @file signal_receiver.cpp
/// @brief Policy evaluation and SignalReceiver implementation

#include "simulation/signal_receiver.hpp"

#include "simulation/signal_network.hpp"

#include <algorithm>
#include <utility>

namespace costumemaster {

bool evaluate_policy(ActivationPolicy policy, const std::vector<bool>& wired_states,
                     const std::vector<bool>& required_states) {
    switch (policy) {
    case ActivationPolicy::NoInput:
        return false;

    case ActivationPolicy::AnyInput:
        for (bool v : wired_states) {
            if (v) {
                return true;
            }
        }
        return false;

    case ActivationPolicy::AllInputs:
        if (required_states.empty()) {
            return false;
        }
        for (bool v : required_states) {
            if (!v) {
                return false;
            }
        }
        return true;
    }
    return false;
}

SignalReceiver::SignalReceiver(uint32_t id, GridPosition position) : id_(id), position_(position) {}

bool SignalReceiver::add_input(GridPosition sender) {
    if (is_wired(sender)) {
        return false;
    }
    inputs_.push_back(sender);
    return true;
}

void SignalReceiver::set_policy(ActivationPolicy policy, std::vector<GridPosition> required) {
    policy_ = policy;
    required_ = std::move(required);
}

void SignalReceiver::clear_inputs() {
    inputs_.clear();
    required_.clear();
    policy_ = ActivationPolicy::NoInput;
}

bool SignalReceiver::is_wired(GridPosition sender) const {
    return std::find(inputs_.begin(), inputs_.end(), sender) != inputs_.end();
}

bool SignalReceiver::recompute(const SignalNetwork& network) {
    std::vector<bool> wired_states;
    wired_states.reserve(inputs_.size());
    for (GridPosition p : inputs_) {
        const SignalSender* sender = network.find_sender(p);
        wired_states.push_back(sender != nullptr && sender->is_active());
    }

    // A required position nobody wired can never be satisfied
    std::vector<bool> required_states;
    required_states.reserve(required_.size());
    for (GridPosition p : required_) {
        const SignalSender* sender = is_wired(p) ? network.find_sender(p) : nullptr;
        required_states.push_back(sender != nullptr && sender->is_active());
    }

    active_ = evaluate_policy(policy_, wired_states, required_states);
    return active_;
}

} // namespace costumemaster
