/// @file signal_network.cpp
/// @brief Network construction, lookup and the sender-then-receiver evaluation pass

#include "simulation/signal_network.hpp"

#include <stdexcept>
#include <string>
#include <utility>

namespace costumemaster {

SignalSender* SignalNetwork::add_sender(GridPosition position, SenderKind kind,
                                        ActivationMethods methods, StimulusPredicate predicate,
                                        double cooldown) {
    if (sender_index_.count(position) != 0) {
        throw std::invalid_argument("A sender already exists at " + to_string(position));
    }
    senders_.push_back(std::make_unique<SignalSender>(next_sender_id_++, position, kind, methods,
                                                      std::move(predicate), cooldown));
    SignalSender* sender = senders_.back().get();
    sender_index_[position] = sender;
    return sender;
}

SignalReceiver* SignalNetwork::add_receiver(GridPosition position) {
    receivers_.push_back(std::make_unique<SignalReceiver>(next_receiver_id_++, position));
    return receivers_.back().get();
}

const SignalSender* SignalNetwork::find_sender(GridPosition position) const {
    auto it = sender_index_.find(position);
    return it == sender_index_.end() ? nullptr : it->second;
}

SignalSender* SignalNetwork::find_sender(GridPosition position) {
    auto it = sender_index_.find(position);
    return it == sender_index_.end() ? nullptr : it->second;
}

std::vector<SignalReceiver*> SignalNetwork::receivers_at(GridPosition position) const {
    std::vector<SignalReceiver*> matches;
    for (const auto& receiver : receivers_) {
        if (receiver->get_position() == position) {
            matches.push_back(receiver.get());
        }
    }
    return matches;
}

SignalReceiver* SignalNetwork::find_receiver(GridPosition position) const {
    for (const auto& receiver : receivers_) {
        if (receiver->get_position() == position) {
            return receiver.get();
        }
    }
    return nullptr;
}

NetworkUpdate SignalNetwork::propagate(const StimulusSnapshot& snapshot, double now) {
    NetworkUpdate update;

    for (auto& sender : senders_) {
        StimulusContext context{snapshot, grid_to_world(sender->get_position(), unit_), unit_};
        SenderUpdate result = sender->evaluate(context, now);
        if (result.transition != Transition::None) {
            update.sender_changes.push_back({sender.get(), result.transition});
        }
    }

    update.receiver_changes = recompute_receivers();
    return update;
}

std::vector<ReceiverChange> SignalNetwork::recompute_receivers() {
    std::vector<ReceiverChange> changes;
    for (auto& receiver : receivers_) {
        bool old_state = receiver->is_active();
        bool new_state = receiver->recompute(*this);
        if (new_state != old_state) {
            changes.push_back({receiver.get(), new_state});
        }
    }
    return changes;
}

void SignalNetwork::validate_wiring() const {
    for (const auto& receiver : receivers_) {
        for (GridPosition input : receiver->get_inputs()) {
            if (find_sender(input) == nullptr) {
                throw std::runtime_error("Receiver at " + to_string(receiver->get_position()) +
                                         " is wired to a missing sender at " + to_string(input));
            }
        }
    }
}

} // namespace costumemaster
