/// @file signal_sender.cpp
/// @brief Sender state machine: permanent latch, live tracking, toggling and timers

#include "simulation/signal_sender.hpp"

#include <stdexcept>
#include <utility>

namespace costumemaster {

SignalSender::SignalSender(uint32_t id, GridPosition position, SenderKind kind,
                           ActivationMethods methods, StimulusPredicate predicate, double cooldown)
    : id_(id), position_(position), kind_(kind), methods_(methods), predicate_(std::move(predicate)),
      cooldown_(cooldown) {
    if (cooldown_ < 0.0) {
        throw std::invalid_argument("Sender cooldown must not be negative");
    }
    if (methods_.empty()) {
        methods_.insert(ActivationMethod::ByIntervention);
    }
}

SenderUpdate SignalSender::evaluate(const StimulusContext& context, double now) {
    bool stimulated = predicate_ ? predicate_(context) : false;
    return step(stimulated, now);
}

SenderUpdate SignalSender::step(bool stimulated, double now) {
    if (timer_pending_) {
        // Held until the timer fires; stimulus is ignored meanwhile
        if (now < deadline_) {
            return {active_, Transition::None};
        }
        timer_pending_ = false;
        if (active_) {
            active_ = false;
            return {false, Transition::Deactivated};
        }
        return {active_, Transition::None};
    }

    const bool was_active = active_;
    bool permanent = false;

    if (methods_.contains(ActivationMethod::OncePermanently)) {
        permanent = true;
        if (!active_ && stimulated) {
            active_ = true;
        }
    } else if (methods_.contains(ActivationMethod::ByIntervention)) {
        active_ = stimulated;
    } else if (methods_.contains(ActivationMethod::OnToggle)) {
        if (stimulated) {
            active_ = !active_;
        }
    } else if (stimulated) {
        // Timer only
        active_ = true;
    }

    if (!was_active && active_) {
        if (!permanent && methods_.contains(ActivationMethod::OnTimer)) {
            timer_pending_ = true;
            deadline_ = now + cooldown_;
        }
        return {true, Transition::Activated};
    }
    if (was_active && !active_) {
        return {false, Transition::Deactivated};
    }
    return {active_, Transition::None};
}

} // namespace costumemaster
