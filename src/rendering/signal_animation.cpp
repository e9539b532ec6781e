/// @file signal_animation.cpp
/// @brief Implements the sender/receiver fade transitions

#include "rendering/signal_animation.hpp"

#include <algorithm>

namespace costumemaster {

const NodeAnim SignalAnimation::DEFAULT_ANIM = {};

namespace {

constexpr float FADE_SPEED = 5.0f;  ///< Glow units per second
constexpr float PULSE_SPEED = 6.0f; ///< Radians per second while a timer runs
constexpr float PI_2 = 6.2831853f;

void ease(NodeAnim& anim, bool active, float delta_time) {
    float target = active ? 1.0f : 0.0f;
    if (anim.glow < target) {
        anim.glow = std::min(target, anim.glow + FADE_SPEED * delta_time);
    } else {
        anim.glow = std::max(target, anim.glow - FADE_SPEED * delta_time);
    }
}

} // namespace

SignalAnimation::SignalAnimation(const SignalNetwork* network)
    : network_(network), sender_anims_(network->num_senders()),
      receiver_anims_(network->num_receivers()) {
    reset();
}

void SignalAnimation::update(float delta_time) {
    for (const auto& sender : network_->senders()) {
        NodeAnim& anim = sender_anims_[sender->get_id()];
        ease(anim, sender->is_active(), delta_time);
        if (sender->timer_pending()) {
            anim.pulse_phase += PULSE_SPEED * delta_time;
            if (anim.pulse_phase > PI_2) {
                anim.pulse_phase -= PI_2;
            }
        } else {
            anim.pulse_phase = 0.0f;
        }
    }
    for (const auto& receiver : network_->receivers()) {
        ease(receiver_anims_[receiver->get_id()], receiver->is_active(), delta_time);
    }
}

void SignalAnimation::reset() {
    for (const auto& sender : network_->senders()) {
        sender_anims_[sender->get_id()] = {sender->is_active() ? 1.0f : 0.0f, 0.0f};
    }
    for (const auto& receiver : network_->receivers()) {
        receiver_anims_[receiver->get_id()] = {receiver->is_active() ? 1.0f : 0.0f, 0.0f};
    }
}

const NodeAnim& SignalAnimation::sender_anim(const SignalSender* sender) const {
    if (sender != nullptr && sender->get_id() < sender_anims_.size()) {
        return sender_anims_[sender->get_id()];
    }
    return DEFAULT_ANIM;
}

const NodeAnim& SignalAnimation::receiver_anim(const SignalReceiver* receiver) const {
    if (receiver != nullptr && receiver->get_id() < receiver_anims_.size()) {
        return receiver_anims_[receiver->get_id()];
    }
    return DEFAULT_ANIM;
}

} // namespace costumemaster
