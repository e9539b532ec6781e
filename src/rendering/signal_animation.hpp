/// @file signal_animation.hpp
/// @brief Per-sender and per-receiver fade state for smooth on/off transitions.
///
/// Animation state lives outside the network: senders and receivers only
/// know whether they are active, and this class eases the drawn brightness
/// toward that value each frame.

#pragma once

#include "simulation/signal_network.hpp"

#include <vector>

namespace costumemaster {

/// Per-node animation parameters
struct NodeAnim {
    float glow = 0.0f;        ///< 0 = drawn inactive, 1 = drawn fully active
    float pulse_phase = 0.0f; ///< Phase for the pending-timer pulse (0-2pi)
};

/// Fade state for every node of one network. Rebuilt whenever a level loads.
class SignalAnimation {
  public:
    explicit SignalAnimation(const SignalNetwork* network);

    /// Eases every node toward its current active state.
    /// @param delta_time Seconds since last frame
    void update(float delta_time);

    /// Snaps every node to its current state without easing
    void reset();

    [[nodiscard]] const NodeAnim& sender_anim(const SignalSender* sender) const;
    [[nodiscard]] const NodeAnim& receiver_anim(const SignalReceiver* receiver) const;

  private:
    const SignalNetwork* network_;
    // Indexed by node id; ids are dense and start at 0
    std::vector<NodeAnim> sender_anims_;
    std::vector<NodeAnim> receiver_anims_;

    static const NodeAnim DEFAULT_ANIM;
};

} // namespace costumemaster
