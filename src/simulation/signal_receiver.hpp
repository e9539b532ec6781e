#pragma once

/// @file signal_receiver.hpp
/// @brief Signal receivers: doors and gates driven by their wired senders

#include "simulation/grid_position.hpp"

#include <cstdint>
#include <string_view>
#include <vector>

namespace costumemaster {

class SignalNetwork; // Forward declaration

/// How a receiver combines its wired senders
enum class ActivationPolicy { NoInput, AnyInput, AllInputs };

/// Returns the human-readable name of a policy
[[nodiscard]] constexpr std::string_view activation_policy_name(ActivationPolicy policy) {
    switch (policy) {
    case ActivationPolicy::NoInput:
        return "NoInput";
    case ActivationPolicy::AnyInput:
        return "AnyInput";
    case ActivationPolicy::AllInputs:
        return "AllInputs";
    }
    return "Unknown";
}

/// Evaluates a policy. This is a pure function with no side effects.
/// @param policy The receiver's policy
/// @param wired_states Active flag of every wired sender (AnyInput)
/// @param required_states One entry per required position: true iff a sender
///        at that position is wired and active (AllInputs)
[[nodiscard]] bool evaluate_policy(ActivationPolicy policy, const std::vector<bool>& wired_states,
                                   const std::vector<bool>& required_states);

/// An interactive object whose active state is derived from its senders.
///
/// The receiver does not own senders; it keeps their grid positions and
/// resolves them through the network on every recompute. `active` is only
/// ever written by recompute().
class SignalReceiver {
  public:
    /// Construct an unwired receiver (policy NoInput)
    explicit SignalReceiver(uint32_t id, GridPosition position);

    [[nodiscard]] uint32_t get_id() const { return id_; }
    [[nodiscard]] GridPosition get_position() const { return position_; }
    [[nodiscard]] ActivationPolicy get_policy() const { return policy_; }
    [[nodiscard]] bool is_active() const { return active_; }

    /// Wired sender positions, in the order they were discovered while linking
    [[nodiscard]] const std::vector<GridPosition>& get_inputs() const { return inputs_; }

    /// Positions that must all be active under AllInputs
    [[nodiscard]] const std::vector<GridPosition>& get_required() const { return required_; }

    /// Wires a sender position. Returns false if it was already wired.
    bool add_input(GridPosition sender);

    /// Assigns the policy and, for AllInputs, the required position set
    void set_policy(ActivationPolicy policy, std::vector<GridPosition> required = {});

    /// Removes all wiring and returns to NoInput
    void clear_inputs();

    /// Derives `active` from the current state of the wired senders.
    /// Idempotent: with unchanged senders the result and state are unchanged.
    bool recompute(const SignalNetwork& network);

  private:
    [[nodiscard]] bool is_wired(GridPosition sender) const;

    uint32_t id_;
    GridPosition position_;
    ActivationPolicy policy_ = ActivationPolicy::NoInput;
    std::vector<GridPosition> inputs_;
    std::vector<GridPosition> required_;
    bool active_ = false;
};

} // namespace costumemaster
