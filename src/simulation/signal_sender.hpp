#pragma once

/// @file signal_sender.hpp
/// @brief Signal senders: levers, computers, plates and triggers that emit a boolean signal

#include "simulation/grid_position.hpp"
#include "simulation/stimulus.hpp"

#include <cstdint>
#include <initializer_list>
#include <string_view>

namespace costumemaster {

/// How a sender's signal turns on and off. Methods combine.
enum class ActivationMethod : uint8_t {
    OncePermanently = 1 << 0,
    ByIntervention = 1 << 1,
    OnTimer = 1 << 2,
    OnToggle = 1 << 3,
};

/// Returns the human-readable name of an activation method
[[nodiscard]] constexpr std::string_view activation_method_name(ActivationMethod method) {
    switch (method) {
    case ActivationMethod::OncePermanently:
        return "OncePermanently";
    case ActivationMethod::ByIntervention:
        return "ByIntervention";
    case ActivationMethod::OnTimer:
        return "OnTimer";
    case ActivationMethod::OnToggle:
        return "OnToggle";
    }
    return "Unknown";
}

/// A set of activation methods
class ActivationMethods {
  public:
    constexpr ActivationMethods() = default;
    constexpr ActivationMethods(std::initializer_list<ActivationMethod> methods) {
        for (ActivationMethod method : methods) {
            insert(method);
        }
    }

    [[nodiscard]] constexpr bool contains(ActivationMethod method) const {
        return (bits_ & static_cast<uint8_t>(method)) != 0;
    }
    [[nodiscard]] constexpr bool empty() const { return bits_ == 0; }

    constexpr void insert(ActivationMethod method) { bits_ |= static_cast<uint8_t>(method); }

  private:
    uint8_t bits_ = 0;
};

/// Edge produced by one evaluation
enum class Transition { None, Activated, Deactivated };

/// Result of evaluating a sender for one tick
struct SenderUpdate {
    bool active = false;
    Transition transition = Transition::None;
};

/// An interactive object producing a boolean signal.
///
/// A sender owns its own state (active flag, pending timer). It never reads
/// receiver state, which keeps the network strictly sender -> receiver.
///
/// When several methods are combined, OncePermanently governs first, then
/// ByIntervention, then OnToggle. OnTimer layers on any of the latter two (or
/// stands alone): a rising edge arms one automatic deactivation `cooldown`
/// seconds later, and the state is held until it fires.
class SignalSender {
  public:
    /// Construct a sender. An empty method set means ByIntervention.
    SignalSender(uint32_t id, GridPosition position, SenderKind kind, ActivationMethods methods,
                 StimulusPredicate predicate, double cooldown = 0.0);

    [[nodiscard]] uint32_t get_id() const { return id_; }
    [[nodiscard]] GridPosition get_position() const { return position_; }
    [[nodiscard]] SenderKind get_kind() const { return kind_; }
    [[nodiscard]] ActivationMethods get_methods() const { return methods_; }
    [[nodiscard]] double get_cooldown() const { return cooldown_; }
    [[nodiscard]] bool is_active() const { return active_; }
    [[nodiscard]] bool timer_pending() const { return timer_pending_; }
    [[nodiscard]] double timer_deadline() const { return deadline_; }

    /// Asks the predicate about this tick's stimulus and advances the state.
    /// @param context Snapshot and geometry for the predicate
    /// @param now Simulation time in seconds
    SenderUpdate evaluate(const StimulusContext& context, double now);

    /// Advances the state given an already-computed predicate value
    SenderUpdate step(bool stimulated, double now);

  private:
    uint32_t id_;
    GridPosition position_;
    SenderKind kind_;
    ActivationMethods methods_;
    StimulusPredicate predicate_;
    double cooldown_;
    bool active_ = false;
    bool timer_pending_ = false;
    double deadline_ = 0.0;
};

} // namespace costumemaster
